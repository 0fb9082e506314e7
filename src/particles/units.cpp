/// @file src/particles/units.cpp
/// @brief Dimensional unit system.

#include "kdc/units.hpp"

#include <cmath>
#include <utility>

namespace kdc::units {

namespace {

constexpr double KPC_IN_M = 3.0856775814913673e19;
constexpr double GYR_IN_S = 3.15576e16;
constexpr double MSOL_IN_KG = 1.98847e30;

// Sentinel exponent for the unknown unit so it never matches a real one.
constexpr int UNKNOWN_DIM = 99;

}  // namespace

// ─── Unit ─────────────────────────────────────────────────────────────────────

Unit::Unit(std::string name, double si_scale, int length, int time, int mass)
    : name_(std::move(name))
    , si_scale_(si_scale)
    , length_(length)
    , time_(time)
    , mass_(mass) {}

bool Unit::same_dimension(const Unit& other) const noexcept {
    return length_ == other.length_ && time_ == other.time_ && mass_ == other.mass_;
}

std::optional<double> Unit::ratio_to(const Unit& target) const noexcept {
    if (!same_dimension(target)) {
        return std::nullopt;
    }
    if (!std::isfinite(si_scale_) || !std::isfinite(target.si_scale_) ||
        target.si_scale_ == 0.0) {
        return std::nullopt;
    }
    return si_scale_ / target.si_scale_;
}

Unit Unit::squared() const {
    return Unit(name_ + "**2", si_scale_ * si_scale_,
                2 * length_, 2 * time_, 2 * mass_);
}

bool Unit::operator==(const Unit& other) const noexcept {
    return same_dimension(other) && si_scale_ == other.si_scale_;
}

// ─── Predefined Units ─────────────────────────────────────────────────────────

Unit kpc()           { return Unit("kpc", KPC_IN_M, 1, 0, 0); }
Unit km_per_s()      { return Unit("km s**-1", 1e3, 1, -1, 0); }
Unit km2_per_s2()    { return Unit("km**2 s**-2", 1e6, 2, -2, 0); }
Unit m2_per_s2()     { return Unit("m**2 s**-2", 1.0, 2, -2, 0); }
Unit Gyr()           { return Unit("Gyr", GYR_IN_S, 0, 1, 0); }
Unit Msol()          { return Unit("Msol", MSOL_IN_KG, 0, 0, 1); }

Unit kpc2_per_Gyr2() {
    const double s = KPC_IN_M / GYR_IN_S;
    return Unit("kpc**2 Gyr**-2", s * s, 2, -2, 0);
}

Unit no_unit() {
    return Unit("unknown", 1.0, UNKNOWN_DIM, UNKNOWN_DIM, UNKNOWN_DIM);
}

}  // namespace kdc::units
