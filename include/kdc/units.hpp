#pragma once

/// @file include/kdc/units.hpp
/// @brief Minimal dimensional unit system.
///
/// # Module: Units
///
/// ## Responsibility
/// Carry the physical unit of per-particle arrays (velocity, potential) so
/// the potential can be converted into the kinetic-energy basis before the
/// two are added. A unit is a scale factor to SI plus integer exponents of
/// length, time and mass.
///
/// ## Guarantees
/// - `ratio_to` returns `nullopt` for dimensionally incompatible units; it
///   never silently rescales across dimensions

#include <optional>
#include <string>

namespace kdc::units {

/// A physical unit: `si_scale` × m^length × s^time × kg^mass.
class Unit {
public:
    Unit(std::string name, double si_scale, int length, int time, int mass);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] double si_scale() const noexcept { return si_scale_; }

    /// True if both units have identical dimension exponents.
    [[nodiscard]] bool same_dimension(const Unit& other) const noexcept;

    /// Factor f such that a value in *this equals f × the value in `target`.
    ///
    /// # Returns
    /// `nullopt` if the dimensions differ.
    [[nodiscard]] std::optional<double> ratio_to(const Unit& target) const noexcept;

    /// The unit squared, e.g. km/s → km²/s².
    [[nodiscard]] Unit squared() const;

    [[nodiscard]] bool operator==(const Unit& other) const noexcept;

private:
    std::string name_;
    double      si_scale_;
    int         length_;
    int         time_;
    int         mass_;
};

// ─── Predefined Units ─────────────────────────────────────────────────────────

[[nodiscard]] Unit kpc();
[[nodiscard]] Unit km_per_s();
[[nodiscard]] Unit km2_per_s2();
[[nodiscard]] Unit kpc2_per_Gyr2();
[[nodiscard]] Unit m2_per_s2();
[[nodiscard]] Unit Gyr();
[[nodiscard]] Unit Msol();

/// Placeholder for arrays whose unit is unknown. Not convertible to
/// anything except itself.
[[nodiscard]] Unit no_unit();

}  // namespace kdc::units
