/// @file src/profile/radial_profile.cpp
/// @brief Equal-population cylindrical rotation curve.

#include "kdc/profile.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace kdc::profile {

// ─── Construction ─────────────────────────────────────────────────────────────

RadialProfile::RadialProfile(units::Unit energy_unit)
    : energy_unit_(std::move(energy_unit)) {}

std::optional<RadialProfile>
RadialProfile::build(const ParticleView& subset, int nbins,
                     const units::Unit& energy_unit) {
    const ParticleSet& set = subset.set();

    const auto phi_all = set.potential_in(energy_unit);
    if (!phi_all) {
        return std::nullopt;
    }

    const ScalarField r   = subset.gather(set.rxy());
    const ScalarField phi = subset.gather(*phi_all);

    const auto binning = equal_population_bins(
        std::span<const double>(r.data(), static_cast<std::size_t>(r.size())), nbins);
    if (!binning) {
        return std::nullopt;
    }

    RadialProfile p(energy_unit);
    p.nbins_  = nbins;
    p.rbins_  = ScalarField::Zero(nbins);
    p.phi_    = ScalarField::Zero(nbins);
    p.counts_ = LabelField::Zero(nbins);
    p.edges_  = Eigen::Map<const ScalarField>(binning->edges.data(), nbins + 1);

    for (Eigen::Index i = 0; i < r.size(); ++i) {
        const int b = binning->bin_of[static_cast<std::size_t>(i)];
        p.rbins_(b) += r(i);
        p.phi_(b)   += phi(i);
        p.counts_(b) += 1;
    }
    // Equal-population bins are never empty.
    p.rbins_.array() /= p.counts_.cast<double>().array();
    p.phi_.array()   /= p.counts_.cast<double>().array();

    const ScalarField force = radial_force_term(p.rbins_, p.phi_);
    p.v_circ_ = force.unaryExpr([](double f) {
        return std::isfinite(f) && f > 0.0 ? std::sqrt(f) : 0.0;
    });
    p.j_circ_ = p.rbins_.cwiseProduct(p.v_circ_);
    p.e_circ_ = p.phi_ + 0.5 * p.v_circ_.cwiseAbs2();
    return p;
}

ScalarField radial_force_term(const ScalarField& r, const ScalarField& phi) {
    const Eigen::Index n = r.size();
    ScalarField out = ScalarField::Zero(n);
    if (n < 2) {
        return out;
    }

    auto slope = [&](Eigen::Index a, Eigen::Index b) {
        const double dr = r(b) - r(a);
        return dr != 0.0 ? (phi(b) - phi(a)) / dr : 0.0;
    };

    out(0)     = slope(0, 1);
    out(n - 1) = slope(n - 2, n - 1);
    for (Eigen::Index i = 1; i + 1 < n; ++i) {
        const double h1 = r(i) - r(i - 1);
        const double h2 = r(i + 1) - r(i);
        if (h1 > 0.0 && h2 > 0.0) {
            // Second-order derivative on a non-uniform grid.
            out(i) = (h1 * h1 * phi(i + 1) - h2 * h2 * phi(i - 1)
                      + (h2 * h2 - h1 * h1) * phi(i))
                     / (h1 * h2 * (h1 + h2));
        } else {
            out(i) = slope(i - 1, i + 1);
        }
    }
    return r.cwiseProduct(out);
}

// ─── Accessors ────────────────────────────────────────────────────────────────

const ScalarField& RadialProfile::quantity(Quantity q) const noexcept {
    switch (q) {
        case Quantity::Phi:   return phi_;
        case Quantity::VCirc: return v_circ_;
        case Quantity::JCirc: return j_circ_;
        case Quantity::ECirc: return e_circ_;
    }
    return phi_;
}

void RadialProfile::shift_potential(double offset) noexcept {
    phi_.array()    -= offset;
    e_circ_.array() -= offset;
}

int RadialProfile::bin_of(double r) const noexcept {
    return locate_bin(std::span<const double>(edges_.data(),
                                              static_cast<std::size_t>(edges_.size())),
                      r);
}

ScalarField RadialProfile::map_back(Quantity q, const ParticleSet& target) const {
    const ScalarField& values = quantity(q);
    const ScalarField  r      = target.rxy();

    ScalarField out(target.size());
    for (Eigen::Index i = 0; i < target.size(); ++i) {
        out(i) = values(bin_of(r(i)));
    }
    return out;
}

}  // namespace kdc::profile
