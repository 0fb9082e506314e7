/// @file src/decomp/rotation_curve.cpp
/// @brief Rotation-Curve Profiler: disc subset → equal-population profile.

#include "kdc/decomp.hpp"
#include "kdc/log.hpp"

namespace kdc::decomp {

std::optional<profile::RadialProfile>
build_rotation_curve(const ParticleSet& set, const EnergyField& energy,
                     const DecompConfig& config) {
    log::info("Making disk rotation curve...");

    if (config.particles_per_bin == 0) {
        log::error("particles_per_bin must be positive");
        return std::nullopt;
    }

    // Everything inside a vertical height of a few softening lengths.
    const double eps_min     = set.size() > 0 ? set.softening().minCoeff() : 0.0;
    const double half_height = eps_min * config.disc_height_factor;
    const auto   disc        = disc_subset(set, config.disc_outer_radius, half_height);

    const auto nbins = static_cast<int>(
        static_cast<std::size_t>(disc.size()) / config.particles_per_bin);
    log::debug("disc subset: {} particles within |z| < {:.3g} kpc, {} bins",
               disc.size(), half_height, nbins);

    if (nbins < 1) {
        log::error("disc subset of {} particles is too small for {} particles per bin",
                   disc.size(), config.particles_per_bin);
        return std::nullopt;
    }

    auto pro = profile::RadialProfile::build(disc, nbins, energy.unit);
    if (!pro) {
        log::error("could not build a {}-bin radial profile in '{}'",
                   nbins, energy.unit.name());
        return std::nullopt;
    }

    // Same reference as the particle energies; E_circ follows.
    pro->shift_potential(energy.te_max);
    return pro;
}

}  // namespace kdc::decomp
