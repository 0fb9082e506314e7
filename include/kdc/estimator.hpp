#pragma once

/// @file include/kdc/estimator.hpp
/// @brief Circular angular momentum as an upper quantile of |j|² per
///        energy bin.
///
/// # Module: Estimator
///
/// ## Responsibility
/// A statistical alternative to the rotation-curve reference used by
/// `decomp`: bin the particles by total energy `te` (equal population) and
/// take, per bin, a high quantile of the squared scalar angular momentum
/// as the circular value. Diagnostic only; `decomp` does not use it.
///
/// Requires the `te` field (attach it with `decomp::apply` or by hand).

#include "kdc/constants.hpp"
#include "kdc/particles.hpp"
#include "kdc/profile.hpp"

#include <optional>

namespace kdc::decomp {

struct EstimatorConfig {
    std::size_t particles_per_bin = constants::DEFAULT_PARTICLES_PER_BIN;
    double      quantile          = constants::DEFAULT_JCIRC_QUANTILE;
};

/// Attach `jcirc2` (bin quantile of |j|²) and `jcirc` = √jcirc2 to every
/// particle of `set`.
///
/// # Returns
/// The quantile profile, or `nullopt` if `te` is missing, the quantile is
/// outside [0, 1], or the set is smaller than one bin.
[[nodiscard]] std::optional<profile::QuantileProfile>
estimate_jcirc_from_energy(ParticleSet& set, const EstimatorConfig& config = EstimatorConfig{});

}  // namespace kdc::decomp
