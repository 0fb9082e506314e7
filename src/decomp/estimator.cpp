/// @file src/decomp/estimator.cpp
/// @brief Quantile-based circular angular momentum from energy.

#include "kdc/estimator.hpp"
#include "kdc/log.hpp"

#include <span>
#include <utility>

namespace kdc::decomp {

std::optional<profile::QuantileProfile>
estimate_jcirc_from_energy(ParticleSet& set, const EstimatorConfig& config) {
    const auto te = set.field("te");
    if (!te) {
        log::error("estimate_jcirc_from_energy needs the 'te' field; run decomp first");
        return std::nullopt;
    }
    if (config.particles_per_bin == 0) {
        log::error("particles_per_bin must be positive");
        return std::nullopt;
    }

    const auto nbins = static_cast<int>(
        static_cast<std::size_t>(set.size()) / config.particles_per_bin);

    const ScalarField j2 = set.angular_momentum().rowwise().squaredNorm();

    auto pro = profile::QuantileProfile::build(
        std::span<const double>(te->data(), static_cast<std::size_t>(te->size())),
        std::span<const double>(j2.data(), static_cast<std::size_t>(j2.size())),
        config.quantile, nbins);
    if (!pro) {
        log::error("could not build a {}-bin quantile profile (q = {})",
                   nbins, config.quantile);
        return std::nullopt;
    }

    ScalarField jcirc2 = pro->map_back();
    ScalarField jcirc  = jcirc2.cwiseSqrt();
    set.set_field("jcirc2", std::move(jcirc2));
    set.set_field("jcirc", std::move(jcirc));
    return pro;
}

}  // namespace kdc::decomp
