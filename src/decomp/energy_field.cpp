/// @file src/decomp/energy_field.cpp
/// @brief Energy Field Builder: total specific energy of every particle.

#include "kdc/decomp.hpp"
#include "kdc/log.hpp"

#include <utility>

namespace kdc::decomp {

std::optional<EnergyField> build_energy_field(const ParticleSet& set) {
    const units::Unit ke_unit = set.kinetic_energy_unit();

    // Put the potential into the kinetic-energy basis before adding.
    const auto phi = set.potential_in(ke_unit);
    if (!phi) {
        log::error("potential unit '{}' cannot be converted to kinetic energy unit '{}'",
                   set.potential_unit().name(), ke_unit.name());
        return std::nullopt;
    }

    const auto stars = set.stars();
    if (stars.empty()) {
        log::error("energy reference needs at least one star particle");
        return std::nullopt;
    }

    ScalarField te = set.kinetic_energy() + *phi;
    const double te_max = stars.gather(te).maxCoeff();

    // Offset so the population is 'fully bound': the least bound star
    // sits at zero.
    te.array() -= te_max;
    log::info("te_max = {:.2e}", te_max);

    return EnergyField{
        .te     = std::move(te),
        .te_max = te_max,
        .unit   = ke_unit,
    };
}

}  // namespace kdc::decomp
