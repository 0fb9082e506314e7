/// @file src/decomp/decomp.cpp
/// @brief Decomposition pipeline: decompose / apply / decomp.

#include "kdc/decomp.hpp"
#include "kdc/frame.hpp"
#include "kdc/log.hpp"

#include <cmath>
#include <utility>

namespace kdc::decomp {

// ─── DecompConfig ─────────────────────────────────────────────────────────────

const char* to_string(CircularSource s) noexcept {
    switch (s) {
        case CircularSource::ByEnergy: return "by-energy";
        case CircularSource::ByRadius: return "by-radius";
    }
    return "unknown";
}

bool DecompConfig::validate() const noexcept {
    if (!std::isfinite(j_disk_min) || !std::isfinite(j_disk_max) || j_disk_min >= j_disk_max) {
        return false;
    }
    if (energy_cut && std::isnan(*energy_cut)) {
        return false;
    }
    if (particles_per_bin == 0) {
        return false;
    }
    if (!aligned && !(angmom_size > 0.0)) {
        return false;
    }
    if (!(disc_outer_radius > 0.0) || !(disc_height_factor > 0.0)) {
        return false;
    }
    if (!std::isfinite(j_crit_lo) || !std::isfinite(j_crit_hi) || j_crit_lo >= j_crit_hi) {
        return false;
    }
    return bisect.max_iterations > 0;
}

// ─── decompose ────────────────────────────────────────────────────────────────

std::optional<DecompResult> decompose(ParticleSet& set, const DecompConfig& config) {
    if (!config.validate()) {
        log::error("invalid decomposition configuration");
        return std::nullopt;
    }
    if (set.count(Family::Star) == 0) {
        log::error("snapshot has no star particles to decompose");
        return std::nullopt;
    }

    // Centre, remove bulk motion and rotate the disk into the x-y plane for
    // the duration of this call.
    std::optional<frame::ScopedFrame> guard;
    if (config.aligned) {
        guard.emplace(frame::identity(set));
    } else {
        guard = frame::align(set, frame::AlignConfig{.disk_size = config.angmom_size});
        if (!guard) {
            return std::nullopt;
        }
    }

    auto energy = build_energy_field(set);
    if (!energy) {
        return std::nullopt;
    }

    auto pro = build_rotation_curve(set, *energy, config);
    if (!pro) {
        return std::nullopt;
    }

    auto ref = map_circular_reference(set, *pro, energy->te, config);
    if (!ref) {
        return std::nullopt;
    }

    const auto        stars      = set.stars();
    const ScalarField te_star    = stars.gather(energy->te);
    const ScalarField ratio_star = stars.gather(ref->jz_by_jzcirc);
    const ScalarField v_star     = stars.gather(set.vcxy());

    const CriticalRatio critical = solve_critical_ratio(
        v_star, ratio_star, config.j_disk_min, config.j_crit_lo, config.j_crit_hi,
        config.bisect);

    const double e_cut = config.energy_cut.value_or(median(te_star));
    log::info("E_cut = {:.2e}", e_cut);

    LabelField labels = classify_components(te_star, ratio_star, ClassifyParams{
        .e_cut      = e_cut,
        .j_crit     = critical.j_crit,
        .j_disk_min = config.j_disk_min,
        .j_disk_max = config.j_disk_max,
    });

    const auto counts = component_counts(labels);
    log::info("components: thin disk {}, halo {}, bulge {}, thick disk {}, pseudo bulge {}",
              counts[1], counts[2], counts[3], counts[4], counts[5]);

    return DecompResult{
        .star_indices  = stars.indices(),
        .labels        = std::move(labels),
        .te            = std::move(energy->te),
        .j_circ        = std::move(ref->j_circ),
        .jz_by_jzcirc  = std::move(ref->jz_by_jzcirc),
        .e_circ        = std::move(ref->e_circ),
        .profile       = std::move(*pro),
        .te_max        = energy->te_max,
        .e_cut         = e_cut,
        .critical      = critical,
        .n_above_range = ref->n_above_range,
        .n_below_range = ref->n_below_range,
    };
}

// ─── apply ────────────────────────────────────────────────────────────────────

bool apply(ParticleSet& set, const DecompResult& result) {
    if (result.te.size() != set.size() ||
        set.indices(Family::Star) != result.star_indices) {
        log::error("decomposition result does not match this particle set");
        return false;
    }

    set.set_field("te", result.te);
    set.set_field("j_circ", result.j_circ);
    set.set_field("jz_by_jzcirc", result.jz_by_jzcirc);
    if (result.e_circ) {
        set.set_field("E_circ", *result.e_circ);
    }

    LabelField& labels = set.ensure_star_labels();
    for (Eigen::Index k = 0; k < result.labels.size(); ++k) {
        if (result.labels(k) != static_cast<int>(ComponentLabel::Unset)) {
            labels(k) = result.labels(k);
        }
    }
    return true;
}

// ─── decomp ───────────────────────────────────────────────────────────────────

std::optional<profile::RadialProfile> decomp(ParticleSet& set, const DecompConfig& config) {
    auto result = decompose(set, config);
    if (!result || !apply(set, *result)) {
        return std::nullopt;
    }
    return std::move(result->profile);
}

}  // namespace kdc::decomp
