/// @file src/decomp/circular_reference.cpp
/// @brief Circular-Reference Mapper: per-particle j_circ and jz / j_circ.

#include "kdc/decomp.hpp"
#include "kdc/log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <span>
#include <utility>

namespace kdc::decomp {

namespace {

std::span<const double> as_span(const ScalarField& v) {
    return {v.data(), static_cast<std::size_t>(v.size())};
}

// Merged or dropped bins can leave the curve narrower than the raw
// E_circ range; energies in that gap take the nearest curve end.
double clamp_to(const numeric::ReferenceCurve& curve, double x) noexcept {
    return std::clamp(x, curve.x_min(), curve.x_max());
}

}  // namespace

std::optional<ScalarField>
jcirc_from_energy(const profile::RadialProfile& profile, const ScalarField& te,
                  bool log_interp) {
    const ScalarField& e_circ = profile.e_circ();
    const ScalarField& j_circ = profile.j_circ();

    ScalarField out(te.size());

    if (log_interp) {
        // Bins with j_circ == 0 give log10 = -inf and are dropped by the
        // curve; only the energies must all be bound.
        if ((e_circ.array() >= 0.0).any()) {
            log::error("log interpolation needs E_circ < 0 in every bin");
            return std::nullopt;
        }
        const ScalarField x = (-e_circ).array().log10();
        const ScalarField y = j_circ.array().log10();
        const auto curve = numeric::ReferenceCurve::build(as_span(x), as_span(y));
        if (!curve) {
            log::error("E_circ -> j_circ curve has fewer than two distinct energies");
            return std::nullopt;
        }
        if (curve->dropped() > 0) {
            log::debug("reference curve: {} duplicate or non-finite bins merged",
                       curve->dropped());
        }
        for (Eigen::Index i = 0; i < te.size(); ++i) {
            // log10 of a non-negative argument is NaN or -inf; such
            // energies lie above the curve and are clamped below.
            const double xi = std::log10(-te(i));
            out(i) = std::isfinite(xi) ? std::pow(10.0, (*curve)(clamp_to(*curve, xi)))
                                       : std::nan("");
        }
    } else {
        const auto curve = numeric::ReferenceCurve::build(as_span(e_circ), as_span(j_circ));
        if (!curve) {
            log::error("E_circ -> j_circ curve has fewer than two distinct energies");
            return std::nullopt;
        }
        if (curve->dropped() > 0) {
            log::debug("reference curve: {} duplicate or non-finite bins merged",
                       curve->dropped());
        }
        for (Eigen::Index i = 0; i < te.size(); ++i) {
            out(i) = std::isfinite(te(i)) ? (*curve)(clamp_to(*curve, te(i)))
                                          : std::nan("");
        }
    }

    // Close-to-unbound particles go to the spheroid; the few below the
    // innermost bin take its value rather than an extrapolation.
    const double e_max   = e_circ.maxCoeff();
    const double e_min   = e_circ.minCoeff();
    const double j_inner = j_circ(0);
    for (Eigen::Index i = 0; i < te.size(); ++i) {
        if (te(i) > e_max) {
            out(i) = std::numeric_limits<double>::infinity();
        } else if (te(i) < e_min) {
            out(i) = j_inner;
        }
    }
    return out;
}

std::optional<CircularReference>
map_circular_reference(const ParticleSet& set, const profile::RadialProfile& profile,
                       const ScalarField& te, const DecompConfig& config) {
    CircularReference ref;

    if (config.source == CircularSource::ByRadius) {
        ref.j_circ = profile.map_back(profile::Quantity::JCirc, set);
        ref.e_circ = profile.map_back(profile::Quantity::ECirc, set);
    } else {
        auto j = jcirc_from_energy(profile, te, config.log_interp);
        if (!j) {
            return std::nullopt;
        }
        ref.j_circ = std::move(*j);

        const double e_max = profile.e_circ().maxCoeff();
        const double e_min = profile.e_circ().minCoeff();
        ref.n_above_range = (te.array() > e_max).count();
        ref.n_below_range = (te.array() < e_min).count();
        log::info("j_circ clamped: {} particles above E_circ range (+inf), {} below",
                  ref.n_above_range, ref.n_below_range);
    }

    const Vec3Array j = set.angular_momentum();
    ref.jz_by_jzcirc = j.col(2).cwiseQuotient(ref.j_circ);
    return ref;
}

}  // namespace kdc::decomp
