/**
 * @file  prop_jcirc_nonnegative.cpp
 * @brief Property: ∀ te: j_circ(te) ≥ 0, +inf above the circular energy
 *        range, innermost bin value below it.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_jcirc_nonnegative
 *
 * The reference profile is built once from a thin exponential disc in a
 * Hernquist potential; energies are drawn across and well beyond its range.
 *
 * Failure modes this test guards against:
 *   • Linear extrapolation producing negative angular momentum
 *   • NaN escaping from the log10 branch for positive energies
 *   • Clamp order (above / below) applied the wrong way round
 */

#include <rapidcheck.h>

#include <cmath>
#include <optional>
#include <vector>

#include "kdc/decomp.hpp"
#include "kdc/log.hpp"

using namespace kdc;

namespace {

/// Ring of circular orbits in a Hernquist potential (GM = 3.2e5, a = 2 kpc).
profile::RadialProfile make_profile() {
    constexpr Eigen::Index n = 2000;
    ParticleSet set(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double R  = 0.2 + 20.0 * static_cast<double>(i) / static_cast<double>(n);
        const double th = 2.399963 * static_cast<double>(i);
        const double vc = std::sqrt(3.2e5 * R) / (R + 2.0);
        set.positions().row(i)  = Eigen::RowVector3d(R * std::cos(th), R * std::sin(th), 0.0);
        set.velocities().row(i) = Eigen::RowVector3d(-vc * std::sin(th), vc * std::cos(th), 0.0);
        set.potential()(i) = -3.2e5 / (R + 2.0);
    }
    return *profile::RadialProfile::build(set.all(), 20, units::km2_per_s2());
}

}  // namespace

int main() {
    kdc::log::set_threshold(kdc::log::Level::Error);
    const profile::RadialProfile pro = make_profile();
    const double e_min = pro.e_circ().minCoeff();
    const double e_max = pro.e_circ().maxCoeff();

    for (const bool log_interp : {false, true}) {
        rc::check(
            log_interp ? "jcirc_from_energy (log10): non-negative, clamped"
                       : "jcirc_from_energy (linear): non-negative, clamped",
            [&](double raw) {
                // Map to roughly [2 e_min, −2 e_min].
                const double te = std::tanh(raw * 1e-3) * 2.0 * std::abs(e_min);

                ScalarField e(1);
                e(0) = te;
                const auto j = decomp::jcirc_from_energy(pro, e, log_interp);
                RC_ASSERT(j.has_value());

                const double v = (*j)(0);
                RC_ASSERT(!std::isnan(v));
                RC_ASSERT(v >= 0.0);
                if (te > e_max) {
                    RC_ASSERT(std::isinf(v));
                } else if (te < e_min) {
                    RC_ASSERT(v == pro.j_circ()(0));
                } else {
                    RC_ASSERT(std::isfinite(v));
                }
            }
        );
    }

    return 0;
}
