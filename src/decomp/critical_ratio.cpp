/// @file src/decomp/critical_ratio.cpp
/// @brief Critical-Ratio Solver: spheroid/disk angular momentum boundary.

#include "kdc/decomp.hpp"
#include "kdc/log.hpp"

#include <cmath>

namespace kdc::decomp {

double mean_rotation_below(const ScalarField& vcxy, const ScalarField& ratio,
                           double c) noexcept {
    double       sum = 0.0;
    Eigen::Index n   = 0;
    for (Eigen::Index i = 0; i < ratio.size(); ++i) {
        if (ratio(i) < c) {
            sum += vcxy(i);
            ++n;
        }
    }
    return n > 0 ? sum / static_cast<double>(n) : std::nan("");
}

CriticalRatio
solve_critical_ratio(const ScalarField& vcxy, const ScalarField& ratio,
                     double j_disk_min, double lo, double hi,
                     const numeric::BisectConfig& bisect) {
    log::info("Finding spheroid/disk angular momentum boundary...");

    const auto objective = [&](double c) { return mean_rotation_below(vcxy, ratio, c); };
    const auto found = numeric::bisect(lo, hi, objective, bisect);

    CriticalRatio out{
        .j_crit     = found.root,
        .solved     = found.root,
        .clamped    = false,
        .bracketed  = found.bracketed,
        .scanned    = false,
        .iterations = found.iterations,
    };

    if (!found.bracketed) {
        // The objective never changed sign under bisection; take the grid
        // point where the sub-threshold rotation is closest to zero.
        double best   = found.root;
        double best_f = std::abs(objective(found.root));
        for (int k = 0; k < constants::J_CRIT_SCAN_POINTS; ++k) {
            const double c = lo + (hi - lo) * k / (constants::J_CRIT_SCAN_POINTS - 1);
            const double f = std::abs(objective(c));
            if (std::isfinite(f) && !(f >= best_f)) {
                best   = c;
                best_f = f;
            }
        }
        log::info("bisection saw no sign change after {} steps; direct scan gives {:.2e}",
                  found.iterations, best);
        out.j_crit  = best;
        out.solved  = best;
        out.scanned = true;
    }

    log::info("j_crit = {:.2e}", out.j_crit);

    if (out.j_crit > j_disk_min) {
        log::warning("!! j_crit exceeds j_disk_min. This is usually a sign that "
                     "something is going wrong (train-wreck galaxy?)");
        log::warning("!! j_crit will be reset to j_disk_min={:.2e}", j_disk_min);
        out.j_crit  = j_disk_min;
        out.clamped = true;
    }
    return out;
}

}  // namespace kdc::decomp
