/// @file src/numeric/bisect.cpp
/// @brief Bisection root finder.

#include "kdc/numeric.hpp"

#include <cmath>

namespace kdc::numeric {

BisectResult bisect(double lo, double hi,
                    const std::function<double(double)>& f,
                    const BisectConfig& config) {
    const double tol = config.tolerance > 0.0
        ? config.tolerance
        : std::abs(hi - lo) * constants::BISECT_RELATIVE_TOLERANCE;

    bool saw_positive = false;
    bool saw_other    = false;

    int iterations = 0;
    double mid = 0.5 * (lo + hi);
    while (iterations < config.max_iterations) {
        mid = 0.5 * (lo + hi);
        const double fm = f(mid);
        ++iterations;

        if (std::abs(hi - lo) < tol || std::abs(fm) < config.eta) {
            break;
        }
        if (fm > 0.0) {
            saw_positive = true;
            hi = mid;
        } else {
            saw_other = true;
            lo = mid;
        }
    }

    return BisectResult{
        .root       = mid,
        .iterations = iterations,
        .bracketed  = saw_positive && saw_other,
    };
}

}  // namespace kdc::numeric
