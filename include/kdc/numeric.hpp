#pragma once

/// @file include/kdc/numeric.hpp
/// @brief Scalar root finding and 1-D interpolation.
///
/// # Module: Numeric
///
/// ## Responsibility
///   - `bisect`         — bisection on a scalar objective over [lo, hi]
///   - `ReferenceCurve` — piecewise-linear y(x) built from noisy, possibly
///                        unsorted samples, undefined (NaN) outside its range
///
/// ## Guarantees
/// - `bisect` always terminates (tolerance, |f| < eta, or max_iterations)
/// - `ReferenceCurve` abscissae are strictly increasing after construction

#include "kdc/constants.hpp"

#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace kdc::numeric {

// ─── Bisection ────────────────────────────────────────────────────────────────

struct BisectConfig {
    /// Absolute interval width at which to stop. Non-positive means
    /// (hi − lo) × BISECT_RELATIVE_TOLERANCE.
    double tolerance = 0.0;

    /// Stop early once |f(mid)| < eta.
    double eta = 0.0;

    int max_iterations = constants::BISECT_MAX_ITERATIONS;
};

struct BisectResult {
    double root;        ///< Midpoint of the final interval
    int    iterations;  ///< Objective evaluations performed
    bool   bracketed;   ///< f changed sign between evaluated points
};

/// Bisection on f over [lo, hi].
///
/// At each step f is evaluated at the midpoint; if f(mid) > 0 the upper
/// bound moves to mid, otherwise (including NaN) the lower bound does. The
/// objective is assumed to increase through its root; a function that
/// never changes sign drives the result to one end of the interval and is
/// reported with `bracketed == false`.
[[nodiscard]] BisectResult bisect(double lo, double hi,
                                  const std::function<double(double)>& f,
                                  const BisectConfig& config = BisectConfig{});

// ─── ReferenceCurve ───────────────────────────────────────────────────────────

class ReferenceCurve {
public:
    /// Build from paired samples in any order.
    ///
    /// Pairs with a non-finite coordinate are dropped. Samples are sorted
    /// by x; runs of x-values equal within CURVE_DUPLICATE_RTOL collapse
    /// to the sample with the largest y.
    ///
    /// # Returns
    /// `nullopt` if the sizes differ or fewer than two distinct abscissae
    /// remain.
    [[nodiscard]] static std::optional<ReferenceCurve>
    build(std::span<const double> x, std::span<const double> y);

    /// Linear interpolation inside [x_min, x_max]; NaN outside (and for a
    /// NaN argument).
    [[nodiscard]] double operator()(double x) const noexcept;

    [[nodiscard]] double x_min() const noexcept { return x_.front(); }
    [[nodiscard]] double x_max() const noexcept { return x_.back(); }

    [[nodiscard]] const std::vector<double>& x() const noexcept { return x_; }
    [[nodiscard]] const std::vector<double>& y() const noexcept { return y_; }

    /// Input samples removed as non-finite or duplicate.
    [[nodiscard]] std::size_t dropped() const noexcept { return dropped_; }

private:
    ReferenceCurve() = default;

    std::vector<double> x_;
    std::vector<double> y_;
    std::size_t         dropped_ = 0;
};

}  // namespace kdc::numeric
