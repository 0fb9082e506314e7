/// @file src/numeric/reference_curve.cpp
/// @brief Piecewise-linear reference curve with explicit tie-breaking.

#include "kdc/numeric.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace kdc::numeric {

std::optional<ReferenceCurve>
ReferenceCurve::build(std::span<const double> x, std::span<const double> y) {
    if (x.size() != y.size()) {
        return std::nullopt;
    }

    std::vector<std::size_t> order;
    order.reserve(x.size());
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (std::isfinite(x[i]) && std::isfinite(y[i])) {
            order.push_back(i);
        }
    }
    std::stable_sort(order.begin(), order.end(),
                     [&x](std::size_t a, std::size_t b) { return x[a] < x[b]; });

    ReferenceCurve curve;
    curve.x_.reserve(order.size());
    curve.y_.reserve(order.size());

    for (const std::size_t i : order) {
        const double xi = x[i];
        const double yi = y[i];
        if (!curve.x_.empty()) {
            const double prev  = curve.x_.back();
            const double scale = std::max(std::abs(prev), std::abs(xi));
            if (xi - prev <= constants::CURVE_DUPLICATE_RTOL * scale) {
                curve.y_.back() = std::max(curve.y_.back(), yi);
                continue;
            }
        }
        curve.x_.push_back(xi);
        curve.y_.push_back(yi);
    }

    curve.dropped_ = x.size() - curve.x_.size();
    if (curve.x_.size() < 2) {
        return std::nullopt;
    }
    return curve;
}

double ReferenceCurve::operator()(double x) const noexcept {
    if (!(x >= x_.front() && x <= x_.back())) {
        return std::nan("");
    }
    // First abscissa strictly greater than x; x_max itself maps to the
    // last segment.
    auto it = std::upper_bound(x_.begin(), x_.end(), x);
    if (it == x_.end()) {
        return y_.back();
    }
    const auto k = static_cast<std::size_t>(it - x_.begin());
    const double x0 = x_[k - 1];
    const double x1 = x_[k];
    const double t  = (x - x0) / (x1 - x0);
    return y_[k - 1] + t * (y_[k] - y_[k - 1]);
}

}  // namespace kdc::numeric
