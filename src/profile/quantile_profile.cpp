/// @file src/profile/quantile_profile.cpp
/// @brief Per-bin quantiles over equal-population bins.

#include "kdc/profile.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace kdc::profile {

double quantile_of(std::vector<double>& values, double q) noexcept {
    if (values.empty()) {
        return std::nan("");
    }
    std::sort(values.begin(), values.end());

    const double      pos = q * static_cast<double>(values.size() - 1);
    const auto        lo  = static_cast<std::size_t>(std::floor(pos));
    const std::size_t hi  = std::min(lo + 1, values.size() - 1);
    const double      t   = pos - static_cast<double>(lo);
    if (t == 0.0) {
        return values[lo];
    }
    return values[lo] + t * (values[hi] - values[lo]);
}

std::optional<QuantileProfile>
QuantileProfile::build(std::span<const double> x, std::span<const double> y,
                       double q, int nbins) {
    if (x.size() != y.size() || !(q >= 0.0 && q <= 1.0)) {
        return std::nullopt;
    }
    auto binning = equal_population_bins(x, nbins);
    if (!binning) {
        return std::nullopt;
    }

    const auto nb = static_cast<std::size_t>(nbins);
    std::vector<std::vector<double>> members(nb);
    for (std::size_t b = 0; b < nb; ++b) {
        members[b].reserve(static_cast<std::size_t>(binning->counts[b]));
    }

    QuantileProfile p;
    p.q_      = q;
    p.x_mean_ = ScalarField::Zero(nbins);
    p.values_ = ScalarField::Zero(nbins);

    for (std::size_t i = 0; i < x.size(); ++i) {
        const auto b = static_cast<std::size_t>(binning->bin_of[i]);
        members[b].push_back(y[i]);
        p.x_mean_(static_cast<Eigen::Index>(b)) += x[i];
    }
    for (std::size_t b = 0; b < nb; ++b) {
        const auto k = static_cast<Eigen::Index>(b);
        p.x_mean_(k) /= static_cast<double>(binning->counts[b]);
        p.values_(k)  = quantile_of(members[b], q);
    }
    p.binning_ = std::move(*binning);
    return p;
}

ScalarField QuantileProfile::map_back() const {
    ScalarField out(static_cast<Eigen::Index>(binning_.bin_of.size()));
    for (std::size_t i = 0; i < binning_.bin_of.size(); ++i) {
        out(static_cast<Eigen::Index>(i)) = values_(binning_.bin_of[i]);
    }
    return out;
}

double QuantileProfile::value_at(double x) const noexcept {
    return values_(locate_bin(binning_.edges, x));
}

}  // namespace kdc::profile
