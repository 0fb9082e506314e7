/// @file src/profile/binning.cpp
/// @brief Equal-population binning shared by the radial and quantile
///        profiles.

#include "kdc/profile.hpp"

#include <algorithm>
#include <cmath>
#include <new>
#include <numeric>

namespace kdc::profile {

std::optional<Binning>
equal_population_bins(std::span<const double> x, int nbins) noexcept {
    const std::size_t n = x.size();
    if (nbins < 1 || static_cast<std::size_t>(nbins) > n) {
        return std::nullopt;
    }
    if (std::any_of(x.begin(), x.end(), [](double v) { return std::isnan(v); })) {
        return std::nullopt;
    }

    try {
        std::vector<std::size_t> order(n);
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(),
                         [&x](std::size_t a, std::size_t b) { return x[a] < x[b]; });

        const auto nb = static_cast<std::size_t>(nbins);
        Binning out;
        out.nbins = nbins;
        out.bin_of.assign(n, 0);
        out.counts.assign(nb, 0);
        out.edges.assign(nb + 1, 0.0);

        std::size_t prev_bin = nb;  // sentinel: no bin seen yet
        for (std::size_t i = 0; i < n; ++i) {
            const std::size_t b = (i * nb) / n;
            out.bin_of[order[i]] = static_cast<int>(b);
            ++out.counts[b];
            if (b != prev_bin) {
                out.edges[b] = x[order[i]];
                prev_bin = b;
            }
        }
        out.edges[nb] = x[order[n - 1]];
        return out;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

int locate_bin(std::span<const double> edges, double x) noexcept {
    if (edges.size() < 3) {
        return 0;
    }
    // Interior edges only: below the first interior edge is bin 0, at or
    // above the last one is the final bin.
    const auto first = edges.begin() + 1;
    const auto last  = edges.end() - 1;
    return static_cast<int>(std::upper_bound(first, last, x) - first);
}

}  // namespace kdc::profile
