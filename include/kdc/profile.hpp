#pragma once

/// @file include/kdc/profile.hpp
/// @brief Equal-population profiles: radial rotation curve and per-bin
///        quantiles.
///
/// # Module: Profile
///
/// ## Responsibility
/// Bin a particle population into bins of (nearly) equal particle count and
/// expose per-bin reference quantities, plus the inverse operation of
/// broadcasting a bin quantity back to particles ("map back").
///
/// ## RadialProfile
/// Bins in cylindrical radius R. Per bin:
///   - phi     count-weighted mean potential (energy unit chosen at build)
///   - v_circ  √max(0, R dphi/dR), derivative by non-uniform central
///             differences of the binned potential (one-sided at the ends)
///   - j_circ  R · v_circ
///   - E_circ  phi + v_circ² / 2
///
/// ## QuantileProfile
/// Bins in an arbitrary abscissa x; per bin the q-quantile of a quantity y
/// (linear interpolation between order statistics, q = 1 is the maximum).
///
/// ## NOT Responsible For
/// - General profile statistics (dispersions, surface densities, ...)
/// - Choosing which particles to profile (see particles.hpp filters)

#include "kdc/particles.hpp"
#include "kdc/types.hpp"
#include "kdc/units.hpp"

#include <optional>
#include <span>
#include <vector>

namespace kdc::profile {

// ─── Equal-population binning ─────────────────────────────────────────────────

/// Assignment of values to equal-population bins.
struct Binning {
    int              nbins = 0;
    std::vector<int> bin_of;  ///< Bin index of every input value
    std::vector<int> counts;  ///< Number of values per bin
    /// Lower edge of every bin (its smallest value) followed by the largest
    /// value overall; nbins + 1 entries, non-decreasing.
    std::vector<double> edges;
};

/// Sort `x` (stably) and assign the value at sorted position i to bin
/// floor(i · nbins / n).
///
/// # Returns
/// `nullopt` if `nbins < 1`, `nbins > x.size()`, or any value is NaN.
[[nodiscard]] std::optional<Binning>
equal_population_bins(std::span<const double> x, int nbins) noexcept;

/// Bin containing `x` given non-decreasing `edges` (nbins + 1 entries).
/// Values outside the tabulated range go to the first or last bin.
[[nodiscard]] int locate_bin(std::span<const double> edges, double x) noexcept;

// ─── RadialProfile ────────────────────────────────────────────────────────────

/// Quantities a RadialProfile can broadcast back to particles.
enum class Quantity {
    Phi,
    VCirc,
    JCirc,
    ECirc,
};

class RadialProfile {
public:
    /// Build an equal-population cylindrical-radius profile of `subset`
    /// with the potential expressed in `energy_unit`.
    ///
    /// # Returns
    /// `nullopt` if the bin count is degenerate (< 1 or more bins than
    /// particles) or the potential cannot be converted to `energy_unit`.
    [[nodiscard]] static std::optional<RadialProfile>
    build(const ParticleView& subset, int nbins, const units::Unit& energy_unit);

    [[nodiscard]] int nbins() const noexcept { return nbins_; }

    [[nodiscard]] const ScalarField& rbins()  const noexcept { return rbins_; }
    [[nodiscard]] const ScalarField& edges()  const noexcept { return edges_; }
    [[nodiscard]] const LabelField&  counts() const noexcept { return counts_; }
    [[nodiscard]] const ScalarField& phi()    const noexcept { return phi_; }
    [[nodiscard]] const ScalarField& v_circ() const noexcept { return v_circ_; }
    [[nodiscard]] const ScalarField& j_circ() const noexcept { return j_circ_; }
    [[nodiscard]] const ScalarField& e_circ() const noexcept { return e_circ_; }

    [[nodiscard]] const ScalarField& quantity(Quantity q) const noexcept;

    [[nodiscard]] const units::Unit& energy_unit() const noexcept { return energy_unit_; }

    /// Subtract `offset` from the potential (and hence from E_circ).
    void shift_potential(double offset) noexcept;

    /// Bin containing cylindrical radius `r` (clamped to the end bins).
    [[nodiscard]] int bin_of(double r) const noexcept;

    /// Broadcast a bin quantity to every particle of `target` by the bin
    /// its cylindrical radius falls in. No interpolation.
    [[nodiscard]] ScalarField map_back(Quantity q, const ParticleSet& target) const;

private:
    explicit RadialProfile(units::Unit energy_unit);

    int         nbins_ = 0;
    ScalarField rbins_;
    ScalarField edges_;
    LabelField  counts_;
    ScalarField phi_;
    ScalarField v_circ_;
    ScalarField j_circ_;
    ScalarField e_circ_;
    units::Unit energy_unit_;
};

/// R dphi/dR per bin from non-uniform central differences.
[[nodiscard]] ScalarField radial_force_term(const ScalarField& r, const ScalarField& phi);

// ─── QuantileProfile ──────────────────────────────────────────────────────────

class QuantileProfile {
public:
    /// Equal-population bins in `x`; per bin the `q`-quantile of `y`.
    ///
    /// # Returns
    /// `nullopt` if the sizes differ, `q` is outside [0, 1], or the bin
    /// count is degenerate.
    [[nodiscard]] static std::optional<QuantileProfile>
    build(std::span<const double> x, std::span<const double> y, double q, int nbins);

    [[nodiscard]] int nbins() const noexcept { return binning_.nbins; }
    [[nodiscard]] double quantile() const noexcept { return q_; }

    /// Mean abscissa of each bin.
    [[nodiscard]] const ScalarField& x_mean() const noexcept { return x_mean_; }

    /// q-quantile of y in each bin.
    [[nodiscard]] const ScalarField& values() const noexcept { return values_; }

    [[nodiscard]] const std::vector<double>& edges() const noexcept { return binning_.edges; }
    [[nodiscard]] const std::vector<int>& counts() const noexcept { return binning_.counts; }

    /// Bin quantile for every input particle, in input order.
    [[nodiscard]] ScalarField map_back() const;

    /// Bin quantile at abscissa `x` (clamped to the end bins).
    [[nodiscard]] double value_at(double x) const noexcept;

private:
    QuantileProfile() = default;

    Binning     binning_;
    double      q_ = 0.0;
    ScalarField x_mean_;
    ScalarField values_;
};

/// q-quantile of `values` with linear interpolation between order
/// statistics (position q·(n − 1)). `values` is reordered.
[[nodiscard]] double quantile_of(std::vector<double>& values, double q) noexcept;

}  // namespace kdc::profile
