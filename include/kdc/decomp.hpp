#pragma once

/// @file include/kdc/decomp.hpp
/// @brief Kinematic bulge/disk/halo decomposition — public API.
///
/// # Module: Decomposition
///
/// ## Responsibility
/// Assign every star of a snapshot one of five dynamical components from its
/// orbital energy and its vertical angular momentum relative to a circular
/// orbit of the same energy (or radius):
///
///   1 thin disk · 2 halo · 3 bulge · 4 thick disk · 5 pseudo bulge
///
/// ## Pipeline
///   snapshot → (align) → energy field → disc subset → radial profile →
///   circular reference j_circ → ratio jz / j_circ → critical ratio j_crit →
///   five-way classification
///
/// Each stage is exposed as a free function so it can be tested and reused
/// on its own; `decompose` runs them in order inside a scoped frame.
///
/// ## Usage
/// ```cpp
/// kdc::decomp::DecompConfig cfg;
/// cfg.log_interp = true;
/// auto result = kdc::decomp::decompose(snapshot, cfg);
/// if (result) kdc::decomp::apply(snapshot, *result);
/// ```
///
/// ## Guarantees
/// - `decompose` never writes fields to the set; the frame is restored on
///   every exit path
/// - j_circ ≥ 0 everywhere; +inf above the profile's energy range
/// - j_crit ≤ j_disk_min
/// - Fallible stages return `std::optional`; the reason is logged at Error
///
/// ## NOT Responsible For
/// - Snapshot I/O
/// - Alignment internals (see frame.hpp) and binning (see profile.hpp)

#include "kdc/constants.hpp"
#include "kdc/numeric.hpp"
#include "kdc/particles.hpp"
#include "kdc/profile.hpp"
#include "kdc/types.hpp"
#include "kdc/units.hpp"

#include <array>
#include <optional>

namespace kdc::decomp {

// ─── Configuration ────────────────────────────────────────────────────────────

/// Where the circular angular momentum reference comes from.
enum class CircularSource {
    ByEnergy,  ///< Interpolate j_circ(E_circ) at each particle's energy
    ByRadius,  ///< Take j_circ of each particle's radial bin
};

[[nodiscard]] const char* to_string(CircularSource s) noexcept;

struct DecompConfig {
    /// Skip alignment: the caller asserts the set is centred and face-on.
    bool aligned = false;

    /// Disk ratio band (j_disk_min, j_disk_max), exclusive.
    double j_disk_min = constants::DEFAULT_J_DISK_MIN;
    double j_disk_max = constants::DEFAULT_J_DISK_MAX;

    /// Bulge/halo energy boundary; median stellar energy when unset.
    std::optional<double> energy_cut;

    CircularSource source = CircularSource::ByEnergy;

    /// By-energy mode only: interpolate log10 j_circ against log10(−E_circ).
    bool log_interp = false;

    /// Radius of the sphere defining the disk plane (kpc).
    double angmom_size = constants::DEFAULT_ANGMOM_SIZE_KPC;

    /// Approximate particle count per rotation-curve bin.
    std::size_t particles_per_bin = constants::DEFAULT_PARTICLES_PER_BIN;

    /// Disc subset: outer cylindrical radius (kpc) and half-height in units
    /// of the minimum softening.
    double disc_outer_radius  = constants::DISC_OUTER_RADIUS_KPC;
    double disc_height_factor = constants::DISC_HEIGHT_SOFTENING_FACTOR;

    /// Critical ratio search interval.
    double j_crit_lo = constants::J_CRIT_SEARCH_LO;
    double j_crit_hi = constants::J_CRIT_SEARCH_HI;

    numeric::BisectConfig bisect{};

    /// True if every parameter is usable.
    [[nodiscard]] bool validate() const noexcept;
};

// ─── Energy Field Builder ─────────────────────────────────────────────────────

struct EnergyField {
    ScalarField te;      ///< ke + phi − te_max, every particle
    double      te_max;  ///< Maximum stellar ke + phi before the shift
    units::Unit unit;    ///< Kinetic-energy unit shared by te and the profile
};

/// Total energy of every particle referenced to the least bound star.
///
/// # Returns
/// `nullopt` if the potential cannot be converted into kinetic-energy
/// units or the set has no stars.
[[nodiscard]] std::optional<EnergyField> build_energy_field(const ParticleSet& set);

// ─── Rotation-Curve Profiler ──────────────────────────────────────────────────

/// Equal-population rotation curve of the thin disc subset, in the energy
/// field's unit and shifted by its `te_max`.
///
/// # Returns
/// `nullopt` if the subset holds fewer than `particles_per_bin` particles
/// (zero bins) or the profile cannot be built.
[[nodiscard]] std::optional<profile::RadialProfile>
build_rotation_curve(const ParticleSet& set, const EnergyField& energy,
                     const DecompConfig& config);

// ─── Circular-Reference Mapper ────────────────────────────────────────────────

struct CircularReference {
    ScalarField                j_circ;        ///< Every particle
    ScalarField                jz_by_jzcirc;  ///< j_z / j_circ, every particle
    std::optional<ScalarField> e_circ;        ///< By-radius mode only
    Eigen::Index               n_above_range = 0;  ///< Set to +inf
    Eigen::Index               n_below_range = 0;  ///< Set to innermost j_circ
};

/// j_circ at each energy of `te`, with the edge policy applied:
/// te > max E_circ → +inf; te < min E_circ → j_circ of the innermost bin.
/// In log mode, bins with j_circ == 0 are left out of the curve; energies
/// inside the E_circ range but beyond the curve take its nearest end.
///
/// # Returns
/// `nullopt` if the curve is degenerate, or `log_interp` is requested on a
/// profile with non-negative E_circ.
[[nodiscard]] std::optional<ScalarField>
jcirc_from_energy(const profile::RadialProfile& profile, const ScalarField& te,
                  bool log_interp);

/// Circular reference and angular momentum ratio for every particle.
[[nodiscard]] std::optional<CircularReference>
map_circular_reference(const ParticleSet& set, const profile::RadialProfile& profile,
                       const ScalarField& te, const DecompConfig& config);

// ─── Critical-Ratio Solver ────────────────────────────────────────────────────

struct CriticalRatio {
    double j_crit;      ///< Value used for classification
    double solved;      ///< Value found before the safety clamp
    bool   clamped;     ///< solved > j_disk_min, reset to j_disk_min
    bool   bracketed;   ///< Bisection saw a sign change
    bool   scanned;     ///< Direct-scan fallback was used
    int    iterations;  ///< Bisection objective evaluations
};

/// Mean of `vcxy` over entries whose ratio is below `c`; NaN if none.
[[nodiscard]] double mean_rotation_below(const ScalarField& vcxy,
                                         const ScalarField& ratio,
                                         double c) noexcept;

/// Threshold at which the sub-threshold population stops rotating.
///
/// Bisection of `mean_rotation_below` over [lo, hi]. The objective is a
/// heuristic and is not guaranteed monotonic; if bisection does not see a
/// sign change the threshold with the smallest |mean| on a uniform grid is
/// used instead. A result above `j_disk_min` is logged as a warning and
/// replaced by `j_disk_min`.
[[nodiscard]] CriticalRatio
solve_critical_ratio(const ScalarField& vcxy, const ScalarField& ratio,
                     double j_disk_min, double lo, double hi,
                     const numeric::BisectConfig& bisect = numeric::BisectConfig{});

// ─── Component Classifier ─────────────────────────────────────────────────────

struct ClassifyParams {
    double e_cut;
    double j_crit;
    double j_disk_min;
    double j_disk_max;
};

/// Label of a single star.
///
/// Pass 1: j_disk_min < ratio < j_disk_max → ThinDisk.
/// Pass 2 (everything else):
///   ratio <  j_crit, te >  e_cut → Halo
///   ratio <  j_crit, te <= e_cut → Bulge
///   ratio >= j_crit, te >  e_cut → ThickDisk
///   ratio >= j_crit, te <= e_cut → PseudoBulge
/// A NaN ratio counts as zero rotation.
[[nodiscard]] ComponentLabel classify_star(double te, double ratio,
                                           const ClassifyParams& params) noexcept;

/// Labels for every star (entries in input order).
[[nodiscard]] LabelField classify_components(const ScalarField& te,
                                             const ScalarField& ratio,
                                             const ClassifyParams& params);

/// Median (mean of the two middle values for an even count); NaN if empty.
[[nodiscard]] double median(const ScalarField& values);

/// Number of stars per label, indexed by the label's integer value (0..5).
[[nodiscard]] std::array<Eigen::Index, NUM_COMPONENTS + 1>
component_counts(const LabelField& labels) noexcept;

// ─── Entry points ─────────────────────────────────────────────────────────────

/// Everything a decomposition produces.
struct DecompResult {
    IndexList                  star_indices;  ///< Particle index of each star
    LabelField                 labels;        ///< Per star, same order
    ScalarField                te;            ///< Every particle
    ScalarField                j_circ;        ///< Every particle
    ScalarField                jz_by_jzcirc;  ///< Every particle
    std::optional<ScalarField> e_circ;        ///< By-radius mode only
    profile::RadialProfile     profile;
    double                     te_max;
    double                     e_cut;
    CriticalRatio              critical;
    Eigen::Index               n_above_range;
    Eigen::Index               n_below_range;
};

/// Run the full decomposition. `set` is temporarily re-framed (unless
/// `config.aligned`) and restored before returning; no fields are written.
///
/// # Returns
/// `nullopt` on an invalid configuration, a set without stars, a failed
/// alignment, a unit mismatch, or a degenerate profile.
[[nodiscard]] std::optional<DecompResult>
decompose(ParticleSet& set, const DecompConfig& config = DecompConfig{});

/// Write a result into `set`: `te`, `j_circ`, `jz_by_jzcirc` (and `E_circ`
/// in by-radius mode) on every particle, `decomp` on stars. Stars left
/// Unset keep their previous label.
///
/// # Returns
/// false if `result` was computed for a different particle layout.
bool apply(ParticleSet& set, const DecompResult& result);

/// `decompose` followed by `apply`.
///
/// # Returns
/// The rotation-curve profile used, or `nullopt` if decomposition failed
/// (in which case `set` is unchanged).
[[nodiscard]] std::optional<profile::RadialProfile>
decomp(ParticleSet& set, const DecompConfig& config = DecompConfig{});

}  // namespace kdc::decomp
