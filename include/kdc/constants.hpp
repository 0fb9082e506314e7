#pragma once

#include <cstddef>

/// @file include/kdc/constants.hpp
/// @brief Default parameters and numerical tolerances for kindecomp.
///
/// Lengths are in kpc, velocities in km/s unless a ParticleSet says
/// otherwise.

namespace kdc::constants {

// ─── Disk Membership ──────────────────────────────────────────────────────────

/// Minimum jz/jcirc for a star to count as thin disk.
static constexpr double DEFAULT_J_DISK_MIN = 0.8;

/// Maximum jz/jcirc for a star to count as thin disk.
static constexpr double DEFAULT_J_DISK_MAX = 1.1;

// ─── Profiling ────────────────────────────────────────────────────────────────

/// Approximate number of particles per equal-population bin.
static constexpr std::size_t DEFAULT_PARTICLES_PER_BIN = 500;

/// Outer cylindrical radius of the disc subset used for the rotation curve
/// (kpc). Large enough to include every bound particle.
static constexpr double DISC_OUTER_RADIUS_KPC = 1000.0;

/// Half-height of the disc subset, in units of the minimum softening.
static constexpr double DISC_HEIGHT_SOFTENING_FACTOR = 3.0;

/// Radius of the sphere used for the disk angular momentum vector (kpc).
static constexpr double DEFAULT_ANGMOM_SIZE_KPC = 3.0;

// ─── Alignment ────────────────────────────────────────────────────────────────

/// Radius inside which the centre-of-mass velocity is measured (kpc).
static constexpr double VELOCITY_CENTRE_RADIUS_KPC = 1.0;

/// Sphere radius shrink factor per shrinking-sphere iteration.
static constexpr double SHRINK_FACTOR = 0.7;

/// Shrinking sphere stops once fewer particles than this remain inside.
static constexpr std::size_t SHRINK_MIN_PARTICLES = 100;

// ─── Critical Ratio Search ────────────────────────────────────────────────────

/// Lower bound of the critical ratio bisection interval.
static constexpr double J_CRIT_SEARCH_LO = 0.0;

/// Upper bound of the critical ratio bisection interval.
static constexpr double J_CRIT_SEARCH_HI = 5.0;

/// Bisection stops once the interval is narrower than this fraction of the
/// starting interval.
static constexpr double BISECT_RELATIVE_TOLERANCE = 1e-6;

/// Hard cap on bisection iterations.
static constexpr int BISECT_MAX_ITERATIONS = 200;

/// Grid size of the direct-scan fallback for the critical ratio.
static constexpr int J_CRIT_SCAN_POINTS = 501;

// ─── Quantile Estimator ───────────────────────────────────────────────────────

/// Default quantile of |j|² taken as the circular reference per energy bin.
static constexpr double DEFAULT_JCIRC_QUANTILE = 0.99;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Relative tolerance under which two curve abscissae count as duplicates.
static constexpr double CURVE_DUPLICATE_RTOL = 1e-12;

}  // namespace kdc::constants
