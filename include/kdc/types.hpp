#pragma once

/// @file include/kdc/types.hpp
/// @brief Shared primitive types for the kindecomp kinematic decomposition
///        library.
///
/// All modules include this file. It defines the Eigen-based array aliases
/// used for per-particle data, the particle family tags and the component
/// label enumeration written by the classifier.

#include <Eigen/Dense>

#include <cstdint>
#include <vector>

namespace kdc {

// ─── Per-particle Array Aliases ───────────────────────────────────────────────

/// A single 3-vector (position, velocity, angular momentum).
using Vec3 = Eigen::Vector3d;

/// N × 3 row-major array: one particle per row, components (x, y, z).
using Vec3Array = Eigen::Matrix<double, Eigen::Dynamic, 3, Eigen::RowMajor>;

/// One scalar per particle.
using ScalarField = Eigen::VectorXd;

/// One integer per particle of a family.
using LabelField = Eigen::VectorXi;

/// Indices into a ParticleSet.
using IndexList = std::vector<Eigen::Index>;

// ─── Particle Family ──────────────────────────────────────────────────────────

/// Particle species in an N-body snapshot.
enum class Family : std::uint8_t {
    DarkMatter,
    Gas,
    Star,
};

/// Convert Family to a human-readable string.
[[nodiscard]] const char* to_string(Family f) noexcept;

// ─── Component Label ──────────────────────────────────────────────────────────

/// Dynamical component assigned to each star by the decomposition.
///
/// The integer values are part of the public contract: they are what the
/// `decomp` star field stores.
enum class ComponentLabel : int {
    Unset       = 0,  ///< Not (yet) classified
    ThinDisk    = 1,  ///< Near-circular rotation inside the disk ratio band
    Halo        = 2,  ///< Loosely bound, no net rotation
    Bulge       = 3,  ///< Tightly bound, no net rotation
    ThickDisk   = 4,  ///< Loosely bound, rotating outside the disk band
    PseudoBulge = 5,  ///< Tightly bound, rotating outside the disk band
};

/// Convert ComponentLabel to a human-readable string.
[[nodiscard]] const char* to_string(ComponentLabel c) noexcept;

/// Number of distinct labels a classified star can carry (1..5).
inline constexpr int NUM_COMPONENTS = 5;

}  // namespace kdc
