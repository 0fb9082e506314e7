#pragma once

/// @file include/kdc/particles.hpp
/// @brief ParticleSet — structure-of-arrays container for an N-body snapshot.
///
/// # Module: Particles
///
/// ## Responsibility
/// Own the per-particle state of one snapshot (position, velocity, mass,
/// softening, potential, family) and the derived fields the decomposition
/// attaches to it (`te`, `j_circ`, `jz_by_jzcirc`, ... on every particle;
/// integer `decomp` on stars only).
///
/// ## Layout
/// Positions and velocities are N × 3 row-major Eigen arrays; every scalar
/// quantity is an `Eigen::VectorXd` of length N. Lengths are in kpc. The
/// velocity and potential arrays each carry a `units::Unit`.
///
/// ## Views
/// A `ParticleView` is a list of indices into a set: the star family, a
/// spatial disc, ... Views never copy particle data.
///
/// ## NOT Responsible For
/// - Reading or writing snapshot files
/// - Re-centring or rotating the frame (see frame.hpp)

#include "kdc/types.hpp"
#include "kdc/units.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kdc {

class ParticleSet;

// ─── ParticleView ─────────────────────────────────────────────────────────────

/// Non-owning index view into a ParticleSet.
///
/// The view must not outlive the set it was taken from.
class ParticleView {
public:
    ParticleView(const ParticleSet& set, IndexList indices);

    [[nodiscard]] Eigen::Index size() const noexcept {
        return static_cast<Eigen::Index>(indices_.size());
    }
    [[nodiscard]] bool empty() const noexcept { return indices_.empty(); }
    [[nodiscard]] const IndexList& indices() const noexcept { return indices_; }
    [[nodiscard]] const ParticleSet& set() const noexcept { return set_.get(); }

    /// Values of a full-length field at the view's particles, in view order.
    [[nodiscard]] ScalarField gather(const ScalarField& full) const;

private:
    std::reference_wrapper<const ParticleSet> set_;
    IndexList indices_;
};

// ─── ParticleSet ──────────────────────────────────────────────────────────────

class ParticleSet {
public:
    /// Create `n` particles at rest at the origin: unit mass, zero
    /// softening and potential, family DarkMatter, velocities in km/s and
    /// potential in km²/s².
    explicit ParticleSet(Eigen::Index n);

    [[nodiscard]] Eigen::Index size() const noexcept { return n_; }

    // ── Primary per-particle state ────────────────────────────────────────────

    [[nodiscard]] Vec3Array& positions() noexcept { return pos_; }
    [[nodiscard]] const Vec3Array& positions() const noexcept { return pos_; }

    [[nodiscard]] Vec3Array& velocities() noexcept { return vel_; }
    [[nodiscard]] const Vec3Array& velocities() const noexcept { return vel_; }

    [[nodiscard]] ScalarField& masses() noexcept { return mass_; }
    [[nodiscard]] const ScalarField& masses() const noexcept { return mass_; }

    [[nodiscard]] ScalarField& softening() noexcept { return eps_; }
    [[nodiscard]] const ScalarField& softening() const noexcept { return eps_; }

    [[nodiscard]] ScalarField& potential() noexcept { return phi_; }
    [[nodiscard]] const ScalarField& potential() const noexcept { return phi_; }

    [[nodiscard]] Family family(Eigen::Index i) const noexcept {
        return family_[static_cast<std::size_t>(i)];
    }

    /// Change the family of particle `i`. Discards the star label field if
    /// star membership changes.
    void set_family(Eigen::Index i, Family f);

    // ── Units ─────────────────────────────────────────────────────────────────

    [[nodiscard]] const units::Unit& velocity_unit() const noexcept { return vel_unit_; }
    void set_velocity_unit(units::Unit unit) { vel_unit_ = std::move(unit); }

    [[nodiscard]] const units::Unit& potential_unit() const noexcept { return phi_unit_; }
    void set_potential_unit(units::Unit unit) { phi_unit_ = std::move(unit); }

    /// Unit of `kinetic_energy()`: the velocity unit squared.
    [[nodiscard]] units::Unit kinetic_energy_unit() const { return vel_unit_.squared(); }

    /// Potential values expressed in `target`.
    ///
    /// # Returns
    /// `nullopt` if the potential unit is not convertible to `target`.
    [[nodiscard]] std::optional<ScalarField>
    potential_in(const units::Unit& target) const;

    /// Rescale the stored potential into `target` in place.
    ///
    /// # Returns
    /// false (and leaves the potential untouched) on a dimension mismatch.
    bool convert_potential_units(const units::Unit& target);

    // ── Families ──────────────────────────────────────────────────────────────

    /// Indices of every particle of family `f`, ascending.
    [[nodiscard]] IndexList indices(Family f) const;

    [[nodiscard]] ParticleView view(Family f) const;
    [[nodiscard]] ParticleView stars() const { return view(Family::Star); }
    [[nodiscard]] ParticleView all() const;

    [[nodiscard]] Eigen::Index count(Family f) const noexcept;

    // ── Derived scalar fields (full length) ───────────────────────────────────

    [[nodiscard]] bool has_field(std::string_view name) const noexcept;

    /// Copy of the named field, or `nullopt` if it is not attached.
    [[nodiscard]] std::optional<ScalarField> field(std::string_view name) const;

    /// Attach or overwrite a field.
    ///
    /// # Returns
    /// false if `values` does not have one entry per particle.
    bool set_field(std::string_view name, ScalarField values);

    bool erase_field(std::string_view name);

    [[nodiscard]] std::vector<std::string> field_names() const;

    // ── Star label field ──────────────────────────────────────────────────────

    [[nodiscard]] bool has_star_labels() const noexcept { return star_labels_.has_value(); }

    /// The `decomp` star field, created (zero-filled) on first use.
    /// Entry k belongs to the k-th star in `indices(Family::Star)`.
    LabelField& ensure_star_labels();

    [[nodiscard]] std::optional<LabelField> star_labels() const { return star_labels_; }

    // ── Derived kinematics (computed on demand) ───────────────────────────────

    /// |v|² / 2 in `kinetic_energy_unit()`.
    [[nodiscard]] ScalarField kinetic_energy() const;

    /// Specific angular momentum r × v.
    [[nodiscard]] Vec3Array angular_momentum() const;

    /// Cylindrical radius √(x² + y²).
    [[nodiscard]] ScalarField rxy() const;

    /// Spherical radius |r|.
    [[nodiscard]] ScalarField radius() const;

    /// Cylindrical rotational velocity (x v_y − y v_x) / rxy; zero on the
    /// z axis.
    [[nodiscard]] ScalarField vcxy() const;

private:
    Eigen::Index        n_;
    Vec3Array           pos_;
    Vec3Array           vel_;
    ScalarField         mass_;
    ScalarField         eps_;
    ScalarField         phi_;
    std::vector<Family> family_;
    units::Unit         vel_unit_;
    units::Unit         phi_unit_;

    std::map<std::string, ScalarField, std::less<>> fields_;
    std::optional<LabelField>                       star_labels_;
};

// ─── Spatial Filters ──────────────────────────────────────────────────────────

/// Particles inside a thin disc in the current frame: rxy < outer_radius
/// and |z| < half_height.
[[nodiscard]] ParticleView
disc_subset(const ParticleSet& set, double outer_radius, double half_height);

/// Particles within `radius` of `centre`.
[[nodiscard]] ParticleView
sphere_subset(const ParticleSet& set, const Vec3& centre, double radius);

}  // namespace kdc
