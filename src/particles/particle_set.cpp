/// @file src/particles/particle_set.cpp
/// @brief ParticleSet storage, field store and derived kinematics.

#include "kdc/particles.hpp"

#include <cmath>

namespace kdc {

// ─── ParticleView ─────────────────────────────────────────────────────────────

ParticleView::ParticleView(const ParticleSet& set, IndexList indices)
    : set_(set)
    , indices_(std::move(indices)) {}

ScalarField ParticleView::gather(const ScalarField& full) const {
    return full(indices_);
}

// ─── Construction ─────────────────────────────────────────────────────────────

ParticleSet::ParticleSet(Eigen::Index n)
    : n_(n < 0 ? 0 : n)
    , pos_(Vec3Array::Zero(n_, 3))
    , vel_(Vec3Array::Zero(n_, 3))
    , mass_(ScalarField::Ones(n_))
    , eps_(ScalarField::Zero(n_))
    , phi_(ScalarField::Zero(n_))
    , family_(static_cast<std::size_t>(n_), Family::DarkMatter)
    , vel_unit_(units::km_per_s())
    , phi_unit_(units::km2_per_s2()) {}

void ParticleSet::set_family(Eigen::Index i, Family f) {
    auto& slot = family_[static_cast<std::size_t>(i)];
    if ((slot == Family::Star) != (f == Family::Star)) {
        // Label entries are keyed by star ordinal; membership change
        // invalidates them.
        star_labels_.reset();
    }
    slot = f;
}

// ─── Units ────────────────────────────────────────────────────────────────────

std::optional<ScalarField>
ParticleSet::potential_in(const units::Unit& target) const {
    const auto ratio = phi_unit_.ratio_to(target);
    if (!ratio) {
        return std::nullopt;
    }
    return ScalarField(phi_ * *ratio);
}

bool ParticleSet::convert_potential_units(const units::Unit& target) {
    const auto ratio = phi_unit_.ratio_to(target);
    if (!ratio) {
        return false;
    }
    phi_ *= *ratio;
    phi_unit_ = target;
    return true;
}

// ─── Families ─────────────────────────────────────────────────────────────────

IndexList ParticleSet::indices(Family f) const {
    IndexList out;
    for (Eigen::Index i = 0; i < n_; ++i) {
        if (family_[static_cast<std::size_t>(i)] == f) {
            out.push_back(i);
        }
    }
    return out;
}

ParticleView ParticleSet::view(Family f) const {
    return ParticleView(*this, indices(f));
}

ParticleView ParticleSet::all() const {
    IndexList idx(static_cast<std::size_t>(n_));
    for (Eigen::Index i = 0; i < n_; ++i) {
        idx[static_cast<std::size_t>(i)] = i;
    }
    return ParticleView(*this, std::move(idx));
}

Eigen::Index ParticleSet::count(Family f) const noexcept {
    Eigen::Index c = 0;
    for (const Family g : family_) {
        if (g == f) ++c;
    }
    return c;
}

// ─── Field store ──────────────────────────────────────────────────────────────

bool ParticleSet::has_field(std::string_view name) const noexcept {
    return fields_.find(name) != fields_.end();
}

std::optional<ScalarField> ParticleSet::field(std::string_view name) const {
    const auto it = fields_.find(name);
    if (it == fields_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ParticleSet::set_field(std::string_view name, ScalarField values) {
    if (values.size() != n_) {
        return false;
    }
    const auto it = fields_.find(name);
    if (it != fields_.end()) {
        it->second = std::move(values);
    } else {
        fields_.emplace(std::string(name), std::move(values));
    }
    return true;
}

bool ParticleSet::erase_field(std::string_view name) {
    const auto it = fields_.find(name);
    if (it == fields_.end()) {
        return false;
    }
    fields_.erase(it);
    return true;
}

std::vector<std::string> ParticleSet::field_names() const {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& [name, values] : fields_) {
        names.push_back(name);
    }
    return names;
}

LabelField& ParticleSet::ensure_star_labels() {
    if (!star_labels_) {
        star_labels_ = LabelField::Zero(count(Family::Star));
    }
    return *star_labels_;
}

// ─── Derived kinematics ───────────────────────────────────────────────────────

ScalarField ParticleSet::kinetic_energy() const {
    return 0.5 * vel_.rowwise().squaredNorm();
}

Vec3Array ParticleSet::angular_momentum() const {
    Vec3Array j(n_, 3);
    j.col(0) = pos_.col(1).cwiseProduct(vel_.col(2)) - pos_.col(2).cwiseProduct(vel_.col(1));
    j.col(1) = pos_.col(2).cwiseProduct(vel_.col(0)) - pos_.col(0).cwiseProduct(vel_.col(2));
    j.col(2) = pos_.col(0).cwiseProduct(vel_.col(1)) - pos_.col(1).cwiseProduct(vel_.col(0));
    return j;
}

ScalarField ParticleSet::rxy() const {
    return pos_.leftCols<2>().rowwise().norm();
}

ScalarField ParticleSet::radius() const {
    return pos_.rowwise().norm();
}

ScalarField ParticleSet::vcxy() const {
    const ScalarField r = rxy();
    const ScalarField jz = pos_.col(0).cwiseProduct(vel_.col(1))
                         - pos_.col(1).cwiseProduct(vel_.col(0));
    ScalarField out(n_);
    for (Eigen::Index i = 0; i < n_; ++i) {
        out(i) = r(i) > 0.0 ? jz(i) / r(i) : 0.0;
    }
    return out;
}

}  // namespace kdc
