/// @file src/frame/alignment.cpp
/// @brief Face-on alignment and the scoped frame guard.

#include "kdc/frame.hpp"
#include "kdc/log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace kdc::frame {

// ─── ScopedFrame ──────────────────────────────────────────────────────────────

ScopedFrame::ScopedFrame(ParticleSet& set, Vec3 centre, Vec3 vcen,
                         Eigen::Matrix3d rotation)
    : set_(&set)
    , transformed_(!centre.isZero(0.0) || !vcen.isZero(0.0) ||
                   !rotation.isIdentity(0.0))
    , centre_(std::move(centre))
    , vcen_(std::move(vcen))
    , rotation_(std::move(rotation)) {
    if (!transformed_) {
        return;
    }
    original_pos_ = set.positions();
    original_vel_ = set.velocities();

    // Rows are particles: x_new^T = (x_old − c)^T R^T.
    set.positions()  = (original_pos_.rowwise() - centre_.transpose()) * rotation_.transpose();
    set.velocities() = (original_vel_.rowwise() - vcen_.transpose()) * rotation_.transpose();
}

ScopedFrame::ScopedFrame(ScopedFrame&& other) noexcept
    : set_(std::exchange(other.set_, nullptr))
    , transformed_(other.transformed_)
    , original_pos_(std::move(other.original_pos_))
    , original_vel_(std::move(other.original_vel_))
    , centre_(other.centre_)
    , vcen_(other.vcen_)
    , rotation_(other.rotation_) {}

ScopedFrame& ScopedFrame::operator=(ScopedFrame&& other) noexcept {
    if (this != &other) {
        restore();
        set_          = std::exchange(other.set_, nullptr);
        transformed_  = other.transformed_;
        original_pos_ = std::move(other.original_pos_);
        original_vel_ = std::move(other.original_vel_);
        centre_       = other.centre_;
        vcen_         = other.vcen_;
        rotation_     = other.rotation_;
    }
    return *this;
}

ScopedFrame::~ScopedFrame() {
    restore();
}

void ScopedFrame::restore() noexcept {
    if (set_ == nullptr) {
        return;
    }
    if (transformed_) {
        // Same shape as on acquisition, so these are plain copies.
        set_->positions()  = original_pos_;
        set_->velocities() = original_vel_;
    }
    set_ = nullptr;
}

// ─── identity ─────────────────────────────────────────────────────────────────

ScopedFrame identity(ParticleSet& set) {
    return ScopedFrame(set, Vec3::Zero(), Vec3::Zero(), Eigen::Matrix3d::Identity());
}

// ─── Helpers ──────────────────────────────────────────────────────────────────

namespace {

/// Mass-weighted mean of rows `idx` of `values`.
Vec3 weighted_mean(const Vec3Array& values, const ScalarField& mass,
                   const IndexList& idx) {
    Vec3   sum = Vec3::Zero();
    double m   = 0.0;
    for (const auto i : idx) {
        sum += mass(i) * values.row(i).transpose();
        m   += mass(i);
    }
    return m > 0.0 ? Vec3(sum / m) : Vec3::Zero();
}

}  // namespace

Vec3 shrink_sphere_centre(const ParticleSet& set, const Vec3& start,
                          double shrink_factor, std::size_t min_particles) {
    const auto& pos  = set.positions();
    const auto& mass = set.masses();

    Vec3   centre = start;
    double r      = 0.0;
    for (Eigen::Index i = 0; i < set.size(); ++i) {
        r = std::max(r, (pos.row(i).transpose() - centre).norm());
    }
    if (r <= 0.0 || shrink_factor <= 0.0 || shrink_factor >= 1.0) {
        return centre;
    }

    // Each step shrinks r geometrically; cap the loop for degenerate sets.
    for (int iter = 0; iter < 200; ++iter) {
        const auto inside = sphere_subset(set, centre, r);
        if (inside.indices().size() < min_particles || inside.empty()) {
            break;
        }
        centre = weighted_mean(pos, mass, inside.indices());
        r *= shrink_factor;
    }
    return centre;
}

Eigen::Matrix3d face_on_rotation(const Vec3& axis) {
    const Vec3 z = axis.normalized();

    // Pick the coordinate axis least aligned with z to build the x' axis.
    Vec3 ref = Vec3::UnitX();
    if (std::abs(z.x()) > 0.9) {
        ref = Vec3::UnitY();
    }
    const Vec3 x = ref.cross(z).normalized();
    const Vec3 y = z.cross(x);

    Eigen::Matrix3d r;
    r.row(0) = x.transpose();
    r.row(1) = y.transpose();
    r.row(2) = z.transpose();
    return r;
}

// ─── align ────────────────────────────────────────────────────────────────────

std::optional<ScopedFrame> align(ParticleSet& set, const AlignConfig& config) {
    if (set.size() == 0) {
        log::error("cannot align an empty particle set");
        return std::nullopt;
    }

    const auto& pos  = set.positions();
    const auto& vel  = set.velocities();
    const auto& mass = set.masses();
    const auto& phi  = set.potential();

    // Start from the potential minimum; fall back to the centre of mass if
    // the potential is not usable.
    Vec3 start;
    Eigen::Index imin = 0;
    if (phi.allFinite()) {
        phi.minCoeff(&imin);
        start = pos.row(imin).transpose();
    } else {
        start = weighted_mean(pos, mass, set.all().indices());
    }

    const Vec3 centre = shrink_sphere_centre(set, start, config.shrink_factor,
                                             config.shrink_min_particles);

    auto inner = sphere_subset(set, centre, config.velocity_radius);
    const Vec3 vcen = inner.empty()
        ? weighted_mean(vel, mass, set.all().indices())
        : weighted_mean(vel, mass, inner.indices());

    // Disk angular momentum from baryons near the centre.
    Vec3   L = Vec3::Zero();
    std::size_t used = 0;
    const double r2 = config.disk_size * config.disk_size;
    for (Eigen::Index i = 0; i < set.size(); ++i) {
        const Family f = set.family(i);
        if (f != Family::Star && f != Family::Gas) {
            continue;
        }
        const Vec3 r = pos.row(i).transpose() - centre;
        if (r.squaredNorm() >= r2) {
            continue;
        }
        const Vec3 v = vel.row(i).transpose() - vcen;
        L += mass(i) * r.cross(v);
        ++used;
    }

    if (used == 0 || L.norm() <= std::numeric_limits<double>::min()) {
        log::error("no disk angular momentum within {} kpc of the centre ({} particles)",
                   config.disk_size, used);
        return std::nullopt;
    }

    log::debug("aligning: centre=({:.3g}, {:.3g}, {:.3g}) kpc, {} disk particles",
               centre.x(), centre.y(), centre.z(), used);

    return ScopedFrame(set, centre, vcen, face_on_rotation(L));
}

}  // namespace kdc::frame
