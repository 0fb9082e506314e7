#pragma once

/// @file include/kdc/frame.hpp
/// @brief Alignment gate — scoped face-on frame for a ParticleSet.
///
/// # Module: Frame
///
/// ## Responsibility
/// Temporarily move a ParticleSet into a centred, face-on frame (disk
/// angular momentum along +z) and put it back afterwards.
///
/// ## Algorithm (`align`)
///   1. Centre: minimum-potential particle, refined by a shrinking-sphere
///      centre of mass.
///   2. Velocity centre: mass-weighted mean velocity within
///      `velocity_radius` of the centre.
///   3. Disk axis: total angular momentum of star and gas particles within
///      `disk_size` of the centre.
///   4. Rotation taking the disk axis onto +z.
///
/// ## Guarantees
/// - The original positions and velocities are stored on acquisition and
///   copied back on release, so the restored frame is bit-identical
/// - Release happens in the destructor, on every exit path
/// - `ScopedFrame` is move-only; a moved-from guard restores nothing

#include "kdc/constants.hpp"
#include "kdc/particles.hpp"
#include "kdc/types.hpp"

#include <optional>

namespace kdc::frame {

/// Parameters of the face-on alignment.
struct AlignConfig {
    /// Radius of the sphere defining the disk angular momentum (kpc).
    double disk_size = constants::DEFAULT_ANGMOM_SIZE_KPC;

    /// Radius of the sphere defining the velocity centre (kpc).
    double velocity_radius = constants::VELOCITY_CENTRE_RADIUS_KPC;

    /// Shrinking-sphere radius factor per iteration, in (0, 1).
    double shrink_factor = constants::SHRINK_FACTOR;

    /// Stop shrinking once fewer particles than this remain in the sphere.
    std::size_t shrink_min_particles = constants::SHRINK_MIN_PARTICLES;
};

/// RAII guard over a temporary change of frame.
class ScopedFrame {
public:
    /// Record the current frame of `set`, then re-centre it on `centre`
    /// and `vcen` and apply `rotation`.
    ScopedFrame(ParticleSet& set, Vec3 centre, Vec3 vcen, Eigen::Matrix3d rotation);

    ScopedFrame(const ScopedFrame&)            = delete;
    ScopedFrame& operator=(const ScopedFrame&) = delete;
    ScopedFrame(ScopedFrame&& other) noexcept;
    ScopedFrame& operator=(ScopedFrame&& other) noexcept;
    ~ScopedFrame();

    /// Restore the original frame now. Idempotent.
    void restore() noexcept;

    /// True until the frame has been restored (or moved from).
    [[nodiscard]] bool active() const noexcept { return set_ != nullptr; }

    /// Position of the new origin in the original frame.
    [[nodiscard]] const Vec3& centre() const noexcept { return centre_; }

    /// Velocity subtracted from every particle.
    [[nodiscard]] const Vec3& velocity_centre() const noexcept { return vcen_; }

    /// Rotation applied after re-centring: x_new = R (x_old − centre).
    [[nodiscard]] const Eigen::Matrix3d& rotation() const noexcept { return rotation_; }

private:
    ParticleSet*    set_;  ///< Non-owning; null once restored
    bool            transformed_;
    Vec3Array       original_pos_;
    Vec3Array       original_vel_;
    Vec3            centre_;
    Vec3            vcen_;
    Eigen::Matrix3d rotation_;
};

/// No-op frame for a set the caller asserts is already face-on.
[[nodiscard]] ScopedFrame identity(ParticleSet& set);

/// Centre the set and rotate it face-on.
///
/// # Returns
/// `nullopt` if the set is empty, or no star or gas particle lies within
/// `disk_size` of the centre, or their angular momentum vanishes.
[[nodiscard]] std::optional<ScopedFrame>
align(ParticleSet& set, const AlignConfig& config = AlignConfig{});

/// Shrinking-sphere centre of mass starting from `start`.
[[nodiscard]] Vec3 shrink_sphere_centre(const ParticleSet& set,
                                        const Vec3& start,
                                        double shrink_factor,
                                        std::size_t min_particles);

/// Rotation matrix whose third row is `axis` normalised, i.e. it maps
/// `axis` onto +z. `axis` must be non-zero.
[[nodiscard]] Eigen::Matrix3d face_on_rotation(const Vec3& axis);

}  // namespace kdc::frame
