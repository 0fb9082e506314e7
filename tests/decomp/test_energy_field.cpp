/// @file tests/decomp/test_energy_field.cpp
/// @brief Tests for the energy field builder and the rotation-curve stage.

#include "kdc/decomp.hpp"
#include "support/log_capture.hpp"
#include "support/synthetic_galaxy.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace kdc;
using namespace kdc::decomp;
using kdc::testing::LogCapture;

namespace {

/// Three stars and one unbound dark matter particle.
///   star 0: ke  5000, phi -20000 → -15000
///   star 1: ke     0, phi -10000 → -10000   (least bound star)
///   star 2: ke 20000, phi -50000 → -30000
///   dm   3: ke 45000, phi -10000 →  35000
ParticleSet make_four() {
    ParticleSet set(4);
    set.velocities().row(0) = Eigen::RowVector3d(100.0, 0.0, 0.0);
    set.velocities().row(2) = Eigen::RowVector3d(0.0, 200.0, 0.0);
    set.velocities().row(3) = Eigen::RowVector3d(300.0, 0.0, 0.0);
    set.potential() << -20000.0, -10000.0, -50000.0, -10000.0;
    for (Eigen::Index i = 0; i < 3; ++i) {
        set.set_family(i, Family::Star);
    }
    return set;
}

}  // namespace

// ─── build_energy_field ───────────────────────────────────────────────────────

TEST(EnergyField, LeastBoundStarSitsAtZero) {
    LogCapture capture;
    const ParticleSet set = make_four();
    const auto e = build_energy_field(set);
    ASSERT_TRUE(e.has_value());
    EXPECT_DOUBLE_EQ(e->te_max, -10000.0);
    EXPECT_DOUBLE_EQ(e->te(0), -5000.0);
    EXPECT_DOUBLE_EQ(e->te(1), 0.0);
    EXPECT_DOUBLE_EQ(e->te(2), -20000.0);
    // Non-star particles may end up above zero.
    EXPECT_DOUBLE_EQ(e->te(3), 45000.0);
    EXPECT_TRUE(e->unit == units::km2_per_s2());
    EXPECT_TRUE(capture.contains(log::Level::Info, "te_max = -1.00e+04"));
}

TEST(EnergyField, PotentialIsConvertedBeforeAdding) {
    ParticleSet km = make_four();
    ParticleSet si = make_four();
    ASSERT_TRUE(si.convert_potential_units(units::m2_per_s2()));

    const auto a = build_energy_field(km);
    const auto b = build_energy_field(si);
    ASSERT_TRUE(a && b);
    for (Eigen::Index i = 0; i < 4; ++i) {
        EXPECT_NEAR(a->te(i), b->te(i), 1e-8);
    }
}

TEST(EnergyField, IncompatiblePotentialUnitFails) {
    LogCapture capture;
    ParticleSet set = make_four();
    set.set_potential_unit(units::kpc());
    EXPECT_FALSE(build_energy_field(set).has_value());
    EXPECT_TRUE(capture.contains(log::Level::Error, "cannot be converted"));
}

TEST(EnergyField, NoStarsFails) {
    LogCapture capture;
    ParticleSet set(5);
    EXPECT_FALSE(build_energy_field(set).has_value());
    EXPECT_EQ(capture.count(log::Level::Error), 1u);
}

// ─── build_rotation_curve ─────────────────────────────────────────────────────

TEST(RotationCurve, BinCountFollowsDiscSubsetSize) {
    LogCapture capture;
    auto g = kdc::testing::make_galaxy({.n_disk = 1000, .n_spheroid = 0, .n_dm = 0});
    // Lift one star out of the disc layer (half-height 3 × 0.1 kpc).
    g.set.positions()(0, 2) = 5.0;

    const auto e = build_energy_field(g.set);
    ASSERT_TRUE(e.has_value());

    DecompConfig cfg;
    cfg.particles_per_bin = 100;
    const auto pro = build_rotation_curve(g.set, *e, cfg);
    ASSERT_TRUE(pro.has_value());
    EXPECT_EQ(pro->nbins(), 9);  // 999 / 100
    EXPECT_EQ(pro->counts().sum(), 999);
    EXPECT_TRUE(capture.contains(log::Level::Info, "Making disk rotation curve"));
}

TEST(RotationCurve, ProfileSharesTheEnergyReference) {
    auto g = kdc::testing::make_galaxy({.n_disk = 1000, .n_spheroid = 0, .n_dm = 0});
    const auto e = build_energy_field(g.set);
    ASSERT_TRUE(e.has_value());

    DecompConfig cfg;
    cfg.particles_per_bin = 100;
    const auto shifted = build_rotation_curve(g.set, *e, cfg);
    const auto raw     = profile::RadialProfile::build(g.set.all(), 10, e->unit);
    ASSERT_TRUE(shifted && raw);
    EXPECT_NEAR(shifted->e_circ()(4), raw->e_circ()(4) - e->te_max, 1e-6);
    EXPECT_NEAR(shifted->phi()(4), raw->phi()(4) - e->te_max, 1e-6);
}

TEST(RotationCurve, ZeroSofteningLeavesEmptySubset) {
    LogCapture capture;
    auto g = kdc::testing::make_galaxy({.n_disk = 500, .n_spheroid = 0, .n_dm = 0});
    g.set.softening().setZero();
    const auto e = build_energy_field(g.set);
    ASSERT_TRUE(e.has_value());
    EXPECT_FALSE(build_rotation_curve(g.set, *e, DecompConfig{}).has_value());
    EXPECT_TRUE(capture.contains(log::Level::Error, "too small"));
}

TEST(RotationCurve, TooFewParticlesForOneBin) {
    LogCapture capture;
    auto g = kdc::testing::make_galaxy({.n_disk = 499, .n_spheroid = 0, .n_dm = 0});
    const auto e = build_energy_field(g.set);
    ASSERT_TRUE(e.has_value());
    EXPECT_FALSE(build_rotation_curve(g.set, *e, DecompConfig{}).has_value());
}
