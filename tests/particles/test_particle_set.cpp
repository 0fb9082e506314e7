/// @file tests/particles/test_particle_set.cpp
/// @brief Tests for ParticleSet, ParticleView and the spatial filters.
///
/// Test categories:
///   1. Construction defaults and family bookkeeping
///   2. Field store
///   3. Star label field
///   4. Derived kinematics
///   5. Potential unit conversion
///   6. Disc and sphere filters

#include "kdc/particles.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

using namespace kdc;

namespace {

/// Four particles on the x axis at x = 1..4 kpc; families DM, star, gas, star.
ParticleSet make_line() {
    ParticleSet set(4);
    for (Eigen::Index i = 0; i < 4; ++i) {
        set.positions()(i, 0) = static_cast<double>(i + 1);
    }
    set.set_family(1, Family::Star);
    set.set_family(2, Family::Gas);
    set.set_family(3, Family::Star);
    return set;
}

}  // namespace

// ─── Test 1: construction and families ────────────────────────────────────────

TEST(ParticleSet, DefaultsAreAtRestUnitMassDarkMatter) {
    ParticleSet set(3);
    EXPECT_EQ(set.size(), 3);
    EXPECT_TRUE(set.positions().isZero());
    EXPECT_TRUE(set.velocities().isZero());
    EXPECT_TRUE(set.masses().isOnes());
    EXPECT_EQ(set.count(Family::DarkMatter), 3);
    EXPECT_EQ(set.count(Family::Star), 0);
    EXPECT_TRUE(set.velocity_unit() == units::km_per_s());
    EXPECT_TRUE(set.potential_unit() == units::km2_per_s2());
}

TEST(ParticleSet, FamilyIndicesAreAscending) {
    const ParticleSet set = make_line();
    EXPECT_EQ(set.indices(Family::Star), (IndexList{1, 3}));
    EXPECT_EQ(set.indices(Family::Gas), (IndexList{2}));
    EXPECT_EQ(set.stars().size(), 2);
    EXPECT_EQ(set.all().size(), 4);
}

TEST(ParticleView, GatherFollowsViewOrder) {
    const ParticleSet set = make_line();
    const ScalarField x = set.positions().col(0);
    const ScalarField s = set.stars().gather(x);
    ASSERT_EQ(s.size(), 2);
    EXPECT_DOUBLE_EQ(s(0), 2.0);
    EXPECT_DOUBLE_EQ(s(1), 4.0);
}

// ─── Test 2: field store ──────────────────────────────────────────────────────

TEST(ParticleSetFields, SetGetAndErase) {
    ParticleSet set(2);
    EXPECT_FALSE(set.has_field("te"));
    EXPECT_FALSE(set.field("te").has_value());

    EXPECT_TRUE(set.set_field("te", ScalarField::Constant(2, -1.5)));
    ASSERT_TRUE(set.has_field("te"));
    EXPECT_DOUBLE_EQ((*set.field("te"))(1), -1.5);

    EXPECT_TRUE(set.set_field("te", ScalarField::Constant(2, 3.0)));
    EXPECT_DOUBLE_EQ((*set.field("te"))(0), 3.0);

    EXPECT_TRUE(set.erase_field("te"));
    EXPECT_FALSE(set.erase_field("te"));
    EXPECT_TRUE(set.field_names().empty());
}

TEST(ParticleSetFields, WrongLengthIsRejected) {
    ParticleSet set(3);
    EXPECT_FALSE(set.set_field("j_circ", ScalarField::Zero(2)));
    EXPECT_FALSE(set.has_field("j_circ"));
}

// ─── Test 3: star labels ──────────────────────────────────────────────────────

TEST(ParticleSetLabels, CreatedZeroFilledPerStar) {
    ParticleSet set = make_line();
    EXPECT_FALSE(set.has_star_labels());
    LabelField& labels = set.ensure_star_labels();
    ASSERT_EQ(labels.size(), 2);
    EXPECT_TRUE((labels.array() == 0).all());

    labels(1) = static_cast<int>(ComponentLabel::Halo);
    EXPECT_EQ((*set.star_labels())(1), 2);
}

TEST(ParticleSetLabels, DiscardedWhenStarMembershipChanges) {
    ParticleSet set = make_line();
    set.ensure_star_labels();
    set.set_family(2, Family::DarkMatter);  // gas → dm, stars untouched
    EXPECT_TRUE(set.has_star_labels());
    set.set_family(0, Family::Star);
    EXPECT_FALSE(set.has_star_labels());
}

// ─── Test 4: derived kinematics ───────────────────────────────────────────────

TEST(ParticleSetKinematics, CircularOrbitInPlane) {
    ParticleSet set(1);
    set.positions().row(0)  = Eigen::RowVector3d(3.0, 4.0, 1.0);
    // Tangential 200 km/s in the x-y plane.
    set.velocities().row(0) = Eigen::RowVector3d(-4.0, 3.0, 0.0) * 40.0;

    EXPECT_DOUBLE_EQ(set.rxy()(0), 5.0);
    EXPECT_DOUBLE_EQ(set.radius()(0), std::sqrt(26.0));
    EXPECT_DOUBLE_EQ(set.vcxy()(0), 200.0);
    EXPECT_DOUBLE_EQ(set.kinetic_energy()(0), 0.5 * 200.0 * 200.0);
    EXPECT_DOUBLE_EQ(set.angular_momentum()(0, 2), 5.0 * 200.0);
}

TEST(ParticleSetKinematics, RotationalVelocityIsZeroOnAxis) {
    ParticleSet set(1);
    set.positions().row(0)  = Eigen::RowVector3d(0.0, 0.0, 2.0);
    set.velocities().row(0) = Eigen::RowVector3d(10.0, 20.0, 30.0);
    EXPECT_DOUBLE_EQ(set.vcxy()(0), 0.0);
}

// ─── Test 5: potential units ──────────────────────────────────────────────────

TEST(ParticleSetUnits, PotentialConvertedToKineticEnergyBasis) {
    ParticleSet set(2);
    set.set_potential_unit(units::m2_per_s2());
    set.potential() << -4e10, -1e10;

    const auto phi = set.potential_in(set.kinetic_energy_unit());
    ASSERT_TRUE(phi.has_value());
    EXPECT_DOUBLE_EQ((*phi)(0), -4e4);
    EXPECT_DOUBLE_EQ((*phi)(1), -1e4);
    // Stored values untouched.
    EXPECT_DOUBLE_EQ(set.potential()(0), -4e10);
}

TEST(ParticleSetUnits, ConvertInPlaceUpdatesUnit) {
    ParticleSet set(1);
    set.potential()(0) = -2.0;
    ASSERT_TRUE(set.convert_potential_units(units::m2_per_s2()));
    EXPECT_DOUBLE_EQ(set.potential()(0), -2e6);
    EXPECT_TRUE(set.potential_unit() == units::m2_per_s2());
}

TEST(ParticleSetUnits, MismatchLeavesPotentialUntouched) {
    ParticleSet set(1);
    set.potential()(0) = -7.0;
    EXPECT_FALSE(set.convert_potential_units(units::kpc()));
    EXPECT_FALSE(set.potential_in(units::Gyr()).has_value());
    EXPECT_DOUBLE_EQ(set.potential()(0), -7.0);
}

// ─── Test 6: filters ──────────────────────────────────────────────────────────

TEST(Filters, DiscSubsetIsStrictInRadiusAndHeight) {
    ParticleSet set(4);
    set.positions() << 1.0, 0.0, 0.1,
                       5.0, 0.0, 0.0,    // on the outer radius: excluded
                       2.0, 0.0, -0.3,   // on the half-height: excluded
                       0.0, 3.0, -0.29;
    const auto disc = disc_subset(set, 5.0, 0.3);
    EXPECT_EQ(disc.indices(), (IndexList{0, 3}));
}

TEST(Filters, SphereSubsetAroundOffsetCentre) {
    const ParticleSet set = make_line();
    const auto inner = sphere_subset(set, Vec3(2.5, 0.0, 0.0), 1.0);
    EXPECT_EQ(inner.indices(), (IndexList{1, 2}));
}
