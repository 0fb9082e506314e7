/// @file tests/particles/test_units.cpp
/// @brief Tests for the dimensional unit system.

#include "kdc/units.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace kdc::units;

// ─── ratio_to ─────────────────────────────────────────────────────────────────

TEST(Units, SameUnitRatioIsOne) {
    const auto r = km2_per_s2().ratio_to(km2_per_s2());
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(*r, 1.0);
}

TEST(Units, KmSquaredToMetresSquared) {
    const auto r = km2_per_s2().ratio_to(m2_per_s2());
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(*r, 1e6);
}

TEST(Units, KpcPerGyrIsAboutOneKmPerSecond) {
    // 1 kpc/Gyr ≈ 0.9778 km/s.
    const auto r = kpc2_per_Gyr2().ratio_to(km2_per_s2());
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(std::sqrt(*r), 0.97779, 1e-4);
}

TEST(Units, DimensionMismatchIsRejected) {
    EXPECT_FALSE(kpc().ratio_to(km_per_s()).has_value());
    EXPECT_FALSE(km_per_s().ratio_to(km2_per_s2()).has_value());
    EXPECT_FALSE(Msol().ratio_to(Gyr()).has_value());
}

TEST(Units, UnknownUnitConvertsOnlyToItself) {
    EXPECT_FALSE(no_unit().ratio_to(km2_per_s2()).has_value());
    EXPECT_FALSE(km2_per_s2().ratio_to(no_unit()).has_value());
    EXPECT_TRUE(no_unit().ratio_to(no_unit()).has_value());
}

// ─── squared ──────────────────────────────────────────────────────────────────

TEST(Units, SquaredVelocityIsSpecificEnergy) {
    const Unit ke = km_per_s().squared();
    EXPECT_TRUE(ke.same_dimension(km2_per_s2()));
    EXPECT_TRUE(ke == km2_per_s2());
    EXPECT_FALSE(ke == m2_per_s2());
}
