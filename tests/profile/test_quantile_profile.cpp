/// @file tests/profile/test_quantile_profile.cpp
/// @brief Tests for per-bin quantile profiles.

#include "kdc/profile.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace kdc::profile;

// ─── quantile_of ──────────────────────────────────────────────────────────────

TEST(QuantileOf, InterpolatesBetweenOrderStatistics) {
    std::vector<double> v{4.0, 1.0, 3.0, 2.0};
    EXPECT_DOUBLE_EQ(quantile_of(v, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(quantile_of(v, 0.5), 2.5);
    EXPECT_DOUBLE_EQ(quantile_of(v, 1.0), 4.0);
    EXPECT_DOUBLE_EQ(quantile_of(v, 0.25), 1.75);
}

TEST(QuantileOf, EmptyIsNaN) {
    std::vector<double> v;
    EXPECT_TRUE(std::isnan(quantile_of(v, 0.5)));
}

// ─── QuantileProfile ──────────────────────────────────────────────────────────

namespace {

/// x = 99, 98, ..., 0 (reverse order); y = x².
void make_parabola(std::vector<double>& x, std::vector<double>& y) {
    for (int i = 99; i >= 0; --i) {
        x.push_back(static_cast<double>(i));
        y.push_back(static_cast<double>(i * i));
    }
}

}  // namespace

TEST(QuantileProfile, UnitQuantileIsBinMaximum) {
    std::vector<double> x, y;
    make_parabola(x, y);
    const auto pro = QuantileProfile::build(x, y, 1.0, 4);
    ASSERT_TRUE(pro.has_value());
    ASSERT_EQ(pro->nbins(), 4);
    EXPECT_DOUBLE_EQ(pro->values()(0), 24.0 * 24.0);
    EXPECT_DOUBLE_EQ(pro->values()(3), 99.0 * 99.0);
    EXPECT_DOUBLE_EQ(pro->x_mean()(0), 12.0);
    EXPECT_DOUBLE_EQ(pro->quantile(), 1.0);
}

TEST(QuantileProfile, MapBackIsInInputOrderAndBoundsEveryMember) {
    std::vector<double> x, y;
    make_parabola(x, y);
    const auto pro = QuantileProfile::build(x, y, 1.0, 5);
    ASSERT_TRUE(pro.has_value());

    const auto mapped = pro->map_back();
    ASSERT_EQ(mapped.size(), 100);
    for (std::size_t i = 0; i < x.size(); ++i) {
        EXPECT_GE(mapped(static_cast<Eigen::Index>(i)), y[i]);
    }
    // First input is x = 99, in the top bin.
    EXPECT_DOUBLE_EQ(mapped(0), 99.0 * 99.0);
}

TEST(QuantileProfile, ValueAtClampsToEndBins) {
    std::vector<double> x, y;
    make_parabola(x, y);
    const auto pro = QuantileProfile::build(x, y, 0.5, 2);
    ASSERT_TRUE(pro.has_value());
    EXPECT_DOUBLE_EQ(pro->value_at(-10.0), pro->values()(0));
    EXPECT_DOUBLE_EQ(pro->value_at(1e9), pro->values()(1));
    EXPECT_DOUBLE_EQ(pro->value_at(75.0), pro->values()(1));
}

TEST(QuantileProfile, RejectsInvalidArguments) {
    std::vector<double> x, y;
    make_parabola(x, y);
    EXPECT_FALSE(QuantileProfile::build(x, y, 1.5, 4).has_value());
    EXPECT_FALSE(QuantileProfile::build(x, y, -0.1, 4).has_value());
    EXPECT_FALSE(QuantileProfile::build(x, y, 0.5, 0).has_value());
    y.pop_back();
    EXPECT_FALSE(QuantileProfile::build(x, y, 0.5, 4).has_value());
}
