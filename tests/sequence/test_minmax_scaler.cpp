/// @file tests/sequence/test_minmax_scaler.cpp
/// @brief Tests for MinMaxScaler fit / transform / inverse.

#include "buylimit/sequence.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace buylimit::sequence;

namespace {

Eigen::MatrixXd sample_matrix() {
    Eigen::MatrixXd m(4, 3);
    m << 0.0, 10.0, 5.0,
         2.0, 20.0, 5.0,
         4.0, 30.0, 5.0,
         1.0, 15.0, 5.0;
    return m;
}

}  // namespace

TEST(MinMaxScaler, FitRecordsColumnBounds) {
    const auto s = MinMaxScaler::fit(sample_matrix());
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->columns(), 3);
    EXPECT_DOUBLE_EQ(s->min()(0), 0.0);
    EXPECT_DOUBLE_EQ(s->max()(0), 4.0);
    EXPECT_DOUBLE_EQ(s->min()(1), 10.0);
    EXPECT_DOUBLE_EQ(s->max()(1), 30.0);
}

TEST(MinMaxScaler, FitRejectsEmptyAndNonFinite) {
    EXPECT_FALSE(MinMaxScaler::fit(Eigen::MatrixXd(0, 3)).has_value());

    auto m = sample_matrix();
    m(2, 1) = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(MinMaxScaler::fit(m).has_value());
}

TEST(MinMaxScaler, TransformMapsRangeOntoUnitInterval) {
    const auto s = MinMaxScaler::fit(sample_matrix());
    ASSERT_TRUE(s.has_value());
    const Eigen::MatrixXd t = s->transform(sample_matrix());

    EXPECT_DOUBLE_EQ(t(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(t(2, 0), 1.0);
    EXPECT_DOUBLE_EQ(t(1, 0), 0.5);
    EXPECT_DOUBLE_EQ(t(3, 1), 0.25);
}

TEST(MinMaxScaler, ZeroRangeColumnMapsToZero) {
    const auto s = MinMaxScaler::fit(sample_matrix());
    ASSERT_TRUE(s.has_value());
    const Eigen::MatrixXd t = s->transform(sample_matrix());
    for (Eigen::Index r = 0; r < t.rows(); ++r) {
        EXPECT_DOUBLE_EQ(t(r, 2), 0.0);
    }
}

TEST(MinMaxScaler, OutOfRangeInputsAreClamped) {
    const auto s = MinMaxScaler::fit(sample_matrix());
    ASSERT_TRUE(s.has_value());

    Eigen::MatrixXd x(2, 3);
    x << -100.0, 1000.0, 7.0,
          100.0, -5.0, std::numeric_limits<double>::quiet_NaN();
    const Eigen::MatrixXd t = s->transform(x);

    EXPECT_DOUBLE_EQ(t(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(t(0, 1), 1.0);
    EXPECT_DOUBLE_EQ(t(1, 0), 1.0);
    EXPECT_DOUBLE_EQ(t(1, 1), 0.0);
    EXPECT_DOUBLE_EQ(t(1, 2), 0.0);
}

TEST(MinMaxScaler, InverseTransformRecoversOriginalUnits) {
    Eigen::MatrixXd y(3, 1);
    y << 0.02, 0.25, 0.10;
    const auto s = MinMaxScaler::fit(y);
    ASSERT_TRUE(s.has_value());

    EXPECT_NEAR(s->inverse_transform(0.0), 0.02, 1e-15);
    EXPECT_NEAR(s->inverse_transform(1.0), 0.25, 1e-15);
    const double scaled = s->transform(y)(2, 0);
    EXPECT_NEAR(s->inverse_transform(scaled), 0.10, 1e-15);
}

TEST(MinMaxScaler, FromBoundsValidates) {
    Eigen::VectorXd lo(2), hi(2), short_hi(1);
    lo << 0.0, 1.0;
    hi << 1.0, 2.0;
    short_hi << 1.0;

    EXPECT_TRUE(MinMaxScaler::from_bounds(lo, hi).has_value());
    EXPECT_FALSE(MinMaxScaler::from_bounds(hi, lo).has_value());
    EXPECT_FALSE(MinMaxScaler::from_bounds(lo, short_hi).has_value());
    EXPECT_FALSE(MinMaxScaler::from_bounds(Eigen::VectorXd(0), Eigen::VectorXd(0)).has_value());
}
