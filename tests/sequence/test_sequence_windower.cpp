/// @file tests/sequence/test_sequence_windower.cpp
/// @brief Tests for SequenceWindower window layout and feature stacking.

#include "buylimit/sequence.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace buylimit;
using namespace buylimit::sequence;

namespace {

/// Row r, column c holds r * 10 + c so every cell identifies its origin.
Eigen::MatrixXd indexed_matrix(Eigen::Index rows) {
    Eigen::MatrixXd m(rows, FEATURE_COUNT);
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < FEATURE_COUNT; ++c) {
            m(r, c) = static_cast<double>(r * 10 + c);
        }
    }
    return m;
}

Eigen::VectorXd indexed_targets(Eigen::Index rows) {
    Eigen::VectorXd t(rows);
    for (Eigen::Index r = 0; r < rows; ++r) t(r) = 1000.0 + static_cast<double>(r);
    return t;
}

}  // namespace

TEST(SequenceWindower, WindowCountIsRowsMinusWindow) {
    const SequenceWindower w(14);
    EXPECT_EQ(w.training_windows(indexed_matrix(20), indexed_targets(20)).size(), 6u);
    EXPECT_EQ(w.training_windows(indexed_matrix(15), indexed_targets(15)).size(), 1u);
    EXPECT_TRUE(w.training_windows(indexed_matrix(14), indexed_targets(14)).empty());
}

TEST(SequenceWindower, WindowInputPrecedesTarget) {
    const SequenceWindower w(14);
    const auto windows = w.training_windows(indexed_matrix(30), indexed_targets(30));
    ASSERT_EQ(windows.size(), 16u);

    for (std::size_t k = 0; k < windows.size(); ++k) {
        const auto i = static_cast<Eigen::Index>(k + 14);
        const auto& win = windows[k];
        EXPECT_EQ(win.end_index, k + 14);
        ASSERT_EQ(win.sequence.rows(), 14);
        ASSERT_EQ(win.sequence.cols(), FEATURE_COUNT);
        EXPECT_DOUBLE_EQ(win.sequence(0, 0), static_cast<double>((i - 14) * 10));
        EXPECT_DOUBLE_EQ(win.sequence(13, 3), static_cast<double>((i - 1) * 10 + 3));
        ASSERT_TRUE(win.target.has_value());
        EXPECT_DOUBLE_EQ(*win.target, 1000.0 + static_cast<double>(i));
    }
}

TEST(SequenceWindower, ConsecutiveWindowsOverlapByWMinusOne) {
    const SequenceWindower w(5);
    const auto windows = w.training_windows(indexed_matrix(12), indexed_targets(12));
    ASSERT_GE(windows.size(), 2u);
    EXPECT_TRUE(windows[0].sequence.bottomRows(4).isApprox(windows[1].sequence.topRows(4)));
}

TEST(SequenceWindower, MismatchedTargetsYieldNoWindows) {
    const SequenceWindower w(14);
    EXPECT_TRUE(w.training_windows(indexed_matrix(30), indexed_targets(29)).empty());
}

TEST(SequenceWindower, LatestWindowNeedsWPlusOneRows) {
    const SequenceWindower w(14);
    EXPECT_EQ(w.min_rows(), 15u);
    EXPECT_FALSE(w.latest_window(indexed_matrix(14)).has_value());

    const auto latest = w.latest_window(indexed_matrix(40));
    ASSERT_TRUE(latest.has_value());
    EXPECT_FALSE(latest->target.has_value());
    EXPECT_EQ(latest->end_index, 39u);
    EXPECT_EQ(latest->sequence.rows(), 14);
    EXPECT_DOUBLE_EQ(latest->sequence(0, 0), 260.0);
    EXPECT_DOUBLE_EQ(latest->sequence(13, 0), 390.0);
}

TEST(SequenceWindower, WindowsNeverSpanSegments) {
    const SequenceWindower w(5);
    const std::vector<std::size_t> segments{0, 0, 0, 0, 0, 0, 1, 1, 1, 1, 1, 1};

    const auto windows = w.training_windows(indexed_matrix(12), indexed_targets(12), segments);
    ASSERT_EQ(windows.size(), 2u);
    EXPECT_EQ(windows[0].end_index, 5u);
    EXPECT_EQ(windows[1].end_index, 11u);
    EXPECT_DOUBLE_EQ(windows[1].sequence(0, 0), 60.0);
}

TEST(SequenceWindower, MismatchedSegmentsYieldNoWindows) {
    const SequenceWindower w(5);
    const std::vector<std::size_t> segments(11, 0);
    EXPECT_TRUE(w.training_windows(indexed_matrix(12), indexed_targets(12), segments).empty());
    EXPECT_FALSE(w.latest_window(indexed_matrix(12), segments).has_value());
}

TEST(SequenceWindower, LatestWindowRejectsGap) {
    const SequenceWindower w(5);
    const std::vector<std::size_t> tail_gap{0, 0, 0, 0, 0, 0, 0, 0, 1, 1, 1, 1};
    EXPECT_FALSE(w.latest_window(indexed_matrix(12), tail_gap).has_value());

    const std::vector<std::size_t> early_gap{0, 0, 0, 0, 0, 0, 1, 1, 1, 1, 1, 1};
    const auto latest = w.latest_window(indexed_matrix(12), early_gap);
    ASSERT_TRUE(latest.has_value());
    EXPECT_DOUBLE_EQ(latest->sequence(0, 0), 70.0);
}

TEST(SequenceWindower, SegmentIdsFollowRows) {
    std::vector<FeatureRow> rows(3);
    rows[2].segment = 4;
    EXPECT_EQ(segment_ids(rows), (std::vector<std::size_t>{0, 0, 4}));
}

TEST(SequenceWindower, FeatureMatrixUsesForecasterOrder) {
    FeatureRow row{};
    row.asset_volatility = 0.4;
    row.sentiment        = 55.0;
    row.trend            = -0.02;
    row.fx_volatility    = 0.01;
    const std::vector<FeatureRow> rows{row, row};

    const Eigen::MatrixXd m = feature_matrix(rows);
    ASSERT_EQ(m.rows(), 2);
    ASSERT_EQ(m.cols(), FEATURE_COUNT);
    EXPECT_DOUBLE_EQ(m(1, 0), 0.4);
    EXPECT_DOUBLE_EQ(m(1, 1), 55.0);
    EXPECT_DOUBLE_EQ(m(1, 2), -0.02);
    EXPECT_DOUBLE_EQ(m(1, 3), 0.01);
}
