/// @file tests/forecast/test_allocation_forecaster.cpp
/// @brief Tests for AllocationForecaster training and fallback inference.

#include "buylimit/forecast.hpp"
#include "buylimit/features.hpp"
#include "buylimit/target.hpp"
#include "../support/synthetic_series.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <vector>

using namespace buylimit;
using namespace buylimit::forecast;
using buylimit::testing::make_wave_series;

namespace {

ForecasterConfig small_config() {
    return ForecasterConfig{
        .shape      = RegressorShape{.lstm1 = 6, .lstm2 = 4, .dense = 3},
        .max_epochs = 3,
        .patience   = 2,
    };
}

std::vector<FeatureRow> wave_features(std::size_t n) {
    return features::FeatureEngine{}.compute(make_wave_series(n)).value_or(std::vector<FeatureRow>{});
}

/// Features of a wave series with one unusable price at `gap`.
std::vector<FeatureRow> gapped_features(std::size_t n, std::size_t gap) {
    auto series = make_wave_series(n);
    series[gap].asset_price_usd = std::numeric_limits<double>::quiet_NaN();
    return features::FeatureEngine{}.compute(series).value_or(std::vector<FeatureRow>{});
}

target::LabelSet wave_labels(std::size_t n) {
    const auto labels = target::TargetConstructor{}.build(wave_features(n));
    return labels.value_or(target::LabelSet{});
}

}  // namespace

// ─── Fallback inference ──────────────────────────────────────────────────────

TEST(AllocationForecaster, NoModelFallsBackToFifteenPercent) {
    const AllocationForecaster f;
    const auto rows = wave_features(100);
    const Forecast out = f.predict(nullptr, rows);
    EXPECT_DOUBLE_EQ(out.allocation_fraction, 0.15);
    ASSERT_TRUE(out.used_fallback());
    EXPECT_EQ(*out.fallback, ErrorKind::ModelUnavailable);
}

TEST(AllocationForecaster, ShortHistoryFallsBack) {
    const AllocationForecaster f(small_config());
    const auto outcome = f.train(wave_labels(300));
    ASSERT_NE(outcome.model, nullptr);

    const auto rows = wave_features(44);  // 14 rows < W + 1
    ASSERT_EQ(rows.size(), 14u);
    const Forecast out = f.predict(outcome.model.get(), rows);
    EXPECT_DOUBLE_EQ(out.allocation_fraction, 0.15);
    ASSERT_TRUE(out.fallback.has_value());
    EXPECT_EQ(*out.fallback, ErrorKind::DataInsufficient);
}

TEST(AllocationForecaster, LatestWindowAcrossGapFallsBack) {
    const AllocationForecaster f(small_config());
    const auto outcome = f.train(wave_labels(300));
    ASSERT_NE(outcome.model, nullptr);

    // 50 rows before the gap, 9 after it: the last 15 rows straddle it.
    const auto rows = gapped_features(120, 80);
    ASSERT_EQ(rows.size(), 59u);
    const Forecast out = f.predict(outcome.model.get(), rows);
    EXPECT_DOUBLE_EQ(out.allocation_fraction, 0.15);
    ASSERT_TRUE(out.fallback.has_value());
    EXPECT_EQ(*out.fallback, ErrorKind::DataInsufficient);

    // Once the segment after the gap holds W + 1 rows, inference resumes.
    const Forecast later = f.predict(outcome.model.get(), gapped_features(150, 80));
    EXPECT_FALSE(later.used_fallback());
}

TEST(AllocationForecaster, ShapeMismatchFallsBack) {
    const AllocationForecaster f(small_config());
    const auto outcome = f.train(wave_labels(300));
    ASSERT_NE(outcome.model, nullptr);

    Eigen::VectorXd lo = Eigen::VectorXd::Zero(3);
    Eigen::VectorXd hi = Eigen::VectorXd::Ones(3);
    AllocationModel broken = *outcome.model;
    broken.feature_scaler = *sequence::MinMaxScaler::from_bounds(lo, hi);

    const Forecast out = f.predict(&broken, wave_features(100));
    EXPECT_DOUBLE_EQ(out.allocation_fraction, 0.15);
    ASSERT_TRUE(out.fallback.has_value());
    EXPECT_EQ(*out.fallback, ErrorKind::ModelUnavailable);
}

// ─── Training ────────────────────────────────────────────────────────────────

TEST(AllocationForecaster, TooFewWindowsTrainsNoModel) {
    const auto labels = wave_labels(60);  // 30 features, 23 labels, 9 windows
    ASSERT_EQ(labels.rows.size(), 23u);

    const auto outcome = AllocationForecaster(small_config()).train(labels);
    EXPECT_EQ(outcome.model, nullptr);
    EXPECT_FALSE(outcome.report.model_trained);
    EXPECT_EQ(outcome.report.windows, 9u);
    EXPECT_DOUBLE_EQ(outcome.report.baseline_mae, 0.08);
    EXPECT_DOUBLE_EQ(outcome.report.model_mae, 0.05);
}

TEST(AllocationForecaster, ChronologicalSplitCounts) {
    const auto labels = wave_labels(300);  // 270 features, 263 labels
    ASSERT_EQ(labels.rows.size(), 263u);

    const auto outcome = AllocationForecaster(small_config()).train(labels);
    ASSERT_NE(outcome.model, nullptr);
    const auto& r = outcome.report;
    EXPECT_TRUE(r.model_trained);
    EXPECT_EQ(r.windows, 249u);
    EXPECT_EQ(r.train_windows, 199u);
    EXPECT_EQ(r.validation_windows, 50u);
    EXPECT_GE(r.epochs_run, 1u);
    EXPECT_LE(r.epochs_run, 3u);
    EXPECT_GE(r.best_epoch, 1u);
    EXPECT_LE(r.best_epoch, r.epochs_run);
    EXPECT_GE(r.model_mae, 0.0);
    EXPECT_GE(r.baseline_mae, 0.0);
}

TEST(AllocationForecaster, TrainingWindowsStopAtGaps) {
    // 120 + 119 feature rows in two segments, 113 + 112 labels.
    const auto labels = target::TargetConstructor{}.build(gapped_features(300, 150));
    ASSERT_TRUE(labels.has_value());
    ASSERT_EQ(labels->rows.size(), 225u);

    const auto outcome = AllocationForecaster(small_config()).train(*labels);
    EXPECT_EQ(outcome.report.windows, (113u - 14u) + (112u - 14u));
}

TEST(AllocationForecaster, ModelCarriesLabelBoundsAndWindow) {
    const auto labels = wave_labels(300);
    const auto outcome = AllocationForecaster(small_config()).train(labels);
    ASSERT_NE(outcome.model, nullptr);
    EXPECT_EQ(outcome.model->window, 14u);
    EXPECT_DOUBLE_EQ(outcome.model->label_lower_bound, labels.lower_bound);
    EXPECT_DOUBLE_EQ(outcome.model->label_upper_bound, labels.upper_bound);
    EXPECT_EQ(outcome.model->feature_scaler.columns(), FEATURE_COUNT);
}

TEST(AllocationForecaster, TrainingIsDeterministicPerSeed) {
    const auto labels = wave_labels(300);
    const AllocationForecaster f(small_config());
    const auto a = f.train(labels);
    const auto b = f.train(labels);
    ASSERT_NE(a.model, nullptr);
    ASSERT_NE(b.model, nullptr);

    for (std::size_t k = 0; k < TENSOR_COUNT; ++k) {
        EXPECT_TRUE(a.model->regressor.weights()[k] == b.model->regressor.weights()[k])
            << tensor_name(static_cast<TensorId>(k));
    }
    EXPECT_EQ(a.report.model_mae, b.report.model_mae);
}

TEST(AllocationForecaster, TrainedPredictionIsBoundedFraction) {
    const AllocationForecaster f(small_config());
    const auto outcome = f.train(wave_labels(300));
    ASSERT_NE(outcome.model, nullptr);

    const Forecast out = f.predict(outcome.model.get(), wave_features(120));
    EXPECT_FALSE(out.used_fallback());
    EXPECT_GE(out.allocation_fraction, 0.0);
    EXPECT_LE(out.allocation_fraction, 1.0);
}

TEST(TrainReport, ToStringMentionsEstimatedWhenUntrained) {
    const TrainReport r;
    EXPECT_NE(r.to_string().find("estimated"), std::string::npos);
}
