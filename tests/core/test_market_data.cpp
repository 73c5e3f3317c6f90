/// @file tests/core/test_market_data.cpp
/// @brief Tests for the MarketDataProvider implementations.

#include "buylimit/market_data.hpp"
#include "../support/synthetic_series.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <limits>

using namespace buylimit;
using namespace buylimit::core;
using buylimit::testing::make_wave_series;
using buylimit::testing::series_to_csv;

namespace {

std::filesystem::path write_history(const PriceSeries& series) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    const auto path = std::filesystem::temp_directory_path() /
                      (std::string("buylimit_market_") + info->name() + ".csv");
    std::ofstream out(path);
    out << series_to_csv(series);
    return path;
}

}  // namespace

// ─── Helpers ─────────────────────────────────────────────────────────────────

TEST(TrimHistory, KeepsMostRecentRecords) {
    const auto series = make_wave_series(100);
    const auto trimmed = trim_history(series, 30);
    ASSERT_EQ(trimmed.size(), 30u);
    EXPECT_DOUBLE_EQ(trimmed.front().timestamp, series[70].timestamp);
    EXPECT_DOUBLE_EQ(trimmed.back().timestamp, series.back().timestamp);
}

TEST(TrimHistory, ShorterSeriesUnchanged) {
    const auto series = make_wave_series(20);
    EXPECT_EQ(trim_history(series, 365).size(), 20u);
    EXPECT_TRUE(trim_history(series, 0).empty());
}

TEST(ValidRates, RequiresPositiveFiniteValues) {
    EXPECT_TRUE(valid_rates({.asset_price_usd = 50000.0, .fx_rate = 83.0}));
    EXPECT_FALSE(valid_rates({.asset_price_usd = 0.0, .fx_rate = 83.0}));
    EXPECT_FALSE(valid_rates({.asset_price_usd = 50000.0, .fx_rate = -1.0}));
    EXPECT_FALSE(valid_rates({.asset_price_usd = std::numeric_limits<double>::quiet_NaN(),
                              .fx_rate = 83.0}));
}

// ─── StaticMarketDataProvider ────────────────────────────────────────────────

TEST(StaticMarketDataProvider, ServesTrimmedHistoryAndLiveQuote) {
    const StaticMarketDataProvider p(make_wave_series(400),
                                     LiveRates{.asset_price_usd = 61000.0, .fx_rate = 84.0});
    const auto history = p.fetch_history(365);
    ASSERT_TRUE(history.has_value());
    EXPECT_EQ(history->size(), 365u);

    const auto live = p.fetch_live();
    ASSERT_TRUE(live.has_value());
    EXPECT_DOUBLE_EQ(live->asset_price_usd, 61000.0);
}

TEST(StaticMarketDataProvider, NulloptSimulatesUnreachableUpstream) {
    const StaticMarketDataProvider p(std::nullopt, std::nullopt);
    EXPECT_FALSE(p.fetch_history(365).has_value());
    EXPECT_FALSE(p.fetch_live().has_value());
}

// ─── CsvMarketDataProvider ───────────────────────────────────────────────────

TEST(CsvMarketDataProvider, LiveQuoteIsLastRow) {
    const auto series = make_wave_series(60);
    const auto path = write_history(series);

    const CsvMarketDataProvider p(path.string());
    const auto history = p.fetch_history(45);
    ASSERT_TRUE(history.has_value());
    EXPECT_EQ(history->size(), 45u);

    const auto live = p.fetch_live();
    ASSERT_TRUE(live.has_value());
    EXPECT_DOUBLE_EQ(live->asset_price_usd, series.back().asset_price_usd);
    EXPECT_DOUBLE_EQ(live->fx_rate, series.back().fx_rate);

    std::filesystem::remove(path);
}

TEST(CsvMarketDataProvider, OverrideWinsOverLastRow) {
    const auto path = write_history(make_wave_series(40));
    const CsvMarketDataProvider p(path.string(),
                                  LiveRates{.asset_price_usd = 70000.0, .fx_rate = 82.5});
    const auto live = p.fetch_live();
    ASSERT_TRUE(live.has_value());
    EXPECT_DOUBLE_EQ(live->asset_price_usd, 70000.0);
    EXPECT_DOUBLE_EQ(live->fx_rate, 82.5);
    std::filesystem::remove(path);
}

TEST(CsvMarketDataProvider, MissingFileIsUpstreamFailure) {
    const CsvMarketDataProvider p("/nonexistent/buylimit/history.csv");
    EXPECT_FALSE(p.fetch_history(365).has_value());
    EXPECT_FALSE(p.fetch_live().has_value());
}
