/// @file tests/core/test_cli.cpp
/// @brief Tests for command-line flag reading.

#include "buylimit/cli.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace buylimit::cli;

// ─── Scalars ─────────────────────────────────────────────────────────────────

TEST(CliParse, NumberNeedsWholeFiniteText) {
    EXPECT_EQ(parse_number("2500.5"), 2500.5);
    EXPECT_EQ(parse_number("1e3"), 1000.0);
    EXPECT_FALSE(parse_number("12abc").has_value());
    EXPECT_FALSE(parse_number("").has_value());
    EXPECT_FALSE(parse_number("inf").has_value());
    EXPECT_FALSE(parse_number("1e400").has_value());
}

TEST(CliParse, CountAcceptsPositiveIntegers) {
    EXPECT_EQ(parse_count("1"), 1u);
    EXPECT_EQ(parse_count("365"), 365u);
}

TEST(CliParse, CountRejectsFractionsExponentsAndSigns) {
    EXPECT_FALSE(parse_count("2.7").has_value());
    EXPECT_FALSE(parse_count("1e30").has_value());
    EXPECT_FALSE(parse_count("-5").has_value());
    EXPECT_FALSE(parse_count("+5").has_value());
    EXPECT_FALSE(parse_count(" 5").has_value());
    EXPECT_FALSE(parse_count("0").has_value());
    EXPECT_FALSE(parse_count("").has_value());
    EXPECT_FALSE(parse_count("99999999999999999999999999").has_value());
}

// ─── Args ────────────────────────────────────────────────────────────────────

TEST(CliArgs, ReadsPositionalFlagsAndValues) {
    const Args args(std::vector<std::string>{"prices.csv", "--balance", "5000", "--first-time"});
    EXPECT_EQ(args.positional(), "prices.csv");
    EXPECT_TRUE(args.flag("--first-time"));
    EXPECT_FALSE(args.flag("--retrain"));
    EXPECT_EQ(args.value("--balance"), "5000");
    EXPECT_EQ(args.number("--balance"), 5000.0);
    EXPECT_FALSE(args.value("--first-time").has_value());
}

TEST(CliArgs, LeadingFlagIsNotPositional) {
    const Args args(std::vector<std::string>{"--balance", "5000"});
    EXPECT_FALSE(args.positional().has_value());
}

// ─── --history-days ──────────────────────────────────────────────────────────

TEST(CliHistoryDays, AbsentLeavesDefault) {
    const auto r = history_days(Args(std::vector<std::string>{"prices.csv"}));
    EXPECT_FALSE(r.value.has_value());
    EXPECT_FALSE(r.error.has_value());
}

TEST(CliHistoryDays, WholeNumberIsUsed) {
    const auto r = history_days(Args(std::vector<std::string>{"prices.csv", "--history-days", "90"}));
    EXPECT_EQ(r.value, 90u);
    EXPECT_FALSE(r.error.has_value());
}

TEST(CliHistoryDays, FractionOrHugeValueIsAnError) {
    for (const std::string text : {"2.7", "1e30", "0", "-1"}) {
        const auto r = history_days(Args(std::vector<std::string>{"prices.csv", "--history-days", text}));
        EXPECT_FALSE(r.value.has_value()) << text;
        ASSERT_TRUE(r.error.has_value()) << text;
        EXPECT_NE(r.error->find(text), std::string::npos);
    }
}

// ─── --price / --fx ──────────────────────────────────────────────────────────

TEST(CliLiveQuote, AbsentMeansLastCsvRow) {
    const auto r = live_quote(Args(std::vector<std::string>{"prices.csv"}));
    EXPECT_FALSE(r.value.has_value());
    EXPECT_FALSE(r.error.has_value());
}

TEST(CliLiveQuote, BothFlagsGiveRates) {
    const auto r = live_quote(Args(std::vector<std::string>{"prices.csv", "--price", "60000", "--fx", "83.5"}));
    ASSERT_TRUE(r.value.has_value());
    EXPECT_FALSE(r.error.has_value());
    EXPECT_DOUBLE_EQ(r.value->asset_price_usd, 60000.0);
    EXPECT_DOUBLE_EQ(r.value->fx_rate, 83.5);
}

TEST(CliLiveQuote, HalfAPairIsAnError) {
    const auto price_only = live_quote(Args(std::vector<std::string>{"prices.csv", "--price", "60000"}));
    EXPECT_FALSE(price_only.value.has_value());
    EXPECT_TRUE(price_only.error.has_value());

    const auto fx_only = live_quote(Args(std::vector<std::string>{"prices.csv", "--fx", "83"}));
    EXPECT_FALSE(fx_only.value.has_value());
    EXPECT_TRUE(fx_only.error.has_value());
}

TEST(CliLiveQuote, MalformedValueIsAnError) {
    const auto r = live_quote(Args(std::vector<std::string>{"prices.csv", "--price", "abc", "--fx", "83"}));
    EXPECT_FALSE(r.value.has_value());
    ASSERT_TRUE(r.error.has_value());
    EXPECT_NE(r.error->find("abc"), std::string::npos);
}
