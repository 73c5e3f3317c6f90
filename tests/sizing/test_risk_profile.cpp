/// @file tests/sizing/test_risk_profile.cpp
/// @brief Tests for risk profile names and the parameter table.

#include "buylimit/risk_profile.hpp"

#include <gtest/gtest.h>

#include <string_view>

using namespace buylimit::sizing;

TEST(RiskProfile, ParseIsCaseInsensitive) {
    EXPECT_EQ(parse_risk_profile("moderate"), RiskProfile::Moderate);
    EXPECT_EQ(parse_risk_profile("CONSERVATIVE"), RiskProfile::Conservative);
    EXPECT_EQ(parse_risk_profile("Aggressive"), RiskProfile::Aggressive);
}

TEST(RiskProfile, ParseRejectsUnknownNames) {
    EXPECT_FALSE(parse_risk_profile("").has_value());
    EXPECT_FALSE(parse_risk_profile("balanced").has_value());
    EXPECT_FALSE(parse_risk_profile("moderate ").has_value());
}

TEST(RiskProfile, ParseMatchesWholeNameWithoutThrowing) {
    static_assert(noexcept(parse_risk_profile(std::string_view{})));
    EXPECT_FALSE(parse_risk_profile("moder").has_value());
    EXPECT_FALSE(parse_risk_profile("aggressively").has_value());
    EXPECT_FALSE(parse_risk_profile("c0nservative").has_value());
    EXPECT_EQ(parse_risk_profile("mOdErAtE"), RiskProfile::Moderate);
}

TEST(RiskProfile, NamesAndLabels) {
    EXPECT_EQ(to_string(RiskProfile::Conservative), "conservative");
    EXPECT_EQ(to_label(RiskProfile::Moderate), "Moderate");
    EXPECT_EQ(to_label(RiskProfile::Aggressive), "Aggressive");
    for (const auto p : ALL_RISK_PROFILES) {
        EXPECT_EQ(parse_risk_profile(to_string(p)), p);
        EXPECT_FALSE(describe(p).empty());
    }
    EXPECT_NE(describe(RiskProfile::Moderate).find("25%"), std::string_view::npos);
}

// ─── RiskProfileTable ────────────────────────────────────────────────────────

TEST(RiskProfileTable, CanonicalCoversEveryProfile) {
    const auto& table = RiskProfileTable::canonical();
    for (const auto p : ALL_RISK_PROFILES) {
        EXPECT_TRUE(table.contains(p));
    }
}

TEST(RiskProfileTable, CanonicalValues) {
    const auto& table = RiskProfileTable::canonical();

    const auto c = table.find(RiskProfile::Conservative).value();
    EXPECT_DOUBLE_EQ(c.max_crypto_allocation, 0.15);
    EXPECT_DOUBLE_EQ(c.volatility_penalty, 2.0);
    EXPECT_DOUBLE_EQ(c.max_single_trade, 0.10);
    EXPECT_DOUBLE_EQ(c.flat_fallback, 0.10);

    const auto m = table.find(RiskProfile::Moderate).value();
    EXPECT_DOUBLE_EQ(m.max_crypto_allocation, 0.25);
    EXPECT_DOUBLE_EQ(m.volatility_penalty, 1.5);
    EXPECT_DOUBLE_EQ(m.first_time_bonus, 1.3);
    EXPECT_DOUBLE_EQ(m.flat_fallback, 0.15);

    const auto a = table.find(RiskProfile::Aggressive).value();
    EXPECT_DOUBLE_EQ(a.max_crypto_allocation, 0.40);
    EXPECT_DOUBLE_EQ(a.max_single_trade, 0.35);
    EXPECT_DOUBLE_EQ(a.flat_fallback, 0.25);
}

TEST(RiskProfileTable, CapsAscendWithRiskAppetite) {
    const auto& table = RiskProfileTable::canonical();
    double prev_cap = 0.0;
    double prev_base = 0.0;
    for (const auto p : ALL_RISK_PROFILES) {
        const auto c = table.find(p).value();
        EXPECT_GT(c.max_single_trade, prev_cap);
        EXPECT_GT(c.max_crypto_allocation, prev_base);
        prev_cap = c.max_single_trade;
        prev_base = c.max_crypto_allocation;
    }
}

TEST(RiskProfileTable, CustomTableLaterEntryWins) {
    auto tweaked = RiskProfileTable::canonical().find(RiskProfile::Moderate).value();
    tweaked.max_single_trade = 0.5;

    const RiskProfileTable table({
        {RiskProfile::Moderate, RiskProfileTable::canonical().find(RiskProfile::Moderate).value()},
        {RiskProfile::Moderate, tweaked},
    });
    EXPECT_DOUBLE_EQ(table.find(RiskProfile::Moderate)->max_single_trade, 0.5);
    EXPECT_FALSE(table.contains(RiskProfile::Conservative));
    EXPECT_FALSE(table.find(RiskProfile::Aggressive).has_value());
}
