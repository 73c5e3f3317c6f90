/// @file src/sizing/risk_profile.cpp
/// @brief Risk profile names and the canonical parameter table.

#include "buylimit/risk_profile.hpp"

#include <algorithm>
#include <cctype>

namespace buylimit::sizing {

namespace {

std::size_t slot(RiskProfile profile) noexcept {
    return static_cast<std::size_t>(profile);
}

}  // namespace

// ─── Names ────────────────────────────────────────────────────────────────────

std::optional<RiskProfile> parse_risk_profile(std::string_view text) noexcept {
    for (const auto profile : ALL_RISK_PROFILES) {
        const std::string_view name = to_string(profile);
        const bool match = std::equal(text.begin(), text.end(), name.begin(), name.end(),
                                      [](unsigned char a, unsigned char b) {
                                          return std::tolower(a) == std::tolower(b);
                                      });
        if (match) {
            return profile;
        }
    }
    return std::nullopt;
}

std::string_view to_string(RiskProfile profile) noexcept {
    switch (profile) {
        case RiskProfile::Conservative: return "conservative";
        case RiskProfile::Moderate:     return "moderate";
        case RiskProfile::Aggressive:   return "aggressive";
    }
    return "unknown";
}

std::string_view to_label(RiskProfile profile) noexcept {
    switch (profile) {
        case RiskProfile::Conservative: return "Conservative";
        case RiskProfile::Moderate:     return "Moderate";
        case RiskProfile::Aggressive:   return "Aggressive";
    }
    return "Unknown";
}

std::string_view describe(RiskProfile profile) noexcept {
    switch (profile) {
        case RiskProfile::Conservative: return "Max 15% crypto allocation, high volatility penalty";
        case RiskProfile::Moderate:     return "Max 25% crypto allocation, balanced approach";
        case RiskProfile::Aggressive:   return "Max 40% crypto allocation, lower volatility penalty";
    }
    return "";
}

// ─── RiskProfileTable ─────────────────────────────────────────────────────────

RiskProfileTable::RiskProfileTable(std::vector<Entry> entries) {
    for (const auto& [profile, config] : entries) {
        entries_[slot(profile)] = config;
    }
}

const RiskProfileTable& RiskProfileTable::canonical() {
    static const RiskProfileTable table({
        {RiskProfile::Conservative, RiskProfileConfig{
            .max_crypto_allocation = 0.15,
            .volatility_penalty    = 2.0,
            .reduction_multiplier  = 0.5,
            .reduction_floor       = 0.1,
            .fear_factor           = 1.1,
            .greed_factor          = 0.5,
            .uptrend_factor        = 0.6,
            .drawdown_factor       = 1.05,
            .max_single_trade      = 0.10,
            .first_time_bonus      = 1.2,
            .flat_fallback         = 0.10,
        }},
        {RiskProfile::Moderate, RiskProfileConfig{
            .max_crypto_allocation = 0.25,
            .volatility_penalty    = 1.5,
            .reduction_multiplier  = 0.3,
            .reduction_floor       = 0.2,
            .fear_factor           = 1.2,
            .greed_factor          = 0.7,
            .uptrend_factor        = 0.8,
            .drawdown_factor       = 1.1,
            .max_single_trade      = 0.20,
            .first_time_bonus      = 1.3,
            .flat_fallback         = 0.15,
        }},
        {RiskProfile::Aggressive, RiskProfileConfig{
            .max_crypto_allocation = 0.40,
            .volatility_penalty    = 1.0,
            .reduction_multiplier  = 0.2,
            .reduction_floor       = 0.2,
            .fear_factor           = 1.3,
            .greed_factor          = 0.8,
            .uptrend_factor        = 0.9,
            .drawdown_factor       = 1.2,
            .max_single_trade      = 0.35,
            .first_time_bonus      = 1.4,
            .flat_fallback         = 0.25,
        }},
    });
    return table;
}

std::optional<RiskProfileConfig> RiskProfileTable::find(RiskProfile profile) const noexcept {
    const auto k = slot(profile);
    if (k >= entries_.size()) {
        return std::nullopt;
    }
    return entries_[k];
}

bool RiskProfileTable::contains(RiskProfile profile) const noexcept {
    return find(profile).has_value();
}

}  // namespace buylimit::sizing
