#pragma once

/// @file include/buylimit/sizing.hpp
/// @brief Smart Limit Calculator — rule-based spending limit.
///
/// # Module: Smart Limit Calculator
///
/// ## Formula
/// ```
/// base       = balance × max_crypto_allocation
/// reduction  = holdings > 0 ? max(floor, 1 − min(holdings/balance, 2) × multiplier) : 1
/// vol_factor = 1 / (1 + volatility_penalty × volatility)
/// sentiment  = < 20 → fear_factor, > 80 → greed_factor, else 1
/// trend      = > +0.15 → uptrend_factor, < −0.15 → drawdown_factor, else 1
/// limit      = clamp(base × reduction × vol_factor × sentiment × trend,
///                    0, balance × max_single_trade)
/// ```
///
/// ## Guarantees
/// - 0 ≤ limit ≤ balance × max_single_trade
/// - Non-increasing in holdings value and in volatility, all else fixed
/// - Pure: no state, no I/O

#include "buylimit/risk_profile.hpp"

#include <optional>
#include <string>

namespace buylimit::sizing {

/// The latest feature values the calculator reads.
struct MarketSnapshot {
    double volatility;  ///< Annualised asset volatility
    double sentiment;   ///< Oscillator in [0, 100]
    double trend;       ///< (price − MA20) / MA20
};

/// Every intermediate factor, for logging and tests.
struct LimitBreakdown {
    double base_limit;
    double reduction_factor;
    double volatility_factor;
    double sentiment_factor;
    double trend_factor;
    double uncapped_limit;
    double cap;
    double limit;

    [[nodiscard]] std::string to_string() const;
};

class SmartLimitCalculator {
public:
    explicit SmartLimitCalculator(RiskProfileTable table = RiskProfileTable::canonical());

    /// Limit for `profile` looked up in the injected table.
    ///
    /// # Returns
    /// `nullopt` if the profile has no table entry, `balance` is not a
    /// positive finite number, `holdings_value` is negative or non-finite,
    /// or any snapshot value is non-finite.
    [[nodiscard]] std::optional<LimitBreakdown>
    compute(const MarketSnapshot& market,
            double balance,
            double holdings_value,
            RiskProfile profile) const;

    /// The formula itself, for validated inputs.
    [[nodiscard]] static LimitBreakdown
    apply(const MarketSnapshot& market,
          double balance,
          double holdings_value,
          const RiskProfileConfig& config) noexcept;

    [[nodiscard]] const RiskProfileTable& table() const noexcept;

private:
    RiskProfileTable table_;
};

}  // namespace buylimit::sizing
