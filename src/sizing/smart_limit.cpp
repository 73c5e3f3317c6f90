/// @file src/sizing/smart_limit.cpp
/// @brief SmartLimitCalculator — profile-driven sizing with market factors.

#include "buylimit/sizing.hpp"
#include "buylimit/constants.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace buylimit::sizing {

namespace {

double sentiment_factor(double sentiment, const RiskProfileConfig& c) noexcept {
    if (sentiment < constants::SIZING_FEAR_BELOW)  return c.fear_factor;
    if (sentiment > constants::SIZING_GREED_ABOVE) return c.greed_factor;
    return 1.0;
}

double trend_factor(double trend, const RiskProfileConfig& c) noexcept {
    if (trend >  constants::SIZING_TREND_THRESHOLD) return c.uptrend_factor;
    if (trend < -constants::SIZING_TREND_THRESHOLD) return c.drawdown_factor;
    return 1.0;
}

}  // namespace

std::string LimitBreakdown::to_string() const {
    return fmt::format(
        "base={:.2f} reduction={:.3f} vol={:.3f} sentiment={:.2f} trend={:.2f} "
        "uncapped={:.2f} cap={:.2f} limit={:.2f}",
        base_limit, reduction_factor, volatility_factor, sentiment_factor,
        trend_factor, uncapped_limit, cap, limit);
}

SmartLimitCalculator::SmartLimitCalculator(RiskProfileTable table)
    : table_(std::move(table))
{}

const RiskProfileTable& SmartLimitCalculator::table() const noexcept {
    return table_;
}

// ─── apply ────────────────────────────────────────────────────────────────────

LimitBreakdown SmartLimitCalculator::apply(const MarketSnapshot& market,
                                           double balance,
                                           double holdings_value,
                                           const RiskProfileConfig& config) noexcept {
    LimitBreakdown b{};
    b.base_limit = balance * config.max_crypto_allocation;

    b.reduction_factor = 1.0;
    if (holdings_value > 0.0) {
        const double ratio = std::min(holdings_value / balance, constants::MAX_HOLDINGS_RATIO);
        b.reduction_factor = std::max(config.reduction_floor,
                                      1.0 - ratio * config.reduction_multiplier);
    }

    const double vol = std::max(market.volatility, 0.0);
    b.volatility_factor = 1.0 / (1.0 + config.volatility_penalty * vol);
    b.sentiment_factor  = sentiment_factor(market.sentiment, config);
    b.trend_factor      = trend_factor(market.trend, config);

    b.uncapped_limit = b.base_limit * b.reduction_factor * b.volatility_factor
                     * b.sentiment_factor * b.trend_factor;
    b.cap   = balance * config.max_single_trade;
    b.limit = std::max(std::min(b.uncapped_limit, b.cap), 0.0);
    return b;
}

// ─── compute ──────────────────────────────────────────────────────────────────

std::optional<LimitBreakdown>
SmartLimitCalculator::compute(const MarketSnapshot& market,
                              double balance,
                              double holdings_value,
                              RiskProfile profile) const {
    const auto config = table_.find(profile);
    if (!config) {
        spdlog::error("[SmartLimit] no configuration for risk profile '{}'", to_string(profile));
        return std::nullopt;
    }
    if (!std::isfinite(balance) || balance <= 0.0) {
        return std::nullopt;
    }
    if (!std::isfinite(holdings_value) || holdings_value < 0.0) {
        return std::nullopt;
    }
    if (!std::isfinite(market.volatility) ||
        !std::isfinite(market.sentiment)  ||
        !std::isfinite(market.trend)) {
        return std::nullopt;
    }
    return apply(market, balance, holdings_value, *config);
}

}  // namespace buylimit::sizing
