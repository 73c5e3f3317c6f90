/// @file src/core/market_data.cpp
/// @brief File-backed and in-memory MarketDataProvider implementations.

#include "buylimit/market_data.hpp"
#include "buylimit/data_loader.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstddef>
#include <utility>

namespace buylimit::core {

PriceSeries trim_history(PriceSeries series, std::size_t days) {
    if (series.size() > days) {
        series.erase(series.begin(),
                     series.begin() + static_cast<std::ptrdiff_t>(series.size() - days));
    }
    return series;
}

bool valid_rates(const LiveRates& rates) noexcept {
    return std::isfinite(rates.asset_price_usd) && rates.asset_price_usd > 0.0 &&
           std::isfinite(rates.fx_rate)         && rates.fx_rate > 0.0;
}

// ─── CsvMarketDataProvider ────────────────────────────────────────────────────

CsvMarketDataProvider::CsvMarketDataProvider(std::string filepath,
                                             std::optional<LiveRates> live_override)
    : filepath_(std::move(filepath))
    , live_override_(live_override)
{}

std::optional<PriceSeries> CsvMarketDataProvider::fetch_history(std::size_t days) const {
    auto series = DataLoader::load_csv(filepath_);
    if (!series) {
        spdlog::warn("[MarketData] cannot open '{}'", filepath_);
        return std::nullopt;
    }
    return trim_history(std::move(*series), days);
}

std::optional<LiveRates> CsvMarketDataProvider::fetch_live() const {
    if (live_override_) {
        return live_override_;
    }
    const auto series = DataLoader::load_csv(filepath_);
    if (!series || series->empty()) {
        return std::nullopt;
    }
    const auto& last = series->back();
    return LiveRates{.asset_price_usd = last.asset_price_usd, .fx_rate = last.fx_rate};
}

// ─── StaticMarketDataProvider ─────────────────────────────────────────────────

StaticMarketDataProvider::StaticMarketDataProvider(std::optional<PriceSeries> history,
                                                   std::optional<LiveRates> live)
    : history_(std::move(history))
    , live_(live)
{}

std::optional<PriceSeries> StaticMarketDataProvider::fetch_history(std::size_t days) const {
    if (!history_) {
        return std::nullopt;
    }
    return trim_history(*history_, days);
}

std::optional<LiveRates> StaticMarketDataProvider::fetch_live() const {
    return live_;
}

}  // namespace buylimit::core
