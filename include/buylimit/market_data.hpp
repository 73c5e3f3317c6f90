#pragma once

/// @file include/buylimit/market_data.hpp
/// @brief Market-data collaborator interface and its two implementations.
///
/// # Module: Market Data
///
/// ## Responsibility
/// Supply the engine with price history and the latest quote pair. The
/// engine depends only on `MarketDataProvider`; a file-backed and an
/// in-memory provider ship with the library. Network retrieval lives
/// outside this repository behind the same interface.
///
/// ## Contract
/// - `fetch_history(days)` returns the most recent `days` records (one
///   record per day), oldest first, or `nullopt` if the source is
///   unreachable
/// - `fetch_live()` returns the latest quote, or `nullopt` if unavailable;
///   the engine then substitutes FALLBACK_ASSET_PRICE_USD / FALLBACK_FX_RATE
/// - Both calls are const and must be safe to call concurrently

#include "buylimit/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace buylimit::core {

class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    [[nodiscard]] virtual std::optional<PriceSeries> fetch_history(std::size_t days) const = 0;
    [[nodiscard]] virtual std::optional<LiveRates> fetch_live() const = 0;
};

/// Keep the last `days` records of a series.
[[nodiscard]] PriceSeries trim_history(PriceSeries series, std::size_t days);

/// True if both rates are finite and strictly positive.
[[nodiscard]] bool valid_rates(const LiveRates& rates) noexcept;

// ─── CsvMarketDataProvider ────────────────────────────────────────────────────

/// Reads history from a CSV file on every call (see DataLoader for the
/// format). The live quote is the configured override if present,
/// otherwise the last row of the file.
class CsvMarketDataProvider final : public MarketDataProvider {
public:
    explicit CsvMarketDataProvider(std::string filepath,
                                   std::optional<LiveRates> live_override = std::nullopt);

    [[nodiscard]] std::optional<PriceSeries> fetch_history(std::size_t days) const override;
    [[nodiscard]] std::optional<LiveRates> fetch_live() const override;

private:
    std::string              filepath_;
    std::optional<LiveRates> live_override_;
};

// ─── StaticMarketDataProvider ─────────────────────────────────────────────────

/// Serves fixed, in-memory data. A `nullopt` member simulates an
/// unreachable upstream for that call.
class StaticMarketDataProvider final : public MarketDataProvider {
public:
    StaticMarketDataProvider(std::optional<PriceSeries> history,
                             std::optional<LiveRates> live);

    [[nodiscard]] std::optional<PriceSeries> fetch_history(std::size_t days) const override;
    [[nodiscard]] std::optional<LiveRates> fetch_live() const override;

private:
    std::optional<PriceSeries> history_;
    std::optional<LiveRates>   live_;
};

}  // namespace buylimit::core
