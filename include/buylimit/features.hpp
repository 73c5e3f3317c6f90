#pragma once

/// @file include/buylimit/features.hpp
/// @brief Feature Engine — risk, trend and sentiment indicators from prices.
///
/// # Module: Feature Engine
///
/// ## Responsibility
/// Turn a raw PriceSeries into FeatureRow values:
///   - asset / fx simple returns
///   - rolling volatility of each return (30 periods, × √24)
///   - trend = (price − MA20) / MA20
///   - sentiment = 14-period RSI: 100 − 100 / (1 + avg_gain / avg_loss)
///
/// ## Edge Cases
/// - avg_loss == 0 → sentiment = 100 (no NaN leaks out)
/// - A non-finite or non-positive price or rate resets every rolling window;
///   rows resume only once all windows are full again
/// - Series shorter than MIN_PRICE_ROWS → `compute` returns nullopt
///
/// ## Guarantees
/// - A FeatureRow is emitted only when every rolling window is full
/// - All emitted values are finite
/// - `compute` is a pure function of its input (idempotent)
/// - FeatureStream is single-pass: once drained it stays drained

#include "buylimit/types.hpp"
#include "buylimit/constants.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <span>
#include <vector>

namespace buylimit::features {

/// Rolling-window lengths and the volatility scale.
struct FeatureConfig {
    std::size_t volatility_window = constants::VOLATILITY_WINDOW;
    std::size_t trend_window      = constants::TREND_MA_WINDOW;
    std::size_t sentiment_window  = constants::SENTIMENT_WINDOW;
    double      annualisation     = constants::VOLATILITY_ANNUALISATION;

    /// Minimum series length before any row can be emitted.
    [[nodiscard]] std::size_t min_rows() const noexcept;
};

// ─── FeatureStream ────────────────────────────────────────────────────────────

/// Lazy, single-pass producer of FeatureRow over a borrowed PriceSeries.
///
/// The stream holds a view of the series; the caller keeps it alive for the
/// stream's lifetime. It cannot be rewound: build a new stream to recompute.
class FeatureStream {
public:
    FeatureStream(std::span<const PriceRecord> series, FeatureConfig config);

    /// Advance to the next fully-populated row.
    ///
    /// # Returns
    /// The next FeatureRow, or `nullopt` once the series is exhausted.
    [[nodiscard]] std::optional<FeatureRow> next();

    /// True once every record of the series has been consumed.
    [[nodiscard]] bool exhausted() const noexcept;

private:
    /// Clear every rolling buffer (a dependency went missing).
    void reset_windows() noexcept;

    std::span<const PriceRecord> series_;
    FeatureConfig                config_;
    std::size_t                  cursor_ = 0;
    std::optional<PriceRecord>   prev_;
    std::size_t                  segment_ = 0;
    bool                         emitted_ = false;
    bool                         broken_  = false;  ///< Sequence broken since the last row

    std::deque<double> asset_returns_;
    std::deque<double> fx_returns_;
    std::deque<double> prices_;
    std::deque<double> gains_;
    std::deque<double> losses_;
};

// ─── FeatureEngine ────────────────────────────────────────────────────────────

/// Stateless front-end over FeatureStream.
class FeatureEngine {
public:
    explicit FeatureEngine(FeatureConfig config = FeatureConfig{}) noexcept;

    /// Compute every FeatureRow for a series.
    ///
    /// # Returns
    /// - `nullopt` if `series.size() < config.min_rows()`
    /// - otherwise the drained stream (possibly empty if bad records keep
    ///   resetting the windows)
    [[nodiscard]] std::optional<std::vector<FeatureRow>>
    compute(std::span<const PriceRecord> series) const;

    /// Open a fresh lazy stream over `series`.
    [[nodiscard]] FeatureStream stream(std::span<const PriceRecord> series) const;

    [[nodiscard]] const FeatureConfig& config() const noexcept;

    /// Sentiment oscillator from average gain and loss magnitudes.
    /// Returns SENTIMENT_NO_LOSS when `avg_loss` is zero.
    [[nodiscard]] static double sentiment(double avg_gain, double avg_loss) noexcept;

private:
    FeatureConfig config_;
};

}  // namespace buylimit::features
