/// @file src/features/feature_engine.cpp
/// @brief FeatureStream / FeatureEngine — rolling indicators from prices.
///
/// Each FeatureStream::next() call:
///   1. Consumes records until every rolling window is full
///   2. Resets all windows on a non-finite or non-positive record
///   3. Emits the row for the record that completed the windows, opening a
///      new segment if anything was reset or dropped since the last row

#include "buylimit/features.hpp"
#include "rolling_stats.hpp"

#include <algorithm>
#include <cmath>

namespace buylimit::features {

namespace {

[[nodiscard]] bool valid_record(const PriceRecord& r) noexcept {
    return std::isfinite(r.timestamp) &&
           std::isfinite(r.asset_price_usd) && r.asset_price_usd > 0.0 &&
           std::isfinite(r.fx_rate) && r.fx_rate > 0.0;
}

}  // namespace

// ─── FeatureConfig ────────────────────────────────────────────────────────────

std::size_t FeatureConfig::min_rows() const noexcept {
    // Returns need one extra leading record; the MA window does not.
    return std::max({volatility_window + 1, sentiment_window + 1, trend_window});
}

// ─── FeatureStream ────────────────────────────────────────────────────────────

FeatureStream::FeatureStream(std::span<const PriceRecord> series, FeatureConfig config)
    : series_(series)
    , config_(config)
{}

void FeatureStream::reset_windows() noexcept {
    asset_returns_.clear();
    fx_returns_.clear();
    prices_.clear();
    gains_.clear();
    losses_.clear();
    prev_.reset();
    broken_ = true;
}

bool FeatureStream::exhausted() const noexcept {
    return cursor_ >= series_.size();
}

std::optional<FeatureRow> FeatureStream::next() {
    using detail::push_bounded;

    while (cursor_ < series_.size()) {
        const PriceRecord& rec = series_[cursor_++];

        if (!valid_record(rec)) {
            reset_windows();
            continue;
        }

        push_bounded(prices_, rec.asset_price_usd, config_.trend_window);

        if (!prev_) {
            prev_ = rec;
            continue;
        }

        const double asset_ret = rec.asset_price_usd / prev_->asset_price_usd - 1.0;
        const double fx_ret    = rec.fx_rate / prev_->fx_rate - 1.0;
        const double delta     = rec.asset_price_usd - prev_->asset_price_usd;
        prev_ = rec;

        push_bounded(asset_returns_, asset_ret, config_.volatility_window);
        push_bounded(fx_returns_,    fx_ret,    config_.volatility_window);
        push_bounded(gains_,  delta > 0.0 ?  delta : 0.0, config_.sentiment_window);
        push_bounded(losses_, delta < 0.0 ? -delta : 0.0, config_.sentiment_window);

        const bool ready = asset_returns_.size() == config_.volatility_window &&
                           prices_.size()        == config_.trend_window &&
                           gains_.size()         == config_.sentiment_window;
        if (!ready) {
            continue;
        }

        const double ma = detail::mean(prices_);
        FeatureRow row{
            .timestamp        = rec.timestamp,
            .asset_price      = rec.asset_price_usd,
            .fx_rate          = rec.fx_rate,
            .asset_return     = asset_ret,
            .fx_return        = fx_ret,
            .asset_volatility = detail::sample_stddev(asset_returns_) * config_.annualisation,
            .fx_volatility    = detail::sample_stddev(fx_returns_) * config_.annualisation,
            .trend            = (rec.asset_price_usd - ma) / ma,
            .sentiment        = FeatureEngine::sentiment(detail::mean(gains_),
                                                         detail::mean(losses_)),
        };

        if (!std::isfinite(row.asset_volatility) || !std::isfinite(row.fx_volatility) ||
            !std::isfinite(row.trend) || !std::isfinite(row.asset_return) ||
            !std::isfinite(row.fx_return)) {
            // Overflowing ratios on extreme inputs: drop the row, keep windows.
            broken_ = true;
            continue;
        }

        if (broken_ && emitted_) {
            ++segment_;
        }
        broken_     = false;
        emitted_    = true;
        row.segment = segment_;
        return row;
    }
    return std::nullopt;
}

// ─── FeatureEngine ────────────────────────────────────────────────────────────

FeatureEngine::FeatureEngine(FeatureConfig config) noexcept
    : config_(config)
{}

const FeatureConfig& FeatureEngine::config() const noexcept {
    return config_;
}

FeatureStream FeatureEngine::stream(std::span<const PriceRecord> series) const {
    return FeatureStream(series, config_);
}

std::optional<std::vector<FeatureRow>>
FeatureEngine::compute(std::span<const PriceRecord> series) const {
    if (series.size() < config_.min_rows()) {
        return std::nullopt;
    }

    std::vector<FeatureRow> rows;
    rows.reserve(series.size() - config_.min_rows() + 1);

    FeatureStream s = stream(series);
    while (auto row = s.next()) {
        rows.push_back(*row);
    }
    return rows;
}

double FeatureEngine::sentiment(double avg_gain, double avg_loss) noexcept {
    if (!(avg_loss > 0.0)) {
        return constants::SENTIMENT_NO_LOSS;
    }
    const double rs = avg_gain / avg_loss;
    if (!std::isfinite(rs)) {
        return constants::SENTIMENT_NO_LOSS;
    }
    return 100.0 - 100.0 / (1.0 + rs);
}

}  // namespace buylimit::features
