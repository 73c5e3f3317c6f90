#pragma once

/// @file include/buylimit/types.hpp
/// @brief Shared value types for the buy-limit recommendation engine.
///
/// All modules include this file. It defines the market-data records, the
/// derived feature and label rows, and the Eigen aliases used by the
/// sequence forecaster.

#include <Eigen/Dense>

#include <array>
#include <cstddef>
#include <vector>

namespace buylimit {

/// Number of features fed to the sequence forecaster per time step.
static constexpr int FEATURE_COUNT = 4;

// ─── Market Data ──────────────────────────────────────────────────────────────

/// One observation from the market-data collaborator.
struct PriceRecord {
    double timestamp;        ///< Unix epoch seconds (or bar index)
    double asset_price_usd;  ///< Crypto asset price in USD
    double fx_rate;          ///< USD → local currency exchange rate
};

/// Ordered, strictly increasing series of PriceRecord. Immutable for a run.
using PriceSeries = std::vector<PriceRecord>;

/// Latest quote pair used to value existing holdings.
struct LiveRates {
    double asset_price_usd;
    double fx_rate;
};

// ─── Derived Rows ─────────────────────────────────────────────────────────────

/// Risk / trend / sentiment indicators for one timestamp.
///
/// Only emitted when every rolling window feeding it is fully populated.
/// Rows that share a `segment` come from consecutive records; a new segment
/// starts wherever a bad record or a dropped row breaks the sequence.
struct FeatureRow {
    double timestamp;
    double asset_price;       ///< Raw asset price at this timestamp
    double fx_rate;           ///< Raw fx rate at this timestamp
    double asset_return;      ///< Simple period-over-period return
    double fx_return;
    double asset_volatility;  ///< Rolling std of asset_return × √24
    double fx_volatility;
    double trend;             ///< (price − MA20) / MA20
    double sentiment;         ///< RSI-style oscillator in [0, 100]
    std::size_t segment = 0;  ///< Contiguous-run index within the series
};

/// A FeatureRow with its training label attached.
struct LabeledRow {
    FeatureRow features;
    double     target_allocation;  ///< Ideal allocation in [0, max_allocation]
};

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Forecaster input vector: [asset_volatility, sentiment, trend, fx_volatility].
using FeatureVector = Eigen::Matrix<double, FEATURE_COUNT, 1>;

/// A W × FEATURE_COUNT sequence (rows are time steps, oldest first).
using SequenceMatrix = Eigen::MatrixXd;

/// Project a FeatureRow onto the forecaster's feature order.
[[nodiscard]] inline FeatureVector to_feature_vector(const FeatureRow& row) noexcept {
    FeatureVector v;
    v << row.asset_volatility, row.sentiment, row.trend, row.fx_volatility;
    return v;
}

}  // namespace buylimit
