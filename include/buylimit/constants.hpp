#pragma once

#include <cstddef>

/// @file include/buylimit/constants.hpp
/// @brief Numeric constants shared by the feature, label, forecast and
///        sizing stages.

namespace buylimit::constants {

// ─── Feature Windows ──────────────────────────────────────────────────────────

/// Lookback of the rolling return standard deviation.
static constexpr std::size_t VOLATILITY_WINDOW = 30;

/// Lookback of the trend moving average.
static constexpr std::size_t TREND_MA_WINDOW = 20;

/// Lookback of the gain/loss averages behind the sentiment oscillator.
static constexpr std::size_t SENTIMENT_WINDOW = 14;

/// Minimum PriceSeries length: a full volatility window plus one return.
static constexpr std::size_t MIN_PRICE_ROWS = VOLATILITY_WINDOW + 1;

/// Annualisation multiplier applied to rolling volatility (√24).
/// Must match the periodicity of the supplied series.
static constexpr double VOLATILITY_ANNUALISATION = 4.898979485566356;

/// Sentiment reported when the average loss over the window is zero.
static constexpr double SENTIMENT_NO_LOSS = 100.0;

// ─── Target Construction ──────────────────────────────────────────────────────

/// Default forward horizon for the training label.
static constexpr std::size_t DEFAULT_LOOKFORWARD = 7;

/// Added to forward volatility to keep the score finite on flat stretches.
static constexpr double TARGET_VOL_EPSILON = 0.01;

/// Ceiling of the training label (25% allocation).
static constexpr double MAX_TARGET_ALLOCATION = 0.25;

static constexpr double TARGET_LOWER_QUANTILE = 0.10;
static constexpr double TARGET_UPPER_QUANTILE = 0.90;

// ─── Forecaster ───────────────────────────────────────────────────────────────

/// Sequence length fed to the forecaster.
static constexpr std::size_t DEFAULT_WINDOW = 14;

/// Allocation fraction used whenever the forecaster cannot run.
static constexpr double FALLBACK_ALLOCATION = 0.15;

/// Below this many windows no sequence model is trained.
static constexpr std::size_t MIN_TRAINING_WINDOWS = 20;

/// Share of windows (chronologically last) held out for validation.
static constexpr double VALIDATION_FRACTION = 0.20;

/// Constant allocation of the naive baseline predictor.
static constexpr double BASELINE_ALLOCATION = 0.10;

/// Reported MAE values when the dataset is too small to hold out.
static constexpr double ESTIMATED_BASELINE_MAE = 0.08;
static constexpr double ESTIMATED_MODEL_MAE    = 0.05;

// ─── Smart Limit ──────────────────────────────────────────────────────────────

/// Sentiment below this applies the profile's fear factor.
static constexpr double SIZING_FEAR_BELOW = 20.0;

/// Sentiment above this applies the profile's greed factor.
static constexpr double SIZING_GREED_ABOVE = 80.0;

/// |trend| beyond this applies the uptrend / drawdown factor.
static constexpr double SIZING_TREND_THRESHOLD = 0.15;

/// Holdings-to-balance ratio is capped here before the reduction applies.
static constexpr double MAX_HOLDINGS_RATIO = 2.0;

// ─── Market Data ──────────────────────────────────────────────────────────────

/// Default history requested from the market-data collaborator (days).
static constexpr std::size_t DEFAULT_HISTORY_DAYS = 365;

/// Live-rate constants used when the feed is unreachable.
static constexpr double FALLBACK_ASSET_PRICE_USD = 100000.0;
static constexpr double FALLBACK_FX_RATE         = 83.0;

// ─── Sentiment Buckets ────────────────────────────────────────────────────────

static constexpr double SENTIMENT_EXTREME_FEAR_BELOW = 25.0;
static constexpr double SENTIMENT_FEAR_BELOW         = 45.0;
static constexpr double SENTIMENT_NEUTRAL_BELOW      = 55.0;
static constexpr double SENTIMENT_GREED_BELOW        = 75.0;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

}  // namespace buylimit::constants
