#pragma once

/// @file tests/support/synthetic_series.hpp
/// @brief Deterministic price series shared by the test suites.

#include "buylimit/types.hpp"

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <numbers>
#include <sstream>
#include <string>

namespace buylimit::testing {

/// Daily series with drift plus two incommensurate oscillations, so returns
/// alternate in sign and every rolling window sees both gains and losses.
inline PriceSeries make_wave_series(std::size_t n,
                                    double start     = 40000.0,
                                    double drift     = 0.0005,
                                    double amplitude = 0.03) {
    PriceSeries series;
    series.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double t     = static_cast<double>(i);
        const double phase = 2.0 * std::numbers::pi * t;
        const double price = start * std::pow(1.0 + drift, t)
                           * (1.0 + amplitude * std::sin(phase / 9.0)
                                  + 0.5 * amplitude * std::sin(phase / 23.0));
        const double fx    = 83.0 + 0.5 * std::sin(phase / 13.0) + 0.1 * std::cos(phase / 5.0);
        series.push_back(PriceRecord{
            .timestamp       = 1.7e9 + t * 86400.0,
            .asset_price_usd = price,
            .fx_rate         = fx,
        });
    }
    return series;
}

/// Constant price and rate.
inline PriceSeries make_flat_series(std::size_t n, double price = 50000.0, double fx = 83.0) {
    PriceSeries series;
    series.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        series.push_back(PriceRecord{
            .timestamp       = 1.7e9 + static_cast<double>(i) * 86400.0,
            .asset_price_usd = price,
            .fx_rate         = fx,
        });
    }
    return series;
}

/// CSV text in the DataLoader format, at full precision.
inline std::string series_to_csv(const PriceSeries& series) {
    std::ostringstream ss;
    ss << std::setprecision(17);
    ss << "timestamp,asset_price_usd,fx_rate\n";
    for (const auto& r : series) {
        ss << r.timestamp << "," << r.asset_price_usd << "," << r.fx_rate << "\n";
    }
    return ss.str();
}

}  // namespace buylimit::testing
