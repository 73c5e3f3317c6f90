/**
 * @file  bench/bench_forecaster.cpp
 * @brief Google Benchmark suite for the recommendation hot paths.
 *
 * Benchmarks
 * ----------
 *   BM_FeatureEngine_Compute     — rolling indicators over N records
 *   BM_Regressor_Predict         — one forward pass, default network
 *   BM_Regressor_Gradient        — forward + BPTT for one window
 *   BM_Engine_RecommendNoModel   — full recommend_limit on 365 days
 *
 * Build (CMake):
 *   cmake -DBUYLIMIT_BENCH=ON ..
 *   cmake --build build --target bench_forecaster
 *   ./build/bench_forecaster --benchmark_format=json
 *
 * Throughput units: items/second (records or windows processed).
 */

#include "benchmark/benchmark.h"

#include "buylimit/engine.hpp"
#include "buylimit/features.hpp"
#include "buylimit/regressor.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstddef>
#include <memory>
#include <numbers>

using namespace buylimit;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Daily series with drift plus an oscillation.
static PriceSeries make_series(std::size_t n) {
    PriceSeries s;
    s.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i);
        s.push_back(PriceRecord{
            .timestamp       = 1.7e9 + t * 86400.0,
            .asset_price_usd = 40000.0 * (1.0 + 0.0005 * t) * (1.0 + 0.03 * std::sin(2.0 * std::numbers::pi * t / 9.0)),
            .fx_rate         = 83.0 + 0.5 * std::sin(2.0 * std::numbers::pi * t / 13.0),
        });
    }
    return s;
}

static SequenceMatrix make_window(Eigen::Index steps) {
    SequenceMatrix m(steps, FEATURE_COUNT);
    for (Eigen::Index r = 0; r < steps; ++r) {
        for (Eigen::Index c = 0; c < FEATURE_COUNT; ++c) {
            m(r, c) = 0.5 + 0.4 * std::sin(static_cast<double>(r * 7 + c));
        }
    }
    return m;
}

// ── Features ───────────────────────────────────────────────────────────────────

static void BM_FeatureEngine_Compute(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto series = make_series(n);
    const features::FeatureEngine engine;
    for (auto _ : state) {
        auto rows = engine.compute(series);
        benchmark::DoNotOptimize(rows);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_FeatureEngine_Compute)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMicrosecond);

// ── Regressor ──────────────────────────────────────────────────────────────────

static void BM_Regressor_Predict(benchmark::State& state) {
    const forecast::SequenceRegressor net(forecast::RegressorShape{}, 42);
    const auto x = make_window(static_cast<Eigen::Index>(state.range(0)));
    for (auto _ : state) {
        auto y = net.predict(x);
        benchmark::DoNotOptimize(y);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Regressor_Predict)->Arg(14)->Arg(30)->Unit(benchmark::kMicrosecond);

static void BM_Regressor_Gradient(benchmark::State& state) {
    const forecast::SequenceRegressor net(forecast::RegressorShape{}, 42);
    const auto x = make_window(14);
    auto grads = net.zero_gradients();
    for (auto _ : state) {
        const double sq = net.accumulate_gradient(x, 0.5, 1.0, grads);
        benchmark::DoNotOptimize(sq);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Regressor_Gradient)->Unit(benchmark::kMicrosecond);

// ── Engine ─────────────────────────────────────────────────────────────────────

static void BM_Engine_RecommendNoModel(benchmark::State& state) {
    // The no-model path logs a degradation per call.
    spdlog::set_level(spdlog::level::off);
    auto provider = std::make_shared<core::StaticMarketDataProvider>(
        make_series(365), LiveRates{.asset_price_usd = 60000.0, .fx_rate = 83.0});
    const core::Engine engine(provider);
    const core::LimitRequest req{.spending_balance = 10000.0, .existing_holdings = 0.01};
    for (auto _ : state) {
        auto rec = engine.recommend_limit(req);
        benchmark::DoNotOptimize(rec);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Engine_RecommendNoModel)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
