#pragma once

/// @file include/buylimit/engine.hpp
/// @brief Recommendation Engine — public API.
///
/// # Module: Recommendation Engine
///
/// ## Responsibility
/// Orchestrate both lifecycles of the recommender:
///
///   retrain():          history → FeatureEngine → TargetConstructor
///                       → AllocationForecaster::train → ModelHandle::publish
///
///   recommend_limit():  history → FeatureEngine ─┬─► SmartLimitCalculator ─┐
///                                                └─► AllocationForecaster ─┴─► AllocationBlender
///
/// The two lifecycles share state only through the ModelHandle.
///
/// ## Usage
/// ```cpp
/// auto provider = std::make_shared<CsvMarketDataProvider>("history.csv");
/// Engine engine(provider);
/// engine.retrain();
/// auto rec = engine.recommend_limit({.spending_balance = 10000.0,
///                                    .existing_holdings = 0.0,
///                                    .is_first_purchase = false,
///                                    .risk_profile = RiskProfile::Moderate});
/// if (rec) fmt::print("{}\n", rec->to_string());
/// ```
///
/// ## Degradation Policy
/// | failure                         | recovery                               |
/// |---------------------------------|----------------------------------------|
/// | live quote unavailable          | constant rates, `using_fallback_rates` |
/// | history unavailable / too short | balance × flat_fallback                |
/// | no model / bad model output     | allocation fraction 0.15               |
/// | profile missing from table      | request rejected (`nullopt`)           |
///
/// Every recovery is appended to `Recommendation::degradations` and logged.
///
/// ## Guarantees
/// - `recommend_limit` is const and safe to call concurrently with itself
///   and with `retrain` / `load_model`
/// - Stage failures inside `recommend_limit` degrade; they are never thrown

#include "buylimit/blend.hpp"
#include "buylimit/constants.hpp"
#include "buylimit/errors.hpp"
#include "buylimit/features.hpp"
#include "buylimit/forecast.hpp"
#include "buylimit/market_data.hpp"
#include "buylimit/risk_profile.hpp"
#include "buylimit/sizing.hpp"
#include "buylimit/target.hpp"
#include "buylimit/types.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace buylimit::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    /// Records requested from the market-data provider.
    std::size_t history_days = constants::DEFAULT_HISTORY_DAYS;

    features::FeatureConfig    feature_config{};
    target::TargetConfig       target_config{};
    forecast::ForecasterConfig forecaster_config{};
};

// ─── Request / Response ───────────────────────────────────────────────────────

struct LimitRequest {
    double              spending_balance;   ///< Token balance, local currency, > 0
    double              existing_holdings;  ///< Asset units already held, ≥ 0
    bool                is_first_purchase = false;
    sizing::RiskProfile risk_profile      = sizing::RiskProfile::Moderate;
};

struct Recommendation {
    double      limit_amount;         ///< Hard limit, local currency
    double      recommended_percent;  ///< limit / balance × 100
    std::string risk_profile_label;   ///< "Moderate"
    std::string sentiment_label;      ///< Guidance text for the latest sentiment
    double      sentiment;
    double      baseline_mae;
    double      model_mae;

    LiveRates   live_rates;
    bool        using_fallback_rates;
    double      holdings_value;        ///< holdings × price × fx
    double      allocation_fraction;   ///< Forecaster output (or fallback)
    bool        flat_fallback;         ///< Limit came from the last-resort path

    std::optional<sizing::LimitBreakdown> smart_limit;
    std::vector<Degradation>              degradations;

    [[nodiscard]] std::string to_string() const;
};

/// Five-bucket guidance text for a sentiment reading.
[[nodiscard]] std::string_view sentiment_label(double sentiment) noexcept;

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(std::shared_ptr<const MarketDataProvider> provider,
                    EngineConfig config = EngineConfig{},
                    sizing::RiskProfileTable table = sizing::RiskProfileTable::canonical());

    /// Recommend a hard limit for one purchase.
    ///
    /// # Returns
    /// `nullopt` only for a rejected request: non-positive or non-finite
    /// balance, negative or non-finite holdings, or a risk profile with no
    /// table entry. Every other failure degrades (see Degradation Policy).
    [[nodiscard]] std::optional<Recommendation>
    recommend_limit(const LimitRequest& request) const;

    /// Fetch history, build labels, train, and publish the model if one was
    /// produced. The previously published model stays in place otherwise.
    forecast::TrainReport retrain();

    /// Load an artifact and publish it.
    ///
    /// # Returns
    /// `false` if the artifact is missing, corrupt, or incompatible with
    /// the configured window and network shape.
    bool load_model(const std::filesystem::path& path);

    /// Persist the current model. `false` if none is loaded or the write fails.
    [[nodiscard]] bool save_model(const std::filesystem::path& path) const;

    [[nodiscard]] forecast::ModelHandle& model_handle() noexcept;
    [[nodiscard]] const forecast::ModelHandle& model_handle() const noexcept;

    [[nodiscard]] const EngineConfig& config() const noexcept;

private:
    /// Fetch history and derive features; records any degradation.
    [[nodiscard]] std::optional<std::vector<FeatureRow>>
    load_features(std::vector<Degradation>& degradations) const;

    std::shared_ptr<const MarketDataProvider> provider_;
    EngineConfig                              config_;
    features::FeatureEngine                   features_;
    target::TargetConstructor                 targets_;
    forecast::AllocationForecaster            forecaster_;
    sizing::SmartLimitCalculator              calculator_;
    blend::AllocationBlender                  blender_;
    forecast::ModelHandle                     model_;
};

}  // namespace buylimit::core
