/// @file src/core/engine.cpp
/// @brief Recommendation Engine — retrain and recommend_limit pipelines.

#include "buylimit/engine.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <utility>

namespace buylimit::core {

namespace {

/// Sentiment reported when no feature row is available.
constexpr double NEUTRAL_SENTIMENT = 50.0;

void record(std::vector<Degradation>& out, ErrorKind kind, std::string stage, double value) {
    Degradation d{.kind = kind, .stage = std::move(stage), .fallback_value = value};
    spdlog::warn("[Engine] {}", describe(d));
    out.push_back(std::move(d));
}

}  // namespace

// ─── Sentiment label ──────────────────────────────────────────────────────────

std::string_view sentiment_label(double sentiment) noexcept {
    if (sentiment < constants::SENTIMENT_EXTREME_FEAR_BELOW) {
        return "Extreme Fear - Good buying opportunity";
    }
    if (sentiment < constants::SENTIMENT_FEAR_BELOW) {
        return "Fear - Cautious buying opportunity";
    }
    if (sentiment < constants::SENTIMENT_NEUTRAL_BELOW) {
        return "Neutral - Normal market conditions";
    }
    if (sentiment < constants::SENTIMENT_GREED_BELOW) {
        return "Greed - Exercise caution";
    }
    return "Extreme Greed - High risk conditions";
}

// ─── Recommendation::to_string ────────────────────────────────────────────────

std::string Recommendation::to_string() const {
    std::string out = fmt::format(
        "=== Buy Limit Recommendation ===\n"
        "  Hard limit          : {:.6f}\n"
        "  Recommended percent : {:.2f}%\n"
        "  Risk profile        : {}\n"
        "  Market sentiment    : {} ({:.1f})\n"
        "  Asset price (USD)   : {:.2f}{}\n"
        "  FX rate             : {:.4f}\n"
        "  Allocation fraction : {:.4f}\n"
        "  Baseline MAE        : {:.4f}\n"
        "  Model MAE           : {:.4f}\n",
        limit_amount, recommended_percent, risk_profile_label,
        sentiment_label, sentiment,
        live_rates.asset_price_usd, using_fallback_rates ? " (fallback)" : "",
        live_rates.fx_rate, allocation_fraction, baseline_mae, model_mae);
    if (smart_limit) {
        out += fmt::format("  Smart limit         : {}\n", smart_limit->to_string());
    }
    for (const auto& d : degradations) {
        out += fmt::format("  Degraded            : {}\n", describe(d));
    }
    return out;
}

// ─── Engine ───────────────────────────────────────────────────────────────────

Engine::Engine(std::shared_ptr<const MarketDataProvider> provider,
               EngineConfig config,
               sizing::RiskProfileTable table)
    : provider_(std::move(provider))
    , config_(std::move(config))
    , features_(config_.feature_config)
    , targets_(config_.target_config)
    , forecaster_(config_.forecaster_config)
    , calculator_(table)
    , blender_(std::move(table))
{}

forecast::ModelHandle& Engine::model_handle() noexcept { return model_; }
const forecast::ModelHandle& Engine::model_handle() const noexcept { return model_; }
const EngineConfig& Engine::config() const noexcept { return config_; }

std::optional<std::vector<FeatureRow>>
Engine::load_features(std::vector<Degradation>& degradations) const {
    const auto history = provider_ ? provider_->fetch_history(config_.history_days)
                                   : std::nullopt;
    if (!history) {
        record(degradations, ErrorKind::UpstreamData, "market_data.history", 0.0);
        return std::nullopt;
    }
    auto rows = features_.compute(*history);
    if (!rows || rows->empty()) {
        record(degradations, ErrorKind::DataInsufficient, "features",
               static_cast<double>(history->size()));
        return std::nullopt;
    }
    return rows;
}

// ─── Engine::recommend_limit ──────────────────────────────────────────────────

std::optional<Recommendation>
Engine::recommend_limit(const LimitRequest& request) const {
    const double balance = request.spending_balance;
    if (!std::isfinite(balance) || balance <= 0.0) {
        spdlog::error("[Engine] rejected request: spending balance {} must be positive", balance);
        return std::nullopt;
    }
    if (!std::isfinite(request.existing_holdings) || request.existing_holdings < 0.0) {
        spdlog::error("[Engine] rejected request: holdings {} must be non-negative",
                      request.existing_holdings);
        return std::nullopt;
    }
    if (!calculator_.table().contains(request.risk_profile)) {
        spdlog::error("[Engine] rejected request: {} for profile '{}'",
                      buylimit::to_string(ErrorKind::Configuration),
                      sizing::to_string(request.risk_profile));
        return std::nullopt;
    }

    Recommendation rec{};
    rec.risk_profile_label = std::string(sizing::to_label(request.risk_profile));

    // ── Live quote ────────────────────────────────────────────────────────────
    const auto live = provider_ ? provider_->fetch_live() : std::nullopt;
    if (live && valid_rates(*live)) {
        rec.live_rates = *live;
        rec.using_fallback_rates = false;
    } else {
        rec.live_rates = LiveRates{.asset_price_usd = constants::FALLBACK_ASSET_PRICE_USD,
                                   .fx_rate         = constants::FALLBACK_FX_RATE};
        rec.using_fallback_rates = true;
        record(rec.degradations, ErrorKind::UpstreamData, "market_data.live",
               constants::FALLBACK_ASSET_PRICE_USD);
    }
    rec.holdings_value = request.existing_holdings
                       * rec.live_rates.asset_price_usd * rec.live_rates.fx_rate;

    // ── Model metadata ────────────────────────────────────────────────────────
    const auto model = model_.current();
    rec.baseline_mae = model ? model->report.baseline_mae : constants::ESTIMATED_BASELINE_MAE;
    rec.model_mae    = model ? model->report.model_mae    : constants::ESTIMATED_MODEL_MAE;

    // ── Features ──────────────────────────────────────────────────────────────
    const auto rows = load_features(rec.degradations);
    if (!rows) {
        const auto flat = blender_.fallback(balance, request.risk_profile);
        if (!flat) {
            return std::nullopt;
        }
        rec.limit_amount        = *flat;
        rec.flat_fallback       = true;
        rec.allocation_fraction = *flat / balance;
        rec.sentiment           = NEUTRAL_SENTIMENT;
        rec.sentiment_label     = std::string(sentiment_label(NEUTRAL_SENTIMENT));
        rec.recommended_percent = rec.limit_amount / balance * 100.0;
        return rec;
    }

    const FeatureRow& latest = rows->back();
    rec.sentiment       = latest.sentiment;
    rec.sentiment_label = std::string(sentiment_label(latest.sentiment));

    // ── Smart limit ───────────────────────────────────────────────────────────
    const sizing::MarketSnapshot snapshot{
        .volatility = latest.asset_volatility,
        .sentiment  = latest.sentiment,
        .trend      = latest.trend,
    };
    rec.smart_limit = calculator_.compute(snapshot, balance, rec.holdings_value,
                                          request.risk_profile);
    if (!rec.smart_limit) {
        spdlog::error("[Engine] smart limit rejected inputs for profile '{}'",
                      sizing::to_string(request.risk_profile));
        return std::nullopt;
    }

    // ── Forecast ──────────────────────────────────────────────────────────────
    const auto predicted = forecaster_.predict(model.get(), *rows);
    rec.allocation_fraction = predicted.allocation_fraction;
    if (predicted.fallback) {
        record(rec.degradations, *predicted.fallback, "forecaster", predicted.allocation_fraction);
    }

    // ── Blend ─────────────────────────────────────────────────────────────────
    const auto blended = blender_.blend(blend::BlendInput{
        .smart_limit         = rec.smart_limit->limit,
        .balance             = balance,
        .allocation_fraction = predicted.allocation_fraction,
        .is_first_purchase   = request.is_first_purchase,
        .profile             = request.risk_profile,
    });
    if (!blended) {
        return std::nullopt;
    }
    rec.limit_amount        = blended->limit;
    rec.flat_fallback       = false;
    rec.recommended_percent = rec.limit_amount / balance * 100.0;

    spdlog::info("[Engine] {} limit={:.2f} ({:.2f}%) smart={:.2f} forecast={:.2f}",
                 rec.risk_profile_label, rec.limit_amount, rec.recommended_percent,
                 rec.smart_limit->limit, blended->forecast_amount);
    return rec;
}

// ─── Engine::retrain ──────────────────────────────────────────────────────────

forecast::TrainReport Engine::retrain() {
    std::vector<Degradation> degradations;
    const auto rows = load_features(degradations);
    if (!rows) {
        spdlog::warn("[Engine] retrain skipped: no usable feature history");
        return forecast::TrainReport{};
    }

    const auto labels = targets_.build(*rows);
    if (!labels) {
        spdlog::warn("[Engine] retrain skipped: {} feature rows cannot be labeled", rows->size());
        return forecast::TrainReport{};
    }

    auto outcome = forecaster_.train(*labels);
    if (outcome.model) {
        model_.publish(std::move(outcome.model));
        spdlog::info("[Engine] published new model");
    } else {
        spdlog::warn("[Engine] training produced no model; keeping current model");
    }
    return outcome.report;
}

// ─── Model persistence ────────────────────────────────────────────────────────

bool Engine::load_model(const std::filesystem::path& path) {
    auto model = forecast::ModelArtifact::load(path, config_.forecaster_config);
    if (!model) {
        return false;
    }
    model_.publish(std::make_shared<forecast::AllocationModel>(std::move(*model)));
    spdlog::info("[Engine] loaded model from '{}'", path.string());
    return true;
}

bool Engine::save_model(const std::filesystem::path& path) const {
    const auto model = model_.current();
    if (!model) {
        spdlog::warn("[Engine] no model to save");
        return false;
    }
    return forecast::ModelArtifact::save(*model, path);
}

}  // namespace buylimit::core
