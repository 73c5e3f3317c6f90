/// @file src/forecast/allocation_forecaster.cpp
/// @brief AllocationForecaster — training loop, held-out evaluation and
///        fallback-guarded inference.

#include "buylimit/forecast.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <numeric>
#include <random>
#include <utility>
#include <vector>

namespace buylimit::forecast {

namespace {

/// Mean squared error of the regressor on scaled windows.
/// Returns +inf if any prediction is non-finite.
double validation_loss(const SequenceRegressor& regressor,
                       std::span<const sequence::Window> windows) {
    if (windows.empty()) {
        return std::numeric_limits<double>::infinity();
    }
    double sum = 0.0;
    for (const auto& w : windows) {
        const auto y = regressor.predict(w.sequence);
        if (!y) {
            return std::numeric_limits<double>::infinity();
        }
        const double err = *y - w.target.value_or(0.0);
        sum += err * err;
    }
    return sum / static_cast<double>(windows.size());
}

}  // namespace

// ─── TrainReport ──────────────────────────────────────────────────────────────

std::string TrainReport::to_string() const {
    if (!model_trained) {
        return fmt::format(
            "TrainReport: no model ({} windows)  baseline_mae={:.4f}  model_mae={:.4f} (estimated)",
            windows, baseline_mae, model_mae);
    }
    return fmt::format(
        "TrainReport: windows={} (train={}, validation={})  epochs={} best_epoch={}\n"
        "  best_validation_mse={:.6f}  baseline_mae={:.4f}  model_mae={:.4f}",
        windows, train_windows, validation_windows, epochs_run, best_epoch,
        best_validation_loss, baseline_mae, model_mae);
}

// ─── AllocationForecaster ─────────────────────────────────────────────────────

AllocationForecaster::AllocationForecaster(ForecasterConfig config) noexcept
    : config_(std::move(config))
{}

const ForecasterConfig& AllocationForecaster::config() const noexcept {
    return config_;
}

TrainingOutcome AllocationForecaster::train(const target::LabelSet& labels) const {
    TrainReport report;

    const std::size_t n = labels.rows.size();
    std::vector<FeatureRow> rows;
    rows.reserve(n);
    Eigen::MatrixXd y(static_cast<Eigen::Index>(n), 1);
    for (std::size_t i = 0; i < n; ++i) {
        rows.push_back(labels.rows[i].features);
        y(static_cast<Eigen::Index>(i), 0) = labels.rows[i].target_allocation;
    }

    const auto feature_scaler = sequence::MinMaxScaler::fit(sequence::feature_matrix(rows));
    const auto target_scaler  = sequence::MinMaxScaler::fit(y);
    if (!feature_scaler || !target_scaler) {
        spdlog::warn("[Forecaster] cannot fit scalers on {} labeled rows; no model trained", n);
        return TrainingOutcome{.model = nullptr, .report = report};
    }

    const Eigen::MatrixXd scaled_x = feature_scaler->transform(sequence::feature_matrix(rows));
    const Eigen::VectorXd scaled_y = target_scaler->transform(y).col(0);

    const sequence::SequenceWindower windower(config_.window);
    const auto segments = sequence::segment_ids(rows);
    const auto windows  = windower.training_windows(scaled_x, scaled_y, segments);
    report.windows = windows.size();

    if (windows.size() < config_.min_windows) {
        spdlog::warn("[Forecaster] {} windows < {} required; using estimated MAE",
                     windows.size(), config_.min_windows);
        return TrainingOutcome{.model = nullptr, .report = report};
    }

    // Chronological split: the most recent windows are held out.
    const auto split = static_cast<std::size_t>(std::floor(
        static_cast<double>(windows.size()) * (1.0 - config_.validation_fraction)));
    const std::span<const sequence::Window> all(windows);
    const auto train_set = all.first(split);
    const auto valid_set = all.subspan(split);
    report.train_windows      = train_set.size();
    report.validation_windows = valid_set.size();

    if (train_set.empty() || valid_set.empty()) {
        spdlog::warn("[Forecaster] degenerate split ({} / {}); no model trained",
                     train_set.size(), valid_set.size());
        return TrainingOutcome{.model = nullptr, .report = report};
    }

    SequenceRegressor regressor(config_.shape, config_.seed);
    AdamOptimizer adam(regressor.weights(), AdamConfig{.learning_rate = config_.learning_rate});
    std::mt19937 rng(config_.seed);

    std::vector<std::size_t> order(train_set.size());
    std::iota(order.begin(), order.end(), std::size_t{0});

    const std::size_t batch = std::max<std::size_t>(config_.batch_size, 1);
    double    best_loss    = std::numeric_limits<double>::infinity();
    WeightSet best_weights = regressor.weights();
    std::size_t since_best = 0;

    for (std::size_t epoch = 1; epoch <= config_.max_epochs; ++epoch) {
        std::shuffle(order.begin(), order.end(), rng);

        double epoch_sq = 0.0;
        for (std::size_t start = 0; start < order.size(); start += batch) {
            const std::size_t end   = std::min(start + batch, order.size());
            const double      scale = 1.0 / static_cast<double>(end - start);

            WeightSet grads = regressor.zero_gradients();
            for (std::size_t k = start; k < end; ++k) {
                const auto& w = train_set[order[k]];
                epoch_sq += regressor.accumulate_gradient(
                    w.sequence, w.target.value_or(0.0), scale, grads);
            }
            adam.step(regressor.weights(), grads);
        }

        const double val_loss = validation_loss(regressor, valid_set);
        report.epochs_run = epoch;
        spdlog::debug("[Forecaster] epoch {:3d}  train_mse={:.6f}  val_mse={:.6f}",
                      epoch, epoch_sq / static_cast<double>(order.size()), val_loss);

        if (val_loss < best_loss) {
            best_loss         = val_loss;
            best_weights      = regressor.weights();
            report.best_epoch = epoch;
            since_best        = 0;
        } else if (++since_best >= config_.patience) {
            spdlog::debug("[Forecaster] early stop at epoch {} (best {})", epoch, report.best_epoch);
            break;
        }
    }

    if (!std::isfinite(best_loss)) {
        spdlog::warn("[Forecaster] validation loss never finite; no model trained");
        return TrainingOutcome{.model = nullptr, .report = report};
    }
    regressor.weights() = best_weights;
    report.best_validation_loss = best_loss;

    // Held-out MAE in original label units.
    double model_abs    = 0.0;
    double baseline_abs = 0.0;
    for (const auto& w : valid_set) {
        const double actual = labels.rows[w.end_index].target_allocation;
        const double scaled = regressor.predict(w.sequence).value_or(0.0);
        model_abs    += std::abs(target_scaler->inverse_transform(scaled) - actual);
        baseline_abs += std::abs(config_.baseline_allocation - actual);
    }
    const auto held_out = static_cast<double>(valid_set.size());
    report.model_mae     = model_abs / held_out;
    report.baseline_mae  = baseline_abs / held_out;
    report.model_trained = true;

    spdlog::info("[Forecaster] trained on {} windows in {} epochs: model_mae={:.4f} baseline_mae={:.4f}",
                 report.windows, report.epochs_run, report.model_mae, report.baseline_mae);

    auto model = std::make_shared<AllocationModel>(AllocationModel{
        .feature_scaler    = *feature_scaler,
        .target_scaler     = *target_scaler,
        .regressor         = std::move(regressor),
        .window            = config_.window,
        .label_lower_bound = labels.lower_bound,
        .label_upper_bound = labels.upper_bound,
        .report            = report,
    });
    return TrainingOutcome{.model = std::move(model), .report = report};
}

// ─── predict ──────────────────────────────────────────────────────────────────

Forecast AllocationForecaster::fall_back(ErrorKind kind, std::string_view reason) const noexcept {
    spdlog::warn("[Forecaster] {} ({}); fallback allocation {:.2f}",
                 reason, to_string(kind), config_.fallback_allocation);
    return Forecast{.allocation_fraction = config_.fallback_allocation, .fallback = kind};
}

Forecast AllocationForecaster::predict(const AllocationModel* model,
                                       std::span<const FeatureRow> history) const noexcept {
    try {
        if (model == nullptr) {
            return fall_back(ErrorKind::ModelUnavailable, "no model loaded");
        }

        const sequence::SequenceWindower windower(model->window);
        if (history.size() < windower.min_rows()) {
            return fall_back(ErrorKind::DataInsufficient,
                             fmt::format("{} feature rows < {} required",
                                         history.size(), windower.min_rows()));
        }

        if (model->feature_scaler.columns() != FEATURE_COUNT ||
            model->target_scaler.columns() != 1 ||
            model->regressor.shape().input != FEATURE_COUNT) {
            return fall_back(ErrorKind::ModelUnavailable, "model shape mismatch");
        }

        const auto recent = history.last(windower.min_rows());
        const Eigen::MatrixXd scaled =
            model->feature_scaler.transform(sequence::feature_matrix(recent));
        const auto window = windower.latest_window(scaled, sequence::segment_ids(recent));
        if (!window) {
            return fall_back(ErrorKind::DataInsufficient, "latest window spans a gap in the history");
        }

        const auto y = model->regressor.predict(window->sequence);
        if (!y) {
            return fall_back(ErrorKind::ModelUnavailable, "non-finite model output");
        }

        const double fraction = model->target_scaler.inverse_transform(*y);
        if (!std::isfinite(fraction)) {
            return fall_back(ErrorKind::ModelUnavailable, "non-finite model output");
        }
        return Forecast{.allocation_fraction = std::clamp(fraction, 0.0, 1.0),
                        .fallback            = std::nullopt};
    } catch (const std::exception& e) {
        return fall_back(ErrorKind::ModelUnavailable, e.what());
    }
}

}  // namespace buylimit::forecast
