#pragma once

/// @file include/buylimit/forecast.hpp
/// @brief Allocation Forecaster — sequence model train/predict contract.
///
/// # Module: Allocation Forecaster
///
/// ## Responsibility
/// - `AllocationForecaster::train` fits the scalers and a SequenceRegressor
///   on a LabelSet and reports held-out error against a constant baseline.
/// - `AllocationForecaster::predict` maps the latest W feature rows to an
///   allocation fraction in [0, 1].
/// - `ModelArtifact` persists scalers and weights together as one text file.
/// - `ModelHandle` is the shared slot through which training publishes a
///   model and inference reads it.
///
/// ## Training Schedule
/// Chronological split (first 80% train, last 20% validation), mini-batch
/// Adam on mean squared error, early stopping on validation loss with the
/// best epoch's weights restored.
///
/// ## Fallback Contract
/// `predict` never throws. When history is shorter than W + 1 rows, no
/// model is loaded, the model's shape does not match the features, or the
/// output is non-finite, it returns FALLBACK_ALLOCATION (0.15) and sets
/// `Forecast::fallback` to the reason.
///
/// ## Guarantees
/// - Identical inputs and seed give identical trained weights
/// - AllocationModel is immutable once published; readers hold a
///   shared_ptr snapshot that outlives any later publish

#include "buylimit/constants.hpp"
#include "buylimit/errors.hpp"
#include "buylimit/regressor.hpp"
#include "buylimit/sequence.hpp"
#include "buylimit/target.hpp"
#include "buylimit/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace buylimit::forecast {

// ─── Configuration ────────────────────────────────────────────────────────────

struct ForecasterConfig {
    std::size_t    window              = constants::DEFAULT_WINDOW;
    RegressorShape shape{};
    std::size_t    min_windows         = constants::MIN_TRAINING_WINDOWS;
    double         validation_fraction = constants::VALIDATION_FRACTION;
    std::size_t    max_epochs          = 100;
    std::size_t    batch_size          = 8;
    std::size_t    patience            = 10;
    double         learning_rate       = 1e-3;
    std::uint32_t  seed                = 42;
    double         baseline_allocation = constants::BASELINE_ALLOCATION;
    double         fallback_allocation = constants::FALLBACK_ALLOCATION;
};

// ─── TrainReport ──────────────────────────────────────────────────────────────

/// Summary of one training run.
struct TrainReport {
    bool        model_trained        = false;
    std::size_t windows              = 0;
    std::size_t train_windows        = 0;
    std::size_t validation_windows   = 0;
    std::size_t epochs_run           = 0;
    std::size_t best_epoch           = 0;
    double      best_validation_loss = 0.0;  ///< Scaled-target MSE
    double      baseline_mae         = constants::ESTIMATED_BASELINE_MAE;
    double      model_mae            = constants::ESTIMATED_MODEL_MAE;

    [[nodiscard]] std::string to_string() const;
};

// ─── AllocationModel ──────────────────────────────────────────────────────────

/// Everything inference needs, fitted together and persisted together.
struct AllocationModel {
    sequence::MinMaxScaler feature_scaler;
    sequence::MinMaxScaler target_scaler;
    SequenceRegressor      regressor;
    std::size_t            window;
    double                 label_lower_bound;  ///< P10 the labels were built with
    double                 label_upper_bound;  ///< P90 the labels were built with
    TrainReport            report;
};

struct TrainingOutcome {
    std::shared_ptr<const AllocationModel> model;  ///< Null when no model was trained
    TrainReport                            report;
};

/// Result of one inference call.
struct Forecast {
    double                   allocation_fraction;
    std::optional<ErrorKind> fallback;  ///< Set when the fallback fraction was used

    [[nodiscard]] bool used_fallback() const noexcept { return fallback.has_value(); }
};

// ─── AllocationForecaster ─────────────────────────────────────────────────────

class AllocationForecaster {
public:
    explicit AllocationForecaster(ForecasterConfig config = ForecasterConfig{}) noexcept;

    /// Fit scalers and regressor on labeled history.
    ///
    /// # Returns
    /// - `model == nullptr` with the estimated MAE pair (0.08 / 0.05) when
    ///   fewer than `min_windows` windows can be built or scaling fails
    /// - otherwise the trained model and its held-out report
    [[nodiscard]] TrainingOutcome train(const target::LabelSet& labels) const;

    /// Allocation fraction for the most recent window of `history`.
    [[nodiscard]] Forecast predict(const AllocationModel* model,
                                   std::span<const FeatureRow> history) const noexcept;

    [[nodiscard]] const ForecasterConfig& config() const noexcept;

private:
    [[nodiscard]] Forecast fall_back(ErrorKind kind, std::string_view reason) const noexcept;

    ForecasterConfig config_;
};

// ─── ModelArtifact ────────────────────────────────────────────────────────────

/// Text persistence of an AllocationModel.
///
/// ## Format
/// ```
/// buylimit-allocation-model 1
/// window 14
/// shape 4 32 16 8
/// label_bounds <p10> <p90>
/// report <trained> <windows> <train> <validation> <epochs> <best_epoch> <best_loss> <baseline_mae> <model_mae>
/// feature_scaler <cols> <min...> <max...>
/// target_scaler 1 <min> <max>
/// tensor <name> <rows> <cols> <row-major values...>   (× 10)
/// end
/// ```
class ModelArtifact {
public:
    static constexpr std::string_view MAGIC   = "buylimit-allocation-model";
    static constexpr int              VERSION = 1;

    [[nodiscard]] static std::string serialize(const AllocationModel& model);

    /// Parse an artifact, checking its window and shape against `expected`.
    ///
    /// # Returns
    /// `nullopt` on a wrong magic or version, truncation, trailing data, a
    /// non-finite value, or any dimension that disagrees with `expected`.
    [[nodiscard]] static std::optional<AllocationModel>
    parse(std::string_view text, const ForecasterConfig& expected);

    /// Write to `<path>.tmp`, then rename over `path`.
    ///
    /// # Returns
    /// `false` if any step fails; the previous artifact is left untouched.
    [[nodiscard]] static bool save(const AllocationModel& model,
                                   const std::filesystem::path& path);

    [[nodiscard]] static std::optional<AllocationModel>
    load(const std::filesystem::path& path, const ForecasterConfig& expected);
};

// ─── ModelHandle ──────────────────────────────────────────────────────────────

/// Mutex-guarded slot holding the currently published model.
class ModelHandle {
public:
    /// Snapshot of the current model (null if none).
    [[nodiscard]] std::shared_ptr<const AllocationModel> current() const;

    /// Replace the current model. Readers holding an older snapshot keep it.
    void publish(std::shared_ptr<const AllocationModel> model);

    void clear();

private:
    mutable std::mutex                     mutex_;
    std::shared_ptr<const AllocationModel> model_;
};

}  // namespace buylimit::forecast
