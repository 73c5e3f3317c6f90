#pragma once

/// @file include/buylimit/target.hpp
/// @brief Target Constructor — training labels from forward-looking returns.
///
/// # Module: Target Constructor
///
/// ## Responsibility
/// Attach an "ideal allocation" label to each FeatureRow for training:
///
///   future_return = price[t+L] / price[t] − 1
///   future_vol    = sample std of asset_return[t+1 .. t+L]
///   raw_score     = future_return / (future_vol + 0.01)
///   target        = clip((raw − P10) / (P90 − P10) × 0.25, 0, 0.25)
///
/// P10 / P90 are linear-interpolated quantiles of raw_score over the whole
/// input, computed once per call. Retraining on a different history therefore
/// moves the label scale; the bounds travel with the model artifact.
///
/// ## Edge Cases
/// - The trailing L rows have no future and are dropped
/// - A row whose horizon crosses into another segment is dropped
/// - In the output, `features.segment` numbers the contiguous runs of labeled
///   rows, so a skipped label also starts a new run
/// - Fewer than L + 2 rows → nullopt
/// - P90 − P10 ≤ FLOAT_EPSILON (no spread to normalise) → nullopt
///
/// ## NOT Responsible For
/// - Inference: labels exist only at training time

#include "buylimit/types.hpp"
#include "buylimit/constants.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace buylimit::target {

struct TargetConfig {
    std::size_t lookforward    = constants::DEFAULT_LOOKFORWARD;
    double      vol_epsilon    = constants::TARGET_VOL_EPSILON;
    double      max_allocation = constants::MAX_TARGET_ALLOCATION;
    double      lower_quantile = constants::TARGET_LOWER_QUANTILE;
    double      upper_quantile = constants::TARGET_UPPER_QUANTILE;
};

/// Labeled rows together with the dataset-level normalisation bounds.
struct LabelSet {
    std::vector<LabeledRow> rows;
    double lower_bound;  ///< P10 of raw_score
    double upper_bound;  ///< P90 of raw_score
};

class TargetConstructor {
public:
    explicit TargetConstructor(TargetConfig config = TargetConfig{}) noexcept;

    /// Label every row that has `lookforward` successors.
    [[nodiscard]] std::optional<LabelSet>
    build(std::span<const FeatureRow> rows) const;

    /// Risk-adjusted forward score for row `t`.
    /// Precondition: t + L < rows.size() and rows t .. t + L share a segment.
    [[nodiscard]] double raw_score(std::span<const FeatureRow> rows, std::size_t t) const noexcept;

    /// Linear-interpolated quantile (numpy/pandas "linear" method).
    ///
    /// # Returns
    /// `nullopt` if `values` is empty or `q ∉ [0, 1]`.
    [[nodiscard]] static std::optional<double>
    quantile(std::span<const double> values, double q);

    [[nodiscard]] const TargetConfig& config() const noexcept;

private:
    TargetConfig config_;
};

}  // namespace buylimit::target
