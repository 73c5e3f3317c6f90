#pragma once

/// @file include/buylimit/sequence.hpp
/// @brief Min-max scaling and sliding-window slicing for the forecaster.
///
/// # Module: Sequence Windower
///
/// ## Responsibility
/// - `MinMaxScaler` maps each column independently onto [0, 1] using bounds
///   fitted once on the training set. The bounds are persisted with the model.
/// - `SequenceWindower` slices a scaled feature matrix into overlapping
///   fixed-length windows (stride 1, overlap W − 1).
///
/// ## Numeric Contract
/// - `transform` clamps out-of-range inputs to [0, 1]; it never fails on
///   finite input
/// - A column with zero range maps to 0 (no variance to scale against)
/// - `inverse_transform` is exact on [0, 1]
///
/// ## Window Layout
/// For window W and row count N, training windows exist for i ∈ [W, N):
///   input  = rows [i − W, i)
///   target = target[i]
/// At inference only the latest W rows are used, and at least W + 1 rows
/// must exist.
///
/// When per-row segment ids are supplied, a window is built only if rows
/// i − W through i share one segment, so no window spans a gap in the series.

#include "buylimit/types.hpp"
#include "buylimit/constants.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace buylimit::sequence {

// ─── MinMaxScaler ─────────────────────────────────────────────────────────────

/// Per-column [0, 1] scaler.
class MinMaxScaler {
public:
    /// Fit bounds on a matrix (rows = samples, cols = features).
    ///
    /// # Returns
    /// `nullopt` if `data` is empty or contains a non-finite value.
    [[nodiscard]] static std::optional<MinMaxScaler> fit(const Eigen::MatrixXd& data);

    /// Rebuild a scaler from persisted bounds.
    ///
    /// # Returns
    /// `nullopt` if sizes differ, are zero, any bound is non-finite, or
    /// `min > max` for any column.
    [[nodiscard]] static std::optional<MinMaxScaler>
    from_bounds(Eigen::VectorXd min, Eigen::VectorXd max);

    /// Scale each column onto [0, 1], clamping values outside the fit range.
    /// Precondition: data.cols() == columns().
    [[nodiscard]] Eigen::MatrixXd transform(const Eigen::MatrixXd& data) const;

    /// Scaled → original units for a single column.
    [[nodiscard]] double inverse_transform(double scaled, Eigen::Index column = 0) const noexcept;

    [[nodiscard]] Eigen::Index columns() const noexcept;
    [[nodiscard]] const Eigen::VectorXd& min() const noexcept;
    [[nodiscard]] const Eigen::VectorXd& max() const noexcept;

private:
    MinMaxScaler(Eigen::VectorXd min, Eigen::VectorXd max);

    Eigen::VectorXd min_;
    Eigen::VectorXd max_;
};

// ─── Window ───────────────────────────────────────────────────────────────────

/// One forecaster input: W consecutive scaled rows and, in training, the
/// scaled target at the window's right edge.
struct Window {
    SequenceMatrix        sequence;   ///< W × FEATURE_COUNT
    std::optional<double> target;     ///< Scaled label (training only)
    std::size_t           end_index;  ///< Index of the labeled row
};

// ─── SequenceWindower ─────────────────────────────────────────────────────────

class SequenceWindower {
public:
    explicit SequenceWindower(std::size_t window = constants::DEFAULT_WINDOW) noexcept;

    /// Training windows for every i ∈ [W, rows), labeled with targets(i).
    ///
    /// Returns an empty vector if there are not enough rows, or the target
    /// or non-empty `segments` length does not match the row count.
    [[nodiscard]] std::vector<Window>
    training_windows(const Eigen::MatrixXd& scaled_features,
                     const Eigen::VectorXd& scaled_targets,
                     std::span<const std::size_t> segments = {}) const;

    /// The last W rows, if at least W + 1 rows exist and, with `segments`,
    /// the last W + 1 rows share one segment.
    [[nodiscard]] std::optional<Window>
    latest_window(const Eigen::MatrixXd& scaled_features,
                  std::span<const std::size_t> segments = {}) const;

    /// Rows needed before `latest_window` succeeds.
    [[nodiscard]] std::size_t min_rows() const noexcept;

    [[nodiscard]] std::size_t window() const noexcept;

private:
    std::size_t window_;
};

/// Segment id of every row, in order.
template <typename RowRange>
[[nodiscard]] std::vector<std::size_t> segment_ids(const RowRange& rows) {
    std::vector<std::size_t> ids;
    ids.reserve(rows.size());
    for (const auto& row : rows) {
        ids.push_back(row.segment);
    }
    return ids;
}

/// Stack FeatureRow values into an N × FEATURE_COUNT matrix.
template <typename RowRange>
[[nodiscard]] Eigen::MatrixXd feature_matrix(const RowRange& rows) {
    Eigen::MatrixXd m(static_cast<Eigen::Index>(rows.size()), FEATURE_COUNT);
    Eigen::Index r = 0;
    for (const auto& row : rows) {
        m.row(r++) = to_feature_vector(row).transpose();
    }
    return m;
}

}  // namespace buylimit::sequence
