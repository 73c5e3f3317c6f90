/// @file src/sequence/minmax_scaler.cpp
/// @brief MinMaxScaler — per-column [0, 1] scaling with clamped transform.

#include "buylimit/sequence.hpp"

#include <algorithm>
#include <cmath>

namespace buylimit::sequence {

namespace {

/// Column ranges below this are treated as constant.
constexpr double FLAT_RANGE_THRESHOLD = 1e-12;

}  // namespace

MinMaxScaler::MinMaxScaler(Eigen::VectorXd min, Eigen::VectorXd max)
    : min_(std::move(min))
    , max_(std::move(max))
{}

// ─── Factories ────────────────────────────────────────────────────────────────

std::optional<MinMaxScaler> MinMaxScaler::fit(const Eigen::MatrixXd& data) {
    if (data.rows() == 0 || data.cols() == 0 || !data.allFinite()) {
        return std::nullopt;
    }
    return MinMaxScaler(data.colwise().minCoeff().transpose(),
                        data.colwise().maxCoeff().transpose());
}

std::optional<MinMaxScaler>
MinMaxScaler::from_bounds(Eigen::VectorXd min, Eigen::VectorXd max) {
    if (min.size() == 0 || min.size() != max.size()) {
        return std::nullopt;
    }
    if (!min.allFinite() || !max.allFinite()) {
        return std::nullopt;
    }
    if ((min.array() > max.array()).any()) {
        return std::nullopt;
    }
    return MinMaxScaler(std::move(min), std::move(max));
}

// ─── transform ────────────────────────────────────────────────────────────────

Eigen::MatrixXd MinMaxScaler::transform(const Eigen::MatrixXd& data) const {
    Eigen::MatrixXd out(data.rows(), data.cols());
    for (Eigen::Index c = 0; c < data.cols(); ++c) {
        const double range = max_(c) - min_(c);
        for (Eigen::Index r = 0; r < data.rows(); ++r) {
            if (range < FLAT_RANGE_THRESHOLD || !std::isfinite(data(r, c))) {
                out(r, c) = 0.0;
                continue;
            }
            out(r, c) = std::clamp((data(r, c) - min_(c)) / range, 0.0, 1.0);
        }
    }
    return out;
}

double MinMaxScaler::inverse_transform(double scaled, Eigen::Index column) const noexcept {
    return min_(column) + scaled * (max_(column) - min_(column));
}

// ─── Accessors ────────────────────────────────────────────────────────────────

Eigen::Index MinMaxScaler::columns() const noexcept {
    return min_.size();
}

const Eigen::VectorXd& MinMaxScaler::min() const noexcept {
    return min_;
}

const Eigen::VectorXd& MinMaxScaler::max() const noexcept {
    return max_;
}

}  // namespace buylimit::sequence
