/// @file src/sequence/sequence_windower.cpp
/// @brief SequenceWindower — stride-1 overlapping windows.

#include "buylimit/sequence.hpp"

namespace buylimit::sequence {

namespace {

/// True when rows [first, last] all sit in one segment. Segment ids never
/// decrease, so the endpoints decide.
[[nodiscard]] bool same_segment(std::span<const std::size_t> segments,
                                std::size_t first, std::size_t last) noexcept {
    return segments.empty() || segments[first] == segments[last];
}

}  // namespace

SequenceWindower::SequenceWindower(std::size_t window) noexcept
    : window_(window < 1 ? 1 : window)
{}

std::size_t SequenceWindower::window() const noexcept {
    return window_;
}

std::size_t SequenceWindower::min_rows() const noexcept {
    return window_ + 1;
}

std::vector<Window>
SequenceWindower::training_windows(const Eigen::MatrixXd& scaled_features,
                                   const Eigen::VectorXd& scaled_targets,
                                   std::span<const std::size_t> segments) const {
    const auto n = static_cast<std::size_t>(scaled_features.rows());
    if (n < min_rows() || scaled_targets.size() != scaled_features.rows()) {
        return {};
    }
    if (!segments.empty() && segments.size() != n) {
        return {};
    }

    const auto w = static_cast<Eigen::Index>(window_);
    std::vector<Window> out;
    out.reserve(n - window_);
    for (std::size_t i = window_; i < n; ++i) {
        if (!same_segment(segments, i - window_, i)) {
            continue;
        }
        const auto start = static_cast<Eigen::Index>(i) - w;
        out.push_back(Window{
            .sequence  = scaled_features.middleRows(start, w),
            .target    = scaled_targets(static_cast<Eigen::Index>(i)),
            .end_index = i,
        });
    }
    return out;
}

std::optional<Window>
SequenceWindower::latest_window(const Eigen::MatrixXd& scaled_features,
                                std::span<const std::size_t> segments) const {
    const auto n = static_cast<std::size_t>(scaled_features.rows());
    if (n < min_rows()) {
        return std::nullopt;
    }
    if (!segments.empty() &&
        (segments.size() != n || !same_segment(segments, n - min_rows(), n - 1))) {
        return std::nullopt;
    }
    const auto w = static_cast<Eigen::Index>(window_);
    return Window{
        .sequence  = scaled_features.bottomRows(w),
        .target    = std::nullopt,
        .end_index = n - 1,
    };
}

}  // namespace buylimit::sequence
