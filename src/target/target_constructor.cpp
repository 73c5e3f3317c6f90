/// @file src/target/target_constructor.cpp
/// @brief TargetConstructor — forward risk-adjusted return labels.

#include "buylimit/target.hpp"
#include "../features/rolling_stats.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

namespace buylimit::target {

TargetConstructor::TargetConstructor(TargetConfig config) noexcept
    : config_(config)
{}

const TargetConfig& TargetConstructor::config() const noexcept {
    return config_;
}

// ─── quantile ─────────────────────────────────────────────────────────────────

std::optional<double>
TargetConstructor::quantile(std::span<const double> values, double q) {
    if (values.empty() || !(q >= 0.0 && q <= 1.0)) {
        return std::nullopt;
    }

    std::vector<double> sorted(values.begin(), values.end());
    std::sort(sorted.begin(), sorted.end());

    const double pos   = q * static_cast<double>(sorted.size() - 1);
    const auto   lo    = static_cast<std::size_t>(std::floor(pos));
    const auto   hi    = std::min(lo + 1, sorted.size() - 1);
    const double frac  = pos - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

// ─── raw_score ────────────────────────────────────────────────────────────────

double TargetConstructor::raw_score(std::span<const FeatureRow> rows,
                                    std::size_t t) const noexcept {
    const std::size_t L = config_.lookforward;

    const double future_return = rows[t + L].asset_price / rows[t].asset_price - 1.0;

    std::vector<double> forward_returns;
    forward_returns.reserve(L);
    for (std::size_t k = t + 1; k <= t + L; ++k) {
        forward_returns.push_back(rows[k].asset_return);
    }
    const double future_vol = features::detail::sample_stddev(
        std::span<const double>(forward_returns));

    return future_return / (future_vol + config_.vol_epsilon);
}

// ─── build ────────────────────────────────────────────────────────────────────

std::optional<LabelSet>
TargetConstructor::build(std::span<const FeatureRow> rows) const {
    const std::size_t L = config_.lookforward;
    if (L < 2 || rows.size() < L + 2) {
        return std::nullopt;
    }

    // Only rows whose whole horizon lies in their own segment get a score.
    const std::size_t labeled = rows.size() - L;
    std::vector<std::optional<double>> scores(labeled);
    std::vector<double> finite_scores;
    finite_scores.reserve(labeled);
    for (std::size_t t = 0; t < labeled; ++t) {
        if (rows[t + L].segment != rows[t].segment) {
            continue;
        }
        const double s = raw_score(rows, t);
        // Non-finite scores (zero price, overflow) neither label nor shape bounds.
        if (std::isfinite(s)) {
            scores[t] = s;
            finite_scores.push_back(s);
        }
    }

    const auto p_lo = quantile(finite_scores, config_.lower_quantile);
    const auto p_hi = quantile(finite_scores, config_.upper_quantile);
    if (!p_lo || !p_hi) {
        return std::nullopt;
    }
    const double spread = *p_hi - *p_lo;
    if (!(spread > constants::FLOAT_EPSILON)) {
        return std::nullopt;
    }

    LabelSet out{.rows = {}, .lower_bound = *p_lo, .upper_bound = *p_hi};
    out.rows.reserve(finite_scores.size());
    std::size_t run = 0;
    std::optional<std::size_t> prev_t;
    for (std::size_t t = 0; t < labeled; ++t) {
        if (!scores[t]) {
            continue;
        }
        if (prev_t && (*prev_t + 1 != t || rows[*prev_t].segment != rows[t].segment)) {
            ++run;
        }
        prev_t = t;

        const double scaled = (*scores[t] - *p_lo) / spread * config_.max_allocation;
        LabeledRow labeled_row{
            .features          = rows[t],
            .target_allocation = std::clamp(scaled, 0.0, config_.max_allocation),
        };
        labeled_row.features.segment = run;
        out.rows.push_back(labeled_row);
    }
    return out;
}

}  // namespace buylimit::target
