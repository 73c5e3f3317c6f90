#pragma once

/// @file include/buylimit/blend.hpp
/// @brief Allocation Blender — merge the rule-based and forecast limits.
///
/// # Module: Allocation Blender
///
/// ## Formula
/// ```
/// forecast_amount = balance × allocation_fraction
/// limit           = min(smart_limit, forecast_amount)
/// limit          *= first_time_bonus          (first purchase only)
/// limit           = max(limit, 0)
/// ```
/// The bonus is applied after the min, so a first purchase may exceed the
/// smart limit by at most the bonus factor.
///
/// `fallback` is the last-resort path: balance × flat_fallback, no bonus.

#include "buylimit/risk_profile.hpp"

#include <optional>

namespace buylimit::blend {

struct BlendInput {
    double              smart_limit;
    double              balance;
    double              allocation_fraction;
    bool                is_first_purchase;
    sizing::RiskProfile profile;
};

struct BlendResult {
    double forecast_amount;  ///< balance × allocation_fraction
    double bonus_factor;     ///< 1 unless first purchase
    double limit;            ///< Final hard limit, ≥ 0
};

class AllocationBlender {
public:
    explicit AllocationBlender(sizing::RiskProfileTable table = sizing::RiskProfileTable::canonical());

    /// # Returns
    /// `nullopt` if the profile has no table entry.
    [[nodiscard]] std::optional<BlendResult> blend(const BlendInput& input) const;

    /// balance × flat_fallback for the profile, or `nullopt` on a lookup miss.
    [[nodiscard]] std::optional<double> fallback(double balance, sizing::RiskProfile profile) const;

private:
    sizing::RiskProfileTable table_;
};

}  // namespace buylimit::blend
