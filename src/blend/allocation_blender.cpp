/// @file src/blend/allocation_blender.cpp
/// @brief AllocationBlender — conservative min of both limits plus the
///        first-purchase bonus.

#include "buylimit/blend.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace buylimit::blend {

AllocationBlender::AllocationBlender(sizing::RiskProfileTable table)
    : table_(std::move(table))
{}

std::optional<BlendResult> AllocationBlender::blend(const BlendInput& input) const {
    const auto config = table_.find(input.profile);
    if (!config) {
        spdlog::error("[Blender] no configuration for risk profile '{}'",
                      sizing::to_string(input.profile));
        return std::nullopt;
    }

    BlendResult r{};
    r.forecast_amount = input.balance * input.allocation_fraction;
    r.bonus_factor    = input.is_first_purchase ? config->first_time_bonus : 1.0;
    r.limit = std::max(std::min(input.smart_limit, r.forecast_amount) * r.bonus_factor, 0.0);
    return r;
}

std::optional<double> AllocationBlender::fallback(double balance, sizing::RiskProfile profile) const {
    const auto config = table_.find(profile);
    if (!config) {
        spdlog::error("[Blender] no configuration for risk profile '{}'",
                      sizing::to_string(profile));
        return std::nullopt;
    }
    return std::max(balance * config->flat_fallback, 0.0);
}

}  // namespace buylimit::blend
