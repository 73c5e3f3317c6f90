#pragma once

/// @file include/buylimit/risk_profile.hpp
/// @brief Risk profiles and their static sizing parameters.
///
/// # Module: Risk Profile Table
///
/// ## Responsibility
/// Map each RiskProfile to the tuple of sizing parameters consumed by the
/// Smart Limit Calculator and the Allocation Blender.
///
/// ## Guarantees
/// - The table is immutable after construction and safe to share
/// - `find` on a profile with no entry returns nullopt (a configuration
///   error the caller must surface)

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace buylimit::sizing {

enum class RiskProfile {
    Conservative,
    Moderate,
    Aggressive,
};

/// All risk profiles, in ascending risk appetite.
inline constexpr std::array<RiskProfile, 3> ALL_RISK_PROFILES{
    RiskProfile::Conservative, RiskProfile::Moderate, RiskProfile::Aggressive};

/// Sizing parameters for one profile.
struct RiskProfileConfig {
    double max_crypto_allocation;  ///< Share of balance before adjustments
    double volatility_penalty;     ///< k in 1 / (1 + k · vol)
    double reduction_multiplier;   ///< Slope of the concentration reduction
    double reduction_floor;        ///< Lower bound of the concentration reduction
    double fear_factor;            ///< Multiplier when sentiment < 20
    double greed_factor;           ///< Multiplier when sentiment > 80
    double uptrend_factor;         ///< Multiplier when trend > +0.15
    double drawdown_factor;        ///< Multiplier when trend < −0.15
    double max_single_trade;       ///< Hard cap as a share of balance
    double first_time_bonus;       ///< Applied by the blender on a first purchase
    double flat_fallback;          ///< Share of balance on the last-resort path
};

/// Parse "conservative" / "moderate" / "aggressive" (case-insensitive).
[[nodiscard]] std::optional<RiskProfile> parse_risk_profile(std::string_view text) noexcept;

/// Lowercase identifier ("moderate").
[[nodiscard]] std::string_view to_string(RiskProfile profile) noexcept;

/// Display label ("Moderate").
[[nodiscard]] std::string_view to_label(RiskProfile profile) noexcept;

/// One-line description for profile listings.
[[nodiscard]] std::string_view describe(RiskProfile profile) noexcept;

// ─── RiskProfileTable ─────────────────────────────────────────────────────────

class RiskProfileTable {
public:
    using Entry = std::pair<RiskProfile, RiskProfileConfig>;

    /// Build from explicit entries. A later entry for the same profile
    /// replaces an earlier one.
    explicit RiskProfileTable(std::vector<Entry> entries);

    /// The shipped parameter set for all three profiles.
    [[nodiscard]] static const RiskProfileTable& canonical();

    [[nodiscard]] std::optional<RiskProfileConfig> find(RiskProfile profile) const noexcept;

    [[nodiscard]] bool contains(RiskProfile profile) const noexcept;

private:
    std::array<std::optional<RiskProfileConfig>, ALL_RISK_PROFILES.size()> entries_;
};

}  // namespace buylimit::sizing
