/**
 * @file  prop_smart_limit_monotone.cpp
 * @brief Property: the smart limit is non-increasing in holdings value and
 *        in volatility, all other inputs fixed.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_smart_limit_monotone
 *
 * Basis:
 *   reduction  = max(floor, 1 − min(h/B, 2) · multiplier)   non-increasing in h
 *   vol_factor = 1 / (1 + k · σ)                           decreasing in σ
 *   Every other factor is independent of h and σ, and the final clamp to
 *   [0, cap] preserves order.
 */

#include <rapidcheck.h>
#include <algorithm>
#include <cmath>

#include "buylimit/sizing.hpp"

using namespace buylimit::sizing;

namespace {

double unit(double raw) { return 0.5 * (std::tanh(raw) + 1.0); }

MarketSnapshot market(double rv, double rs, double rt) {
    return MarketSnapshot{
        .volatility = unit(rv) * 3.0,
        .sentiment  = unit(rs) * 100.0,
        .trend      = std::tanh(rt) * 0.5,
    };
}

}  // namespace

int main() {
    // ── Property 1: more holdings never raise the limit ─────────────────────
    rc::check(
        "smart_limit: non-increasing in holdings value",
        [](double rh1, double rh2, double rv, double rs, double rt, unsigned k) {
            const auto profile = ALL_RISK_PROFILES[k % ALL_RISK_PROFILES.size()];
            const double balance = 10000.0;
            const double h_lo = std::min(unit(rh1), unit(rh2)) * 50000.0;
            const double h_hi = std::max(unit(rh1), unit(rh2)) * 50000.0;
            const auto m = market(rv, rs, rt);

            const SmartLimitCalculator calc;
            const auto lo = calc.compute(m, balance, h_lo, profile);
            const auto hi = calc.compute(m, balance, h_hi, profile);
            RC_ASSERT(lo.has_value());
            RC_ASSERT(hi.has_value());
            RC_ASSERT(hi->limit <= lo->limit + 1e-9);
        }
    );

    // ── Property 2: higher volatility never raises the limit ────────────────
    rc::check(
        "smart_limit: non-increasing in volatility",
        [](double rv1, double rv2, double rh, double rs, double rt, unsigned k) {
            const auto profile = ALL_RISK_PROFILES[k % ALL_RISK_PROFILES.size()];
            auto calm  = market(std::min(rv1, rv2), rs, rt);
            auto rough = market(std::max(rv1, rv2), rs, rt);

            const SmartLimitCalculator calc;
            const double holdings = unit(rh) * 20000.0;
            const auto a = calc.compute(calm, 10000.0, holdings, profile);
            const auto b = calc.compute(rough, 10000.0, holdings, profile);
            RC_ASSERT(a.has_value());
            RC_ASSERT(b.has_value());
            RC_ASSERT(b->limit <= a->limit + 1e-9);
        }
    );

    // ── Property 3: limit scales linearly with balance at fixed ratio ───────
    rc::check(
        "smart_limit: homogeneous of degree one in (balance, holdings)",
        [](double rb, double rh, double rv, double rs, double rt) {
            const double balance  = 100.0 + unit(rb) * 1e5;
            const double holdings = unit(rh) * balance * 3.0;
            const auto m = market(rv, rs, rt);

            const SmartLimitCalculator calc;
            const auto one = calc.compute(m, balance, holdings, RiskProfile::Moderate);
            const auto two = calc.compute(m, 2.0 * balance, 2.0 * holdings, RiskProfile::Moderate);
            RC_ASSERT(one.has_value());
            RC_ASSERT(two.has_value());
            RC_ASSERT(std::abs(two->limit - 2.0 * one->limit) <= 1e-9 * std::max(1.0, two->limit));
        }
    );

    return 0;
}
