/// @file src/core/cli.cpp
/// @brief Args and the typed flag readers used by src/main.cpp.

#include "buylimit/cli.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace buylimit::cli {

// ─── Scalars ──────────────────────────────────────────────────────────────────

std::optional<double> parse_number(const std::string& text) {
    try {
        std::size_t pos = 0;
        const double v = std::stod(text, &pos);
        if (pos != text.size() || !std::isfinite(v)) {
            return std::nullopt;
        }
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<std::size_t> parse_count(const std::string& text) {
    // stoull would accept leading blanks and wrap a leading minus sign.
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        const unsigned long long v = std::stoull(text, &pos);
        if (pos != text.size() || v == 0 ||
            v > std::numeric_limits<std::size_t>::max()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(v);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// ─── Args ─────────────────────────────────────────────────────────────────────

Args::Args(std::vector<std::string> args)
    : args_(std::move(args))
{}

Args::Args(int argc, char* argv[]) {
    for (int i = 2; i < argc; ++i) {
        args_.emplace_back(argv[i]);
    }
}

bool Args::flag(const std::string& name) const {
    for (const auto& a : args_) {
        if (a == name) return true;
    }
    return false;
}

std::optional<std::string> Args::value(const std::string& name) const {
    for (std::size_t i = 0; i + 1 < args_.size(); ++i) {
        if (args_[i] == name) return args_[i + 1];
    }
    return std::nullopt;
}

std::optional<std::string> Args::positional() const {
    if (!args_.empty() && args_[0].rfind("--", 0) != 0) {
        return args_[0];
    }
    return std::nullopt;
}

std::optional<double> Args::number(const std::string& name) const {
    const auto text = value(name);
    if (!text) return std::nullopt;
    return parse_number(*text);
}

// ─── Flag groups ──────────────────────────────────────────────────────────────

FlagResult<std::size_t> history_days(const Args& args) {
    const auto text = args.value("--history-days");
    if (!text) {
        return {};
    }
    const auto n = parse_count(*text);
    if (!n) {
        return {.value = std::nullopt,
                .error = fmt::format("--history-days must be a positive integer, got '{}'", *text)};
    }
    return {.value = n, .error = std::nullopt};
}

FlagResult<LiveRates> live_quote(const Args& args) {
    const bool has_price = args.flag("--price");
    const bool has_fx    = args.flag("--fx");
    if (!has_price && !has_fx) {
        return {};
    }
    if (has_price != has_fx) {
        return {.value = std::nullopt,
                .error = "--price and --fx must be given together"};
    }

    const auto price = args.number("--price");
    const auto fx    = args.number("--fx");
    if (!price || !fx) {
        return {.value = std::nullopt,
                .error = fmt::format("invalid live quote --price '{}' --fx '{}'",
                                     args.value("--price").value_or(""),
                                     args.value("--fx").value_or(""))};
    }
    return {.value = LiveRates{.asset_price_usd = *price, .fx_rate = *fx},
            .error = std::nullopt};
}

}  // namespace buylimit::cli
