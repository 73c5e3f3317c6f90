#pragma once

/// @file include/buylimit/cli.hpp
/// @brief Command-line flag reading for the buylimit executable.
///
/// # Module: CLI Arguments
///
/// ## Responsibility
/// Turn the argument list after the mode (`--train`, `--recommend`, ...)
/// into typed values. Every reader returns `nullopt` on malformed text so
/// the caller can print one error and exit.
///
/// ## Guarantees
/// - `parse_number` accepts only a complete, finite decimal
/// - `parse_count` accepts only a complete, positive integer that fits in
///   `std::size_t`
/// - `live_quote` never drops half of a `--price` / `--fx` pair silently

#include "buylimit/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace buylimit::cli {

/// Parse a finite double; `nullopt` on garbage.
[[nodiscard]] std::optional<double> parse_number(const std::string& text);

/// Parse a positive integer count; `nullopt` on signs, fractions, exponents,
/// trailing characters, zero or overflow.
[[nodiscard]] std::optional<std::size_t> parse_count(const std::string& text);

/// Minimal flag reader over the arguments that follow the mode.
class Args {
public:
    explicit Args(std::vector<std::string> args);

    /// Skips argv[0] (program) and argv[1] (mode).
    Args(int argc, char* argv[]);

    [[nodiscard]] bool flag(const std::string& name) const;

    /// The argument right after `name`, if both are present.
    [[nodiscard]] std::optional<std::string> value(const std::string& name) const;

    /// The argument right after the mode, unless it is a flag.
    [[nodiscard]] std::optional<std::string> positional() const;

    /// Numeric value of `name`, if present and well-formed.
    [[nodiscard]] std::optional<double> number(const std::string& name) const;

private:
    std::vector<std::string> args_;
};

/// Outcome of reading an optional group of flags.
template <typename T>
struct FlagResult {
    std::optional<T>           value;  ///< Set when the group was given and valid
    std::optional<std::string> error;  ///< Set when the group was malformed
};

/// `--history-days <n>`: unset when absent, an error unless a positive count.
[[nodiscard]] FlagResult<std::size_t> history_days(const Args& args);

/// `--price <usd> --fx <rate>`: unset when both are absent, an error when
/// only one is given or either is not a number.
[[nodiscard]] FlagResult<LiveRates> live_quote(const Args& args);

}  // namespace buylimit::cli
