#pragma once

/// @file include/buylimit/errors.hpp
/// @brief Error taxonomy and recovery records.
///
/// # Module: Errors
///
/// ## Responsibility
/// Name the four failure classes the engine distinguishes and describe a
/// local recovery so it can be logged and surfaced on the recommendation.
///
/// ## Convention
/// No exception crosses the library API. Fallible calls return
/// `std::optional`; the engine converts a `nullopt` from a stage into a
/// `Degradation` entry and continues on the stage's fallback path.
/// `ErrorKind::Configuration` is the only class that rejects a request.

#include <string>
#include <string_view>

namespace buylimit {

/// Failure classes recognised by the engine.
enum class ErrorKind {
    DataInsufficient,  ///< Too few rows for a feature/window computation
    ModelUnavailable,  ///< No trained artifact, or it failed to load
    Configuration,     ///< Risk profile without a configuration entry
    UpstreamData,      ///< Market-data collaborator unreachable
};

/// Stable lowercase identifier ("data_insufficient", ...).
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// A local recovery taken while serving one request.
struct Degradation {
    ErrorKind   kind;
    std::string stage;           ///< Pipeline stage that fell back
    double      fallback_value;  ///< Value substituted by the fallback path
};

/// One-line log form: "<kind> at <stage> (fallback=<value>)".
[[nodiscard]] std::string describe(const Degradation& d);

}  // namespace buylimit
