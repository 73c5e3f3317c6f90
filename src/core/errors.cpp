/// @file src/core/errors.cpp
/// @brief ErrorKind names and Degradation formatting.

#include "buylimit/errors.hpp"

#include <fmt/format.h>

namespace buylimit {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::DataInsufficient: return "data_insufficient";
        case ErrorKind::ModelUnavailable: return "model_unavailable";
        case ErrorKind::Configuration:    return "configuration";
        case ErrorKind::UpstreamData:     return "upstream_data";
    }
    return "unknown";
}

std::string describe(const Degradation& d) {
    return fmt::format("{} at {} (fallback={:.6f})",
                       to_string(d.kind), d.stage, d.fallback_value);
}

}  // namespace buylimit
