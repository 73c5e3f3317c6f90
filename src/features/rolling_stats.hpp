#pragma once

/// @file src/features/rolling_stats.hpp
/// @brief Bounded-deque helpers shared by the feature and label stages.

#include <cstddef>
#include <deque>
#include <span>

namespace buylimit::features::detail {

/// Push a value into a deque, evicting the oldest if at capacity.
void push_bounded(std::deque<double>& buf, double value, std::size_t max_size) noexcept;

/// Mean of all values in buf. Precondition: buf is non-empty.
[[nodiscard]] double mean(const std::deque<double>& buf) noexcept;

/// Sample std-dev (Bessel-corrected). Returns 0.0 if buf.size() < 2.
[[nodiscard]] double sample_stddev(const std::deque<double>& buf) noexcept;

/// Sample std-dev of a contiguous range. Returns 0.0 if fewer than 2 values.
[[nodiscard]] double sample_stddev(std::span<const double> values) noexcept;

}  // namespace buylimit::features::detail
