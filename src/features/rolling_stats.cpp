/// @file src/features/rolling_stats.cpp
/// @brief Rolling mean / sample standard deviation over bounded deques.

#include "rolling_stats.hpp"

#include <cmath>
#include <numeric>

namespace buylimit::features::detail {

void push_bounded(std::deque<double>& buf, double value, std::size_t max_size) noexcept {
    buf.push_back(value);
    while (buf.size() > max_size) {
        buf.pop_front();
    }
}

double mean(const std::deque<double>& buf) noexcept {
    // Precondition: buf is non-empty.
    const double sum = std::accumulate(buf.begin(), buf.end(), 0.0);
    return sum / static_cast<double>(buf.size());
}

namespace {

template <typename Range>
double bessel_stddev(const Range& values, std::size_t n) noexcept {
    if (n < 2) {
        return 0.0;
    }
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    const double m = sum / static_cast<double>(n);
    double sq_sum = 0.0;
    for (double v : values) {
        const double d = v - m;
        sq_sum += d * d;
    }
    return std::sqrt(sq_sum / static_cast<double>(n - 1));
}

}  // namespace

double sample_stddev(const std::deque<double>& buf) noexcept {
    return bessel_stddev(buf, buf.size());
}

double sample_stddev(std::span<const double> values) noexcept {
    return bessel_stddev(values, values.size());
}

}  // namespace buylimit::features::detail
