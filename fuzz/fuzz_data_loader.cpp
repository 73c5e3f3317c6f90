/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader::parse_csv_string and the feature
 *        stage downstream of it.
 *
 * Build:
 *   cmake -DBUYLIMIT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed record is finite with price > 0 and rate > 0.
 *   3. Parsed timestamps are strictly increasing.
 *   4. If features are produced, every indicator is finite and
 *      sentiment ∈ [0, 100].
 *   5. Feature segment ids never decrease.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "buylimit/data_loader.hpp"
#include "buylimit/features.hpp"

using namespace buylimit;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const PriceSeries series = core::DataLoader::parse_csv_string(input);

    for (std::size_t i = 0; i < series.size(); ++i) {
        assert(core::DataLoader::validate_record(series[i]));
        if (i > 0) {
            assert(series[i].timestamp > series[i - 1].timestamp);
        }
    }

    const auto rows = features::FeatureEngine{}.compute(series);
    if (rows.has_value()) {
        for (std::size_t i = 1; i < rows->size(); ++i) {
            assert((*rows)[i].segment >= (*rows)[i - 1].segment);
        }
        for (const auto& r : *rows) {
            assert(std::isfinite(r.asset_volatility));
            assert(std::isfinite(r.fx_volatility));
            assert(std::isfinite(r.trend));
            assert(r.sentiment >= 0.0 && r.sentiment <= 100.0);
        }
    }

    return 0;
}
