/**
 * @file  fuzz_model_artifact.cpp
 * @brief libFuzzer target for ModelArtifact::parse.
 *
 * Build:
 *   cmake -DBUYLIMIT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_model_artifact
 *
 * Run for 60 seconds (seed the corpus with a saved artifact):
 *   ./fuzz_model_artifact -max_total_time=60 corpus/
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no unbounded allocation: tensor dimensions are
 *      checked against the configured shape before any matrix is built.
 *   2. An accepted artifact matches the configured window and shape.
 *   3. An accepted artifact re-serialises to text that parses again.
 *   4. Inference on an accepted artifact never throws and always returns a
 *      fraction in [0, 1].
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "buylimit/forecast.hpp"

using namespace buylimit;
using namespace buylimit::forecast;

namespace {

const ForecasterConfig& fuzz_config() {
    static const ForecasterConfig cfg{
        .window = 4,
        .shape  = RegressorShape{.lstm1 = 2, .lstm2 = 2, .dense = 2},
    };
    return cfg;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};
    const auto& cfg = fuzz_config();

    const auto model = ModelArtifact::parse(input, cfg);
    if (!model.has_value()) {
        return 0;
    }

    // Invariant 2
    assert(model->window == cfg.window);
    assert(model->regressor.shape() == cfg.shape);

    // Invariant 3
    const std::string again = ModelArtifact::serialize(*model);
    assert(ModelArtifact::parse(again, cfg).has_value());

    // Invariant 4
    std::vector<FeatureRow> history(cfg.window + 1);
    for (std::size_t i = 0; i < history.size(); ++i) {
        history[i].asset_volatility = 0.1 * static_cast<double>(i);
        history[i].sentiment        = 50.0;
    }
    const auto out = AllocationForecaster(cfg).predict(&*model, history);
    assert(out.allocation_fraction >= 0.0 && out.allocation_fraction <= 1.0);

    return 0;
}
