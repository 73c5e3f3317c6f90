#pragma once

/// @file include/buylimit/regressor.hpp
/// @brief SequenceRegressor — stacked-LSTM sequence-to-scalar network.
///
/// # Module: Sequence Regressor
///
/// ## Architecture
///   x[0..W) ──► LSTM(H1, all steps) ──► LSTM(H2, last step)
///            ──► Dense(D, tanh) ──► Dense(1, sigmoid) ──► y ∈ (0, 1)
///
/// Default widths: H1 = 32, H2 = 16, D = 8, input = FEATURE_COUNT.
/// LSTM gate order within each 4H block is [input, forget, cell, output].
///
/// ## Training Support
/// `accumulate_gradient` runs forward + backpropagation-through-time for a
/// single sequence under a scaled squared-error loss and adds the result
/// into a caller-owned gradient set. `AdamOptimizer` applies the update.
///
/// ## Guarantees
/// - Weights are initialised deterministically from the seed
///   (Glorot-uniform kernels, zero biases, forget-gate bias 1)
/// - `predict` returns nullopt on shape mismatch or non-finite output
/// - Thread-safe reads: const members are safe to call concurrently

#include "buylimit/types.hpp"

#include <Eigen/Dense>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace buylimit::forecast {

// ─── Tensors ──────────────────────────────────────────────────────────────────

/// Index of each trainable tensor in a WeightSet.
enum class TensorId : std::size_t {
    Lstm1Kernel,
    Lstm1Recurrent,
    Lstm1Bias,
    Lstm2Kernel,
    Lstm2Recurrent,
    Lstm2Bias,
    DenseKernel,
    DenseBias,
    OutputKernel,
    OutputBias,
};

static constexpr std::size_t TENSOR_COUNT = 10;

/// All trainable parameters (or their gradients), indexed by TensorId.
using WeightSet = std::array<Eigen::MatrixXd, TENSOR_COUNT>;

[[nodiscard]] constexpr std::size_t index(TensorId id) noexcept {
    return static_cast<std::size_t>(id);
}

/// Stable serialisation name ("lstm1.kernel", ...).
[[nodiscard]] std::string_view tensor_name(TensorId id) noexcept;

/// Reverse lookup of `tensor_name`.
[[nodiscard]] std::optional<TensorId> tensor_from_name(std::string_view name) noexcept;

// ─── RegressorShape ───────────────────────────────────────────────────────────

struct RegressorShape {
    int input = FEATURE_COUNT;
    int lstm1 = 32;
    int lstm2 = 16;
    int dense = 8;

    /// Expected (rows, cols) of a tensor under this shape.
    [[nodiscard]] std::pair<Eigen::Index, Eigen::Index> dims(TensorId id) const noexcept;

    /// All widths strictly positive.
    [[nodiscard]] bool valid() const noexcept;

    bool operator==(const RegressorShape&) const = default;
};

// ─── SequenceRegressor ────────────────────────────────────────────────────────

class SequenceRegressor {
public:
    /// Freshly initialised network.
    SequenceRegressor(RegressorShape shape, std::uint32_t seed);

    /// Rebuild from persisted weights.
    ///
    /// # Returns
    /// `nullopt` if the shape is invalid, any tensor has the wrong
    /// dimensions, or any weight is non-finite.
    [[nodiscard]] static std::optional<SequenceRegressor>
    from_weights(RegressorShape shape, WeightSet weights);

    /// Forward pass over one sequence (rows = time steps).
    ///
    /// # Returns
    /// - `Some(y)` with y ∈ (0, 1)
    /// - `None` if the sequence is empty, has the wrong column count, or
    ///   the output is non-finite
    [[nodiscard]] std::optional<double> predict(const SequenceMatrix& sequence) const;

    /// Forward + backward pass for loss = scale · (y − target)².
    ///
    /// Adds ∂loss/∂θ into `grads` (which must match `zero_gradients()`).
    ///
    /// # Returns
    /// The unscaled squared error (y − target)², or 0 with `grads` untouched
    /// if the sequence is empty, has the wrong column count, or `grads` does
    /// not match the weight shapes.
    double accumulate_gradient(const SequenceMatrix& sequence,
                               double target,
                               double scale,
                               WeightSet& grads) const;

    /// Zero-filled WeightSet with this network's tensor shapes.
    [[nodiscard]] WeightSet zero_gradients() const;

    [[nodiscard]] const WeightSet& weights() const noexcept;
    [[nodiscard]] WeightSet& weights() noexcept;
    [[nodiscard]] const RegressorShape& shape() const noexcept;

private:
    SequenceRegressor(RegressorShape shape, WeightSet weights) noexcept;

    RegressorShape shape_;
    WeightSet      weights_;
};

// ─── AdamOptimizer ────────────────────────────────────────────────────────────

struct AdamConfig {
    double learning_rate = 1e-3;
    double beta1         = 0.9;
    double beta2         = 0.999;
    double epsilon       = 1e-7;
};

/// Adam with bias-corrected first and second moment estimates.
class AdamOptimizer {
public:
    AdamOptimizer(const WeightSet& like, AdamConfig config = AdamConfig{});

    /// Apply one update step: weights ← weights − lr · m̂ / (√v̂ + ε).
    void step(WeightSet& weights, const WeightSet& grads);

    [[nodiscard]] std::size_t steps() const noexcept;

private:
    AdamConfig  config_;
    WeightSet   m_;
    WeightSet   v_;
    std::size_t t_ = 0;
};

}  // namespace buylimit::forecast
