/// @file src/forecast/sequence_regressor.cpp
/// @brief SequenceRegressor forward/backward passes and AdamOptimizer.

#include "buylimit/regressor.hpp"
#include "lstm_cell.hpp"

#include <cmath>
#include <random>

namespace buylimit::forecast {

namespace {

constexpr std::array<std::string_view, TENSOR_COUNT> TENSOR_NAMES{
    "lstm1.kernel", "lstm1.recurrent", "lstm1.bias",
    "lstm2.kernel", "lstm2.recurrent", "lstm2.bias",
    "dense.kernel", "dense.bias",
    "output.kernel", "output.bias",
};

/// Glorot-uniform matrix: U(−l, l), l = √(6 / (fan_in + fan_out)).
Eigen::MatrixXd glorot(Eigen::Index rows, Eigen::Index cols, std::mt19937& rng) {
    const double limit = std::sqrt(6.0 / static_cast<double>(rows + cols));
    std::uniform_real_distribution<double> dist(-limit, limit);
    Eigen::MatrixXd m(rows, cols);
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            m(r, c) = dist(rng);
        }
    }
    return m;
}

/// Zero bias for a 4H LSTM block with the forget slice set to 1.
Eigen::MatrixXd lstm_bias(int hidden) {
    Eigen::MatrixXd b = Eigen::MatrixXd::Zero(4 * hidden, 1);
    b.block(hidden, 0, hidden, 1).setOnes();
    return b;
}

std::vector<Eigen::VectorXd> rows_as_steps(const SequenceMatrix& sequence) {
    std::vector<Eigen::VectorXd> steps;
    steps.reserve(static_cast<std::size_t>(sequence.rows()));
    for (Eigen::Index t = 0; t < sequence.rows(); ++t) {
        steps.push_back(sequence.row(t).transpose());
    }
    return steps;
}

}  // namespace

// ─── Tensor names ─────────────────────────────────────────────────────────────

std::string_view tensor_name(TensorId id) noexcept {
    return TENSOR_NAMES[index(id)];
}

std::optional<TensorId> tensor_from_name(std::string_view name) noexcept {
    for (std::size_t k = 0; k < TENSOR_COUNT; ++k) {
        if (TENSOR_NAMES[k] == name) {
            return static_cast<TensorId>(k);
        }
    }
    return std::nullopt;
}

// ─── RegressorShape ───────────────────────────────────────────────────────────

std::pair<Eigen::Index, Eigen::Index> RegressorShape::dims(TensorId id) const noexcept {
    switch (id) {
        case TensorId::Lstm1Kernel:    return {4 * lstm1, input};
        case TensorId::Lstm1Recurrent: return {4 * lstm1, lstm1};
        case TensorId::Lstm1Bias:      return {4 * lstm1, 1};
        case TensorId::Lstm2Kernel:    return {4 * lstm2, lstm1};
        case TensorId::Lstm2Recurrent: return {4 * lstm2, lstm2};
        case TensorId::Lstm2Bias:      return {4 * lstm2, 1};
        case TensorId::DenseKernel:    return {dense, lstm2};
        case TensorId::DenseBias:      return {dense, 1};
        case TensorId::OutputKernel:   return {1, dense};
        case TensorId::OutputBias:     return {1, 1};
    }
    return {0, 0};
}

bool RegressorShape::valid() const noexcept {
    return input > 0 && lstm1 > 0 && lstm2 > 0 && dense > 0;
}

// ─── SequenceRegressor construction ───────────────────────────────────────────

SequenceRegressor::SequenceRegressor(RegressorShape shape, WeightSet weights) noexcept
    : shape_(shape)
    , weights_(std::move(weights))
{}

SequenceRegressor::SequenceRegressor(RegressorShape shape, std::uint32_t seed)
    : shape_(shape)
{
    std::mt19937 rng(seed);
    for (std::size_t k = 0; k < TENSOR_COUNT; ++k) {
        const auto id = static_cast<TensorId>(k);
        const auto [rows, cols] = shape_.dims(id);
        switch (id) {
            case TensorId::Lstm1Bias:
                weights_[k] = lstm_bias(shape_.lstm1);
                break;
            case TensorId::Lstm2Bias:
                weights_[k] = lstm_bias(shape_.lstm2);
                break;
            case TensorId::DenseBias:
            case TensorId::OutputBias:
                weights_[k] = Eigen::MatrixXd::Zero(rows, cols);
                break;
            default:
                weights_[k] = glorot(rows, cols, rng);
                break;
        }
    }
}

std::optional<SequenceRegressor>
SequenceRegressor::from_weights(RegressorShape shape, WeightSet weights) {
    if (!shape.valid()) {
        return std::nullopt;
    }
    for (std::size_t k = 0; k < TENSOR_COUNT; ++k) {
        const auto [rows, cols] = shape.dims(static_cast<TensorId>(k));
        if (weights[k].rows() != rows || weights[k].cols() != cols) {
            return std::nullopt;
        }
        if (!weights[k].allFinite()) {
            return std::nullopt;
        }
    }
    return SequenceRegressor(shape, std::move(weights));
}

WeightSet SequenceRegressor::zero_gradients() const {
    WeightSet g;
    for (std::size_t k = 0; k < TENSOR_COUNT; ++k) {
        g[k] = Eigen::MatrixXd::Zero(weights_[k].rows(), weights_[k].cols());
    }
    return g;
}

const WeightSet& SequenceRegressor::weights() const noexcept { return weights_; }
WeightSet& SequenceRegressor::weights() noexcept { return weights_; }
const RegressorShape& SequenceRegressor::shape() const noexcept { return shape_; }

// ─── Forward ──────────────────────────────────────────────────────────────────

std::optional<double> SequenceRegressor::predict(const SequenceMatrix& sequence) const {
    if (sequence.rows() == 0 || sequence.cols() != shape_.input) {
        return std::nullopt;
    }
    const auto& w = weights_;

    const auto trace1 = detail::lstm_forward(w[index(TensorId::Lstm1Kernel)],
                                             w[index(TensorId::Lstm1Recurrent)],
                                             w[index(TensorId::Lstm1Bias)],
                                             rows_as_steps(sequence));
    const auto trace2 = detail::lstm_forward(w[index(TensorId::Lstm2Kernel)],
                                             w[index(TensorId::Lstm2Recurrent)],
                                             w[index(TensorId::Lstm2Bias)],
                                             detail::hidden_states(trace1));

    const Eigen::VectorXd dense =
        (w[index(TensorId::DenseKernel)] * trace2.back().h
         + w[index(TensorId::DenseBias)].col(0)).array().tanh().matrix();
    const double logit = (w[index(TensorId::OutputKernel)] * dense)(0)
                       + w[index(TensorId::OutputBias)](0, 0);
    const double y = 1.0 / (1.0 + std::exp(-logit));

    if (!std::isfinite(y)) {
        return std::nullopt;
    }
    return y;
}

// ─── Backward ─────────────────────────────────────────────────────────────────

double SequenceRegressor::accumulate_gradient(const SequenceMatrix& sequence,
                                              double target,
                                              double scale,
                                              WeightSet& grads) const {
    if (sequence.rows() == 0 || sequence.cols() != shape_.input) {
        return 0.0;
    }
    for (std::size_t k = 0; k < TENSOR_COUNT; ++k) {
        if (grads[k].rows() != weights_[k].rows() || grads[k].cols() != weights_[k].cols()) {
            return 0.0;
        }
    }
    const auto& w = weights_;

    // Forward, keeping every activation.
    const auto trace1 = detail::lstm_forward(w[index(TensorId::Lstm1Kernel)],
                                             w[index(TensorId::Lstm1Recurrent)],
                                             w[index(TensorId::Lstm1Bias)],
                                             rows_as_steps(sequence));
    const auto h1 = detail::hidden_states(trace1);
    const auto trace2 = detail::lstm_forward(w[index(TensorId::Lstm2Kernel)],
                                             w[index(TensorId::Lstm2Recurrent)],
                                             w[index(TensorId::Lstm2Bias)],
                                             h1);
    const Eigen::VectorXd& h2 = trace2.back().h;

    const Eigen::VectorXd dense =
        (w[index(TensorId::DenseKernel)] * h2
         + w[index(TensorId::DenseBias)].col(0)).array().tanh().matrix();
    const double logit = (w[index(TensorId::OutputKernel)] * dense)(0)
                       + w[index(TensorId::OutputBias)](0, 0);
    const double y = 1.0 / (1.0 + std::exp(-logit));

    const double err = y - target;

    // Output unit: ∂L/∂logit = 2·scale·err · y(1 − y).
    const double d_logit = 2.0 * scale * err * y * (1.0 - y);
    grads[index(TensorId::OutputKernel)].noalias() += d_logit * dense.transpose();
    grads[index(TensorId::OutputBias)](0, 0) += d_logit;

    // Dense tanh layer.
    const Eigen::VectorXd d_dense =
        w[index(TensorId::OutputKernel)].transpose() * d_logit;
    const Eigen::VectorXd d_pre =
        (d_dense.array() * (1.0 - dense.array().square())).matrix();
    grads[index(TensorId::DenseKernel)].noalias() += d_pre * h2.transpose();
    grads[index(TensorId::DenseBias)].col(0) += d_pre;

    // Second LSTM: gradient enters at the last step only.
    std::vector<Eigen::VectorXd> dh2(trace2.size(), Eigen::VectorXd::Zero(shape_.lstm2));
    dh2.back() = w[index(TensorId::DenseKernel)].transpose() * d_pre;
    const auto dh1 = detail::lstm_backward(w[index(TensorId::Lstm2Kernel)],
                                           w[index(TensorId::Lstm2Recurrent)],
                                           trace2, dh2,
                                           grads[index(TensorId::Lstm2Kernel)],
                                           grads[index(TensorId::Lstm2Recurrent)],
                                           grads[index(TensorId::Lstm2Bias)]);

    // First LSTM: every step receives the second layer's input gradient.
    static_cast<void>(detail::lstm_backward(w[index(TensorId::Lstm1Kernel)],
                                            w[index(TensorId::Lstm1Recurrent)],
                                            trace1, dh1,
                                            grads[index(TensorId::Lstm1Kernel)],
                                            grads[index(TensorId::Lstm1Recurrent)],
                                            grads[index(TensorId::Lstm1Bias)]));

    return err * err;
}

// ─── AdamOptimizer ────────────────────────────────────────────────────────────

AdamOptimizer::AdamOptimizer(const WeightSet& like, AdamConfig config)
    : config_(config)
{
    for (std::size_t k = 0; k < TENSOR_COUNT; ++k) {
        m_[k] = Eigen::MatrixXd::Zero(like[k].rows(), like[k].cols());
        v_[k] = Eigen::MatrixXd::Zero(like[k].rows(), like[k].cols());
    }
}

void AdamOptimizer::step(WeightSet& weights, const WeightSet& grads) {
    ++t_;
    const double t = static_cast<double>(t_);
    const double bc1 = 1.0 - std::pow(config_.beta1, t);
    const double bc2 = 1.0 - std::pow(config_.beta2, t);

    for (std::size_t k = 0; k < TENSOR_COUNT; ++k) {
        m_[k] = config_.beta1 * m_[k] + (1.0 - config_.beta1) * grads[k];
        v_[k] = config_.beta2 * v_[k]
              + (1.0 - config_.beta2) * grads[k].cwiseProduct(grads[k]);

        const Eigen::ArrayXXd m_hat = m_[k].array() / bc1;
        const Eigen::ArrayXXd v_hat = v_[k].array() / bc2;
        weights[k].array() -= config_.learning_rate * m_hat / (v_hat.sqrt() + config_.epsilon);
    }
}

std::size_t AdamOptimizer::steps() const noexcept {
    return t_;
}

}  // namespace buylimit::forecast
