#pragma once

/// @file src/forecast/lstm_cell.hpp
/// @brief Single-layer LSTM forward pass with cached activations and
///        backpropagation-through-time.
///
/// Per step, with z = W·x + U·h_prev + b split into four H-blocks:
///   i = σ(z_i)   f = σ(z_f)   g = tanh(z_g)   o = σ(z_o)
///   c = f ⊙ c_prev + i ⊙ g
///   h = o ⊙ tanh(c)

#include <Eigen/Dense>

#include <vector>

namespace buylimit::forecast::detail {

/// Activations cached for one time step.
struct LstmStep {
    Eigen::VectorXd x;
    Eigen::VectorXd h_prev;
    Eigen::VectorXd c_prev;
    Eigen::VectorXd i;
    Eigen::VectorXd f;
    Eigen::VectorXd g;
    Eigen::VectorXd o;
    Eigen::VectorXd c;
    Eigen::VectorXd tanh_c;
    Eigen::VectorXd h;
};

using LstmTrace = std::vector<LstmStep>;

/// Elementwise logistic sigmoid.
[[nodiscard]] Eigen::VectorXd sigmoid(const Eigen::VectorXd& z);

/// Run the layer over `inputs` starting from zero state.
[[nodiscard]] LstmTrace lstm_forward(const Eigen::MatrixXd& kernel,
                                     const Eigen::MatrixXd& recurrent,
                                     const Eigen::MatrixXd& bias,
                                     const std::vector<Eigen::VectorXd>& inputs);

/// Hidden states of a trace, oldest first.
[[nodiscard]] std::vector<Eigen::VectorXd> hidden_states(const LstmTrace& trace);

/// Backpropagate through a trace.
///
/// `dh_external[t]` is ∂loss/∂h_t arriving from above (zeros where none).
/// Gradients are accumulated into d_kernel / d_recurrent / d_bias.
///
/// # Returns
/// ∂loss/∂x_t for every step.
std::vector<Eigen::VectorXd> lstm_backward(const Eigen::MatrixXd& kernel,
                                           const Eigen::MatrixXd& recurrent,
                                           const LstmTrace& trace,
                                           const std::vector<Eigen::VectorXd>& dh_external,
                                           Eigen::MatrixXd& d_kernel,
                                           Eigen::MatrixXd& d_recurrent,
                                           Eigen::MatrixXd& d_bias);

}  // namespace buylimit::forecast::detail
