/// @file src/forecast/lstm_cell.cpp
/// @brief LSTM forward pass and backpropagation-through-time.

#include "lstm_cell.hpp"

namespace buylimit::forecast::detail {

Eigen::VectorXd sigmoid(const Eigen::VectorXd& z) {
    return (1.0 + (-z.array()).exp()).inverse().matrix();
}

// ─── lstm_forward ─────────────────────────────────────────────────────────────

LstmTrace lstm_forward(const Eigen::MatrixXd& kernel,
                       const Eigen::MatrixXd& recurrent,
                       const Eigen::MatrixXd& bias,
                       const std::vector<Eigen::VectorXd>& inputs) {
    const Eigen::Index H = recurrent.cols();

    LstmTrace trace;
    trace.reserve(inputs.size());

    Eigen::VectorXd h = Eigen::VectorXd::Zero(H);
    Eigen::VectorXd c = Eigen::VectorXd::Zero(H);

    for (const auto& x : inputs) {
        const Eigen::VectorXd z = kernel * x + recurrent * h + bias.col(0);

        LstmStep step;
        step.x      = x;
        step.h_prev = h;
        step.c_prev = c;
        step.i      = sigmoid(z.segment(0, H));
        step.f      = sigmoid(z.segment(H, H));
        step.g      = z.segment(2 * H, H).array().tanh().matrix();
        step.o      = sigmoid(z.segment(3 * H, H));
        step.c      = (step.f.array() * c.array() + step.i.array() * step.g.array()).matrix();
        step.tanh_c = step.c.array().tanh().matrix();
        step.h      = (step.o.array() * step.tanh_c.array()).matrix();

        h = step.h;
        c = step.c;
        trace.push_back(std::move(step));
    }
    return trace;
}

std::vector<Eigen::VectorXd> hidden_states(const LstmTrace& trace) {
    std::vector<Eigen::VectorXd> hs;
    hs.reserve(trace.size());
    for (const auto& s : trace) {
        hs.push_back(s.h);
    }
    return hs;
}

// ─── lstm_backward ────────────────────────────────────────────────────────────

std::vector<Eigen::VectorXd> lstm_backward(const Eigen::MatrixXd& kernel,
                                           const Eigen::MatrixXd& recurrent,
                                           const LstmTrace& trace,
                                           const std::vector<Eigen::VectorXd>& dh_external,
                                           Eigen::MatrixXd& d_kernel,
                                           Eigen::MatrixXd& d_recurrent,
                                           Eigen::MatrixXd& d_bias) {
    const Eigen::Index H = recurrent.cols();

    std::vector<Eigen::VectorXd> dx(trace.size());
    Eigen::VectorXd dh_next = Eigen::VectorXd::Zero(H);
    Eigen::VectorXd dc_next = Eigen::VectorXd::Zero(H);

    for (std::size_t k = trace.size(); k-- > 0;) {
        const LstmStep& s = trace[k];

        const Eigen::ArrayXd dh = (dh_external[k] + dh_next).array();
        const Eigen::ArrayXd d_o = dh * s.tanh_c.array();
        const Eigen::ArrayXd dc = dh * s.o.array() * (1.0 - s.tanh_c.array().square())
                                + dc_next.array();

        const Eigen::ArrayXd d_f = dc * s.c_prev.array();
        const Eigen::ArrayXd d_i = dc * s.g.array();
        const Eigen::ArrayXd d_g = dc * s.i.array();

        Eigen::VectorXd dz(4 * H);
        dz.segment(0, H)     = (d_i * s.i.array() * (1.0 - s.i.array())).matrix();
        dz.segment(H, H)     = (d_f * s.f.array() * (1.0 - s.f.array())).matrix();
        dz.segment(2 * H, H) = (d_g * (1.0 - s.g.array().square())).matrix();
        dz.segment(3 * H, H) = (d_o * s.o.array() * (1.0 - s.o.array())).matrix();

        d_kernel.noalias()    += dz * s.x.transpose();
        d_recurrent.noalias() += dz * s.h_prev.transpose();
        d_bias.col(0)         += dz;

        dx[k]   = kernel.transpose() * dz;
        dh_next = recurrent.transpose() * dz;
        dc_next = (dc * s.f.array()).matrix();
    }
    return dx;
}

}  // namespace buylimit::forecast::detail
