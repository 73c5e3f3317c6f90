/// @file src/forecast/model_artifact.cpp
/// @brief ModelArtifact — text persistence of scalers and regressor weights.

#include "buylimit/forecast.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace buylimit::forecast {

namespace {

// ─── Writing ──────────────────────────────────────────────────────────────────

void append_vector(std::string& out, const Eigen::VectorXd& v) {
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        fmt::format_to(std::back_inserter(out), " {}", v(i));
    }
}

void append_scaler(std::string& out, std::string_view tag, const sequence::MinMaxScaler& s) {
    fmt::format_to(std::back_inserter(out), "{} {}", tag, s.columns());
    append_vector(out, s.min());
    append_vector(out, s.max());
    out += '\n';
}

// ─── Reading ──────────────────────────────────────────────────────────────────

/// Whitespace token reader over the artifact text. Every read reports
/// failure through its return value; nothing throws on malformed input.
class TokenReader {
public:
    explicit TokenReader(std::string_view text) : in_(std::string(text)) {}

    [[nodiscard]] bool expect(std::string_view keyword) {
        std::string tok;
        return static_cast<bool>(in_ >> tok) && tok == keyword;
    }

    [[nodiscard]] std::optional<std::string> word() {
        std::string tok;
        if (!(in_ >> tok)) return std::nullopt;
        return tok;
    }

    [[nodiscard]] std::optional<long long> integer() {
        long long v = 0;
        if (!(in_ >> v)) return std::nullopt;
        return v;
    }

    [[nodiscard]] std::optional<double> real() {
        double v = 0.0;
        if (!(in_ >> v) || !std::isfinite(v)) return std::nullopt;
        return v;
    }

    [[nodiscard]] bool at_end() {
        std::string tok;
        return !(in_ >> tok);
    }

private:
    std::istringstream in_;
};

std::optional<Eigen::VectorXd> read_vector(TokenReader& r, Eigen::Index n) {
    Eigen::VectorXd v(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto x = r.real();
        if (!x) return std::nullopt;
        v(i) = *x;
    }
    return v;
}

std::optional<sequence::MinMaxScaler>
read_scaler(TokenReader& r, std::string_view tag, Eigen::Index expected_cols) {
    if (!r.expect(tag)) return std::nullopt;
    const auto cols = r.integer();
    if (!cols || *cols != expected_cols) return std::nullopt;
    auto lo = read_vector(r, expected_cols);
    auto hi = read_vector(r, expected_cols);
    if (!lo || !hi) return std::nullopt;
    return sequence::MinMaxScaler::from_bounds(std::move(*lo), std::move(*hi));
}

std::optional<std::size_t> read_count(TokenReader& r) {
    const auto v = r.integer();
    if (!v || *v < 0) return std::nullopt;
    return static_cast<std::size_t>(*v);
}

}  // namespace

// ─── serialize ────────────────────────────────────────────────────────────────

std::string ModelArtifact::serialize(const AllocationModel& model) {
    std::string out;
    auto it = std::back_inserter(out);

    const auto& shape = model.regressor.shape();
    const auto& rep   = model.report;

    fmt::format_to(it, "{} {}\n", MAGIC, VERSION);
    fmt::format_to(it, "window {}\n", model.window);
    fmt::format_to(it, "shape {} {} {} {}\n", shape.input, shape.lstm1, shape.lstm2, shape.dense);
    fmt::format_to(it, "label_bounds {} {}\n", model.label_lower_bound, model.label_upper_bound);
    fmt::format_to(it, "report {} {} {} {} {} {} {} {} {}\n",
                   rep.model_trained ? 1 : 0, rep.windows, rep.train_windows,
                   rep.validation_windows, rep.epochs_run, rep.best_epoch,
                   rep.best_validation_loss, rep.baseline_mae, rep.model_mae);
    append_scaler(out, "feature_scaler", model.feature_scaler);
    append_scaler(out, "target_scaler", model.target_scaler);

    const auto& weights = model.regressor.weights();
    for (std::size_t k = 0; k < TENSOR_COUNT; ++k) {
        const auto& m = weights[k];
        fmt::format_to(it, "tensor {} {} {}", tensor_name(static_cast<TensorId>(k)),
                       m.rows(), m.cols());
        for (Eigen::Index r = 0; r < m.rows(); ++r) {
            for (Eigen::Index c = 0; c < m.cols(); ++c) {
                fmt::format_to(it, " {}", m(r, c));
            }
        }
        out += '\n';
    }
    out += "end\n";
    return out;
}

// ─── parse ────────────────────────────────────────────────────────────────────

std::optional<AllocationModel>
ModelArtifact::parse(std::string_view text, const ForecasterConfig& expected) {
    TokenReader r(text);

    if (!r.expect(MAGIC)) return std::nullopt;
    const auto version = r.integer();
    if (!version || *version != VERSION) {
        spdlog::warn("[Artifact] unsupported artifact version");
        return std::nullopt;
    }

    if (!r.expect("window")) return std::nullopt;
    const auto window = read_count(r);
    if (!window || *window != expected.window) {
        spdlog::warn("[Artifact] window does not match configuration ({})", expected.window);
        return std::nullopt;
    }

    if (!r.expect("shape")) return std::nullopt;
    RegressorShape shape{};
    {
        const auto in = r.integer();
        const auto l1 = r.integer();
        const auto l2 = r.integer();
        const auto dn = r.integer();
        if (!in || !l1 || !l2 || !dn) return std::nullopt;
        shape = RegressorShape{.input = static_cast<int>(*in), .lstm1 = static_cast<int>(*l1),
                               .lstm2 = static_cast<int>(*l2), .dense = static_cast<int>(*dn)};
    }
    if (!(shape == expected.shape)) {
        spdlog::warn("[Artifact] network shape does not match configuration");
        return std::nullopt;
    }

    if (!r.expect("label_bounds")) return std::nullopt;
    const auto lower = r.real();
    const auto upper = r.real();
    if (!lower || !upper) return std::nullopt;

    if (!r.expect("report")) return std::nullopt;
    TrainReport report;
    {
        const auto trained    = r.integer();
        const auto windows    = read_count(r);
        const auto train      = read_count(r);
        const auto validation = read_count(r);
        const auto epochs     = read_count(r);
        const auto best_epoch = read_count(r);
        const auto best_loss  = r.real();
        const auto baseline   = r.real();
        const auto model_mae  = r.real();
        if (!trained || !windows || !train || !validation || !epochs || !best_epoch ||
            !best_loss || !baseline || !model_mae) {
            return std::nullopt;
        }
        report = TrainReport{
            .model_trained        = *trained != 0,
            .windows              = *windows,
            .train_windows        = *train,
            .validation_windows   = *validation,
            .epochs_run           = *epochs,
            .best_epoch           = *best_epoch,
            .best_validation_loss = *best_loss,
            .baseline_mae         = *baseline,
            .model_mae            = *model_mae,
        };
    }

    auto feature_scaler = read_scaler(r, "feature_scaler", shape.input);
    auto target_scaler  = read_scaler(r, "target_scaler", 1);
    if (!feature_scaler || !target_scaler) return std::nullopt;

    WeightSet weights;
    std::array<bool, TENSOR_COUNT> seen{};
    for (std::size_t k = 0; k < TENSOR_COUNT; ++k) {
        if (!r.expect("tensor")) return std::nullopt;
        const auto name = r.word();
        if (!name) return std::nullopt;
        const auto id = tensor_from_name(*name);
        if (!id || seen[index(*id)]) return std::nullopt;
        seen[index(*id)] = true;

        // Dimensions are checked before anything is allocated.
        const auto [rows, cols] = shape.dims(*id);
        const auto file_rows = r.integer();
        const auto file_cols = r.integer();
        if (!file_rows || !file_cols || *file_rows != rows || *file_cols != cols) {
            return std::nullopt;
        }

        Eigen::MatrixXd m(rows, cols);
        for (Eigen::Index i = 0; i < rows; ++i) {
            for (Eigen::Index j = 0; j < cols; ++j) {
                const auto v = r.real();
                if (!v) return std::nullopt;
                m(i, j) = *v;
            }
        }
        weights[index(*id)] = std::move(m);
    }

    if (!r.expect("end") || !r.at_end()) return std::nullopt;

    auto regressor = SequenceRegressor::from_weights(shape, std::move(weights));
    if (!regressor) return std::nullopt;

    return AllocationModel{
        .feature_scaler    = std::move(*feature_scaler),
        .target_scaler     = std::move(*target_scaler),
        .regressor         = std::move(*regressor),
        .window            = *window,
        .label_lower_bound = *lower,
        .label_upper_bound = *upper,
        .report            = report,
    };
}

// ─── save / load ──────────────────────────────────────────────────────────────

bool ModelArtifact::save(const AllocationModel& model, const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            spdlog::error("[Artifact] cannot create '{}': {}", path.parent_path().string(), ec.message());
            return false;
        }
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            spdlog::error("[Artifact] cannot open '{}' for writing", tmp.string());
            return false;
        }
        file << serialize(model);
        file.flush();
        if (!file) {
            spdlog::error("[Artifact] write to '{}' failed", tmp.string());
            return false;
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        spdlog::error("[Artifact] rename to '{}' failed: {}", path.string(), ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }
    spdlog::info("[Artifact] saved model to '{}'", path.string());
    return true;
}

std::optional<AllocationModel>
ModelArtifact::load(const std::filesystem::path& path, const ForecasterConfig& expected) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("[Artifact] no artifact at '{}'", path.string());
        return std::nullopt;
    }
    const std::string contents((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());

    auto model = parse(contents, expected);
    if (!model) {
        spdlog::warn("[Artifact] '{}' is corrupt or incompatible", path.string());
    }
    return model;
}

}  // namespace buylimit::forecast
