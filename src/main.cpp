/// @file src/main.cpp
/// @brief buylimit CLI entry point.
///
/// Usage:
///   buylimit --train <csv_file> [--model <path>]
///   buylimit --recommend <csv_file> --balance <amount> [options]
///   buylimit --profiles
///   buylimit --help
///
/// Log verbosity follows SPDLOG_LEVEL, overridden by --log-level.

#include "buylimit/cli.hpp"
#include "buylimit/engine.hpp"
#include "buylimit/market_data.hpp"
#include "buylimit/risk_profile.hpp"

#include <fmt/core.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>

namespace {

constexpr const char* DEFAULT_MODEL_PATH = "allocation_model.txt";

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  buylimit --train <csv_file> [--model <path>]\n"
        "      Fit the allocation forecaster on the history and save the artifact.\n"
        "  buylimit --recommend <csv_file> --balance <amount> [options]\n"
        "      --holdings <units>     Existing asset holdings (default 0)\n"
        "      --profile <name>       conservative | moderate | aggressive (default moderate)\n"
        "      --first-time           First purchase (applies the profile bonus)\n"
        "      --model <path>         Load a saved model artifact\n"
        "      --retrain              Train on the history before recommending\n"
        "      --price <usd> --fx <rate>  Live quote (default: last CSV row)\n"
        "  buylimit --profiles           List risk profiles\n"
        "  buylimit --help               Show this help\n"
        "\n"
        "Global options:\n"
        "  --log-level <level>   trace | debug | info | warn | error | off\n"
        "  --history-days <n>    Most recent records to use (default {})\n"
        "\n"
        "CSV format (header required):\n"
        "  timestamp,asset_price_usd,fx_rate\n",
        buylimit::constants::DEFAULT_HISTORY_DAYS);
}

using buylimit::cli::Args;

std::optional<buylimit::core::EngineConfig> engine_config(const Args& args) {
    buylimit::core::EngineConfig config;
    const auto days = buylimit::cli::history_days(args);
    if (days.error) {
        fmt::print(stderr, "Error: {}\n", *days.error);
        return std::nullopt;
    }
    if (days.value) {
        config.history_days = *days.value;
    }
    return config;
}

int run_profiles() {
    const auto& table = buylimit::sizing::RiskProfileTable::canonical();
    for (const auto profile : buylimit::sizing::ALL_RISK_PROFILES) {
        const auto c = table.find(profile);
        if (!c) continue;
        fmt::print("{:<13} {}\n", buylimit::sizing::to_string(profile),
                   buylimit::sizing::describe(profile));
        fmt::print("              max_alloc={:.2f} vol_penalty={:.2f} max_trade={:.2f} "
                   "first_time_bonus={:.2f} fallback={:.2f}\n",
                   c->max_crypto_allocation, c->volatility_penalty, c->max_single_trade,
                   c->first_time_bonus, c->flat_fallback);
    }
    return 0;
}

int run_train(const Args& args) {
    const auto csv = args.positional();
    if (!csv) {
        fmt::print(stderr, "Error: --train requires a CSV file path\n");
        return 1;
    }
    const auto config = engine_config(args);
    if (!config) return 1;

    auto provider = std::make_shared<buylimit::core::CsvMarketDataProvider>(*csv);
    buylimit::core::Engine engine(provider, *config);

    const auto report = engine.retrain();
    fmt::print("{}\n", report.to_string());
    if (!report.model_trained) {
        fmt::print(stderr, "Error: not enough history to train a model from '{}'\n", *csv);
        return 1;
    }

    const std::string model_path = args.value("--model").value_or(DEFAULT_MODEL_PATH);
    if (!engine.save_model(model_path)) {
        fmt::print(stderr, "Error: cannot write model artifact '{}'\n", model_path);
        return 1;
    }
    fmt::print("Saved model to '{}'\n", model_path);
    return 0;
}

int run_recommend(const Args& args) {
    const auto csv = args.positional();
    if (!csv) {
        fmt::print(stderr, "Error: --recommend requires a CSV file path\n");
        return 1;
    }
    const auto config = engine_config(args);
    if (!config) return 1;

    const auto balance = args.number("--balance");
    if (!balance) {
        fmt::print(stderr, "Error: --balance <amount> is required\n");
        return 1;
    }

    double holdings = 0.0;
    if (const auto h = args.value("--holdings")) {
        const auto v = buylimit::cli::parse_number(*h);
        if (!v) {
            fmt::print(stderr, "Error: invalid --holdings '{}'\n", *h);
            return 1;
        }
        holdings = *v;
    }

    const std::string profile_name = args.value("--profile").value_or("moderate");
    const auto profile = buylimit::sizing::parse_risk_profile(profile_name);
    if (!profile) {
        fmt::print(stderr, "Error: unknown risk profile '{}'\n", profile_name);
        return 1;
    }

    const auto live = buylimit::cli::live_quote(args);
    if (live.error) {
        fmt::print(stderr, "Error: {}\n", *live.error);
        return 1;
    }

    auto provider = std::make_shared<buylimit::core::CsvMarketDataProvider>(*csv, live.value);
    buylimit::core::Engine engine(provider, *config);

    if (args.flag("--retrain")) {
        fmt::print("{}\n", engine.retrain().to_string());
    } else if (const auto model_path = args.value("--model")) {
        if (!engine.load_model(*model_path)) {
            fmt::print(stderr, "Warning: model '{}' unavailable; using fallback allocation\n",
                       *model_path);
        }
    }

    const auto rec = engine.recommend_limit(buylimit::core::LimitRequest{
        .spending_balance  = *balance,
        .existing_holdings = holdings,
        .is_first_purchase = args.flag("--first-time"),
        .risk_profile      = *profile,
    });
    if (!rec) {
        fmt::print(stderr, "Error: request rejected (balance must be > 0, holdings >= 0)\n");
        return 1;
    }
    fmt::print("{}", rec->to_string());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    spdlog::cfg::load_env_levels();

    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);
    const Args args(argc, argv);

    if (const auto level = args.value("--log-level")) {
        spdlog::set_level(spdlog::level::from_str(*level));
    }

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }
    if (mode == "--profiles") {
        return run_profiles();
    }
    if (mode == "--train") {
        return run_train(args);
    }
    if (mode == "--recommend") {
        return run_recommend(args);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
