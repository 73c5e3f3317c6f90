/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for asset-price / fx-rate history.

#include "buylimit/data_loader.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace buylimit::core {

namespace {

constexpr std::size_t FIELD_COUNT = 3;

}  // namespace

// ─── DataLoader::validate_record ──────────────────────────────────────────────

bool DataLoader::validate_record(const PriceRecord& record) noexcept {
    if (!std::isfinite(record.timestamp)       ||
        !std::isfinite(record.asset_price_usd) ||
        !std::isfinite(record.fx_rate)) {
        return false;
    }
    return record.asset_price_usd > 0.0 && record.fx_rate > 0.0;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<PriceRecord>
DataLoader::parse_row(const std::string& line) noexcept {
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    std::istringstream ss(line);
    std::string token;
    std::vector<double> fields;
    fields.reserve(FIELD_COUNT);

    while (std::getline(ss, token, ',')) {
        const auto first = token.find_first_not_of(" \t\r\n");
        const auto last  = token.find_last_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return std::nullopt;  // empty token
        }
        token = token.substr(first, last - first + 1);

        double val = 0.0;
        try {
            std::size_t pos = 0;
            val = std::stod(token, &pos);
            if (pos != token.size()) {
                return std::nullopt;  // trailing garbage
            }
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }

        fields.push_back(val);
    }

    if (fields.size() != FIELD_COUNT) {
        return std::nullopt;
    }

    PriceRecord record{
        .timestamp       = fields[0],
        .asset_price_usd = fields[1],
        .fx_rate         = fields[2],
    };

    if (!validate_record(record)) {
        return std::nullopt;
    }
    return record;
}

// ─── DataLoader::parse_csv_string ─────────────────────────────────────────────

PriceSeries DataLoader::parse_csv_string(const std::string& csv_content) noexcept {
    PriceSeries series;
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;
    std::size_t skipped = 0;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!header_skipped) {
            if (!line.empty() && line[0] != '#') {
                header_skipped = true;
            }
            continue;
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto record = parse_row(line);
        if (!record) {
            ++skipped;
            continue;
        }
        // Duplicate or out-of-order timestamps break the series invariant.
        if (!series.empty() && record->timestamp <= series.back().timestamp) {
            ++skipped;
            continue;
        }
        series.push_back(*record);
    }

    if (skipped > 0) {
        spdlog::warn("[DataLoader] skipped {} invalid or out-of-order rows", skipped);
    }
    return series;
}

// ─── DataLoader::load_csv ─────────────────────────────────────────────────────

std::optional<PriceSeries>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string contents;
    std::string line;
    while (std::getline(file, line)) {
        contents += line;
        contents += '\n';
    }

    return parse_csv_string(contents);
}

}  // namespace buylimit::core
