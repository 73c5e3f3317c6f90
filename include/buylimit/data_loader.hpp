#pragma once

/// @file include/buylimit/data_loader.hpp
/// @brief CSV loader for asset-price / fx-rate history.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files of market history into a `PriceSeries`. Malformed or
/// non-finite rows are skipped; rows whose timestamp does not strictly
/// increase (duplicates, out-of-order) are dropped so the series invariant
/// holds for every downstream stage.
///
/// ## Expected CSV Format
/// ```
/// timestamp,asset_price_usd,fx_rate
/// 1704067200,42000.5,83.12
/// 1704153600,42810.0,83.10
/// ```
/// The first non-comment line is treated as a header and skipped.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when the file cannot be opened
/// - Output timestamps are strictly increasing
/// - Does not modify any file or external state

#include "buylimit/types.hpp"

#include <optional>
#include <string>

namespace buylimit::core {

class DataLoader {
public:
    /// Load a PriceSeries from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty series if the file has a header but no valid rows
    /// - Parsed series otherwise
    [[nodiscard]] static std::optional<PriceSeries>
    load_csv(const std::string& filepath) noexcept;

    /// Parse a CSV-formatted string (same format as `load_csv`).
    [[nodiscard]] static PriceSeries
    parse_csv_string(const std::string& csv_content) noexcept;

    /// A record is valid if every field is finite and both price and rate
    /// are strictly positive.
    [[nodiscard]] static bool validate_record(const PriceRecord& record) noexcept;

private:
    /// Parse one data row; `nullopt` if malformed or invalid.
    [[nodiscard]] static std::optional<PriceRecord>
    parse_row(const std::string& line) noexcept;
};

}  // namespace buylimit::core
