#pragma once

/// @file include/rebal/price_loader.hpp
/// @brief Long-format CSV loader producing a finalized PriceTable.
///
/// # Module: PriceLoader
///
/// ## Expected CSV Format
/// ```
/// date,asset,price,volume
/// 2020-01-02,AAPL,75.09,135480400
/// 2020-01-02,MSFT,160.62,
/// ```
/// The header is required and names the columns; `date`, `asset` and `price`
/// are mandatory, `volume` is optional. Column order is free and header names
/// are matched case-insensitively (`ticker` / `symbol` are accepted for
/// `asset`, `close` for `price`).
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors
/// - Skips individual bad rows rather than failing the entire load
/// - Does not modify any file or external state

#include "rebal/price_table.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace rebal::core {

/// Outcome of a load: the finalized table plus row accounting.
struct LoadResult {
    PriceTable  table;
    std::size_t rows_accepted = 0;
    std::size_t rows_skipped  = 0;  ///< Malformed, non-finite or non-positive rows
};

class PriceLoader {
public:
    /// Load observations from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened or the header lacks a
    ///   mandatory column
    /// - A result with an empty table if the file holds no valid rows
    [[nodiscard]] static std::optional<LoadResult>
    load_csv(const std::string& filepath) noexcept;

    /// Parse observations from CSV text (same format as `load_csv`).
    [[nodiscard]] static std::optional<LoadResult>
    parse_csv_string(const std::string& csv_content) noexcept;
};

}  // namespace rebal::core
