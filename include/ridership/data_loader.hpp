#pragma once

/// @file include/ridership/data_loader.hpp
/// @brief CSV loaders for cleaned readings and topology side tables.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse the canonical CSV files handed over by the upstream cleaner into
/// Readings, registering every device and station in a NetworkTopology as it
/// goes. Malformed rows are skipped and counted; the loader never crashes on
/// bad input.
///
/// ## Expected CSV Formats
/// Header row required; columns may appear in any order, names are
/// case-insensitive, extra columns are ignored.
/// ```
/// control_area,unit,subunit,station,line_names,timestamp,net_increment
/// A002,R051,02-00-00,59 ST,NQR456W,2020-06-20 00:00:00,0
/// A002,R051,02-00-00,59 ST,NQR456W,2020-06-20 04:00:00,13
/// ```
/// ```
/// station,line_names,complex_id
/// 59 ST,NQR456W,613
/// ```
/// ```
/// station,line_names,device_count
/// 59 ST,NQR456W,12
/// ```
/// `timestamp` is epoch seconds or `YYYY-MM-DD HH:MM:SS` (UTC).
/// `net_increment` must be a non-negative integer.
///
/// ## Guarantees
/// - Never throws; `load_*` return `nullopt` only when the file cannot be opened
/// - A missing required column makes every row count as skipped
/// - Blank lines and lines starting with `#` are ignored

#include "ridership/topology.hpp"
#include "ridership/types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ridership::core {

/// Row accounting for one load.
struct LoadStats {
    std::size_t rows_read{0};     ///< Data rows seen (header excluded)
    std::size_t rows_skipped{0};  ///< Rows rejected as malformed
};

struct ReadingsLoad {
    std::vector<Reading> readings;
    LoadStats            stats;
};

class DataLoader {
public:
    /// Load readings from a CSV file, registering keys in `topology`.
    [[nodiscard]] static std::optional<ReadingsLoad>
    load_readings_csv(const std::string& filepath, NetworkTopology& topology) noexcept;

    /// Parse readings from CSV text (useful for testing).
    [[nodiscard]] static ReadingsLoad
    parse_readings_string(const std::string& csv_content, NetworkTopology& topology) noexcept;

    /// Load station → complex memberships. Unknown stations are registered.
    [[nodiscard]] static std::optional<LoadStats>
    load_complexes_csv(const std::string& filepath, NetworkTopology& topology) noexcept;

    [[nodiscard]] static LoadStats
    parse_complexes_string(const std::string& csv_content, NetworkTopology& topology) noexcept;

    /// Load declared station device counts. Unknown stations are registered.
    [[nodiscard]] static std::optional<LoadStats>
    load_device_counts_csv(const std::string& filepath, NetworkTopology& topology) noexcept;

    [[nodiscard]] static LoadStats
    parse_device_counts_string(const std::string& csv_content, NetworkTopology& topology) noexcept;

private:
    /// Called with the fields of one data row and the positions of the
    /// required columns. Returns false to count the row as skipped.
    using RowHandler = std::function<bool(const std::vector<std::string>& fields,
                                          const std::vector<std::size_t>& columns)>;

    /// Walk the data rows of `csv_content`, resolving `required` column names
    /// against the header row.
    [[nodiscard]] static LoadStats
    parse_table(const std::string& csv_content,
                const std::vector<std::string>& required,
                const RowHandler& handle);

    /// Split a CSV line on commas, honouring double-quoted fields, and trim
    /// surrounding whitespace from every field.
    [[nodiscard]] static std::vector<std::string> split_row(const std::string& line);

    /// Index of `name` in `header` (case-insensitive).
    [[nodiscard]] static std::optional<std::size_t>
    find_column(const std::vector<std::string>& header, const std::string& name);

    /// Read a whole file into a string; `nullopt` if it cannot be opened.
    [[nodiscard]] static std::optional<std::string> read_file(const std::string& filepath);
};

}  // namespace ridership::core
