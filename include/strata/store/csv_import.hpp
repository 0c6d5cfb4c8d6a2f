#pragma once

#include <strata/core/error.hpp>
#include <strata/core/table.hpp>
#include <strata/store/column_store.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>

namespace strata::store {

struct CsvOptions {
    char separator = ',';
    /// Empty cells read as null.
    bool null_if_empty = true;
    /// Further cell texts that read as null, e.g. "NA".
    std::unordered_set<std::string> null_tokens;
    /// Store low-cardinality text columns as Categorical.
    bool detect_categorical = true;
};

/// Parse a null specification such as "<empty>,NA" into options.
[[nodiscard]] auto parse_null_spec(std::string_view spec) -> CsvOptions;

/// Read an RFC 4180 CSV file with a header row into a table named after
/// `path`, split into batches of at most `chunk_size` rows.
///
/// Each column is typed by the first type every non-null cell parses as:
/// Int64, then Float64, then text. Fails with an IO error when the file is
/// missing or malformed.
[[nodiscard]] auto import_csv(std::string_view path, std::size_t chunk_size,
                              const CsvOptions& options = {}) -> Result<Table>;

/// Import `csv_path` and write it to `dest` through `store`. Returns the
/// number of rows written.
[[nodiscard]] auto convert_csv(ColumnStore& store, std::string_view csv_path,
                               std::string_view dest, std::size_t chunk_size,
                               const CsvOptions& options = {}) -> Result<std::int64_t>;

}  // namespace strata::store
