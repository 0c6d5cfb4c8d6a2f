#pragma once

#include <strata/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace strata::pipeline {

/// Rewrite a CSV file as Parquet, one row group per `chunk_size` rows.
/// Returns the number of rows written.
[[nodiscard]] auto convert_csv_to_parquet(std::string_view csv_path,
                                          std::string_view parquet_path,
                                          std::size_t chunk_size = 65536)
    -> Result<std::int64_t>;

}  // namespace strata::pipeline
