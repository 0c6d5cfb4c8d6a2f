#include <strata/pipeline/ingest.hpp>

#include <strata/store/csv_import.hpp>
#include <strata/store/parquet_store.hpp>

#include <spdlog/spdlog.h>

namespace strata::pipeline {

auto convert_csv_to_parquet(std::string_view csv_path, std::string_view parquet_path,
                            std::size_t chunk_size) -> Result<std::int64_t> {
    store::ParquetStore parquet;
    auto rows = store::convert_csv(parquet, csv_path, parquet_path, chunk_size);
    if (rows) {
        spdlog::info("converted {} ({} rows) to {}", csv_path, *rows, parquet_path);
    }
    return rows;
}

}  // namespace strata::pipeline
