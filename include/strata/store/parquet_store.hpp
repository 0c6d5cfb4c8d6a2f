#pragma once

#include <strata/store/column_store.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace strata::store {

/// Column store over Parquet files, built on Apache Arrow.
///
/// Type mapping on read:
///   INT8 .. UINT64          -> Int64
///   FLOAT, DOUBLE           -> Float64
///   UTF8, LARGE_UTF8        -> String, or Categorical when the field carries
///                              metadata strata.type=categorical
///   DICTIONARY<UTF8>        -> Categorical
/// Any other column type makes open() fail with an IO error.
///
/// Writes produce one row group per incoming batch. Categorical columns are
/// stored as UTF8 with the categorical marker so they read back as
/// Categorical.
class ParquetStore final : public ColumnStore {
   public:
    [[nodiscard]] auto open(std::string_view path) -> Result<SourcePtr> override;
    [[nodiscard]] auto write(std::string_view path, BatchReader& batches,
                             const SchemaPtr& schema) -> Result<std::int64_t> override;
};

/// Field metadata key marking a UTF8 column as categorical.
inline constexpr std::string_view kTypeMetadataKey = "strata.type";
inline constexpr std::string_view kCategoricalMarker = "categorical";

}  // namespace strata::store
