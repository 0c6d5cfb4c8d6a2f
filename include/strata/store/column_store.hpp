#pragma once

#include <strata/core/batch.hpp>
#include <strata/core/error.hpp>
#include <strata/core/schema.hpp>
#include <strata/core/table.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::store {

/// A single pass over a columnar source.
///
/// Finite and not resumable: once next() returns nullopt (end of input) or
/// an error, the reader is spent. Start a new pass with read_batches().
class BatchReader {
   public:
    virtual ~BatchReader() = default;

    [[nodiscard]] virtual auto schema() const -> const SchemaPtr& = 0;

    /// The next batch, or nullopt at end of input.
    [[nodiscard]] virtual auto next() -> Result<std::optional<Batch>> = 0;
};

/// An opened columnar source.
///
/// Closing the handle makes every outstanding reader fail its next pull
/// with an IO error; this is the only way to stop a running pipeline early.
class SourceHandle {
   public:
    virtual ~SourceHandle() = default;

    [[nodiscard]] virtual auto name() const -> const std::string& = 0;
    [[nodiscard]] virtual auto schema() const -> const SchemaPtr& = 0;
    [[nodiscard]] virtual auto is_open() const -> bool = 0;
    virtual void close() = 0;

    /// Start a new pass that materializes only `columns` (in source order),
    /// at most `chunk_size` rows per batch.
    [[nodiscard]] virtual auto read_batches(const std::vector<std::string>& columns,
                                            std::size_t chunk_size)
        -> Result<std::unique_ptr<BatchReader>> = 0;
};

using SourcePtr = std::shared_ptr<SourceHandle>;

/// Column store I/O boundary.
class ColumnStore {
   public:
    virtual ~ColumnStore() = default;

    /// Fails with an IO error when `path` is missing or unreadable.
    [[nodiscard]] virtual auto open(std::string_view path) -> Result<SourcePtr> = 0;

    /// Drain `batches` into `path`. Returns the number of rows written.
    /// Every failure, a batch that does not match `schema` included, is an
    /// IO error; the destination is then unspecified and must be discarded.
    [[nodiscard]] virtual auto write(std::string_view path, BatchReader& batches,
                                     const SchemaPtr& schema) -> Result<std::int64_t> = 0;
};

/// BatchReader over the batches of a materialized table.
class TableReader final : public BatchReader {
   public:
    explicit TableReader(const Table& table) : table_(&table) {}

    [[nodiscard]] auto schema() const -> const SchemaPtr& override { return table_->schema(); }
    [[nodiscard]] auto next() -> Result<std::optional<Batch>> override;

   private:
    const Table* table_;
    std::size_t position_ = 0;
};

/// Write every batch of `table` through `store`.
[[nodiscard]] auto write_table(ColumnStore& store, std::string_view path, const Table& table)
    -> Result<std::int64_t>;

/// Resolve `columns` against `schema`, returning them in source order.
/// An empty request selects every column.
[[nodiscard]] auto project_schema(const SchemaPtr& schema, const std::vector<std::string>& columns)
    -> Result<SchemaPtr>;

}  // namespace strata::store
