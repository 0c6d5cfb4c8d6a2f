#pragma once

#include <strata/core/table.hpp>
#include <strata/store/column_store.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace strata::store {

/// Source backed by an in-memory table. Batches are re-chunked to the
/// requested chunk size on every pass.
class MemorySource final : public SourceHandle {
   public:
    MemorySource(std::string name, std::shared_ptr<const Table> table);

    [[nodiscard]] auto name() const -> const std::string& override { return name_; }
    [[nodiscard]] auto schema() const -> const SchemaPtr& override { return table_->schema(); }
    [[nodiscard]] auto is_open() const -> bool override { return *open_; }
    void close() override { *open_ = false; }

    [[nodiscard]] auto read_batches(const std::vector<std::string>& columns,
                                    std::size_t chunk_size)
        -> Result<std::unique_ptr<BatchReader>> override;

   private:
    std::string name_;
    std::shared_ptr<const Table> table_;
    std::shared_ptr<bool> open_;
};

/// Column store keyed by path, holding tables in memory.
class MemoryStore final : public ColumnStore {
   public:
    [[nodiscard]] auto open(std::string_view path) -> Result<SourcePtr> override;
    [[nodiscard]] auto write(std::string_view path, BatchReader& batches,
                             const SchemaPtr& schema) -> Result<std::int64_t> override;

    /// Register `table` under `path`, replacing any previous entry.
    void put(std::string path, Table table);

    [[nodiscard]] auto contains(std::string_view path) const -> bool;

   private:
    std::map<std::string, std::shared_ptr<const Table>, std::less<>> tables_;
};

}  // namespace strata::store
