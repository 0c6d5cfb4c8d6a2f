#pragma once

#include <strata/core/batch.hpp>
#include <strata/core/error.hpp>
#include <strata/core/schema.hpp>

#include <string>
#include <vector>

namespace strata {

/// A named, ordered sequence of batches sharing one schema.
class Table {
   public:
    Table() = default;
    Table(std::string name, SchemaPtr schema) : name_(std::move(name)), schema_(std::move(schema)) {}

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto schema() const noexcept -> const SchemaPtr& { return schema_; }
    [[nodiscard]] auto batches() const noexcept -> const std::vector<Batch>& { return batches_; }
    [[nodiscard]] auto num_batches() const noexcept -> std::size_t { return batches_.size(); }
    [[nodiscard]] auto rows() const noexcept -> std::size_t;

    /// Append a batch; fails with a schema error when its schema differs.
    /// Zero-row batches are accepted but not stored.
    auto append(Batch batch) -> Result<void>;

    /// All batches concatenated into one (an empty batch for an empty table).
    [[nodiscard]] auto combine() const -> Result<Batch>;

   private:
    std::string name_;
    SchemaPtr schema_;
    std::vector<Batch> batches_;
};

/// Boxed text rendering of the first `max_rows` rows.
[[nodiscard]] auto format_table(const Table& table, std::size_t max_rows = 10) -> std::string;

}  // namespace strata
