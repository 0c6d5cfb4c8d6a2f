#pragma once

#include <strata/core/column.hpp>
#include <strata/core/error.hpp>
#include <strata/core/schema.hpp>
#include <strata/core/value.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strata {

using ColumnValue =
    std::variant<Column<std::int64_t>, Column<double>, Column<Categorical>, Column<std::string>>;

struct ColumnEntry {
    std::shared_ptr<const ColumnValue> column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid, the common case, with zero overhead.
    std::optional<std::vector<bool>> validity;
};

/// Returns true if row `row` of `entry` is null.
[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

[[nodiscard]] auto column_size(const ColumnValue& column) -> std::size_t;
[[nodiscard]] auto data_type_of(const ColumnValue& column) -> DataType;
[[nodiscard]] auto make_empty_column(DataType type) -> ColumnValue;

/// Read one cell as a scalar (null when the validity bitmap says so).
[[nodiscard]] auto value_at(const ColumnEntry& entry, std::size_t row) -> ScalarValue;

/// Incrementally builds a column of a fixed logical type from scalars.
class ColumnBuilder {
   public:
    explicit ColumnBuilder(DataType type);

    /// Appends `value`; fails with a compute error when the value's type is
    /// inconsistent with the builder's type. Int64 widens into Float64 and
    /// text is accepted for both Categorical and String.
    auto append(const ScalarValue& value) -> Result<void>;
    void append_null();
    void reserve(std::size_t rows);

    [[nodiscard]] auto type() const noexcept -> DataType { return type_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return rows_; }

    [[nodiscard]] auto finish() -> ColumnEntry;

   private:
    DataType type_;
    ColumnValue column_;
    std::vector<bool> validity_;
    bool has_nulls_ = false;
    std::size_t rows_ = 0;
};

/// A bounded slice of rows across a fixed column set.
///
/// Every column holds exactly rows() values and matches the schema's type
/// at its position. Columns are shared, so select() and with_column() never
/// copy data.
class Batch {
   public:
    Batch() = default;

    /// Validate and assemble a batch.
    [[nodiscard]] static auto make(SchemaPtr schema, std::vector<ColumnEntry> columns)
        -> Result<Batch>;

    /// A zero-row batch with empty columns of the schema's types.
    [[nodiscard]] static auto empty(SchemaPtr schema) -> Batch;

    [[nodiscard]] auto schema() const noexcept -> const SchemaPtr& { return schema_; }
    [[nodiscard]] auto rows() const noexcept -> std::size_t { return rows_; }
    [[nodiscard]] auto num_columns() const noexcept -> std::size_t { return columns_.size(); }
    [[nodiscard]] auto columns() const noexcept -> const std::vector<ColumnEntry>& {
        return columns_;
    }
    [[nodiscard]] auto column(std::size_t idx) const -> const ColumnEntry& {
        return columns_.at(idx);
    }
    [[nodiscard]] auto find(std::string_view name) const -> const ColumnEntry*;

    /// Keep the columns named by `target`, in its order.
    [[nodiscard]] auto select(SchemaPtr target) const -> Result<Batch>;

    /// Gather the rows at `indices`.
    [[nodiscard]] auto take(std::span<const std::size_t> indices) const -> Batch;

    [[nodiscard]] auto slice(std::size_t offset, std::size_t length) const -> Batch;

    /// Append a column; `schema` must be this schema plus the new field.
    [[nodiscard]] auto with_column(SchemaPtr schema, ColumnEntry entry) const -> Result<Batch>;

   private:
    Batch(SchemaPtr schema, std::vector<ColumnEntry> columns, std::size_t rows)
        : schema_(std::move(schema)), columns_(std::move(columns)), rows_(rows) {}

    SchemaPtr schema_;
    std::vector<ColumnEntry> columns_;
    std::size_t rows_ = 0;
};

/// Concatenate batches that share one schema into a single batch.
[[nodiscard]] auto concat_batches(const SchemaPtr& schema, std::span<const Batch> batches)
    -> Result<Batch>;

}  // namespace strata
