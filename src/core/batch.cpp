#include <strata/core/batch.hpp>

#include <fmt/format.h>

#include <type_traits>

namespace strata {

namespace {

auto column_type_mismatch(const Field& field, const ColumnValue& column) -> std::unexpected<Error> {
    return schema_error(fmt::format("column '{}' declared {} but holds {}", field.name,
                                    to_string(field.type), to_string(data_type_of(column))));
}

}  // namespace

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto data_type_of(const ColumnValue& column) -> DataType {
    if (std::holds_alternative<Column<std::int64_t>>(column)) {
        return DataType::Int64;
    }
    if (std::holds_alternative<Column<double>>(column)) {
        return DataType::Float64;
    }
    if (std::holds_alternative<Column<Categorical>>(column)) {
        return DataType::Categorical;
    }
    return DataType::String;
}

auto make_empty_column(DataType type) -> ColumnValue {
    switch (type) {
        case DataType::Int64:
            return Column<std::int64_t>{};
        case DataType::Float64:
            return Column<double>{};
        case DataType::Categorical:
            return Column<Categorical>{};
        case DataType::String:
            return Column<std::string>{};
    }
    return Column<std::string>{};
}

auto value_at(const ColumnEntry& entry, std::size_t row) -> ScalarValue {
    if (is_null(entry, row)) {
        return std::monostate{};
    }
    return std::visit(
        [row](const auto& col) -> ScalarValue {
            using ColT = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColT, Column<Categorical>>) {
                return std::string(col[row]);
            } else {
                return col[row];
            }
        },
        *entry.column);
}

// ─── ColumnBuilder ───────────────────────────────────────────────────────────

ColumnBuilder::ColumnBuilder(DataType type) : type_(type), column_(make_empty_column(type)) {}

void ColumnBuilder::reserve(std::size_t rows) {
    std::visit([rows](auto& col) { col.reserve(rows); }, column_);
    validity_.reserve(rows);
}

auto ColumnBuilder::append(const ScalarValue& value) -> Result<void> {
    if (is_null(value)) {
        append_null();
        return {};
    }
    bool accepted = std::visit(
        [&value](auto& col) -> bool {
            using ColT = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColT, Column<std::int64_t>>) {
                if (const auto* v = std::get_if<std::int64_t>(&value)) {
                    col.push_back(*v);
                    return true;
                }
            } else if constexpr (std::is_same_v<ColT, Column<double>>) {
                if (const auto* v = std::get_if<double>(&value)) {
                    col.push_back(*v);
                    return true;
                }
                if (const auto* v = std::get_if<std::int64_t>(&value)) {
                    col.push_back(static_cast<double>(*v));
                    return true;
                }
            } else {
                if (const auto* v = std::get_if<std::string>(&value)) {
                    col.push_back(*v);
                    return true;
                }
            }
            return false;
        },
        column_);
    if (!accepted) {
        return compute_error(fmt::format("value {} is not compatible with a {} column",
                                         format_scalar(value), to_string(type_)));
    }
    validity_.push_back(true);
    ++rows_;
    return {};
}

void ColumnBuilder::append_null() {
    std::visit(
        [](auto& col) {
            using ColT = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColT, Column<Categorical>>) {
                col.push_back(std::string_view{});
            } else {
                col.push_back(typename ColT::value_type{});
            }
        },
        column_);
    validity_.push_back(false);
    has_nulls_ = true;
    ++rows_;
}

auto ColumnBuilder::finish() -> ColumnEntry {
    ColumnEntry entry{.column = std::make_shared<const ColumnValue>(std::move(column_))};
    if (has_nulls_) {
        entry.validity = std::move(validity_);
    }
    column_ = make_empty_column(type_);
    validity_.clear();
    has_nulls_ = false;
    rows_ = 0;
    return entry;
}

// ─── Batch ───────────────────────────────────────────────────────────────────

auto Batch::make(SchemaPtr schema, std::vector<ColumnEntry> columns) -> Result<Batch> {
    if (schema == nullptr) {
        return schema_error("batch has no schema");
    }
    if (columns.size() != schema->size()) {
        return schema_error(fmt::format("batch has {} columns but schema has {} ({})",
                                        columns.size(), schema->size(), schema->to_string()));
    }
    std::size_t rows = 0;
    for (std::size_t i = 0; i < columns.size(); ++i) {
        const auto& field = schema->field(i);
        const auto& entry = columns[i];
        if (entry.column == nullptr) {
            return schema_error(fmt::format("column '{}' has no data", field.name));
        }
        if (data_type_of(*entry.column) != field.type) {
            return column_type_mismatch(field, *entry.column);
        }
        auto n = column_size(*entry.column);
        if (i == 0) {
            rows = n;
        } else if (n != rows) {
            return schema_error(fmt::format("column '{}' has {} rows, expected {}", field.name,
                                            n, rows));
        }
        if (entry.validity.has_value() && entry.validity->size() != n) {
            return schema_error(
                fmt::format("validity bitmap of column '{}' has the wrong length", field.name));
        }
    }
    return Batch{std::move(schema), std::move(columns), rows};
}

auto Batch::empty(SchemaPtr schema) -> Batch {
    std::vector<ColumnEntry> columns;
    columns.reserve(schema->size());
    for (const auto& field : schema->fields()) {
        columns.push_back(
            ColumnEntry{.column = std::make_shared<const ColumnValue>(make_empty_column(field.type))});
    }
    return Batch{std::move(schema), std::move(columns), 0};
}

auto Batch::find(std::string_view name) const -> const ColumnEntry* {
    if (schema_ == nullptr) {
        return nullptr;
    }
    auto idx = schema_->index_of(name);
    if (!idx) {
        return nullptr;
    }
    return &columns_[*idx];
}

auto Batch::select(SchemaPtr target) const -> Result<Batch> {
    std::vector<ColumnEntry> columns;
    columns.reserve(target->size());
    for (const auto& field : target->fields()) {
        const auto* entry = find(field.name);
        if (entry == nullptr) {
            return schema_error(fmt::format("select column not found: {} (available: {})",
                                            field.name, schema_->to_string()));
        }
        if (data_type_of(*entry->column) != field.type) {
            return column_type_mismatch(field, *entry->column);
        }
        columns.push_back(*entry);
    }
    return Batch{std::move(target), std::move(columns), rows_};
}

auto Batch::take(std::span<const std::size_t> indices) const -> Batch {
    std::vector<ColumnEntry> columns;
    columns.reserve(columns_.size());
    for (const auto& entry : columns_) {
        ColumnEntry out{.column = std::make_shared<const ColumnValue>(std::visit(
                            [indices](const auto& col) -> ColumnValue { return col.take(indices); },
                            *entry.column))};
        if (entry.validity.has_value()) {
            std::vector<bool> validity;
            validity.reserve(indices.size());
            for (auto idx : indices) {
                validity.push_back((*entry.validity)[idx]);
            }
            out.validity = std::move(validity);
        }
        columns.push_back(std::move(out));
    }
    return Batch{schema_, std::move(columns), indices.size()};
}

auto Batch::slice(std::size_t offset, std::size_t length) const -> Batch {
    std::vector<ColumnEntry> columns;
    columns.reserve(columns_.size());
    for (const auto& entry : columns_) {
        ColumnEntry out{.column = std::make_shared<const ColumnValue>(std::visit(
                            [offset, length](const auto& col) -> ColumnValue {
                                return col.slice(offset, length);
                            },
                            *entry.column))};
        if (entry.validity.has_value()) {
            auto first = entry.validity->begin() + static_cast<std::ptrdiff_t>(offset);
            out.validity = std::vector<bool>(first, first + static_cast<std::ptrdiff_t>(length));
        }
        columns.push_back(std::move(out));
    }
    return Batch{schema_, std::move(columns), length};
}

auto Batch::with_column(SchemaPtr schema, ColumnEntry entry) const -> Result<Batch> {
    if (schema->size() != columns_.size() + 1) {
        return schema_error(fmt::format("with_column: schema ({}) does not extend ({})",
                                        schema->to_string(), schema_->to_string()));
    }
    const auto& field = schema->field(columns_.size());
    if (data_type_of(*entry.column) != field.type) {
        return column_type_mismatch(field, *entry.column);
    }
    auto n = column_size(*entry.column);
    if (!columns_.empty() && n != rows_) {
        return schema_error(
            fmt::format("column '{}' has {} rows, expected {}", field.name, n, rows_));
    }
    std::vector<ColumnEntry> columns = columns_;
    columns.push_back(std::move(entry));
    return Batch{std::move(schema), std::move(columns), n};
}

auto concat_batches(const SchemaPtr& schema, std::span<const Batch> batches) -> Result<Batch> {
    if (batches.empty()) {
        return Batch::empty(schema);
    }
    if (batches.size() == 1) {
        return batches.front();
    }
    std::vector<ColumnEntry> columns;
    columns.reserve(schema->size());
    for (std::size_t c = 0; c < schema->size(); ++c) {
        ColumnValue merged = make_empty_column(schema->field(c).type);
        bool any_validity = false;
        std::size_t total = 0;
        for (const auto& batch : batches) {
            if (*batch.schema() != *schema) {
                return schema_error(fmt::format("cannot concatenate batch ({}) into ({})",
                                                batch.schema()->to_string(), schema->to_string()));
            }
            const auto& entry = batch.column(c);
            any_validity = any_validity || entry.validity.has_value();
            total += batch.rows();
            std::visit(
                [&entry](auto& dst) {
                    using ColT = std::decay_t<decltype(dst)>;
                    dst.append(std::get<ColT>(*entry.column));
                },
                merged);
        }
        ColumnEntry out{.column = std::make_shared<const ColumnValue>(std::move(merged))};
        if (any_validity) {
            std::vector<bool> validity;
            validity.reserve(total);
            for (const auto& batch : batches) {
                const auto& entry = batch.column(c);
                for (std::size_t r = 0; r < batch.rows(); ++r) {
                    validity.push_back(!is_null(entry, r));
                }
            }
            out.validity = std::move(validity);
        }
        columns.push_back(std::move(out));
    }
    return Batch::make(schema, std::move(columns));
}

}  // namespace strata
