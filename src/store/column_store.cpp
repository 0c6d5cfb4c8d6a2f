#include <strata/store/column_store.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace strata::store {

auto TableReader::next() -> Result<std::optional<Batch>> {
    if (position_ >= table_->batches().size()) {
        return std::optional<Batch>{};
    }
    return std::optional<Batch>{table_->batches()[position_++]};
}

auto write_table(ColumnStore& store, std::string_view path, const Table& table)
    -> Result<std::int64_t> {
    TableReader reader(table);
    return store.write(path, reader, table.schema());
}

auto project_schema(const SchemaPtr& schema, const std::vector<std::string>& columns)
    -> Result<SchemaPtr> {
    if (columns.empty()) {
        return schema;
    }
    for (const auto& name : columns) {
        if (!schema->contains(name)) {
            return schema_error(fmt::format("requested column '{}' not in source (available: {})",
                                            name, schema->to_string()));
        }
    }
    std::vector<Field> fields;
    fields.reserve(columns.size());
    for (const auto& field : schema->fields()) {
        if (std::find(columns.begin(), columns.end(), field.name) != columns.end()) {
            fields.push_back(field);
        }
    }
    return make_schema(std::move(fields));
}

}  // namespace strata::store
