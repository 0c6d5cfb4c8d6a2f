#include <strata/store/parquet_store.hpp>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <fmt/format.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <spdlog/spdlog.h>

#include <numeric>
#include <type_traits>

namespace strata::store {

namespace {

auto arrow_failure(std::string_view what, std::string_view path, const arrow::Status& st)
    -> std::unexpected<Error> {
    return io_error(fmt::format("{} {}: {}", what, path, st.ToString()));
}

auto is_categorical_field(const arrow::Field& field) -> bool {
    const auto& metadata = field.metadata();
    if (metadata == nullptr) {
        return false;
    }
    auto idx = metadata->FindKey(std::string(kTypeMetadataKey));
    return idx >= 0 && metadata->value(idx) == kCategoricalMarker;
}

auto to_data_type(const arrow::Field& field) -> std::optional<DataType> {
    switch (field.type()->id()) {
        case arrow::Type::INT8:
        case arrow::Type::INT16:
        case arrow::Type::INT32:
        case arrow::Type::INT64:
        case arrow::Type::UINT8:
        case arrow::Type::UINT16:
        case arrow::Type::UINT32:
        case arrow::Type::UINT64:
            return DataType::Int64;
        case arrow::Type::FLOAT:
        case arrow::Type::DOUBLE:
            return DataType::Float64;
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING:
            return is_categorical_field(field) ? DataType::Categorical : DataType::String;
        case arrow::Type::DICTIONARY: {
            const auto& dict = static_cast<const arrow::DictionaryType&>(*field.type());
            auto value_id = dict.value_type()->id();
            if (value_id == arrow::Type::STRING || value_id == arrow::Type::LARGE_STRING) {
                return DataType::Categorical;
            }
            return std::nullopt;
        }
        default:
            return std::nullopt;
    }
}

auto to_schema(const arrow::Schema& schema, std::string_view path) -> Result<SchemaPtr> {
    std::vector<Field> fields;
    fields.reserve(static_cast<std::size_t>(schema.num_fields()));
    for (const auto& field : schema.fields()) {
        auto type = to_data_type(*field);
        if (!type) {
            return io_error(fmt::format("{}: column '{}' has unsupported type {}", path,
                                        field->name(), field->type()->ToString()));
        }
        fields.push_back(Field{.name = field->name(), .type = *type, .nullable = field->nullable()});
    }
    return make_schema(std::move(fields));
}

template <typename ArrayT>
void append_ints(const arrow::Array& array, Column<std::int64_t>& out) {
    const auto& typed = static_cast<const ArrayT&>(array);
    for (std::int64_t i = 0; i < typed.length(); ++i) {
        out.push_back(typed.IsNull(i) ? 0 : static_cast<std::int64_t>(typed.Value(i)));
    }
}

template <typename ArrayT>
void append_doubles(const arrow::Array& array, Column<double>& out) {
    const auto& typed = static_cast<const ArrayT&>(array);
    for (std::int64_t i = 0; i < typed.length(); ++i) {
        out.push_back(typed.IsNull(i) ? 0.0 : static_cast<double>(typed.Value(i)));
    }
}

void push_text(Column<std::string>& out, std::string_view value) {
    out.push_back(std::string(value));
}

void push_text(Column<Categorical>& out, std::string_view value) { out.push_back(value); }

template <typename ArrayT, typename ColumnT>
void append_strings(const arrow::Array& array, ColumnT& out) {
    const auto& typed = static_cast<const ArrayT&>(array);
    for (std::int64_t i = 0; i < typed.length(); ++i) {
        auto view = typed.GetView(i);
        push_text(out, typed.IsNull(i) ? std::string_view{}
                                       : std::string_view(view.data(), view.size()));
    }
}

auto read_int_column(const arrow::Array& array) -> std::optional<ColumnValue> {
    Column<std::int64_t> out;
    out.reserve(static_cast<std::size_t>(array.length()));
    switch (array.type_id()) {
        case arrow::Type::INT8:
            append_ints<arrow::Int8Array>(array, out);
            break;
        case arrow::Type::INT16:
            append_ints<arrow::Int16Array>(array, out);
            break;
        case arrow::Type::INT32:
            append_ints<arrow::Int32Array>(array, out);
            break;
        case arrow::Type::INT64:
            append_ints<arrow::Int64Array>(array, out);
            break;
        case arrow::Type::UINT8:
            append_ints<arrow::UInt8Array>(array, out);
            break;
        case arrow::Type::UINT16:
            append_ints<arrow::UInt16Array>(array, out);
            break;
        case arrow::Type::UINT32:
            append_ints<arrow::UInt32Array>(array, out);
            break;
        case arrow::Type::UINT64:
            append_ints<arrow::UInt64Array>(array, out);
            break;
        default:
            return std::nullopt;
    }
    return ColumnValue{std::move(out)};
}

auto read_double_column(const arrow::Array& array) -> std::optional<ColumnValue> {
    Column<double> out;
    out.reserve(static_cast<std::size_t>(array.length()));
    switch (array.type_id()) {
        case arrow::Type::FLOAT:
            append_doubles<arrow::FloatArray>(array, out);
            break;
        case arrow::Type::DOUBLE:
            append_doubles<arrow::DoubleArray>(array, out);
            break;
        default:
            return std::nullopt;
    }
    return ColumnValue{std::move(out)};
}

template <typename ColumnT>
auto read_text_column(const arrow::Array& array) -> std::optional<ColumnValue> {
    ColumnT out;
    out.reserve(static_cast<std::size_t>(array.length()));
    switch (array.type_id()) {
        case arrow::Type::STRING:
            append_strings<arrow::StringArray>(array, out);
            break;
        case arrow::Type::LARGE_STRING:
            append_strings<arrow::LargeStringArray>(array, out);
            break;
        case arrow::Type::DICTIONARY: {
            const auto& dict = static_cast<const arrow::DictionaryArray&>(array);
            auto values = dict.dictionary();
            if (values->type_id() != arrow::Type::STRING) {
                return std::nullopt;
            }
            const auto& strings = static_cast<const arrow::StringArray&>(*values);
            for (std::int64_t i = 0; i < dict.length(); ++i) {
                if (dict.IsNull(i)) {
                    push_text(out, {});
                } else {
                    auto view = strings.GetView(dict.GetValueIndex(i));
                    push_text(out, std::string_view(view.data(), view.size()));
                }
            }
            break;
        }
        default:
            return std::nullopt;
    }
    return ColumnValue{std::move(out)};
}

auto read_column(const arrow::Array& array, const Field& field) -> Result<ColumnEntry> {
    std::optional<ColumnValue> column;
    switch (field.type) {
        case DataType::Int64:
            column = read_int_column(array);
            break;
        case DataType::Float64:
            column = read_double_column(array);
            break;
        case DataType::Categorical:
            column = read_text_column<Column<Categorical>>(array);
            break;
        case DataType::String:
            column = read_text_column<Column<std::string>>(array);
            break;
    }
    if (!column) {
        return io_error(fmt::format("column '{}': cannot read {} as {}", field.name,
                                    array.type()->ToString(), to_string(field.type)));
    }
    ColumnEntry entry{.column = std::make_shared<const ColumnValue>(std::move(*column))};
    if (array.null_count() > 0) {
        std::vector<bool> validity(static_cast<std::size_t>(array.length()));
        for (std::int64_t i = 0; i < array.length(); ++i) {
            validity[static_cast<std::size_t>(i)] = array.IsValid(i);
        }
        entry.validity = std::move(validity);
    }
    return entry;
}

class ParquetReader final : public BatchReader {
   public:
    ParquetReader(std::string path, SchemaPtr schema, std::shared_ptr<bool> open,
                  std::unique_ptr<parquet::arrow::FileReader> file,
                  std::unique_ptr<arrow::RecordBatchReader> batches)
        : path_(std::move(path)),
          schema_(std::move(schema)),
          open_(std::move(open)),
          file_(std::move(file)),
          batches_(std::move(batches)) {}

    [[nodiscard]] auto schema() const -> const SchemaPtr& override { return schema_; }

    [[nodiscard]] auto next() -> Result<std::optional<Batch>> override {
        if (!*open_) {
            return io_error(fmt::format("source '{}' was closed", path_));
        }
        std::shared_ptr<arrow::RecordBatch> record;
        auto st = batches_->ReadNext(&record);
        if (!st.ok()) {
            return arrow_failure("failed to read batch from", path_, st);
        }
        if (record == nullptr) {
            return std::optional<Batch>{};
        }
        std::vector<ColumnEntry> columns;
        columns.reserve(schema_->size());
        for (std::size_t i = 0; i < schema_->size(); ++i) {
            auto column = read_column(*record->column(static_cast<int>(i)), schema_->field(i));
            if (!column) {
                return std::unexpected(column.error());
            }
            columns.push_back(std::move(*column));
        }
        auto batch = Batch::make(schema_, std::move(columns));
        if (!batch) {
            return io_error(fmt::format("{}: {}", path_, batch.error().message));
        }
        return std::optional<Batch>{std::move(*batch)};
    }

   private:
    std::string path_;
    SchemaPtr schema_;
    std::shared_ptr<bool> open_;
    std::unique_ptr<parquet::arrow::FileReader> file_;
    std::unique_ptr<arrow::RecordBatchReader> batches_;
};

auto open_file(const std::string& path) -> Result<std::unique_ptr<parquet::arrow::FileReader>> {
    auto input = arrow::io::ReadableFile::Open(path);
    if (!input.ok()) {
        return arrow_failure("failed to open", path, input.status());
    }
    std::unique_ptr<parquet::arrow::FileReader> reader;
    auto st = parquet::arrow::OpenFile(input.ValueOrDie(), arrow::default_memory_pool(), &reader);
    if (!st.ok()) {
        return arrow_failure("failed to read", path, st);
    }
    return reader;
}

class ParquetSource final : public SourceHandle {
   public:
    ParquetSource(std::string path, SchemaPtr schema, std::shared_ptr<arrow::Schema> arrow_schema)
        : path_(std::move(path)),
          schema_(std::move(schema)),
          arrow_schema_(std::move(arrow_schema)),
          open_(std::make_shared<bool>(true)) {}

    [[nodiscard]] auto name() const -> const std::string& override { return path_; }
    [[nodiscard]] auto schema() const -> const SchemaPtr& override { return schema_; }
    [[nodiscard]] auto is_open() const -> bool override { return *open_; }
    void close() override { *open_ = false; }

    [[nodiscard]] auto read_batches(const std::vector<std::string>& columns,
                                    std::size_t chunk_size)
        -> Result<std::unique_ptr<BatchReader>> override {
        if (!*open_) {
            return io_error(fmt::format("source '{}' was closed", path_));
        }
        if (chunk_size == 0) {
            return io_error(fmt::format("source '{}': chunk size must be positive", path_));
        }
        auto projected = project_schema(schema_, columns);
        if (!projected) {
            return std::unexpected(projected.error());
        }
        std::vector<int> indices;
        indices.reserve((*projected)->size());
        for (const auto& field : (*projected)->fields()) {
            indices.push_back(arrow_schema_->GetFieldIndex(field.name));
        }

        auto file = open_file(path_);
        if (!file) {
            return std::unexpected(file.error());
        }
        (*file)->set_batch_size(static_cast<std::int64_t>(chunk_size));
        std::vector<int> row_groups((*file)->num_row_groups());
        std::iota(row_groups.begin(), row_groups.end(), 0);
        std::unique_ptr<arrow::RecordBatchReader> batches;
        auto st = (*file)->GetRecordBatchReader(row_groups, indices, &batches);
        if (!st.ok()) {
            return arrow_failure("failed to scan", path_, st);
        }
        spdlog::debug("parquet: scanning {} column(s) of {} in chunks of {}", indices.size(),
                      path_, chunk_size);
        return std::make_unique<ParquetReader>(path_, std::move(*projected), open_,
                                               std::move(*file), std::move(batches));
    }

   private:
    std::string path_;
    SchemaPtr schema_;
    std::shared_ptr<arrow::Schema> arrow_schema_;
    std::shared_ptr<bool> open_;
};

// ─── Writing ─────────────────────────────────────────────────────────────────

auto to_arrow_field(const Field& field) -> std::shared_ptr<arrow::Field> {
    switch (field.type) {
        case DataType::Int64:
            return arrow::field(field.name, arrow::int64(), field.nullable);
        case DataType::Float64:
            return arrow::field(field.name, arrow::float64(), field.nullable);
        case DataType::Categorical:
            return arrow::field(field.name, arrow::utf8(), field.nullable,
                                arrow::key_value_metadata({std::string(kTypeMetadataKey)},
                                                          {std::string(kCategoricalMarker)}));
        case DataType::String:
            return arrow::field(field.name, arrow::utf8(), field.nullable);
    }
    return arrow::field(field.name, arrow::utf8(), field.nullable);
}

template <typename BuilderT, typename ColumnT>
auto build_array(BuilderT& builder, const ColumnT& column, const ColumnEntry& entry)
    -> arrow::Result<std::shared_ptr<arrow::Array>> {
    ARROW_RETURN_NOT_OK(builder.Reserve(static_cast<std::int64_t>(column.size())));
    for (std::size_t i = 0; i < column.size(); ++i) {
        if (is_null(entry, i)) {
            ARROW_RETURN_NOT_OK(builder.AppendNull());
            continue;
        }
        if constexpr (std::is_same_v<BuilderT, arrow::StringBuilder>) {
            std::string_view value = column[i];
            ARROW_RETURN_NOT_OK(
                builder.Append(value.data(), static_cast<std::int32_t>(value.size())));
        } else {
            ARROW_RETURN_NOT_OK(builder.Append(column[i]));
        }
    }
    std::shared_ptr<arrow::Array> array;
    ARROW_RETURN_NOT_OK(builder.Finish(&array));
    return array;
}

auto to_arrow_array(const ColumnEntry& entry) -> arrow::Result<std::shared_ptr<arrow::Array>> {
    return std::visit(
        [&](const auto& column) -> arrow::Result<std::shared_ptr<arrow::Array>> {
            using ColT = std::decay_t<decltype(column)>;
            if constexpr (std::is_same_v<ColT, Column<std::int64_t>>) {
                arrow::Int64Builder builder;
                return build_array(builder, column, entry);
            } else if constexpr (std::is_same_v<ColT, Column<double>>) {
                arrow::DoubleBuilder builder;
                return build_array(builder, column, entry);
            } else {
                arrow::StringBuilder builder;
                return build_array(builder, column, entry);
            }
        },
        *entry.column);
}

auto to_record_batch(const Batch& batch, const std::shared_ptr<arrow::Schema>& schema)
    -> arrow::Result<std::shared_ptr<arrow::RecordBatch>> {
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    arrays.reserve(batch.num_columns());
    for (const auto& entry : batch.columns()) {
        ARROW_ASSIGN_OR_RAISE(auto array, to_arrow_array(entry));
        arrays.push_back(std::move(array));
    }
    return arrow::RecordBatch::Make(schema, static_cast<std::int64_t>(batch.rows()),
                                    std::move(arrays));
}

}  // namespace

auto ParquetStore::open(std::string_view path) -> Result<SourcePtr> {
    std::string file_path(path);
    auto reader = open_file(file_path);
    if (!reader) {
        return std::unexpected(reader.error());
    }
    std::shared_ptr<arrow::Schema> arrow_schema;
    auto st = (*reader)->GetSchema(&arrow_schema);
    if (!st.ok()) {
        return arrow_failure("failed to read schema of", path, st);
    }
    auto schema = to_schema(*arrow_schema, path);
    if (!schema) {
        return std::unexpected(schema.error());
    }
    spdlog::debug("parquet: opened {} ({} rows, {} row group(s)): {}", path,
                  (*reader)->parquet_reader()->metadata()->num_rows(),
                  (*reader)->num_row_groups(), (*schema)->to_string());
    return std::make_shared<ParquetSource>(std::move(file_path), std::move(*schema),
                                           std::move(arrow_schema));
}

auto ParquetStore::write(std::string_view path, BatchReader& batches, const SchemaPtr& schema)
    -> Result<std::int64_t> {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    fields.reserve(schema->size());
    for (const auto& field : schema->fields()) {
        fields.push_back(to_arrow_field(field));
    }
    auto arrow_schema = arrow::schema(std::move(fields));

    auto sink = arrow::io::FileOutputStream::Open(std::string(path));
    if (!sink.ok()) {
        return arrow_failure("cannot open for writing", path, sink.status());
    }
    // Keep the Arrow schema in the file so field metadata survives.
    auto arrow_props = parquet::ArrowWriterProperties::Builder().store_schema()->build();
    auto writer = parquet::arrow::FileWriter::Open(*arrow_schema, arrow::default_memory_pool(),
                                                   sink.ValueOrDie(),
                                                   parquet::default_writer_properties(),
                                                   arrow_props);
    if (!writer.ok()) {
        return arrow_failure("failed to start", path, writer.status());
    }
    auto file = std::move(writer).ValueOrDie();

    std::int64_t rows = 0;
    std::int64_t row_groups = 0;
    while (true) {
        auto batch = batches.next();
        if (!batch) {
            return std::unexpected(batch.error());
        }
        if (!batch->has_value()) {
            break;
        }
        const Batch& b = **batch;
        if (b.rows() == 0) {
            continue;
        }
        if (*b.schema() != *schema) {
            return io_error(fmt::format("write {}: batch ({}) does not match ({})", path,
                                            b.schema()->to_string(), schema->to_string()));
        }
        auto record = to_record_batch(b, arrow_schema);
        if (!record.ok()) {
            return arrow_failure("failed to convert batch for", path, record.status());
        }
        auto table = arrow::Table::FromRecordBatches(arrow_schema, {record.ValueOrDie()});
        if (!table.ok()) {
            return arrow_failure("failed to convert batch for", path, table.status());
        }
        auto st = file->WriteTable(*table.ValueOrDie(), static_cast<std::int64_t>(b.rows()));
        if (!st.ok()) {
            return arrow_failure("failed to write", path, st);
        }
        rows += static_cast<std::int64_t>(b.rows());
        ++row_groups;
    }
    if (auto st = file->Close(); !st.ok()) {
        return arrow_failure("failed to finish", path, st);
    }
    if (auto st = sink.ValueOrDie()->Close(); !st.ok()) {
        return arrow_failure("failed to close", path, st);
    }
    spdlog::debug("parquet: wrote {} rows in {} row group(s) to {}", rows, row_groups, path);
    return rows;
}

}  // namespace strata::store
