#include <strata/store/csv_import.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <unordered_map>
#include <vector>

namespace strata::store {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto try_int(const std::string& text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto try_double(const std::string& text, double& out) -> bool {
    char* end_ptr = nullptr;
    out = std::strtod(text.c_str(), &end_ptr);
    return end_ptr != text.c_str() && *end_ptr == '\0';
}

constexpr std::size_t kMaxCategoricalUniques = 4096;
constexpr double kMaxCategoricalRatio = 0.05;

struct ParsedColumn {
    DataType type = DataType::String;
    ColumnEntry entry;
};

template <typename T, typename Parse>
auto all_parse(const std::vector<std::string>& values, const std::vector<bool>& validity,
               Parse parse) -> bool {
    bool any_valid = false;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!validity[i]) {
            continue;
        }
        T parsed{};
        if (!parse(values[i], parsed)) {
            return false;
        }
        any_valid = true;
    }
    return any_valid;
}

template <typename T, typename Parse>
auto parse_column(const std::vector<std::string>& values, const std::vector<bool>& validity,
                  Parse parse) -> ColumnValue {
    Column<T> column;
    column.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        T parsed{};
        if (validity[i]) {
            parse(values[i], parsed);
        }
        column.push_back(parsed);
    }
    return column;
}

// Dictionary-encode `values` unless there are too many distinct ones.
auto try_categorical(const std::vector<std::string>& values, const std::vector<bool>& validity)
    -> std::optional<ColumnValue> {
    const std::size_t n = values.size();
    if (n == 0) {
        return std::nullopt;
    }
    const std::size_t ratio_limit = std::max<std::size_t>(
        1, static_cast<std::size_t>(static_cast<double>(n) * kMaxCategoricalRatio));
    const std::size_t max_uniques = std::min(kMaxCategoricalUniques, ratio_limit);
    using code_type = Column<Categorical>::code_type;
    std::vector<code_type> codes;
    codes.reserve(n);
    std::vector<std::string> dict;
    std::unordered_map<std::string_view, code_type> index;
    for (std::size_t i = 0; i < n; ++i) {
        std::string_view key = validity[i] ? std::string_view{values[i]} : std::string_view{};
        auto it = index.find(key);
        if (it != index.end()) {
            codes.push_back(it->second);
            continue;
        }
        if (index.size() + 1 > max_uniques) {
            return std::nullopt;
        }
        auto code = static_cast<code_type>(dict.size());
        dict.emplace_back(key);
        index.emplace(key, code);
        codes.push_back(code);
    }
    return Column<Categorical>(std::move(dict), std::move(codes));
}

auto type_column(std::vector<std::string> values, const CsvOptions& options) -> ParsedColumn {
    std::vector<bool> validity(values.size(), true);
    bool has_nulls = false;
    for (std::size_t i = 0; i < values.size(); ++i) {
        const bool null = (options.null_if_empty && values[i].empty()) ||
                          options.null_tokens.contains(values[i]);
        validity[i] = !null;
        has_nulls = has_nulls || null;
    }

    ParsedColumn out;
    if (all_parse<std::int64_t>(values, validity, try_int)) {
        out.type = DataType::Int64;
        out.entry.column = std::make_shared<const ColumnValue>(
            parse_column<std::int64_t>(values, validity, try_int));
    } else if (all_parse<double>(values, validity, try_double)) {
        out.type = DataType::Float64;
        out.entry.column = std::make_shared<const ColumnValue>(
            parse_column<double>(values, validity, try_double));
    } else if (auto categorical = options.detect_categorical
                                      ? try_categorical(values, validity)
                                      : std::nullopt) {
        out.type = DataType::Categorical;
        out.entry.column = std::make_shared<const ColumnValue>(std::move(*categorical));
    } else {
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (!validity[i]) {
                values[i].clear();
            }
        }
        out.type = DataType::String;
        out.entry.column =
            std::make_shared<const ColumnValue>(Column<std::string>(std::move(values)));
    }
    if (has_nulls) {
        out.entry.validity = std::move(validity);
    }
    return out;
}

}  // namespace

auto parse_null_spec(std::string_view spec) -> CsvOptions {
    CsvOptions options;
    options.null_if_empty = false;
    std::size_t pos = 0;
    while (pos <= spec.size()) {
        std::size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto token = trim(spec.substr(pos, comma - pos));
        if (token == "<empty>") {
            options.null_if_empty = true;
        } else if (!token.empty()) {
            options.null_tokens.emplace(token);
        }
        pos = comma + 1;
    }
    return options;
}

auto import_csv(std::string_view path, std::size_t chunk_size, const CsvOptions& options)
    -> Result<Table> {
    if (chunk_size == 0) {
        return io_error(fmt::format("import_csv {}: chunk size must be positive", path));
    }
    std::vector<std::string> names;
    std::vector<std::vector<std::string>> raw;
    try {
        rapidcsv::Document doc(std::string(path),
                               rapidcsv::LabelParams(0, -1),  // row 0 = header, no row-index column
                               rapidcsv::SeparatorParams(options.separator));
        names = doc.GetColumnNames();
        raw.reserve(names.size());
        for (const auto& name : names) {
            raw.push_back(doc.GetColumn<std::string>(name));
        }
    } catch (const std::exception& e) {
        return io_error(fmt::format("import_csv {}: {}", path, e.what()));
    }
    if (names.empty()) {
        return io_error(fmt::format("import_csv {}: no header row", path));
    }

    std::vector<Field> fields;
    std::vector<ColumnEntry> columns;
    fields.reserve(names.size());
    columns.reserve(names.size());
    for (std::size_t c = 0; c < names.size(); ++c) {
        auto parsed = type_column(std::move(raw[c]), options);
        fields.push_back(Field{.name = names[c], .type = parsed.type});
        columns.push_back(std::move(parsed.entry));
    }
    auto schema = make_schema(std::move(fields));
    auto whole = Batch::make(schema, std::move(columns));
    if (!whole) {
        return io_error(fmt::format("import_csv {}: {}", path, whole.error().message));
    }

    Table table(std::string(path), schema);
    for (std::size_t offset = 0; offset < whole->rows(); offset += chunk_size) {
        auto appended =
            table.append(whole->slice(offset, std::min(chunk_size, whole->rows() - offset)));
        if (!appended) {
            return std::unexpected(appended.error());
        }
    }
    spdlog::debug("import_csv: {} rows from {} ({})", table.rows(), path, schema->to_string());
    return table;
}

auto convert_csv(ColumnStore& store, std::string_view csv_path, std::string_view dest,
                 std::size_t chunk_size, const CsvOptions& options) -> Result<std::int64_t> {
    auto table = import_csv(csv_path, chunk_size, options);
    if (!table) {
        return std::unexpected(table.error());
    }
    return write_table(store, dest, *table);
}

}  // namespace strata::store
