#include <strata/core/table.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <type_traits>

namespace strata {

auto Table::rows() const noexcept -> std::size_t {
    std::size_t total = 0;
    for (const auto& batch : batches_) {
        total += batch.rows();
    }
    return total;
}

auto Table::append(Batch batch) -> Result<void> {
    if (schema_ == nullptr) {
        return schema_error(fmt::format("table '{}' has no schema", name_));
    }
    if (batch.schema() == nullptr || *batch.schema() != *schema_) {
        return schema_error(fmt::format("table '{}' expects ({}), got ({})", name_,
                                        schema_->to_string(),
                                        batch.schema() ? batch.schema()->to_string() : "<none>"));
    }
    if (batch.rows() == 0) {
        return {};
    }
    batches_.push_back(std::move(batch));
    return {};
}

auto Table::combine() const -> Result<Batch> {
    if (schema_ == nullptr) {
        return schema_error(fmt::format("table '{}' has no schema", name_));
    }
    return concat_batches(schema_, batches_);
}

namespace {

auto format_cell(const ColumnEntry& entry, std::size_t row) -> std::string {
    if (is_null(entry, row)) {
        return "null";
    }
    return std::visit(
        [row](const auto& col) -> std::string { return fmt::format("{}", col[row]); },
        *entry.column);
}

}  // namespace

auto format_table(const Table& table, std::size_t max_rows) -> std::string {
    const auto& schema = table.schema();
    if (schema == nullptr || schema->empty()) {
        return "<empty>\n";
    }
    std::string out = fmt::format("{}: {} row(s)\n", table.name(), table.rows());

    const std::size_t col_count = schema->size();
    std::vector<std::size_t> widths(col_count);
    std::vector<std::vector<std::string>> cells(col_count);
    for (std::size_t c = 0; c < col_count; ++c) {
        widths[c] = schema->field(c).name.size();
    }
    std::size_t shown = 0;
    for (const auto& batch : table.batches()) {
        for (std::size_t r = 0; r < batch.rows() && shown < max_rows; ++r, ++shown) {
            for (std::size_t c = 0; c < col_count; ++c) {
                auto cell = format_cell(batch.column(c), r);
                widths[c] = std::max(widths[c], cell.size());
                cells[c].push_back(std::move(cell));
            }
        }
    }

    auto append_sep = [&]() {
        out.push_back('+');
        for (std::size_t c = 0; c < col_count; ++c) {
            fmt::format_to(std::back_inserter(out), "{:-<{}}+", "", widths[c] + 2);
        }
        out.push_back('\n');
    };

    append_sep();
    out.push_back('|');
    for (std::size_t c = 0; c < col_count; ++c) {
        fmt::format_to(std::back_inserter(out), " {:<{}} |", schema->field(c).name, widths[c]);
    }
    out.push_back('\n');
    append_sep();
    for (std::size_t r = 0; r < shown; ++r) {
        out.push_back('|');
        for (std::size_t c = 0; c < col_count; ++c) {
            fmt::format_to(std::back_inserter(out), " {:<{}} |", cells[c][r], widths[c]);
        }
        out.push_back('\n');
    }
    append_sep();
    if (table.rows() > shown) {
        fmt::format_to(std::back_inserter(out), "... ({} more rows)\n", table.rows() - shown);
    }
    return out;
}

}  // namespace strata
