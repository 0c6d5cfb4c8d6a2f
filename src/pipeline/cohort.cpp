#include <strata/pipeline/cohort.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>

namespace strata::pipeline {

namespace {

auto find_report_field(const CohortSpec& spec, const std::string& column) -> ReportField {
    auto it = std::find_if(spec.report.begin(), spec.report.end(),
                           [&](const ReportField& f) { return f.column == column; });
    if (it == spec.report.end()) {
        return ReportField{.column = column, .label = column};
    }
    return *it;
}

auto format_value(const ScalarValue& value, int precision) -> std::string {
    if (const auto* d = std::get_if<double>(&value)) {
        return fmt::format("{:.{}f}", *d, precision);
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    return format_scalar(value);
}

// Columns the aggregation stage reads from the source, in first-use order.
auto used_columns(const CohortSpec& spec) -> std::vector<std::string> {
    std::vector<std::string> out;
    auto add = [&out](const std::string& name) {
        if (!name.empty() && std::find(out.begin(), out.end(), name) == out.end()) {
            out.push_back(name);
        }
    };
    add(spec.field);
    for (const auto& key : spec.group_by) {
        if (key != spec.bucket_column) {
            add(key);
        }
    }
    for (const auto& agg : spec.aggregations) {
        add(agg.column);
    }
    return out;
}

}  // namespace

auto build_cohort_plan(ir::Builder& builder, const store::SourcePtr& source,
                       const CohortSpec& spec) -> Result<ir::NodePtr> {
    auto plan = builder.scan(source);
    if (!plan) {
        return plan;
    }
    plan = builder.filter(std::move(*plan),
                          ir::between(spec.field, spec.min_value, spec.max_value));
    if (!plan) {
        return plan;
    }
    plan = builder.project(std::move(*plan), used_columns(spec));
    if (!plan) {
        return plan;
    }
    auto bucket = ir::bucketize(spec.field, spec.buckets);
    if (!bucket) {
        return std::unexpected(bucket.error());
    }
    plan = builder.derive_column(std::move(*plan), spec.bucket_column, std::move(*bucket),
                                 DataType::Categorical);
    if (!plan) {
        return plan;
    }
    return builder.group_aggregate(std::move(*plan), spec.group_by, spec.aggregations);
}

auto run_cohort_analysis(const store::SourcePtr& source, const CohortSpec& spec,
                         const runtime::ExecutorConfig& config) -> Result<Table> {
    ir::Builder builder;
    auto plan = build_cohort_plan(builder, source, spec);
    if (!plan) {
        return std::unexpected(plan.error());
    }
    spdlog::debug("cohort plan:\n{}", ir::explain(**plan));
    return runtime::Executor(config).execute(*plan);
}

auto summarize(const Table& result, const CohortSpec& spec) -> Result<CohortSummary> {
    auto combined = result.combine();
    if (!combined) {
        return std::unexpected(combined.error());
    }
    const auto* counts = combined->find(spec.count_column);
    if (counts == nullptr || data_type_of(*counts->column) != DataType::Int64) {
        return schema_error(fmt::format("summary: no Int64 column '{}' in ({})", spec.count_column,
                                        result.schema()->to_string()));
    }
    CohortSummary summary;
    for (std::size_t row = 0; row < combined->rows(); ++row) {
        auto count = value_at(*counts, row);
        const auto* n = std::get_if<std::int64_t>(&count);
        if (n != nullptr && __builtin_add_overflow(summary.total, *n, &summary.total)) {
            return compute_error(fmt::format("summary: '{}' total overflows", spec.count_column));
        }
    }

    std::vector<std::size_t> order(combined->rows());
    std::iota(order.begin(), order.end(), 0);
    if (!spec.group_by.empty()) {
        const auto* key = combined->find(spec.group_by.front());
        if (key == nullptr) {
            return schema_error(
                fmt::format("summary: no group column '{}'", spec.group_by.front()));
        }
        std::vector<ScalarValue> keys;
        keys.reserve(order.size());
        for (std::size_t row = 0; row < combined->rows(); ++row) {
            keys.push_back(value_at(*key, row));
        }
        std::stable_sort(order.begin(), order.end(),
                         [&keys](std::size_t a, std::size_t b) { return keys[a] < keys[b]; });
    }
    summary.rows = combined->take(order);
    return summary;
}

auto format_summary(const CohortSummary& summary, const CohortSpec& spec) -> std::string {
    std::string out = fmt::format("Total {}: {}\n", spec.total_label, summary.total);
    const auto& rows = summary.rows;
    if (rows.schema() == nullptr || rows.rows() == 0) {
        return out;
    }
    const auto& schema = *rows.schema();
    std::vector<ReportField> fields;
    fields.reserve(schema.size());
    for (const auto& field : schema.fields()) {
        fields.push_back(find_report_field(spec, field.name));
    }
    const std::size_t keys = std::min(spec.group_by.size(), schema.size());
    if (keys > 0) {
        out.append(fmt::format("\nDetailed Results (sorted by {}):\n", fields.front().label));
    }
    for (std::size_t row = 0; row < rows.rows(); ++row) {
        if (row > 0 || keys == 0) {
            out.push_back('\n');
        }
        for (std::size_t c = 0; c < schema.size(); ++c) {
            out.append(fmt::format("{}{}: {}\n", c < keys ? "" : "  - ", fields[c].label,
                                   format_value(value_at(rows.column(c), row),
                                                fields[c].precision)));
        }
    }
    return out;
}

}  // namespace strata::pipeline
