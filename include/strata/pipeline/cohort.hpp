#pragma once

#include <strata/core/batch.hpp>
#include <strata/core/error.hpp>
#include <strata/core/table.hpp>
#include <strata/ir/builder.hpp>
#include <strata/ir/expr.hpp>
#include <strata/ir/node.hpp>
#include <strata/runtime/executor.hpp>
#include <strata/store/column_store.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace strata::pipeline {

/// How one result column reads in the detailed report.
struct ReportField {
    std::string column;
    std::string label;
    /// Digits after the decimal point for Float64 values.
    int precision = 2;
};

/// Parameters of a cohort report: outlier bounds on a numeric field, the
/// bucket table applied to it and the per-bucket aggregates.
struct CohortSpec {
    std::string field = "BMI";
    /// Rows outside [min_value, max_value] are outliers and dropped.
    double min_value = 10.0;
    double max_value = 60.0;

    std::string bucket_column = "bmi_range";
    ir::BucketSpec buckets{
        .boundaries = {18.5, 25.0, 30.0},
        .labels = {"Underweight", "Normal", "Overweight", "Obese"},
    };

    std::vector<std::string> group_by{"bmi_range"};
    std::vector<ir::AggSpec> aggregations{
        {.func = ir::AggFunc::Mean, .column = "Glucose", .alias = "avg_glucose"},
        {.func = ir::AggFunc::Count, .column = "", .alias = "patient_count"},
        {.func = ir::AggFunc::Mean, .column = "Age", .alias = "avg_age"},
    };

    /// Output column summed for the report total.
    std::string count_column = "patient_count";
    std::string total_label = "patients analyzed";

    /// Columns not listed here print under their own name with two decimals.
    std::vector<ReportField> report{
        {.column = "bmi_range", .label = "BMI Range"},
        {.column = "avg_glucose", .label = "Average Glucose", .precision = 2},
        {.column = "patient_count", .label = "Patient Count"},
        {.column = "avg_age", .label = "Average Age", .precision = 1},
    };
};

/// scan -> filter outliers -> select used columns -> derive bucket -> group-aggregate.
[[nodiscard]] auto build_cohort_plan(ir::Builder& builder, const store::SourcePtr& source,
                                     const CohortSpec& spec) -> Result<ir::NodePtr>;

/// Build, optimize and execute the cohort plan over `source`.
[[nodiscard]] auto run_cohort_analysis(const store::SourcePtr& source, const CohortSpec& spec,
                                       const runtime::ExecutorConfig& config = {})
    -> Result<Table>;

struct CohortSummary {
    std::int64_t total = 0;
    /// Result rows ordered by the first group column.
    Batch rows;
};

[[nodiscard]] auto summarize(const Table& result, const CohortSpec& spec)
    -> Result<CohortSummary>;

/// The report text: total followed by one block per group.
[[nodiscard]] auto format_summary(const CohortSummary& summary, const CohortSpec& spec)
    -> std::string;

}  // namespace strata::pipeline
