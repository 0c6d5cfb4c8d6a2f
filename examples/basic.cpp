#include <strata/strata.hpp>

#include <fmt/core.h>

auto main() -> int {
    using namespace strata;

    // A small in-memory source with one nullable BMI value.
    auto schema = make_schema({
        {.name = "BMI", .type = DataType::Float64},
        {.name = "Glucose", .type = DataType::Float64},
        {.name = "Age", .type = DataType::Int64},
    });
    auto batch = Batch::make(
        schema, {
                    ColumnEntry{.column = std::make_shared<const ColumnValue>(
                                    Column<double>{17.0, 22.4, 24.9, 27.1, 30.0, 65.0}),
                                .validity = std::vector<bool>{true, true, true, true, true, false}},
                    ColumnEntry{.column = std::make_shared<const ColumnValue>(
                                    Column<double>{85.0, 99.0, 101.0, 120.0, 140.0, 90.0})},
                    ColumnEntry{.column = std::make_shared<const ColumnValue>(
                                    Column<std::int64_t>{23, 35, 41, 52, 60, 33})},
                });
    if (!batch) {
        fmt::print("error: {}\n", batch.error().format());
        return 1;
    }
    Table patients("patients", schema);
    if (auto ok = patients.append(std::move(*batch)); !ok) {
        fmt::print("error: {}\n", ok.error().format());
        return 1;
    }

    store::MemoryStore store;
    store.put("patients", std::move(patients));
    auto source = store.open("patients");
    if (!source) {
        fmt::print("error: {}\n", source.error().format());
        return 1;
    }

    pipeline::CohortSpec spec;
    ir::Builder builder;
    auto plan = pipeline::build_cohort_plan(builder, *source, spec);
    if (!plan) {
        fmt::print("error: {}\n", plan.error().format());
        return 1;
    }
    fmt::print("=== plan ===\n{}\n", ir::explain(**plan));
    fmt::print("=== optimized ===\n{}\n", ir::explain(*ir::optimize(*plan)));

    auto result = runtime::Executor({.chunk_size = 2}).execute(*plan);
    if (!result) {
        fmt::print("error: {}\n", result.error().format());
        return 1;
    }
    fmt::print("{}", format_table(*result));
    return 0;
}
