#include <strata/ir/builder.hpp>
#include <strata/runtime/executor.hpp>
#include <strata/store/parquet_store.hpp>

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include <string>
#include <vector>

using namespace strata;
using strata::testing::entry;
using strata::testing::TempPath;

namespace {

auto visits() -> Table {
    auto schema = make_schema({{.name = "patient", .type = DataType::String},
                               {.name = "ward", .type = DataType::Categorical},
                               {.name = "age", .type = DataType::Int64},
                               {.name = "bmi", .type = DataType::Float64}});
    auto first = testing::make_batch(
        schema, {entry(Column<std::string>{"ann", "bob", "cy"}),
                 entry(Column<Categorical>{"north", "south", "north"}),
                 entry(Column<std::int64_t>{30, 50, 40}),
                 entry(Column<double>{24.9, 0.0, 22.0}, std::vector<bool>{true, false, true})});
    auto second = testing::make_batch(
        schema, {entry(Column<std::string>{"dee", "eve"}),
                 entry(Column<Categorical>{"east", "north"}),
                 entry(Column<std::int64_t>{70, 20}), entry(Column<double>{31.0, 18.0})});
    return testing::make_table("visits", schema, {first, second});
}

}  // namespace

TEST_CASE("ParquetStore round-trips types and nulls", "[store][parquet]") {
    TempPath file(".parquet");
    store::ParquetStore parquet;

    auto written = store::write_table(parquet, file.string(), visits());
    REQUIRE(written.has_value());
    REQUIRE(*written == 5);

    auto source = parquet.open(file.string());
    REQUIRE(source.has_value());
    const auto& schema = *(*source)->schema();
    REQUIRE(schema.names() == std::vector<std::string>{"patient", "ward", "age", "bmi"});
    REQUIRE(schema.field(0).type == DataType::String);
    REQUIRE(schema.field(1).type == DataType::Categorical);
    REQUIRE(schema.field(2).type == DataType::Int64);
    REQUIRE(schema.field(3).type == DataType::Float64);

    ir::Builder builder;
    auto plan = *builder.scan(*source);
    runtime::Executor executor({.chunk_size = 2, .optimize = false});
    auto table = executor.execute(plan);
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 5);
    for (const auto& batch : table->batches()) {
        REQUIRE(batch.rows() <= 2);
    }

    auto wards = testing::values(*table, "ward");
    REQUIRE(std::get<std::string>(wards[3]) == "east");
    auto bmi = testing::values(*table, "bmi");
    REQUIRE(is_null(bmi[1]));
    REQUIRE(std::get<double>(bmi[4]) == 18.0);
}

TEST_CASE("ParquetStore reads only requested columns", "[store][parquet]") {
    TempPath file(".parquet");
    store::ParquetStore parquet;
    REQUIRE(store::write_table(parquet, file.string(), visits()).has_value());

    auto source = parquet.open(file.string());
    REQUIRE(source.has_value());
    auto reader = (*source)->read_batches({"bmi", "patient"}, 100);
    REQUIRE(reader.has_value());
    REQUIRE((*reader)->schema()->names() == std::vector<std::string>{"patient", "bmi"});

    std::size_t rows = 0;
    while (true) {
        auto batch = (*reader)->next();
        REQUIRE(batch.has_value());
        if (!batch->has_value()) {
            break;
        }
        REQUIRE((*batch)->num_columns() == 2);
        rows += (*batch)->rows();
    }
    REQUIRE(rows == 5);
}

TEST_CASE("ParquetStore errors", "[store][parquet][errors]") {
    store::ParquetStore parquet;

    SECTION("missing file") {
        auto source = parquet.open("/nonexistent/strata/visits.parquet");
        REQUIRE_FALSE(source.has_value());
        REQUIRE(source.error().kind == ErrorKind::IO);
    }

    SECTION("not a parquet file") {
        TempPath file(".parquet");
        file.write("definitely not parquet");
        auto source = parquet.open(file.string());
        REQUIRE_FALSE(source.has_value());
        REQUIRE(source.error().kind == ErrorKind::IO);
    }

    SECTION("batch that does not match the declared schema") {
        TempPath file(".parquet");
        auto table = visits();
        store::TableReader reader(table);
        auto other = make_schema({{.name = "patient", .type = DataType::String}});
        auto written = parquet.write(file.string(), reader, other);
        REQUIRE_FALSE(written.has_value());
        REQUIRE(written.error().kind == ErrorKind::IO);
    }

    SECTION("closed handle") {
        TempPath file(".parquet");
        REQUIRE(store::write_table(parquet, file.string(), visits()).has_value());
        auto source = parquet.open(file.string());
        REQUIRE(source.has_value());
        auto reader = (*source)->read_batches({}, 1);
        REQUIRE(reader.has_value());
        REQUIRE((*reader)->next().has_value());
        (*source)->close();
        auto next = (*reader)->next();
        REQUIRE_FALSE(next.has_value());
        REQUIRE(next.error().kind == ErrorKind::IO);
    }
}
