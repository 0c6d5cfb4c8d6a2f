#include <strata/ir/builder.hpp>
#include <strata/runtime/aggregator.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace strata;
using strata::testing::entry;

namespace {

auto sales_schema() -> SchemaPtr {
    return make_schema({{.name = "region", .type = DataType::Categorical},
                        {.name = "units", .type = DataType::Int64},
                        {.name = "price", .type = DataType::Float64}});
}

// region A: units 10, 20; region B: units 5. price is null for the last A row.
auto sales_table() -> Table {
    auto schema = sales_schema();
    auto first = testing::make_batch(
        schema, {entry(Column<Categorical>{"A", "B"}), entry(Column<std::int64_t>{10, 5}),
                 entry(Column<double>{1.5, 4.0})});
    auto second = testing::make_batch(
        schema, {entry(Column<Categorical>{"A"}), entry(Column<std::int64_t>{20}),
                 entry(Column<double>{0.0}, std::vector<bool>{false})});
    return testing::make_table("sales", schema, {first, second});
}

auto aggregate_node(ir::Builder& builder, const Table& table, std::vector<std::string> keys,
                    std::vector<ir::AggSpec> aggs)
    -> std::shared_ptr<const ir::GroupAggregateNode> {
    auto scan = *builder.scan(testing::memory_source(table));
    auto node = builder.group_aggregate(scan, std::move(keys), std::move(aggs));
    if (!node) {
        throw std::runtime_error(node.error().format());
    }
    return std::static_pointer_cast<const ir::GroupAggregateNode>(*node);
}

auto run(const ir::GroupAggregateNode& node, const Table& table) -> Batch {
    runtime::GroupAccumulator acc(node, node.schema());
    for (const auto& batch : table.batches()) {
        auto ok = acc.consume(batch);
        if (!ok) {
            throw std::runtime_error(ok.error().format());
        }
    }
    auto out = acc.finalize();
    if (!out) {
        throw std::runtime_error(out.error().format());
    }
    return std::move(*out);
}

auto cell(const Batch& batch, std::string_view column, std::size_t row) -> ScalarValue {
    return value_at(*batch.find(column), row);
}

}  // namespace

TEST_CASE("GroupAccumulator groups in first-seen order", "[runtime][aggregate]") {
    ir::Builder builder;
    auto table = sales_table();
    auto node = aggregate_node(
        builder, table, {"region"},
        {{.func = ir::AggFunc::Count, .column = "", .alias = "n"},
         {.func = ir::AggFunc::Mean, .column = "units", .alias = "avg_units"},
         {.func = ir::AggFunc::Sum, .column = "units", .alias = "total"},
         {.func = ir::AggFunc::Min, .column = "units", .alias = "least"},
         {.func = ir::AggFunc::Max, .column = "price", .alias = "top"}});

    auto out = run(*node, table);
    REQUIRE(out.rows() == 2);
    REQUIRE(out.find("region")->column->index() == 2);  // Categorical

    REQUIRE(std::get<std::string>(cell(out, "region", 0)) == "A");
    REQUIRE(std::get<std::int64_t>(cell(out, "n", 0)) == 2);
    REQUIRE(std::get<double>(cell(out, "avg_units", 0)) == Catch::Approx(15.0));
    REQUIRE(std::get<std::int64_t>(cell(out, "total", 0)) == 30);
    REQUIRE(std::get<std::int64_t>(cell(out, "least", 0)) == 10);
    REQUIRE(std::get<double>(cell(out, "top", 0)) == Catch::Approx(1.5));

    REQUIRE(std::get<std::string>(cell(out, "region", 1)) == "B");
    REQUIRE(std::get<std::int64_t>(cell(out, "n", 1)) == 1);
    REQUIRE(std::get<double>(cell(out, "avg_units", 1)) == Catch::Approx(5.0));
}

TEST_CASE("Mean skips nulls and divides by the non-null count", "[runtime][aggregate]") {
    ir::Builder builder;
    auto table = sales_table();
    auto node = aggregate_node(
        builder, table, {"region"},
        {{.func = ir::AggFunc::Mean, .column = "price", .alias = "avg_price"},
         {.func = ir::AggFunc::Count, .column = "price", .alias = "priced"}});

    auto out = run(*node, table);
    REQUIRE(std::get<double>(cell(out, "avg_price", 0)) == Catch::Approx(1.5));
    REQUIRE(std::get<std::int64_t>(cell(out, "priced", 0)) == 1);
}

TEST_CASE("Empty and all-null inputs", "[runtime][aggregate]") {
    ir::Builder builder;
    auto schema = sales_schema();
    std::vector<bool> none{false, false};
    auto nulls = testing::make_table(
        "nulls", schema,
        {testing::make_batch(schema, {entry(Column<Categorical>{"A", "A"}),
                                      entry(Column<std::int64_t>{0, 0}, none),
                                      entry(Column<double>{0.0, 0.0}, none)})});

    std::vector<ir::AggSpec> aggs{
        {.func = ir::AggFunc::Sum, .column = "units", .alias = "total"},
        {.func = ir::AggFunc::Mean, .column = "price", .alias = "avg_price"},
        {.func = ir::AggFunc::Min, .column = "price", .alias = "least"},
        {.func = ir::AggFunc::Count, .column = "", .alias = "n"}};

    SECTION("all-null group") {
        auto node = aggregate_node(builder, nulls, {"region"}, aggs);
        auto out = run(*node, nulls);
        REQUIRE(out.rows() == 1);
        REQUIRE(std::get<std::int64_t>(cell(out, "total", 0)) == 0);
        REQUIRE(is_null(cell(out, "avg_price", 0)));
        REQUIRE(is_null(cell(out, "least", 0)));
        REQUIRE(std::get<std::int64_t>(cell(out, "n", 0)) == 2);
    }

    SECTION("grouped aggregate over no rows is empty") {
        Table empty("empty", schema);
        auto node = aggregate_node(builder, empty, {"region"}, aggs);
        auto out = run(*node, empty);
        REQUIRE(out.rows() == 0);
    }

    SECTION("global aggregate over no rows has one row") {
        Table empty("empty", schema);
        auto node = aggregate_node(builder, empty, {}, aggs);
        auto out = run(*node, empty);
        REQUIRE(out.rows() == 1);
        REQUIRE(std::get<std::int64_t>(cell(out, "n", 0)) == 0);
        REQUIRE(is_null(cell(out, "avg_price", 0)));
    }
}

TEST_CASE("Null keys form their own group", "[runtime][aggregate]") {
    ir::Builder builder;
    auto schema = make_schema({{.name = "k", .type = DataType::Int64},
                               {.name = "v", .type = DataType::Int64}});
    auto table = testing::make_table(
        "t", schema,
        {testing::make_batch(schema, {entry(Column<std::int64_t>{1, 0, 1, 0},
                                            std::vector<bool>{true, false, true, false}),
                                      entry(Column<std::int64_t>{1, 2, 3, 4})})});
    auto node = aggregate_node(builder, table, {"k"},
                               {{.func = ir::AggFunc::Sum, .column = "v", .alias = "s"}});

    auto out = run(*node, table);
    REQUIRE(out.rows() == 2);
    REQUIRE(std::get<std::int64_t>(cell(out, "k", 0)) == 1);
    REQUIRE(std::get<std::int64_t>(cell(out, "s", 0)) == 4);
    REQUIRE(is_null(cell(out, "k", 1)));
    REQUIRE(std::get<std::int64_t>(cell(out, "s", 1)) == 6);
}

TEST_CASE("NaN keys share one group", "[runtime][aggregate]") {
    ir::Builder builder;
    constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
    auto schema = make_schema({{.name = "k", .type = DataType::Float64},
                               {.name = "v", .type = DataType::Int64}});
    auto table = testing::make_table(
        "t", schema,
        {testing::make_batch(schema, {entry(Column<double>{kNaN, 2.0, kNaN}),
                                      entry(Column<std::int64_t>{1, 2, 3})}),
         testing::make_batch(schema, {entry(Column<double>{-kNaN}),
                                      entry(Column<std::int64_t>{4})})});
    auto node = aggregate_node(builder, table, {"k"},
                               {{.func = ir::AggFunc::Sum, .column = "v", .alias = "s"}});

    auto out = run(*node, table);
    REQUIRE(out.rows() == 2);
    REQUIRE(std::isnan(std::get<double>(cell(out, "k", 0))));
    REQUIRE(std::get<std::int64_t>(cell(out, "s", 0)) == 8);
    REQUIRE(std::get<double>(cell(out, "k", 1)) == 2.0);
}

TEST_CASE("Integer sum overflow is a compute error", "[runtime][aggregate]") {
    ir::Builder builder;
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    auto schema = make_schema({{.name = "v", .type = DataType::Int64}});
    auto table = testing::make_table(
        "t", schema, {testing::make_batch(schema, {entry(Column<std::int64_t>{kMax, 1})})});
    auto node = aggregate_node(builder, table, {},
                               {{.func = ir::AggFunc::Sum, .column = "v", .alias = "s"}});

    runtime::GroupAccumulator acc(*node, node->schema());
    auto ok = acc.consume(table.batches().front());
    REQUIRE_FALSE(ok.has_value());
    REQUIRE(ok.error().kind == ErrorKind::Compute);
}

TEST_CASE("Shared layouts produce the same results", "[runtime][aggregate]") {
    ir::Builder builder;
    auto table = sales_table();
    auto node = aggregate_node(builder, table, {"region"},
                               {{.func = ir::AggFunc::Mean, .column = "units", .alias = "avg"},
                                {.func = ir::AggFunc::Sum, .column = "units", .alias = "total"},
                                {.func = ir::AggFunc::Count, .column = "units", .alias = "n"}});
    auto fused_ptr = builder.with_layout(*node, ir::make_layout(node->aggregations(), true));
    const auto& fused = static_cast<const ir::GroupAggregateNode&>(*fused_ptr);

    runtime::GroupAccumulator separate(*node, node->schema());
    runtime::GroupAccumulator shared(fused, fused.schema());
    REQUIRE(separate.slot_count() == 4);
    REQUIRE(shared.slot_count() == 2);

    auto a = run(*node, table);
    auto b = run(fused, table);
    Table ta("a", a.schema());
    Table tb("b", b.schema());
    REQUIRE(ta.append(a).has_value());
    REQUIRE(tb.append(b).has_value());
    REQUIRE(testing::rows_of(ta) == testing::rows_of(tb));
}

TEST_CASE("Accumulator memory follows distinct keys", "[runtime][aggregate]") {
    ir::Builder builder;
    auto schema = make_schema({{.name = "k", .type = DataType::Int64}});
    Table table("keys", schema);
    for (int b = 0; b < 10; ++b) {
        Column<std::int64_t> keys;
        for (int i = 0; i < 100; ++i) {
            keys.push_back(i % 3);
        }
        REQUIRE(table.append(testing::make_batch(schema, {entry(std::move(keys))})).has_value());
    }
    auto node = aggregate_node(builder, table, {"k"},
                               {{.func = ir::AggFunc::Count, .column = "", .alias = "n"}});

    runtime::GroupAccumulator acc(*node, node->schema());
    for (const auto& batch : table.batches()) {
        REQUIRE(acc.consume(batch).has_value());
    }
    REQUIRE(acc.group_count() == 3);
}
