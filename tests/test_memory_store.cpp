#include <strata/store/column_store.hpp>
#include <strata/store/memory_store.hpp>

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include <string>
#include <vector>

using namespace strata;
using strata::testing::entry;

namespace {

auto readings() -> Table {
    auto schema = make_schema({{.name = "sensor", .type = DataType::Categorical},
                               {.name = "reading", .type = DataType::Float64},
                               {.name = "seq", .type = DataType::Int64}});
    auto first = testing::make_batch(
        schema, {entry(Column<Categorical>{"t1", "t2", "t1"}), entry(Column<double>{0.5, 1.5, 2.5}),
                 entry(Column<std::int64_t>{1, 2, 3})});
    auto second = testing::make_batch(
        schema, {entry(Column<Categorical>{"t3", "t2"}), entry(Column<double>{3.5, 4.5}),
                 entry(Column<std::int64_t>{4, 5})});
    return testing::make_table("readings", schema, {first, second});
}

auto drain(store::BatchReader& reader) -> std::vector<Batch> {
    std::vector<Batch> out;
    while (true) {
        auto batch = reader.next();
        REQUIRE(batch.has_value());
        if (!batch->has_value()) {
            return out;
        }
        out.push_back(std::move(**batch));
    }
}

}  // namespace

TEST_CASE("MemoryStore opens registered tables", "[store][memory]") {
    store::MemoryStore store;
    store.put("readings", readings());
    REQUIRE(store.contains("readings"));

    auto source = store.open("readings");
    REQUIRE(source.has_value());
    REQUIRE((*source)->name() == "readings");
    REQUIRE((*source)->schema()->size() == 3);
    REQUIRE((*source)->is_open());

    auto missing = store.open("nowhere");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().kind == ErrorKind::IO);
}

TEST_CASE("MemorySource re-chunks and projects", "[store][memory]") {
    auto source = testing::memory_source(readings());

    SECTION("batches never exceed the chunk size") {
        auto reader = source->read_batches({}, 2);
        REQUIRE(reader.has_value());
        auto batches = drain(**reader);
        std::vector<std::size_t> sizes;
        for (const auto& b : batches) {
            sizes.push_back(b.rows());
        }
        REQUIRE(sizes == std::vector<std::size_t>{2, 1, 2});
    }

    SECTION("columns come back in source order") {
        auto reader = source->read_batches({"seq", "sensor"}, 10);
        REQUIRE(reader.has_value());
        REQUIRE((*reader)->schema()->names() == std::vector<std::string>{"sensor", "seq"});
        auto batches = drain(**reader);
        REQUIRE(batches.size() == 2);
        REQUIRE(batches[0].num_columns() == 2);
    }

    SECTION("unknown columns are schema errors") {
        auto reader = source->read_batches({"humidity"}, 10);
        REQUIRE_FALSE(reader.has_value());
        REQUIRE(reader.error().kind == ErrorKind::Schema);
    }

    SECTION("every pass starts from the beginning") {
        auto first = source->read_batches({}, 10);
        auto second = source->read_batches({}, 10);
        REQUIRE(drain(**first).size() == 2);
        REQUIRE(drain(**second).size() == 2);
    }

    SECTION("closing fails outstanding readers") {
        auto reader = source->read_batches({}, 1);
        REQUIRE(reader.has_value());
        REQUIRE((*reader)->next().has_value());
        source->close();
        REQUIRE_FALSE(source->is_open());
        auto next = (*reader)->next();
        REQUIRE_FALSE(next.has_value());
        REQUIRE(next.error().kind == ErrorKind::IO);
        REQUIRE_FALSE(source->read_batches({}, 1).has_value());
    }
}

TEST_CASE("MemoryStore writes drained batches", "[store][memory]") {
    store::MemoryStore store;
    auto table = readings();

    auto written = store::write_table(store, "copy", table);
    REQUIRE(written.has_value());
    REQUIRE(*written == 5);

    auto source = store.open("copy");
    REQUIRE(source.has_value());
    auto reader = (*source)->read_batches({"reading"}, 100);
    REQUIRE(reader.has_value());
    auto batches = drain(**reader);
    Table copy("copy", (*reader)->schema());
    for (auto& b : batches) {
        REQUIRE(copy.append(std::move(b)).has_value());
    }
    auto values = testing::values(copy, "reading");
    REQUIRE(values.size() == 5);
    REQUIRE(std::get<double>(values.back()) == 4.5);
}

TEST_CASE("MemoryStore write rejects batches of another schema", "[store][memory][errors]") {
    store::MemoryStore store;
    auto table = readings();
    store::TableReader reader(table);
    auto other = make_schema({{.name = "reading", .type = DataType::Float64}});

    auto written = store.write("mismatch", reader, other);
    REQUIRE_FALSE(written.has_value());
    REQUIRE(written.error().kind == ErrorKind::IO);
}

TEST_CASE("project_schema resolves requested columns", "[store]") {
    auto schema = readings().schema();

    auto all = store::project_schema(schema, {});
    REQUIRE(all.has_value());
    REQUIRE(*all == schema);

    auto some = store::project_schema(schema, {"seq", "reading"});
    REQUIRE(some.has_value());
    REQUIRE((*some)->names() == std::vector<std::string>{"reading", "seq"});

    REQUIRE_FALSE(store::project_schema(schema, {"nope"}).has_value());
}
