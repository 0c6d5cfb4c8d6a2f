#include <strata/store/csv_import.hpp>
#include <strata/store/memory_store.hpp>

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include <string>
#include <vector>

using namespace strata;
using strata::testing::TempPath;

namespace {

constexpr std::string_view kPatientsCsv =
    "Name,Age,BMI,Glucose,Ward\n"
    "ann,30,24.9,100,north\n"
    "bob,50,30,,north\n"
    "cy,40,22,110,south\n"
    "dee,70,5,NA,north\n";

}  // namespace

TEST_CASE("import_csv infers column types", "[store][csv]") {
    TempPath csv(".csv");
    csv.write(kPatientsCsv);

    auto table = store::import_csv(csv.string(), 2, store::parse_null_spec("<empty>,NA"));
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 4);
    REQUIRE(table->num_batches() == 2);

    const auto& schema = *table->schema();
    REQUIRE(schema.names() == std::vector<std::string>{"Name", "Age", "BMI", "Glucose", "Ward"});
    REQUIRE(schema.field(1).type == DataType::Int64);
    REQUIRE(schema.field(2).type == DataType::Float64);
    REQUIRE(schema.field(3).type == DataType::Int64);

    auto glucose = testing::values(*table, "Glucose");
    REQUIRE(std::get<std::int64_t>(glucose[0]) == 100);
    REQUIRE(is_null(glucose[1]));
    REQUIRE(is_null(glucose[3]));

    auto bmi = testing::values(*table, "BMI");
    REQUIRE(std::get<double>(bmi[1]) == 30.0);
}

TEST_CASE("Null spec parsing", "[store][csv]") {
    auto options = store::parse_null_spec("<empty>, NA ,null");
    REQUIRE(options.null_if_empty);
    REQUIRE(options.null_tokens.contains("NA"));
    REQUIRE(options.null_tokens.contains("null"));

    auto strict = store::parse_null_spec("NA");
    REQUIRE_FALSE(strict.null_if_empty);
}

TEST_CASE("Text columns without empty-cell nulls stay text", "[store][csv]") {
    TempPath csv(".csv");
    csv.write("code,label\n1,a\n2,\n3,c\n");

    store::CsvOptions options;
    options.null_if_empty = false;
    options.detect_categorical = false;
    auto table = store::import_csv(csv.string(), 10, options);
    REQUIRE(table.has_value());
    REQUIRE(table->schema()->field(1).type == DataType::String);
    auto labels = testing::values(*table, "label");
    REQUIRE(std::get<std::string>(labels[1]).empty());
}

TEST_CASE("Low-cardinality text becomes categorical", "[store][csv]") {
    TempPath csv(".csv");
    std::string text = "ward,id\n";
    for (int i = 0; i < 200; ++i) {
        text += fmt::format("{},{}\n", i % 2 == 0 ? "north" : "south", i);
    }
    csv.write(text);

    auto table = store::import_csv(csv.string(), 64);
    REQUIRE(table.has_value());
    REQUIRE(table->schema()->field(0).type == DataType::Categorical);
    REQUIRE(table->num_batches() == 4);
    auto wards = testing::values(*table, "ward");
    REQUIRE(std::get<std::string>(wards[199]) == "south");
}

TEST_CASE("import_csv reports unreadable input as IO errors", "[store][csv][errors]") {
    auto missing = store::import_csv("/nonexistent/strata/patients.csv", 16);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().kind == ErrorKind::IO);

    TempPath csv(".csv");
    csv.write(kPatientsCsv);
    auto zero = store::import_csv(csv.string(), 0);
    REQUIRE_FALSE(zero.has_value());
    REQUIRE(zero.error().kind == ErrorKind::IO);
}

TEST_CASE("convert_csv writes through a column store", "[store][csv]") {
    TempPath csv(".csv");
    csv.write(kPatientsCsv);

    store::MemoryStore memory;
    auto rows = store::convert_csv(memory, csv.string(), "patients", 3);
    REQUIRE(rows.has_value());
    REQUIRE(*rows == 4);

    auto source = memory.open("patients");
    REQUIRE(source.has_value());
    REQUIRE((*source)->schema()->size() == 5);
}
