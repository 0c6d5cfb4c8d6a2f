#include <strata/pipeline/cohort.hpp>
#include <strata/pipeline/ingest.hpp>
#include <strata/store/parquet_store.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include <string>

using namespace strata;
using strata::testing::TempPath;

TEST_CASE("CSV converts to Parquet and feeds the cohort report", "[pipeline][ingest]") {
    TempPath csv(".csv");
    TempPath parquet(".parquet");
    csv.write(
        "Pregnancies,Glucose,BloodPressure,BMI,Age,Outcome\n"
        "1,100,70,24.9,30,0\n"
        "2,150,80,30.0,50,1\n"
        "0,110,60,22.0,40,0\n"
        "3,200,90,5.0,70,1\n"
        "1,90,65,61.0,20,0\n");

    auto rows = pipeline::convert_csv_to_parquet(csv.string(), parquet.string(), 2);
    REQUIRE(rows.has_value());
    REQUIRE(*rows == 5);

    store::ParquetStore store;
    auto source = store.open(parquet.string());
    REQUIRE(source.has_value());

    pipeline::CohortSpec spec;
    auto result = pipeline::run_cohort_analysis(*source, spec, {.chunk_size = 2});
    REQUIRE(result.has_value());
    auto summary = pipeline::summarize(*result, spec);
    REQUIRE(summary.has_value());
    REQUIRE(summary->total == 3);
    REQUIRE(summary->rows.rows() == 2);

    auto glucose = value_at(*summary->rows.find("avg_glucose"), 0);
    REQUIRE(std::get<double>(glucose) == Catch::Approx(105.0));
}

TEST_CASE("Conversion of a missing CSV fails with an IO error", "[pipeline][ingest][errors]") {
    TempPath parquet(".parquet");
    auto rows = pipeline::convert_csv_to_parquet("/nonexistent/strata/in.csv", parquet.string());
    REQUIRE_FALSE(rows.has_value());
    REQUIRE(rows.error().kind == ErrorKind::IO);
}
