#include <strata/core/table.hpp>
#include <strata/pipeline/cohort.hpp>
#include <strata/pipeline/ingest.hpp>
#include <strata/store/parquet_store.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <string>

namespace {

// Removes the intermediate Parquet file however the run ends.
class TempFile {
   public:
    explicit TempFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFile() {
        if (path_.empty()) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec) {
            spdlog::warn("could not remove {}: {}", path_.string(), ec.message());
        }
    }
    TempFile(const TempFile&) = delete;
    auto operator=(const TempFile&) -> TempFile& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

   private:
    std::filesystem::path path_;
};

auto chunk_size_from_env() -> std::size_t {
    const char* env = std::getenv("STRATA_CHUNK_SIZE");
    if (env == nullptr) {
        return strata::runtime::ExecutorConfig{}.chunk_size;
    }
    char* end = nullptr;
    auto value = std::strtoull(env, &end, 10);
    if (end == env || *end != '\0' || value == 0) {
        spdlog::warn("ignoring invalid STRATA_CHUNK_SIZE '{}'", env);
        return strata::runtime::ExecutorConfig{}.chunk_size;
    }
    return static_cast<std::size_t>(value);
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"strata_cohort - bucketed cohort statistics over a CSV or Parquet file"};

    strata::pipeline::CohortSpec spec;
    strata::runtime::ExecutorConfig config;
    config.chunk_size = chunk_size_from_env();

    std::string input;
    bool verbose = false;
    bool no_optimize = false;
    app.add_option("-i,--input", input, "Input .csv or .parquet file")->required();
    app.add_option("--chunk-size", config.chunk_size,
                   "Rows per batch. Defaults to STRATA_CHUNK_SIZE or 65536.")
        ->check(CLI::PositiveNumber);
    app.add_option("--field", spec.field, "Numeric field to bucket");
    app.add_option("--min", spec.min_value, "Drop rows with field below this value");
    app.add_option("--max", spec.max_value, "Drop rows with field above this value");
    app.add_flag("--no-optimize", no_optimize, "Execute the plan as built");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    config.optimize = !no_optimize;

    std::filesystem::path source_path(input);
    if (!std::filesystem::exists(source_path)) {
        fmt::print(stderr, "Error: input file {} not found\n", input);
        return 1;
    }

    TempFile temp{source_path.extension() == ".csv"
                      ? std::filesystem::temp_directory_path() /
                            fmt::format("strata_{}.parquet", source_path.stem().string())
                      : std::filesystem::path{}};
    if (!temp.path().empty()) {
        auto converted = strata::pipeline::convert_csv_to_parquet(
            source_path.string(), temp.path().string(), config.chunk_size);
        if (!converted) {
            fmt::print(stderr, "Error: {}\n", converted.error().format());
            return 1;
        }
        source_path = temp.path();
    }

    strata::store::ParquetStore store;
    auto source = store.open(source_path.string());
    if (!source) {
        fmt::print(stderr, "Error: {}\n", source.error().format());
        return 1;
    }
    auto result = strata::pipeline::run_cohort_analysis(*source, spec, config);
    if (!result) {
        fmt::print(stderr, "Error: {}\n", result.error().format());
        return 1;
    }

    fmt::print("\nCohort Analysis Summary:\n{}", strata::format_table(*result));
    auto summary = strata::pipeline::summarize(*result, spec);
    if (!summary) {
        fmt::print(stderr, "Error: {}\n", summary.error().format());
        return 1;
    }
    fmt::print("\n{}", strata::pipeline::format_summary(*summary, spec));
    return 0;
}
