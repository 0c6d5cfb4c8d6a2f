#pragma once

#include <strata/core/error.hpp>
#include <strata/core/table.hpp>
#include <strata/ir/node.hpp>
#include <strata/store/column_store.hpp>

#include <cstddef>
#include <memory>

namespace strata::runtime {

struct ExecutorConfig {
    /// Rows per batch pulled from the source; the only memory knob.
    std::size_t chunk_size = 65536;
    /// Run the optimizer before building streams.
    bool optimize = true;
    std::size_t max_optimizer_passes = 16;
};

/// Compute error when the configuration cannot drive a run.
[[nodiscard]] auto validate(const ExecutorConfig& config) -> Result<void>;

/// Pull-based operator stream. End of input is a nullopt batch, never an
/// error; streams never emit zero-row batches.
using BatchStream = store::BatchReader;
using StreamPtr = std::unique_ptr<BatchStream>;

/// Streaming plan executor.
///
/// Single-threaded and synchronous. Streaming operators hold at most one
/// input batch at a time; group-aggregate holds one accumulator entry per
/// distinct key and emits only after its input is exhausted.
class Executor {
   public:
    explicit Executor(ExecutorConfig config = {}) : config_(config) {}

    [[nodiscard]] auto config() const noexcept -> const ExecutorConfig& { return config_; }

    /// The plan that would run: optimized when config().optimize is set.
    [[nodiscard]] auto prepare(const ir::NodePtr& plan) const -> ir::NodePtr;

    /// Root stream of the prepared plan, for incremental consumption.
    [[nodiscard]] auto stream(const ir::NodePtr& plan) const -> Result<StreamPtr>;

    /// Drain the prepared plan into a table named after its source. Any
    /// error aborts the run and no table is returned.
    [[nodiscard]] auto execute(const ir::NodePtr& plan) const -> Result<Table>;

   private:
    ExecutorConfig config_;
};

/// Name of the source the plan scans.
[[nodiscard]] auto source_name(const ir::Node& plan) -> std::string;

}  // namespace strata::runtime
