#pragma once

#include <strata/ir/builder.hpp>
#include <strata/ir/node.hpp>

#include <cstddef>

namespace strata::ir {

/// Rule-based plan rewriter.
///
/// Each pass applies predicate pushdown, projection pruning and aggregate
/// fusion, in that order. Passes repeat until one leaves the plan untouched
/// or `max_passes` is reached. Rules return untouched subtrees by identity,
/// so a plan already in normal form comes back as the same pointer.
///
/// The optimizer never fails: a rewrite that cannot be rebuilt is logged
/// and the original subtree is kept.
class Optimizer {
   public:
    explicit Optimizer(std::size_t max_passes = 16) : max_passes_(max_passes) {}

    [[nodiscard]] auto optimize(const NodePtr& plan) -> NodePtr;

    [[nodiscard]] auto push_down_predicates(const NodePtr& plan) -> NodePtr;
    [[nodiscard]] auto prune_projections(const NodePtr& plan) -> NodePtr;
    [[nodiscard]] auto fuse_aggregates(const NodePtr& plan) -> NodePtr;

    /// Passes run by the last optimize() call, including the final no-op pass.
    [[nodiscard]] auto passes_run() const noexcept -> std::size_t { return passes_run_; }

   private:
    Builder builder_;
    std::size_t max_passes_;
    std::size_t passes_run_ = 0;
};

/// Convenience wrapper around Optimizer::optimize.
[[nodiscard]] auto optimize(const NodePtr& plan, std::size_t max_passes = 16) -> NodePtr;

}  // namespace strata::ir
