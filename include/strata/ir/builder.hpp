#pragma once

#include <strata/core/error.hpp>
#include <strata/ir/node.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace strata::ir {

/// Factory for plan nodes.
///
/// Every constructor validates its arguments against the input schema and
/// propagates the output schema; schema errors surface here, never at
/// execution time. Building never touches data.
class Builder {
   public:
    Builder() = default;

    /// Scan every column of `source`.
    [[nodiscard]] auto scan(std::shared_ptr<store::SourceHandle> source) -> Result<NodePtr>;

    /// Scan `schema`'s columns, which must exist in `source` with equal types.
    /// The scan's output lists them in source order, not in `schema`'s order;
    /// project() over the scan restores a caller-chosen order.
    [[nodiscard]] auto scan(std::shared_ptr<store::SourceHandle> source, SchemaPtr schema)
        -> Result<NodePtr>;

    [[nodiscard]] auto filter(NodePtr input, ExprPtr predicate) -> Result<NodePtr>;

    [[nodiscard]] auto derive_column(NodePtr input, std::string name, ExprPtr expr,
                                     DataType type) -> Result<NodePtr>;

    /// Derive a column from an opaque per-row function reading `inputs`.
    [[nodiscard]] auto derive_column(NodePtr input, std::string name, DataType type,
                                     std::vector<std::string> inputs, RowFn fn)
        -> Result<NodePtr>;

    [[nodiscard]] auto group_aggregate(NodePtr input, std::vector<std::string> group_by,
                                       std::vector<AggSpec> aggregations) -> Result<NodePtr>;

    [[nodiscard]] auto project(NodePtr input, std::vector<std::string> columns)
        -> Result<NodePtr>;

    /// Rebuild `node` (any kind but Scan) over a different input,
    /// re-validating and re-deriving its schema.
    [[nodiscard]] auto with_input(const Node& node, NodePtr input) -> Result<NodePtr>;

    /// Copy of `node` with a different accumulator layout.
    [[nodiscard]] auto with_layout(const GroupAggregateNode& node, AggregateLayout layout)
        -> NodePtr;

    /// Copy of `node` computing only `aggregations`.
    [[nodiscard]] auto with_aggregations(const GroupAggregateNode& node,
                                         std::vector<AggSpec> aggregations) -> Result<NodePtr>;

   private:
    [[nodiscard]] auto next_id() -> NodeId {
        return next_id_.fetch_add(1, std::memory_order_relaxed);
    }

    std::atomic<NodeId> next_id_{1};
};

}  // namespace strata::ir
