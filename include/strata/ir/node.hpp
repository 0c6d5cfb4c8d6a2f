#pragma once

#include <strata/core/schema.hpp>
#include <strata/ir/expr.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace strata::store {
class SourceHandle;
}

namespace strata::ir {

/// Unique identifier for plan nodes.
using NodeId = std::uint64_t;

class Node;
using NodePtr = std::shared_ptr<const Node>;

/// Supported aggregation functions.
enum class AggFunc : std::uint8_t {
    Count,
    Sum,
    Mean,
    Min,
    Max,
};

/// Aggregation specification: apply function to column, store as alias.
/// Count with an empty column counts rows; with a column it counts non-null values.
struct AggSpec {
    AggFunc func = AggFunc::Sum;
    std::string column;
    std::string alias;
};

/// Running statistics kept per group by the accumulator.
enum class Statistic : std::uint8_t {
    RowCount,
    ValidCount,
    Sum,
    Min,
    Max,
};

struct StatSlot {
    Statistic stat = Statistic::RowCount;
    std::string column;

    auto operator==(const StatSlot&) const -> bool = default;
};

/// Physical accumulator layout of a group-aggregate node.
///
/// `outputs[i]` lists the slots aggregation i reads at finalization: one
/// slot for count/sum/min/max, {sum, valid count} for mean.
struct AggregateLayout {
    std::vector<StatSlot> slots;
    std::vector<std::vector<std::size_t>> outputs;

    auto operator==(const AggregateLayout&) const -> bool = default;
};

/// Build the accumulator layout for `aggregations`. With `share` set, every
/// distinct (statistic, column) pair gets one slot that all readers share.
[[nodiscard]] auto make_layout(const std::vector<AggSpec>& aggregations, bool share)
    -> AggregateLayout;

[[nodiscard]] auto to_string(AggFunc func) noexcept -> std::string_view;
[[nodiscard]] auto to_string(Statistic stat) noexcept -> std::string_view;

/// Plan node types.
enum class NodeKind : std::uint8_t {
    Scan,
    Filter,
    Derive,
    GroupAggregate,
    Project,
};

/// Base plan node.
///
/// Represents a single relational operation in the query DAG. Nodes are
/// immutable: children and output schema are fixed at construction, and
/// rewrites build new nodes that share untouched subtrees.
class Node {
   public:
    Node(NodeKind kind, NodeId id, SchemaPtr schema, std::vector<NodePtr> children)
        : kind_(kind), id_(id), schema_(std::move(schema)), children_(std::move(children)) {}
    virtual ~Node() = default;

    Node(const Node&) = delete;
    auto operator=(const Node&) -> Node& = delete;

    [[nodiscard]] auto kind() const noexcept -> NodeKind { return kind_; }
    [[nodiscard]] auto id() const noexcept -> NodeId { return id_; }
    [[nodiscard]] auto schema() const noexcept -> const SchemaPtr& { return schema_; }
    [[nodiscard]] auto children() const noexcept -> const std::vector<NodePtr>& {
        return children_;
    }
    /// The single input of a unary node.
    [[nodiscard]] auto input() const -> const NodePtr& { return children_.at(0); }

   private:
    NodeKind kind_;
    NodeId id_;
    SchemaPtr schema_;
    std::vector<NodePtr> children_;
};

/// Scan node: reads the schema's columns from a column store source.
class ScanNode final : public Node {
   public:
    ScanNode(NodeId id, std::shared_ptr<store::SourceHandle> source, SchemaPtr schema)
        : Node(NodeKind::Scan, id, std::move(schema), {}), source_(std::move(source)) {}

    [[nodiscard]] auto source() const noexcept -> const std::shared_ptr<store::SourceHandle>& {
        return source_;
    }
    [[nodiscard]] auto source_name() const -> const std::string&;

   private:
    std::shared_ptr<store::SourceHandle> source_;
};

/// Filter node: keeps rows whose predicate is true.
class FilterNode final : public Node {
   public:
    FilterNode(NodeId id, NodePtr input, ExprPtr predicate)
        : Node(NodeKind::Filter, id, input->schema(), {input}), predicate_(std::move(predicate)) {}

    [[nodiscard]] auto predicate() const noexcept -> const ExprPtr& { return predicate_; }

   private:
    ExprPtr predicate_;
};

/// Derive node: appends one computed column.
class DeriveNode final : public Node {
   public:
    DeriveNode(NodeId id, NodePtr input, SchemaPtr schema, Field field, ExprPtr expr)
        : Node(NodeKind::Derive, id, std::move(schema), {std::move(input)}),
          field_(std::move(field)),
          expr_(std::move(expr)) {}

    [[nodiscard]] auto field() const noexcept -> const Field& { return field_; }
    [[nodiscard]] auto expr() const noexcept -> const ExprPtr& { return expr_; }

   private:
    Field field_;
    ExprPtr expr_;
};

/// Project node: keeps a subset of columns, in the listed order.
class ProjectNode final : public Node {
   public:
    ProjectNode(NodeId id, NodePtr input, SchemaPtr schema)
        : Node(NodeKind::Project, id, std::move(schema), {std::move(input)}) {}

    [[nodiscard]] auto columns() const -> std::vector<std::string> { return schema()->names(); }
};

/// Group-aggregate node: one output row per distinct group key.
class GroupAggregateNode final : public Node {
   public:
    GroupAggregateNode(NodeId id, NodePtr input, SchemaPtr schema,
                       std::vector<std::string> group_by, std::vector<AggSpec> aggregations,
                       AggregateLayout layout)
        : Node(NodeKind::GroupAggregate, id, std::move(schema), {std::move(input)}),
          group_by_(std::move(group_by)),
          aggregations_(std::move(aggregations)),
          layout_(std::move(layout)) {}

    [[nodiscard]] auto group_by() const noexcept -> const std::vector<std::string>& {
        return group_by_;
    }
    [[nodiscard]] auto aggregations() const noexcept -> const std::vector<AggSpec>& {
        return aggregations_;
    }
    [[nodiscard]] auto layout() const noexcept -> const AggregateLayout& { return layout_; }

   private:
    std::vector<std::string> group_by_;
    std::vector<AggSpec> aggregations_;
    AggregateLayout layout_;
};

/// Indented, id-free rendering of a plan; equal strings mean equal plans.
[[nodiscard]] auto explain(const Node& root) -> std::string;

}  // namespace strata::ir
