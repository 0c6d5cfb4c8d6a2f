#include <strata/ir/optimizer.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace strata::ir {

namespace {

using ColumnSet = std::unordered_set<std::string>;

// NOLINTBEGIN cppcoreguidelines-pro-type-static-cast-downcast

auto references_only(const ExprPtr& expr, const ColumnSet& allowed) -> bool {
    auto columns = referenced_columns(*expr);
    return std::all_of(columns.begin(), columns.end(),
                       [&](const std::string& c) { return allowed.contains(c); });
}

auto references(const ExprPtr& expr, const std::string& column) -> bool {
    auto columns = referenced_columns(*expr);
    return std::find(columns.begin(), columns.end(), column) != columns.end();
}

/// Whether `conjunct`, sitting directly above `node`, may move below it.
auto can_sink_below(const Node& node, const ExprPtr& conjunct) -> bool {
    switch (node.kind()) {
        case NodeKind::Scan:
        case NodeKind::Filter:
            return false;
        case NodeKind::Project:
            return true;
        case NodeKind::Derive:
            return !references(conjunct, static_cast<const DeriveNode&>(node).field().name);
        case NodeKind::GroupAggregate: {
            const auto& agg = static_cast<const GroupAggregateNode&>(node);
            // A global aggregate emits a row even when every input row is filtered out.
            if (agg.group_by().empty()) {
                return false;
            }
            ColumnSet keys(agg.group_by().begin(), agg.group_by().end());
            return references_only(conjunct, keys);
        }
    }
    return false;
}

class PushdownRule {
   public:
    explicit PushdownRule(Builder& builder) : builder_(&builder) {}

    auto apply(const NodePtr& node) -> Result<NodePtr> {
        if (node->kind() == NodeKind::Scan) {
            return node;
        }
        auto child = apply(node->input());
        if (!child) {
            return child;
        }
        if (node->kind() != NodeKind::Filter) {
            return rebuild(node, *child);
        }
        const auto& filter = static_cast<const FilterNode&>(*node);
        auto conjuncts = split_conjuncts(filter.predicate());
        const auto& below = **child;
        bool merges = below.kind() == NodeKind::Filter;
        bool moves = !conjuncts.empty() && can_sink_below(below, conjuncts.front());
        if (!merges && !moves) {
            return rebuild(node, *child);
        }
        spdlog::debug("pushdown: sinking {} conjunct(s) of filter below {}", conjuncts.size(),
                      explain_kind(below));
        return sink(*child, std::move(conjuncts));
    }

   private:
    static auto explain_kind(const Node& node) -> std::string_view {
        switch (node.kind()) {
            case NodeKind::Scan:
                return "scan";
            case NodeKind::Filter:
                return "filter";
            case NodeKind::Derive:
                return "derive";
            case NodeKind::GroupAggregate:
                return "group_aggregate";
            case NodeKind::Project:
                return "project";
        }
        return "node";
    }

    auto rebuild(const NodePtr& node, const NodePtr& child) -> Result<NodePtr> {
        if (child == node->input()) {
            return node;
        }
        return builder_->with_input(*node, child);
    }

    /// Place `conjuncts` as a filter over `input`, as deep as each may go.
    /// Only a leading run of conjuncts moves below `input`, so no conjunct
    /// is evaluated on rows an earlier one would have short-circuited.
    auto sink(const NodePtr& input, std::vector<ExprPtr> conjuncts) -> Result<NodePtr> {
        if (conjuncts.empty()) {
            return input;
        }
        if (input->kind() == NodeKind::Filter) {
            const auto& lower = static_cast<const FilterNode&>(*input);
            auto merged = split_conjuncts(lower.predicate());
            merged.insert(merged.end(), conjuncts.begin(), conjuncts.end());
            return sink(input->input(), std::move(merged));
        }
        auto first_stay =
            std::find_if_not(conjuncts.begin(), conjuncts.end(),
                             [&](const ExprPtr& c) { return can_sink_below(*input, c); });
        std::vector<ExprPtr> movable(conjuncts.begin(), first_stay);
        std::vector<ExprPtr> stay(first_stay, conjuncts.end());
        NodePtr base = input;
        if (!movable.empty()) {
            auto lowered = sink(input->input(), std::move(movable));
            if (!lowered) {
                return lowered;
            }
            auto rebuilt = builder_->with_input(*input, *lowered);
            if (!rebuilt) {
                return rebuilt;
            }
            base = std::move(*rebuilt);
        }
        if (stay.empty()) {
            return base;
        }
        return builder_->filter(std::move(base), conjoin(stay));
    }

    Builder* builder_;
};

class PruneRule {
   public:
    explicit PruneRule(Builder& builder) : builder_(&builder) {}

    auto apply(const NodePtr& node, const ColumnSet& required) -> Result<NodePtr> {
        switch (node->kind()) {
            case NodeKind::Scan:
                return prune_scan(node, required);
            case NodeKind::Filter: {
                const auto& filter = static_cast<const FilterNode&>(*node);
                ColumnSet needed = required;
                for (auto& c : referenced_columns(*filter.predicate())) {
                    needed.insert(std::move(c));
                }
                return over(node, needed);
            }
            case NodeKind::Derive: {
                const auto& derive = static_cast<const DeriveNode&>(*node);
                if (!required.contains(derive.field().name)) {
                    spdlog::debug("prune: dropping unused derived column '{}'",
                                  derive.field().name);
                    return apply(node->input(), required);
                }
                ColumnSet needed = required;
                needed.erase(derive.field().name);
                for (auto& c : referenced_columns(*derive.expr())) {
                    needed.insert(std::move(c));
                }
                return over(node, needed);
            }
            case NodeKind::Project:
                return prune_project(node, required);
            case NodeKind::GroupAggregate:
                return prune_aggregate(node, required);
        }
        return node;
    }

   private:
    auto over(const NodePtr& node, const ColumnSet& needed) -> Result<NodePtr> {
        auto child = apply(node->input(), needed);
        if (!child) {
            return child;
        }
        if (*child == node->input()) {
            return node;
        }
        return builder_->with_input(*node, *child);
    }

    auto prune_scan(const NodePtr& node, const ColumnSet& required) -> Result<NodePtr> {
        const auto& scan = static_cast<const ScanNode&>(*node);
        const auto& fields = scan.schema()->fields();
        std::vector<Field> kept;
        for (const auto& field : fields) {
            if (required.contains(field.name)) {
                kept.push_back(field);
            }
        }
        if (kept.empty()) {
            kept.push_back(fields.front());
        }
        if (kept.size() == fields.size()) {
            return node;
        }
        spdlog::debug("prune: scan {} reads {} of {} column(s)", scan.source_name(), kept.size(),
                      fields.size());
        return builder_->scan(scan.source(), make_schema(std::move(kept)));
    }

    auto prune_project(const NodePtr& node, const ColumnSet& required) -> Result<NodePtr> {
        const auto& project = static_cast<const ProjectNode&>(*node);
        auto columns = project.columns();
        std::vector<std::string> kept;
        for (const auto& c : columns) {
            if (required.contains(c)) {
                kept.push_back(c);
            }
        }
        if (kept.empty()) {
            kept.push_back(columns.front());
        }
        auto child = apply(node->input(), ColumnSet(kept.begin(), kept.end()));
        if (!child) {
            return child;
        }
        if ((*child)->schema()->names() == kept) {
            spdlog::debug("prune: dropping identity project [{}]", fmt::join(kept, ", "));
            return child;
        }
        if (kept == columns && *child == node->input()) {
            return node;
        }
        return builder_->project(std::move(*child), std::move(kept));
    }

    auto prune_aggregate(const NodePtr& node, const ColumnSet& required) -> Result<NodePtr> {
        const auto& agg = static_cast<const GroupAggregateNode&>(*node);
        std::vector<AggSpec> kept;
        for (const auto& spec : agg.aggregations()) {
            if (required.contains(spec.alias)) {
                kept.push_back(spec);
            }
        }
        if (kept.empty() && agg.group_by().empty()) {
            kept.push_back(agg.aggregations().front());
        }
        ColumnSet needed(agg.group_by().begin(), agg.group_by().end());
        for (const auto& spec : kept) {
            if (!spec.column.empty()) {
                needed.insert(spec.column);
            }
        }
        auto child = apply(node->input(), needed);
        if (!child) {
            return child;
        }
        if (kept.size() == agg.aggregations().size()) {
            if (*child == node->input()) {
                return node;
            }
            return builder_->with_input(*node, *child);
        }
        spdlog::debug("prune: aggregate keeps {} of {} output(s)", kept.size(),
                      agg.aggregations().size());
        return builder_->group_aggregate(std::move(*child), agg.group_by(), std::move(kept));
    }

    Builder* builder_;
};

class FusionRule {
   public:
    explicit FusionRule(Builder& builder) : builder_(&builder) {}

    auto apply(const NodePtr& node) -> Result<NodePtr> {
        if (node->kind() == NodeKind::Scan) {
            return node;
        }
        auto child = apply(node->input());
        if (!child) {
            return child;
        }
        NodePtr current = node;
        if (*child != node->input()) {
            auto rebuilt = builder_->with_input(*node, *child);
            if (!rebuilt) {
                return rebuilt;
            }
            current = std::move(*rebuilt);
        }
        if (current->kind() != NodeKind::GroupAggregate) {
            return current;
        }
        const auto& agg = static_cast<const GroupAggregateNode&>(*current);
        auto shared = make_layout(agg.aggregations(), true);
        if (shared == agg.layout()) {
            return current;
        }
        spdlog::debug("fusion: {} accumulator slot(s) shrink to {}", agg.layout().slots.size(),
                      shared.slots.size());
        return builder_->with_layout(agg, std::move(shared));
    }

   private:
    Builder* builder_;
};

// NOLINTEND cppcoreguidelines-pro-type-static-cast-downcast

auto keep_on_error(const NodePtr& plan, Result<NodePtr> rewritten, std::string_view rule)
    -> NodePtr {
    if (!rewritten) {
        spdlog::warn("optimizer: {} left plan unchanged: {}", rule, rewritten.error().format());
        return plan;
    }
    return std::move(*rewritten);
}

}  // namespace

auto Optimizer::push_down_predicates(const NodePtr& plan) -> NodePtr {
    return keep_on_error(plan, PushdownRule(builder_).apply(plan), "predicate pushdown");
}

auto Optimizer::prune_projections(const NodePtr& plan) -> NodePtr {
    auto names = plan->schema()->names();
    ColumnSet required(names.begin(), names.end());
    return keep_on_error(plan, PruneRule(builder_).apply(plan, required), "projection pruning");
}

auto Optimizer::fuse_aggregates(const NodePtr& plan) -> NodePtr {
    return keep_on_error(plan, FusionRule(builder_).apply(plan), "aggregate fusion");
}

auto Optimizer::optimize(const NodePtr& plan) -> NodePtr {
    passes_run_ = 0;
    NodePtr current = plan;
    while (passes_run_ < max_passes_) {
        ++passes_run_;
        auto next = fuse_aggregates(prune_projections(push_down_predicates(current)));
        if (next == current) {
            spdlog::debug("optimizer: fixed point after {} pass(es)", passes_run_);
            return current;
        }
        current = std::move(next);
    }
    spdlog::debug("optimizer: stopped at pass limit {}", max_passes_);
    return current;
}

auto optimize(const NodePtr& plan, std::size_t max_passes) -> NodePtr {
    Optimizer optimizer(max_passes);
    return optimizer.optimize(plan);
}

}  // namespace strata::ir
