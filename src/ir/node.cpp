#include <strata/ir/node.hpp>
#include <strata/store/column_store.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace strata::ir {

namespace {

auto agg_to_string(const AggSpec& agg) -> std::string {
    if (agg.column.empty()) {
        return fmt::format("{}={}(*)", agg.alias, to_string(agg.func));
    }
    return fmt::format("{}={}({})", agg.alias, to_string(agg.func), agg.column);
}

auto slot_to_string(const StatSlot& slot) -> std::string {
    if (slot.column.empty()) {
        return std::string(to_string(slot.stat));
    }
    return fmt::format("{}({})", to_string(slot.stat), slot.column);
}

// NOLINTBEGIN cppcoreguidelines-pro-type-static-cast-downcast
void explain_into(const Node& node, std::size_t depth, std::string& out) {
    out.append(depth * 2, ' ');
    switch (node.kind()) {
        case NodeKind::Scan: {
            const auto& scan = static_cast<const ScanNode&>(node);
            out.append(fmt::format("Scan {} [{}]", scan.source_name(),
                                   fmt::join(scan.schema()->names(), ", ")));
            break;
        }
        case NodeKind::Filter: {
            const auto& filter = static_cast<const FilterNode&>(node);
            out.append(fmt::format("Filter {}", to_string(*filter.predicate())));
            break;
        }
        case NodeKind::Derive: {
            const auto& derive = static_cast<const DeriveNode&>(node);
            out.append(fmt::format("Derive {}: {} = {}", derive.field().name,
                                   strata::to_string(derive.field().type),
                                   to_string(*derive.expr())));
            break;
        }
        case NodeKind::Project: {
            const auto& project = static_cast<const ProjectNode&>(node);
            out.append(fmt::format("Project [{}]", fmt::join(project.columns(), ", ")));
            break;
        }
        case NodeKind::GroupAggregate: {
            const auto& agg = static_cast<const GroupAggregateNode&>(node);
            std::vector<std::string> aggs;
            for (const auto& spec : agg.aggregations()) {
                aggs.push_back(agg_to_string(spec));
            }
            std::vector<std::string> slots;
            for (const auto& slot : agg.layout().slots) {
                slots.push_back(slot_to_string(slot));
            }
            out.append(fmt::format("GroupAggregate keys=[{}] aggs=[{}] slots=[{}]",
                                   fmt::join(agg.group_by(), ", "), fmt::join(aggs, ", "),
                                   fmt::join(slots, ", ")));
            break;
        }
    }
    out.push_back('\n');
    for (const auto& child : node.children()) {
        explain_into(*child, depth + 1, out);
    }
}
// NOLINTEND cppcoreguidelines-pro-type-static-cast-downcast

}  // namespace

auto to_string(AggFunc func) noexcept -> std::string_view {
    switch (func) {
        case AggFunc::Count:
            return "count";
        case AggFunc::Sum:
            return "sum";
        case AggFunc::Mean:
            return "mean";
        case AggFunc::Min:
            return "min";
        case AggFunc::Max:
            return "max";
    }
    return "unknown";
}

auto to_string(Statistic stat) noexcept -> std::string_view {
    switch (stat) {
        case Statistic::RowCount:
            return "row_count";
        case Statistic::ValidCount:
            return "valid_count";
        case Statistic::Sum:
            return "sum";
        case Statistic::Min:
            return "min";
        case Statistic::Max:
            return "max";
    }
    return "unknown";
}

auto make_layout(const std::vector<AggSpec>& aggregations, bool share) -> AggregateLayout {
    AggregateLayout layout;
    layout.outputs.reserve(aggregations.size());
    auto slot_for = [&](Statistic stat, const std::string& column) -> std::size_t {
        StatSlot slot{.stat = stat, .column = column};
        if (share) {
            auto it = std::find(layout.slots.begin(), layout.slots.end(), slot);
            if (it != layout.slots.end()) {
                return static_cast<std::size_t>(it - layout.slots.begin());
            }
        }
        layout.slots.push_back(std::move(slot));
        return layout.slots.size() - 1;
    };
    for (const auto& agg : aggregations) {
        std::vector<std::size_t> reads;
        switch (agg.func) {
            case AggFunc::Count:
                reads.push_back(agg.column.empty() ? slot_for(Statistic::RowCount, "")
                                                   : slot_for(Statistic::ValidCount, agg.column));
                break;
            case AggFunc::Sum:
                reads.push_back(slot_for(Statistic::Sum, agg.column));
                break;
            case AggFunc::Mean:
                reads.push_back(slot_for(Statistic::Sum, agg.column));
                reads.push_back(slot_for(Statistic::ValidCount, agg.column));
                break;
            case AggFunc::Min:
                reads.push_back(slot_for(Statistic::Min, agg.column));
                break;
            case AggFunc::Max:
                reads.push_back(slot_for(Statistic::Max, agg.column));
                break;
        }
        layout.outputs.push_back(std::move(reads));
    }
    return layout;
}

auto ScanNode::source_name() const -> const std::string& {
    return source_->name();
}

auto explain(const Node& root) -> std::string {
    std::string out;
    explain_into(root, 0, out);
    return out;
}

}  // namespace strata::ir
