#include <strata/ir/builder.hpp>
#include <strata/store/column_store.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace strata::ir {

namespace {

auto require_input(const NodePtr& input, std::string_view op) -> Result<void> {
    if (input == nullptr) {
        return schema_error(fmt::format("{}: missing input plan", op));
    }
    return {};
}

auto missing_column(std::string_view op, std::string_view name, const Schema& schema)
    -> std::unexpected<Error> {
    return schema_error(
        fmt::format("{}: unknown column '{}' (available: {})", op, name, schema.to_string()));
}

auto aggregate_field(const AggSpec& agg, const Schema& input) -> Result<Field> {
    if (agg.alias.empty()) {
        return schema_error(fmt::format("group_aggregate: {} needs an output alias",
                                        to_string(agg.func)));
    }
    if (agg.func == AggFunc::Count && agg.column.empty()) {
        return Field{.name = agg.alias, .type = DataType::Int64, .nullable = false};
    }
    const auto* source = input.find(agg.column);
    if (source == nullptr) {
        return missing_column("group_aggregate", agg.column, input);
    }
    switch (agg.func) {
        case AggFunc::Count:
            return Field{.name = agg.alias, .type = DataType::Int64, .nullable = false};
        case AggFunc::Mean:
            if (!is_numeric(source->type)) {
                break;
            }
            return Field{.name = agg.alias, .type = DataType::Float64};
        case AggFunc::Sum:
        case AggFunc::Min:
        case AggFunc::Max:
            if (!is_numeric(source->type)) {
                break;
            }
            return Field{.name = agg.alias, .type = source->type};
    }
    return schema_error(fmt::format("group_aggregate: cannot {} column '{}' of type {}",
                                    to_string(agg.func), agg.column,
                                    strata::to_string(source->type)));
}

}  // namespace

auto Builder::scan(std::shared_ptr<store::SourceHandle> source) -> Result<NodePtr> {
    if (source == nullptr) {
        return schema_error("scan: missing source");
    }
    auto schema = source->schema();
    return scan(std::move(source), std::move(schema));
}

auto Builder::scan(std::shared_ptr<store::SourceHandle> source, SchemaPtr schema)
    -> Result<NodePtr> {
    if (source == nullptr || schema == nullptr) {
        return schema_error("scan: missing source or schema");
    }
    if (schema->empty()) {
        return schema_error(fmt::format("scan: empty column list for '{}'", source->name()));
    }
    const auto& available = *source->schema();
    for (const auto& field : schema->fields()) {
        const auto* actual = available.find(field.name);
        if (actual == nullptr) {
            return missing_column("scan", field.name, available);
        }
        if (actual->type != field.type) {
            return schema_error(fmt::format("scan: column '{}' declared {} but source has {}",
                                            field.name, strata::to_string(field.type),
                                            strata::to_string(actual->type)));
        }
    }
    // Readers materialize columns in source order, so the node does too.
    auto ordered = store::project_schema(source->schema(), schema->names());
    if (!ordered) {
        return std::unexpected(ordered.error());
    }
    if ((*ordered)->size() != schema->size()) {
        return schema_error("scan: duplicate column in declared schema");
    }
    spdlog::debug("scan {} [{}]", source->name(), (*ordered)->to_string());
    return std::make_shared<ScanNode>(next_id(), std::move(source), std::move(*ordered));
}

auto Builder::filter(NodePtr input, ExprPtr predicate) -> Result<NodePtr> {
    if (auto ok = require_input(input, "filter"); !ok) {
        return std::unexpected(ok.error());
    }
    if (predicate == nullptr) {
        return schema_error("filter: missing predicate");
    }
    auto type = infer_type(*predicate, *input->schema());
    if (!type) {
        return std::unexpected(type.error());
    }
    if (*type != ExprType::Bool && *type != ExprType::Null) {
        return schema_error(fmt::format("filter: predicate {} has type {}, expected Bool",
                                        to_string(*predicate), to_string(*type)));
    }
    return std::make_shared<FilterNode>(next_id(), std::move(input), std::move(predicate));
}

auto Builder::derive_column(NodePtr input, std::string name, ExprPtr expr, DataType type)
    -> Result<NodePtr> {
    if (auto ok = require_input(input, "derive_column"); !ok) {
        return std::unexpected(ok.error());
    }
    if (name.empty() || expr == nullptr) {
        return schema_error("derive_column: missing name or expression");
    }
    const auto& schema = *input->schema();
    if (schema.contains(name)) {
        return schema_error(fmt::format("derive_column: column '{}' already exists", name));
    }
    auto inferred = infer_type(*expr, schema);
    if (!inferred) {
        return std::unexpected(inferred.error());
    }
    if (!assignable(*inferred, type)) {
        return schema_error(fmt::format("derive_column: '{}' declared {} but {} yields {}", name,
                                        strata::to_string(type), to_string(*expr),
                                        to_string(*inferred)));
    }
    Field field{.name = std::move(name), .type = type};
    auto fields = schema.fields();
    fields.push_back(field);
    return std::make_shared<DeriveNode>(next_id(), std::move(input),
                                        make_schema(std::move(fields)), std::move(field),
                                        std::move(expr));
}

auto Builder::derive_column(NodePtr input, std::string name, DataType type,
                            std::vector<std::string> inputs, RowFn fn) -> Result<NodePtr> {
    if (!fn) {
        return schema_error(fmt::format("derive_column: '{}' has no row function", name));
    }
    auto label = name;
    return derive_column(std::move(input), std::move(name),
                         row_fn(std::move(label), std::move(inputs), type, std::move(fn)), type);
}

auto Builder::group_aggregate(NodePtr input, std::vector<std::string> group_by,
                              std::vector<AggSpec> aggregations) -> Result<NodePtr> {
    if (auto ok = require_input(input, "group_aggregate"); !ok) {
        return std::unexpected(ok.error());
    }
    if (group_by.empty() && aggregations.empty()) {
        return schema_error("group_aggregate: needs group keys or aggregations");
    }
    const auto& schema = *input->schema();
    std::unordered_set<std::string> names;
    std::vector<Field> fields;
    fields.reserve(group_by.size() + aggregations.size());
    for (const auto& key : group_by) {
        const auto* field = schema.find(key);
        if (field == nullptr) {
            return missing_column("group_aggregate", key, schema);
        }
        if (!names.insert(key).second) {
            return schema_error(fmt::format("group_aggregate: duplicate group key '{}'", key));
        }
        fields.push_back(*field);
    }
    for (const auto& agg : aggregations) {
        auto field = aggregate_field(agg, schema);
        if (!field) {
            return std::unexpected(field.error());
        }
        if (!names.insert(agg.alias).second) {
            return schema_error(
                fmt::format("group_aggregate: output name '{}' is not unique", agg.alias));
        }
        fields.push_back(std::move(*field));
    }
    auto layout = make_layout(aggregations, false);
    return std::make_shared<GroupAggregateNode>(next_id(), std::move(input),
                                                make_schema(std::move(fields)),
                                                std::move(group_by), std::move(aggregations),
                                                std::move(layout));
}

auto Builder::project(NodePtr input, std::vector<std::string> columns) -> Result<NodePtr> {
    if (auto ok = require_input(input, "project"); !ok) {
        return std::unexpected(ok.error());
    }
    if (columns.empty()) {
        return schema_error("project: empty column list");
    }
    const auto& schema = *input->schema();
    std::vector<Field> fields;
    fields.reserve(columns.size());
    for (const auto& name : columns) {
        const auto* field = schema.find(name);
        if (field == nullptr) {
            return missing_column("project", name, schema);
        }
        auto duplicate = std::any_of(fields.begin(), fields.end(),
                                     [&](const Field& f) { return f.name == name; });
        if (duplicate) {
            return schema_error(fmt::format("project: duplicate column '{}'", name));
        }
        fields.push_back(*field);
    }
    return std::make_shared<ProjectNode>(next_id(), std::move(input),
                                         make_schema(std::move(fields)));
}

// NOLINTBEGIN cppcoreguidelines-pro-type-static-cast-downcast
auto Builder::with_input(const Node& node, NodePtr input) -> Result<NodePtr> {
    switch (node.kind()) {
        case NodeKind::Scan:
            return schema_error("scan has no input to replace");
        case NodeKind::Filter:
            return filter(std::move(input), static_cast<const FilterNode&>(node).predicate());
        case NodeKind::Derive: {
            const auto& derive = static_cast<const DeriveNode&>(node);
            return derive_column(std::move(input), derive.field().name, derive.expr(),
                                 derive.field().type);
        }
        case NodeKind::Project:
            return project(std::move(input), static_cast<const ProjectNode&>(node).columns());
        case NodeKind::GroupAggregate: {
            const auto& agg = static_cast<const GroupAggregateNode&>(node);
            auto rebuilt = group_aggregate(std::move(input), agg.group_by(), agg.aggregations());
            if (!rebuilt) {
                return rebuilt;
            }
            return with_layout(static_cast<const GroupAggregateNode&>(**rebuilt), agg.layout());
        }
    }
    return schema_error("unknown plan node kind");
}
// NOLINTEND cppcoreguidelines-pro-type-static-cast-downcast

auto Builder::with_layout(const GroupAggregateNode& node, AggregateLayout layout) -> NodePtr {
    return std::make_shared<GroupAggregateNode>(next_id(), node.input(), node.schema(),
                                                node.group_by(), node.aggregations(),
                                                std::move(layout));
}

auto Builder::with_aggregations(const GroupAggregateNode& node, std::vector<AggSpec> aggregations)
    -> Result<NodePtr> {
    return group_aggregate(node.input(), node.group_by(), std::move(aggregations));
}

}  // namespace strata::ir
