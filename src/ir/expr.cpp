#include <strata/ir/expr.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <type_traits>

namespace strata::ir {

namespace {

auto make(auto node) -> ExprPtr {
    return std::make_shared<const Expr>(Expr{.node = std::move(node)});
}

auto column_expr_type(DataType type) -> ExprType {
    switch (type) {
        case DataType::Int64:
            return ExprType::Int64;
        case DataType::Float64:
            return ExprType::Float64;
        case DataType::Categorical:
        case DataType::String:
            return ExprType::Text;
    }
    return ExprType::Text;
}

auto literal_type(const ScalarValue& value) -> ExprType {
    return std::visit(
        [](const auto& v) -> ExprType {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return ExprType::Null;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return ExprType::Int64;
            } else if constexpr (std::is_same_v<T, double>) {
                return ExprType::Float64;
            } else {
                return ExprType::Text;
            }
        },
        value);
}

auto is_numeric_or_null(ExprType t) -> bool {
    return t == ExprType::Int64 || t == ExprType::Float64 || t == ExprType::Null;
}

auto is_bool_or_null(ExprType t) -> bool {
    return t == ExprType::Bool || t == ExprType::Null;
}

// Common type of two CASE results, or nullopt when they cannot be unified.
auto unify(ExprType a, ExprType b) -> std::optional<ExprType> {
    if (a == ExprType::Null) {
        return b;
    }
    if (b == ExprType::Null || a == b) {
        return a;
    }
    if ((a == ExprType::Int64 && b == ExprType::Float64) ||
        (a == ExprType::Float64 && b == ExprType::Int64)) {
        return ExprType::Float64;
    }
    return std::nullopt;
}

auto arith_symbol(ArithmeticOp op) -> std::string_view {
    switch (op) {
        case ArithmeticOp::Add:
            return "+";
        case ArithmeticOp::Sub:
            return "-";
        case ArithmeticOp::Mul:
            return "*";
        case ArithmeticOp::Div:
            return "/";
    }
    return "?";
}

auto compare_symbol(CompareOp op) -> std::string_view {
    switch (op) {
        case CompareOp::Eq:
            return "==";
        case CompareOp::Ne:
            return "!=";
        case CompareOp::Lt:
            return "<";
        case CompareOp::Le:
            return "<=";
        case CompareOp::Gt:
            return ">";
        case CompareOp::Ge:
            return ">=";
    }
    return "?";
}

void collect_columns(const Expr& expr, std::vector<std::string>& out) {
    auto add = [&out](const std::string& name) {
        if (std::find(out.begin(), out.end(), name) == out.end()) {
            out.push_back(name);
        }
    };
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ColumnRef>) {
                add(node.name);
            } else if constexpr (std::is_same_v<T, Literal>) {
                // no columns
            } else if constexpr (std::is_same_v<T, NotExpr> || std::is_same_v<T, IsNullExpr>) {
                collect_columns(*node.operand, out);
            } else if constexpr (std::is_same_v<T, CaseExpr>) {
                for (const auto& branch : node.branches) {
                    collect_columns(*branch.condition, out);
                    collect_columns(*branch.value, out);
                }
                collect_columns(*node.otherwise, out);
            } else if constexpr (std::is_same_v<T, RowFunction>) {
                for (const auto& name : node.inputs) {
                    add(name);
                }
            } else {
                collect_columns(*node.left, out);
                collect_columns(*node.right, out);
            }
        },
        expr.node);
}

}  // namespace

auto RowView::get(std::string_view name) const -> Result<ScalarValue> {
    if (std::find(inputs_.begin(), inputs_.end(), name) == inputs_.end()) {
        return compute_error(fmt::format("row function read undeclared column '{}'", name));
    }
    const auto* entry = batch_->find(name);
    if (entry == nullptr) {
        return compute_error(fmt::format("row function input '{}' missing from batch", name));
    }
    return value_at(*entry, row_);
}

auto to_string(ExprType type) noexcept -> std::string_view {
    switch (type) {
        case ExprType::Null:
            return "Null";
        case ExprType::Int64:
            return "Int64";
        case ExprType::Float64:
            return "Float64";
        case ExprType::Text:
            return "Text";
        case ExprType::Bool:
            return "Bool";
    }
    return "Unknown";
}

auto infer_type(const Expr& expr, const Schema& schema) -> Result<ExprType> {
    return std::visit(
        [&schema](const auto& node) -> Result<ExprType> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ColumnRef>) {
                const auto* field = schema.find(node.name);
                if (field == nullptr) {
                    return schema_error(fmt::format("unknown column '{}' (available: {})",
                                                    node.name, schema.to_string()));
                }
                return column_expr_type(field->type);
            } else if constexpr (std::is_same_v<T, Literal>) {
                return literal_type(node.value);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                auto lhs = infer_type(*node.left, schema);
                if (!lhs)
                    return lhs;
                auto rhs = infer_type(*node.right, schema);
                if (!rhs)
                    return rhs;
                if (!is_numeric_or_null(*lhs) || !is_numeric_or_null(*rhs)) {
                    return schema_error(fmt::format("arithmetic '{}' on {} and {}",
                                                    arith_symbol(node.op), to_string(*lhs),
                                                    to_string(*rhs)));
                }
                if (node.op == ArithmeticOp::Div || *lhs == ExprType::Float64 ||
                    *rhs == ExprType::Float64) {
                    return ExprType::Float64;
                }
                if (*lhs == ExprType::Null && *rhs == ExprType::Null) {
                    return ExprType::Null;
                }
                return ExprType::Int64;
            } else if constexpr (std::is_same_v<T, CompareExpr>) {
                auto lhs = infer_type(*node.left, schema);
                if (!lhs)
                    return lhs;
                auto rhs = infer_type(*node.right, schema);
                if (!rhs)
                    return rhs;
                bool numeric = is_numeric_or_null(*lhs) && is_numeric_or_null(*rhs);
                bool text = (*lhs == ExprType::Text || *lhs == ExprType::Null) &&
                            (*rhs == ExprType::Text || *rhs == ExprType::Null);
                if (!numeric && !text) {
                    return schema_error(fmt::format("cannot compare {} with {}", to_string(*lhs),
                                                    to_string(*rhs)));
                }
                return ExprType::Bool;
            } else if constexpr (std::is_same_v<T, AndExpr> || std::is_same_v<T, OrExpr>) {
                auto lhs = infer_type(*node.left, schema);
                if (!lhs)
                    return lhs;
                auto rhs = infer_type(*node.right, schema);
                if (!rhs)
                    return rhs;
                if (!is_bool_or_null(*lhs) || !is_bool_or_null(*rhs)) {
                    return schema_error(fmt::format("logical operator on {} and {}",
                                                    to_string(*lhs), to_string(*rhs)));
                }
                return ExprType::Bool;
            } else if constexpr (std::is_same_v<T, NotExpr>) {
                auto operand = infer_type(*node.operand, schema);
                if (!operand)
                    return operand;
                if (!is_bool_or_null(*operand)) {
                    return schema_error(fmt::format("NOT on {}", to_string(*operand)));
                }
                return ExprType::Bool;
            } else if constexpr (std::is_same_v<T, IsNullExpr>) {
                auto operand = infer_type(*node.operand, schema);
                if (!operand)
                    return operand;
                return ExprType::Bool;
            } else if constexpr (std::is_same_v<T, CaseExpr>) {
                if (node.branches.empty() || node.otherwise == nullptr) {
                    return schema_error("CASE needs at least one branch and an otherwise value");
                }
                auto result = infer_type(*node.otherwise, schema);
                if (!result)
                    return result;
                for (const auto& branch : node.branches) {
                    auto cond = infer_type(*branch.condition, schema);
                    if (!cond)
                        return cond;
                    if (!is_bool_or_null(*cond)) {
                        return schema_error(
                            fmt::format("CASE condition is {}, expected Bool", to_string(*cond)));
                    }
                    auto value = infer_type(*branch.value, schema);
                    if (!value)
                        return value;
                    auto unified = unify(*result, *value);
                    if (!unified) {
                        return schema_error(fmt::format("CASE mixes {} and {} results",
                                                        to_string(*result), to_string(*value)));
                    }
                    *result = *unified;
                }
                return result;
            } else {
                static_assert(std::is_same_v<T, RowFunction>);
                for (const auto& name : node.inputs) {
                    if (!schema.contains(name)) {
                        return schema_error(fmt::format(
                            "row function '{}' reads unknown column '{}' (available: {})",
                            node.label, name, schema.to_string()));
                    }
                }
                if (!node.fn) {
                    return schema_error(fmt::format("row function '{}' has no body", node.label));
                }
                return column_expr_type(node.result_type);
            }
        },
        expr.node);
}

auto assignable(ExprType type, DataType target) noexcept -> bool {
    switch (type) {
        case ExprType::Null:
            return true;
        case ExprType::Int64:
            return is_numeric(target);
        case ExprType::Float64:
            return target == DataType::Float64;
        case ExprType::Text:
            return is_textual(target);
        case ExprType::Bool:
            return false;
    }
    return false;
}

auto referenced_columns(const Expr& expr) -> std::vector<std::string> {
    std::vector<std::string> out;
    collect_columns(expr, out);
    return out;
}

auto split_conjuncts(const ExprPtr& expr) -> std::vector<ExprPtr> {
    std::vector<ExprPtr> out;
    if (expr == nullptr) {
        return out;
    }
    if (const auto* conj = std::get_if<AndExpr>(&expr->node)) {
        auto left = split_conjuncts(conj->left);
        auto right = split_conjuncts(conj->right);
        out.insert(out.end(), left.begin(), left.end());
        out.insert(out.end(), right.begin(), right.end());
        return out;
    }
    out.push_back(expr);
    return out;
}

auto conjoin(std::span<const ExprPtr> conjuncts) -> ExprPtr {
    if (conjuncts.empty()) {
        return nullptr;
    }
    ExprPtr result = conjuncts.front();
    for (std::size_t i = 1; i < conjuncts.size(); ++i) {
        result = and_expr(result, conjuncts[i]);
    }
    return result;
}

auto to_string(const Expr& expr) -> std::string {
    return std::visit(
        [](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ColumnRef>) {
                return node.name;
            } else if constexpr (std::is_same_v<T, Literal>) {
                return format_scalar(node.value);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                return fmt::format("({} {} {})", to_string(*node.left), arith_symbol(node.op),
                                   to_string(*node.right));
            } else if constexpr (std::is_same_v<T, CompareExpr>) {
                return fmt::format("({} {} {})", to_string(*node.left), compare_symbol(node.op),
                                   to_string(*node.right));
            } else if constexpr (std::is_same_v<T, AndExpr>) {
                return fmt::format("({} AND {})", to_string(*node.left), to_string(*node.right));
            } else if constexpr (std::is_same_v<T, OrExpr>) {
                return fmt::format("({} OR {})", to_string(*node.left), to_string(*node.right));
            } else if constexpr (std::is_same_v<T, NotExpr>) {
                return fmt::format("NOT {}", to_string(*node.operand));
            } else if constexpr (std::is_same_v<T, IsNullExpr>) {
                return fmt::format("({} IS NULL)", to_string(*node.operand));
            } else if constexpr (std::is_same_v<T, CaseExpr>) {
                std::string out = "CASE";
                for (const auto& branch : node.branches) {
                    out.append(fmt::format(" WHEN {} THEN {}", to_string(*branch.condition),
                                           to_string(*branch.value)));
                }
                out.append(fmt::format(" ELSE {} END", to_string(*node.otherwise)));
                return out;
            } else {
                return fmt::format("{}({})", node.label, fmt::join(node.inputs, ", "));
            }
        },
        expr.node);
}

// ─── Expression builders ──────────────────────────────────────────────────────

auto col_ref(std::string name) -> ExprPtr {
    return make(ColumnRef{.name = std::move(name)});
}

auto int_lit(std::int64_t v) -> ExprPtr {
    return make(Literal{.value = v});
}

auto dbl_lit(double v) -> ExprPtr {
    return make(Literal{.value = v});
}

auto str_lit(std::string v) -> ExprPtr {
    return make(Literal{.value = std::move(v)});
}

auto null_lit() -> ExprPtr {
    return make(Literal{.value = std::monostate{}});
}

auto binop(ArithmeticOp op, ExprPtr lhs, ExprPtr rhs) -> ExprPtr {
    return make(BinaryExpr{.op = op, .left = std::move(lhs), .right = std::move(rhs)});
}

auto cmp(CompareOp op, ExprPtr lhs, ExprPtr rhs) -> ExprPtr {
    return make(CompareExpr{.op = op, .left = std::move(lhs), .right = std::move(rhs)});
}

auto and_expr(ExprPtr lhs, ExprPtr rhs) -> ExprPtr {
    return make(AndExpr{.left = std::move(lhs), .right = std::move(rhs)});
}

auto or_expr(ExprPtr lhs, ExprPtr rhs) -> ExprPtr {
    return make(OrExpr{.left = std::move(lhs), .right = std::move(rhs)});
}

auto not_expr(ExprPtr operand) -> ExprPtr {
    return make(NotExpr{.operand = std::move(operand)});
}

auto is_null_expr(ExprPtr operand) -> ExprPtr {
    return make(IsNullExpr{.operand = std::move(operand)});
}

auto case_when(std::vector<WhenClause> branches, ExprPtr otherwise) -> ExprPtr {
    return make(CaseExpr{.branches = std::move(branches), .otherwise = std::move(otherwise)});
}

auto row_fn(std::string label, std::vector<std::string> inputs, DataType result_type, RowFn fn)
    -> ExprPtr {
    return make(RowFunction{.label = std::move(label),
                            .inputs = std::move(inputs),
                            .result_type = result_type,
                            .fn = std::move(fn)});
}

auto between(std::string column, double lo, double hi) -> ExprPtr {
    return and_expr(cmp(CompareOp::Ge, col_ref(column), dbl_lit(lo)),
                    cmp(CompareOp::Le, col_ref(column), dbl_lit(hi)));
}

auto bucketize(std::string column, const BucketSpec& spec) -> Result<ExprPtr> {
    if (spec.boundaries.empty()) {
        return schema_error("bucketize: at least one boundary is required");
    }
    if (spec.labels.size() != spec.boundaries.size() + 1) {
        return schema_error(fmt::format("bucketize: {} boundaries need {} labels, got {}",
                                        spec.boundaries.size(), spec.boundaries.size() + 1,
                                        spec.labels.size()));
    }
    for (std::size_t i = 1; i < spec.boundaries.size(); ++i) {
        if (!(spec.boundaries[i - 1] < spec.boundaries[i])) {
            return schema_error("bucketize: boundaries must be strictly ascending");
        }
    }
    std::vector<WhenClause> branches;
    branches.reserve(spec.boundaries.size());
    for (std::size_t i = 0; i < spec.boundaries.size(); ++i) {
        branches.push_back(WhenClause{
            .condition = cmp(CompareOp::Lt, col_ref(column), dbl_lit(spec.boundaries[i])),
            .value = str_lit(spec.labels[i]),
        });
    }
    return case_when(std::move(branches), str_lit(spec.labels.back()));
}

}  // namespace strata::ir
