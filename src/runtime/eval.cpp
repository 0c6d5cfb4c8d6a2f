#include <strata/runtime/eval.hpp>

#include <fmt/format.h>

#include <string_view>
#include <type_traits>

namespace strata::runtime {

namespace {

auto is_boolean(const ir::Expr& expr) -> bool {
    return std::holds_alternative<ir::CompareExpr>(expr.node) ||
           std::holds_alternative<ir::AndExpr>(expr.node) ||
           std::holds_alternative<ir::OrExpr>(expr.node) ||
           std::holds_alternative<ir::NotExpr>(expr.node) ||
           std::holds_alternative<ir::IsNullExpr>(expr.node);
}

auto to_double(const ScalarValue& v) -> double {
    if (const auto* i = std::get_if<std::int64_t>(&v)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(v);
}

auto is_number(const ScalarValue& v) -> bool {
    return std::holds_alternative<std::int64_t>(v) || std::holds_alternative<double>(v);
}

auto op_symbol(ir::ArithmeticOp op) -> std::string_view {
    switch (op) {
        case ir::ArithmeticOp::Add:
            return "+";
        case ir::ArithmeticOp::Sub:
            return "-";
        case ir::ArithmeticOp::Mul:
            return "*";
        case ir::ArithmeticOp::Div:
            return "/";
    }
    return "?";
}

auto arithmetic(ir::ArithmeticOp op, const ScalarValue& lhs, const ScalarValue& rhs)
    -> Result<ScalarValue> {
    if (is_null(lhs) || is_null(rhs)) {
        return ScalarValue{};
    }
    if (!is_number(lhs) || !is_number(rhs)) {
        return compute_error(fmt::format("arithmetic on non-numeric values {} and {}",
                                         format_scalar(lhs), format_scalar(rhs)));
    }
    const auto* li = std::get_if<std::int64_t>(&lhs);
    const auto* ri = std::get_if<std::int64_t>(&rhs);
    if (op == ir::ArithmeticOp::Div) {
        if (li != nullptr && ri != nullptr && *ri == 0) {
            return compute_error(fmt::format("integer division by zero ({} / 0)", *li));
        }
        return ScalarValue{to_double(lhs) / to_double(rhs)};
    }
    if (li != nullptr && ri != nullptr) {
        std::int64_t out = 0;
        bool overflow = false;
        switch (op) {
            case ir::ArithmeticOp::Add:
                overflow = __builtin_add_overflow(*li, *ri, &out);
                break;
            case ir::ArithmeticOp::Sub:
                overflow = __builtin_sub_overflow(*li, *ri, &out);
                break;
            case ir::ArithmeticOp::Mul:
                overflow = __builtin_mul_overflow(*li, *ri, &out);
                break;
            case ir::ArithmeticOp::Div:
                break;
        }
        if (overflow) {
            return compute_error(fmt::format("integer overflow ({} {} {})", *li,
                                             op_symbol(op), *ri));
        }
        return ScalarValue{out};
    }
    double l = to_double(lhs);
    double r = to_double(rhs);
    switch (op) {
        case ir::ArithmeticOp::Add:
            return ScalarValue{l + r};
        case ir::ArithmeticOp::Sub:
            return ScalarValue{l - r};
        case ir::ArithmeticOp::Mul:
            return ScalarValue{l * r};
        case ir::ArithmeticOp::Div:
            return ScalarValue{l / r};
    }
    return compute_error("unknown arithmetic operator");
}

template <typename T>
auto apply_compare(ir::CompareOp op, const T& l, const T& r) -> bool {
    switch (op) {
        case ir::CompareOp::Eq:
            return l == r;
        case ir::CompareOp::Ne:
            return l != r;
        case ir::CompareOp::Lt:
            return l < r;
        case ir::CompareOp::Le:
            return l <= r;
        case ir::CompareOp::Gt:
            return l > r;
        case ir::CompareOp::Ge:
            return l >= r;
    }
    return false;
}

auto compare(ir::CompareOp op, const ScalarValue& lhs, const ScalarValue& rhs) -> Result<Truth> {
    if (is_null(lhs) || is_null(rhs)) {
        return Truth::Unknown;
    }
    bool result = false;
    if (const auto* ls = std::get_if<std::string>(&lhs)) {
        const auto* rs = std::get_if<std::string>(&rhs);
        if (rs == nullptr) {
            return compute_error(fmt::format("cannot compare {} with {}", format_scalar(lhs),
                                             format_scalar(rhs)));
        }
        result = apply_compare(op, *ls, *rs);
    } else if (!is_number(rhs)) {
        return compute_error(
            fmt::format("cannot compare {} with {}", format_scalar(lhs), format_scalar(rhs)));
    } else {
        const auto* li = std::get_if<std::int64_t>(&lhs);
        const auto* ri = std::get_if<std::int64_t>(&rhs);
        result = (li != nullptr && ri != nullptr) ? apply_compare(op, *li, *ri)
                                                  : apply_compare(op, to_double(lhs), to_double(rhs));
    }
    return result ? Truth::True : Truth::False;
}

}  // namespace

auto eval_value(const ir::Expr& expr, const Batch& batch, std::size_t row) -> Result<ScalarValue> {
    if (const auto* col = std::get_if<ir::ColumnRef>(&expr.node)) {
        const auto* entry = batch.find(col->name);
        if (entry == nullptr) {
            return compute_error(fmt::format("unknown column in expression: {} (available: {})",
                                             col->name, batch.schema()->to_string()));
        }
        return value_at(*entry, row);
    }
    if (const auto* lit = std::get_if<ir::Literal>(&expr.node)) {
        return lit->value;
    }
    if (const auto* bin = std::get_if<ir::BinaryExpr>(&expr.node)) {
        auto left = eval_value(*bin->left, batch, row);
        if (!left) {
            return left;
        }
        auto right = eval_value(*bin->right, batch, row);
        if (!right) {
            return right;
        }
        return arithmetic(bin->op, *left, *right);
    }
    if (const auto* case_expr = std::get_if<ir::CaseExpr>(&expr.node)) {
        for (const auto& branch : case_expr->branches) {
            auto taken = eval_predicate(*branch.condition, batch, row);
            if (!taken) {
                return std::unexpected(taken.error());
            }
            if (*taken == Truth::True) {
                return eval_value(*branch.value, batch, row);
            }
        }
        return eval_value(*case_expr->otherwise, batch, row);
    }
    if (const auto* fn = std::get_if<ir::RowFunction>(&expr.node)) {
        ir::RowView view(batch, row, fn->inputs);
        auto value = fn->fn(view);
        if (!value) {
            return compute_error(fmt::format("{}: {}", fn->label, value.error().message));
        }
        return value;
    }
    return compute_error(fmt::format("boolean expression used as a value: {}", ir::to_string(expr)));
}

auto eval_predicate(const ir::Expr& expr, const Batch& batch, std::size_t row) -> Result<Truth> {
    if (const auto* cmp = std::get_if<ir::CompareExpr>(&expr.node)) {
        auto left = eval_value(*cmp->left, batch, row);
        if (!left) {
            return std::unexpected(left.error());
        }
        auto right = eval_value(*cmp->right, batch, row);
        if (!right) {
            return std::unexpected(right.error());
        }
        return compare(cmp->op, *left, *right);
    }
    if (const auto* conj = std::get_if<ir::AndExpr>(&expr.node)) {
        auto left = eval_predicate(*conj->left, batch, row);
        if (!left || *left == Truth::False) {
            return left;
        }
        auto right = eval_predicate(*conj->right, batch, row);
        if (!right || *right == Truth::False) {
            return right;
        }
        return (*left == Truth::True && *right == Truth::True) ? Truth::True : Truth::Unknown;
    }
    if (const auto* disj = std::get_if<ir::OrExpr>(&expr.node)) {
        auto left = eval_predicate(*disj->left, batch, row);
        if (!left || *left == Truth::True) {
            return left;
        }
        auto right = eval_predicate(*disj->right, batch, row);
        if (!right || *right == Truth::True) {
            return right;
        }
        return (*left == Truth::False && *right == Truth::False) ? Truth::False : Truth::Unknown;
    }
    if (const auto* neg = std::get_if<ir::NotExpr>(&expr.node)) {
        auto operand = eval_predicate(*neg->operand, batch, row);
        if (!operand || *operand == Truth::Unknown) {
            return operand;
        }
        return *operand == Truth::True ? Truth::False : Truth::True;
    }
    if (const auto* null_test = std::get_if<ir::IsNullExpr>(&expr.node)) {
        if (is_boolean(*null_test->operand)) {
            auto operand = eval_predicate(*null_test->operand, batch, row);
            if (!operand) {
                return operand;
            }
            return *operand == Truth::Unknown ? Truth::True : Truth::False;
        }
        auto operand = eval_value(*null_test->operand, batch, row);
        if (!operand) {
            return std::unexpected(operand.error());
        }
        return is_null(*operand) ? Truth::True : Truth::False;
    }
    if (const auto* case_expr = std::get_if<ir::CaseExpr>(&expr.node)) {
        for (const auto& branch : case_expr->branches) {
            auto taken = eval_predicate(*branch.condition, batch, row);
            if (!taken) {
                return taken;
            }
            if (*taken == Truth::True) {
                return eval_predicate(*branch.value, batch, row);
            }
        }
        return eval_predicate(*case_expr->otherwise, batch, row);
    }
    auto value = eval_value(expr, batch, row);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (is_null(*value)) {
        return Truth::Unknown;
    }
    return compute_error(fmt::format("predicate {} yielded non-boolean {}", ir::to_string(expr),
                                     format_scalar(*value)));
}

auto compute_selection(const ir::Expr& predicate, const Batch& batch)
    -> Result<std::vector<std::size_t>> {
    std::vector<std::size_t> selected;
    selected.reserve(batch.rows());
    for (std::size_t row = 0; row < batch.rows(); ++row) {
        auto truth = eval_predicate(predicate, batch, row);
        if (!truth) {
            return std::unexpected(truth.error());
        }
        if (*truth == Truth::True) {
            selected.push_back(row);
        }
    }
    return selected;
}

auto evaluate_column(const ir::Expr& expr, DataType type, const Batch& batch)
    -> Result<ColumnEntry> {
    // Plain column reference of the right type: share the input column.
    if (const auto* col = std::get_if<ir::ColumnRef>(&expr.node)) {
        const auto* entry = batch.find(col->name);
        if (entry != nullptr && data_type_of(*entry->column) == type) {
            return *entry;
        }
    }
    ColumnBuilder builder(type);
    builder.reserve(batch.rows());
    for (std::size_t row = 0; row < batch.rows(); ++row) {
        auto value = eval_value(expr, batch, row);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (auto appended = builder.append(*value); !appended) {
            return compute_error(
                fmt::format("{} at row {}: {}", ir::to_string(expr), row, appended.error().message));
        }
    }
    return builder.finish();
}

}  // namespace strata::runtime
