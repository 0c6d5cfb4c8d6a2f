#pragma once

#include <strata/core/batch.hpp>
#include <strata/core/error.hpp>
#include <strata/core/schema.hpp>
#include <strata/core/value.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strata::ir {

/// Expression tree shared by filter predicates and derived columns.
/// Nodes are immutable and shared between plan versions.
struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

struct ColumnRef {
    std::string name;
};

struct Literal {
    ScalarValue value;
};

enum class ArithmeticOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
};

struct BinaryExpr {
    ArithmeticOp op = ArithmeticOp::Add;
    ExprPtr left;
    ExprPtr right;
};

enum class CompareOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
};

struct CompareExpr {
    CompareOp op = CompareOp::Eq;
    ExprPtr left;
    ExprPtr right;
};

struct AndExpr {
    ExprPtr left;
    ExprPtr right;
};

struct OrExpr {
    ExprPtr left;
    ExprPtr right;
};

struct NotExpr {
    ExprPtr operand;
};

struct IsNullExpr {
    ExprPtr operand;
};

struct WhenClause {
    ExprPtr condition;
    ExprPtr value;
};

/// First branch whose condition is true wins; a null condition counts as false.
struct CaseExpr {
    std::vector<WhenClause> branches;
    ExprPtr otherwise;
};

/// Read access to the declared input columns of one row.
class RowView {
   public:
    RowView(const Batch& batch, std::size_t row, std::span<const std::string> inputs)
        : batch_(&batch), row_(row), inputs_(inputs) {}

    /// Fails with a compute error for columns the function did not declare.
    [[nodiscard]] auto get(std::string_view name) const -> Result<ScalarValue>;

    [[nodiscard]] auto row() const noexcept -> std::size_t { return row_; }

   private:
    const Batch* batch_;
    std::size_t row_;
    std::span<const std::string> inputs_;
};

using RowFn = std::function<Result<ScalarValue>(const RowView&)>;

/// Opaque per-row function. `inputs` lists every column it reads; the
/// optimizer relies on that list for pushdown and pruning.
struct RowFunction {
    std::string label;
    std::vector<std::string> inputs;
    DataType result_type = DataType::Float64;
    RowFn fn;
};

struct Expr {
    std::variant<ColumnRef, Literal, BinaryExpr, CompareExpr, AndExpr, OrExpr, NotExpr,
                 IsNullExpr, CaseExpr, RowFunction>
        node;
};

/// Static result type of an expression.
enum class ExprType : std::uint8_t {
    Null,
    Int64,
    Float64,
    Text,
    Bool,
};

[[nodiscard]] auto to_string(ExprType type) noexcept -> std::string_view;

/// Type-check `expr` against `schema`; unknown columns and incompatible
/// operands are schema errors.
[[nodiscard]] auto infer_type(const Expr& expr, const Schema& schema) -> Result<ExprType>;

/// Whether a value of static type `type` may be stored in a `target` column.
[[nodiscard]] auto assignable(ExprType type, DataType target) noexcept -> bool;

/// Every column the expression reads, in first-reference order, without duplicates.
[[nodiscard]] auto referenced_columns(const Expr& expr) -> std::vector<std::string>;

/// Split a predicate on top-level AND.
[[nodiscard]] auto split_conjuncts(const ExprPtr& expr) -> std::vector<ExprPtr>;

/// Left-deep AND of `conjuncts`; nullptr when empty.
[[nodiscard]] auto conjoin(std::span<const ExprPtr> conjuncts) -> ExprPtr;

[[nodiscard]] auto to_string(const Expr& expr) -> std::string;

// ─── Expression builders ──────────────────────────────────────────────────────

[[nodiscard]] auto col_ref(std::string name) -> ExprPtr;
[[nodiscard]] auto int_lit(std::int64_t v) -> ExprPtr;
[[nodiscard]] auto dbl_lit(double v) -> ExprPtr;
[[nodiscard]] auto str_lit(std::string v) -> ExprPtr;
[[nodiscard]] auto null_lit() -> ExprPtr;
[[nodiscard]] auto binop(ArithmeticOp op, ExprPtr lhs, ExprPtr rhs) -> ExprPtr;
[[nodiscard]] auto cmp(CompareOp op, ExprPtr lhs, ExprPtr rhs) -> ExprPtr;
[[nodiscard]] auto and_expr(ExprPtr lhs, ExprPtr rhs) -> ExprPtr;
[[nodiscard]] auto or_expr(ExprPtr lhs, ExprPtr rhs) -> ExprPtr;
[[nodiscard]] auto not_expr(ExprPtr operand) -> ExprPtr;
[[nodiscard]] auto is_null_expr(ExprPtr operand) -> ExprPtr;
[[nodiscard]] auto case_when(std::vector<WhenClause> branches, ExprPtr otherwise) -> ExprPtr;
[[nodiscard]] auto row_fn(std::string label, std::vector<std::string> inputs, DataType result_type,
                          RowFn fn) -> ExprPtr;

/// `lo <= column <= hi`.
[[nodiscard]] auto between(std::string column, double lo, double hi) -> ExprPtr;

/// Categorical bucketing table: labels.size() == boundaries.size() + 1.
struct BucketSpec {
    std::vector<double> boundaries;
    std::vector<std::string> labels;
};

/// CASE chain mapping a numeric column to bucket labels over half-open,
/// lower-inclusive intervals: value < b[0] -> labels[0], b[i-1] <= value < b[i]
/// -> labels[i], value >= b[n-1] -> labels[n]. A null value takes the last label.
[[nodiscard]] auto bucketize(std::string column, const BucketSpec& spec) -> Result<ExprPtr>;

}  // namespace strata::ir
