#pragma once

#include <strata/core/batch.hpp>
#include <strata/core/error.hpp>
#include <strata/core/value.hpp>
#include <strata/ir/expr.hpp>

#include <cstdint>
#include <vector>

namespace strata::runtime {

/// Three-valued truth of a predicate; Unknown arises from null operands.
enum class Truth : std::uint8_t {
    False,
    True,
    Unknown,
};

/// Evaluate a value-typed expression at one row of `batch`.
/// Arithmetic and comparisons propagate null; Int64 division by zero is a
/// compute error.
[[nodiscard]] auto eval_value(const ir::Expr& expr, const Batch& batch, std::size_t row)
    -> Result<ScalarValue>;

/// Evaluate a boolean expression at one row of `batch` with three-valued logic.
/// AND stops at a false left operand, OR at a true one.
[[nodiscard]] auto eval_predicate(const ir::Expr& expr, const Batch& batch, std::size_t row)
    -> Result<Truth>;

/// Row indices of `batch` whose predicate is True.
[[nodiscard]] auto compute_selection(const ir::Expr& predicate, const Batch& batch)
    -> Result<std::vector<std::size_t>>;

/// Evaluate `expr` for every row into a column of logical type `type`.
[[nodiscard]] auto evaluate_column(const ir::Expr& expr, DataType type, const Batch& batch)
    -> Result<ColumnEntry>;

}  // namespace strata::runtime
