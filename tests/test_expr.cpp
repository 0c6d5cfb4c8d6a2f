#include <strata/ir/expr.hpp>
#include <strata/runtime/eval.hpp>

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace strata;
using namespace strata::ir;
using strata::runtime::Truth;
using strata::testing::entry;

namespace {

auto sample_schema() -> SchemaPtr {
    return make_schema({{.name = "a", .type = DataType::Int64},
                        {.name = "b", .type = DataType::Int64},
                        {.name = "x", .type = DataType::Float64},
                        {.name = "name", .type = DataType::String}});
}

// Row 0: a=6 b=3 x=1.5 name="ann"; row 1: a=7 b=0 x=null name="bob".
auto sample_batch() -> Batch {
    return testing::make_batch(
        sample_schema(),
        {entry(Column<std::int64_t>{6, 7}), entry(Column<std::int64_t>{3, 0}),
         entry(Column<double>{1.5, 0.0}, std::vector<bool>{true, false}),
         entry(Column<std::string>{"ann", "bob"})});
}

}  // namespace

TEST_CASE("infer_type types expressions against a schema", "[ir][expr]") {
    auto schema = sample_schema();

    REQUIRE(infer_type(*binop(ArithmeticOp::Add, col_ref("a"), col_ref("b")), *schema) ==
            ExprType::Int64);
    REQUIRE(infer_type(*binop(ArithmeticOp::Div, col_ref("a"), col_ref("b")), *schema) ==
            ExprType::Float64);
    REQUIRE(infer_type(*binop(ArithmeticOp::Mul, col_ref("a"), col_ref("x")), *schema) ==
            ExprType::Float64);
    REQUIRE(infer_type(*cmp(CompareOp::Eq, col_ref("name"), str_lit("ann")), *schema) ==
            ExprType::Bool);

    SECTION("unknown column") {
        auto result = infer_type(*col_ref("missing"), *schema);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Schema);
    }

    SECTION("arithmetic on text") {
        auto result = infer_type(*binop(ArithmeticOp::Add, col_ref("name"), int_lit(1)), *schema);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Schema);
    }

    SECTION("comparing text with a number") {
        auto result = infer_type(*cmp(CompareOp::Lt, col_ref("name"), col_ref("a")), *schema);
        REQUIRE_FALSE(result.has_value());
    }

    SECTION("CASE with mixed result types") {
        auto expr = case_when({{.condition = cmp(CompareOp::Gt, col_ref("a"), int_lit(1)),
                                .value = str_lit("big")}},
                              int_lit(0));
        REQUIRE_FALSE(infer_type(*expr, *schema).has_value());
    }

    SECTION("row function reading an unknown column") {
        auto fn = row_fn("score", {"nope"}, DataType::Float64,
                         [](const RowView&) -> Result<ScalarValue> { return ScalarValue{1.0}; });
        REQUIRE_FALSE(infer_type(*fn, *schema).has_value());
    }
}

TEST_CASE("assignable follows column widening rules", "[ir][expr]") {
    REQUIRE(assignable(ExprType::Int64, DataType::Float64));
    REQUIRE(assignable(ExprType::Null, DataType::String));
    REQUIRE(assignable(ExprType::Text, DataType::Categorical));
    REQUIRE_FALSE(assignable(ExprType::Float64, DataType::Int64));
    REQUIRE_FALSE(assignable(ExprType::Bool, DataType::Int64));
}

TEST_CASE("referenced_columns and conjunct helpers", "[ir][expr]") {
    auto pred = and_expr(and_expr(cmp(CompareOp::Gt, col_ref("a"), int_lit(1)),
                                  cmp(CompareOp::Lt, col_ref("x"), col_ref("a"))),
                         is_null_expr(col_ref("name")));

    REQUIRE(referenced_columns(*pred) == std::vector<std::string>{"a", "x", "name"});

    auto conjuncts = split_conjuncts(pred);
    REQUIRE(conjuncts.size() == 3);
    auto rebuilt = conjoin(conjuncts);
    REQUIRE(to_string(*rebuilt) == to_string(*pred));
    REQUIRE(conjoin({}) == nullptr);

    auto fn = row_fn("f", {"b", "a"}, DataType::Int64,
                     [](const RowView&) -> Result<ScalarValue> { return ScalarValue{}; });
    REQUIRE(referenced_columns(*fn) == std::vector<std::string>{"b", "a"});
}

TEST_CASE("to_string renders expressions", "[ir][expr]") {
    REQUIRE(to_string(*between("BMI", 10.0, 60.0)) == "((BMI >= 10) AND (BMI <= 60))");
    REQUIRE(to_string(*binop(ArithmeticOp::Sub, col_ref("a"), int_lit(2))) == "(a - 2)");
}

TEST_CASE("bucketize validates its table", "[ir][expr]") {
    REQUIRE_FALSE(bucketize("v", {.boundaries = {}, .labels = {"x"}}).has_value());
    REQUIRE_FALSE(bucketize("v", {.boundaries = {1.0}, .labels = {"x"}}).has_value());
    REQUIRE_FALSE(
        bucketize("v", {.boundaries = {2.0, 1.0}, .labels = {"a", "b", "c"}}).has_value());
}

TEST_CASE("bucketize maps values onto lower-inclusive intervals", "[ir][expr][eval]") {
    auto schema = make_schema({{.name = "BMI", .type = DataType::Float64}});
    auto batch = testing::make_batch(
        schema, {entry(Column<double>{17.0, 18.5, 24.9, 25.0, 29.99, 30.0, 45.0, 0.0},
                       std::vector<bool>{true, true, true, true, true, true, true, false})});
    auto expr = bucketize("BMI", {.boundaries = {18.5, 25.0, 30.0},
                                  .labels = {"Underweight", "Normal", "Overweight", "Obese"}});
    REQUIRE(expr.has_value());
    REQUIRE(infer_type(**expr, *schema) == ExprType::Text);

    std::vector<std::string> expected{"Underweight", "Normal",     "Normal", "Overweight",
                                      "Overweight",  "Obese",      "Obese"};
    for (std::size_t row = 0; row < expected.size(); ++row) {
        auto value = runtime::eval_value(**expr, batch, row);
        REQUIRE(value.has_value());
        REQUIRE(std::get<std::string>(*value) == expected[row]);
    }
    auto missing = runtime::eval_value(**expr, batch, 7);
    REQUIRE(missing.has_value());
    REQUIRE(std::get<std::string>(*missing) == "Obese");
}

TEST_CASE("eval_value computes arithmetic with null propagation", "[runtime][eval]") {
    auto batch = sample_batch();

    auto sum = runtime::eval_value(*binop(ArithmeticOp::Add, col_ref("a"), col_ref("b")), batch, 0);
    REQUIRE(std::get<std::int64_t>(*sum) == 9);

    auto ratio =
        runtime::eval_value(*binop(ArithmeticOp::Div, col_ref("a"), col_ref("b")), batch, 0);
    REQUIRE(std::get<double>(*ratio) == 2.0);

    auto with_null =
        runtime::eval_value(*binop(ArithmeticOp::Mul, col_ref("x"), int_lit(2)), batch, 1);
    REQUIRE(with_null.has_value());
    REQUIRE(is_null(*with_null));

    SECTION("integer division by zero is a compute error") {
        auto result =
            runtime::eval_value(*binop(ArithmeticOp::Div, col_ref("a"), col_ref("b")), batch, 1);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Compute);
    }

    SECTION("integer overflow is a compute error") {
        constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
        auto add = runtime::eval_value(*binop(ArithmeticOp::Add, int_lit(kMax), int_lit(1)),
                                       batch, 0);
        REQUIRE_FALSE(add.has_value());
        REQUIRE(add.error().kind == ErrorKind::Compute);

        auto mul = runtime::eval_value(*binop(ArithmeticOp::Mul, int_lit(kMax), int_lit(2)),
                                       batch, 0);
        REQUIRE_FALSE(mul.has_value());
        REQUIRE(mul.error().kind == ErrorKind::Compute);

        auto fits = runtime::eval_value(*binop(ArithmeticOp::Sub, int_lit(kMax), int_lit(1)),
                                        batch, 0);
        REQUIRE(std::get<std::int64_t>(*fits) == kMax - 1);
    }

    SECTION("float division by zero follows IEEE") {
        auto result =
            runtime::eval_value(*binop(ArithmeticOp::Div, dbl_lit(1.0), dbl_lit(0.0)), batch, 0);
        REQUIRE(result.has_value());
        REQUIRE(std::isinf(std::get<double>(*result)));
    }
}

TEST_CASE("eval_predicate uses three-valued logic", "[runtime][eval]") {
    auto batch = sample_batch();
    auto x_pos = cmp(CompareOp::Gt, col_ref("x"), dbl_lit(0.0));
    auto a_big = cmp(CompareOp::Gt, col_ref("a"), int_lit(100));
    auto a_small = cmp(CompareOp::Lt, col_ref("a"), int_lit(100));

    REQUIRE(runtime::eval_predicate(*x_pos, batch, 0) == Truth::True);
    REQUIRE(runtime::eval_predicate(*x_pos, batch, 1) == Truth::Unknown);
    REQUIRE(runtime::eval_predicate(*and_expr(x_pos, a_big), batch, 1) == Truth::False);
    REQUIRE(runtime::eval_predicate(*and_expr(x_pos, a_small), batch, 1) == Truth::Unknown);
    REQUIRE(runtime::eval_predicate(*or_expr(x_pos, a_small), batch, 1) == Truth::True);
    REQUIRE(runtime::eval_predicate(*not_expr(x_pos), batch, 1) == Truth::Unknown);
    REQUIRE(runtime::eval_predicate(*is_null_expr(col_ref("x")), batch, 1) == Truth::True);
    REQUIRE(runtime::eval_predicate(*is_null_expr(x_pos), batch, 1) == Truth::True);

    SECTION("AND stops at a false left operand") {
        auto failing = cmp(CompareOp::Gt,
                           binop(ArithmeticOp::Div, col_ref("a"), col_ref("b")), int_lit(0));
        REQUIRE(runtime::eval_predicate(*and_expr(a_big, failing), batch, 1) == Truth::False);
        auto evaluated = runtime::eval_predicate(*and_expr(a_small, failing), batch, 1);
        REQUIRE_FALSE(evaluated.has_value());
        REQUIRE(evaluated.error().kind == ErrorKind::Compute);
    }
}

TEST_CASE("compute_selection keeps only true rows", "[runtime][eval]") {
    auto batch = sample_batch();
    auto selected =
        runtime::compute_selection(*cmp(CompareOp::Ge, col_ref("x"), dbl_lit(1.0)), batch);
    REQUIRE(selected.has_value());
    REQUIRE(*selected == std::vector<std::size_t>{0});

    auto text =
        runtime::compute_selection(*cmp(CompareOp::Eq, col_ref("name"), str_lit("bob")), batch);
    REQUIRE(*text == std::vector<std::size_t>{1});
}

TEST_CASE("evaluate_column builds a typed column", "[runtime][eval]") {
    auto batch = sample_batch();

    SECTION("column reference of the same type is shared") {
        auto column = runtime::evaluate_column(*col_ref("a"), DataType::Int64, batch);
        REQUIRE(column.has_value());
        REQUIRE(column->column == batch.find("a")->column);
    }

    SECTION("integers widen into a float column") {
        auto column = runtime::evaluate_column(*col_ref("a"), DataType::Float64, batch);
        REQUIRE(column.has_value());
        REQUIRE(std::get<double>(value_at(*column, 1)) == 7.0);
    }

    SECTION("row functions see only declared inputs") {
        auto doubled = row_fn("doubled", {"a"}, DataType::Int64,
                              [](const RowView& row) -> Result<ScalarValue> {
                                  auto a = row.get("a");
                                  if (!a) {
                                      return std::unexpected(a.error());
                                  }
                                  return ScalarValue{std::get<std::int64_t>(*a) * 2};
                              });
        auto column = runtime::evaluate_column(*doubled, DataType::Int64, batch);
        REQUIRE(column.has_value());
        REQUIRE(std::get<std::int64_t>(value_at(*column, 1)) == 14);

        auto sneaky =
            row_fn("sneaky", {"a"}, DataType::Int64,
                   [](const RowView& row) -> Result<ScalarValue> { return row.get("b"); });
        auto failed = runtime::evaluate_column(*sneaky, DataType::Int64, batch);
        REQUIRE_FALSE(failed.has_value());
        REQUIRE(failed.error().kind == ErrorKind::Compute);
        REQUIRE(failed.error().message.find("sneaky") != std::string::npos);
    }

    SECTION("value of the wrong type is a compute error") {
        auto failed = runtime::evaluate_column(*col_ref("name"), DataType::Int64, batch);
        REQUIRE_FALSE(failed.has_value());
        REQUIRE(failed.error().kind == ErrorKind::Compute);
    }
}
