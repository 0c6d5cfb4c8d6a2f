#include <strata/core/column.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <stdexcept>
#include <vector>

TEST_CASE("Column<int64_t> basic operations", "[core][column]") {
    strata::Column<std::int64_t> col{1, 2, 3, 4, 5};

    SECTION("size and element access") {
        REQUIRE(col.size() == 5);
        REQUIRE_FALSE(col.empty());
        REQUIRE(col.at(0) == 1);
        REQUIRE(col[4] == 5);
    }

    SECTION("push_back grows the column") {
        col.push_back(6);
        REQUIRE(col.size() == 6);
        REQUIRE(col.at(5) == 6);
    }

    SECTION("span provides zero-copy view") {
        auto view = col.span();
        REQUIRE(view.size() == 5);
        REQUIRE(view[2] == 3);
    }

    SECTION("at() throws on out-of-bounds") {
        REQUIRE_THROWS_AS(col.at(100), std::out_of_range);
    }
}

TEST_CASE("Column take and slice copy selected rows", "[core][column]") {
    strata::Column<double> col{1.5, 2.5, 3.5, 4.5};

    std::vector<std::size_t> picks{3, 0};
    auto taken = col.take(picks);
    REQUIRE(taken.size() == 2);
    REQUIRE(taken[0] == 4.5);
    REQUIRE(taken[1] == 1.5);

    auto sliced = col.slice(1, 2);
    REQUIRE(sliced.size() == 2);
    REQUIRE(sliced[0] == 2.5);
    REQUIRE(sliced[1] == 3.5);
}

TEST_CASE("Column append concatenates", "[core][column]") {
    strata::Column<std::int64_t> a{1, 2};
    strata::Column<std::int64_t> b{3};
    a.append(b);
    REQUIRE(a.size() == 3);
    REQUIRE(a[2] == 3);
}

TEST_CASE("Column default-constructs empty", "[core][column]") {
    strata::Column<std::int64_t> col;

    REQUIRE(col.empty());
    REQUIRE(col.size() == 0);
}

TEST_CASE("Categorical column encodes values once", "[core][column][categorical]") {
    strata::Column<strata::Categorical> col{"Normal", "Obese", "Normal"};

    REQUIRE(col.size() == 3);
    REQUIRE(col.dictionary().size() == 2);
    REQUIRE(col.code_at(0) == col.code_at(2));
    REQUIRE(col[1] == "Obese");
    REQUIRE(col.find_code("Obese").has_value());
    REQUIRE_FALSE(col.find_code("Underweight").has_value());
}

TEST_CASE("Categorical take shares the dictionary", "[core][column][categorical]") {
    strata::Column<strata::Categorical> col{"a", "b", "c"};
    std::vector<std::size_t> picks{2, 2, 0};

    auto taken = col.take(picks);
    REQUIRE(taken.size() == 3);
    REQUIRE(taken[0] == "c");
    REQUIRE(taken[2] == "a");
    REQUIRE(&taken.dictionary() == &col.dictionary());

    auto sliced = col.slice(1, 1);
    REQUIRE(sliced.size() == 1);
    REQUIRE(sliced[0] == "b");
}

TEST_CASE("Categorical append re-encodes foreign dictionaries", "[core][column][categorical]") {
    strata::Column<strata::Categorical> left{"x", "y"};
    strata::Column<strata::Categorical> right{"z", "x"};

    left.append(right);
    REQUIRE(left.size() == 4);
    REQUIRE(left[2] == "z");
    REQUIRE(left[3] == "x");
    REQUIRE(left.code_at(3) == left.code_at(0));
    REQUIRE(left.dictionary().size() == 3);
}
