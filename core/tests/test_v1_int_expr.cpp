#include <catch2/catch.hpp>

#include "settree/v1/errors.hpp"
#include "settree/v1/int_expr.hpp"

#include <cstdint>
#include <limits>
#include <string>

using namespace settree::v1;

TEST_CASE("v1 integer expressions are recognised by their alphabet", "[v1][int_expr]") {
    CHECK_FALSE(is_int_expression("(1 << 0)"));
    CHECK(is_int_expression("1+2"));
    CHECK(is_int_expression("0x10|0x01"));
    CHECK(is_int_expression("!(4/2)"));
    CHECK_FALSE(is_int_expression("0xff"));
    CHECK_FALSE(is_int_expression("abc"));
    CHECK_FALSE(is_int_expression(""));
}

TEST_CASE("v1 integer expressions follow C precedence", "[v1][int_expr]") {
    CHECK(eval_int_expression("1+2*3") == 7);
    CHECK(eval_int_expression("(1+2)*3") == 9);
    CHECK(eval_int_expression("8-2-1") == 5);
    CHECK(eval_int_expression("7/2") == 3);
    CHECK(eval_int_expression("1|2&3") == 3);
    CHECK(eval_int_expression("4&1+1") == 0);
    CHECK(eval_int_expression("0x10|0x01") == 17);
}

TEST_CASE("v1 integer expressions support unary operators", "[v1][int_expr]") {
    CHECK(eval_int_expression("-5") == -5);
    CHECK(eval_int_expression("+5") == 5);
    CHECK(eval_int_expression("!0") == 1);
    CHECK(eval_int_expression("!7") == 0);
    CHECK(eval_int_expression("-(2*3)+10") == 4);
}

TEST_CASE("v1 malformed integer expressions raise PropertyError", "[v1][int_expr]") {
    for (const char* text : {"1+", "(1", "1)", "", "*2", "0x"}) {
        INFO(text);
        try {
            (void)eval_int_expression(text);
            FAIL("expected PropertyError");
        } catch (const PropertyError& e) {
            CHECK(e.code() == kDiagBadExpression);
        }
    }
}

TEST_CASE("v1 division by zero in an integer expression is an error", "[v1][int_expr]") {
    CHECK_THROWS_AS(eval_int_expression("1/0"), PropertyError);
    CHECK_THROWS_AS(eval_int_expression("4/(2-2)"), PropertyError);
}

TEST_CASE("v1 integer expressions reject overflowing division", "[v1][int_expr]") {
    try {
        (void)eval_int_expression("-0x8000000000000000/-1");
        FAIL("expected PropertyError");
    } catch (const PropertyError& e) {
        CHECK(e.code() == kDiagBadExpression);
        CHECK(std::string(e.what()).find("overflow") != std::string::npos);
    }
    CHECK_THROWS_AS(eval_int_expression("(0-9223372036854775807-1)/(0-1)"), PropertyError);
    CHECK(eval_int_expression("-0x8000000000000000/1") == std::numeric_limits<std::int64_t>::min());
}

TEST_CASE("v1 integer expressions wrap on negation like other arithmetic", "[v1][int_expr]") {
    // Negating the most negative value wraps to itself
    CHECK(eval_int_expression("-0x8000000000000000") == std::numeric_limits<std::int64_t>::min());
    CHECK(eval_int_expression("-(-0x8000000000000000)") == std::numeric_limits<std::int64_t>::min());
    CHECK(eval_int_expression("-(-0x8000000000000000)/2") == std::numeric_limits<std::int64_t>::min() / 2);
}
