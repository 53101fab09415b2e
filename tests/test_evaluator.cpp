#include <cmath>
#include <string>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "kalkon/evaluator.h"

using kalkon::ErrorKind;
using kalkon::EvaluationResult;

namespace {

EvaluationResult eval(const std::string& text) {
    const kalkon::Environment environment;
    return kalkon::Evaluator().evaluate(kalkon::Expression(text), environment);
}

std::string show(const std::string& text) {
    const EvaluationResult result = eval(text);
    REQUIRE(result.ok());
    return result.value().toString();
}

ErrorKind failureKind(const std::string& text) {
    const EvaluationResult result = eval(text);
    REQUIRE_FALSE(result.ok());
    return result.failure().kind;
}

}  // namespace

TEST_CASE("Arithmetic precedence and associativity") {
    CHECK(show("2+2") == "4");
    CHECK(show("1 + 2 * 3") == "7");
    CHECK(show("(1 + 2) * 3") == "9");
    CHECK(show("10 - 4 - 3") == "3");
    CHECK(show("2^3") == "8");
    CHECK(show("2**3") == "8");
    CHECK(show("2^3^2") == "512");
    CHECK(show("7 / 2") == "3.5");
    CHECK(show("8 / 2") == "4");
    CHECK(eval("8 / 2").value().isInteger());
}

TEST_CASE("Unary operators") {
    CHECK(show("-3+5") == "2");
    CHECK(show("-(3 + 2)") == "-5");
    CHECK(show("- -3") == "3");
    CHECK(show("+4") == "4");
    CHECK(show("-2^2") == "4");
    CHECK(show("2^-1") == "0.5");
    CHECK(show("2 * -3") == "-6");
}

TEST_CASE("Modulo follows the sign of the divisor") {
    CHECK(show("7 % 3") == "1");
    CHECK(show("-7 % 3") == "2");
    CHECK(show("7 % -3") == "-2");
    CHECK(show("7.5 % 2") == "1.5");
}

TEST_CASE("Bitwise operators work on integers") {
    CHECK(show("0xff & 0x0f") == "15");
    CHECK(show("5 | 2") == "7");
    CHECK(show("~0") == "-1");
    CHECK(show("1 << 4") == "16");
    CHECK(show("-16 >> 2") == "-4");
    CHECK(show("1 >> 80") == "0");
    CHECK(eval("1 << 70").value().asDouble() == Catch::Approx(std::ldexp(1.0, 70)));

    CHECK(failureKind("1.5 & 1") == ErrorKind::Domain);
    CHECK(failureKind("~0.5") == ErrorKind::Domain);
    CHECK(failureKind("1 << -1") == ErrorKind::Domain);
}

TEST_CASE("Built-in functions and constants") {
    CHECK(eval("sin(pi / 2)").value().asDouble() == Catch::Approx(1.0).margin(1e-12));
    CHECK(eval("atan2(1, 1)").value().asDouble() == Catch::Approx(std::atan(1.0)));
    CHECK(eval("tau").value().asDouble() == Catch::Approx(2 * std::acos(-1.0)));
    CHECK(eval("log(e)").value().asDouble() == Catch::Approx(1.0));
    CHECK(show("sqrt(16)") == "4");
    CHECK(show("log10(1000)") == "3");
    CHECK(show("log2(1024)") == "10");
    CHECK(show("log(8, 2)") == "3");
    CHECK(show("abs(-5)") == "5");
    CHECK(show("round(2.5)") == "2");
    CHECK(show("round(3.5)") == "4");
    CHECK(show("floor(-1.5)") == "-2");
    CHECK(show("ceil(1.2)") == "2");
    CHECK(show("trunc(-1.7)") == "-1");
    CHECK(show("min(3, 1, 2)") == "1");
    CHECK(show("max(1, 2.5)") == "2.5");
    CHECK(show("pow(2, 10)") == "1024");
    CHECK(show("hypot(3, 4)") == "5");
    CHECK(show("cbrt(27)") == "3");
}

TEST_CASE("Division by zero is a DivisionError") {
    CHECK(failureKind("1/0") == ErrorKind::Division);
    CHECK(failureKind("1.5 / 0.0") == ErrorKind::Division);
    CHECK(failureKind("5 % 0") == ErrorKind::Division);
    CHECK(failureKind("0 ^ -1") == ErrorKind::Division);
    CHECK_THAT(eval("1/0").failure().message, Catch::Matchers::ContainsSubstring("Division by zero"));
}

TEST_CASE("Unknown names are UnknownSymbolErrors") {
    CHECK(failureKind("foo(1)") == ErrorKind::UnknownSymbol);
    CHECK_THAT(eval("foo(1)").failure().message, Catch::Matchers::ContainsSubstring("Unknown function 'foo'"));
    CHECK(failureKind("foo(1/0)") == ErrorKind::UnknownSymbol);
    CHECK(failureKind("x + 1") == ErrorKind::UnknownSymbol);
    CHECK_THAT(eval("x + 1").failure().message, Catch::Matchers::ContainsSubstring("Unknown variable 'x'"));
    CHECK(failureKind("sqrt") == ErrorKind::UnknownSymbol);
    CHECK(failureKind("$1") == ErrorKind::UnknownSymbol);
}

TEST_CASE("Malformed syntax is a SyntaxError with a position") {
    const EvaluationResult result = eval("2 + * 3");
    REQUIRE_FALSE(result.ok());
    CHECK(result.failure().kind == ErrorKind::Syntax);
    REQUIRE(result.failure().position.has_value());
    CHECK(*result.failure().position == 4);

    CHECK(failureKind("(1 + 2") == ErrorKind::Syntax);
    CHECK(failureKind("2 @ 3") == ErrorKind::Syntax);
}

TEST_CASE("Empty input is an error, not a crash") {
    for (const std::string text : {"", "   ", "\t\n"}) {
        const EvaluationResult result = eval(text);
        REQUIRE_FALSE(result.ok());
        CHECK(result.failure().kind == ErrorKind::Syntax);
        CHECK(result.failure().message == "Empty expression");
        CHECK(result.failure().position == std::size_t{0});
    }
}

TEST_CASE("Results out of range are OverflowErrors") {
    CHECK(failureKind("10.0 ^ 400") == ErrorKind::Overflow);
    CHECK(failureKind("exp(1000)") == ErrorKind::Overflow);
    CHECK(failureKind("1e308 * 10") == ErrorKind::Overflow);
    CHECK(failureKind("1e999") == ErrorKind::Overflow);
    CHECK(show("1e-999") == "0");
    CHECK(show("inf + 1") == "inf");
}

TEST_CASE("Tiny results stay non-zero doubles") {
    for (const std::string text : {"1e-13", "2^-50", "1/3e12", "0.5e-12 + 0.5e-12", "sin(pi)"}) {
        CAPTURE(text);
        const EvaluationResult result = eval(text);
        REQUIRE(result.ok());
        CHECK_FALSE(result.value().isInteger());
        CHECK(result.value().asDouble() != 0.0);
    }
    CHECK(show("1e-13") == "1e-13");
    CHECK(eval("2^-50").value().asDouble() == std::ldexp(1.0, -50));
    CHECK(eval("1e-13 * 2").value().asDouble() == Catch::Approx(2e-13));
    CHECK(eval("1/3e12").value().asDouble() == Catch::Approx(1.0 / 3e12));
}

TEST_CASE("Integer overflow falls back to floating point") {
    const EvaluationResult sum = eval("9223372036854775807 + 1");
    REQUIRE(sum.ok());
    CHECK_FALSE(sum.value().isInteger());
    CHECK(sum.value().asDouble() == Catch::Approx(9223372036854775808.0));

    CHECK(eval("2 ^ 62").value().isInteger());
    CHECK_FALSE(eval("2 ^ 64").value().isInteger());
    CHECK_FALSE(eval("99999999999999999999").value().isInteger());
}

TEST_CASE("Math domain errors") {
    CHECK(failureKind("sqrt(-1)") == ErrorKind::Domain);
    CHECK(failureKind("log(0)") == ErrorKind::Domain);
    CHECK(failureKind("log(8, 1)") == ErrorKind::Domain);
    CHECK(failureKind("asin(2)") == ErrorKind::Domain);
    CHECK(failureKind("(-8) ^ 0.5") == ErrorKind::Domain);
    CHECK(failureKind("sin(1, 2)") == ErrorKind::Domain);
    CHECK_THAT(eval("sin(1, 2)").failure().message,
               Catch::Matchers::ContainsSubstring("expects 1 argument(s), got 2"));
    CHECK_THAT(eval("max()").failure().message, Catch::Matchers::ContainsSubstring("at least 1"));
}

TEST_CASE("Assigning to a constant fails without touching the environment") {
    const EvaluationResult result = eval("pi = 3");
    REQUIRE_FALSE(result.ok());
    CHECK(result.failure().kind == ErrorKind::Domain);
    CHECK_THAT(result.failure().message, Catch::Matchers::ContainsSubstring("built-in constant"));

    CHECK(show("x = 2 + 3") == "5");
}

TEST_CASE("Variables and history references are read from the caller") {
    kalkon::Environment environment;
    environment.setVariable("rate", kalkon::Value::fromInteger(3));

    kalkon::HistoryStore history;
    history.append("2 + 3", kalkon::Value::fromInteger(5));
    history.append("10", kalkon::Value::fromInteger(10));

    const kalkon::Evaluator evaluator{};
    CHECK(evaluator.evaluate(kalkon::Expression("$1 + $2 * rate"), environment, history).value().asInteger() == 35);

    const EvaluationResult missing = evaluator.evaluate(kalkon::Expression("$3"), environment, history);
    REQUIRE_FALSE(missing.ok());
    CHECK(missing.failure().kind == ErrorKind::UnknownSymbol);
    CHECK_THAT(missing.failure().message, Catch::Matchers::ContainsSubstring("out of range"));
}

TEST_CASE("Evaluation is deterministic") {
    const kalkon::Environment environment;
    const kalkon::Evaluator evaluator{};

    for (const std::string text : {"2^0.5 + sin(1)", "1/0", "2 + * 3", "foo(2)", "7 / 3"}) {
        const kalkon::Expression expression(text);
        const EvaluationResult first = evaluator.evaluate(expression, environment);
        const EvaluationResult second = evaluator.evaluate(expression, environment);
        const EvaluationResult fresh = evaluator.evaluate(kalkon::Expression(text), environment);
        CHECK(first == second);
        CHECK(first == fresh);
    }
}

TEST_CASE("Evaluation does not mutate the environment") {
    const kalkon::Environment environment;
    const kalkon::Evaluator evaluator{};

    REQUIRE(evaluator.evaluate(kalkon::Expression("y = 4"), environment).ok());
    CHECK_FALSE(environment.hasVariable("y"));
}
