#include <sstream>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "kalkon/repl.h"

using Catch::Matchers::ContainsSubstring;

TEST_CASE("Batch mode prints one result per line") {
    kalkon::Session session;
    kalkon::Repl repl;
    std::istringstream input("2+2\n# comment\n\nx = 3\nx * 2\n:hex\n255\n");
    std::ostringstream output;
    std::ostringstream error;

    CHECK(repl.runStream(session, input, output, error) == 0);
    CHECK(output.str() == "4\nx = 3\n6\nmode: hex int\n0xff\n");
    CHECK(error.str().empty());
}

TEST_CASE("Batch mode stops at the first failing line") {
    kalkon::Session session;
    kalkon::Repl repl;
    std::istringstream input("1+1\n1/0\n3\n");
    std::ostringstream output;
    std::ostringstream error;

    CHECK(repl.runStream(session, input, output, error) == 1);
    CHECK(output.str() == "2\n");
    CHECK_THAT(error.str(), ContainsSubstring("Line 2: DivisionError"));
}

TEST_CASE("Missing input file") {
    kalkon::Session session;
    std::ostringstream output;
    std::ostringstream error;

    CHECK(kalkon::Repl().runFile(session, "/nonexistent/kalkon-input.txt", output, error) == 1);
    CHECK_THAT(error.str(), ContainsSubstring("Unable to open file"));
}

TEST_CASE("Interactive mode keeps going after errors") {
    kalkon::Session session;
    kalkon::Repl repl;
    std::istringstream input("2^10\n1/0\n2 + * 3\n1+1\nexit\n3\n");
    std::ostringstream output;
    std::ostringstream error;

    CHECK(repl.runInteractive(session, input, output, error) == 0);
    CHECK_THAT(output.str(), ContainsSubstring("1024\n"));
    CHECK_THAT(output.str(), ContainsSubstring("kalkon> 2\n"));
    CHECK_THAT(error.str(), ContainsSubstring("DivisionError: Division by zero"));
    CHECK_THAT(error.str(), ContainsSubstring("  2 + * 3\n      ^\n"));
    CHECK(session.history().size() == 2);
}

TEST_CASE("Interactive listing commands") {
    kalkon::Session session;
    kalkon::Repl repl;
    std::istringstream input(":history\n2+3\nrate = 4\n:history\n:vars\nhelp\n");
    std::ostringstream output;
    std::ostringstream error;

    CHECK(repl.runInteractive(session, input, output, error) == 0);
    CHECK_THAT(output.str(), ContainsSubstring("(history is empty)"));
    CHECK_THAT(output.str(), ContainsSubstring("$1    2+3 = 5"));
    CHECK_THAT(output.str(), ContainsSubstring("rate = 4"));
    CHECK_THAT(output.str(), ContainsSubstring("Commands:"));
    CHECK_THAT(output.str(), ContainsSubstring("sqrt"));
    CHECK(error.str().empty());
}

TEST_CASE("Batch mode prints listings") {
    kalkon::Session session;
    kalkon::Repl repl;
    std::istringstream input("2+3\n:history\nrate = 4\n:vars\n7\n");
    std::ostringstream output;
    std::ostringstream error;

    CHECK(repl.runStream(session, input, output, error) == 0);
    CHECK(output.str() == "5\n  $1    2+3 = 5\nrate = 4\n  rate = 4\n7\n");
    CHECK(error.str().empty());
}
