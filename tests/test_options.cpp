#include <sstream>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "kalkon/options.h"

using kalkon::Options;
using kalkon::OptionsError;
using kalkon::parseOptions;

TEST_CASE("No arguments starts the REPL with defaults") {
    const Options options = parseOptions({});

    CHECK_FALSE(options.show_help);
    CHECK_FALSE(options.file.has_value());
    CHECK_FALSE(options.session.retention.isBounded());
    CHECK(options.session.display.system == kalkon::ValueSystem::Decimal);
    CHECK(options.session.display.type == kalkon::IntegerType::Int);
}

TEST_CASE("File mode accepts a flag or a bare path") {
    CHECK(*parseOptions({"--file", "exprs.txt"}).file == "exprs.txt");
    CHECK(*parseOptions({"-f", "exprs.txt"}).file == "exprs.txt");
    CHECK(*parseOptions({"exprs.txt"}).file == "exprs.txt");
    CHECK_THROWS_WITH(parseOptions({"--file"}), Catch::Matchers::ContainsSubstring("Missing value"));
    CHECK_THROWS_AS(parseOptions({"a.txt", "b.txt"}), OptionsError);
}

TEST_CASE("History limit option") {
    const Options bounded = parseOptions({"--history-limit", "3"});
    CHECK(bounded.session.retention.isBounded());
    CHECK(bounded.session.retention.limit() == 3);

    CHECK_FALSE(parseOptions({"--history-limit", "0"}).session.retention.isBounded());
    CHECK_THROWS_WITH(parseOptions({"--history-limit", "abc"}),
                      Catch::Matchers::ContainsSubstring("Invalid history limit"));
    CHECK_THROWS_AS(parseOptions({"--history-limit", "-2"}), OptionsError);
    CHECK_THROWS_AS(parseOptions({"--history-limit", "5x"}), OptionsError);
}

TEST_CASE("Display options") {
    const Options options = parseOptions({"--system", "hex", "--type", "u8"});
    CHECK(options.session.display.system == kalkon::ValueSystem::Hexadecimal);
    CHECK(options.session.display.type == kalkon::IntegerType::UInt8);

    CHECK_THROWS_WITH(parseOptions({"--system", "oct"}), Catch::Matchers::ContainsSubstring("Unknown value system"));
    CHECK_THROWS_WITH(parseOptions({"--type", "i128"}), Catch::Matchers::ContainsSubstring("Unknown integer type"));
}

TEST_CASE("Help and unknown options") {
    CHECK(parseOptions({"-h"}).show_help);
    CHECK(parseOptions({"--help"}).show_help);
    CHECK_THROWS_WITH(parseOptions({"--bogus"}), Catch::Matchers::ContainsSubstring("Unknown option '--bogus'"));

    std::ostringstream usage;
    kalkon::printUsage(usage);
    CHECK_THAT(usage.str(), Catch::Matchers::ContainsSubstring("--history-limit"));
}
