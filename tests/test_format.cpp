#include <limits>

#include <catch2/catch_test_macros.hpp>

#include "kalkon/format.h"

using kalkon::DisplayMode;
using kalkon::IntegerType;
using kalkon::Value;
using kalkon::ValueSystem;

TEST_CASE("Decimal values print without trailing zeros") {
    CHECK(Value::fromDouble(0.1 + 0.2).toString() == "0.3");
    CHECK(Value::fromDouble(3.5).toString() == "3.5");
    CHECK(Value::fromDouble(2.0).toString() == "2");
    CHECK(Value::fromDouble(2.0).isInteger());
    CHECK(Value(1e20).toString() == "1e+20");
    CHECK(Value(-0.0).toString() == "0");
    CHECK(Value(std::numeric_limits<double>::infinity()).toString() == "inf");
}

TEST_CASE("Hexadecimal and binary display of plain integers") {
    CHECK(formatValue(Value::fromInteger(255), {ValueSystem::Hexadecimal, IntegerType::Int}) == "0xff");
    CHECK(formatValue(Value::fromInteger(5), {ValueSystem::Binary, IntegerType::Int}) == "0b101");
    CHECK(formatValue(Value::fromInteger(-255), {ValueSystem::Hexadecimal, IntegerType::Int}) == "-0xff");
    CHECK(formatValue(Value::fromInteger(std::numeric_limits<long long>::min()),
                      {ValueSystem::Hexadecimal, IntegerType::Int}) == "-0x8000000000000000");
    CHECK(formatValue(Value::fromInteger(0), {ValueSystem::Binary, IntegerType::Int}) == "0b0");
}

TEST_CASE("Fixed-width types wrap and show the bit pattern") {
    CHECK(kalkon::wrapInteger(256, IntegerType::UInt8) == 0);
    CHECK(kalkon::wrapInteger(200, IntegerType::Int8) == -56);
    CHECK(kalkon::wrapInteger(-1, IntegerType::UInt16) == 65535);
    CHECK(kalkon::wrapInteger(0x80000000LL, IntegerType::Int32) == -2147483648LL);
    CHECK(kalkon::wrapInteger(-1, IntegerType::Int64) == -1);

    CHECK(formatValue(Value::fromInteger(-1), {ValueSystem::Hexadecimal, IntegerType::Int8}) == "0xff");
    CHECK(formatValue(Value::fromInteger(-1), {ValueSystem::Binary, IntegerType::Int8}) == "0b11111111");
    CHECK(formatValue(Value::fromInteger(-1), {ValueSystem::Decimal, IntegerType::UInt64}) == "18446744073709551615");
    CHECK(formatValue(Value::fromInteger(-1), {ValueSystem::Hexadecimal, IntegerType::UInt64}) ==
          "0xffffffffffffffff");
    CHECK(formatValue(Value::fromInteger(300), {ValueSystem::Decimal, IntegerType::UInt8}) == "44");
    CHECK(formatValue(Value::fromInteger(-5), {ValueSystem::Decimal, IntegerType::Int16}) == "-5");
}

TEST_CASE("Floating values ignore the integer display settings") {
    const DisplayMode mode{ValueSystem::Hexadecimal, IntegerType::UInt8};
    CHECK(formatValue(Value::fromDouble(3.5), mode) == "3.5");
    CHECK(kalkon::wrapValue(Value::fromDouble(300.5), IntegerType::UInt8).asDouble() == 300.5);
}

TEST_CASE("Display settings are looked up by their short names") {
    CHECK(kalkon::valueSystemFromName("hex") == ValueSystem::Hexadecimal);
    CHECK(kalkon::valueSystemFromName("dec") == ValueSystem::Decimal);
    CHECK_FALSE(kalkon::valueSystemFromName("oct").has_value());

    CHECK(kalkon::integerTypeFromName("u32") == IntegerType::UInt32);
    CHECK(kalkon::integerTypeFromName("int") == IntegerType::Int);
    CHECK_FALSE(kalkon::integerTypeFromName("i128").has_value());

    CHECK(kalkon::integerTypeName(IntegerType::Int16) == "i16");
    CHECK(kalkon::integerTypeBits(IntegerType::UInt32) == 32);
    CHECK_FALSE(kalkon::isSigned(IntegerType::UInt8));
}
