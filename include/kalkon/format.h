#pragma once

#include <optional>
#include <string>

#include "kalkon/value.h"

namespace kalkon {

enum class ValueSystem {
    Decimal,
    Hexadecimal,
    Binary,
};

// Int is the unbounded default; the others wrap results to a fixed two's complement width.
enum class IntegerType {
    Int,
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
};

struct DisplayMode {
    ValueSystem system = ValueSystem::Decimal;
    IntegerType type = IntegerType::Int;
};

// Short names as typed after ':' ("dec", "hex", "bin", "int", "i8" ... "u64").
std::string valueSystemName(ValueSystem system);
std::string integerTypeName(IntegerType type);
std::optional<ValueSystem> valueSystemFromName(const std::string& name);
std::optional<IntegerType> integerTypeFromName(const std::string& name);

int integerTypeBits(IntegerType type);
bool isSigned(IntegerType type);

// Reduces an integer to the width of `type`. Unsigned 64-bit values above LLONG_MAX keep their bit pattern.
long long wrapInteger(long long value, IntegerType type);
Value wrapValue(const Value& value, IntegerType type);

std::string formatValue(const Value& value, const DisplayMode& mode);

}  // namespace kalkon
