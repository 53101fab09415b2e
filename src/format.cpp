#include "kalkon/format.h"

#include <fmt/format.h>

namespace kalkon {

namespace {

unsigned long long widthMask(int bits) {
    return bits >= 64 ? ~0ULL : (1ULL << bits) - 1;
}

std::string formatBits(unsigned long long bits, ValueSystem system) {
    switch (system) {
        case ValueSystem::Hexadecimal:
            return fmt::format("0x{:x}", bits);
        case ValueSystem::Binary:
            return fmt::format("0b{:b}", bits);
        case ValueSystem::Decimal:
            break;
    }
    return fmt::format("{}", bits);
}

}  // namespace

std::string valueSystemName(ValueSystem system) {
    switch (system) {
        case ValueSystem::Decimal:
            return "dec";
        case ValueSystem::Hexadecimal:
            return "hex";
        case ValueSystem::Binary:
            return "bin";
    }
    return "dec";
}

std::string integerTypeName(IntegerType type) {
    switch (type) {
        case IntegerType::Int:
            return "int";
        case IntegerType::Int8:
            return "i8";
        case IntegerType::Int16:
            return "i16";
        case IntegerType::Int32:
            return "i32";
        case IntegerType::Int64:
            return "i64";
        case IntegerType::UInt8:
            return "u8";
        case IntegerType::UInt16:
            return "u16";
        case IntegerType::UInt32:
            return "u32";
        case IntegerType::UInt64:
            return "u64";
    }
    return "int";
}

std::optional<ValueSystem> valueSystemFromName(const std::string& name) {
    for (const ValueSystem system : {ValueSystem::Decimal, ValueSystem::Hexadecimal, ValueSystem::Binary}) {
        if (valueSystemName(system) == name) {
            return system;
        }
    }
    return std::nullopt;
}

std::optional<IntegerType> integerTypeFromName(const std::string& name) {
    for (const IntegerType type : {IntegerType::Int, IntegerType::Int8, IntegerType::Int16, IntegerType::Int32,
                                   IntegerType::Int64, IntegerType::UInt8, IntegerType::UInt16, IntegerType::UInt32,
                                   IntegerType::UInt64}) {
        if (integerTypeName(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

int integerTypeBits(IntegerType type) {
    switch (type) {
        case IntegerType::Int8:
        case IntegerType::UInt8:
            return 8;
        case IntegerType::Int16:
        case IntegerType::UInt16:
            return 16;
        case IntegerType::Int32:
        case IntegerType::UInt32:
            return 32;
        case IntegerType::Int:
        case IntegerType::Int64:
        case IntegerType::UInt64:
            break;
    }
    return 64;
}

bool isSigned(IntegerType type) {
    switch (type) {
        case IntegerType::UInt8:
        case IntegerType::UInt16:
        case IntegerType::UInt32:
        case IntegerType::UInt64:
            return false;
        default:
            return true;
    }
}

long long wrapInteger(long long value, IntegerType type) {
    const int bits = integerTypeBits(type);
    if (bits >= 64) {
        return value;
    }

    const unsigned long long pattern = static_cast<unsigned long long>(value) & widthMask(bits);
    if (isSigned(type) && (pattern >> (bits - 1)) != 0) {
        return static_cast<long long>(pattern | ~widthMask(bits));
    }
    return static_cast<long long>(pattern);
}

Value wrapValue(const Value& value, IntegerType type) {
    if (!value.isInteger()) {
        return value;
    }
    return Value::fromInteger(wrapInteger(value.asInteger(), type));
}

std::string formatValue(const Value& value, const DisplayMode& mode) {
    if (!value.isInteger()) {
        return value.toString();
    }

    const long long integer = wrapInteger(value.asInteger(), mode.type);
    const unsigned long long pattern = static_cast<unsigned long long>(integer) & widthMask(integerTypeBits(mode.type));

    if (mode.type == IntegerType::Int) {
        if (mode.system == ValueSystem::Decimal) {
            return std::to_string(integer);
        }
        if (integer < 0) {
            return "-" + formatBits(0ULL - static_cast<unsigned long long>(integer), mode.system);
        }
        return formatBits(pattern, mode.system);
    }

    if (mode.system == ValueSystem::Decimal && isSigned(mode.type)) {
        return std::to_string(integer);
    }
    return formatBits(pattern, mode.system);
}

}  // namespace kalkon
