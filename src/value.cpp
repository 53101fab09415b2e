#include "kalkon/value.h"

#include <cmath>
#include <optional>
#include <stdexcept>

#include <fmt/format.h>

namespace kalkon {

namespace {

// 2^63 is exactly representable; every double strictly below it converts safely.
constexpr double kLongLongLimit = 9223372036854775808.0;

std::optional<long long> exactInteger(double floating_value) {
    if (!std::isfinite(floating_value) || std::trunc(floating_value) != floating_value) {
        return std::nullopt;
    }
    if (floating_value < -kLongLongLimit || floating_value >= kLongLongLimit) {
        return std::nullopt;
    }
    return static_cast<long long>(floating_value);
}

// Up to 15 significant digits; a fractional part loses its trailing zeros.
std::string decimalText(double floating_value) {
    if (std::isnan(floating_value)) {
        return "nan";
    }
    if (std::isinf(floating_value)) {
        return std::signbit(floating_value) ? "-inf" : "inf";
    }

    std::string text = fmt::format("{:.15g}", floating_value);
    const bool has_exponent = text.find_first_of("eE") != std::string::npos;
    if (!has_exponent && text.find('.') != std::string::npos) {
        text.erase(text.find_last_not_of('0') + 1);
        if (text.back() == '.') {
            text.pop_back();
        }
    }
    return text == "-0" ? "0" : text;
}

}  // namespace

Value::Value() : value_(0LL) {}

Value::Value(long long integer_value) : value_(integer_value) {}

Value::Value(double floating_value) : value_(floating_value) {}

Value Value::fromInteger(long long integer_value) {
    return Value(integer_value);
}

Value Value::fromDouble(double floating_value) {
    if (const auto integral = exactInteger(floating_value)) {
        return Value(*integral);
    }
    return Value(floating_value);
}

bool Value::isInteger() const {
    return std::holds_alternative<long long>(value_);
}

long long Value::asInteger() const {
    if (const auto* integer_value = std::get_if<long long>(&value_)) {
        return *integer_value;
    }
    throw std::logic_error("Value is not an integer");
}

double Value::asDouble() const {
    if (const auto* integer_value = std::get_if<long long>(&value_)) {
        return static_cast<double>(*integer_value);
    }
    return std::get<double>(value_);
}

std::string Value::toString() const {
    if (const auto* integer_value = std::get_if<long long>(&value_)) {
        return std::to_string(*integer_value);
    }
    return decimalText(std::get<double>(value_));
}

bool Value::operator==(const Value& other) const {
    if (value_.index() != other.value_.index()) {
        return false;
    }
    if (isInteger()) {
        return std::get<long long>(value_) == std::get<long long>(other.value_);
    }
    const double lhs = std::get<double>(value_);
    const double rhs = std::get<double>(other.value_);
    return lhs == rhs || (std::isnan(lhs) && std::isnan(rhs));
}

bool Value::operator!=(const Value& other) const {
    return !(*this == other);
}

}  // namespace kalkon
