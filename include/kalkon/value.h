#pragma once

#include <cstddef>
#include <string>
#include <variant>

namespace kalkon {

class Value {
public:
    Value();
    explicit Value(long long integer_value);
    explicit Value(double floating_value);

    static Value fromInteger(long long integer_value);
    // Exactly integral doubles that fit in a long long are stored as integers.
    static Value fromDouble(double floating_value);

    bool isInteger() const;
    long long asInteger() const;
    double asDouble() const;

    std::string toString() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const;

private:
    std::variant<long long, double> value_;
};

}  // namespace kalkon
