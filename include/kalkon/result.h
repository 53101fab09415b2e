#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

#include "kalkon/errors.h"
#include "kalkon/value.h"

namespace kalkon {

enum class ErrorKind {
    Syntax,
    UnknownSymbol,
    Division,
    Overflow,
    Domain,
};

std::string errorKindToString(ErrorKind kind);

struct Failure {
    ErrorKind kind;
    std::string message;
    std::optional<std::size_t> position;

    static Failure fromError(const CalcError& error);

    bool operator==(const Failure& other) const;
};

// Outcome of one evaluation: exactly one of a value or a failure.
class EvaluationResult {
public:
    EvaluationResult(Value value);
    EvaluationResult(Failure failure);

    bool ok() const;
    explicit operator bool() const { return ok(); }

    const Value& value() const;
    const Failure& failure() const;

    bool operator==(const EvaluationResult& other) const;
    bool operator!=(const EvaluationResult& other) const;

private:
    std::variant<Value, Failure> outcome_;
};

}  // namespace kalkon
