#include "kalkon/result.h"

#include <stdexcept>
#include <utility>

namespace kalkon {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Syntax:
            return "SyntaxError";
        case ErrorKind::UnknownSymbol:
            return "UnknownSymbolError";
        case ErrorKind::Division:
            return "DivisionError";
        case ErrorKind::Overflow:
            return "OverflowError";
        case ErrorKind::Domain:
            return "DomainError";
    }
    return "Error";
}

Failure Failure::fromError(const CalcError& error) {
    if (const auto* syntax = dynamic_cast<const SyntaxError*>(&error)) {
        return {ErrorKind::Syntax, syntax->what(), syntax->position()};
    }
    if (dynamic_cast<const UnknownSymbolError*>(&error) != nullptr) {
        return {ErrorKind::UnknownSymbol, error.what(), std::nullopt};
    }
    if (dynamic_cast<const DivisionError*>(&error) != nullptr) {
        return {ErrorKind::Division, error.what(), std::nullopt};
    }
    if (dynamic_cast<const OverflowError*>(&error) != nullptr) {
        return {ErrorKind::Overflow, error.what(), std::nullopt};
    }
    return {ErrorKind::Domain, error.what(), std::nullopt};
}

bool Failure::operator==(const Failure& other) const {
    return kind == other.kind && message == other.message && position == other.position;
}

EvaluationResult::EvaluationResult(Value value) : outcome_(std::move(value)) {}

EvaluationResult::EvaluationResult(Failure failure) : outcome_(std::move(failure)) {}

bool EvaluationResult::ok() const {
    return std::holds_alternative<Value>(outcome_);
}

const Value& EvaluationResult::value() const {
    if (const auto* value = std::get_if<Value>(&outcome_)) {
        return *value;
    }
    throw std::logic_error("EvaluationResult holds a failure, not a value");
}

const Failure& EvaluationResult::failure() const {
    if (const auto* failure = std::get_if<Failure>(&outcome_)) {
        return *failure;
    }
    throw std::logic_error("EvaluationResult holds a value, not a failure");
}

bool EvaluationResult::operator==(const EvaluationResult& other) const {
    if (ok() != other.ok()) {
        return false;
    }
    return ok() ? value() == other.value() : failure() == other.failure();
}

bool EvaluationResult::operator!=(const EvaluationResult& other) const {
    return !(*this == other);
}

}  // namespace kalkon
