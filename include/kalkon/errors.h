#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace kalkon {

class CalcError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed input. position() is the 0-based offset of the offending character or token.
class SyntaxError : public CalcError {
public:
    SyntaxError(const std::string& message, std::size_t position) : CalcError(message), position_(position) {}

    std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

class UnknownSymbolError : public CalcError {
public:
    UnknownSymbolError(const std::string& message, std::string symbol)
        : CalcError(message), symbol_(std::move(symbol)) {}

    const std::string& symbol() const noexcept { return symbol_; }

private:
    std::string symbol_;
};

class DivisionError : public CalcError {
public:
    using CalcError::CalcError;
};

class OverflowError : public CalcError {
public:
    using CalcError::CalcError;
};

// Argument count, operand type or math domain violations.
class DomainError : public CalcError {
public:
    using CalcError::CalcError;
};

}  // namespace kalkon
