#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "kalkon/value.h"

namespace kalkon {

enum class UnaryOp {
    Negate,
    Identity,
    Invert,
};

enum class BinaryOp {
    Add,
    Subtract,
    Multiply,
    Divide,
    Modulo,
    Power,
    BitAnd,
    BitOr,
    ShiftLeft,
    ShiftRight,
};

// Operator spelling for messages ("-", "~", "<<" ...).
std::string operatorSymbol(UnaryOp op);
std::string operatorSymbol(BinaryOp op);

struct Expr {
    explicit Expr(std::size_t position_in) : position(position_in) {}
    virtual ~Expr() = default;

    // Offset of the node's first token (operators: the operator token).
    std::size_t position;
};

using ExprPtr = std::unique_ptr<Expr>;

struct NumberExpr final : Expr {
    NumberExpr(Value value_in, std::size_t position_in) : Expr(position_in), value(std::move(value_in)) {}

    Value value;
};

struct VariableExpr final : Expr {
    VariableExpr(std::string name_in, std::size_t position_in) : Expr(position_in), name(std::move(name_in)) {}

    std::string name;
};

struct HistoryExpr final : Expr {
    HistoryExpr(std::size_t index_in, std::size_t position_in) : Expr(position_in), index(index_in) {}

    std::size_t index;
};

struct UnaryExpr final : Expr {
    UnaryExpr(UnaryOp op_in, ExprPtr operand_in, std::size_t position_in)
        : Expr(position_in), op(op_in), operand(std::move(operand_in)) {}

    UnaryOp op;
    ExprPtr operand;
};

struct BinaryExpr final : Expr {
    BinaryExpr(BinaryOp op_in, ExprPtr left_in, ExprPtr right_in, std::size_t position_in)
        : Expr(position_in), op(op_in), left(std::move(left_in)), right(std::move(right_in)) {}

    BinaryOp op;
    ExprPtr left;
    ExprPtr right;
};

struct CallExpr final : Expr {
    CallExpr(std::string function_in, std::vector<ExprPtr> args_in, std::size_t position_in)
        : Expr(position_in), function(std::move(function_in)), args(std::move(args_in)) {}

    std::string function;
    std::vector<ExprPtr> args;
};

// One parsed input line: an expression, optionally bound to a variable (`name = expr`).
struct Statement {
    std::optional<std::string> target;
    ExprPtr expression;
};

}  // namespace kalkon
