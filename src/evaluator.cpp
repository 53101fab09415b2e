#include "kalkon/evaluator.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <limits>
#include <map>

#include <fmt/format.h>

#include "kalkon/errors.h"

namespace kalkon {

namespace {

constexpr long long kMaxInteger = std::numeric_limits<long long>::max();
constexpr long long kMinInteger = std::numeric_limits<long long>::min();

using Builtin = std::function<Value(const std::vector<Value>& args, std::size_t position)>;

struct FunctionSpec {
    std::size_t min_args;
    std::size_t max_args;
    Builtin apply;
};

bool addOverflows(long long left, long long right) {
    return (right > 0 && left > kMaxInteger - right) || (right < 0 && left < kMinInteger - right);
}

bool subtractOverflows(long long left, long long right) {
    return (right < 0 && left > kMaxInteger + right) || (right > 0 && left < kMinInteger + right);
}

bool multiplyOverflows(long long left, long long right) {
    if (left == 0 || right == 0) {
        return false;
    }
    if (left > 0) {
        return right > 0 ? left > kMaxInteger / right : right < kMinInteger / left;
    }
    return right > 0 ? left < kMinInteger / right : left < kMaxInteger / right;
}

// Exact integer power for a non-negative exponent; false if the result leaves the long long range.
bool integerPower(long long base, long long exponent, long long& result) {
    result = 1;
    while (exponent > 0) {
        if ((exponent & 1) != 0) {
            if (multiplyOverflows(result, base)) {
                return false;
            }
            result *= base;
        }
        exponent >>= 1;
        if (exponent > 0) {
            if (multiplyOverflows(base, base)) {
                return false;
            }
            base *= base;
        }
    }
    return true;
}

Value checkedDouble(double result, std::initializer_list<double> operands, std::size_t position) {
    if (std::isinf(result) && std::all_of(operands.begin(), operands.end(), [](double x) { return std::isfinite(x); })) {
        throw OverflowError(fmt::format("Result too large at position {}", position));
    }
    return Value::fromDouble(result);
}

void requireIntegers(const Value& left, const Value& right, BinaryOp op, std::size_t position) {
    if (!left.isInteger() || !right.isInteger()) {
        throw DomainError(fmt::format("Operator '{}' requires integer operands at position {}", operatorSymbol(op),
                                      position));
    }
}

Value raisePower(const Value& left, const Value& right, std::size_t position) {
    long long power = 0;
    if (left.isInteger() && right.isInteger() && right.asInteger() >= 0 &&
        integerPower(left.asInteger(), right.asInteger(), power)) {
        return Value::fromInteger(power);
    }

    const double x = left.asDouble();
    const double y = right.asDouble();
    if (x == 0.0 && y < 0.0) {
        throw DivisionError(fmt::format("Zero raised to a negative power at position {}", position));
    }
    const double result = std::pow(x, y);
    if (std::isnan(result) && !std::isnan(x) && !std::isnan(y)) {
        throw DomainError(fmt::format("Negative base with fractional exponent at position {}", position));
    }
    return checkedDouble(result, {x, y}, position);
}

double flooredModulo(double left, double right) {
    const double remainder = std::fmod(left, right);
    if (remainder != 0.0 && ((remainder < 0.0) != (right < 0.0))) {
        return remainder + right;
    }
    return remainder;
}

void requireDomain(const std::string& name, const Value& arg, bool condition, std::size_t position) {
    if (!condition || std::isnan(arg.asDouble())) {
        throw DomainError(fmt::format("{}() domain error at position {}", name, position));
    }
}

Builtin unaryMath(double (*function)(double)) {
    return [function](const std::vector<Value>& args, std::size_t position) {
        return checkedDouble(function(args[0].asDouble()), {args[0].asDouble()}, position);
    };
}

Builtin binaryMath(double (*function)(double, double)) {
    return [function](const std::vector<Value>& args, std::size_t position) {
        const double x = args[0].asDouble();
        const double y = args[1].asDouble();
        return checkedDouble(function(x, y), {x, y}, position);
    };
}

Builtin rounding(double (*function)(double)) {
    return [function](const std::vector<Value>& args, std::size_t) {
        if (args[0].isInteger()) {
            return args[0];
        }
        return Value::fromDouble(function(args[0].asDouble()));
    };
}

Builtin extremum(bool want_min) {
    return [want_min](const std::vector<Value>& args, std::size_t) {
        Value best = args[0];
        for (std::size_t i = 1; i < args.size(); ++i) {
            const Value& candidate = args[i];
            const bool better = want_min ? candidate.asDouble() < best.asDouble()
                                         : candidate.asDouble() > best.asDouble();
            if (better) {
                best = candidate;
            }
        }
        return best;
    };
}

const std::map<std::string, FunctionSpec>& builtins() {
    static const std::map<std::string, FunctionSpec> table = [] {
        std::map<std::string, FunctionSpec> functions;
        const auto unlimited = std::numeric_limits<std::size_t>::max();

        functions["sin"] = {1, 1, unaryMath(static_cast<double (*)(double)>(std::sin))};
        functions["cos"] = {1, 1, unaryMath(static_cast<double (*)(double)>(std::cos))};
        functions["tan"] = {1, 1, unaryMath(static_cast<double (*)(double)>(std::tan))};
        functions["atan"] = {1, 1, unaryMath(static_cast<double (*)(double)>(std::atan))};
        functions["sinh"] = {1, 1, unaryMath(static_cast<double (*)(double)>(std::sinh))};
        functions["cosh"] = {1, 1, unaryMath(static_cast<double (*)(double)>(std::cosh))};
        functions["tanh"] = {1, 1, unaryMath(static_cast<double (*)(double)>(std::tanh))};
        functions["cbrt"] = {1, 1, unaryMath(static_cast<double (*)(double)>(std::cbrt))};
        functions["exp"] = {1, 1, unaryMath(static_cast<double (*)(double)>(std::exp))};
        functions["atan2"] = {2, 2, binaryMath(static_cast<double (*)(double, double)>(std::atan2))};
        functions["hypot"] = {2, 2, binaryMath(static_cast<double (*)(double, double)>(std::hypot))};
        functions["pow"] = {2, 2, [](const std::vector<Value>& args, std::size_t position) {
                                return raisePower(args[0], args[1], position);
                            }};

        functions["asin"] = {1, 1, [](const std::vector<Value>& args, std::size_t position) {
                                 const double x = args[0].asDouble();
                                 requireDomain("asin", args[0], x >= -1.0 && x <= 1.0, position);
                                 return Value::fromDouble(std::asin(x));
                             }};
        functions["acos"] = {1, 1, [](const std::vector<Value>& args, std::size_t position) {
                                 const double x = args[0].asDouble();
                                 requireDomain("acos", args[0], x >= -1.0 && x <= 1.0, position);
                                 return Value::fromDouble(std::acos(x));
                             }};
        functions["sqrt"] = {1, 1, [](const std::vector<Value>& args, std::size_t position) {
                                 requireDomain("sqrt", args[0], args[0].asDouble() >= 0.0, position);
                                 return Value::fromDouble(std::sqrt(args[0].asDouble()));
                             }};
        functions["log"] = {1, 2, [](const std::vector<Value>& args, std::size_t position) {
                                requireDomain("log", args[0], args[0].asDouble() > 0.0, position);
                                const double natural = std::log(args[0].asDouble());
                                if (args.size() == 1) {
                                    return Value::fromDouble(natural);
                                }
                                const double base = args[1].asDouble();
                                requireDomain("log", args[1], base > 0.0 && base != 1.0, position);
                                return Value::fromDouble(natural / std::log(base));
                            }};
        functions["log2"] = {1, 1, [](const std::vector<Value>& args, std::size_t position) {
                                 requireDomain("log2", args[0], args[0].asDouble() > 0.0, position);
                                 return Value::fromDouble(std::log2(args[0].asDouble()));
                             }};
        functions["log10"] = {1, 1, [](const std::vector<Value>& args, std::size_t position) {
                                  requireDomain("log10", args[0], args[0].asDouble() > 0.0, position);
                                  return Value::fromDouble(std::log10(args[0].asDouble()));
                              }};
        functions["abs"] = {1, 1, [](const std::vector<Value>& args, std::size_t) {
                                if (args[0].isInteger() && args[0].asInteger() != kMinInteger) {
                                    return Value::fromInteger(std::llabs(args[0].asInteger()));
                                }
                                return Value::fromDouble(std::fabs(args[0].asDouble()));
                            }};
        functions["ceil"] = {1, 1, rounding(static_cast<double (*)(double)>(std::ceil))};
        functions["floor"] = {1, 1, rounding(static_cast<double (*)(double)>(std::floor))};
        functions["trunc"] = {1, 1, rounding(static_cast<double (*)(double)>(std::trunc))};
        // Ties go to the even neighbour.
        functions["round"] = {1, 1, rounding(static_cast<double (*)(double)>(std::nearbyint))};
        functions["min"] = {1, unlimited, extremum(true)};
        functions["max"] = {1, unlimited, extremum(false)};
        return functions;
    }();
    return table;
}

const HistoryStore& emptyHistory() {
    static const HistoryStore history;
    return history;
}

}  // namespace

EvaluationResult Evaluator::evaluate(const Expression& expression, const Environment& environment) const {
    return evaluate(expression, environment, emptyHistory());
}

EvaluationResult Evaluator::evaluate(const Expression& expression,
                                     const Environment& environment,
                                     const HistoryStore& history) const {
    try {
        const Statement& statement = expression.statement();
        if (statement.target && environment.isConstant(*statement.target)) {
            throw DomainError(fmt::format("Cannot assign to built-in constant '{}'", *statement.target));
        }
        return evaluateTree(*statement.expression, environment, history);
    } catch (const CalcError& error) {
        return Failure::fromError(error);
    }
}

Value Evaluator::evaluateTree(const Expr& expr, const Environment& environment, const HistoryStore& history) const {
    if (const auto* node = dynamic_cast<const NumberExpr*>(&expr)) {
        return evaluateNumber(*node);
    }
    if (const auto* node = dynamic_cast<const VariableExpr*>(&expr)) {
        return evaluateVariable(*node, environment);
    }
    if (const auto* node = dynamic_cast<const HistoryExpr*>(&expr)) {
        return evaluateHistory(*node, history);
    }
    if (const auto* node = dynamic_cast<const UnaryExpr*>(&expr)) {
        return evaluateUnary(*node, environment, history);
    }
    if (const auto* node = dynamic_cast<const BinaryExpr*>(&expr)) {
        return evaluateBinary(*node, environment, history);
    }
    if (const auto* node = dynamic_cast<const CallExpr*>(&expr)) {
        return evaluateCall(*node, environment, history);
    }

    throw SyntaxError("Unknown expression type", expr.position);
}

bool Evaluator::isFunction(const std::string& name) {
    return builtins().find(name) != builtins().end();
}

std::vector<std::string> Evaluator::functionNames() {
    std::vector<std::string> names;
    for (const auto& entry : builtins()) {
        names.push_back(entry.first);
    }
    return names;
}

Value Evaluator::evaluateNumber(const NumberExpr& expr) const {
    return expr.value;
}

Value Evaluator::evaluateVariable(const VariableExpr& expr, const Environment& environment) const {
    if (!environment.hasVariable(expr.name) && isFunction(expr.name)) {
        throw UnknownSymbolError(
            fmt::format("'{}' is a function; call it as {}(...) at position {}", expr.name, expr.name, expr.position),
            expr.name);
    }
    return environment.getVariable(expr.name);
}

Value Evaluator::evaluateHistory(const HistoryExpr& expr, const HistoryStore& history) const {
    const HistoryEntry* entry = history.find(expr.index);
    if (entry == nullptr || !entry->result().ok()) {
        const std::string symbol = "$" + std::to_string(expr.index);
        throw UnknownSymbolError(fmt::format("History reference '{}' out of range", symbol), symbol);
    }
    return entry->result().value();
}

Value Evaluator::evaluateUnary(const UnaryExpr& expr,
                               const Environment& environment,
                               const HistoryStore& history) const {
    const Value operand = evaluateTree(*expr.operand, environment, history);
    switch (expr.op) {
        case UnaryOp::Identity:
            return operand;
        case UnaryOp::Negate:
            if (operand.isInteger() && operand.asInteger() != kMinInteger) {
                return Value::fromInteger(-operand.asInteger());
            }
            return Value::fromDouble(-operand.asDouble());
        case UnaryOp::Invert:
            if (!operand.isInteger()) {
                throw DomainError(fmt::format("Operator '~' requires an integer operand at position {}", expr.position));
            }
            return Value::fromInteger(~operand.asInteger());
    }

    throw SyntaxError(fmt::format("Unsupported unary operator at position {}", expr.position), expr.position);
}

Value Evaluator::evaluateBinary(const BinaryExpr& expr,
                                const Environment& environment,
                                const HistoryStore& history) const {
    const Value left = evaluateTree(*expr.left, environment, history);
    const Value right = evaluateTree(*expr.right, environment, history);
    return applyBinaryOperator(expr.op, left, right, expr.position);
}

Value Evaluator::evaluateCall(const CallExpr& expr, const Environment& environment, const HistoryStore& history) const {
    if (!isFunction(expr.function)) {
        throw UnknownSymbolError(fmt::format("Unknown function '{}'", expr.function), expr.function);
    }

    std::vector<Value> args;
    args.reserve(expr.args.size());
    for (const ExprPtr& arg : expr.args) {
        args.push_back(evaluateTree(*arg, environment, history));
    }
    return applyFunction(expr.function, args, expr.position);
}

Value Evaluator::applyBinaryOperator(BinaryOp op, const Value& left, const Value& right, std::size_t position) const {
    const bool both_integers = left.isInteger() && right.isInteger();
    const double x = left.asDouble();
    const double y = right.asDouble();

    switch (op) {
        case BinaryOp::Add:
            if (both_integers && !addOverflows(left.asInteger(), right.asInteger())) {
                return Value::fromInteger(left.asInteger() + right.asInteger());
            }
            return checkedDouble(x + y, {x, y}, position);

        case BinaryOp::Subtract:
            if (both_integers && !subtractOverflows(left.asInteger(), right.asInteger())) {
                return Value::fromInteger(left.asInteger() - right.asInteger());
            }
            return checkedDouble(x - y, {x, y}, position);

        case BinaryOp::Multiply:
            if (both_integers && !multiplyOverflows(left.asInteger(), right.asInteger())) {
                return Value::fromInteger(left.asInteger() * right.asInteger());
            }
            return checkedDouble(x * y, {x, y}, position);

        case BinaryOp::Divide:
            if (y == 0.0) {
                throw DivisionError(fmt::format("Division by zero at position {}", position));
            }
            if (both_integers && !(left.asInteger() == kMinInteger && right.asInteger() == -1) &&
                left.asInteger() % right.asInteger() == 0) {
                return Value::fromInteger(left.asInteger() / right.asInteger());
            }
            return checkedDouble(x / y, {x, y}, position);

        case BinaryOp::Modulo:
            if (y == 0.0) {
                throw DivisionError(fmt::format("Modulo by zero at position {}", position));
            }
            if (both_integers) {
                if (right.asInteger() == -1) {
                    return Value::fromInteger(0);
                }
                long long remainder = left.asInteger() % right.asInteger();
                if (remainder != 0 && ((remainder < 0) != (right.asInteger() < 0))) {
                    remainder += right.asInteger();
                }
                return Value::fromInteger(remainder);
            }
            return Value::fromDouble(flooredModulo(x, y));

        case BinaryOp::Power:
            return raisePower(left, right, position);

        case BinaryOp::BitAnd:
            requireIntegers(left, right, op, position);
            return Value::fromInteger(left.asInteger() & right.asInteger());

        case BinaryOp::BitOr:
            requireIntegers(left, right, op, position);
            return Value::fromInteger(left.asInteger() | right.asInteger());

        case BinaryOp::ShiftLeft:
        case BinaryOp::ShiftRight: {
            requireIntegers(left, right, op, position);
            const long long value = left.asInteger();
            const long long amount = right.asInteger();
            if (amount < 0) {
                throw DomainError(fmt::format("Negative shift count at position {}", position));
            }
            if (op == BinaryOp::ShiftRight) {
                if (amount >= 64) {
                    return Value::fromInteger(value < 0 ? -1 : 0);
                }
                return Value::fromInteger(value >> amount);
            }
            if (amount < 63) {
                const long long factor = 1LL << amount;
                if (!multiplyOverflows(value, factor)) {
                    return Value::fromInteger(value * factor);
                }
            }
            return checkedDouble(std::ldexp(x, static_cast<int>(std::min<long long>(amount, 4096))), {x}, position);
        }
    }

    throw SyntaxError(fmt::format("Unsupported binary operator at position {}", position), position);
}

Value Evaluator::applyFunction(const std::string& name, const std::vector<Value>& args, std::size_t position) const {
    const auto it = builtins().find(name);
    if (it == builtins().end()) {
        throw UnknownSymbolError(fmt::format("Unknown function '{}'", name), name);
    }

    const FunctionSpec& spec = it->second;
    if (args.size() < spec.min_args || args.size() > spec.max_args) {
        if (spec.min_args == spec.max_args) {
            throw DomainError(fmt::format("Function '{}' expects {} argument(s), got {}", name, spec.min_args,
                                          args.size()));
        }
        if (spec.max_args == std::numeric_limits<std::size_t>::max()) {
            throw DomainError(fmt::format("Function '{}' expects at least {} argument(s), got {}", name,
                                          spec.min_args, args.size()));
        }
        throw DomainError(fmt::format("Function '{}' expects {} to {} arguments, got {}", name, spec.min_args,
                                      spec.max_args, args.size()));
    }
    return spec.apply(args, position);
}

}  // namespace kalkon
