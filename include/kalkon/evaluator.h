#pragma once

#include <string>
#include <vector>

#include "kalkon/ast.h"
#include "kalkon/environment.h"
#include "kalkon/expression.h"
#include "kalkon/history.h"
#include "kalkon/result.h"
#include "kalkon/value.h"

namespace kalkon {

// Stateless: results depend only on the expression text, the environment and the history passed in.
class Evaluator {
public:
    // Never throws a CalcError; failures are reported through the result.
    EvaluationResult evaluate(const Expression& expression, const Environment& environment) const;
    EvaluationResult evaluate(const Expression& expression,
                              const Environment& environment,
                              const HistoryStore& history) const;

    // Throws CalcError subclasses.
    Value evaluateTree(const Expr& expr, const Environment& environment, const HistoryStore& history) const;

    static bool isFunction(const std::string& name);
    static std::vector<std::string> functionNames();

private:
    Value evaluateNumber(const NumberExpr& expr) const;
    Value evaluateVariable(const VariableExpr& expr, const Environment& environment) const;
    Value evaluateHistory(const HistoryExpr& expr, const HistoryStore& history) const;
    Value evaluateUnary(const UnaryExpr& expr, const Environment& environment, const HistoryStore& history) const;
    Value evaluateBinary(const BinaryExpr& expr, const Environment& environment, const HistoryStore& history) const;
    Value evaluateCall(const CallExpr& expr, const Environment& environment, const HistoryStore& history) const;

    Value applyBinaryOperator(BinaryOp op, const Value& left, const Value& right, std::size_t position) const;
    Value applyFunction(const std::string& name, const std::vector<Value>& args, std::size_t position) const;
};

}  // namespace kalkon
