#pragma once

#include <map>
#include <string>
#include <unordered_map>

#include "kalkon/value.h"

namespace kalkon {

// Names visible to an expression: the built-in constants and the variables bound by assignments.
class Environment {
public:
    Environment();

    bool hasVariable(const std::string& name) const;
    bool isConstant(const std::string& name) const;

    // Throws UnknownSymbolError for unbound names.
    const Value& getVariable(const std::string& name) const;
    // Throws DomainError when `name` is a built-in constant.
    void setVariable(const std::string& name, const Value& value);

    // User variables only, sorted by name.
    const std::map<std::string, Value>& variables() const;

private:
    std::unordered_map<std::string, Value> constants_;
    std::map<std::string, Value> variables_;
};

}  // namespace kalkon
