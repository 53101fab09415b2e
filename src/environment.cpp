#include "kalkon/environment.h"

#include <cmath>
#include <limits>

#include <fmt/format.h>

#include "kalkon/errors.h"

namespace kalkon {

Environment::Environment() {
    const double pi = std::acos(-1.0);
    constants_.emplace("pi", Value::fromDouble(pi));
    constants_.emplace("tau", Value::fromDouble(2.0 * pi));
    constants_.emplace("e", Value::fromDouble(std::exp(1.0)));
    constants_.emplace("inf", Value(std::numeric_limits<double>::infinity()));
    constants_.emplace("nan", Value(std::numeric_limits<double>::quiet_NaN()));
}

bool Environment::hasVariable(const std::string& name) const {
    return isConstant(name) || variables_.find(name) != variables_.end();
}

bool Environment::isConstant(const std::string& name) const {
    return constants_.find(name) != constants_.end();
}

const Value& Environment::getVariable(const std::string& name) const {
    const auto constant = constants_.find(name);
    if (constant != constants_.end()) {
        return constant->second;
    }
    const auto it = variables_.find(name);
    if (it == variables_.end()) {
        throw UnknownSymbolError(fmt::format("Unknown variable '{}'", name), name);
    }
    return it->second;
}

void Environment::setVariable(const std::string& name, const Value& value) {
    if (isConstant(name)) {
        throw DomainError(fmt::format("Cannot assign to built-in constant '{}'", name));
    }
    variables_[name] = value;
}

const std::map<std::string, Value>& Environment::variables() const {
    return variables_;
}

}  // namespace kalkon
