#pragma once

#include <exception>
#include <memory>
#include <string>

#include "kalkon/ast.h"

namespace kalkon {

// User-entered text together with its parsed form. Parsing happens on first use and is cached,
// including a parse failure.
class Expression {
public:
    explicit Expression(std::string text);

    bool isBlank() const;

    // Rethrows the cached parse error (a CalcError) if the text does not parse.
    const Statement& statement() const;

    bool isAssignment() const;

private:
    void parseOnce() const;

    std::string text_;
    mutable std::shared_ptr<const Statement> statement_;
    mutable std::exception_ptr parse_error_;
};

}  // namespace kalkon
