#include "kalkon/expression.h"

#include <cctype>
#include <utility>

#include "kalkon/errors.h"
#include "kalkon/lexer.h"
#include "kalkon/parser.h"

namespace kalkon {

Expression::Expression(std::string text) : text_(std::move(text)) {}

bool Expression::isBlank() const {
    for (char ch : text_) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

const Statement& Expression::statement() const {
    parseOnce();
    if (parse_error_) {
        std::rethrow_exception(parse_error_);
    }
    return *statement_;
}

bool Expression::isAssignment() const {
    parseOnce();
    return statement_ != nullptr && statement_->target.has_value();
}

void Expression::parseOnce() const {
    if (statement_ || parse_error_) {
        return;
    }
    if (isBlank()) {
        parse_error_ = std::make_exception_ptr(SyntaxError("Empty expression", 0));
        return;
    }

    try {
        Lexer lexer(text_);
        Parser parser(lexer.tokenize());
        statement_ = std::make_shared<const Statement>(parser.parse());
    } catch (const CalcError&) {
        parse_error_ = std::current_exception();
    }
}

}  // namespace kalkon
