#pragma once

#include <string>
#include <vector>

#include "kalkon/token.h"

namespace kalkon {

class Lexer {
public:
    explicit Lexer(std::string input);

    std::vector<Token> tokenize();

private:
    bool isAtEnd() const;
    char peek() const;
    char peekNext() const;
    char advance();

    void skipWhitespace();
    Token lexNumber();
    Token lexRadixNumber();
    Token lexIdentifier();
    Token lexHistoryRef();

    std::string input_;
    std::size_t current_;
};

}  // namespace kalkon
