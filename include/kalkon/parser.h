#pragma once

#include <initializer_list>
#include <string>
#include <vector>

#include "kalkon/ast.h"
#include "kalkon/token.h"

namespace kalkon {

// Recursive descent over the token stream, lowest precedence first:
// assignment, |, &, << >>, + -, * / %, ^ (right-associative, unary operand), unary - + ~, primary.
class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    // Throws SyntaxError (or OverflowError for an out-of-range literal).
    Statement parse();

private:
    using Level = ExprPtr (Parser::*)();

    ExprPtr parseLeftAssociative(Level operand, std::initializer_list<TokenType> operators);
    ExprPtr parseBitOr();
    ExprPtr parseBitAnd();
    ExprPtr parseShift();
    ExprPtr parseAdditive();
    ExprPtr parseMultiplicative();
    ExprPtr parsePower();
    ExprPtr parseUnary();
    ExprPtr parsePrimary();
    ExprPtr parseNumber(const Token& token);
    ExprPtr parseHistoryRef(const Token& token);
    ExprPtr parseCall(const Token& identifier);

    bool match(TokenType type);
    bool matchAny(std::initializer_list<TokenType> types);
    bool check(TokenType type) const;
    const Token& advance();
    const Token& peek() const;
    const Token& previous() const;
    bool isAtEnd() const;
    const Token& expect(TokenType type, const std::string& message);

    std::vector<Token> tokens_;
    std::size_t current_;
};

}  // namespace kalkon
