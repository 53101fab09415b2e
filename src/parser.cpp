#include "kalkon/parser.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "kalkon/errors.h"

namespace kalkon {

namespace {

std::string tokenForMessage(const Token& token) {
    if (!token.lexeme.empty()) {
        return token.lexeme;
    }
    return tokenTypeToString(token.type);
}

[[noreturn]] void throwUnexpected(const Token& token) {
    throw SyntaxError(fmt::format("Unexpected token '{}' at position {}", tokenForMessage(token), token.position),
                      token.position);
}

BinaryOp binaryOpFor(const Token& token) {
    switch (token.type) {
        case TokenType::Plus:
            return BinaryOp::Add;
        case TokenType::Minus:
            return BinaryOp::Subtract;
        case TokenType::Star:
            return BinaryOp::Multiply;
        case TokenType::Slash:
            return BinaryOp::Divide;
        case TokenType::Percent:
            return BinaryOp::Modulo;
        case TokenType::Caret:
            return BinaryOp::Power;
        case TokenType::Ampersand:
            return BinaryOp::BitAnd;
        case TokenType::Pipe:
            return BinaryOp::BitOr;
        case TokenType::ShiftLeft:
            return BinaryOp::ShiftLeft;
        case TokenType::ShiftRight:
            return BinaryOp::ShiftRight;
        default:
            break;
    }
    throwUnexpected(token);
}

UnaryOp unaryOpFor(const Token& token) {
    switch (token.type) {
        case TokenType::Minus:
            return UnaryOp::Negate;
        case TokenType::Plus:
            return UnaryOp::Identity;
        case TokenType::Tilde:
            return UnaryOp::Invert;
        default:
            break;
    }
    throwUnexpected(token);
}

int radixOf(const std::string& lexeme) {
    if (lexeme.size() > 2 && lexeme[0] == '0') {
        if (lexeme[1] == 'x' || lexeme[1] == 'X') {
            return 16;
        }
        if (lexeme[1] == 'b' || lexeme[1] == 'B') {
            return 2;
        }
    }
    return 10;
}

bool looksLikeIntegerLiteral(const std::string& lexeme) {
    return lexeme.find_first_of(".eE") == std::string::npos;
}

// Literals too wide for a long long are kept as (inexact) doubles.
Value integerLiteral(const std::string& digits, int radix) {
    try {
        return Value::fromInteger(std::stoll(digits, nullptr, radix));
    } catch (const std::out_of_range&) {
        double value = 0.0;
        for (const char ch : digits) {
            const int digit = std::isdigit(static_cast<unsigned char>(ch))
                                  ? ch - '0'
                                  : std::tolower(static_cast<unsigned char>(ch)) - 'a' + 10;
            value = value * radix + digit;
        }
        return Value(value);
    }
}

}  // namespace

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)), current_(0) {}

Statement Parser::parse() {
    Statement statement;
    ExprPtr expression = parseBitOr();

    if (match(TokenType::Assign)) {
        const Token& assign = previous();
        const auto* variable = dynamic_cast<const VariableExpr*>(expression.get());
        if (variable == nullptr) {
            throw SyntaxError(fmt::format("Invalid assignment target at position {}", assign.position),
                              assign.position);
        }
        statement.target = variable->name;
        expression = parseBitOr();
    }

    if (!isAtEnd()) {
        throwUnexpected(peek());
    }

    statement.expression = std::move(expression);
    return statement;
}

ExprPtr Parser::parseLeftAssociative(Level operand, std::initializer_list<TokenType> operators) {
    ExprPtr expression = (this->*operand)();

    while (matchAny(operators)) {
        const Token operator_token = previous();
        ExprPtr right = (this->*operand)();
        expression = std::make_unique<BinaryExpr>(binaryOpFor(operator_token), std::move(expression),
                                                  std::move(right), operator_token.position);
    }

    return expression;
}

ExprPtr Parser::parseBitOr() {
    return parseLeftAssociative(&Parser::parseBitAnd, {TokenType::Pipe});
}

ExprPtr Parser::parseBitAnd() {
    return parseLeftAssociative(&Parser::parseShift, {TokenType::Ampersand});
}

ExprPtr Parser::parseShift() {
    return parseLeftAssociative(&Parser::parseAdditive, {TokenType::ShiftLeft, TokenType::ShiftRight});
}

ExprPtr Parser::parseAdditive() {
    return parseLeftAssociative(&Parser::parseMultiplicative, {TokenType::Plus, TokenType::Minus});
}

ExprPtr Parser::parseMultiplicative() {
    return parseLeftAssociative(&Parser::parsePower, {TokenType::Star, TokenType::Slash, TokenType::Percent});
}

// The base is a unary operand, so -2^2 == (-2)^2 and 2^-1 == 0.5.
ExprPtr Parser::parsePower() {
    ExprPtr expression = parseUnary();
    if (!match(TokenType::Caret)) {
        return expression;
    }

    const Token operator_token = previous();
    ExprPtr right = parsePower();
    return std::make_unique<BinaryExpr>(BinaryOp::Power, std::move(expression), std::move(right),
                                        operator_token.position);
}

ExprPtr Parser::parseUnary() {
    if (!matchAny({TokenType::Minus, TokenType::Plus, TokenType::Tilde})) {
        return parsePrimary();
    }

    const Token operator_token = previous();
    ExprPtr operand = parseUnary();
    return std::make_unique<UnaryExpr>(unaryOpFor(operator_token), std::move(operand), operator_token.position);
}

ExprPtr Parser::parsePrimary() {
    if (match(TokenType::Number)) {
        return parseNumber(previous());
    }
    if (match(TokenType::HistoryRef)) {
        return parseHistoryRef(previous());
    }
    if (match(TokenType::Identifier)) {
        const Token& identifier = previous();
        if (match(TokenType::LParen)) {
            return parseCall(identifier);
        }
        return std::make_unique<VariableExpr>(identifier.lexeme, identifier.position);
    }
    if (match(TokenType::LParen)) {
        ExprPtr expression = parseBitOr();
        expect(TokenType::RParen, "Expected ')' after expression");
        return expression;
    }

    throwUnexpected(peek());
}

ExprPtr Parser::parseNumber(const Token& token) {
    const int radix = radixOf(token.lexeme);
    try {
        if (radix != 10) {
            return std::make_unique<NumberExpr>(integerLiteral(token.lexeme.substr(2), radix), token.position);
        }
        if (looksLikeIntegerLiteral(token.lexeme)) {
            return std::make_unique<NumberExpr>(integerLiteral(token.lexeme, 10), token.position);
        }
        return std::make_unique<NumberExpr>(Value::fromDouble(std::stod(token.lexeme)), token.position);
    } catch (const std::out_of_range&) {
        // Underflow rounds towards zero; overflow is an error.
        const double value = std::strtod(token.lexeme.c_str(), nullptr);
        if (std::isinf(value)) {
            throw OverflowError(fmt::format("Number '{}' too large at position {}", token.lexeme, token.position));
        }
        return std::make_unique<NumberExpr>(Value::fromDouble(value), token.position);
    }
}

ExprPtr Parser::parseHistoryRef(const Token& token) {
    std::size_t index = 0;
    try {
        index = static_cast<std::size_t>(std::stoull(token.lexeme.substr(1)));
    } catch (const std::out_of_range&) {
        throw SyntaxError(fmt::format("Invalid history reference '{}' at position {}", token.lexeme, token.position),
                          token.position);
    }
    if (index == 0) {
        throw SyntaxError(fmt::format("History references are 1-based at position {}", token.position),
                          token.position);
    }
    return std::make_unique<HistoryExpr>(index, token.position);
}

ExprPtr Parser::parseCall(const Token& identifier) {
    std::vector<ExprPtr> arguments;
    if (!check(TokenType::RParen)) {
        do {
            arguments.push_back(parseBitOr());
        } while (match(TokenType::Comma));
    }
    expect(TokenType::RParen, "Expected ')' after function arguments");
    return std::make_unique<CallExpr>(identifier.lexeme, std::move(arguments), identifier.position);
}

bool Parser::match(TokenType type) {
    if (!check(type)) {
        return false;
    }
    advance();
    return true;
}

bool Parser::matchAny(std::initializer_list<TokenType> types) {
    for (const TokenType type : types) {
        if (match(type)) {
            return true;
        }
    }
    return false;
}

bool Parser::check(TokenType type) const {
    if (isAtEnd()) {
        return type == TokenType::EndOfInput;
    }
    return peek().type == type;
}

const Token& Parser::advance() {
    if (!isAtEnd()) {
        ++current_;
    }
    return previous();
}

const Token& Parser::peek() const {
    return tokens_[current_];
}

const Token& Parser::previous() const {
    return tokens_[current_ - 1];
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::EndOfInput;
}

const Token& Parser::expect(TokenType type, const std::string& message) {
    if (check(type)) {
        return advance();
    }

    const Token& token = peek();
    throw SyntaxError(
        fmt::format("{}. Unexpected token '{}' at position {}", message, tokenForMessage(token), token.position),
        token.position);
}

}  // namespace kalkon
