#include "kalkon/lexer.h"

#include <cctype>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "kalkon/errors.h"

namespace kalkon {

namespace {

bool isDigit(char value) {
    return std::isdigit(static_cast<unsigned char>(value)) != 0;
}

bool isIdentifierStart(char value) {
    return std::isalpha(static_cast<unsigned char>(value)) || value == '_';
}

bool isIdentifierPart(char value) {
    return std::isalnum(static_cast<unsigned char>(value)) || value == '_';
}

bool isRadixDigit(char value, char prefix) {
    if (prefix == 'x' || prefix == 'X') {
        return std::isxdigit(static_cast<unsigned char>(value)) != 0;
    }
    return value == '0' || value == '1';
}

}  // namespace

Lexer::Lexer(std::string input) : input_(std::move(input)), current_(0) {}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;

    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd()) {
            break;
        }

        const char ch = peek();
        if (isDigit(ch) || (ch == '.' && isDigit(peekNext()))) {
            tokens.push_back(lexNumber());
            continue;
        }
        if (isIdentifierStart(ch)) {
            tokens.push_back(lexIdentifier());
            continue;
        }
        if (ch == '$') {
            tokens.push_back(lexHistoryRef());
            continue;
        }

        const std::size_t position = current_;
        switch (advance()) {
            case '+':
                tokens.push_back({TokenType::Plus, "+", position});
                break;
            case '-':
                tokens.push_back({TokenType::Minus, "-", position});
                break;
            case '*':
                if (peek() == '*') {
                    advance();
                    tokens.push_back({TokenType::Caret, "**", position});
                } else {
                    tokens.push_back({TokenType::Star, "*", position});
                }
                break;
            case '/':
                tokens.push_back({TokenType::Slash, "/", position});
                break;
            case '%':
                tokens.push_back({TokenType::Percent, "%", position});
                break;
            case '^':
                tokens.push_back({TokenType::Caret, "^", position});
                break;
            case '~':
                tokens.push_back({TokenType::Tilde, "~", position});
                break;
            case '&':
                tokens.push_back({TokenType::Ampersand, "&", position});
                break;
            case '|':
                tokens.push_back({TokenType::Pipe, "|", position});
                break;
            case '<':
                if (peek() != '<') {
                    throw SyntaxError(fmt::format("Unexpected character '<' at position {}", position), position);
                }
                advance();
                tokens.push_back({TokenType::ShiftLeft, "<<", position});
                break;
            case '>':
                if (peek() != '>') {
                    throw SyntaxError(fmt::format("Unexpected character '>' at position {}", position), position);
                }
                advance();
                tokens.push_back({TokenType::ShiftRight, ">>", position});
                break;
            case '(':
                tokens.push_back({TokenType::LParen, "(", position});
                break;
            case ')':
                tokens.push_back({TokenType::RParen, ")", position});
                break;
            case ',':
                tokens.push_back({TokenType::Comma, ",", position});
                break;
            case '=':
                tokens.push_back({TokenType::Assign, "=", position});
                break;
            default:
                throw SyntaxError(
                    fmt::format("Unexpected character '{}' at position {}", input_[position], position), position);
        }
    }

    tokens.push_back({TokenType::EndOfInput, "", input_.size()});
    return tokens;
}

bool Lexer::isAtEnd() const {
    return current_ >= input_.size();
}

char Lexer::peek() const {
    if (isAtEnd()) {
        return '\0';
    }
    return input_[current_];
}

char Lexer::peekNext() const {
    if (current_ + 1 >= input_.size()) {
        return '\0';
    }
    return input_[current_ + 1];
}

char Lexer::advance() {
    return input_[current_++];
}

void Lexer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

Token Lexer::lexNumber() {
    if (peek() == '0') {
        const char prefix = peekNext();
        if (prefix == 'x' || prefix == 'X' || prefix == 'b' || prefix == 'B') {
            return lexRadixNumber();
        }
    }

    const std::size_t start = current_;
    bool saw_dot = false;

    if (peek() == '.') {
        saw_dot = true;
        advance();
    }

    while (isDigit(peek())) {
        advance();
    }

    if (peek() == '.' && !saw_dot) {
        advance();
        while (isDigit(peek())) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!isDigit(peek())) {
            throw SyntaxError(fmt::format("Malformed exponent at position {}", current_), current_);
        }
        while (isDigit(peek())) {
            advance();
        }
    }

    return {TokenType::Number, input_.substr(start, current_ - start), start};
}

Token Lexer::lexRadixNumber() {
    const std::size_t start = current_;
    advance();  // '0'
    const char prefix = advance();

    if (!isRadixDigit(peek(), prefix)) {
        throw SyntaxError(fmt::format("Expected digits after '0{}' at position {}", prefix, start), start);
    }
    while (isRadixDigit(peek(), prefix)) {
        advance();
    }
    if (isIdentifierPart(peek())) {
        throw SyntaxError(fmt::format("Invalid digit '{}' at position {}", peek(), current_), current_);
    }

    return {TokenType::Number, input_.substr(start, current_ - start), start};
}

Token Lexer::lexIdentifier() {
    const std::size_t start = current_;
    while (isIdentifierPart(peek())) {
        advance();
    }
    return {TokenType::Identifier, input_.substr(start, current_ - start), start};
}

Token Lexer::lexHistoryRef() {
    const std::size_t start = current_;
    advance();  // '$'
    if (!isDigit(peek())) {
        throw SyntaxError(fmt::format("Expected history index after '$' at position {}", start), start);
    }
    while (isDigit(peek())) {
        advance();
    }
    return {TokenType::HistoryRef, input_.substr(start, current_ - start), start};
}

}  // namespace kalkon
