#pragma once

#include <stdint.h>
#include <string>

#include "common.hpp"

namespace losp {

// Scans tokens on demand from a source buffer. The buffer must outlive the
// lexer.
class Lexer {
public:
    enum class Token {
        NONE,
        LPAREN,
        RPAREN,
        SYMBOL,
        KEYWORD,
        INTEGER,
        FLOAT,
        STRING,
    };

    Lexer(const std::string& input)
        : position_(0), line_(1), column_(1), input_(input),
          tokenPosition_{1, 1}, integer_(0), float_(0.0)
    {
    }

    Token lex();

    // Rewind to the beginning of the input.
    void reset();

    const std::string& rdbuf() const
    {
        return inputBuffer_;
    }

    // Position of the first character of the most recently lexed token.
    SourcePosition position() const
    {
        return tokenPosition_;
    }

    int64_t integerValue() const
    {
        return integer_;
    }

    double floatValue() const
    {
        return float_;
    }

    std::string remaining() const
    {
        return input_.substr(position_);
    }

    static bool isKeyword(const std::string& text);

    static const char* name(Token tok);

private:
    bool checkWhitespace(char c) const
    {
        return c == ' ' or c == '\t' or c == '\n' or c == '\r';
    }

    char current() const
    {
        return input_[position_];
    }

    bool checkTermCond() const
    {
        return position_ < input_.size() and not checkWhitespace(current()) and
               current() not_eq '(' and current() not_eq ')' and
               current() not_eq ';' and current() not_eq '"';
    }

    void advance();

    Token classify();

    size_t position_;
    size_t line_;
    size_t column_;
    const std::string& input_;
    std::string inputBuffer_;
    SourcePosition tokenPosition_;
    int64_t integer_;
    double float_;
};

} // namespace losp
