#include "lexer.hpp"
#include "error.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace losp {

static const char* const keywords[] = {"def",   "let",  "if",    "when",
                                       "do",    "defn", "while", "and",
                                       "or",    "nil",  "true",  "false"};

bool Lexer::isKeyword(const std::string& text)
{
    for (auto kw : keywords) {
        if (text == kw) {
            return true;
        }
    }
    return false;
}

const char* Lexer::name(Token tok)
{
    switch (tok) {
    case Token::NONE:
        return "end of input";
    case Token::LPAREN:
        return "'('";
    case Token::RPAREN:
        return "')'";
    case Token::SYMBOL:
        return "symbol";
    case Token::KEYWORD:
        return "keyword";
    case Token::INTEGER:
        return "integer";
    case Token::FLOAT:
        return "float";
    case Token::STRING:
        return "string";
    }
    return "token";
}

void Lexer::reset()
{
    position_ = 0;
    line_ = 1;
    column_ = 1;
    tokenPosition_ = {1, 1};
    inputBuffer_.clear();
}

void Lexer::advance()
{
    if (current() == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    ++position_;
}

Lexer::Token Lexer::lex()
{
RETRY:
    if (position_ >= input_.size()) {
        tokenPosition_ = {line_, column_};
        inputBuffer_.clear();
        return Token::NONE;
    }
    tokenPosition_ = {line_, column_};
    switch (current()) {
    case '(':
        advance();
        return Token::LPAREN;

    case ')':
        advance();
        return Token::RPAREN;

    case ' ':
    case '\t':
    case '\n':
    case '\r':
        advance();
        goto RETRY;

    case ';':
        while (position_ < input_.size() and current() not_eq '\n') {
            advance();
        }
        goto RETRY;

    case '"': {
        inputBuffer_.clear();
        advance();
        while (position_ < input_.size()) {
            if (current() == '"') {
                advance();
                return Token::STRING;
            }
            inputBuffer_.push_back(current());
            advance();
        }
        throw LexError("unterminated string", tokenPosition_);
    }

    default:
        inputBuffer_.clear();
        for (; checkTermCond(); advance()) {
            inputBuffer_.push_back(current());
        }
        return classify();
    }
}

// A run made only of digits and dots (with an optional leading minus) and at
// least one digit is numeric. Anything else is a symbol or keyword.
Lexer::Token Lexer::classify()
{
    const std::string& text = inputBuffer_;
    size_t start = (text[0] == '-') ? 1 : 0;
    size_t digits = 0;
    size_t dots = 0;
    for (size_t i = start; i < text.size(); ++i) {
        if (std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++digits;
        } else if (text[i] == '.') {
            ++dots;
        } else {
            goto SYMBOL;
        }
    }
    if (digits == 0) {
        goto SYMBOL;
    }
    if (dots > 1) {
        throw LexError("malformed number " + text, tokenPosition_);
    }
    errno = 0;
    if (dots == 0) {
        integer_ = std::strtoll(text.c_str(), nullptr, 10);
        if (errno == ERANGE) {
            throw LexError("integer literal " + text + " out of range",
                           tokenPosition_);
        }
        return Token::INTEGER;
    }
    float_ = std::strtod(text.c_str(), nullptr);
    if (errno == ERANGE) {
        throw LexError("float literal " + text + " out of range",
                       tokenPosition_);
    }
    return Token::FLOAT;

SYMBOL:
    if (isKeyword(text)) {
        return Token::KEYWORD;
    }
    return Token::SYMBOL;
}

} // namespace losp
