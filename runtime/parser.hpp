#pragma once

#include "ast.hpp"
#include "lexer.hpp"

namespace losp {

// Reads top-level forms one at a time. The source buffer must outlive the
// reader.
class Reader : public Lexer {
public:
    Reader(const std::string& code, size_t maxNestingDepth)
        : Lexer(code), depth_(0), maxDepth_(maxNestingDepth)
    {
    }

    // Returns null once the input is exhausted. Throws LexError or
    // ParseError for a malformed form.
    ast::Ptr<ast::Statement> next();

    // Called on every opening paren of an expression; throws ParseError
    // once more than maxNestingDepth expressions are open.
    void enter(SourcePosition pos);

    void leave()
    {
        --depth_;
    }

private:
    size_t depth_;
    size_t maxDepth_;
};

// Builds one tree per top-level form. Throws LexError or ParseError; nothing
// is returned for a partially valid input.
ast::Ptr<ast::TopLevel> parse(const std::string& code,
                              size_t maxNestingDepth = 256);

} // namespace losp
