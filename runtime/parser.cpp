#include "parser.hpp"
#include "error.hpp"
#include "lexer.hpp"
#include "utility.hpp"

namespace losp {

template <Lexer::Token TOK> void expect(Lexer& lexer, const char* ctx)
{
    const auto result = lexer.lex();
    if (result not_eq TOK) {
        throw ParseError(std::string("expected ") + Lexer::name(TOK) + " " +
                             ctx + ", found " + Lexer::name(result),
                         lexer.position());
    }
}

struct UnexpectedClosingParen {
    SourcePosition position_;
};

struct UnexpectedEOF {
    SourcePosition position_;
};

template <typename T> ast::Ptr<T> makeNode(SourcePosition pos)
{
    auto node = make_unique<T>();
    node->position_ = pos;
    return node;
}

ast::Ptr<ast::Expr> parseExpr(Reader& lexer, SourcePosition open);

ast::Ptr<ast::Atom> parseKeywordAtom(Reader& lexer)
{
    auto lit = makeNode<ast::Literal>(lexer.position());
    const std::string& kw = lexer.rdbuf();
    if (kw == "nil") {
        lit->value_ = Value();
    } else if (kw == "true") {
        lit->value_ = Value(true);
    } else if (kw == "false") {
        lit->value_ = Value(false);
    } else {
        throw ParseError("unexpected keyword " + kw, lexer.position());
    }
    return std::move(lit);
}

ast::Ptr<ast::Statement> parseStatement(Reader& lexer, Lexer::Token tok)
{
    const auto pos = lexer.position();
    switch (tok) {
    case Lexer::Token::LPAREN:
        return parseExpr(lexer, pos);

    case Lexer::Token::SYMBOL: {
        auto ret = makeNode<ast::LValue>(pos);
        ret->name_ = lexer.rdbuf();
        return std::move(ret);
    }

    case Lexer::Token::KEYWORD:
        return parseKeywordAtom(lexer);

    case Lexer::Token::INTEGER: {
        auto ret = makeNode<ast::Literal>(pos);
        ret->value_ = Value(lexer.integerValue());
        return std::move(ret);
    }

    case Lexer::Token::FLOAT: {
        auto ret = makeNode<ast::Literal>(pos);
        ret->value_ = Value(lexer.floatValue());
        return std::move(ret);
    }

    case Lexer::Token::STRING: {
        auto ret = makeNode<ast::Literal>(pos);
        ret->value_ = Value(lexer.rdbuf());
        return std::move(ret);
    }

    case Lexer::Token::RPAREN:
        throw UnexpectedClosingParen{pos};

    case Lexer::Token::NONE:
        throw UnexpectedEOF{pos};
    }
    throw ParseError("invalid token in statement", pos);
}

ast::Ptr<ast::Statement> parseStatement(Reader& lexer)
{
    const auto tok = lexer.lex();
    return parseStatement(lexer, tok);
}

// For slots of a special form that must be filled.
ast::Ptr<ast::Statement> requireStatement(Reader& lexer, const char* ctx)
{
    try {
        return parseStatement(lexer);
    } catch (const UnexpectedClosingParen& paren) {
        throw ParseError(std::string("expected expression ") + ctx +
                             ", found ')'",
                         paren.position_);
    }
}

void parseStatementList(Reader& l, ast::Vector<ast::Ptr<ast::Statement>>& out)
{
    try {
        while (true) {
            out.push_back(parseStatement(l));
        }
    } catch (const UnexpectedClosingParen&) {
        return;
    }
}

ast::Ptr<ast::Def> parseDef(Reader& lexer, SourcePosition pos)
{
    auto def = makeNode<ast::Def>(pos);
    expect<Lexer::Token::SYMBOL>(lexer, "after def");
    def->name_ = lexer.rdbuf();
    def->value_ = requireStatement(lexer, "in def");
    expect<Lexer::Token::RPAREN>(lexer, "to close def");
    return def;
}

ast::Ptr<ast::If> parseIf(Reader& lexer, SourcePosition pos)
{
    auto ifExpr = makeNode<ast::If>(pos);
    ifExpr->condition_ = requireStatement(lexer, "for if condition");
    ifExpr->trueBranch_ = requireStatement(lexer, "for if true branch");
    ifExpr->falseBranch_ = requireStatement(lexer, "for if false branch");
    expect<Lexer::Token::RPAREN>(lexer, "to close if");
    return ifExpr;
}

ast::Ptr<ast::When> parseWhen(Reader& lexer, SourcePosition pos)
{
    auto when = makeNode<ast::When>(pos);
    when->condition_ = requireStatement(lexer, "for when condition");
    parseStatementList(lexer, when->statements_);
    return when;
}

ast::Ptr<ast::While> parseWhile(Reader& lexer, SourcePosition pos)
{
    auto loop = makeNode<ast::While>(pos);
    loop->condition_ = requireStatement(lexer, "for while condition");
    parseStatementList(lexer, loop->statements_);
    return loop;
}

ast::Ptr<ast::Begin> parseBegin(Reader& lexer, SourcePosition pos)
{
    auto begin = makeNode<ast::Begin>(pos);
    parseStatementList(lexer, begin->statements_);
    return begin;
}

ast::Ptr<ast::And> parseAnd(Reader& lexer, SourcePosition pos)
{
    auto _and = makeNode<ast::And>(pos);
    parseStatementList(lexer, _and->statements_);
    return _and;
}

ast::Ptr<ast::Or> parseOr(Reader& lexer, SourcePosition pos)
{
    auto _or = makeNode<ast::Or>(pos);
    parseStatementList(lexer, _or->statements_);
    return _or;
}

ast::Ptr<ast::Defn> parseDefn(Reader& lexer, SourcePosition pos)
{
    auto defn = makeNode<ast::Defn>(pos);
    defn->name_ = requireStatement(lexer, "for function name");
    expect<Lexer::Token::LPAREN>(lexer, "to open parameter list");
    parseStatementList(lexer, defn->params_);
    parseStatementList(lexer, defn->statements_);
    return defn;
}

// Binding lists are read pairwise. A binding is either a parenthesized
// (name value) pair or a bare name followed by its value, so
// ((a 1) b 2) and (a 1 b 2) both bind a and b.
ast::Ptr<ast::Let> parseLet(Reader& lexer, SourcePosition pos)
{
    auto let = makeNode<ast::Let>(pos);
    expect<Lexer::Token::LPAREN>(lexer, "to open let bindings");
    while (true) {
        ast::Let::Binding binding;
        switch (const auto tok = lexer.lex()) {
        case Lexer::Token::RPAREN:
            goto BODY;

        case Lexer::Token::LPAREN:
            binding.name_ = requireStatement(lexer, "for binding name");
            binding.value_ = requireStatement(lexer, "for binding value");
            expect<Lexer::Token::RPAREN>(lexer, "to close binding");
            break;

        default:
            binding.name_ = parseStatement(lexer, tok);
            binding.value_ = requireStatement(lexer, "for binding value");
            break;
        }
        let->bindings_.push_back(std::move(binding));
    }
BODY:
    parseStatementList(lexer, let->statements_);
    return let;
}

struct NestingGuard {
    NestingGuard(Reader& reader, SourcePosition open) : reader_(reader)
    {
        reader_.enter(open);
    }

    ~NestingGuard()
    {
        reader_.leave();
    }

    Reader& reader_;
};

ast::Ptr<ast::Expr> parseExpr(Reader& lexer, SourcePosition open)
{
    NestingGuard guard(lexer, open);
    const auto tok = lexer.lex();
    if (tok == Lexer::Token::KEYWORD) {
        // special forms
        const std::string kw = lexer.rdbuf();
        if (kw == "def") {
            return parseDef(lexer, open);
        } else if (kw == "let") {
            return parseLet(lexer, open);
        } else if (kw == "if") {
            return parseIf(lexer, open);
        } else if (kw == "when") {
            return parseWhen(lexer, open);
        } else if (kw == "do") {
            return parseBegin(lexer, open);
        } else if (kw == "defn") {
            return parseDefn(lexer, open);
        } else if (kw == "while") {
            return parseWhile(lexer, open);
        } else if (kw == "and") {
            return parseAnd(lexer, open);
        } else if (kw == "or") {
            return parseOr(lexer, open);
        }
    } else if (tok == Lexer::Token::RPAREN) {
        throw ParseError("empty expression ()", open);
    }
    auto apply = makeNode<ast::Application>(open);
    apply->toApply_ = parseStatement(lexer, tok);
    parseStatementList(lexer, apply->args_);
    return std::move(apply);
}

void Reader::enter(SourcePosition pos)
{
    if (depth_ == maxDepth_) {
        throw ParseError("nesting too deep, more than " +
                             std::to_string(maxDepth_) + " levels",
                         pos);
    }
    ++depth_;
}

ast::Ptr<ast::Statement> Reader::next()
{
    const auto tok = lex();
    if (tok == Lexer::Token::NONE) {
        return nullptr;
    } else if (tok == Lexer::Token::RPAREN) {
        throw ParseError("unexpected ')'", position());
    }
    try {
        return parseStatement(*this, tok);
    } catch (const UnexpectedEOF& eof) {
        throw ParseError("unexpected end of input, expected ')'",
                         eof.position_);
    }
}

ast::Ptr<ast::TopLevel> parse(const std::string& code, size_t maxNestingDepth)
{
    Reader reader(code, maxNestingDepth);
    auto top = make_unique<ast::TopLevel>();
    while (auto form = reader.next()) {
        top->statements_.push_back(std::move(form));
    }
    return top;
}

} // namespace losp
