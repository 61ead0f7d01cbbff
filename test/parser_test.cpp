#include "runtime/error.hpp"
#include "runtime/parser.hpp"
#include <gtest/gtest.h>

using namespace losp;

template <typename T> T* as(const ast::Ptr<ast::Statement>& node)
{
    return dynamic_cast<T*>(node.get());
}

TEST(Parser, Definition)
{
    auto top = parse("(def pi 3.14159)");
    ASSERT_EQ(1u, top->statements_.size());
    auto def = as<ast::Def>(top->statements_[0]);
    ASSERT_NE(nullptr, def);
    EXPECT_EQ("pi", def->name_);
    auto value = as<ast::Literal>(def->value_);
    ASSERT_NE(nullptr, value);
    EXPECT_EQ(Value(3.14159), value->value_);
}

TEST(Parser, TopLevelFormsInOrder)
{
    auto top = parse("1 \"two\" three nil true false");
    ASSERT_EQ(6u, top->statements_.size());
    EXPECT_EQ(Value(1), as<ast::Literal>(top->statements_[0])->value_);
    EXPECT_EQ(Value("two"), as<ast::Literal>(top->statements_[1])->value_);
    EXPECT_EQ("three", as<ast::LValue>(top->statements_[2])->name_);
    EXPECT_EQ(Value(), as<ast::Literal>(top->statements_[3])->value_);
    EXPECT_EQ(Value(true), as<ast::Literal>(top->statements_[4])->value_);
    EXPECT_EQ(Value(false), as<ast::Literal>(top->statements_[5])->value_);
}

TEST(Parser, Application)
{
    auto top = parse("(foo 1 (bar))");
    auto apply = as<ast::Application>(top->statements_[0]);
    ASSERT_NE(nullptr, apply);
    EXPECT_EQ("foo", as<ast::LValue>(apply->toApply_)->name_);
    ASSERT_EQ(2u, apply->args_.size());
    auto inner = as<ast::Application>(apply->args_[1]);
    ASSERT_NE(nullptr, inner);
    EXPECT_TRUE(inner->args_.empty());
}

TEST(Parser, Defn)
{
    auto top = parse("(defn foo (a b) (+ a b) b)");
    auto defn = as<ast::Defn>(top->statements_[0]);
    ASSERT_NE(nullptr, defn);
    EXPECT_EQ("foo", as<ast::LValue>(defn->name_)->name_);
    ASSERT_EQ(2u, defn->params_.size());
    EXPECT_EQ("b", as<ast::LValue>(defn->params_[1])->name_);
    EXPECT_EQ(2u, defn->statements_.size());
}

TEST(Parser, LetBindingStyles)
{
    auto top = parse("(let ((a 1) b 2) a b) (let (c 3) c) (let () 1)");
    ASSERT_EQ(3u, top->statements_.size());
    auto first = as<ast::Let>(top->statements_[0]);
    ASSERT_TRUE(first not_eq nullptr);
    ASSERT_EQ(2u, first->bindings_.size());
    EXPECT_EQ("a", as<ast::LValue>(first->bindings_[0].name_)->name_);
    EXPECT_EQ("b", as<ast::LValue>(first->bindings_[1].name_)->name_);
    EXPECT_EQ(2u, first->statements_.size());
    auto second = as<ast::Let>(top->statements_[1]);
    ASSERT_EQ(1u, second->bindings_.size());
    EXPECT_EQ(Value(3), as<ast::Literal>(second->bindings_[0].value_)->value_);
    EXPECT_TRUE(as<ast::Let>(top->statements_[2])->bindings_.empty());
}

TEST(Parser, SpecialForms)
{
    auto top = parse("(if a b c) (when a b) (do) (while a b) (and) (or a)");
    ASSERT_EQ(6u, top->statements_.size());
    EXPECT_NE(nullptr, as<ast::If>(top->statements_[0]));
    EXPECT_NE(nullptr, as<ast::When>(top->statements_[1]));
    EXPECT_NE(nullptr, as<ast::Begin>(top->statements_[2]));
    EXPECT_NE(nullptr, as<ast::While>(top->statements_[3]));
    EXPECT_NE(nullptr, as<ast::And>(top->statements_[4]));
    EXPECT_EQ(1u, as<ast::Or>(top->statements_[5])->statements_.size());
}

TEST(Parser, NodePositions)
{
    auto top = parse("1\n  (foo x)");
    EXPECT_EQ(1u, top->statements_[0]->position_.line_);
    EXPECT_EQ(2u, top->statements_[1]->position_.line_);
    EXPECT_EQ(3u, top->statements_[1]->position_.column_);
}

TEST(Parser, EmptyInput)
{
    EXPECT_TRUE(parse("")->statements_.empty());
    EXPECT_TRUE(parse("  ; only a comment\n")->statements_.empty());
}

TEST(Parser, Errors)
{
    EXPECT_THROW(parse("(def pi"), ParseError);
    EXPECT_THROW(parse(")"), ParseError);
    EXPECT_THROW(parse("()"), ParseError);
    EXPECT_THROW(parse("(if 1 2)"), ParseError);
    EXPECT_THROW(parse("(if 1 2 3 4)"), ParseError);
    EXPECT_THROW(parse("(def 5 1)"), ParseError);
    EXPECT_THROW(parse("(def x)"), ParseError);
    EXPECT_THROW(parse("(let (a) a)"), ParseError);
    EXPECT_THROW(parse("(defn f a)"), ParseError);
    EXPECT_THROW(parse("(foo def)"), ParseError);
    EXPECT_THROW(parse("(foo 1.2.3)"), LexError);
}

TEST(Parser, ErrorPosition)
{
    try {
        parse("(foo)\n(bar ())");
        FAIL() << "expected a ParseError";
    } catch (const ParseError& err) {
        EXPECT_EQ(2u, err.position().line_);
        EXPECT_EQ(6u, err.position().column_);
    }
}

static std::string nested(size_t depth)
{
    std::string code;
    for (size_t i = 0; i < depth; ++i) {
        code += "(do ";
    }
    code += "1";
    code += std::string(depth, ')');
    return code;
}

TEST(Parser, NestingLimit)
{
    EXPECT_EQ(1u, parse(nested(3), 3)->statements_.size());
    EXPECT_THROW(parse(nested(4), 3), ParseError);
    EXPECT_NO_THROW(parse(nested(256)));
    EXPECT_THROW(parse(nested(100000)), ParseError);
}

TEST(Parser, NestingCountsOpenExpressionsOnly)
{
    // Siblings at the same depth do not add up.
    EXPECT_NO_THROW(parse("(do (do 1) (do 2) (do 3))", 2));
    EXPECT_NO_THROW(parse("(do 1) (do 2)", 1));
}

TEST(Parser, ReaderYieldsFormsOneAtATime)
{
    const std::string code = "(def a 1) a (def b";
    Reader reader(code, 256);
    auto first = reader.next();
    ASSERT_TRUE(first not_eq nullptr);
    EXPECT_NE(nullptr, as<ast::Def>(first));
    auto second = reader.next();
    ASSERT_TRUE(second not_eq nullptr);
    EXPECT_EQ("a", as<ast::LValue>(second)->name_);
    EXPECT_THROW(reader.next(), ParseError);

    const std::string empty = " ; nothing\n";
    Reader done(empty, 256);
    EXPECT_TRUE(done.next() == nullptr);
}
