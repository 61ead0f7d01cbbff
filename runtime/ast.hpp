#pragma once

#include "common.hpp"
#include "types.hpp"
#include "utility.hpp"
#include <memory>
#include <string>
#include <vector>

namespace losp {
namespace ast {

template <typename T> using Ptr = std::unique_ptr<T>;
template <typename T> using Vector = std::vector<T>;
using StrVal = std::string;


class Visitor;


struct Node {
    virtual ~Node()
    {
    }

    virtual void visit(Visitor& visitor) = 0;

    SourcePosition position_ = {0, 0};
};


struct Statement : Node {
};


struct Expr : Statement {
};


struct Atom : Statement {
};


// Integer, float and string literals, and the nil/true/false keywords.
struct Literal : Atom {
    losp::Value value_;

    void visit(Visitor& visitor) override;
};


// A reference to a variable, resolved by the compiler.
struct LValue : Atom {
    StrVal name_;

    void visit(Visitor& visitor) override;
};


struct Def : Expr {
    StrVal name_;
    Ptr<Statement> value_;

    void visit(Visitor& visitor) override;
};


struct Let : Expr {
    struct Binding {
        Ptr<Statement> name_;
        Ptr<Statement> value_;
    };

    Vector<Binding> bindings_;
    Vector<Ptr<Statement>> statements_;

    void visit(Visitor& visitor) override;
};


struct If : Expr {
    Ptr<Statement> condition_;
    Ptr<Statement> trueBranch_;
    Ptr<Statement> falseBranch_;

    void visit(Visitor& visitor) override;
};


struct When : Expr {
    Ptr<Statement> condition_;
    Vector<Ptr<Statement>> statements_;

    void visit(Visitor& visitor) override;
};


struct Begin : Expr {
    Vector<Ptr<Statement>> statements_;

    void visit(Visitor& visitor) override;
};


struct Defn : Expr {
    Ptr<Statement> name_;
    Vector<Ptr<Statement>> params_;
    Vector<Ptr<Statement>> statements_;

    void visit(Visitor& visitor) override;
};


struct While : Expr {
    Ptr<Statement> condition_;
    Vector<Ptr<Statement>> statements_;

    void visit(Visitor& visitor) override;
};


struct And : Expr {
    Vector<Ptr<Statement>> statements_;

    void visit(Visitor& visitor) override;
};


struct Or : Expr {
    Vector<Ptr<Statement>> statements_;

    void visit(Visitor& visitor) override;
};


struct Application : Expr {
    Ptr<Statement> toApply_;
    Vector<Ptr<Statement>> args_;

    void visit(Visitor& visitor) override;
};


// The parsed forms of one source text, in order. Each form is compiled into
// its own chunk.
struct TopLevel {
    Vector<Ptr<Statement>> statements_;
};


class Visitor {
public:
    virtual ~Visitor()
    {
    }

    virtual void visit(Literal& node) = 0;
    virtual void visit(LValue& node) = 0;
    virtual void visit(Def& node) = 0;
    virtual void visit(Let& node) = 0;
    virtual void visit(If& node) = 0;
    virtual void visit(When& node) = 0;
    virtual void visit(Begin& node) = 0;
    virtual void visit(Defn& node) = 0;
    virtual void visit(While& node) = 0;
    virtual void visit(And& node) = 0;
    virtual void visit(Or& node) = 0;
    virtual void visit(Application& node) = 0;
};

} // namespace ast
} // namespace losp
