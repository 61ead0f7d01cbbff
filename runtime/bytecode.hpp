#pragma once

#include "ast.hpp"
#include "common.hpp"
#include "types.hpp"
#include <vector>

namespace losp {

enum class Opcode : uint8_t {
    // CALL INSTRUCTIONS
    //
    // The callee sits below its arguments on the operand stack. Arguments
    // become the callee's first locals in place.
    //
    Call,   // CALL(u8 argc) : invoke, consuming fn and args on stack
    Return, // RETURN : pop the frame, leaving the result where the fn was

    // JUMP INSTRUCTIONS
    //
    // Update the instruction pointer by an offset relative to the end
    // of the jump instruction.
    //
    Jump,        // JUMP(u16 offset)
    JumpIfFalse, // JUMPIFFALSE(u16 offset) : consume stack top, jump if false
    Loop,        // LOOP(u16 offset) : jump backwards

    // PUSH INSTRUCTIONS
    //
    // Constants live in the chunk's constant pool, addressed by u16 ids.
    //
    PushI,     // PUSHI(u16 id) : push constant onto stack
    PushNull,  // PUSHNULL : push nil onto the stack
    PushTrue,  // PUSHTRUE : push true onto the stack
    PushFalse, // PUSHFALSE : push false onto the stack

    // VARIABLE INSTRUCTIONS
    //
    // Locals are addressed relative to the frame base. Globals are looked up
    // by a name held in the constant pool.
    //
    LoadLocal,   // LOADLOCAL(u16 slot)
    LoadGlobal,  // LOADGLOBAL(u16 id)
    StoreGlobal, // STOREGLOBAL(u16 id) : consume stack top, bind it to name

    ExitLet, // EXITLET(u16 count) : drop count locals beneath the stack top

    Discard, // DISCARD : pop the top of the operand stack
    Dup,     // DUP : push a copy of the stack top

    // INTRINSICS
    //
    // Binary operators consume two operands (lhs pushed first) and push
    // one result.
    //
    Add,
    Subtract,
    Multiply,
    Divide,
    Negate,
    Equal,
    Less,
    Greater,
    Not,
    Print, // PRINT : consume stack top, write it to the output, push nil

    Count
};

// Number of operand bytes following an opcode.
size_t operandSize(Opcode op);

const char* mnemonic(Opcode op);


// Compile time view of the locals of one function. Scopes chain to their
// enclosing scope within the same function only; a name that is not found
// is a global.
//
// A local's slot is the operand stack offset, from the frame base, where its
// initializer left its value. LOADLOCAL indexes the stack directly, so slots
// must match stack positions: once a let exits, EXITLET pops its locals and
// a following sibling let lands on (and reuses) the same slots. Slots of
// bindings that are still live are never shared.
class Scope {
public:
    struct Variable {
        std::string name_;
        StackLoc slot_;
    };

    Scope(Scope* parent) : parent_(parent)
    {
    }

    void insert(const std::string& name, StackLoc slot, SourcePosition pos);

    const Variable* find(const std::string& name) const;

    size_t size() const
    {
        return variables_.size();
    }

private:
    Scope* parent_;
    std::vector<Variable> variables_;
};


// Compiles one top-level form (or, recursively, a function body) into a
// chunk. Use a fresh builder per form.
class BytecodeBuilder : public ast::Visitor {
public:
    BytecodeBuilder();

    void visit(ast::Literal& node) override;
    void visit(ast::LValue& node) override;
    void visit(ast::Def& node) override;
    void visit(ast::Let& node) override;
    void visit(ast::If& node) override;
    void visit(ast::When& node) override;
    void visit(ast::Begin& node) override;
    void visit(ast::Defn& node) override;
    void visit(ast::While& node) override;
    void visit(ast::And& node) override;
    void visit(ast::Or& node) override;
    void visit(ast::Application& node) override;

    // Terminates the top-level chunk with a RETURN and hands it over.
    Chunk result();

private:
    struct FunctionContext {
        Chunk chunk_;
        Scope* scope_;
        // Operand stack height relative to the frame base.
        size_t depth_;
    };

    FunctionContext& current()
    {
        return fnContexts_.back();
    }

    void emitByte(uint8_t byte, const ast::Node& at);
    void writeOp(Opcode op, const ast::Node& at);
    template <typename T> void writeParam(T param, const ast::Node& at);
    size_t writeJump(Opcode op, const ast::Node& at);
    void patchJump(size_t operandLoc, const ast::Node& at);
    void writeLoop(size_t target, const ast::Node& at);
    void writeConstant(const Value& value, const ast::Node& at);
    ConstantId makeConstant(const Value& value, const ast::Node& at);

    void compileBody(ast::Vector<ast::Ptr<ast::Statement>>& statements,
                     const ast::Node& at);
    void compileShortCircuit(ast::Vector<ast::Ptr<ast::Statement>>& statements,
                             bool isAnd, const ast::Node& at);
    bool compileIntrinsic(const std::string& name, ast::Application& node);

    const Scope::Variable* resolve(const std::string& name) const;

    std::vector<FunctionContext> fnContexts_;
};

} // namespace losp
