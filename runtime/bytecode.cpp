#include "bytecode.hpp"
#include "error.hpp"
#include <limits>

namespace losp {

size_t operandSize(Opcode op)
{
    switch (op) {
    case Opcode::Call:
        return sizeof(ArgCount);

    case Opcode::Jump:
    case Opcode::JumpIfFalse:
    case Opcode::Loop:
        return sizeof(JumpOffset);

    case Opcode::PushI:
    case Opcode::LoadGlobal:
    case Opcode::StoreGlobal:
        return sizeof(ConstantId);

    case Opcode::LoadLocal:
    case Opcode::ExitLet:
        return sizeof(StackLoc);

    default:
        return 0;
    }
}

const char* mnemonic(Opcode op)
{
    switch (op) {
    case Opcode::Call:        return "CALL";
    case Opcode::Return:      return "RETURN";
    case Opcode::Jump:        return "JUMP";
    case Opcode::JumpIfFalse: return "JUMPIFFALSE";
    case Opcode::Loop:        return "LOOP";
    case Opcode::PushI:       return "PUSHI";
    case Opcode::PushNull:    return "PUSHNULL";
    case Opcode::PushTrue:    return "PUSHTRUE";
    case Opcode::PushFalse:   return "PUSHFALSE";
    case Opcode::LoadLocal:   return "LOADLOCAL";
    case Opcode::LoadGlobal:  return "LOADGLOBAL";
    case Opcode::StoreGlobal: return "STOREGLOBAL";
    case Opcode::ExitLet:     return "EXITLET";
    case Opcode::Discard:     return "DISCARD";
    case Opcode::Dup:         return "DUP";
    case Opcode::Add:         return "ADD";
    case Opcode::Subtract:    return "SUBTRACT";
    case Opcode::Multiply:    return "MULTIPLY";
    case Opcode::Divide:      return "DIVIDE";
    case Opcode::Negate:      return "NEGATE";
    case Opcode::Equal:       return "EQUAL";
    case Opcode::Less:        return "LESS";
    case Opcode::Greater:     return "GREATER";
    case Opcode::Not:         return "NOT";
    case Opcode::Print:       return "PRINT";
    case Opcode::Count:       break;
    }
    return "???";
}

// Net change in operand stack height. CALL and EXITLET depend on their
// operand and are accounted for where they are written.
static int stackEffect(Opcode op)
{
    switch (op) {
    case Opcode::PushI:
    case Opcode::PushNull:
    case Opcode::PushTrue:
    case Opcode::PushFalse:
    case Opcode::LoadLocal:
    case Opcode::LoadGlobal:
    case Opcode::Dup:
        return 1;

    case Opcode::Return:
    case Opcode::JumpIfFalse:
    case Opcode::StoreGlobal:
    case Opcode::Discard:
    case Opcode::Add:
    case Opcode::Subtract:
    case Opcode::Multiply:
    case Opcode::Divide:
    case Opcode::Equal:
    case Opcode::Less:
    case Opcode::Greater:
        return -1;

    default:
        return 0;
    }
}

void Scope::insert(const std::string& name, StackLoc slot, SourcePosition pos)
{
    for (const auto& var : variables_) {
        if (var.name_ == name) {
            throw CompileError("redefinition of variable " + name +
                                   " not allowed",
                               pos);
        }
    }
    variables_.push_back({name, slot});
}

const Scope::Variable* Scope::find(const std::string& name) const
{
    for (auto it = variables_.rbegin(); it not_eq variables_.rend(); ++it) {
        if (it->name_ == name) {
            return &*it;
        }
    }
    if (parent_) {
        return parent_->find(name);
    }
    return nullptr;
}

BytecodeBuilder::BytecodeBuilder()
{
    fnContexts_.push_back({Chunk{}, nullptr, 0});
}

Chunk BytecodeBuilder::result()
{
    auto& chunk = current().chunk_;
    chunk.code_.push_back(static_cast<uint8_t>(Opcode::Return));
    chunk.lines_.push_back(chunk.lines_.empty() ? 0 : chunk.lines_.back());
    return std::move(chunk);
}

void BytecodeBuilder::emitByte(uint8_t byte, const ast::Node& at)
{
    auto& chunk = current().chunk_;
    chunk.code_.push_back(byte);
    chunk.lines_.push_back(at.position_.line_);
}

void BytecodeBuilder::writeOp(Opcode op, const ast::Node& at)
{
    emitByte(static_cast<uint8_t>(op), at);
    const int effect = stackEffect(op);
    if (effect < 0) {
        current().depth_ -= static_cast<size_t>(-effect);
    } else {
        current().depth_ += static_cast<size_t>(effect);
    }
}

template <typename T>
void BytecodeBuilder::writeParam(T param, const ast::Node& at)
{
    // little endian, to match the vm's readParam
    for (size_t i = 0; i < sizeof(param); ++i) {
        emitByte(static_cast<uint8_t>((param >> (8 * i)) & 0xff), at);
    }
}

size_t BytecodeBuilder::writeJump(Opcode op, const ast::Node& at)
{
    writeOp(op, at);
    const size_t operandLoc = current().chunk_.code_.size();
    writeParam<JumpOffset>(0, at);
    return operandLoc;
}

void BytecodeBuilder::patchJump(size_t operandLoc, const ast::Node& at)
{
    auto& code = current().chunk_.code_;
    const size_t offset = code.size() - (operandLoc + sizeof(JumpOffset));
    if (offset > std::numeric_limits<JumpOffset>::max()) {
        throw CompileError("jump offset exceeds allowed size", at.position_);
    }
    code[operandLoc] = offset & 0xff;
    code[operandLoc + 1] = (offset >> 8) & 0xff;
}

void BytecodeBuilder::writeLoop(size_t target, const ast::Node& at)
{
    writeOp(Opcode::Loop, at);
    const size_t offset =
        (current().chunk_.code_.size() + sizeof(JumpOffset)) - target;
    if (offset > std::numeric_limits<JumpOffset>::max()) {
        throw CompileError("jump offset exceeds allowed size", at.position_);
    }
    writeParam(static_cast<JumpOffset>(offset), at);
}

ConstantId BytecodeBuilder::makeConstant(const Value& value,
                                         const ast::Node& at)
{
    const size_t id = current().chunk_.addConstant(value);
    if (id > std::numeric_limits<ConstantId>::max()) {
        throw CompileError("too many constants in one chunk", at.position_);
    }
    return static_cast<ConstantId>(id);
}

void BytecodeBuilder::writeConstant(const Value& value, const ast::Node& at)
{
    const auto id = makeConstant(value, at);
    writeOp(Opcode::PushI, at);
    writeParam(id, at);
}

const Scope::Variable* BytecodeBuilder::resolve(const std::string& name) const
{
    const auto scope = fnContexts_.back().scope_;
    return scope ? scope->find(name) : nullptr;
}

void BytecodeBuilder::compileBody(
    ast::Vector<ast::Ptr<ast::Statement>>& statements, const ast::Node& at)
{
    if (statements.empty()) {
        writeOp(Opcode::PushNull, at);
        return;
    }
    for (size_t i = 0; i < statements.size(); ++i) {
        statements[i]->visit(*this);
        // Only the last expression's result stays on the operand stack.
        if (i + 1 < statements.size()) {
            writeOp(Opcode::Discard, *statements[i]);
        }
    }
}

void BytecodeBuilder::visit(ast::Literal& node)
{
    switch (node.value_.type()) {
    case Value::Type::Nil:
        writeOp(Opcode::PushNull, node);
        break;

    case Value::Type::Boolean:
        writeOp(node.value_.asBoolean() ? Opcode::PushTrue : Opcode::PushFalse,
                node);
        break;

    default:
        writeConstant(node.value_, node);
        break;
    }
}

void BytecodeBuilder::visit(ast::LValue& node)
{
    if (auto var = resolve(node.name_)) {
        writeOp(Opcode::LoadLocal, node);
        writeParam(var->slot_, node);
    } else {
        const auto id = makeConstant(Value(node.name_), node);
        writeOp(Opcode::LoadGlobal, node);
        writeParam(id, node);
    }
}

void BytecodeBuilder::visit(ast::Def& node)
{
    node.value_->visit(*this);
    const auto id = makeConstant(Value(node.name_), node);
    writeOp(Opcode::StoreGlobal, node);
    writeParam(id, node);
    writeOp(Opcode::PushNull, node);
}

void BytecodeBuilder::visit(ast::Let& node)
{
    Scope scope(current().scope_);
    Scope* const enclosing = current().scope_;
    current().scope_ = &scope;
    for (auto& binding : node.bindings_) {
        auto name = dynamic_cast<ast::LValue*>(binding.name_.get());
        if (not name) {
            throw CompileError("let binding name must be a symbol",
                               binding.name_->position_);
        }
        binding.value_->visit(*this);
        // The initializer's result already sits in the local's slot.
        const size_t slot = current().depth_ - 1;
        if (slot > std::numeric_limits<StackLoc>::max()) {
            throw CompileError("too many locals in function", name->position_);
        }
        scope.insert(name->name_, static_cast<StackLoc>(slot),
                     name->position_);
    }
    compileBody(node.statements_, node);
    current().scope_ = enclosing;
    if (scope.size() > 0) {
        writeOp(Opcode::ExitLet, node);
        writeParam(static_cast<StackLoc>(scope.size()), node);
        current().depth_ -= scope.size();
    }
}

void BytecodeBuilder::visit(ast::If& node)
{
    // Condition, then conditionally branch over the true block
    node.condition_->visit(*this);
    const size_t falseJump = writeJump(Opcode::JumpIfFalse, node);
    const size_t depth = current().depth_;
    // True block, then unconditionally branch over the false block
    node.trueBranch_->visit(*this);
    const size_t endJump = writeJump(Opcode::Jump, node);
    patchJump(falseJump, node);
    // False block
    current().depth_ = depth;
    node.falseBranch_->visit(*this);
    patchJump(endJump, node);
}

void BytecodeBuilder::visit(ast::When& node)
{
    node.condition_->visit(*this);
    const size_t falseJump = writeJump(Opcode::JumpIfFalse, node);
    const size_t depth = current().depth_;
    compileBody(node.statements_, node);
    const size_t endJump = writeJump(Opcode::Jump, node);
    patchJump(falseJump, node);
    current().depth_ = depth;
    writeOp(Opcode::PushNull, node);
    patchJump(endJump, node);
}

void BytecodeBuilder::visit(ast::Begin& node)
{
    compileBody(node.statements_, node);
}

void BytecodeBuilder::visit(ast::While& node)
{
    const size_t loopStart = current().chunk_.code_.size();
    node.condition_->visit(*this);
    const size_t exitJump = writeJump(Opcode::JumpIfFalse, node);
    compileBody(node.statements_, node);
    writeOp(Opcode::Discard, node);
    writeLoop(loopStart, node);
    patchJump(exitJump, node);
    writeOp(Opcode::PushNull, node);
}

void BytecodeBuilder::compileShortCircuit(
    ast::Vector<ast::Ptr<ast::Statement>>& statements, bool isAnd,
    const ast::Node& at)
{
    if (statements.empty()) {
        writeOp(isAnd ? Opcode::PushTrue : Opcode::PushNull, at);
        return;
    }
    // Every operand but the last either ends the form with its own value
    // or is discarded before evaluating the next one.
    std::vector<size_t> exits;
    for (size_t i = 0; i + 1 < statements.size(); ++i) {
        statements[i]->visit(*this);
        writeOp(Opcode::Dup, at);
        if (isAnd) {
            exits.push_back(writeJump(Opcode::JumpIfFalse, at));
        } else {
            const size_t next = writeJump(Opcode::JumpIfFalse, at);
            exits.push_back(writeJump(Opcode::Jump, at));
            patchJump(next, at);
        }
        writeOp(Opcode::Discard, at);
    }
    statements.back()->visit(*this);
    for (auto exit : exits) {
        patchJump(exit, at);
    }
}

void BytecodeBuilder::visit(ast::And& node)
{
    compileShortCircuit(node.statements_, true, node);
}

void BytecodeBuilder::visit(ast::Or& node)
{
    compileShortCircuit(node.statements_, false, node);
}

void BytecodeBuilder::visit(ast::Defn& node)
{
    auto name = dynamic_cast<ast::LValue*>(node.name_.get());
    if (not name) {
        throw CompileError("function name must be a symbol",
                           node.name_->position_);
    }
    if (node.params_.size() > std::numeric_limits<ArgCount>::max()) {
        throw CompileError("too many parameters for " + name->name_,
                           node.position_);
    }
    // Functions capture nothing: the body starts from an empty scope chain
    // holding only the parameters, at slots 0..N-1.
    fnContexts_.push_back({Chunk{}, nullptr, 0});
    Scope params(nullptr);
    current().scope_ = &params;
    for (size_t i = 0; i < node.params_.size(); ++i) {
        auto param = dynamic_cast<ast::LValue*>(node.params_[i].get());
        if (not param) {
            throw CompileError("function parameter must be a symbol",
                               node.params_[i]->position_);
        }
        params.insert(param->name_, static_cast<StackLoc>(i),
                      param->position_);
    }
    current().depth_ = node.params_.size();
    compileBody(node.statements_, node);
    writeOp(Opcode::Return, node);
    Chunk body = std::move(current().chunk_);
    fnContexts_.pop_back();

    auto fn = std::make_shared<const Function>(
        name->name_, node.params_.size(), std::move(body));
    writeConstant(Value(std::move(fn)), node);
    const auto id = makeConstant(Value(name->name_), node);
    writeOp(Opcode::StoreGlobal, node);
    writeParam(id, node);
    writeOp(Opcode::PushNull, node);
}

bool BytecodeBuilder::compileIntrinsic(const std::string& name,
                                       ast::Application& node)
{
    auto& args = node.args_;
    auto requireArgs = [&](bool ok) {
        if (not ok) {
            throw CompileError("wrong number of args to " + name,
                               node.position_);
        }
    };
    auto fold = [&](Opcode op) {
        args[0]->visit(*this);
        for (size_t i = 1; i < args.size(); ++i) {
            args[i]->visit(*this);
            writeOp(op, node);
        }
    };
    auto binary = [&](Opcode op) {
        requireArgs(args.size() == 2);
        args[0]->visit(*this);
        args[1]->visit(*this);
        writeOp(op, node);
    };
    if (name == "+") {
        requireArgs(not args.empty());
        fold(Opcode::Add);
    } else if (name == "*") {
        requireArgs(not args.empty());
        fold(Opcode::Multiply);
    } else if (name == "-") {
        requireArgs(not args.empty());
        if (args.size() == 1) {
            args[0]->visit(*this);
            writeOp(Opcode::Negate, node);
        } else {
            fold(Opcode::Subtract);
        }
    } else if (name == "/") {
        requireArgs(args.size() >= 2);
        fold(Opcode::Divide);
    } else if (name == "=") {
        binary(Opcode::Equal);
    } else if (name == "<") {
        binary(Opcode::Less);
    } else if (name == ">") {
        binary(Opcode::Greater);
    } else if (name == "<=") {
        binary(Opcode::Greater);
        writeOp(Opcode::Not, node);
    } else if (name == ">=") {
        binary(Opcode::Less);
        writeOp(Opcode::Not, node);
    } else if (name == "not") {
        requireArgs(args.size() == 1);
        args[0]->visit(*this);
        writeOp(Opcode::Not, node);
    } else if (name == "print") {
        requireArgs(args.size() == 1);
        args[0]->visit(*this);
        writeOp(Opcode::Print, node);
    } else {
        return false;
    }
    return true;
}

void BytecodeBuilder::visit(ast::Application& node)
{
    if (auto lval = dynamic_cast<ast::LValue*>(node.toApply_.get())) {
        // Operators compile to dedicated opcodes unless a local shadows them.
        if (not resolve(lval->name_) and compileIntrinsic(lval->name_, node)) {
            return;
        }
    }
    if (node.args_.size() > std::numeric_limits<ArgCount>::max()) {
        throw CompileError("too many arguments in call", node.position_);
    }
    node.toApply_->visit(*this);
    for (auto& arg : node.args_) {
        arg->visit(*this);
    }
    writeOp(Opcode::Call, node);
    writeParam(static_cast<ArgCount>(node.args_.size()), node);
    current().depth_ -= node.args_.size();
}

} // namespace losp
