#include "vm.hpp"
#include "bytecode.hpp"
#include "debug.hpp"
#include "error.hpp"
#include "macros.hpp"
#include "utility.hpp"
#include <array>
#include <limits>

namespace losp {

template <typename T> T readParam(const Bytecode& bc, size_t& ip)
{
    throw RuntimeError("encountered unsupported param size");
}

template <> uint8_t readParam(const Bytecode& bc, size_t& ip)
{
    const auto result = bc[ip];
    ip += 1;
    return result;
}

template <> uint16_t readParam(const Bytecode& bc, size_t& ip)
{
    const auto result = ((uint16_t)(bc[ip])) | (((uint16_t)(bc[ip + 1])) << 8);
    ip += 2;
    return result;
}


static std::string describe(const Value& val)
{
    return toString(val, true) + " " + val.typeName();
}

static TypeError invalidOperands(const char* op, const Value& lhs,
                                 const Value& rhs)
{
    return TypeError(std::string("cannot apply ") + op + " to " +
                     describe(lhs) + " and " + describe(rhs));
}

// Integer results wrap on overflow.
static int64_t wrap(uint64_t result)
{
    return static_cast<int64_t>(result);
}

template <typename IntOp, typename FloatOp>
static Value arithmetic(const char* op, const Value& lhs, const Value& rhs,
                        IntOp&& intOp, FloatOp&& floatOp)
{
    if (LOSP_UNLIKELY(not lhs.isNumber() or not rhs.isNumber())) {
        throw invalidOperands(op, lhs, rhs);
    }
    if (lhs.type() == Value::Type::Integer and
        rhs.type() == Value::Type::Integer) {
        return Value(intOp(lhs.asInteger(), rhs.asInteger()));
    }
    return Value(floatOp(lhs.toDouble(), rhs.toDouble()));
}

static Value add(const Value& lhs, const Value& rhs)
{
    return arithmetic(
        "+", lhs, rhs,
        [](int64_t a, int64_t b) { return wrap((uint64_t)a + (uint64_t)b); },
        [](double a, double b) { return a + b; });
}

static Value subtract(const Value& lhs, const Value& rhs)
{
    return arithmetic(
        "-", lhs, rhs,
        [](int64_t a, int64_t b) { return wrap((uint64_t)a - (uint64_t)b); },
        [](double a, double b) { return a - b; });
}

static Value multiply(const Value& lhs, const Value& rhs)
{
    return arithmetic(
        "*", lhs, rhs,
        [](int64_t a, int64_t b) { return wrap((uint64_t)a * (uint64_t)b); },
        [](double a, double b) { return a * b; });
}

static Value divide(const Value& lhs, const Value& rhs)
{
    return arithmetic("/", lhs, rhs,
                      [](int64_t a, int64_t b) {
                          if (b == 0) {
                              throw ArithmeticError(
                                  "integer division by zero: " +
                                  std::to_string(a) + " / 0");
                          }
                          if (a == std::numeric_limits<int64_t>::min() and
                              b == -1) {
                              throw ArithmeticError(
                                  "integer overflow: " + std::to_string(a) +
                                  " / -1");
                          }
                          return a / b;
                      },
                      [](double a, double b) { return a / b; });
}

struct LessThan {
    template <typename T> bool operator()(T lhs, T rhs) const
    {
        return lhs < rhs;
    }
};

struct GreaterThan {
    template <typename T> bool operator()(T lhs, T rhs) const
    {
        return lhs > rhs;
    }
};

template <typename Compare>
static Value compare(const char* op, const Value& lhs, const Value& rhs,
                     Compare&& cmp)
{
    if (LOSP_UNLIKELY(not lhs.isNumber() or not rhs.isNumber())) {
        throw invalidOperands(op, lhs, rhs);
    }
    if (lhs.type() == Value::Type::Integer and
        rhs.type() == Value::Type::Integer) {
        return Value(cmp(lhs.asInteger(), rhs.asInteger()));
    }
    return Value(cmp(lhs.toDouble(), rhs.toDouble()));
}

static Value negate(const Value& val)
{
    switch (val.type()) {
    case Value::Type::Integer:
        return Value(wrap(0 - (uint64_t)val.asInteger()));

    case Value::Type::Float:
        return Value(-val.asFloat());

    default:
        throw TypeError("cannot apply - to " + describe(val));
    }
}


VM::VM(size_t maxCallDepth, size_t maxStackSize, std::ostream& out)
    : maxCallDepth_(maxCallDepth), maxStackSize_(maxStackSize), out_(out)
{
}

Value VM::execute(const Chunk& chunk)
{
    return dynamicWind(
        [&] {
            frames_.push_back(
                {&chunk, 0, stack_.size(), stack_.size(), nullptr});
            return run();
        },
        [this] {
            stack_.clear();
            frames_.clear();
        });
}

Value VM::getGlobal(const std::string& name) const
{
    auto found = globals_.find(name);
    if (found == globals_.end()) {
        throw UnboundVariableError(name);
    }
    return found->second;
}

void VM::setGlobal(const std::string& name, const Value& value)
{
    globals_[name] = value;
}

bool VM::hasGlobal(const std::string& name) const
{
    return globals_.find(name) not_eq globals_.end();
}

void VM::push(Value value)
{
    if (LOSP_UNLIKELY(stack_.size() >= maxStackSize_)) {
        throw StackOverflowError("operand stack exceeded " +
                                 std::to_string(maxStackSize_) + " values");
    }
    stack_.push_back(std::move(value));
}

Value VM::pop()
{
    Value result = std::move(stack_.back());
    stack_.pop_back();
    return result;
}

#if defined(_WIN32) or defined(_WIN64) or not defined(__GNUC__)
#define NO_DIRECT_THREADING
#endif

Value VM::run()
{
    const Chunk* chunk = frames_.back().chunk_;
    const Bytecode* bc = &chunk->code_;
    size_t base = frames_.back().base_;
    size_t ip = 0;

#define VM_TAP()                                                               \
    if (LOSP_UNLIKELY(observer_ not_eq nullptr)) {                             \
        observer_->step(*chunk, ip, decode(*chunk, ip), stack_);               \
    }

#ifndef NO_DIRECT_THREADING
    static const std::array<void*, (uint8_t)Opcode::Count> labels = {
        &&Call,
        &&Return,
        &&Jump,
        &&JumpIfFalse,
        &&Loop,
        &&PushI,
        &&PushNull,
        &&PushTrue,
        &&PushFalse,
        &&LoadLocal,
        &&LoadGlobal,
        &&StoreGlobal,
        &&ExitLet,
        &&Discard,
        &&Dup,
        &&Add,
        &&Subtract,
        &&Multiply,
        &&Divide,
        &&Negate,
        &&Equal,
        &&Less,
        &&Greater,
        &&Not,
        &&Print
    };
#define VM_DISPATCH_BEGIN() VM_TAP(); goto *labels[(*bc)[ip]];
#define VM_DISPATCH_END() ;
#define VM_BLOCK_BEGIN(IDENTIFIER) IDENTIFIER:
#define VM_BLOCK_END() VM_DISPATCH_BEGIN();
#else // No direct threading, use switch case instead.
#define VM_DISPATCH_BEGIN() while (true) { VM_TAP(); switch ((Opcode)(*bc)[ip]) {
#define VM_DISPATCH_END() case Opcode::Count: goto INVALID; }}
#define VM_BLOCK_BEGIN(IDENTIFIER) case Opcode::IDENTIFIER: {
#define VM_BLOCK_END() } break;
#endif

    VM_DISPATCH_BEGIN();

    VM_BLOCK_BEGIN(Call) {
        ++ip;
        const auto argc = readParam<uint8_t>(*bc, ip);
        const size_t calleeLoc = stack_.size() - argc - 1;
        const Value& target = stack_[calleeLoc];
        if (LOSP_UNLIKELY(target.type() not_eq Value::Type::Function)) {
            throw TypeError("cannot call " + describe(target) +
                            ", not a function");
        }
        auto fn = target.asFunction();
        if (LOSP_UNLIKELY(argc not_eq fn->argCount())) {
            throw ArityError(fn->name(), fn->argCount(), argc);
        }
        if (LOSP_UNLIKELY(frames_.size() >= maxCallDepth_)) {
            throw StackOverflowError("call depth exceeded " +
                                     std::to_string(maxCallDepth_) +
                                     " frames");
        }
        frames_.back().returnAddress_ = ip;
        base = calleeLoc + 1;
        chunk = &fn->chunk();
        bc = &chunk->code_;
        ip = 0;
        frames_.push_back({chunk, 0, base, calleeLoc, std::move(fn)});
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(Return) {
        Value result = pop();
        stack_.erase(stack_.begin() + frames_.back().resultSlot_,
                     stack_.end());
        frames_.pop_back();
        if (frames_.empty()) {
            return result;
        }
        stack_.push_back(std::move(result));
        chunk = frames_.back().chunk_;
        bc = &chunk->code_;
        base = frames_.back().base_;
        ip = frames_.back().returnAddress_;
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(Jump) {
        ++ip;
        const auto offset = readParam<JumpOffset>(*bc, ip);
        ip += offset;
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(JumpIfFalse) {
        ++ip;
        const auto offset = readParam<JumpOffset>(*bc, ip);
        if (not pop().truthy()) {
            ip += offset;
        }
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(Loop) {
        ++ip;
        const auto offset = readParam<JumpOffset>(*bc, ip);
        ip -= offset;
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(PushI) {
        ++ip;
        const auto id = readParam<ConstantId>(*bc, ip);
        push(chunk->constants_[id]);
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(PushNull) {
        ++ip;
        push(Value());
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(PushTrue) {
        ++ip;
        push(Value(true));
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(PushFalse) {
        ++ip;
        push(Value(false));
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(LoadLocal) {
        ++ip;
        const auto slot = readParam<StackLoc>(*bc, ip);
        push(Value(stack_[base + slot]));
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(LoadGlobal) {
        ++ip;
        const auto id = readParam<ConstantId>(*bc, ip);
        const auto& name = chunk->constants_[id].asString();
        auto found = globals_.find(name);
        if (LOSP_UNLIKELY(found == globals_.end())) {
            throw UnboundVariableError(name);
        }
        push(found->second);
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(StoreGlobal) {
        ++ip;
        const auto id = readParam<ConstantId>(*bc, ip);
        globals_[chunk->constants_[id].asString()] = pop();
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(ExitLet) {
        ++ip;
        const auto count = readParam<uint16_t>(*bc, ip);
        Value result = pop();
        stack_.erase(stack_.end() - count, stack_.end());
        stack_.push_back(std::move(result));
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(Discard) {
        ++ip;
        stack_.pop_back();
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(Dup) {
        ++ip;
        push(Value(stack_.back()));
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(Add) {
        ++ip;
        const Value rhs = pop();
        const Value lhs = pop();
        push(add(lhs, rhs));
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(Subtract) {
        ++ip;
        const Value rhs = pop();
        const Value lhs = pop();
        push(subtract(lhs, rhs));
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(Multiply) {
        ++ip;
        const Value rhs = pop();
        const Value lhs = pop();
        push(multiply(lhs, rhs));
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(Divide) {
        ++ip;
        const Value rhs = pop();
        const Value lhs = pop();
        push(divide(lhs, rhs));
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(Negate) {
        ++ip;
        push(negate(pop()));
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(Equal) {
        ++ip;
        const Value rhs = pop();
        const Value lhs = pop();
        push(Value(lhs == rhs));
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(Less) {
        ++ip;
        const Value rhs = pop();
        const Value lhs = pop();
        push(compare("<", lhs, rhs, LessThan()));
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(Greater) {
        ++ip;
        const Value rhs = pop();
        const Value lhs = pop();
        push(compare(">", lhs, rhs, GreaterThan()));
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(Not) {
        ++ip;
        push(Value(not pop().truthy()));
    } VM_BLOCK_END();


    VM_BLOCK_BEGIN(Print) {
        ++ip;
        print(pop(), out_);
        out_ << std::endl;
        push(Value());
    } VM_BLOCK_END();

    VM_DISPATCH_END();

#ifdef NO_DIRECT_THREADING
INVALID:
#endif
    throw RuntimeError("invalid instruction at address " + std::to_string(ip));
}

} // namespace losp
