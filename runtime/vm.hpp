#pragma once

#include "common.hpp"
#include "types.hpp"
#include <memory>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace losp {

class Observer;

struct StackFrame {
    const Chunk* chunk_;
    // Where this frame resumes once a call it made returns.
    InstructionAddress returnAddress_;
    // Operand stack index of local slot 0.
    size_t base_;
    // Operand stack index that receives the frame's return value.
    size_t resultSlot_;
    // Keeps the executing chunk alive if its global is rebound mid-call.
    std::shared_ptr<const Function> function_;
};

class VM {
public:
    using Globals = std::unordered_map<std::string, Value>;
    using CallStack = std::vector<StackFrame>;

    VM(size_t maxCallDepth, size_t maxStackSize, std::ostream& out);
    VM(const VM&) = delete;

    // Runs a top-level chunk to completion and returns the value it leaves.
    // The operand stack and call stack are empty again afterwards, whether
    // the run succeeded or threw.
    Value execute(const Chunk& chunk);

    Value getGlobal(const std::string& name) const;
    void setGlobal(const std::string& name, const Value& value);
    bool hasGlobal(const std::string& name) const;

    const std::vector<Value>& operandStack() const
    {
        return stack_;
    }

    const CallStack& callStack() const
    {
        return frames_;
    }

    // Installs a tap called before every instruction. Pass nullptr to
    // remove it.
    void setObserver(Observer* observer)
    {
        observer_ = observer;
    }

private:
    Value run();

    void push(Value value);
    Value pop();

    size_t maxCallDepth_;
    size_t maxStackSize_;
    std::ostream& out_;
    Observer* observer_ = nullptr;
    std::vector<Value> stack_;
    CallStack frames_;
    Globals globals_;
};

} // namespace losp
