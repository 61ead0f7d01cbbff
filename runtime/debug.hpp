#pragma once

#include "bytecode.hpp"
#include "types.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace losp {

struct Instruction {
    Opcode opcode_;
    // Zero for opcodes without an operand.
    uint16_t operand_;
    // Opcode byte plus operand bytes.
    size_t size_;
};

Instruction decode(const Chunk& chunk, InstructionAddress ip);


// Read-only tap on the vm's dispatch loop.
class Observer {
public:
    virtual ~Observer()
    {
    }

    virtual void step(const Chunk& chunk, InstructionAddress ip,
                      const Instruction& inst,
                      const std::vector<Value>& stack) = 0;
};


// Writes each instruction and the operand stack beneath it.
class TracePrinter : public Observer {
public:
    TracePrinter(std::ostream& out) : out_(out)
    {
    }

    void step(const Chunk& chunk, InstructionAddress ip,
              const Instruction& inst,
              const std::vector<Value>& stack) override;

private:
    std::ostream& out_;
};


void printInstruction(const Chunk& chunk, InstructionAddress ip,
                      std::ostream& out);

// Prints every instruction in a chunk, then the chunks of any functions in
// its constant pool.
void disassemble(const Chunk& chunk, const std::string& name,
                 std::ostream& out);

} // namespace losp
