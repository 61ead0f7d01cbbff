#include "debug.hpp"
#include "error.hpp"
#include <iomanip>

namespace losp {

Instruction decode(const Chunk& chunk, InstructionAddress ip)
{
    const auto& code = chunk.code_;
    if (ip >= code.size() or code[ip] >= static_cast<uint8_t>(Opcode::Count)) {
        throw RuntimeError("invalid instruction at address " +
                           std::to_string(ip));
    }
    Instruction inst;
    inst.opcode_ = static_cast<Opcode>(code[ip]);
    inst.operand_ = 0;
    const size_t width = operandSize(inst.opcode_);
    if (ip + width >= code.size()) {
        throw RuntimeError("truncated instruction at address " +
                           std::to_string(ip));
    }
    for (size_t i = 0; i < width; ++i) {
        inst.operand_ |= static_cast<uint16_t>(code[ip + 1 + i]) << (8 * i);
    }
    inst.size_ = 1 + width;
    return inst;
}

static void printOperand(const Chunk& chunk, InstructionAddress ip,
                         const Instruction& inst, std::ostream& out)
{
    switch (inst.opcode_) {
    case Opcode::PushI:
    case Opcode::LoadGlobal:
    case Opcode::StoreGlobal:
        out << "[" << std::setw(4) << std::setfill('0') << inst.operand_
            << std::setfill(' ') << "] => ";
        print(chunk.constants_[inst.operand_], out, true);
        break;

    case Opcode::Jump:
    case Opcode::JumpIfFalse:
        out << "-> " << std::hex << std::setw(4) << std::setfill('0')
            << ip + inst.size_ + inst.operand_ << std::dec
            << std::setfill(' ');
        break;

    case Opcode::Loop:
        out << "-> " << std::hex << std::setw(4) << std::setfill('0')
            << ip + inst.size_ - inst.operand_ << std::dec
            << std::setfill(' ');
        break;

    case Opcode::Call:
    case Opcode::LoadLocal:
    case Opcode::ExitLet:
        out << inst.operand_;
        break;

    default:
        break;
    }
}

void printInstruction(const Chunk& chunk, InstructionAddress ip,
                      std::ostream& out)
{
    const auto inst = decode(chunk, ip);
    out << std::hex << std::setw(4) << std::setfill('0') << ip << std::dec
        << std::setfill(' ') << " ";
    if (ip > 0 and chunk.lines_[ip] == chunk.lines_[ip - 1]) {
        out << std::setw(5) << "|";
    } else {
        out << std::setw(5) << chunk.lines_[ip];
    }
    out << " " << std::left << std::setw(12) << mnemonic(inst.opcode_)
        << std::right << " ";
    printOperand(chunk, ip, inst, out);
}

void TracePrinter::step(const Chunk& chunk, InstructionAddress ip,
                        const Instruction&, const std::vector<Value>& stack)
{
    printInstruction(chunk, ip, out_);
    out_ << "\n           stack: [";
    for (const auto& val : stack) {
        out_ << " ";
        print(val, out_, true);
    }
    out_ << " ]" << std::endl;
}

void disassemble(const Chunk& chunk, const std::string& name,
                 std::ostream& out)
{
    out << "== " << name << " ==" << std::endl;
    for (InstructionAddress ip = 0; ip < chunk.code_.size();) {
        printInstruction(chunk, ip, out);
        out << std::endl;
        ip += decode(chunk, ip).size_;
    }
    for (const auto& constant : chunk.constants_) {
        if (constant.type() == Value::Type::Function) {
            const auto& fn = constant.asFunction();
            disassemble(fn->chunk(), "fn<" + fn->name() + ">", out);
        }
    }
}

} // namespace losp
