#pragma once

#include <stddef.h>
#include <stdint.h>
#include <vector>

namespace losp {

using ConstantId = uint16_t;
using StackLoc = uint16_t;
using JumpOffset = uint16_t;
using ArgCount = uint8_t;

using InstructionAddress = size_t;

using Bytecode = std::vector<uint8_t>;

struct SourcePosition {
    size_t line_;
    size_t column_;
};

} // namespace losp
