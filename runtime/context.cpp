#include "context.hpp"
#include "bytecode.hpp"
#include "parser.hpp"
#include <iostream>

namespace losp {

const Context::Configuration& Context::defaultConfig()
{
    static const Configuration defaults{
        1024,      // Call frames
        65536,     // Operand stack values
        &std::cout,
        256        // Nested expressions
    };
    return defaults;
}

Context::Context(const Configuration& config)
    : maxNestingDepth_(config.maxNestingDepth_),
      vm_(config.maxCallDepth_, config.maxStackSize_, *config.output_)
{
}

std::vector<Chunk> Context::compile(const std::string& code)
{
    auto root = parse(code, maxNestingDepth_);
    std::vector<Chunk> chunks;
    for (auto& statement : root->statements_) {
        BytecodeBuilder builder;
        statement->visit(builder);
        chunks.push_back(builder.result());
    }
    return chunks;
}

Value Context::exec(const std::string& code)
{
    Value result;
    for (const auto& chunk : compile(code)) {
        result = vm_.execute(chunk);
    }
    return result;
}

Value Context::eval(const std::string& code)
{
    Reader reader(code, maxNestingDepth_);
    Value result;
    while (auto form = reader.next()) {
        BytecodeBuilder builder;
        form->visit(builder);
        result = vm_.execute(builder.result());
    }
    return result;
}

} // namespace losp
