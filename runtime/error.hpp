#pragma once

#include <stdexcept>
#include <string>

#include "common.hpp"

namespace losp {

// Raised before a top-level form runs. Carries the source position of the
// offending text.
struct SyntaxError : std::runtime_error {
    SyntaxError(const std::string& reason, SourcePosition pos);

    SourcePosition position() const
    {
        return position_;
    }

private:
    SourcePosition position_;
};


struct LexError : SyntaxError {
    using SyntaxError::SyntaxError;
};


struct ParseError : SyntaxError {
    using SyntaxError::SyntaxError;
};


struct CompileError : SyntaxError {
    using SyntaxError::SyntaxError;
};


// Raised by the vm. A runtime error terminates the current run.
struct RuntimeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};


struct TypeError : RuntimeError {
    using RuntimeError::RuntimeError;
};


struct ArithmeticError : RuntimeError {
    using RuntimeError::RuntimeError;
};


struct ArityError : RuntimeError {
    ArityError(const std::string& fnName, size_t expected, size_t given);

    size_t expected() const
    {
        return expected_;
    }

    size_t given() const
    {
        return given_;
    }

private:
    size_t expected_;
    size_t given_;
};


struct UnboundVariableError : RuntimeError {
    UnboundVariableError(const std::string& name);

    const std::string& name() const
    {
        return name_;
    }

private:
    std::string name_;
};


struct StackOverflowError : RuntimeError {
    using RuntimeError::RuntimeError;
};

} // namespace losp
