#include "error.hpp"

namespace losp {

static std::string locate(const std::string& reason, SourcePosition pos)
{
    return "line " + std::to_string(pos.line_) + ", column " +
           std::to_string(pos.column_) + ": " + reason;
}

SyntaxError::SyntaxError(const std::string& reason, SourcePosition pos)
    : std::runtime_error(locate(reason, pos)), position_(pos)
{
}

ArityError::ArityError(const std::string& fnName, size_t expected,
                       size_t given)
    : RuntimeError("failed to apply " + fnName + "\nexpected argc: " +
                   std::to_string(expected) + "\nsupplied argc: " +
                   std::to_string(given)),
      expected_(expected), given_(given)
{
}

UnboundVariableError::UnboundVariableError(const std::string& name)
    : RuntimeError("variable " + name +
                   " is not visible in the current environment"),
      name_(name)
{
}

} // namespace losp
