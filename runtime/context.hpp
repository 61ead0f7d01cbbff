#pragma once

#include "types.hpp"
#include "vm.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace losp {

class Observer;

class Context {
public:
    struct Configuration {
        size_t maxCallDepth_;
        size_t maxStackSize_;
        // Destination of print.
        std::ostream* output_;
        // Parenthesized expressions open at once within one form.
        size_t maxNestingDepth_ = 256;
    };

    Context(const Configuration& config = defaultConfig());
    Context(const Context&) = delete;

    // Compiles every form in code before running any of them, so a syntax
    // error anywhere in the input means nothing runs. Returns the value of
    // the last form, or nil for empty input.
    Value exec(const std::string& code);

    // Compiles and runs one form at a time. A syntax error stops at the
    // offending form, after the forms before it have run. Used for REPL
    // entries.
    Value eval(const std::string& code);

    // One chunk per top-level form.
    std::vector<Chunk> compile(const std::string& code);

    Value getGlobal(const std::string& name) const
    {
        return vm_.getGlobal(name);
    }

    void setGlobal(const std::string& name, const Value& value)
    {
        vm_.setGlobal(name, value);
    }

    void setObserver(Observer* observer)
    {
        vm_.setObserver(observer);
    }

    VM& vm()
    {
        return vm_;
    }

    static const Configuration& defaultConfig();

private:
    size_t maxNestingDepth_;
    VM vm_;
};

} // namespace losp
