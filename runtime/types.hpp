#pragma once

#include <memory>
#include <ostream>
#include <stdint.h>
#include <string>
#include <vector>

#include "common.hpp"

namespace losp {

class Function;


// The runtime currency of the vm. A closed set of variants; every operation
// over values switches exhaustively on type().
class Value {
public:
    enum class Type : uint8_t { Nil, Boolean, Integer, Float, String, Function };

    Value() : type_(Type::Nil), integer_(0)
    {
    }

    explicit Value(bool value) : type_(Type::Boolean), boolean_(value)
    {
    }

    explicit Value(int value) : type_(Type::Integer), integer_(value)
    {
    }

    explicit Value(int64_t value) : type_(Type::Integer), integer_(value)
    {
    }

    explicit Value(double value) : type_(Type::Float), float_(value)
    {
    }

    explicit Value(const char* value)
        : type_(Type::String), integer_(0),
          string_(std::make_shared<const std::string>(value))
    {
    }

    explicit Value(const std::string& value)
        : type_(Type::String), integer_(0),
          string_(std::make_shared<const std::string>(value))
    {
    }

    explicit Value(std::shared_ptr<const Function> fn)
        : type_(Type::Function), integer_(0), function_(std::move(fn))
    {
    }

    Type type() const
    {
        return type_;
    }

    bool isNumber() const
    {
        return type_ == Type::Integer or type_ == Type::Float;
    }

    // Checked accessors, a TypeError is raised on a variant mismatch.
    bool asBoolean() const;
    int64_t asInteger() const;
    double asFloat() const;
    const std::string& asString() const;
    const std::shared_ptr<const Function>& asFunction() const;

    // Integers and floats both widen to double.
    double toDouble() const;

    // nil, false, 0, 0.0 and "" are false, everything else is true.
    bool truthy() const;

    // Structural equality. Never coerces between Integer and Float, and is
    // reflexive for NaN.
    bool operator==(const Value& other) const;

    bool operator!=(const Value& other) const
    {
        return not(*this == other);
    }

    const char* typeName() const
    {
        return name(type_);
    }

    static const char* name(Type type);

private:
    Type type_;
    union {
        bool boolean_;
        int64_t integer_;
        double float_;
    };
    std::shared_ptr<const std::string> string_;
    std::shared_ptr<const Function> function_;
};


// A compiled unit: instruction bytes, the source line of every byte, and the
// constants referenced by PUSHI and the global access instructions.
struct Chunk {
    Bytecode code_;
    std::vector<size_t> lines_;
    std::vector<Value> constants_;

    // Returns the index of an identical constant if one is already pooled.
    size_t addConstant(const Value& value);
};


class Function {
public:
    Function(const std::string& name, size_t argCount, Chunk chunk)
        : name_(name), argCount_(argCount), chunk_(std::move(chunk))
    {
    }

    const std::string& name() const
    {
        return name_;
    }

    size_t argCount() const
    {
        return argCount_;
    }

    const Chunk& chunk() const
    {
        return chunk_;
    }

private:
    std::string name_;
    size_t argCount_;
    Chunk chunk_;
};


// Renders a value the way print does. With showQuotes, strings are wrapped in
// double quotes (used by the tracer and error messages).
void print(const Value& val, std::ostream& out, bool showQuotes = false);

std::string toString(const Value& val, bool showQuotes = false);

} // namespace losp
