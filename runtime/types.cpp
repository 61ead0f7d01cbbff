#include "types.hpp"
#include "error.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace losp {

const char* Value::name(Type type)
{
    switch (type) {
    case Type::Nil:
        return "<Nil>";
    case Type::Boolean:
        return "<Boolean>";
    case Type::Integer:
        return "<Integer>";
    case Type::Float:
        return "<Float>";
    case Type::String:
        return "<String>";
    case Type::Function:
        return "<Function>";
    }
    return "<Unknown>";
}

static TypeError invalidCast(const Value& val, Value::Type to)
{
    return TypeError(std::string("for type ") + val.typeName() +
                     ": invalid cast to " + Value::name(to));
}

bool Value::asBoolean() const
{
    if (type_ not_eq Type::Boolean) {
        throw invalidCast(*this, Type::Boolean);
    }
    return boolean_;
}

int64_t Value::asInteger() const
{
    if (type_ not_eq Type::Integer) {
        throw invalidCast(*this, Type::Integer);
    }
    return integer_;
}

double Value::asFloat() const
{
    if (type_ not_eq Type::Float) {
        throw invalidCast(*this, Type::Float);
    }
    return float_;
}

const std::string& Value::asString() const
{
    if (type_ not_eq Type::String) {
        throw invalidCast(*this, Type::String);
    }
    return *string_;
}

const std::shared_ptr<const Function>& Value::asFunction() const
{
    if (type_ not_eq Type::Function) {
        throw invalidCast(*this, Type::Function);
    }
    return function_;
}

double Value::toDouble() const
{
    switch (type_) {
    case Type::Integer:
        return static_cast<double>(integer_);
    case Type::Float:
        return float_;
    default:
        throw invalidCast(*this, Type::Float);
    }
}

bool Value::truthy() const
{
    switch (type_) {
    case Type::Nil:
        return false;
    case Type::Boolean:
        return boolean_;
    case Type::Integer:
        return integer_ not_eq 0;
    case Type::Float:
        return float_ not_eq 0.0;
    case Type::String:
        return not string_->empty();
    case Type::Function:
        return true;
    }
    return true;
}

bool Value::operator==(const Value& other) const
{
    if (type_ not_eq other.type_) {
        return false;
    }
    switch (type_) {
    case Type::Nil:
        return true;
    case Type::Boolean:
        return boolean_ == other.boolean_;
    case Type::Integer:
        return integer_ == other.integer_;
    case Type::Float:
        // NaN equals itself; 0.0 and -0.0 are equal.
        return float_ == other.float_ or
               (std::isnan(float_) and std::isnan(other.float_));
    case Type::String:
        return *string_ == *other.string_;
    case Type::Function:
        return function_ == other.function_;
    }
    return false;
}

static bool identicalConstant(const Value& lhs, const Value& rhs)
{
    if (lhs.type() not_eq rhs.type()) {
        return false;
    }
    switch (lhs.type()) {
    case Value::Type::Float: {
        // Bitwise, so that 0.0 and -0.0 stay distinct and NaN is reused.
        const double a = lhs.asFloat();
        const double b = rhs.asFloat();
        return std::memcmp(&a, &b, sizeof(double)) == 0;
    }
    case Value::Type::Function:
        return false;
    default:
        return lhs == rhs;
    }
}

size_t Chunk::addConstant(const Value& value)
{
    for (size_t i = 0; i < constants_.size(); ++i) {
        if (identicalConstant(constants_[i], value)) {
            return i;
        }
    }
    constants_.push_back(value);
    return constants_.size() - 1;
}

// Shortest decimal text that reads back as the same double, always with a
// fractional part.
static std::string formatFloat(double value)
{
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }
    // Enough precision for every integral digit, so that %g does not switch
    // to exponent notation for values such as 100.0.
    int precision = 1;
    if (std::fabs(value) >= 1.0) {
        const int digits = std::snprintf(nullptr, 0, "%.0f",
                                         std::trunc(std::fabs(value)));
        precision = std::min(digits, 17);
    }
    char buffer[32];
    for (; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof buffer, "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    std::string result(buffer);
    if (result.find_first_of(".e") == std::string::npos) {
        result += ".0";
    }
    return result;
}

void print(const Value& val, std::ostream& out, bool showQuotes)
{
    switch (val.type()) {
    case Value::Type::Nil:
        out << "nil";
        break;

    case Value::Type::Boolean:
        out << (val.asBoolean() ? "true" : "false");
        break;

    case Value::Type::Integer:
        out << val.asInteger();
        break;

    case Value::Type::Float:
        out << formatFloat(val.asFloat());
        break;

    case Value::Type::String:
        if (showQuotes) {
            out << '"' << val.asString() << '"';
        } else {
            out << val.asString();
        }
        break;

    case Value::Type::Function:
        out << "fn<" << val.asFunction()->name() << ">";
        break;
    }
}

std::string toString(const Value& val, bool showQuotes)
{
    std::stringstream format;
    print(val, format, showQuotes);
    return format.str();
}

} // namespace losp
