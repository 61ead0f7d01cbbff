#include "ast.hpp"

namespace losp {
namespace ast {

void Literal::visit(Visitor& visitor)
{
    visitor.visit(*this);
}

void LValue::visit(Visitor& visitor)
{
    visitor.visit(*this);
}

void Def::visit(Visitor& visitor)
{
    visitor.visit(*this);
}

void Let::visit(Visitor& visitor)
{
    visitor.visit(*this);
}

void If::visit(Visitor& visitor)
{
    visitor.visit(*this);
}

void When::visit(Visitor& visitor)
{
    visitor.visit(*this);
}

void Begin::visit(Visitor& visitor)
{
    visitor.visit(*this);
}

void Defn::visit(Visitor& visitor)
{
    visitor.visit(*this);
}

void While::visit(Visitor& visitor)
{
    visitor.visit(*this);
}

void And::visit(Visitor& visitor)
{
    visitor.visit(*this);
}

void Or::visit(Visitor& visitor)
{
    visitor.visit(*this);
}

void Application::visit(Visitor& visitor)
{
    visitor.visit(*this);
}

} // namespace ast
} // namespace losp
