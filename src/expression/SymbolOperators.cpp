#include <pdekit/expression/SymbolOperators.h>
#include <memory>

namespace
{
SymbolPtr binary(Symbol::Kind kind, const SymbolPtr& left, const SymbolPtr& right)
{
    return std::make_shared<BinaryOperator>(kind, left, right);
}

SymbolPtr function(Function::Type type, const SymbolPtr& child)
{
    return std::make_shared<Function>(type, child);
}
}

SymbolPtr makeScalar(double value, const std::string& name)
{
    return std::make_shared<Scalar>(value, name);
}

std::shared_ptr<const Parameter> makeParameter(const std::string& name)
{
    return std::make_shared<Parameter>(name);
}

VariablePtr makeVariable(const std::string& name, const std::string& domain)
{
    return std::make_shared<Variable>(name, domain);
}

SpatialVariablePtr makeSpatialVariable(const std::string& name, const std::string& domain,
                                       CoordinateSystem coordinateSystem)
{
    return std::make_shared<SpatialVariable>(name, domain, coordinateSystem);
}

SymbolPtr makeTime()
{
    return std::make_shared<Time>();
}

// ============================================================================
// Arithmetic
// ============================================================================

SymbolPtr operator-(const SymbolPtr& child)
{
    return std::make_shared<Negate>(child);
}

SymbolPtr operator+(const SymbolPtr& left, const SymbolPtr& right)
{
    return binary(Symbol::Kind::Add, left, right);
}

SymbolPtr operator-(const SymbolPtr& left, const SymbolPtr& right)
{
    return binary(Symbol::Kind::Subtract, left, right);
}

SymbolPtr operator*(const SymbolPtr& left, const SymbolPtr& right)
{
    return binary(Symbol::Kind::Multiply, left, right);
}

SymbolPtr operator/(const SymbolPtr& left, const SymbolPtr& right)
{
    return binary(Symbol::Kind::Divide, left, right);
}

SymbolPtr operator+(const SymbolPtr& left, double right) { return left + makeScalar(right); }
SymbolPtr operator+(double left, const SymbolPtr& right) { return makeScalar(left) + right; }
SymbolPtr operator-(const SymbolPtr& left, double right) { return left - makeScalar(right); }
SymbolPtr operator-(double left, const SymbolPtr& right) { return makeScalar(left) - right; }
SymbolPtr operator*(const SymbolPtr& left, double right) { return left * makeScalar(right); }
SymbolPtr operator*(double left, const SymbolPtr& right) { return makeScalar(left) * right; }
SymbolPtr operator/(const SymbolPtr& left, double right) { return left / makeScalar(right); }
SymbolPtr operator/(double left, const SymbolPtr& right) { return makeScalar(left) / right; }

SymbolPtr pow(const SymbolPtr& base, const SymbolPtr& exponent)
{
    return binary(Symbol::Kind::Power, base, exponent);
}

SymbolPtr pow(const SymbolPtr& base, double exponent)
{
    return pow(base, makeScalar(exponent));
}

// ============================================================================
// Functions
// ============================================================================

SymbolPtr abs(const SymbolPtr& child) { return std::make_shared<AbsoluteValue>(child); }
SymbolPtr sqrt(const SymbolPtr& child) { return function(Function::Type::Sqrt, child); }
SymbolPtr exp(const SymbolPtr& child) { return function(Function::Type::Exp, child); }
SymbolPtr log(const SymbolPtr& child) { return function(Function::Type::Log, child); }
SymbolPtr sin(const SymbolPtr& child) { return function(Function::Type::Sin, child); }
SymbolPtr cos(const SymbolPtr& child) { return function(Function::Type::Cos, child); }
SymbolPtr tanh(const SymbolPtr& child) { return function(Function::Type::Tanh, child); }

// ============================================================================
// Spatial Operators
// ============================================================================

SymbolPtr grad(const SymbolPtr& child)
{
    return std::make_shared<Gradient>(child);
}

SymbolPtr div(const SymbolPtr& child)
{
    return std::make_shared<Divergence>(child);
}

SymbolPtr boundaryValue(const SymbolPtr& child, Side side)
{
    return std::make_shared<BoundaryValue>(child, side);
}

SymbolPtr surf(const SymbolPtr& child)
{
    return boundaryValue(child, Side::Right);
}

SymbolPtr integral(const SymbolPtr& child, const SpatialVariablePtr& integrationVariable)
{
    return std::make_shared<Integral>(child, integrationVariable);
}
