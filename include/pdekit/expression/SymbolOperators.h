#ifndef PDEKIT_SYMBOLOPERATORS_H
#define PDEKIT_SYMBOLOPERATORS_H

#include <pdekit/expression/Symbol.h>
#include <string>

/**
 * Builder API for symbolic models.
 *
 * Every function is pure: it returns a new node referencing its operands and
 * never modifies them. Example (diffusion in a spherical particle):
 *
 *   auto c = makeVariable("Concentration", "particle");
 *   auto N = -grad(c);
 *   auto dcdt = -div(N);
 *   auto j = makeParameter("j0") * sqrt(1.0 - surf(c)) * sqrt(surf(c));
 */

// ---- leaves ----
SymbolPtr makeScalar(double value, const std::string& name = "");
std::shared_ptr<const Parameter> makeParameter(const std::string& name);
VariablePtr makeVariable(const std::string& name, const std::string& domain = "");
SpatialVariablePtr makeSpatialVariable(const std::string& name, const std::string& domain,
                                       CoordinateSystem coordinateSystem = CoordinateSystem::Cartesian);
SymbolPtr makeTime();

// ---- arithmetic ----
SymbolPtr operator-(const SymbolPtr& child);
SymbolPtr operator+(const SymbolPtr& left, const SymbolPtr& right);
SymbolPtr operator-(const SymbolPtr& left, const SymbolPtr& right);
SymbolPtr operator*(const SymbolPtr& left, const SymbolPtr& right);
SymbolPtr operator/(const SymbolPtr& left, const SymbolPtr& right);

SymbolPtr operator+(const SymbolPtr& left, double right);
SymbolPtr operator+(double left, const SymbolPtr& right);
SymbolPtr operator-(const SymbolPtr& left, double right);
SymbolPtr operator-(double left, const SymbolPtr& right);
SymbolPtr operator*(const SymbolPtr& left, double right);
SymbolPtr operator*(double left, const SymbolPtr& right);
SymbolPtr operator/(const SymbolPtr& left, double right);
SymbolPtr operator/(double left, const SymbolPtr& right);

SymbolPtr pow(const SymbolPtr& base, const SymbolPtr& exponent);
SymbolPtr pow(const SymbolPtr& base, double exponent);

// ---- elementwise functions ----
SymbolPtr abs(const SymbolPtr& child);
SymbolPtr sqrt(const SymbolPtr& child);
SymbolPtr exp(const SymbolPtr& child);
SymbolPtr log(const SymbolPtr& child);
SymbolPtr sin(const SymbolPtr& child);
SymbolPtr cos(const SymbolPtr& child);
SymbolPtr tanh(const SymbolPtr& child);

// ---- spatial operators ----
SymbolPtr grad(const SymbolPtr& child);
SymbolPtr div(const SymbolPtr& child);
SymbolPtr boundaryValue(const SymbolPtr& child, Side side);
SymbolPtr surf(const SymbolPtr& child);   // value at the right boundary
SymbolPtr integral(const SymbolPtr& child, const SpatialVariablePtr& integrationVariable);

#endif // PDEKIT_SYMBOLOPERATORS_H
