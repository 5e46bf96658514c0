#include <pdekit/expression/Symbol.h>
#include <pdekit/utils/Errors.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace
{
void requireChild(const SymbolPtr& child, const std::string& opName)
{
    if (!child) {
        throw std::invalid_argument(opName + ": operand is null");
    }
}

bool subtreeHas(const Symbol& node, const std::vector<Symbol::Kind>& kinds,
                std::unordered_set<const Symbol*>& visited)
{
    if (!visited.insert(&node).second) {
        return false;   // already searched through this shared node
    }
    if (std::find(kinds.begin(), kinds.end(), node.kind()) != kinds.end()) {
        return true;
    }
    for (const SymbolPtr& child : node.children()) {
        if (subtreeHas(*child, kinds, visited)) {
            return true;
        }
    }
    return false;
}

std::string describeSizes(size_t a, size_t b)
{
    return std::to_string(a) + " vs " + std::to_string(b);
}
}

std::string toString(CoordinateSystem coordinateSystem)
{
    switch (coordinateSystem) {
        case CoordinateSystem::Cartesian:
            return "cartesian";
        case CoordinateSystem::CylindricalPolar:
            return "cylindrical polar";
        case CoordinateSystem::SphericalPolar:
            return "spherical polar";
    }
    return "unknown";
}

std::string toString(Side side)
{
    return side == Side::Left ? "left" : "right";
}

// ============================================================================
// Symbol Base Class Implementation
// ============================================================================

Symbol::Symbol(Kind kind, std::string name, std::vector<SymbolPtr> children, std::string domain)
    : _kind(kind), _name(std::move(name)), _children(std::move(children)),
      _domain(std::move(domain)), _id(nextId())
{
}

size_t Symbol::nextId()
{
    static std::atomic<size_t> counter{0};
    return ++counter;
}

std::vector<double> Symbol::evaluate(double t, const std::vector<double>& y) const
{
    KnownEvals known;
    return evaluate(t, y, known);
}

const std::vector<double>& Symbol::evaluate(double t, const std::vector<double>& y, KnownEvals& known) const
{
    auto it = known.find(this);
    if (it != known.end()) {
        return it->second;
    }
    std::vector<double> value = compute(t, y, known);
    // unordered_map references stay valid on rehash
    return known.emplace(this, std::move(value)).first->second;
}

bool Symbol::has(Kind kind) const
{
    std::unordered_set<const Symbol*> visited;
    return subtreeHas(*this, {kind}, visited);
}

bool Symbol::isConstant() const
{
    std::unordered_set<const Symbol*> visited;
    return !subtreeHas(*this,
                       {Kind::Parameter, Kind::Variable, Kind::SpatialVariable, Kind::Time,
                        Kind::StateVector, Kind::Gradient, Kind::Divergence,
                        Kind::BoundaryValue, Kind::Integral},
                       visited);
}

SymbolPtr Symbol::withChildren(std::vector<SymbolPtr> children) const
{
    if (children.size() != _children.size()) {
        throw std::invalid_argument("Symbol::withChildren: '" + _name + "' expects "
                                    + std::to_string(_children.size()) + " children");
    }
    if (std::equal(children.begin(), children.end(), _children.begin())) {
        return shared_from_this();
    }
    return rebuild(std::move(children));
}

std::string Symbol::toString() const
{
    if (_children.empty()) {
        return _name;
    }
    std::string out = _name + "(";
    for (size_t i = 0; i < _children.size(); ++i) {
        if (i > 0) out += ", ";
        out += _children[i]->toString();
    }
    return out + ")";
}

std::string Symbol::combineDomains(const std::string& opName, const std::vector<SymbolPtr>& children)
{
    std::string domain;
    for (const SymbolPtr& child : children) {
        requireChild(child, opName);
        if (child->domain().empty()) continue;
        if (domain.empty()) {
            domain = child->domain();
        } else if (child->domain() != domain) {
            throw ModelError("domain mismatch in '" + opName + "': '" + domain + "' vs '"
                             + child->domain() + "'");
        }
    }
    return domain;
}

// ============================================================================
// Leaves
// ============================================================================

Scalar::Scalar(double value, std::string name)
    : Symbol(Kind::Scalar, std::move(name), {}, ""), _value(value)
{
}

std::string Scalar::toString() const
{
    if (!name().empty()) {
        return name();
    }
    std::ostringstream os;
    os << _value;
    return os.str();
}

std::vector<double> Scalar::compute(double, const std::vector<double>&, KnownEvals&) const
{
    return {_value};
}

SymbolPtr Scalar::rebuild(std::vector<SymbolPtr>) const
{
    return std::make_shared<Scalar>(_value, name());
}

VectorConstant::VectorConstant(std::vector<double> values, std::string name, std::string domain)
    : Symbol(Kind::VectorConstant, std::move(name), {}, std::move(domain)), _values(std::move(values))
{
    if (_values.empty()) {
        throw std::invalid_argument("VectorConstant: values cannot be empty");
    }
}

std::vector<double> VectorConstant::compute(double, const std::vector<double>&, KnownEvals&) const
{
    return _values;
}

SymbolPtr VectorConstant::rebuild(std::vector<SymbolPtr>) const
{
    return std::make_shared<VectorConstant>(_values, name(), domain());
}

Parameter::Parameter(std::string name)
    : Symbol(Kind::Parameter, std::move(name), {}, "")
{
}

std::vector<double> Parameter::compute(double, const std::vector<double>&, KnownEvals&) const
{
    throw ModelError("parameter '" + name() + "' has no value; process the model with ParameterValues first");
}

SymbolPtr Parameter::rebuild(std::vector<SymbolPtr>) const
{
    return shared_from_this();
}

Variable::Variable(std::string name, std::string domain)
    : Symbol(Kind::Variable, std::move(name), {}, std::move(domain))
{
}

std::vector<double> Variable::compute(double, const std::vector<double>&, KnownEvals&) const
{
    throw DiscretisationError("variable '" + name() + "' must be discretised before it can be evaluated");
}

SymbolPtr Variable::rebuild(std::vector<SymbolPtr>) const
{
    return shared_from_this();   // identity matters for variables
}

SpatialVariable::SpatialVariable(std::string name, std::string domain, CoordinateSystem coordinateSystem)
    : Symbol(Kind::SpatialVariable, std::move(name), {}, std::move(domain)),
      _coordinateSystem(coordinateSystem)
{
    if (this->domain().empty()) {
        throw ModelError("spatial variable '" + this->name() + "' must belong to a domain");
    }
}

std::vector<double> SpatialVariable::compute(double, const std::vector<double>&, KnownEvals&) const
{
    throw DiscretisationError("spatial variable '" + name() + "' must be discretised before it can be evaluated");
}

SymbolPtr SpatialVariable::rebuild(std::vector<SymbolPtr>) const
{
    return shared_from_this();
}

Time::Time()
    : Symbol(Kind::Time, "time", {}, "")
{
}

std::vector<double> Time::compute(double t, const std::vector<double>&, KnownEvals&) const
{
    return {t};
}

SymbolPtr Time::rebuild(std::vector<SymbolPtr>) const
{
    return shared_from_this();
}

StateVector::StateVector(size_t start, size_t size, std::string name, std::string domain)
    : Symbol(Kind::StateVector, std::move(name), {}, std::move(domain)), _start(start), _size(size)
{
    if (_size == 0) {
        throw std::invalid_argument("StateVector: slice for '" + this->name() + "' cannot be empty");
    }
}

std::vector<double> StateVector::compute(double, const std::vector<double>& y, KnownEvals&) const
{
    if (y.size() < _start + _size) {
        throw DiscretisationError("state vector of size " + std::to_string(y.size())
                                  + " too small for '" + name() + "' at y["
                                  + std::to_string(_start) + ":" + std::to_string(_start + _size) + "]");
    }
    return std::vector<double>(y.begin() + static_cast<std::ptrdiff_t>(_start),
                               y.begin() + static_cast<std::ptrdiff_t>(_start + _size));
}

SymbolPtr StateVector::rebuild(std::vector<SymbolPtr>) const
{
    return shared_from_this();
}

// ============================================================================
// Unary Operators
// ============================================================================

Negate::Negate(SymbolPtr child)
    : Symbol(Kind::Negate, "-", {child}, combineDomains("-", {child}))
{
}

std::string Negate::toString() const
{
    return "-" + children()[0]->toString();
}

std::vector<double> Negate::compute(double t, const std::vector<double>& y, KnownEvals& known) const
{
    std::vector<double> out = children()[0]->evaluate(t, y, known);
    for (double& v : out) v = -v;
    return out;
}

SymbolPtr Negate::rebuild(std::vector<SymbolPtr> children) const
{
    return std::make_shared<Negate>(children[0]);
}

AbsoluteValue::AbsoluteValue(SymbolPtr child)
    : Symbol(Kind::AbsoluteValue, "abs", {child}, combineDomains("abs", {child}))
{
}

std::vector<double> AbsoluteValue::compute(double t, const std::vector<double>& y, KnownEvals& known) const
{
    std::vector<double> out = children()[0]->evaluate(t, y, known);
    for (double& v : out) v = std::abs(v);
    return out;
}

SymbolPtr AbsoluteValue::rebuild(std::vector<SymbolPtr> children) const
{
    return std::make_shared<AbsoluteValue>(children[0]);
}

namespace
{
std::string functionName(Function::Type type)
{
    switch (type) {
        case Function::Type::Sqrt: return "sqrt";
        case Function::Type::Exp:  return "exp";
        case Function::Type::Log:  return "log";
        case Function::Type::Sin:  return "sin";
        case Function::Type::Cos:  return "cos";
        case Function::Type::Tanh: return "tanh";
    }
    return "function";
}
}

Function::Function(Type type, SymbolPtr child)
    : Symbol(Kind::Function, functionName(type), {child}, combineDomains(functionName(type), {child})),
      _type(type)
{
}

double Function::apply(Type type, double x)
{
    switch (type) {
        case Type::Sqrt: return std::sqrt(x);
        case Type::Exp:  return std::exp(x);
        case Type::Log:  return std::log(x);
        case Type::Sin:  return std::sin(x);
        case Type::Cos:  return std::cos(x);
        case Type::Tanh: return std::tanh(x);
    }
    return x;
}

std::vector<double> Function::compute(double t, const std::vector<double>& y, KnownEvals& known) const
{
    std::vector<double> out = children()[0]->evaluate(t, y, known);
    for (double& v : out) v = apply(_type, v);
    return out;
}

SymbolPtr Function::rebuild(std::vector<SymbolPtr> children) const
{
    return std::make_shared<Function>(_type, children[0]);
}

// ============================================================================
// Binary Operators
// ============================================================================

namespace
{
std::string binaryName(Symbol::Kind kind)
{
    switch (kind) {
        case Symbol::Kind::Add:      return "+";
        case Symbol::Kind::Subtract: return "-";
        case Symbol::Kind::Multiply: return "*";
        case Symbol::Kind::Divide:   return "/";
        case Symbol::Kind::Power:    return "**";
        default:
            throw std::invalid_argument("BinaryOperator: not a binary operator kind");
    }
}
}

BinaryOperator::BinaryOperator(Kind kind, SymbolPtr left, SymbolPtr right)
    : Symbol(kind, binaryName(kind), {left, right}, combineDomains(binaryName(kind), {left, right}))
{
}

double BinaryOperator::apply(Kind kind, double a, double b)
{
    switch (kind) {
        case Kind::Add:      return a + b;
        case Kind::Subtract: return a - b;
        case Kind::Multiply: return a * b;
        case Kind::Divide:   return a / b;
        case Kind::Power:    return std::pow(a, b);
        default:
            throw std::invalid_argument("BinaryOperator::apply: not a binary operator kind");
    }
}

std::string BinaryOperator::toString() const
{
    return "(" + left()->toString() + " " + name() + " " + right()->toString() + ")";
}

std::vector<double> BinaryOperator::compute(double t, const std::vector<double>& y, KnownEvals& known) const
{
    const std::vector<double>& a = left()->evaluate(t, y, known);
    const std::vector<double>& b = right()->evaluate(t, y, known);

    if (a.size() != b.size() && a.size() != 1 && b.size() != 1) {
        throw DiscretisationError("shape mismatch in '" + toString() + "': " + describeSizes(a.size(), b.size()));
    }

    size_t n = std::max(a.size(), b.size());
    std::vector<double> out(n);
    for (size_t i = 0; i < n; ++i) {
        double ai = a.size() == 1 ? a[0] : a[i];
        double bi = b.size() == 1 ? b[0] : b[i];
        out[i] = apply(kind(), ai, bi);
    }
    return out;
}

SymbolPtr BinaryOperator::rebuild(std::vector<SymbolPtr> children) const
{
    return std::make_shared<BinaryOperator>(kind(), children[0], children[1]);
}

// ============================================================================
// Spatial Operators
// ============================================================================

namespace
{
std::string requireDomain(const SymbolPtr& child, const std::string& opName)
{
    requireChild(child, opName);
    if (child->domain().empty()) {
        throw ModelError(opName + " of '" + child->toString() + "' requires an operand defined on a spatial domain");
    }
    return child->domain();
}

[[noreturn]] void notDiscretised(const Symbol& symbol)
{
    throw DiscretisationError("'" + symbol.toString() + "' must be discretised before it can be evaluated");
}
}

Gradient::Gradient(SymbolPtr child)
    : Symbol(Kind::Gradient, "grad", {child}, requireDomain(child, "grad"))
{
}

std::vector<double> Gradient::compute(double, const std::vector<double>&, KnownEvals&) const
{
    notDiscretised(*this);
}

SymbolPtr Gradient::rebuild(std::vector<SymbolPtr> children) const
{
    return std::make_shared<Gradient>(children[0]);
}

Divergence::Divergence(SymbolPtr child)
    : Symbol(Kind::Divergence, "div", {child}, requireDomain(child, "div"))
{
}

std::vector<double> Divergence::compute(double, const std::vector<double>&, KnownEvals&) const
{
    notDiscretised(*this);
}

SymbolPtr Divergence::rebuild(std::vector<SymbolPtr> children) const
{
    return std::make_shared<Divergence>(children[0]);
}

BoundaryValue::BoundaryValue(SymbolPtr child, Side side)
    : Symbol(Kind::BoundaryValue, side == Side::Right ? "boundary value right" : "boundary value left",
             {child}, ""),
      _side(side)
{
    requireDomain(child, name());
}

std::vector<double> BoundaryValue::compute(double, const std::vector<double>&, KnownEvals&) const
{
    notDiscretised(*this);
}

SymbolPtr BoundaryValue::rebuild(std::vector<SymbolPtr> children) const
{
    return std::make_shared<BoundaryValue>(children[0], _side);
}

Integral::Integral(SymbolPtr child, SpatialVariablePtr integrationVariable)
    : Symbol(Kind::Integral, "integral", {child}, ""), _integrationVariable(std::move(integrationVariable))
{
    requireChild(_integrationVariable, "integral");
    std::string childDomain = requireDomain(child, "integral");
    if (childDomain != _integrationVariable->domain()) {
        throw ModelError("integral of '" + child->toString() + "' on domain '" + childDomain
                         + "' with respect to '" + _integrationVariable->name() + "' on domain '"
                         + _integrationVariable->domain() + "'");
    }
}

std::vector<double> Integral::compute(double, const std::vector<double>&, KnownEvals&) const
{
    notDiscretised(*this);
}

SymbolPtr Integral::rebuild(std::vector<SymbolPtr> children) const
{
    return std::make_shared<Integral>(children[0], _integrationVariable);
}

// ============================================================================
// Discrete Operators
// ============================================================================

MatrixProduct::MatrixProduct(std::shared_ptr<const SparseMatrix> matrix, SymbolPtr child,
                             std::string name, std::string domain)
    : Symbol(Kind::MatrixProduct, std::move(name), {child}, std::move(domain)), _matrix(std::move(matrix))
{
    requireChild(child, this->name());
    if (!_matrix) {
        throw std::invalid_argument("MatrixProduct: matrix is null");
    }
}

std::vector<double> MatrixProduct::compute(double t, const std::vector<double>& y, KnownEvals& known) const
{
    const std::vector<double>& x = children()[0]->evaluate(t, y, known);
    if (x.size() == _matrix->cols()) {
        return _matrix->multiply(x);
    }
    if (x.size() == 1) {
        return _matrix->multiply(std::vector<double>(_matrix->cols(), x[0]));
    }
    throw DiscretisationError("shape mismatch in '" + name() + "': operator expects "
                              + std::to_string(_matrix->cols()) + " values, got "
                              + std::to_string(x.size()));
}

SymbolPtr MatrixProduct::rebuild(std::vector<SymbolPtr> children) const
{
    return std::make_shared<MatrixProduct>(_matrix, children[0], name(), domain());
}
