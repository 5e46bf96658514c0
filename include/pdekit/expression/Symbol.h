#ifndef PDEKIT_SYMBOL_H
#define PDEKIT_SYMBOL_H

#include <pdekit/utils/SparseMatrix.h>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * =============================================================================
 * SYMBOLIC EXPRESSIONS
 * =============================================================================
 * A model is written as a graph of immutable Symbol nodes. Nodes are shared
 * through std::shared_ptr<const Symbol>, so the same subexpression may be
 * referenced by several equations (DAG, not tree). Nothing is ever mutated
 * after construction: every operator returns a new node.
 *
 * Two families of nodes:
 *   - continuous: Variable, Parameter, SpatialVariable, Gradient, Divergence,
 *     BoundaryValue, Integral (replaced during parameter processing / discretisation)
 *   - evaluable: Scalar, VectorConstant, StateVector, MatrixProduct, Time and the
 *     unary / binary arithmetic operators
 *
 * Evaluation returns a std::vector<double>: size 1 for scalars, the number of
 * mesh points (cells or edges) for fields. Binary operators broadcast size-1
 * operands.
 */

class Symbol;
using SymbolPtr = std::shared_ptr<const Symbol>;

// Cache of already evaluated nodes, keyed by node identity.
// Shared subexpressions are evaluated once per call.
using KnownEvals = std::unordered_map<const Symbol*, std::vector<double>>;

enum class CoordinateSystem { Cartesian, CylindricalPolar, SphericalPolar };

enum class Side { Left, Right };

std::string toString(CoordinateSystem coordinateSystem);
std::string toString(Side side);

// ============================================================================
// BASE CLASS: Symbol
// ============================================================================
class Symbol : public std::enable_shared_from_this<Symbol>
{
public:
    enum class Kind {
        Scalar, VectorConstant, Parameter, Variable, SpatialVariable, Time, StateVector,
        Negate, AbsoluteValue, Function,
        Add, Subtract, Multiply, Divide, Power,
        Gradient, Divergence, BoundaryValue, Integral, MatrixProduct
    };

    virtual ~Symbol() = default;

    Symbol(const Symbol&) = delete;
    Symbol& operator=(const Symbol&) = delete;

    Kind kind() const { return _kind; }
    const std::string& name() const { return _name; }
    const std::string& domain() const { return _domain; }
    size_t id() const { return _id; }   // unique per node, stable for the node's lifetime
    const std::vector<SymbolPtr>& children() const { return _children; }

    /**
     * Evaluate at time t against the flat state vector y
     * Throws if the subtree still contains continuous nodes
     */
    std::vector<double> evaluate(double t = 0.0, const std::vector<double>& y = {}) const;
    const std::vector<double>& evaluate(double t, const std::vector<double>& y, KnownEvals& known) const;

    // True if any node in the subtree (including this one) is of the given kind
    bool has(Kind kind) const;

    // True if the value does not depend on time, state or unbound parameters
    bool isConstant() const;

    /**
     * Same node type and data with new children.
     * Returns this node itself when the children are unchanged.
     */
    SymbolPtr withChildren(std::vector<SymbolPtr> children) const;

    virtual std::string toString() const;

protected:
    Symbol(Kind kind, std::string name, std::vector<SymbolPtr> children, std::string domain);

    virtual std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const = 0;
    virtual SymbolPtr rebuild(std::vector<SymbolPtr> children) const = 0;

    // Domain of a node combining several children (all non-empty domains must match)
    static std::string combineDomains(const std::string& opName, const std::vector<SymbolPtr>& children);

private:
    Kind _kind;
    std::string _name;
    std::vector<SymbolPtr> _children;
    std::string _domain;
    size_t _id;

    static size_t nextId();
};

// ============================================================================
// LEAVES
// ============================================================================

class Scalar : public Symbol
{
public:
    explicit Scalar(double value, std::string name = "");
    double value() const { return _value; }
    std::string toString() const override;

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;

private:
    double _value;
};

// Constant vector on a domain, e.g. cell-centre coordinates
class VectorConstant : public Symbol
{
public:
    VectorConstant(std::vector<double> values, std::string name, std::string domain);
    const std::vector<double>& values() const { return _values; }

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;

private:
    std::vector<double> _values;
};

// Named placeholder, replaced by a Scalar through ParameterValues
class Parameter : public Symbol
{
public:
    explicit Parameter(std::string name);

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;
};

// Unknown field; empty domain means a single (0-D) unknown
class Variable : public Symbol
{
public:
    Variable(std::string name, std::string domain = "");

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;
};

using VariablePtr = std::shared_ptr<const Variable>;

// Independent spatial coordinate (e.g. r) on a domain
class SpatialVariable : public Symbol
{
public:
    SpatialVariable(std::string name, std::string domain,
                    CoordinateSystem coordinateSystem = CoordinateSystem::Cartesian);
    CoordinateSystem coordinateSystem() const { return _coordinateSystem; }

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;

private:
    CoordinateSystem _coordinateSystem;
};

using SpatialVariablePtr = std::shared_ptr<const SpatialVariable>;

class Time : public Symbol
{
public:
    Time();

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;
};

// Slice y[start, start + size) of the flat state vector
class StateVector : public Symbol
{
public:
    StateVector(size_t start, size_t size, std::string name, std::string domain);
    size_t start() const { return _start; }
    size_t size() const { return _size; }

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;

private:
    size_t _start;
    size_t _size;
};

// ============================================================================
// UNARY OPERATORS
// ============================================================================

class Negate : public Symbol
{
public:
    explicit Negate(SymbolPtr child);
    std::string toString() const override;

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;
};

class AbsoluteValue : public Symbol
{
public:
    explicit AbsoluteValue(SymbolPtr child);

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;
};

// Elementwise standard function
class Function : public Symbol
{
public:
    enum class Type { Sqrt, Exp, Log, Sin, Cos, Tanh };

    Function(Type type, SymbolPtr child);
    Type type() const { return _type; }

    static double apply(Type type, double x);

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;

private:
    Type _type;
};

// ============================================================================
// BINARY OPERATORS
// ============================================================================

/**
 * Add / Subtract / Multiply / Divide / Power, selected by kind
 * Operands must have the same size, or one of them size 1 (broadcast)
 */
class BinaryOperator : public Symbol
{
public:
    BinaryOperator(Kind kind, SymbolPtr left, SymbolPtr right);

    const SymbolPtr& left() const { return children()[0]; }
    const SymbolPtr& right() const { return children()[1]; }

    static double apply(Kind kind, double a, double b);
    std::string toString() const override;

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;
};

// ============================================================================
// SPATIAL OPERATORS (replaced during discretisation)
// ============================================================================

class Gradient : public Symbol
{
public:
    explicit Gradient(SymbolPtr child);

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;
};

class Divergence : public Symbol
{
public:
    explicit Divergence(SymbolPtr child);

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;
};

// Value of a field at the left or right end of its domain
class BoundaryValue : public Symbol
{
public:
    BoundaryValue(SymbolPtr child, Side side);
    Side side() const { return _side; }

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;

private:
    Side _side;
};

// Integral of a field over its domain with respect to a spatial variable
class Integral : public Symbol
{
public:
    Integral(SymbolPtr child, SpatialVariablePtr integrationVariable);
    const SpatialVariablePtr& integrationVariable() const { return _integrationVariable; }

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;

private:
    SpatialVariablePtr _integrationVariable;
};

// ============================================================================
// DISCRETE OPERATORS
// ============================================================================

// A * child, where A is a discrete spatial operator
class MatrixProduct : public Symbol
{
public:
    MatrixProduct(std::shared_ptr<const SparseMatrix> matrix, SymbolPtr child,
                  std::string name, std::string domain);
    const SparseMatrix& matrix() const { return *_matrix; }

protected:
    std::vector<double> compute(double t, const std::vector<double>& y, KnownEvals& known) const override;
    SymbolPtr rebuild(std::vector<SymbolPtr> children) const override;

private:
    std::shared_ptr<const SparseMatrix> _matrix;
};

#endif // PDEKIT_SYMBOL_H
