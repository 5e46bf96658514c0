#ifndef PDEKIT_DISCRETISATION_H
#define PDEKIT_DISCRETISATION_H

#include <pdekit/discretisation/SpatialMethod.h>
#include <pdekit/mesh/Mesh.h>
#include <pdekit/model/Model.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

using SpatialMethods = std::map<std::string, std::shared_ptr<const SpatialMethod>>;   // domain -> method

/**
 * Position of one variable in the flat state vector y
 */
struct StateSlice
{
    VariablePtr variable;
    size_t start = 0;
    size_t size = 0;
    bool differential = true;
};

/**
 * @class DiscretisedSystem
 * @brief The model as a semi-discrete ODE / DAE system
 *
 *   M dy/dt = F(t, y),   M = diag(1 for differential entries, 0 for algebraic)
 *
 * y is laid out as [differential variables | algebraic variables], each block
 * grouped by domain then by variable id. F stacks the discretised rhs and
 * algebraic residuals in the same order. Every expression only references
 * StateVector slices of y, Time and constants.
 */
class DiscretisedSystem
{
public:
    const std::string& name() const { return _name; }

    size_t size() const { return _y0.size(); }
    size_t numDifferential() const { return _numDifferential; }
    size_t numAlgebraic() const { return _y0.size() - _numDifferential; }
    bool hasAlgebraic() const { return numAlgebraic() > 0; }

    // dy/dt for the differential block (size numDifferential)
    std::vector<double> rhs(double t, const std::vector<double>& y) const;

    // Residuals of the algebraic block (size numAlgebraic)
    std::vector<double> algebraic(double t, const std::vector<double>& y) const;

    // F(t, y): rhs and algebraic residuals stacked (size size())
    std::vector<double> evaluate(double t, const std::vector<double>& y) const;

    const std::vector<double>& massDiagonal() const { return _massDiagonal; }
    const std::vector<double>& initialState() const { return _y0; }

    const std::vector<StateSlice>& layout() const { return _layout; }
    const StateSlice& slice(const Variable& variable) const;   // throws std::out_of_range

    // Discretised named outputs, plus one entry per state variable under its own name
    const std::map<std::string, SymbolPtr>& outputs() const { return _outputs; }
    const SymbolPtr& output(const std::string& name) const;    // throws std::out_of_range

    const Mesh& mesh() const { return _mesh; }
    const std::map<std::string, double>& lengthScales() const { return _lengthScales; }

private:
    friend class Discretisation;
    DiscretisedSystem() = default;

    std::string _name;
    std::vector<StateSlice> _layout;
    std::vector<SymbolPtr> _rhs;          // one per differential slice
    std::vector<SymbolPtr> _algebraic;    // one per algebraic slice
    std::vector<double> _y0;
    std::vector<double> _massDiagonal;
    size_t _numDifferential = 0;
    std::map<std::string, SymbolPtr> _outputs;
    Mesh _mesh;
    std::map<std::string, double> _lengthScales;

    void stack(const std::vector<SymbolPtr>& expressions, size_t firstSlice, double t,
               const std::vector<double>& y, KnownEvals& known, std::vector<double>& out) const;
};

/**
 * @class Discretisation
 * @brief Turns a parameterised Model into a DiscretisedSystem
 *
 * Steps:
 *   1. model.checkWellPosedness()                         (ModelError)
 *   2. reject unbound Parameters                          (ModelError)
 *   3. require a mesh and a spatial method per domain     (DiscretisationError)
 *   4. lay out the state vector and replace variables by StateVector slices
 *   5. replace grad / div / boundary values / integrals with the domain's method
 *   6. evaluate the initial conditions and check every equation's size
 *
 * Discretisation is memoised per node: shared subexpressions are discretised
 * once and stay shared.
 */
class Discretisation
{
public:
    Discretisation(Mesh mesh, SpatialMethods methods);

    DiscretisedSystem processModel(const Model& model, bool simplify = true) const;

    const Mesh& mesh() const { return _mesh; }
    const SpatialMethods& methods() const { return _methods; }

private:
    Mesh _mesh;
    SpatialMethods _methods;
};

#endif // PDEKIT_DISCRETISATION_H
