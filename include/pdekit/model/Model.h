#ifndef PDEKIT_MODEL_H
#define PDEKIT_MODEL_H

#include <pdekit/expression/Symbol.h>
#include <pdekit/model/BoundaryConditions.h>
#include <functional>
#include <map>
#include <string>
#include <vector>

/**
 * @class Model
 *
 * We want to solve systems of the form:
 *   du/dt = f(t, u, grad u, ...)      (rhs, one entry per differential variable)
 *       0 = g(t, u, ...)              (algebraic, one entry per algebraic variable)
 *
 * With:
 *   - Initial conditions:  u(x, 0) = u_0(x)
 *   - Boundary conditions at the left and right ends of each variable's domain
 *   - Named output variables (quantities of interest, e.g. "Surface concentration")
 *
 * Equations are keyed by the Variable's id, not by the node itself. No
 * validation happens when equations are registered; checkWellPosedness() runs
 * lazily before discretisation.
 */
class Model
{
public:
    struct Equation {
        VariablePtr variable;
        SymbolPtr expression;
    };

    struct BoundaryEntry {
        VariablePtr variable;
        BoundaryConditionSet conditions;
    };

    using EquationMap = std::map<size_t, Equation>;          // variable id -> equation
    using BoundaryMap = std::map<size_t, BoundaryEntry>;     // variable id -> conditions

    explicit Model(std::string name = "Unnamed model");

    const std::string& name() const { return _name; }

    // Registration
    void setRhs(const VariablePtr& variable, const SymbolPtr& expression);
    void setAlgebraic(const VariablePtr& variable, const SymbolPtr& expression);
    void setInitialCondition(const VariablePtr& variable, const SymbolPtr& expression);
    void setInitialCondition(const VariablePtr& variable, double value);
    void setBoundaryConditions(const VariablePtr& variable, const BoundaryConditionSet& conditions);
    void addVariable(const std::string& name, const SymbolPtr& expression);   // named output
    void setLengthScale(const std::string& domain, double scale);

    // Accessors
    const EquationMap& rhs() const { return _rhs; }
    const EquationMap& algebraic() const { return _algebraic; }
    const EquationMap& initialConditions() const { return _initialConditions; }
    const BoundaryMap& boundaryConditions() const { return _boundaryConditions; }
    const std::map<std::string, SymbolPtr>& variables() const { return _variables; }
    const std::map<std::string, double>& lengthScales() const { return _lengthScales; }

    /**
     * Check that the model is well posed, throws ModelError naming the variable:
     *   - every rhs / algebraic variable has an initial condition
     *   - no variable has both an rhs and an algebraic equation
     *   - every variable referenced by an equation, condition or output has an equation
     *   - every variable whose equation contains grad / div has left and right conditions
     *   - initial / boundary conditions only refer to variables with an equation
     */
    void checkWellPosedness() const;

    /**
     * Copy of the model with fn applied to every expression (equations,
     * conditions, outputs). Used by parameter processing.
     */
    Model transformed(const std::function<SymbolPtr(const SymbolPtr&)>& fn) const;

private:
    std::string _name;
    EquationMap _rhs;
    EquationMap _algebraic;
    EquationMap _initialConditions;
    BoundaryMap _boundaryConditions;
    std::map<std::string, SymbolPtr> _variables;
    std::map<std::string, double> _lengthScales;

    void checkEquationsHaveInitialConditions() const;
    void checkVariableNames() const;
    void checkReferencedVariables() const;
    void checkBoundaryConditions() const;
};

// All Variable nodes referenced by an expression, keyed by id
std::map<size_t, VariablePtr> collectVariables(const SymbolPtr& expression);

#endif // PDEKIT_MODEL_H
