#include <pdekit/model/Model.h>
#include <pdekit/expression/SymbolOperators.h>
#include <pdekit/utils/Errors.h>
#include <unordered_set>

namespace
{
void visit(const SymbolPtr& node, std::unordered_set<const Symbol*>& seen,
           const std::function<void(const SymbolPtr&)>& fn)
{
    if (!seen.insert(node.get()).second) return;
    fn(node);
    for (const SymbolPtr& child : node->children()) {
        visit(child, seen, fn);
    }
}

// Variables appearing directly under a gradient
std::map<size_t, VariablePtr> collectGradientOperands(const SymbolPtr& expression)
{
    std::map<size_t, VariablePtr> out;
    std::unordered_set<const Symbol*> seen;
    visit(expression, seen, [&out](const SymbolPtr& node) {
        if (node->kind() != Symbol::Kind::Gradient) return;
        const SymbolPtr& child = node->children()[0];
        if (child->kind() == Symbol::Kind::Variable) {
            out.emplace(child->id(), std::static_pointer_cast<const Variable>(child));
        }
    });
    return out;
}

void requireNonNull(const VariablePtr& variable, const SymbolPtr& expression, const std::string& what)
{
    if (!variable) {
        throw ModelError(what + ": variable is null");
    }
    if (!expression) {
        throw ModelError(what + ": expression for '" + variable->name() + "' is null");
    }
}
}

std::map<size_t, VariablePtr> collectVariables(const SymbolPtr& expression)
{
    std::map<size_t, VariablePtr> out;
    std::unordered_set<const Symbol*> seen;
    visit(expression, seen, [&out](const SymbolPtr& node) {
        if (node->kind() == Symbol::Kind::Variable) {
            out.emplace(node->id(), std::static_pointer_cast<const Variable>(node));
        }
    });
    return out;
}

// ============================================================================
// Registration
// ============================================================================

Model::Model(std::string name) : _name(std::move(name))
{
}

void Model::setRhs(const VariablePtr& variable, const SymbolPtr& expression)
{
    requireNonNull(variable, expression, "Model::setRhs");
    _rhs[variable->id()] = {variable, expression};
}

void Model::setAlgebraic(const VariablePtr& variable, const SymbolPtr& expression)
{
    requireNonNull(variable, expression, "Model::setAlgebraic");
    _algebraic[variable->id()] = {variable, expression};
}

void Model::setInitialCondition(const VariablePtr& variable, const SymbolPtr& expression)
{
    requireNonNull(variable, expression, "Model::setInitialCondition");
    _initialConditions[variable->id()] = {variable, expression};
}

void Model::setInitialCondition(const VariablePtr& variable, double value)
{
    setInitialCondition(variable, makeScalar(value));
}

void Model::setBoundaryConditions(const VariablePtr& variable, const BoundaryConditionSet& conditions)
{
    if (!variable) {
        throw ModelError("Model::setBoundaryConditions: variable is null");
    }
    for (const auto& [side, condition] : conditions) {
        if (!condition.value) {
            throw ModelError("Model::setBoundaryConditions: " + toString(side)
                             + " condition for '" + variable->name() + "' has no value");
        }
    }
    _boundaryConditions[variable->id()] = {variable, conditions};
}

void Model::addVariable(const std::string& name, const SymbolPtr& expression)
{
    if (!expression) {
        throw ModelError("Model::addVariable: expression for '" + name + "' is null");
    }
    _variables[name] = expression;
}

void Model::setLengthScale(const std::string& domain, double scale)
{
    if (!(scale > 0.0)) {
        throw ModelError("length scale for domain '" + domain + "' must be positive");
    }
    _lengthScales[domain] = scale;
}

// ============================================================================
// Well-posedness
// ============================================================================

void Model::checkWellPosedness() const
{
    checkEquationsHaveInitialConditions();
    checkVariableNames();
    checkReferencedVariables();
    checkBoundaryConditions();
}

void Model::checkEquationsHaveInitialConditions() const
{
    for (const auto& [id, equation] : _rhs) {
        if (_algebraic.count(id)) {
            throw ModelError("variable '" + equation.variable->name()
                             + "' has both an rhs and an algebraic equation");
        }
    }

    auto requireInitialCondition = [this](const Equation& equation) {
        if (!_initialConditions.count(equation.variable->id())) {
            throw ModelError("no initial condition given for variable '" + equation.variable->name() + "'");
        }
    };
    for (const auto& [id, equation] : _rhs) requireInitialCondition(equation);
    for (const auto& [id, equation] : _algebraic) requireInitialCondition(equation);

    for (const auto& [id, ic] : _initialConditions) {
        if (!_rhs.count(id) && !_algebraic.count(id)) {
            throw ModelError("initial condition given for variable '" + ic.variable->name()
                             + "' which has no rhs or algebraic equation");
        }
        auto dependencies = collectVariables(ic.expression);
        if (!dependencies.empty()) {
            throw ModelError("initial condition for '" + ic.variable->name()
                             + "' must not depend on variable '" + dependencies.begin()->second->name() + "'");
        }
        const std::string& icDomain = ic.expression->domain();
        if (!icDomain.empty() && icDomain != ic.variable->domain()) {
            throw ModelError("initial condition for '" + ic.variable->name() + "' is defined on domain '"
                             + icDomain + "' instead of '" + ic.variable->domain() + "'");
        }
    }
}

// Solutions are looked up by name, so state and output names must be unique
void Model::checkVariableNames() const
{
    std::map<std::string, size_t> stateNames;
    auto requireUniqueName = [&stateNames](const Equation& equation) {
        auto [it, inserted] = stateNames.emplace(equation.variable->name(), equation.variable->id());
        if (!inserted && it->second != equation.variable->id()) {
            throw ModelError("more than one variable is named '" + equation.variable->name() + "'");
        }
    };
    for (const auto& [id, equation] : _rhs) requireUniqueName(equation);
    for (const auto& [id, equation] : _algebraic) requireUniqueName(equation);

    for (const auto& [name, expression] : _variables) {
        if (stateNames.count(name)) {
            throw ModelError("output variable '" + name + "' has the same name as a state variable");
        }
    }
}

void Model::checkReferencedVariables() const
{
    auto requireEquation = [this](const SymbolPtr& expression, const std::string& where) {
        for (const auto& [id, variable] : collectVariables(expression)) {
            if (!_rhs.count(id) && !_algebraic.count(id)) {
                throw ModelError("variable '" + variable->name() + "' appears in " + where
                                 + " but has no rhs or algebraic equation");
            }
        }
    };

    for (const auto& [id, equation] : _rhs) {
        requireEquation(equation.expression, "the rhs of '" + equation.variable->name() + "'");
    }
    for (const auto& [id, equation] : _algebraic) {
        requireEquation(equation.expression, "the algebraic equation of '" + equation.variable->name() + "'");
    }
    for (const auto& [id, entry] : _boundaryConditions) {
        for (const auto& [side, condition] : entry.conditions) {
            requireEquation(condition.value, "the " + toString(side) + " boundary condition of '"
                                             + entry.variable->name() + "'");
        }
    }
    for (const auto& [name, expression] : _variables) {
        requireEquation(expression, "output variable '" + name + "'");
    }
}

void Model::checkBoundaryConditions() const
{
    for (const auto& [id, entry] : _boundaryConditions) {
        if (!_rhs.count(id) && !_algebraic.count(id)) {
            throw ModelError("boundary conditions given for variable '" + entry.variable->name()
                             + "' which has no rhs or algebraic equation");
        }
        for (const auto& [side, condition] : entry.conditions) {
            if (!condition.value->domain().empty()) {
                throw ModelError("the " + toString(side) + " boundary condition of '" + entry.variable->name()
                                 + "' must be a boundary quantity, not a field on '"
                                 + condition.value->domain() + "'");
            }
        }
    }

    // Every differentiated variable needs both conditions (second order in space)
    std::map<size_t, VariablePtr> differentiated;
    auto collect = [&differentiated](const SymbolPtr& expression) {
        for (const auto& entry : collectGradientOperands(expression)) differentiated.insert(entry);
    };
    for (const auto& [id, equation] : _rhs) collect(equation.expression);
    for (const auto& [id, equation] : _algebraic) collect(equation.expression);
    for (const auto& [name, expression] : _variables) collect(expression);

    for (const auto& [id, variable] : differentiated) {
        auto it = _boundaryConditions.find(id);
        for (Side side : {Side::Left, Side::Right}) {
            if (it == _boundaryConditions.end() || !it->second.conditions.count(side)) {
                throw ModelError("no " + toString(side) + " boundary condition given for variable '"
                                 + variable->name() + "'");
            }
        }
    }
}

// ============================================================================
// Transformation
// ============================================================================

Model Model::transformed(const std::function<SymbolPtr(const SymbolPtr&)>& fn) const
{
    Model out(_name);
    for (const auto& [id, equation] : _rhs) {
        out._rhs[id] = {equation.variable, fn(equation.expression)};
    }
    for (const auto& [id, equation] : _algebraic) {
        out._algebraic[id] = {equation.variable, fn(equation.expression)};
    }
    for (const auto& [id, ic] : _initialConditions) {
        out._initialConditions[id] = {ic.variable, fn(ic.expression)};
    }
    for (const auto& [id, entry] : _boundaryConditions) {
        BoundaryConditionSet conditions;
        for (const auto& [side, condition] : entry.conditions) {
            conditions[side] = {fn(condition.value), condition.type};
        }
        out._boundaryConditions[id] = {entry.variable, conditions};
    }
    for (const auto& [name, expression] : _variables) {
        out._variables[name] = fn(expression);
    }
    out._lengthScales = _lengthScales;
    return out;
}
