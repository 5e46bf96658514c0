#include <pdekit/discretisation/Discretisation.h>
#include <pdekit/expression/Simplify.h>
#include <pdekit/utils/Errors.h>
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace
{
// Name of the first Parameter found in the expression, empty if none
std::string findParameter(const SymbolPtr& symbol, std::unordered_set<const Symbol*>& seen)
{
    if (!seen.insert(symbol.get()).second) return "";
    if (symbol->kind() == Symbol::Kind::Parameter) return symbol->name();
    for (const SymbolPtr& child : symbol->children()) {
        std::string name = findParameter(child, seen);
        if (!name.empty()) return name;
    }
    return "";
}

void rejectParameters(const Model& model)
{
    std::unordered_set<const Symbol*> seen;
    auto check = [&seen](const SymbolPtr& expression, const std::string& where) {
        std::string name = findParameter(expression, seen);
        if (!name.empty()) {
            throw ModelError("parameter '" + name + "' in " + where
                             + " has no value; process the model with ParameterValues first");
        }
    };
    for (const auto& [id, equation] : model.rhs()) check(equation.expression, "the rhs of '" + equation.variable->name() + "'");
    for (const auto& [id, equation] : model.algebraic()) check(equation.expression, "the algebraic equation of '" + equation.variable->name() + "'");
    for (const auto& [id, ic] : model.initialConditions()) check(ic.expression, "the initial condition of '" + ic.variable->name() + "'");
    for (const auto& [id, entry] : model.boundaryConditions()) {
        for (const auto& [side, condition] : entry.conditions) {
            check(condition.value, "the " + toString(side) + " boundary condition of '" + entry.variable->name() + "'");
        }
    }
    for (const auto& [name, expression] : model.variables()) check(expression, "output '" + name + "'");
}

const SpatialMethod& requireMethod(const SpatialMethods& methods, const std::string& domain)
{
    auto it = methods.find(domain);
    if (it == methods.end() || !it->second) {
        throw DiscretisationError("no spatial method given for domain '" + domain + "'");
    }
    return *it->second;
}

const SubMesh1D& requireSubmesh(const Mesh& mesh, const std::string& domain)
{
    if (!mesh.hasDomain(domain)) {
        throw DiscretisationError("no mesh for domain '" + domain + "'");
    }
    return mesh[domain];
}

/**
 * Memoised replacement of continuous nodes by discrete ones.
 * One instance per processModel call, so sharing across equations is kept.
 */
class SymbolDiscretiser
{
public:
    SymbolDiscretiser(const Mesh& mesh, const SpatialMethods& methods, const Model& model,
                      const std::map<size_t, SymbolPtr>& stateVectors)
        : _mesh(mesh), _methods(methods), _model(model), _stateVectors(stateVectors)
    {
    }

    SymbolPtr operator()(const SymbolPtr& symbol)
    {
        auto it = _cache.find(symbol.get());
        if (it != _cache.end()) {
            return it->second;
        }
        SymbolPtr result = discretiseNode(symbol);
        _cache.emplace(symbol.get(), result);
        return result;
    }

private:
    const Mesh& _mesh;
    const SpatialMethods& _methods;
    const Model& _model;
    const std::map<size_t, SymbolPtr>& _stateVectors;
    std::unordered_map<const Symbol*, SymbolPtr> _cache;

    const SpatialMethod& method(const std::string& domain) const { return requireMethod(_methods, domain); }
    const SubMesh1D& submesh(const std::string& domain) const { return requireSubmesh(_mesh, domain); }

    SymbolPtr discretiseNode(const SymbolPtr& symbol)
    {
        switch (symbol->kind()) {
            case Symbol::Kind::Variable: {
                auto it = _stateVectors.find(symbol->id());
                if (it == _stateVectors.end()) {
                    throw DiscretisationError("variable '" + symbol->name() + "' has no slot in the state vector");
                }
                return it->second;
            }
            case Symbol::Kind::Parameter:
                throw ModelError("parameter '" + symbol->name() + "' has no value");
            case Symbol::Kind::SpatialVariable: {
                const std::string& domain = symbol->domain();
                return method(domain).spatialVariable(static_cast<const SpatialVariable&>(*symbol), submesh(domain));
            }
            case Symbol::Kind::Gradient:
                return discretiseGradient(symbol);
            case Symbol::Kind::Divergence: {
                const std::string& domain = symbol->domain();
                SymbolPtr child = (*this)(symbol->children()[0]);
                return method(domain).divergence(child, domain, submesh(domain));
            }
            case Symbol::Kind::BoundaryValue: {
                const SymbolPtr& operand = symbol->children()[0];
                const std::string& domain = operand->domain();
                SymbolPtr child = (*this)(operand);
                Side side = static_cast<const BoundaryValue&>(*symbol).side();
                return method(domain).boundaryValue(child, submesh(domain), side);
            }
            case Symbol::Kind::Integral: {
                const auto& node = static_cast<const Integral&>(*symbol);
                const std::string& domain = node.children()[0]->domain();
                const SubMesh1D& mesh = submesh(domain);
                if (node.integrationVariable()->name() != mesh.coordinateName()) {
                    throw DiscretisationError("cannot integrate over '" + node.integrationVariable()->name()
                                              + "': the mesh of domain '" + domain + "' is in '"
                                              + mesh.coordinateName() + "'");
                }
                SymbolPtr child = (*this)(node.children()[0]);
                return method(domain).integral(child, mesh);
            }
            default:
                break;
        }

        std::vector<SymbolPtr> children;
        children.reserve(symbol->children().size());
        for (const SymbolPtr& child : symbol->children()) {
            children.push_back((*this)(child));
        }
        return symbol->withChildren(std::move(children));
    }

    SymbolPtr discretiseGradient(const SymbolPtr& symbol)
    {
        const SymbolPtr& operand = symbol->children()[0];
        const std::string& domain = symbol->domain();
        SymbolPtr child = (*this)(operand);

        // Only a variable carries boundary conditions
        if (operand->kind() == Symbol::Kind::Variable) {
            auto it = _model.boundaryConditions().find(operand->id());
            if (it != _model.boundaryConditions().end()) {
                BoundaryConditionSet conditions;
                for (const auto& [side, condition] : it->second.conditions) {
                    conditions[side] = {(*this)(condition.value), condition.type};
                }
                return method(domain).gradient(child, domain, submesh(domain), &conditions);
            }
        }
        return method(domain).gradient(child, domain, submesh(domain), nullptr);
    }
};

void checkSize(const std::vector<double>& value, size_t expected, const std::string& what)
{
    if (value.size() != expected && value.size() != 1) {
        throw DiscretisationError(what + " evaluates to " + std::to_string(value.size())
                                  + " values, expected " + std::to_string(expected));
    }
}
}

// ============================================================================
// DiscretisedSystem
// ============================================================================

void DiscretisedSystem::stack(const std::vector<SymbolPtr>& expressions, size_t firstSlice, double t,
                              const std::vector<double>& y, KnownEvals& known, std::vector<double>& out) const
{
    for (size_t k = 0; k < expressions.size(); ++k) {
        const StateSlice& slice = _layout[firstSlice + k];
        const std::vector<double>& value = expressions[k]->evaluate(t, y, known);
        checkSize(value, slice.size, "equation for '" + slice.variable->name() + "'");
        for (size_t i = 0; i < slice.size; ++i) {
            out.push_back(value.size() == 1 ? value[0] : value[i]);
        }
    }
}

std::vector<double> DiscretisedSystem::rhs(double t, const std::vector<double>& y) const
{
    KnownEvals known;
    std::vector<double> out;
    out.reserve(_numDifferential);
    stack(_rhs, 0, t, y, known, out);
    return out;
}

std::vector<double> DiscretisedSystem::algebraic(double t, const std::vector<double>& y) const
{
    KnownEvals known;
    std::vector<double> out;
    out.reserve(numAlgebraic());
    stack(_algebraic, _rhs.size(), t, y, known, out);
    return out;
}

std::vector<double> DiscretisedSystem::evaluate(double t, const std::vector<double>& y) const
{
    KnownEvals known;   // shared between both blocks
    std::vector<double> out;
    out.reserve(size());
    stack(_rhs, 0, t, y, known, out);
    stack(_algebraic, _rhs.size(), t, y, known, out);
    return out;
}

const StateSlice& DiscretisedSystem::slice(const Variable& variable) const
{
    for (const StateSlice& entry : _layout) {
        if (entry.variable->id() == variable.id()) {
            return entry;
        }
    }
    throw std::out_of_range("variable '" + variable.name() + "' is not part of the discretised system");
}

const SymbolPtr& DiscretisedSystem::output(const std::string& name) const
{
    auto it = _outputs.find(name);
    if (it == _outputs.end()) {
        throw std::out_of_range("'" + name + "' is not a variable of model '" + _name + "'");
    }
    return it->second;
}

// ============================================================================
// Discretisation
// ============================================================================

Discretisation::Discretisation(Mesh mesh, SpatialMethods methods)
    : _mesh(std::move(mesh)), _methods(std::move(methods))
{
}

DiscretisedSystem Discretisation::processModel(const Model& model, bool simplify) const
{
    model.checkWellPosedness();
    rejectParameters(model);

    DiscretisedSystem system;
    system._name = model.name();
    system._mesh = _mesh;
    system._lengthScales = model.lengthScales();

    // ---- state layout ----
    auto ordered = [](const Model::EquationMap& equations) {
        std::vector<VariablePtr> variables;
        for (const auto& [id, equation] : equations) variables.push_back(equation.variable);
        std::stable_sort(variables.begin(), variables.end(), [](const VariablePtr& a, const VariablePtr& b) {
            return a->domain() < b->domain();   // ids already ascending from the map
        });
        return variables;
    };

    std::map<size_t, SymbolPtr> stateVectors;
    size_t offset = 0;
    auto place = [&](const VariablePtr& variable, bool differential) {
        size_t n = 1;
        if (!variable->domain().empty()) {
            requireMethod(_methods, variable->domain());
            n = requireSubmesh(_mesh, variable->domain()).npts();
        }
        system._layout.push_back({variable, offset, n, differential});
        stateVectors[variable->id()] = std::make_shared<StateVector>(offset, n, variable->name(), variable->domain());
        system._massDiagonal.insert(system._massDiagonal.end(), n, differential ? 1.0 : 0.0);
        offset += n;
    };
    for (const VariablePtr& variable : ordered(model.rhs())) place(variable, true);
    system._numDifferential = offset;
    for (const VariablePtr& variable : ordered(model.algebraic())) place(variable, false);

    // ---- expressions ----
    SymbolDiscretiser discretise(_mesh, _methods, model, stateVectors);
    Simplifier simplifier;
    auto process = [&](const SymbolPtr& expression) {
        SymbolPtr out = discretise(expression);
        return simplify ? simplifier(out) : out;
    };

    for (const StateSlice& slice : system._layout) {
        size_t id = slice.variable->id();
        if (slice.differential) {
            system._rhs.push_back(process(model.rhs().at(id).expression));
        } else {
            system._algebraic.push_back(process(model.algebraic().at(id).expression));
        }
        system._outputs[slice.variable->name()] = stateVectors.at(id);
    }
    for (const auto& [name, expression] : model.variables()) {
        system._outputs[name] = process(expression);
    }

    // ---- initial state ----
    system._y0.reserve(offset);
    for (const StateSlice& slice : system._layout) {
        SymbolPtr ic = process(model.initialConditions().at(slice.variable->id()).expression);
        std::vector<double> value = ic->evaluate(0.0, {});
        checkSize(value, slice.size, "initial condition for '" + slice.variable->name() + "'");
        for (size_t i = 0; i < slice.size; ++i) {
            system._y0.push_back(value.size() == 1 ? value[0] : value[i]);
        }
    }

    // ---- shape check ----
    system.evaluate(0.0, system._y0);
    for (const auto& [name, expression] : system._outputs) {
        expression->evaluate(0.0, system._y0);
    }
    return system;
}
