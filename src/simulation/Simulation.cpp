#include <pdekit/simulation/Simulation.h>
#include <pdekit/utils/Errors.h>
#include <stdexcept>

Simulation::Simulation(Model model, Geometry geometry, ParameterValues parameterValues)
    : _model(std::move(model)), _geometry(std::move(geometry)), _parameterValues(std::move(parameterValues)),
      _solver(std::make_shared<RK45Solver>())
{
    for (const auto& [domain, coordinates] : _geometry.domains()) {
        _submeshTypes[domain] = std::make_shared<Uniform1DSubMesh>();
        _methods[domain] = std::make_shared<FiniteVolume>();
        for (const CoordinateLimits& limits : coordinates) {
            _varPts[limits.name] = DEFAULT_POINTS;
        }
    }
}

void Simulation::setSubmeshType(const std::string& domain, std::shared_ptr<const SubMeshGenerator> generator)
{
    if (!generator) {
        throw GeometryError("submesh type for domain '" + domain + "' is null");
    }
    _submeshTypes[domain] = std::move(generator);
    _system.reset();
}

void Simulation::setSpatialMethod(const std::string& domain, std::shared_ptr<const SpatialMethod> method)
{
    if (!method) {
        throw DiscretisationError("spatial method for domain '" + domain + "' is null");
    }
    _methods[domain] = std::move(method);
    _system.reset();
}

void Simulation::setVarPts(const std::string& coordinateName, size_t npts)
{
    _varPts[coordinateName] = npts;
    _system.reset();
}

void Simulation::setSolver(std::shared_ptr<const BaseSolver> solver)
{
    if (!solver) {
        throw SolverError("solver is null");
    }
    _solver = std::move(solver);
}

void Simulation::build()
{
    Model parameterised = _parameterValues.processModel(_model);
    Mesh mesh(_geometry, _submeshTypes, _varPts);
    Discretisation discretisation(std::move(mesh), _methods);
    _system = discretisation.processModel(parameterised);
}

Solution Simulation::solve(double t0, double t1, size_t numSamples)
{
    if (!isBuilt()) build();
    return _solver->solve(*_system, t0, t1, numSamples);
}

Solution Simulation::solve(const std::vector<double>& tEval)
{
    if (!isBuilt()) build();
    return _solver->solve(*_system, tEval);
}

const DiscretisedSystem& Simulation::discretisedSystem() const
{
    if (!_system) {
        throw std::logic_error("Simulation::discretisedSystem: call build() or solve() first");
    }
    return *_system;
}
