#include <pdekit/solvers/Solution.h>
#include <pdekit/utils/Errors.h>
#include <exception>
#include <iostream>
#include <stdexcept>

// ============================================================================
// ProcessedVariable
// ============================================================================

ProcessedVariable::ProcessedVariable(std::string name, const SymbolPtr& expression, const std::vector<double>& times,
                                     const std::vector<std::vector<double>>& states, const DiscretisedSystem& system)
    : _name(std::move(name)), _domain(expression->domain()), _times(times)
{
    if (times.empty() || times.size() != states.size()) {
        throw std::invalid_argument("ProcessedVariable: need one state per time for '" + _name + "'");
    }
    evaluateEntries(expression, states);
    assignCoordinates(system);
}

void ProcessedVariable::evaluateEntries(const SymbolPtr& expression, const std::vector<std::vector<double>>& states)
{
    const long n = static_cast<long>(_times.size());
    _entries.resize(_times.size());

    // First sample serially: fixes the number of points
    _entries[0] = expression->evaluate(_times[0], states[0]);

    // The expression graph is immutable; each evaluate() call owns its cache
    std::exception_ptr error;
#pragma omp parallel for schedule(static)
    for (long k = 1; k < n; ++k) {
        try {
            _entries[k] = expression->evaluate(_times[k], states[k]);
        } catch (...) {
#pragma omp critical(pdekit_processed_variable)
            {
                if (!error) error = std::current_exception();
            }
        }
    }
    if (error) {
        std::rethrow_exception(error);
    }

    for (const std::vector<double>& entry : _entries) {
        if (entry.size() != _entries[0].size()) {
            throw DiscretisationError("output '" + _name + "' changes size between time samples");
        }
    }
}

void ProcessedVariable::assignCoordinates(const DiscretisedSystem& system)
{
    size_t npts = numPoints();
    if (npts == 1) {
        return;   // scalar output
    }
    if (_domain.empty() || !system.mesh().hasDomain(_domain)) {
        throw DiscretisationError("output '" + _name + "' has " + std::to_string(npts)
                                  + " values but no mesh to place them on");
    }

    const SubMesh1D& mesh = system.mesh()[_domain];
    if (npts == mesh.npts()) {
        _coordinates = mesh.nodes();
    } else if (npts == mesh.edges().size()) {
        _coordinates = mesh.edges();
    } else {
        throw DiscretisationError("output '" + _name + "' has " + std::to_string(npts) + " values; the mesh of '"
                                  + _domain + "' has " + std::to_string(mesh.npts()) + " cells");
    }

    auto it = system.lengthScales().find(_domain);
    if (it != system.lengthScales().end()) {
        _lengthScale = it->second;
    } else {
        std::string warning = "no length scale given for domain '" + _domain + "', using 1";
        std::cerr << "Warning: " << warning << std::endl;
        _warnings.push_back(warning);
    }
    for (double& x : _coordinates) {
        x *= _lengthScale;
    }
    _xMin = mesh.min() * _lengthScale;
    _xMax = mesh.max() * _lengthScale;
}

std::vector<double> ProcessedVariable::series(size_t i) const
{
    if (i >= numPoints()) {
        throw std::out_of_range("ProcessedVariable::series: point " + std::to_string(i) + " out of range for '"
                                + _name + "'");
    }
    std::vector<double> out;
    out.reserve(_entries.size());
    for (const std::vector<double>& entry : _entries) {
        out.push_back(entry[i]);
    }
    return out;
}

std::vector<double> ProcessedVariable::profileAt(double t) const
{
    if (_times.size() == 1) {
        if (t != _times[0]) {
            throw std::out_of_range("ProcessedVariable: '" + _name + "' only has a sample at t = "
                                    + std::to_string(_times[0]));
        }
        return _entries[0];
    }

    std::vector<double> profile(numPoints());
    for (size_t i = 0; i < profile.size(); ++i) {
        LinearInterpolation inTime(_times, series(i), ExtrapolationType::None);
        profile[i] = inTime(t);
    }
    return profile;
}

double ProcessedVariable::operator()(double t) const
{
    if (!isScalar()) {
        throw std::logic_error("'" + _name + "' is a field on '" + _domain + "'; give a position as well");
    }
    return profileAt(t)[0];
}

double ProcessedVariable::operator()(double t, double x) const
{
    if (isScalar()) {
        return (*this)(t);
    }
    if (x < _xMin || x > _xMax) {
        throw std::out_of_range("position " + std::to_string(x) + " outside the domain '" + _domain + "' of '"
                                + _name + "'");
    }
    // Between the domain ends and the outermost nodes the value is held flat
    LinearInterpolation inSpace(_coordinates, profileAt(t), ExtrapolationType::Flat);
    return inSpace(x);
}

// ============================================================================
// Solution
// ============================================================================

Solution::Solution(std::shared_ptr<const DiscretisedSystem> system, std::vector<double> t,
                   std::vector<std::vector<double>> y, std::string solverName, SolverStats stats,
                   std::string terminationReason)
    : _system(std::move(system)), _t(std::move(t)), _y(std::move(y)), _solverName(std::move(solverName)),
      _stats(stats), _terminationReason(std::move(terminationReason))
{
    if (!_system) {
        throw std::invalid_argument("Solution: discretised system is null");
    }
    if (_t.empty() || _t.size() != _y.size()) {
        throw std::invalid_argument("Solution: need one state per sample time");
    }
}

ProcessedVariable Solution::operator[](const std::string& name) const
{
    return ProcessedVariable(name, _system->output(name), _t, _y, *_system);
}
