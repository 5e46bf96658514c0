#ifndef PDEKIT_SOLUTION_H
#define PDEKIT_SOLUTION_H

#include <pdekit/discretisation/Discretisation.h>
#include <pdekit/utils/InterpolationSchemes.h>
#include <memory>
#include <string>
#include <vector>

/**
 * Counters collected while integrating
 */
struct SolverStats
{
    size_t steps = 0;              // accepted steps
    size_t rejectedSteps = 0;
    size_t rhsEvaluations = 0;
    size_t newtonIterations = 0;
};

/**
 * @class ProcessedVariable
 * @brief One output re-evaluated at every stored time
 *
 * entries()[k] holds the output at times()[k]: a single value for scalar
 * outputs, one value per node (or per edge, for fluxes) for fields.
 * coordinates() are the dimensional positions of those values, i.e. mesh
 * nodes or edges multiplied by the domain's length scale. A domain without a
 * length scale uses 1 and records a warning.
 *
 * Queries between samples interpolate linearly in time and then in space.
 */
class ProcessedVariable
{
public:
    ProcessedVariable(std::string name, const SymbolPtr& expression, const std::vector<double>& times,
                      const std::vector<std::vector<double>>& states, const DiscretisedSystem& system);

    const std::string& name() const { return _name; }
    const std::string& domain() const { return _domain; }
    const std::vector<double>& times() const { return _times; }
    const std::vector<std::vector<double>>& entries() const { return _entries; }
    const std::vector<double>& coordinates() const { return _coordinates; }
    const std::vector<std::string>& warnings() const { return _warnings; }

    bool isScalar() const { return _coordinates.empty(); }
    size_t numPoints() const { return _entries.front().size(); }

    // Values of spatial point i over time
    std::vector<double> series(size_t i = 0) const;

    // Scalar output at time t; throws std::logic_error for fields
    double operator()(double t) const;

    // Field output at time t and dimensional position x; throws std::out_of_range outside the mesh
    double operator()(double t, double x) const;

private:
    std::string _name;
    std::string _domain;
    std::vector<double> _times;
    std::vector<std::vector<double>> _entries;
    std::vector<double> _coordinates;
    double _lengthScale = 1.0;
    double _xMin = 0.0;   // dimensional domain ends
    double _xMax = 0.0;
    std::vector<std::string> _warnings;

    void evaluateEntries(const SymbolPtr& expression, const std::vector<std::vector<double>>& states);
    void assignCoordinates(const DiscretisedSystem& system);
    std::vector<double> profileAt(double t) const;
};

/**
 * @class Solution
 * @brief Sample times, states and post-processing of an integration
 *
 * Holds strictly increasing times covering [t0, t1] and one state vector per
 * time. solution["Surface concentration"] re-evaluates that output of the
 * discretised system at every stored state.
 */
class Solution
{
public:
    Solution(std::shared_ptr<const DiscretisedSystem> system, std::vector<double> t,
             std::vector<std::vector<double>> y, std::string solverName, SolverStats stats,
             std::string terminationReason);

    const std::vector<double>& t() const { return _t; }
    const std::vector<std::vector<double>>& y() const { return _y; }

    // throws std::out_of_range for an unknown name
    ProcessedVariable operator[](const std::string& name) const;

    const DiscretisedSystem& system() const { return *_system; }
    const std::string& solverName() const { return _solverName; }
    const SolverStats& stats() const { return _stats; }
    size_t numSteps() const { return _stats.steps; }
    const std::string& terminationReason() const { return _terminationReason; }

private:
    std::shared_ptr<const DiscretisedSystem> _system;
    std::vector<double> _t;
    std::vector<std::vector<double>> _y;
    std::string _solverName;
    SolverStats _stats;
    std::string _terminationReason;
};

#endif // PDEKIT_SOLUTION_H
