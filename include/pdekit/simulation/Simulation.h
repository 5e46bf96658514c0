#ifndef PDEKIT_SIMULATION_H
#define PDEKIT_SIMULATION_H

#include <pdekit/discretisation/Discretisation.h>
#include <pdekit/geometry/Geometry.h>
#include <pdekit/model/Model.h>
#include <pdekit/model/ParameterValues.h>
#include <pdekit/solvers/Solution.h>
#include <pdekit/solvers/Solver.h>
#include <memory>
#include <optional>
#include <string>

/**
 * @class Simulation
 * @brief Runs the whole pipeline from one configuration
 *
 *   Model --ParameterValues--> Model --Mesh + SpatialMethods--> DiscretisedSystem --Solver--> Solution
 *
 * Every domain of the geometry gets a Uniform1DSubMesh and FiniteVolume
 * unless told otherwise; every spatial variable gets 20 points. The solver
 * defaults to RK45. build() is called by solve() when needed; changing the
 * configuration afterwards discards the built system.
 */
class Simulation
{
public:
    static constexpr size_t DEFAULT_POINTS = 20;

    Simulation(Model model, Geometry geometry, ParameterValues parameterValues = {});

    void setSubmeshType(const std::string& domain, std::shared_ptr<const SubMeshGenerator> generator);
    void setSpatialMethod(const std::string& domain, std::shared_ptr<const SpatialMethod> method);
    void setVarPts(const std::string& coordinateName, size_t npts);
    void setSolver(std::shared_ptr<const BaseSolver> solver);

    // Processes parameters, builds the mesh and discretises the model
    void build();
    bool isBuilt() const { return _system.has_value(); }

    Solution solve(double t0, double t1, size_t numSamples = 100);
    Solution solve(const std::vector<double>& tEval);

    const Model& model() const { return _model; }
    const Geometry& geometry() const { return _geometry; }
    const ParameterValues& parameterValues() const { return _parameterValues; }
    const BaseSolver& solver() const { return *_solver; }
    const DiscretisedSystem& discretisedSystem() const;   // throws std::logic_error before build()

private:
    Model _model;
    Geometry _geometry;
    ParameterValues _parameterValues;
    SubMeshTypes _submeshTypes;
    SpatialMethods _methods;
    VarPts _varPts;
    std::shared_ptr<const BaseSolver> _solver;
    std::optional<DiscretisedSystem> _system;
};

#endif // PDEKIT_SIMULATION_H
