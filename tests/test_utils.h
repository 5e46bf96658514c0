//
// Shared helpers for the pdekit tests
//

#ifndef PDEKIT_TEST_UTILS_H
#define PDEKIT_TEST_UTILS_H

#include <gtest/gtest.h>
#include <pdekit/discretisation/Discretisation.h>
#include <pdekit/expression/SymbolOperators.h>
#include <pdekit/geometry/Geometry.h>
#include <pdekit/mesh/Mesh.h>
#include <pdekit/model/Model.h>
#include <pdekit/model/ParameterValues.h>
#include <cmath>
#include <memory>
#include <numeric>
#include <string>
#include <vector>

// ============================================================================
// Tolerances
// ============================================================================

constexpr double EXACT_TOL = 1e-12;      // algebraic identities, assembled operators
constexpr double SOLVER_TOL = 1e-4;      // integrated trajectories

namespace testutils
{

inline Geometry unitGeometry(const SpatialVariablePtr& r, double min = 0.0, double max = 1.0)
{
    Geometry geometry;
    geometry.add(r->domain(), r, min, max);
    return geometry;
}

// Uniform mesh + finite volumes on every domain of the geometry
inline Discretisation uniformDiscretisation(const Geometry& geometry, size_t npts)
{
    SubMeshTypes submeshTypes;
    SpatialMethods methods;
    VarPts varPts;
    for (const auto& [domain, coordinates] : geometry.domains()) {
        submeshTypes[domain] = std::make_shared<Uniform1DSubMesh>();
        methods[domain] = std::make_shared<FiniteVolume>();
        for (const CoordinateLimits& limits : coordinates) varPts[limits.name] = npts;
    }
    return Discretisation(Mesh(geometry, submeshTypes, varPts), methods);
}

inline SubMesh1D uniformSubMesh(size_t npts, CoordinateSystem system = CoordinateSystem::Cartesian,
                                double min = 0.0, double max = 1.0)
{
    return Uniform1DSubMesh().generate(CoordinateLimits{"x", system, min, max}, npts);
}

inline double sum(const std::vector<double>& v)
{
    return std::accumulate(v.begin(), v.end(), 0.0);
}

/**
 * Diffusion in a spherical particle
 *   dc/dt = -div(N), N = -grad(c)
 *   N(0) = 0, N(1) = j0 * (1 - c_s)^(1/2) * c_s^(1/2)
 * with outputs "Surface concentration", "Surface flux", "Total lithium", "Flux"
 */
struct ParticleModel
{
    VariablePtr c = makeVariable("Concentration", "particle");
    SpatialVariablePtr r = makeSpatialVariable("r", "particle", CoordinateSystem::SphericalPolar);
    SymbolPtr cSurf = surf(c);
    SymbolPtr j = makeParameter("j0") * sqrt(1.0 - cSurf) * sqrt(cSurf);
    Model model{"Particle diffusion"};

    ParticleModel()
    {
        SymbolPtr N = -grad(c);
        model.setRhs(c, -div(N));
        model.setBoundaryConditions(c, {{Side::Left, {makeScalar(0.0), BoundaryConditionType::Neumann}},
                                        {Side::Right, {-j, BoundaryConditionType::Neumann}}});
        model.setInitialCondition(c, makeParameter("c0"));
        model.addVariable("Surface concentration", cSurf);
        model.addVariable("Surface flux", j);
        model.addVariable("Total lithium", integral(c, r));
        model.addVariable("Flux", N);
    }

    static ParameterValues defaultParameters() { return {{"c0", 0.9}, {"j0", 0.8}}; }

    DiscretisedSystem discretise(size_t npts = 20, const ParameterValues& values = defaultParameters()) const
    {
        Model parameterised = values.processModel(model);
        return uniformDiscretisation(unitGeometry(r), npts).processModel(parameterised);
    }
};

}  // namespace testutils

#endif // PDEKIT_TEST_UTILS_H
