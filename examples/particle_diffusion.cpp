#include <pdekit/expression/SymbolOperators.h>
#include <pdekit/model/Model.h>
#include <pdekit/model/ParameterValues.h>
#include <pdekit/simulation/Simulation.h>
#include <pdekit/utils/Errors.h>

#include <iomanip>
#include <iostream>
#include <vector>

// Fickian diffusion in a spherical particle, lithium leaving through the surface
int main()
{
    // dc/dt = -div(N), N = -grad(c)
    // N(r=0) = 0, N(r=1) = j = j0 * (1 - c_s)^(1/2) * c_s^(1/2)
    auto c = makeVariable("Concentration", "particle");
    auto r = makeSpatialVariable("r", "particle", CoordinateSystem::SphericalPolar);
    auto c0 = makeParameter("c0");
    auto j0 = makeParameter("j0");

    SymbolPtr cSurf = surf(c);
    SymbolPtr j = j0 * sqrt(1.0 - cSurf) * sqrt(cSurf);

    Model model("Particle diffusion");
    auto N = -grad(c);
    model.setRhs(c, -div(N));
    model.setBoundaryConditions(c, {{Side::Left, {makeScalar(0.0), BoundaryConditionType::Neumann}},
                                    {Side::Right, {-j, BoundaryConditionType::Neumann}}});
    model.setInitialCondition(c, c0);
    model.addVariable("Surface concentration", cSurf);
    model.addVariable("Surface flux", j);
    model.addVariable("Total lithium", integral(c, r));
    model.addVariable("Flux", N);

    Geometry geometry;
    geometry.add("particle", r, 0.0, 1.0);

    ParameterValues parameterValues{{"c0", 0.9}, {"j0", 0.8}};

    Simulation sim(model, geometry, parameterValues);
    sim.setVarPts("r", 20);

    try {
        Solution solution = sim.solve(0.0, 1.0, 11);
        std::cout << "Solver: " << solution.solverName() << " (" << solution.numSteps() << " steps, "
                  << solution.stats().rejectedSteps << " rejected)" << std::endl;

        ProcessedVariable surface = solution["Surface concentration"];
        ProcessedVariable flux = solution["Surface flux"];
        ProcessedVariable total = solution["Total lithium"];
        std::cout << std::fixed << std::setprecision(6);
        std::cout << "\n       t   surface c       flux      total" << std::endl;
        for (size_t k = 0; k < surface.times().size(); ++k) {
            std::cout << std::setw(8) << surface.times()[k] << "  " << surface.entries()[k][0] << "  "
                      << flux.entries()[k][0] << "  " << total.entries()[k][0] << std::endl;
        }

        ProcessedVariable concentration = solution["Concentration"];
        std::cout << "\nConcentration at t=0.5, r=0.5: " << concentration(0.5, 0.5) << std::endl;
    } catch (const PdeKitError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
