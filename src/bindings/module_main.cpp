// pybind11 module entry point
#include "bindings_common.h"

PYBIND11_MODULE(_core, m)
{
    m.doc() = R"pbdoc(
        PDEKit Python Bindings
        ----------------------

        Python interface to the PDEKit model -> mesh -> discretisation -> solver pipeline.
        Provides access to:
        - Symbolic expressions (variables, parameters, grad, div, surf, integral)
        - Models with boundary and initial conditions
        - Geometry and 1D submesh generators
        - Finite volume discretisation
        - RK45 and implicit time integrators, solutions and processed variables

        Example:
            import pdekit as pk

            c = pk.Variable("Concentration", domain="particle")
            r = pk.SpatialVariable("r", "particle", pk.CoordinateSystem.SphericalPolar)
            model = pk.Model("Particle diffusion")
            model.set_rhs(c, -pk.div(-pk.grad(c)))
            model.set_boundary_conditions(c, {"left": (0.0, "Neumann"),
                                              "right": (-pk.Parameter("j0"), "Neumann")})
            model.set_initial_condition(c, pk.Parameter("c0"))
            model.add_variable("Surface concentration", pk.surf(c))

            geometry = pk.Geometry()
            geometry.add("particle", r, 0.0, 1.0)

            sim = pk.Simulation(model, geometry, pk.ParameterValues({"c0": 0.9, "j0": 0.8}))
            solution = sim.solve(0.0, 1.0)
            solution["Surface concentration"].entries
    )pbdoc";

    bind_errors(m);
    bind_expression(m);
    bind_model(m);
    bind_mesh(m);
    bind_solvers(m);

    m.attr("__version__") = "0.1.0";
}
