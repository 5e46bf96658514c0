// bindings for solvers, solutions and the Simulation driver
#include "bindings_common.h"
#include <pdekit/simulation/Simulation.h>
#include <pdekit/solvers/Solution.h>
#include <pdekit/solvers/Solver.h>

void bind_solvers(py::module_ &m)
{
    py::class_<SolverOptions>(m, "SolverOptions")
        .def(py::init<>())
        .def_readwrite("rtol", &SolverOptions::rtol)
        .def_readwrite("atol", &SolverOptions::atol)
        .def_readwrite("max_steps", &SolverOptions::maxSteps)
        .def_readwrite("initial_step", &SolverOptions::initialStep)
        .def_readwrite("max_step", &SolverOptions::maxStep)
        .def_readwrite("verbose", &SolverOptions::verbose);

    py::class_<ThetaMethodOptions>(m, "ThetaMethodOptions")
        .def(py::init<>())
        .def_readwrite("dt", &ThetaMethodOptions::dt)
        .def_readwrite("max_newton_iterations", &ThetaMethodOptions::maxNewtonIterations)
        .def_readwrite("algebraic_tol", &ThetaMethodOptions::algebraicTol)
        .def_readwrite("compute_consistent_state", &ThetaMethodOptions::computeConsistentState);

    py::class_<SolverStats>(m, "SolverStats")
        .def_readonly("steps", &SolverStats::steps)
        .def_readonly("rejected_steps", &SolverStats::rejectedSteps)
        .def_readonly("rhs_evaluations", &SolverStats::rhsEvaluations)
        .def_readonly("newton_iterations", &SolverStats::newtonIterations);

    py::class_<BaseSolver, std::shared_ptr<BaseSolver>>(m, "BaseSolver")
        .def_property_readonly("name", &BaseSolver::name)
        .def_property_readonly("options", &BaseSolver::options);

    py::class_<RK45Solver, BaseSolver, std::shared_ptr<RK45Solver>>(m, "RK45Solver",
        "Adaptive Dormand-Prince 5(4), ODE systems only")
        .def(py::init<SolverOptions>(), py::arg("options") = SolverOptions{});

    py::enum_<ThetaMethodSolver::Scheme>(m, "ThetaScheme")
        .value("Implicit", ThetaMethodSolver::Scheme::Implicit)
        .value("CrankNicolson", ThetaMethodSolver::Scheme::CrankNicolson);

    py::class_<ThetaMethodSolver, BaseSolver, std::shared_ptr<ThetaMethodSolver>>(m, "ThetaMethodSolver",
        "Fixed-step implicit Euler / Crank-Nicolson, supports algebraic equations")
        .def(py::init<ThetaMethodSolver::Scheme, SolverOptions, ThetaMethodOptions>(),
             py::arg("scheme") = ThetaMethodSolver::Scheme::Implicit,
             py::arg("options") = SolverOptions{}, py::arg("theta_options") = ThetaMethodOptions{})
        .def_property_readonly("theta", &ThetaMethodSolver::theta);

    m.def("create_solver", [](const std::string& name, double rtol, double atol) {
        SolverOptions options;
        options.rtol = rtol;
        options.atol = atol;
        return std::shared_ptr<BaseSolver>(createSolver(name, options));
    }, py::arg("name"), py::arg("rtol") = 1e-6, py::arg("atol") = 1e-8);
    m.def("available_solvers", &availableSolvers);

    py::class_<ProcessedVariable>(m, "ProcessedVariable", "One output evaluated at every stored time")
        .def_property_readonly("name", &ProcessedVariable::name)
        .def_property_readonly("domain", &ProcessedVariable::domain)
        .def_property_readonly("times", &ProcessedVariable::times)
        .def_property_readonly("entries", &ProcessedVariable::entries)
        .def_property_readonly("coordinates", &ProcessedVariable::coordinates)
        .def_property_readonly("warnings", &ProcessedVariable::warnings)
        .def_property_readonly("is_scalar", &ProcessedVariable::isScalar)
        .def("series", &ProcessedVariable::series, py::arg("i") = 0)
        .def("__call__", py::overload_cast<double>(&ProcessedVariable::operator(), py::const_), py::arg("t"))
        .def("__call__", py::overload_cast<double, double>(&ProcessedVariable::operator(), py::const_),
             py::arg("t"), py::arg("x"));

    py::class_<Solution>(m, "Solution", "Sample times and states of an integration")
        .def_property_readonly("t", &Solution::t)
        .def_property_readonly("y", &Solution::y)
        .def_property_readonly("solver_name", &Solution::solverName)
        .def_property_readonly("stats", &Solution::stats)
        .def_property_readonly("termination_reason", &Solution::terminationReason)
        .def("__getitem__", &Solution::operator[], py::arg("name"))
        .def("output_names", [](const Solution& solution) {
            std::vector<std::string> names;
            for (const auto& [name, expression] : solution.system().outputs()) names.push_back(name);
            return names;
        });

    py::class_<Simulation>(m, "Simulation", "Model -> mesh -> discretisation -> solver")
        .def(py::init<Model, Geometry, ParameterValues>(),
             py::arg("model"), py::arg("geometry"), py::arg("parameter_values") = ParameterValues{})
        .def("set_submesh_type", [](Simulation& sim, const std::string& domain,
                                    std::shared_ptr<SubMeshGenerator> generator) {
            sim.setSubmeshType(domain, std::move(generator));
        }, py::arg("domain"), py::arg("generator"))
        .def("set_spatial_method", [](Simulation& sim, const std::string& domain,
                                      std::shared_ptr<SpatialMethod> method) {
            sim.setSpatialMethod(domain, std::move(method));
        }, py::arg("domain"), py::arg("method"))
        .def("set_var_pts", &Simulation::setVarPts, py::arg("coordinate"), py::arg("npts"))
        .def("set_solver", [](Simulation& sim, std::shared_ptr<BaseSolver> solver) {
            sim.setSolver(std::move(solver));
        }, py::arg("solver"))
        .def("set_solver", [](Simulation& sim, const std::string& name, double rtol, double atol) {
            SolverOptions options;
            options.rtol = rtol;
            options.atol = atol;
            sim.setSolver(std::shared_ptr<const BaseSolver>(createSolver(name, options)));
        }, py::arg("name"), py::arg("rtol") = 1e-6, py::arg("atol") = 1e-8)
        .def("build", &Simulation::build)
        .def_property_readonly("is_built", &Simulation::isBuilt)
        .def("solve", py::overload_cast<double, double, size_t>(&Simulation::solve),
             py::arg("t0"), py::arg("t1"), py::arg("num_samples") = 100)
        .def("solve", py::overload_cast<const std::vector<double>&>(&Simulation::solve), py::arg("t_eval"));
}
