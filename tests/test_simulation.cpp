#include <gtest/gtest.h>
#include <pdekit/simulation/Simulation.h>
#include <pdekit/utils/Errors.h>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include "test_utils.h"

using testutils::ParticleModel;

constexpr double PI = std::numbers::pi;

// ============================================================================
// Particle Diffusion Scenario
// ============================================================================

TEST(SimulationTest, ParticleDiffusionWithRK45) {
    ParticleModel particle;
    Simulation sim(particle.model, testutils::unitGeometry(particle.r), ParticleModel::defaultParameters());
    sim.setVarPts("r", 20);

    Solution solution = sim.solve(0.0, 1.0, 11);
    ASSERT_EQ(solution.t().size(), 11u);
    EXPECT_EQ(solution.t().front(), 0.0);
    EXPECT_EQ(solution.t().back(), 1.0);
    EXPECT_EQ(solution.solverName(), "RK45 (Dormand-Prince)");
    EXPECT_GT(solution.numSteps(), 100u);
    EXPECT_LT(solution.numSteps(), 5000u);

    // Concentration stays inside (0, 1)
    for (const std::vector<double>& y : solution.y()) {
        ASSERT_EQ(y.size(), 20u);
        for (double c : y) {
            EXPECT_TRUE(std::isfinite(c));
            EXPECT_GT(c, 0.0);
            EXPECT_LT(c, 1.0);
        }
    }

    // Lithium leaves through the surface only
    std::vector<double> cSurf = solution["Surface concentration"].series();
    std::vector<double> total = solution["Total lithium"].series();
    EXPECT_NEAR(total.front(), 4.0 * PI / 3.0 * 0.9, EXACT_TOL);
    for (size_t k = 1; k < solution.t().size(); ++k) {
        EXPECT_LT(cSurf[k], cSurf[k - 1]) << "t = " << solution.t()[k];
        EXPECT_LT(total[k], total[k - 1]) << "t = " << solution.t()[k];
    }

    // Reference values for this discretisation
    ProcessedVariable surface = solution["Surface concentration"];
    EXPECT_NEAR(surface(0.1), 0.7447, 1e-2);
    EXPECT_NEAR(surface(0.5), 0.2727, 1e-2);
    EXPECT_NEAR(total.back(), 0.098, 2e-2);
}

TEST(SimulationTest, ImplicitSolverAgreesWithRK45) {
    ParticleModel particle;
    Simulation sim(particle.model, testutils::unitGeometry(particle.r), ParticleModel::defaultParameters());
    sim.setVarPts("r", 10);

    Solution explicitSolution = sim.solve(0.0, 0.5, 6);

    ThetaMethodOptions thetaOptions;
    thetaOptions.dt = 1e-3;
    sim.setSolver(std::make_shared<ThetaMethodSolver>(ThetaMethodSolver::Scheme::CrankNicolson, SolverOptions{},
                                                      thetaOptions));
    EXPECT_TRUE(sim.isBuilt());   // a new solver keeps the discretised system
    Solution implicitSolution = sim.solve(0.0, 0.5, 6);
    EXPECT_EQ(implicitSolution.solverName(), "Crank-Nicolson");

    for (size_t k = 0; k < 6; ++k) {
        for (size_t i = 0; i < 10; ++i) {
            EXPECT_NEAR(implicitSolution.y()[k][i], explicitSolution.y()[k][i], SOLVER_TOL);
        }
    }
}

TEST(SimulationTest, StretchedMeshKeepsTotalLithium) {
    ParticleModel particle;
    Simulation sim(particle.model, testutils::unitGeometry(particle.r), ParticleModel::defaultParameters());
    sim.setSubmeshType("particle", std::make_shared<Exponential1DSubMesh>(Exponential1DSubMesh::Cluster::Right));
    sim.setVarPts("r", 15);
    sim.build();

    const DiscretisedSystem& system = sim.discretisedSystem();
    EXPECT_EQ(system.size(), 15u);
    const SubMesh1D& mesh = system.mesh()["particle"];
    EXPECT_LT(mesh.dEdge(14), mesh.dEdge(0));

    Solution solution = sim.solve({0.0, 0.05, 0.1});
    EXPECT_NEAR(solution["Total lithium"](0.0), 4.0 * PI / 3.0 * 0.9, EXACT_TOL);
    EXPECT_LT(solution["Total lithium"](0.1), solution["Total lithium"](0.0));
}

// ============================================================================
// Configuration
// ============================================================================

TEST(SimulationTest, DefaultsToTwentyPointsPerCoordinate) {
    ParticleModel particle;
    Simulation sim(particle.model, testutils::unitGeometry(particle.r), ParticleModel::defaultParameters());
    EXPECT_EQ(sim.solver().name(), "RK45 (Dormand-Prince)");
    sim.build();
    EXPECT_EQ(sim.discretisedSystem().size(), Simulation::DEFAULT_POINTS);
}

TEST(SimulationTest, ChangingTheMeshDiscardsTheSystem) {
    ParticleModel particle;
    Simulation sim(particle.model, testutils::unitGeometry(particle.r), ParticleModel::defaultParameters());
    EXPECT_FALSE(sim.isBuilt());
    EXPECT_THROW(sim.discretisedSystem(), std::logic_error);

    sim.build();
    EXPECT_TRUE(sim.isBuilt());

    sim.setVarPts("r", 8);
    EXPECT_FALSE(sim.isBuilt());
    sim.build();
    EXPECT_EQ(sim.discretisedSystem().size(), 8u);

    sim.setSpatialMethod("particle", std::make_shared<FiniteVolume>());
    EXPECT_FALSE(sim.isBuilt());
}

TEST(SimulationTest, NullComponentsAreRejected) {
    ParticleModel particle;
    Simulation sim(particle.model, testutils::unitGeometry(particle.r), ParticleModel::defaultParameters());
    EXPECT_THROW(sim.setSolver(nullptr), SolverError);
    EXPECT_THROW(sim.setSubmeshType("particle", nullptr), GeometryError);
    EXPECT_THROW(sim.setSpatialMethod("particle", nullptr), DiscretisationError);
}

TEST(SimulationTest, SolverByName) {
    ParticleModel particle;
    Simulation sim(particle.model, testutils::unitGeometry(particle.r), ParticleModel::defaultParameters());
    sim.setSolver(createSolver("Implicit Euler"));
    EXPECT_EQ(sim.solver().name(), "Implicit Euler");
    EXPECT_THROW(sim.setSolver(createSolver("explicit-euler")), SolverError);
}

// ============================================================================
// Failures
// ============================================================================

TEST(SimulationTest, InvertedGeometryIsGeometryError) {
    ParticleModel particle;
    Simulation sim(particle.model, testutils::unitGeometry(particle.r, 1.0, 0.0), ParticleModel::defaultParameters());
    EXPECT_THROW(sim.solve(0.0, 1.0), GeometryError);
    EXPECT_FALSE(sim.isBuilt());
}

TEST(SimulationTest, MissingInitialConditionIsModelError) {
    auto c = makeVariable("c", "particle");
    auto r = makeSpatialVariable("r", "particle", CoordinateSystem::SphericalPolar);
    Model model;
    model.setRhs(c, div(grad(c)));
    model.setBoundaryConditions(c, {{Side::Left, {makeScalar(0.0), BoundaryConditionType::Neumann}},
                                    {Side::Right, {makeScalar(-1.0), BoundaryConditionType::Neumann}}});

    Simulation sim(model, testutils::unitGeometry(r));
    EXPECT_THROW(sim.build(), ModelError);
}

TEST(SimulationTest, MissingParameterIsModelError) {
    ParticleModel particle;
    Simulation sim(particle.model, testutils::unitGeometry(particle.r), ParameterValues{{"c0", 0.9}});
    EXPECT_THROW(sim.solve(0.0, 1.0), ModelError);
}

TEST(SimulationTest, BadTimeGridIsSolverError) {
    ParticleModel particle;
    Simulation sim(particle.model, testutils::unitGeometry(particle.r), ParticleModel::defaultParameters());
    EXPECT_THROW(sim.solve(1.0, 0.0), SolverError);
    // The system was still built
    EXPECT_TRUE(sim.isBuilt());
}
