#include <gtest/gtest.h>
#include <pdekit/solvers/Solver.h>
#include <pdekit/utils/Errors.h>
#include <cmath>
#include "test_utils.h"

namespace
{
// Systems without spatial domains
DiscretisedSystem discretise0D(const Model& model)
{
    return Discretisation(Mesh(), {}).processModel(model);
}

// y' = -k y, y(0) = 1
DiscretisedSystem exponentialDecay(double k = 1.0)
{
    auto y = makeVariable("y");
    Model model("Decay");
    model.setRhs(y, -k * SymbolPtr(y));
    model.setInitialCondition(y, 1.0);
    return discretise0D(model);
}

// x' = -x, 0 = z - 2x  with an inconsistent z(0) = 0
DiscretisedSystem semiExplicitDAE()
{
    auto x = makeVariable("x");
    auto z = makeVariable("z");
    Model model("DAE");
    model.setRhs(x, -x);
    model.setAlgebraic(z, z - 2.0 * x);
    model.setInitialCondition(x, 1.0);
    model.setInitialCondition(z, 0.0);
    return discretise0D(model);
}
}

// ============================================================================
// RK45
// ============================================================================

TEST(RK45SolverTest, ExponentialDecay) {
    DiscretisedSystem system = exponentialDecay();
    RK45Solver solver;
    Solution solution = solver.solve(system, 0.0, 1.0, 11);

    ASSERT_EQ(solution.t().size(), 11u);
    EXPECT_EQ(solution.t().front(), 0.0);
    EXPECT_EQ(solution.t().back(), 1.0);
    for (size_t k = 0; k < solution.t().size(); ++k) {
        EXPECT_NEAR(solution.y()[k][0], std::exp(-solution.t()[k]), 1e-5);
    }
    EXPECT_GT(solution.numSteps(), 0u);
    EXPECT_EQ(solution.solverName(), "RK45 (Dormand-Prince)");
    EXPECT_EQ(solution.terminationReason(), "final time reached");
}

TEST(RK45SolverTest, TimeDependentRhs) {
    // y' = cos(t), y(0) = 0  ->  y = sin(t)
    auto y = makeVariable("y");
    Model model;
    model.setRhs(y, cos(makeTime()));
    model.setInitialCondition(y, 0.0);
    DiscretisedSystem system = discretise0D(model);

    Solution solution = RK45Solver().solve(system, {0.0, 0.5, 2.0, 3.0});
    for (size_t k = 0; k < 4; ++k) {
        EXPECT_NEAR(solution.y()[k][0], std::sin(solution.t()[k]), 1e-5);
    }
}

TEST(RK45SolverTest, TighterToleranceIsMoreAccurate) {
    DiscretisedSystem system = exponentialDecay(3.0);
    SolverOptions loose;
    loose.rtol = 1e-3;
    loose.atol = 1e-6;
    SolverOptions tight;
    tight.rtol = 1e-9;
    tight.atol = 1e-12;

    Solution a = RK45Solver(loose).solve(system, 0.0, 2.0, 2);
    Solution b = RK45Solver(tight).solve(system, 0.0, 2.0, 2);
    double exact = std::exp(-6.0);
    EXPECT_LT(std::abs(b.y().back()[0] - exact), 1e-9);
    EXPECT_GT(b.numSteps(), a.numSteps());
}

TEST(RK45SolverTest, MaxStepIsHonoured) {
    DiscretisedSystem system = exponentialDecay();
    SolverOptions options;
    options.maxStep = 0.01;
    Solution solution = RK45Solver(options).solve(system, 0.0, 1.0, 2);
    EXPECT_GE(solution.numSteps(), 100u);
}

TEST(RK45SolverTest, RejectsAlgebraicEquations) {
    DiscretisedSystem system = semiExplicitDAE();
    EXPECT_THROW(RK45Solver().solve(system, 0.0, 1.0), SolverError);
}

TEST(RK45SolverTest, StepBudgetExhaustedIsSolverError) {
    DiscretisedSystem system = exponentialDecay();
    SolverOptions options;
    options.maxSteps = 3;
    options.maxStep = 0.01;
    EXPECT_THROW(RK45Solver(options).solve(system, 0.0, 1.0), SolverError);
}

// ============================================================================
// Theta Method
// ============================================================================

TEST(ThetaMethodSolverTest, ImplicitEulerIsFirstOrder) {
    DiscretisedSystem system = exponentialDecay();
    ThetaMethodOptions coarse;
    coarse.dt = 0.01;
    ThetaMethodOptions fine;
    fine.dt = 0.005;

    ThetaMethodSolver a(ThetaMethodSolver::Scheme::Implicit, {}, coarse);
    ThetaMethodSolver b(ThetaMethodSolver::Scheme::Implicit, {}, fine);
    double errA = std::abs(a.solve(system, 0.0, 1.0, 2).y().back()[0] - std::exp(-1.0));
    double errB = std::abs(b.solve(system, 0.0, 1.0, 2).y().back()[0] - std::exp(-1.0));

    EXPECT_LT(errA, 5e-3);
    EXPECT_NEAR(errA / errB, 2.0, 0.1);
    EXPECT_EQ(a.name(), "Implicit Euler");
    EXPECT_EQ(a.theta(), 1.0);
}

TEST(ThetaMethodSolverTest, CrankNicolsonIsSecondOrder) {
    DiscretisedSystem system = exponentialDecay();
    ThetaMethodOptions coarse;
    coarse.dt = 0.02;
    ThetaMethodOptions fine;
    fine.dt = 0.01;
    SolverOptions options;
    options.rtol = 1e-10;
    options.atol = 1e-12;

    ThetaMethodSolver a(ThetaMethodSolver::Scheme::CrankNicolson, options, coarse);
    ThetaMethodSolver b(ThetaMethodSolver::Scheme::CrankNicolson, options, fine);
    double errA = std::abs(a.solve(system, 0.0, 1.0, 2).y().back()[0] - std::exp(-1.0));
    double errB = std::abs(b.solve(system, 0.0, 1.0, 2).y().back()[0] - std::exp(-1.0));

    EXPECT_LT(errA, 1e-4);
    EXPECT_NEAR(errA / errB, 4.0, 0.2);
    EXPECT_EQ(a.name(), "Crank-Nicolson");
    EXPECT_EQ(a.theta(), 0.5);
}

TEST(ThetaMethodSolverTest, SolvesSemiExplicitDAE) {
    DiscretisedSystem system = semiExplicitDAE();
    ThetaMethodOptions thetaOptions;
    thetaOptions.dt = 1e-3;
    ThetaMethodSolver solver(ThetaMethodSolver::Scheme::CrankNicolson, {}, thetaOptions);

    Solution solution = solver.solve(system, 0.0, 1.0, 5);

    // Algebraic variable made consistent at t0
    EXPECT_NEAR(solution.y().front()[1], 2.0, 1e-8);
    for (size_t k = 0; k < solution.t().size(); ++k) {
        double x = solution.y()[k][0];
        double z = solution.y()[k][1];
        EXPECT_NEAR(x, std::exp(-solution.t()[k]), 1e-5);
        EXPECT_NEAR(z, 2.0 * x, 1e-7);
    }
    EXPECT_GT(solution.stats().newtonIterations, 0u);
}

TEST(ThetaMethodSolverTest, InconsistentStateWithoutCorrectionIsSolverError) {
    DiscretisedSystem system = semiExplicitDAE();
    ThetaMethodOptions thetaOptions;
    thetaOptions.computeConsistentState = false;
    ThetaMethodSolver solver(ThetaMethodSolver::Scheme::Implicit, {}, thetaOptions);
    EXPECT_THROW(solver.solve(system, 0.0, 1.0), SolverError);
}

TEST(ThetaMethodSolverTest, NewtonFailureIsSolverError) {
    // y' = -y^2 needs more than one Newton iteration per step
    auto y = makeVariable("y");
    Model model;
    model.setRhs(y, -(y * y));
    model.setInitialCondition(y, 1.0);
    DiscretisedSystem system = discretise0D(model);

    ThetaMethodOptions thetaOptions;
    thetaOptions.dt = 0.1;
    thetaOptions.maxNewtonIterations = 1;
    ThetaMethodSolver solver(ThetaMethodSolver::Scheme::Implicit, {}, thetaOptions);
    EXPECT_THROW(solver.solve(system, 0.0, 1.0), SolverError);
}

TEST(ThetaMethodSolverTest, LandsOnSampleTimes) {
    DiscretisedSystem system = exponentialDecay();
    ThetaMethodOptions thetaOptions;
    thetaOptions.dt = 0.3;
    ThetaMethodSolver solver(ThetaMethodSolver::Scheme::Implicit, {}, thetaOptions);

    std::vector<double> tEval = {0.0, 0.25, 1.0};
    Solution solution = solver.solve(system, tEval);
    EXPECT_EQ(solution.t(), tEval);
    // 0 -> 0.25 in one step, 0.25 -> 1.0 in three
    EXPECT_EQ(solution.numSteps(), 4u);
}

// ============================================================================
// Validation and Factory
// ============================================================================

TEST(SolverTest, InvalidTimeGridIsSolverError) {
    DiscretisedSystem system = exponentialDecay();
    RK45Solver solver;
    EXPECT_THROW(solver.solve(system, 1.0, 0.0), SolverError);
    EXPECT_THROW(solver.solve(system, 0.0, 0.0), SolverError);
    EXPECT_THROW(solver.solve(system, 0.0, 1.0, 1), SolverError);
    EXPECT_THROW(solver.solve(system, std::vector<double>{0.0}), SolverError);
    EXPECT_THROW(solver.solve(system, std::vector<double>{0.0, 0.5, 0.5}), SolverError);
    EXPECT_THROW(solver.solve(system, std::vector<double>{0.0, NAN}), SolverError);
}

TEST(SolverTest, NonFiniteInitialStateIsSolverError) {
    auto y = makeVariable("y");
    Model model;
    model.setRhs(y, -y);
    model.setInitialCondition(y, NAN);
    DiscretisedSystem system = discretise0D(model);
    EXPECT_THROW(RK45Solver().solve(system, 0.0, 1.0), SolverError);
}

TEST(SolverTest, InvalidOptionsAreSolverError) {
    SolverOptions badTolerance;
    badTolerance.rtol = 0.0;
    EXPECT_THROW(RK45Solver{badTolerance}, SolverError);

    SolverOptions noSteps;
    noSteps.maxSteps = 0;
    EXPECT_THROW(RK45Solver{noSteps}, SolverError);

    ThetaMethodOptions badStep;
    badStep.dt = -1.0;
    EXPECT_THROW((ThetaMethodSolver{ThetaMethodSolver::Scheme::Implicit, {}, badStep}), SolverError);
}

TEST(SolverTest, FactoryAcceptsCommonSpellings) {
    EXPECT_EQ(createSolver("RK45")->name(), "RK45 (Dormand-Prince)");
    EXPECT_EQ(createSolver("dormand_prince")->name(), "RK45 (Dormand-Prince)");
    EXPECT_EQ(createSolver("Implicit Euler")->name(), "Implicit Euler");
    EXPECT_EQ(createSolver("backward-euler")->name(), "Implicit Euler");
    EXPECT_EQ(createSolver("crank_nicolson")->name(), "Crank-Nicolson");
    EXPECT_THROW(createSolver("euler"), SolverError);

    SolverOptions options;
    options.rtol = 1e-4;
    EXPECT_EQ(createSolver("rk45", options)->options().rtol, 1e-4);
    EXPECT_EQ(availableSolvers().size(), 3u);
}

TEST(SolverTest, CloneKeepsConfiguration) {
    ThetaMethodOptions thetaOptions;
    thetaOptions.dt = 0.05;
    ThetaMethodSolver original(ThetaMethodSolver::Scheme::CrankNicolson, {}, thetaOptions);
    std::unique_ptr<BaseSolver> copy(original.clone());
    EXPECT_EQ(copy->name(), "Crank-Nicolson");
    EXPECT_EQ(static_cast<ThetaMethodSolver&>(*copy).thetaOptions().dt, 0.05);
}
