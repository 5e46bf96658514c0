#ifndef PDEKIT_SOLVER_H
#define PDEKIT_SOLVER_H

#include <pdekit/discretisation/Discretisation.h>
#include <pdekit/solvers/Solution.h>
#include <memory>
#include <string>
#include <vector>

/**
 * =============================================================================
 * TIME INTEGRATION
 * =============================================================================
 * Integrates the semi-discrete system
 *
 *   M dy/dt = F(t, y),   y(t0) = y0
 *
 * from the first to the last requested sample time, returning the state at
 * every sample. M is diagonal: 1 for differential entries, 0 for algebraic.
 */

struct SolverOptions
{
    double rtol = 1e-6;
    double atol = 1e-8;
    size_t maxSteps = 100000;   // accepted + rejected steps over the whole interval
    double initialStep = 0.0;   // 0: estimated from the initial state
    double maxStep = 0.0;       // 0: unbounded
    bool verbose = false;       // progress on std::cout
};

struct ThetaMethodOptions
{
    double dt = 1e-3;                   // fixed step, shortened to land on sample times
    size_t maxNewtonIterations = 20;
    double algebraicTol = 1e-8;         // residual allowed in the initial algebraic equations
    bool computeConsistentState = true; // Newton solve for algebraic variables at t0
};

/**
 * @class BaseSolver
 * @brief Validates the time grid and the initial state, then integrates
 *
 * Throws SolverError for an invalid time grid, a non-finite initial state,
 * exhaustion of the step budget, step size underflow or a non-finite state.
 */
class BaseSolver
{
public:
    explicit BaseSolver(SolverOptions options = {});
    virtual ~BaseSolver() = default;

    // numSamples equally spaced times in [t0, t1], both included
    Solution solve(const DiscretisedSystem& system, double t0, double t1, size_t numSamples = 100) const;

    // tEval strictly increasing, at least 2 entries
    Solution solve(const DiscretisedSystem& system, const std::vector<double>& tEval) const;

    virtual std::string name() const = 0;
    virtual BaseSolver* clone() const = 0;

    const SolverOptions& options() const { return _options; }

protected:
    SolverOptions _options;

    // States at every entry of tEval; states[0] is the (possibly corrected) initial state
    virtual std::vector<std::vector<double>> integrate(const DiscretisedSystem& system,
                                                       const std::vector<double>& tEval,
                                                       SolverStats& stats) const = 0;

    void checkStepBudget(const SolverStats& stats, double t) const;
    static void checkFinite(const std::vector<double>& y, double t, const std::string& solverName);
};

/**
 * @class RK45Solver
 * @brief Dormand-Prince 5(4) with adaptive step size
 *
 * Local error estimate from the embedded 4th order solution, measured as
 *   err = rms( e_i / (atol + rtol * max(|y_i|, |y_new_i|)) )
 * A step is accepted when err <= 1. The next step is
 *   h * clamp(0.9 * err^(-1/5), 0.2, 5)
 * Steps are clipped to land exactly on every sample time. First same as last:
 * the last stage of an accepted step is the first stage of the next.
 *
 * ODE systems only: algebraic equations are a SolverError.
 */
class RK45Solver : public BaseSolver
{
public:
    explicit RK45Solver(SolverOptions options = {});

    std::string name() const override { return "RK45 (Dormand-Prince)"; }
    RK45Solver* clone() const override;

protected:
    std::vector<std::vector<double>> integrate(const DiscretisedSystem& system, const std::vector<double>& tEval,
                                               SolverStats& stats) const override;

private:
    double initialStepSize(const DiscretisedSystem& system, double t0, const std::vector<double>& y0,
                           const std::vector<double>& f0, double span, SolverStats& stats) const;
};

/**
 * @class ThetaMethodSolver
 * @brief Fixed-step implicit θ-method for ODEs and semi-explicit DAEs
 *
 * Differential rows:  y^{n+1} - y^n = Δt [θ F(t^{n+1}, y^{n+1}) + (1-θ) F(t^n, y^n)]
 * Algebraic rows:     0 = F(t^{n+1}, y^{n+1})
 *
 * Each step solves the nonlinear system by Newton iterations with a
 * finite-difference Jacobian and a dense Householder QR solve.
 *   - θ = 1.0: implicit Euler (1st order, L-stable)
 *   - θ = 0.5: Crank-Nicolson (2nd order)
 */
class ThetaMethodSolver : public BaseSolver
{
public:
    enum class Scheme {
        Implicit,        // θ = 1.0
        CrankNicolson    // θ = 0.5
    };

    explicit ThetaMethodSolver(Scheme scheme = Scheme::Implicit, SolverOptions options = {},
                               ThetaMethodOptions thetaOptions = {});

    std::string name() const override;
    ThetaMethodSolver* clone() const override;

    double theta() const { return _theta; }
    Scheme scheme() const { return _scheme; }
    const ThetaMethodOptions& thetaOptions() const { return _thetaOptions; }

protected:
    std::vector<std::vector<double>> integrate(const DiscretisedSystem& system, const std::vector<double>& tEval,
                                               SolverStats& stats) const override;

private:
    Scheme _scheme;
    double _theta;
    ThetaMethodOptions _thetaOptions;

    // Solve the algebraic equations at t0 for the algebraic block of y
    void makeConsistent(const DiscretisedSystem& system, double t0, std::vector<double>& y, SolverStats& stats) const;

    std::vector<double> timeStep(const DiscretisedSystem& system, const std::vector<double>& yOld,
                                 double tOld, double tNew, SolverStats& stats) const;
};

// "rk45", "implicit-euler" or "crank-nicolson" (case, '-', '_' and spaces ignored)
std::unique_ptr<BaseSolver> createSolver(const std::string& name, SolverOptions options = {});
std::vector<std::string> availableSolvers();

#endif // PDEKIT_SOLVER_H
