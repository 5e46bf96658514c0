#include <pdekit/solvers/Solver.h>
#include <pdekit/utils/Errors.h>
#include <pdekit/utils/LinearAlgebra.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <utility>

namespace
{
constexpr double EPS = std::numeric_limits<double>::epsilon();

double rmsNorm(const std::vector<double>& v)
{
    if (v.empty()) return 0.0;
    double sum = 0.0;
    for (double x : v) sum += x * x;
    return std::sqrt(sum / static_cast<double>(v.size()));
}
}

// ============================================================================
// BaseSolver
// ============================================================================

BaseSolver::BaseSolver(SolverOptions options) : _options(options)
{
    if (!(_options.rtol > 0.0) || !(_options.atol > 0.0)) {
        throw SolverError("tolerances must be positive (rtol = " + std::to_string(_options.rtol)
                          + ", atol = " + std::to_string(_options.atol) + ")");
    }
    if (_options.maxSteps == 0) {
        throw SolverError("maxSteps must be at least 1");
    }
    if (_options.initialStep < 0.0 || _options.maxStep < 0.0) {
        throw SolverError("initialStep and maxStep cannot be negative");
    }
}

Solution BaseSolver::solve(const DiscretisedSystem& system, double t0, double t1, size_t numSamples) const
{
    if (numSamples < 2) {
        throw SolverError("need at least 2 sample times, got " + std::to_string(numSamples));
    }
    if (!std::isfinite(t0) || !std::isfinite(t1) || !(t1 > t0)) {
        throw SolverError("invalid time interval [" + std::to_string(t0) + ", " + std::to_string(t1) + "]");
    }
    std::vector<double> tEval(numSamples);
    double dt = (t1 - t0) / static_cast<double>(numSamples - 1);
    for (size_t k = 0; k < numSamples; ++k) {
        tEval[k] = t0 + static_cast<double>(k) * dt;
    }
    tEval.back() = t1;
    return solve(system, tEval);
}

Solution BaseSolver::solve(const DiscretisedSystem& system, const std::vector<double>& tEval) const
{
    if (tEval.size() < 2) {
        throw SolverError("need at least 2 sample times, got " + std::to_string(tEval.size()));
    }
    for (size_t k = 0; k < tEval.size(); ++k) {
        if (!std::isfinite(tEval[k])) {
            throw SolverError("sample time " + std::to_string(k) + " is not finite");
        }
        if (k > 0 && !(tEval[k] > tEval[k - 1])) {
            throw SolverError("sample times must be strictly increasing");
        }
    }
    if (system.size() == 0) {
        throw SolverError("the system has no state variables");
    }
    checkFinite(system.initialState(), tEval.front(), name());

    if (_options.verbose) {
        std::cout << name() << ": integrating " << system.size() << " states from t = " << tEval.front()
                  << " to t = " << tEval.back() << std::endl;
    }

    SolverStats stats;
    std::vector<std::vector<double>> states = integrate(system, tEval, stats);

    if (_options.verbose) {
        std::cout << name() << ": done, " << stats.steps << " steps (" << stats.rejectedSteps << " rejected), "
                  << stats.rhsEvaluations << " function evaluations" << std::endl;
    }

    return Solution(std::make_shared<const DiscretisedSystem>(system), tEval, std::move(states), name(), stats,
                    "final time reached");
}

void BaseSolver::checkStepBudget(const SolverStats& stats, double t) const
{
    if (stats.steps + stats.rejectedSteps >= _options.maxSteps) {
        throw SolverError(name() + ": maximum number of steps (" + std::to_string(_options.maxSteps)
                          + ") reached at t = " + std::to_string(t));
    }
}

void BaseSolver::checkFinite(const std::vector<double>& y, double t, const std::string& solverName)
{
    for (size_t i = 0; i < y.size(); ++i) {
        if (!std::isfinite(y[i])) {
            throw SolverError(solverName + ": state entry " + std::to_string(i) + " is not finite at t = "
                              + std::to_string(t));
        }
    }
}

// ============================================================================
// RK45Solver (Dormand-Prince)
// ============================================================================

namespace
{
// Butcher tableau
constexpr double C2 = 1.0 / 5.0, C3 = 3.0 / 10.0, C4 = 4.0 / 5.0, C5 = 8.0 / 9.0;

constexpr double A21 = 1.0 / 5.0;
constexpr double A31 = 3.0 / 40.0, A32 = 9.0 / 40.0;
constexpr double A41 = 44.0 / 45.0, A42 = -56.0 / 15.0, A43 = 32.0 / 9.0;
constexpr double A51 = 19372.0 / 6561.0, A52 = -25360.0 / 2187.0, A53 = 64448.0 / 6561.0, A54 = -212.0 / 729.0;
constexpr double A61 = 9017.0 / 3168.0, A62 = -355.0 / 33.0, A63 = 46732.0 / 5247.0, A64 = 49.0 / 176.0,
                 A65 = -5103.0 / 18656.0;
// 5th order weights (also the 7th stage row)
constexpr double B1 = 35.0 / 384.0, B3 = 500.0 / 1113.0, B4 = 125.0 / 192.0, B5 = -2187.0 / 6784.0,
                 B6 = 11.0 / 84.0;
// 5th minus embedded 4th order weights
constexpr double E1 = 71.0 / 57600.0, E3 = -71.0 / 16695.0, E4 = 71.0 / 1920.0, E5 = -17253.0 / 339200.0,
                 E6 = 22.0 / 525.0, E7 = -1.0 / 40.0;

constexpr double SAFETY = 0.9;
constexpr double MIN_FACTOR = 0.2;
constexpr double MAX_FACTOR = 5.0;

// y + h * sum_j a_j k_j
std::vector<double> stage(const std::vector<double>& y, double h,
                          std::initializer_list<std::pair<double, const std::vector<double>*>> terms)
{
    std::vector<double> out = y;
    for (const auto& [a, k] : terms) {
        MatrixOps::axpy(h * a, *k, out);
    }
    return out;
}
}

RK45Solver::RK45Solver(SolverOptions options) : BaseSolver(options)
{
}

RK45Solver* RK45Solver::clone() const
{
    return new RK45Solver(*this);
}

double RK45Solver::initialStepSize(const DiscretisedSystem& system, double t0, const std::vector<double>& y0,
                                   const std::vector<double>& f0, double span, SolverStats& stats) const
{
    if (_options.initialStep > 0.0) {
        return std::min(_options.initialStep, span);
    }

    // Hairer, Norsett & Wanner, Solving ODEs I, II.4
    size_t n = y0.size();
    std::vector<double> scaledY(n), scaledF(n);
    for (size_t i = 0; i < n; ++i) {
        double sc = _options.atol + _options.rtol * std::abs(y0[i]);
        scaledY[i] = y0[i] / sc;
        scaledF[i] = f0[i] / sc;
    }
    double d0 = rmsNorm(scaledY);
    double d1 = rmsNorm(scaledF);
    double h0 = (d0 < 1e-5 || d1 < 1e-5) ? 1e-6 : 0.01 * d0 / d1;
    h0 = std::min(h0, span);

    std::vector<double> y1 = y0;
    MatrixOps::axpy(h0, f0, y1);
    std::vector<double> f1 = system.rhs(t0 + h0, y1);
    ++stats.rhsEvaluations;

    std::vector<double> scaledDiff(n);
    for (size_t i = 0; i < n; ++i) {
        double sc = _options.atol + _options.rtol * std::abs(y0[i]);
        scaledDiff[i] = (f1[i] - f0[i]) / sc;
    }
    double d2 = rmsNorm(scaledDiff) / h0;

    double dMax = std::max(d1, d2);
    double h1 = dMax <= 1e-15 ? std::max(1e-6, h0 * 1e-3) : std::pow(0.01 / dMax, 1.0 / 5.0);
    return std::min({100.0 * h0, h1, span});
}

std::vector<std::vector<double>> RK45Solver::integrate(const DiscretisedSystem& system,
                                                       const std::vector<double>& tEval, SolverStats& stats) const
{
    if (system.hasAlgebraic()) {
        throw SolverError(name() + " cannot solve systems with algebraic equations; use an implicit solver");
    }

    double t = tEval.front();
    std::vector<double> y = system.initialState();
    std::vector<double> f = system.rhs(t, y);
    ++stats.rhsEvaluations;
    checkFinite(f, t, name());

    std::vector<std::vector<double>> states;
    states.reserve(tEval.size());
    states.push_back(y);

    double h = initialStepSize(system, t, y, f, tEval.back() - t, stats);
    if (_options.maxStep > 0.0) h = std::min(h, _options.maxStep);

    size_t n = y.size();
    std::vector<double> err(n);

    for (size_t k = 1; k < tEval.size(); ++k) {
        double target = tEval[k];
        while (t < target) {
            checkStepBudget(stats, t);

            double remaining = target - t;
            double hStep = h;
            if (_options.maxStep > 0.0) hStep = std::min(hStep, _options.maxStep);
            bool hitsTarget = hStep >= remaining - 16.0 * EPS * std::max(std::abs(target), 1.0);
            if (hitsTarget) hStep = remaining;
            bool clipped = hStep < h;

            if (!hitsTarget && hStep <= 16.0 * EPS * std::max(std::abs(t), 1.0)) {
                throw SolverError(name() + ": step size underflow at t = " + std::to_string(t)
                                  + " (h = " + std::to_string(hStep) + ")");
            }

            const std::vector<double>& k1 = f;
            std::vector<double> k2 = system.rhs(t + C2 * hStep, stage(y, hStep, {{A21, &k1}}));
            std::vector<double> k3 = system.rhs(t + C3 * hStep, stage(y, hStep, {{A31, &k1}, {A32, &k2}}));
            std::vector<double> k4 = system.rhs(t + C4 * hStep, stage(y, hStep, {{A41, &k1}, {A42, &k2}, {A43, &k3}}));
            std::vector<double> k5 = system.rhs(t + C5 * hStep,
                                                stage(y, hStep, {{A51, &k1}, {A52, &k2}, {A53, &k3}, {A54, &k4}}));
            std::vector<double> k6 = system.rhs(t + hStep,
                                                stage(y, hStep, {{A61, &k1}, {A62, &k2}, {A63, &k3}, {A64, &k4}, {A65, &k5}}));
            std::vector<double> yNew = stage(y, hStep, {{B1, &k1}, {B3, &k3}, {B4, &k4}, {B5, &k5}, {B6, &k6}});
            double tNew = hitsTarget ? target : t + hStep;
            std::vector<double> k7 = system.rhs(tNew, yNew);
            stats.rhsEvaluations += 6;

            // Local error, scaled per component
            for (size_t i = 0; i < n; ++i) {
                double e = hStep * (E1 * k1[i] + E3 * k3[i] + E4 * k4[i] + E5 * k5[i] + E6 * k6[i] + E7 * k7[i]);
                double sc = _options.atol + _options.rtol * std::max(std::abs(y[i]), std::abs(yNew[i]));
                err[i] = e / sc;
            }
            double errNorm = rmsNorm(err);

            if (!std::isfinite(errNorm)) {
                ++stats.rejectedSteps;
                h = 0.25 * hStep;
                continue;
            }

            if (errNorm <= 1.0) {
                t = tNew;
                y = std::move(yNew);
                f = std::move(k7);
                ++stats.steps;

                double factor = errNorm == 0.0 ? MAX_FACTOR
                                               : std::clamp(SAFETY * std::pow(errNorm, -0.2), MIN_FACTOR, MAX_FACTOR);
                // A step shortened to hit a sample time keeps the previous proposal
                if (!(clipped && factor >= 1.0)) {
                    h = hStep * factor;
                }
                if (_options.maxStep > 0.0) h = std::min(h, _options.maxStep);
            } else {
                ++stats.rejectedSteps;
                h = hStep * std::max(MIN_FACTOR, SAFETY * std::pow(errNorm, -0.2));
            }
        }

        checkFinite(y, t, name());
        states.push_back(y);
        if (_options.verbose) {
            std::cout << name() << ": t = " << t << " (" << stats.steps << " steps)" << std::endl;
        }
    }
    return states;
}

// ============================================================================
// ThetaMethodSolver
// ============================================================================

namespace
{
double schemeTheta(ThetaMethodSolver::Scheme scheme)
{
    switch (scheme) {
        case ThetaMethodSolver::Scheme::Implicit:
            return 1.0;
        case ThetaMethodSolver::Scheme::CrankNicolson:
            return 0.5;
    }
    return 1.0;
}

// Forward difference column j: (R(y + h e_j) - R(y)) / h
template <typename Residual>
Matrix finiteDifferenceJacobian(const Residual& residual, const std::vector<double>& y,
                                const std::vector<double>& r0, const std::vector<size_t>& columns)
{
    Matrix J = MatrixOps::zeros(r0.size(), columns.size());
    std::vector<double> yp = y;
    for (size_t c = 0; c < columns.size(); ++c) {
        size_t j = columns[c];
        double h = std::sqrt(EPS) * std::max(1.0, std::abs(y[j]));
        yp[j] = y[j] + h;
        std::vector<double> rp = residual(yp);
        for (size_t i = 0; i < r0.size(); ++i) {
            J[i][c] = (rp[i] - r0[i]) / h;
        }
        yp[j] = y[j];
    }
    return J;
}

std::vector<double> newtonUpdate(const Matrix& J, const std::vector<double>& r, const std::string& solverName,
                                 double t)
{
    std::vector<double> minusR(r.size());
    for (size_t i = 0; i < r.size(); ++i) minusR[i] = -r[i];
    try {
        return QR::solve(QR::decompose(J), minusR);
    } catch (const std::runtime_error& e) {
        throw SolverError(solverName + ": singular Jacobian at t = " + std::to_string(t) + " (" + e.what() + ")");
    }
}
}

ThetaMethodSolver::ThetaMethodSolver(Scheme scheme, SolverOptions options, ThetaMethodOptions thetaOptions)
    : BaseSolver(options), _scheme(scheme), _theta(schemeTheta(scheme)), _thetaOptions(thetaOptions)
{
    if (!(_thetaOptions.dt > 0.0)) {
        throw SolverError("time step dt must be positive");
    }
    if (_thetaOptions.maxNewtonIterations == 0) {
        throw SolverError("maxNewtonIterations must be at least 1");
    }
}

std::string ThetaMethodSolver::name() const
{
    return _scheme == Scheme::Implicit ? "Implicit Euler" : "Crank-Nicolson";
}

ThetaMethodSolver* ThetaMethodSolver::clone() const
{
    return new ThetaMethodSolver(*this);
}

void ThetaMethodSolver::makeConsistent(const DiscretisedSystem& system, double t0, std::vector<double>& y,
                                       SolverStats& stats) const
{
    std::vector<size_t> algebraicColumns;
    for (size_t i = system.numDifferential(); i < system.size(); ++i) {
        algebraicColumns.push_back(i);
    }

    auto residual = [&](const std::vector<double>& yTrial) {
        ++stats.rhsEvaluations;
        return system.algebraic(t0, yTrial);
    };

    std::vector<double> r = residual(y);
    if (_thetaOptions.computeConsistentState) {
        for (size_t iter = 0; iter < _thetaOptions.maxNewtonIterations; ++iter) {
            if (MatrixOps::normInf(r) <= _thetaOptions.algebraicTol) break;
            Matrix J = finiteDifferenceJacobian(residual, y, r, algebraicColumns);
            std::vector<double> delta = newtonUpdate(J, r, name(), t0);
            for (size_t c = 0; c < algebraicColumns.size(); ++c) {
                y[algebraicColumns[c]] += delta[c];
            }
            ++stats.newtonIterations;
            r = residual(y);
        }
    }

    double residualNorm = MatrixOps::normInf(r);
    if (!(residualNorm <= _thetaOptions.algebraicTol)) {
        throw SolverError(name() + ": initial state is inconsistent, algebraic residual "
                          + std::to_string(residualNorm) + " exceeds " + std::to_string(_thetaOptions.algebraicTol));
    }
}

std::vector<double> ThetaMethodSolver::timeStep(const DiscretisedSystem& system, const std::vector<double>& yOld,
                                                double tOld, double tNew, SolverStats& stats) const
{
    size_t n = yOld.size();
    size_t nd = system.numDifferential();
    double dt = tNew - tOld;

    // Explicit part, fixed during the Newton iterations
    std::vector<double> explicitPart(nd, 0.0);
    if (_theta < 1.0) {
        std::vector<double> fOld = system.rhs(tOld, yOld);
        ++stats.rhsEvaluations;
        for (size_t i = 0; i < nd; ++i) {
            explicitPart[i] = dt * (1.0 - _theta) * fOld[i];
        }
    }

    auto residual = [&](const std::vector<double>& y) {
        std::vector<double> F = system.evaluate(tNew, y);
        ++stats.rhsEvaluations;
        std::vector<double> r(n);
        for (size_t i = 0; i < nd; ++i) {
            r[i] = y[i] - yOld[i] - dt * _theta * F[i] - explicitPart[i];
        }
        for (size_t i = nd; i < n; ++i) {
            r[i] = F[i];
        }
        return r;
    };

    std::vector<size_t> columns(n);
    for (size_t j = 0; j < n; ++j) columns[j] = j;

    std::vector<double> y = yOld;
    for (size_t iter = 0; iter < _thetaOptions.maxNewtonIterations; ++iter) {
        std::vector<double> r = residual(y);
        Matrix J = finiteDifferenceJacobian(residual, y, r, columns);
        std::vector<double> delta = newtonUpdate(J, r, name(), tNew);
        MatrixOps::axpy(1.0, delta, y);
        ++stats.newtonIterations;
        checkFinite(y, tNew, name());

        if (MatrixOps::normInf(delta) <= _options.atol + _options.rtol * MatrixOps::normInf(y)) {
            return y;
        }
    }
    throw SolverError(name() + ": Newton iterations did not converge at t = " + std::to_string(tNew) + " after "
                      + std::to_string(_thetaOptions.maxNewtonIterations) + " iterations");
}

std::vector<std::vector<double>> ThetaMethodSolver::integrate(const DiscretisedSystem& system,
                                                              const std::vector<double>& tEval,
                                                              SolverStats& stats) const
{
    double t = tEval.front();
    std::vector<double> y = system.initialState();
    if (system.hasAlgebraic()) {
        makeConsistent(system, t, y, stats);
    }

    std::vector<std::vector<double>> states;
    states.reserve(tEval.size());
    states.push_back(y);

    for (size_t k = 1; k < tEval.size(); ++k) {
        double span = tEval[k] - tEval[k - 1];
        size_t substeps = std::max<size_t>(1, static_cast<size_t>(std::ceil(span / _thetaOptions.dt - 1e-9)));
        double dt = span / static_cast<double>(substeps);

        for (size_t s = 0; s < substeps; ++s) {
            checkStepBudget(stats, t);
            double tNew = (s + 1 == substeps) ? tEval[k] : tEval[k - 1] + static_cast<double>(s + 1) * dt;
            y = timeStep(system, y, t, tNew, stats);
            t = tNew;
            ++stats.steps;
        }

        states.push_back(y);
        if (_options.verbose) {
            std::cout << name() << ": t = " << t << " (" << stats.steps << " steps, " << stats.newtonIterations
                      << " Newton iterations)" << std::endl;
        }
    }
    return states;
}

// ============================================================================
// Factory
// ============================================================================

namespace
{
std::string canonicalSolverName(const std::string& value)
{
    std::string canonical;
    canonical.reserve(value.size());
    for (unsigned char c : value) {
        if (c == '_' || c == '-' || std::isspace(c)) {
            continue;
        }
        canonical.push_back(static_cast<char>(std::tolower(c)));
    }
    return canonical;
}
}

std::unique_ptr<BaseSolver> createSolver(const std::string& name, SolverOptions options)
{
    const std::string canonical = canonicalSolverName(name);

    if (canonical == "rk45" || canonical == "dormandprince") {
        return std::make_unique<RK45Solver>(options);
    }
    if (canonical == "impliciteuler" || canonical == "backwardeuler") {
        return std::make_unique<ThetaMethodSolver>(ThetaMethodSolver::Scheme::Implicit, options);
    }
    if (canonical == "cranknicolson") {
        return std::make_unique<ThetaMethodSolver>(ThetaMethodSolver::Scheme::CrankNicolson, options);
    }
    throw SolverError("unknown solver '" + name + "'");
}

std::vector<std::string> availableSolvers()
{
    return {"rk45", "implicit-euler", "crank-nicolson"};
}
