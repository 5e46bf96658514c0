#include <gtest/gtest.h>
#include <pdekit/discretisation/SpatialMethod.h>
#include <pdekit/expression/SymbolOperators.h>
#include <pdekit/utils/Errors.h>
#include <cmath>
#include <numbers>
#include "test_utils.h"

namespace
{
// Cell values f(x_i) as a state slice, evaluated against y = f(nodes)
struct Field
{
    SymbolPtr symbol;
    std::vector<double> y;
};

template <typename F>
Field sampled(const SubMesh1D& mesh, F f)
{
    Field field;
    for (double x : mesh.nodes()) field.y.push_back(f(x));
    field.symbol = std::make_shared<StateVector>(0, mesh.npts(), "u", "rod");
    return field;
}

BoundaryConditionSet conditions(double left, BoundaryConditionType leftType, double right,
                                BoundaryConditionType rightType)
{
    return {{Side::Left, {makeScalar(left), leftType}}, {Side::Right, {makeScalar(right), rightType}}};
}
}

// ============================================================================
// Assembled Operators
// ============================================================================

TEST(FiniteVolumeTest, GradientMatrixInteriorStencil) {
    SubMesh1D mesh = testutils::uniformSubMesh(5);
    SparseMatrix G = FiniteVolume::gradientMatrix(mesh);

    ASSERT_EQ(G.rows(), 6u);
    ASSERT_EQ(G.cols(), 5u);
    EXPECT_EQ(G.nonZeros(), 8u);
    for (size_t k = 1; k < 5; ++k) {
        EXPECT_NEAR(G.coeff(k, k - 1), -5.0, EXACT_TOL);
        EXPECT_NEAR(G.coeff(k, k), 5.0, EXACT_TOL);
    }
    // Boundary rows are filled in by the boundary conditions
    EXPECT_EQ(G.coeff(0, 0), 0.0);
    EXPECT_EQ(G.coeff(5, 4), 0.0);
}

TEST(FiniteVolumeTest, DivergenceMatrixUsesAreasAndVolumes) {
    SubMesh1D mesh = testutils::uniformSubMesh(4, CoordinateSystem::SphericalPolar);
    SparseMatrix D = FiniteVolume::divergenceMatrix(mesh);
    std::vector<double> volumes = mesh.cellVolumes();
    std::vector<double> areas = mesh.faceAreas();

    ASSERT_EQ(D.rows(), 4u);
    ASSERT_EQ(D.cols(), 5u);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_NEAR(D.coeff(i, i), -areas[i] / volumes[i], EXACT_TOL);
        EXPECT_NEAR(D.coeff(i, i + 1), areas[i + 1] / volumes[i], EXACT_TOL);
    }
}

// ============================================================================
// Gradient
// ============================================================================

TEST(FiniteVolumeTest, GradientOfLinearFieldIsExactInside) {
    SubMesh1D mesh = testutils::uniformSubMesh(8);
    Field u = sampled(mesh, [](double x) { return 3.0 * x - 1.0; });

    FiniteVolume fv;
    std::vector<double> g = fv.gradient(u.symbol, "rod", mesh, nullptr)->evaluate(0.0, u.y);
    ASSERT_EQ(g.size(), 9u);
    EXPECT_EQ(g.front(), 0.0);   // no conditions: no flux
    EXPECT_EQ(g.back(), 0.0);
    for (size_t k = 1; k < 8; ++k) {
        EXPECT_NEAR(g[k], 3.0, 1e-10);
    }
}

TEST(FiniteVolumeTest, NeumannSetsBoundaryEdges) {
    SubMesh1D mesh = testutils::uniformSubMesh(6);
    Field u = sampled(mesh, [](double x) { return x * x; });
    BoundaryConditionSet bcs = conditions(0.25, BoundaryConditionType::Neumann, -0.8, BoundaryConditionType::Neumann);

    FiniteVolume fv;
    std::vector<double> g = fv.gradient(u.symbol, "rod", mesh, &bcs)->evaluate(0.0, u.y);
    ASSERT_EQ(g.size(), 7u);
    EXPECT_NEAR(g.front(), 0.25, EXACT_TOL);
    EXPECT_NEAR(g.back(), -0.8, EXACT_TOL);
}

TEST(FiniteVolumeTest, DirichletConsistentWithLinearField) {
    // u = 2x + 1 with u(0) = 1 and u(1) = 3 imposed: gradient is 2 on every edge
    SubMesh1D mesh = testutils::uniformSubMesh(5);
    Field u = sampled(mesh, [](double x) { return 2.0 * x + 1.0; });
    BoundaryConditionSet bcs = conditions(1.0, BoundaryConditionType::Dirichlet, 3.0, BoundaryConditionType::Dirichlet);

    FiniteVolume fv;
    std::vector<double> g = fv.gradient(u.symbol, "rod", mesh, &bcs)->evaluate(0.0, u.y);
    ASSERT_EQ(g.size(), 6u);
    for (double value : g) {
        EXPECT_NEAR(value, 2.0, 1e-10);
    }
}

TEST(FiniteVolumeTest, FieldBoundaryConditionIsDiscretisationError) {
    SubMesh1D mesh = testutils::uniformSubMesh(3);
    Field u = sampled(mesh, [](double x) { return x; });
    BoundaryConditionSet bcs{{Side::Left, {u.symbol, BoundaryConditionType::Neumann}}};

    FiniteVolume fv;
    EXPECT_THROW(fv.gradient(u.symbol, "rod", mesh, &bcs), DiscretisationError);
}

// ============================================================================
// Divergence
// ============================================================================

TEST(FiniteVolumeTest, DivGradOfConstantIsZero) {
    FiniteVolume fv;
    for (CoordinateSystem system : {CoordinateSystem::Cartesian, CoordinateSystem::CylindricalPolar,
                                    CoordinateSystem::SphericalPolar}) {
        SubMesh1D mesh = testutils::uniformSubMesh(20, system);
        Field u = sampled(mesh, [](double) { return 0.7; });
        BoundaryConditionSet bcs = conditions(0.0, BoundaryConditionType::Neumann, 0.0, BoundaryConditionType::Neumann);

        SymbolPtr lap = fv.divergence(fv.gradient(u.symbol, "rod", mesh, &bcs), "rod", mesh);
        std::vector<double> value = lap->evaluate(0.0, u.y);
        ASSERT_EQ(value.size(), 20u);
        for (double v : value) {
            EXPECT_NEAR(v, 0.0, EXACT_TOL);
        }
    }
}

TEST(FiniteVolumeTest, DivergenceTelescopesToBoundaryFluxes) {
    // sum_i V_i div(F)_i = A_N F_N - A_0 F_0 for any edge flux F
    SubMesh1D mesh = Exponential1DSubMesh(Exponential1DSubMesh::Cluster::Right, 1.5)
                         .generate(CoordinateLimits{"r", CoordinateSystem::SphericalPolar, 0.0, 1.0}, 12);
    std::vector<double> flux;
    for (double x : mesh.edges()) flux.push_back(std::sin(3.0 * x) + 0.1);
    auto F = std::make_shared<StateVector>(0, flux.size(), "F", "rod");

    FiniteVolume fv;
    std::vector<double> div = fv.divergence(F, "rod", mesh)->evaluate(0.0, flux);
    std::vector<double> volumes = mesh.cellVolumes();
    std::vector<double> areas = mesh.faceAreas();

    double total = 0.0;
    for (size_t i = 0; i < div.size(); ++i) total += volumes[i] * div[i];
    EXPECT_NEAR(total, areas.back() * flux.back() - areas.front() * flux.front(), EXACT_TOL);
}

// ============================================================================
// Boundary Value, Integral, Spatial Variable
// ============================================================================

TEST(FiniteVolumeTest, BoundaryValueExtrapolatesLinearly) {
    SubMesh1D mesh = testutils::uniformSubMesh(10, CoordinateSystem::SphericalPolar);
    Field u = sampled(mesh, [](double r) { return 0.5 + 0.25 * r; });

    FiniteVolume fv;
    EXPECT_NEAR(fv.boundaryValue(u.symbol, mesh, Side::Right)->evaluate(0.0, u.y)[0], 0.75, EXACT_TOL);
    EXPECT_NEAR(fv.boundaryValue(u.symbol, mesh, Side::Left)->evaluate(0.0, u.y)[0], 0.5, EXACT_TOL);
    EXPECT_EQ(fv.boundaryValue(u.symbol, mesh, Side::Right)->name(), "surf");
}

TEST(FiniteVolumeTest, BoundaryValueOfSingleCell) {
    SubMesh1D mesh = testutils::uniformSubMesh(1);
    Field u = sampled(mesh, [](double) { return 0.42; });

    FiniteVolume fv;
    EXPECT_NEAR(fv.boundaryValue(u.symbol, mesh, Side::Right)->evaluate(0.0, u.y)[0], 0.42, EXACT_TOL);
    EXPECT_NEAR(fv.boundaryValue(u.symbol, mesh, Side::Left)->evaluate(0.0, u.y)[0], 0.42, EXACT_TOL);
}

TEST(FiniteVolumeTest, IntegralIncludesAngularFactor) {
    constexpr double PI = std::numbers::pi;
    FiniteVolume fv;

    SubMesh1D sphere = testutils::uniformSubMesh(16, CoordinateSystem::SphericalPolar);
    EXPECT_NEAR(fv.integral(makeScalar(1.0), sphere)->evaluate()[0], 4.0 * PI / 3.0, EXACT_TOL);

    SubMesh1D disc = testutils::uniformSubMesh(16, CoordinateSystem::CylindricalPolar);
    EXPECT_NEAR(fv.integral(makeScalar(1.0), disc)->evaluate()[0], PI, EXACT_TOL);

    SubMesh1D rod = testutils::uniformSubMesh(16, CoordinateSystem::Cartesian, 0.0, 2.0);
    Field u = sampled(rod, [](double x) { return x; });
    // Midpoint rule is exact for linear integrands
    EXPECT_NEAR(fv.integral(u.symbol, rod)->evaluate(0.0, u.y)[0], 2.0, EXACT_TOL);
}

TEST(FiniteVolumeTest, SpatialVariableIsCellCentres) {
    SubMesh1D mesh = testutils::uniformSubMesh(4);
    FiniteVolume fv;

    SpatialVariable x("x", "rod");
    std::vector<double> value = fv.spatialVariable(x, mesh)->evaluate();
    EXPECT_EQ(value, mesh.nodes());

    SpatialVariable r("r", "rod");
    EXPECT_THROW(fv.spatialVariable(r, mesh), DiscretisationError);
}

TEST(FiniteVolumeTest, Clone) {
    FiniteVolume fv;
    std::unique_ptr<SpatialMethod> copy(fv.clone());
    EXPECT_EQ(copy->name(), "FiniteVolume");
}
