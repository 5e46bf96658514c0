#include <pdekit/discretisation/SpatialMethod.h>
#include <pdekit/expression/SymbolOperators.h>
#include <pdekit/utils/Errors.h>
#include <cmath>
#include <memory>
#include <numbers>
#include <vector>

namespace
{
constexpr double PI = std::numbers::pi;

// (N+1) x 1 column with a single unit entry, used to place a boundary value on an edge
SymbolPtr onEdge(size_t edge, size_t nEdges, const SymbolPtr& value, const std::string& name,
                 const std::string& domain)
{
    auto column = std::make_shared<const SparseMatrix>(nEdges, 1, std::vector<SparseMatrix::Triplet>{{edge, 0, 1.0}});
    return std::make_shared<MatrixProduct>(column, value, name, domain);
}

void requireScalarCondition(const BoundaryCondition& condition, Side side)
{
    if (!condition.value) {
        throw DiscretisationError(toString(side) + " boundary condition has no value");
    }
    if (!condition.value->domain().empty()) {
        throw DiscretisationError(toString(side) + " boundary condition must be a single value, got a field on '"
                                  + condition.value->domain() + "'");
    }
}

double angularFactor(CoordinateSystem coordinateSystem)
{
    switch (coordinateSystem) {
        case CoordinateSystem::Cartesian:
            return 1.0;
        case CoordinateSystem::CylindricalPolar:
            return 2.0 * PI;
        case CoordinateSystem::SphericalPolar:
            return 4.0 * PI;
    }
    return 1.0;
}

// Two-point differences on the interior edges 1..N-1
std::vector<SparseMatrix::Triplet> interiorGradient(const SubMesh1D& mesh)
{
    size_t n = mesh.npts();
    std::vector<SparseMatrix::Triplet> triplets;
    triplets.reserve(2 * n + 2);
    for (size_t k = 1; k < n; ++k) {
        double dx = mesh.dNode(k - 1);
        triplets.push_back({k, k - 1, -1.0 / dx});
        triplets.push_back({k, k, 1.0 / dx});
    }
    return triplets;
}
}

FiniteVolume* FiniteVolume::clone() const
{
    return new FiniteVolume(*this);
}

SymbolPtr FiniteVolume::spatialVariable(const SpatialVariable& symbol, const SubMesh1D& mesh) const
{
    if (symbol.name() != mesh.coordinateName()) {
        throw DiscretisationError("spatial variable '" + symbol.name() + "' does not match the mesh coordinate '"
                                  + mesh.coordinateName() + "' of domain '" + symbol.domain() + "'");
    }
    return std::make_shared<VectorConstant>(mesh.nodes(), symbol.name(), symbol.domain());
}

// ============================================================================
// Gradient
// ============================================================================

SparseMatrix FiniteVolume::gradientMatrix(const SubMesh1D& mesh)
{
    return SparseMatrix(mesh.npts() + 1, mesh.npts(), interiorGradient(mesh));
}

SymbolPtr FiniteVolume::gradient(const SymbolPtr& child, const std::string& domain, const SubMesh1D& mesh,
                                 const BoundaryConditionSet* conditions) const
{
    size_t n = mesh.npts();
    const std::vector<double>& edges = mesh.edges();
    const std::vector<double>& nodes = mesh.nodes();
    double hLeft = nodes.front() - edges.front();    // half cell at each end
    double hRight = edges.back() - nodes.back();

    std::vector<SparseMatrix::Triplet> triplets = interiorGradient(mesh);

    // Boundary contributions that do not depend on the operand
    std::vector<SymbolPtr> boundaryTerms;
    if (conditions) {
        for (const auto& [side, condition] : *conditions) {
            requireScalarCondition(condition, side);
            size_t edge = side == Side::Left ? 0 : n;
            if (condition.type == BoundaryConditionType::Neumann) {
                boundaryTerms.push_back(onEdge(edge, n + 1, condition.value, "neumann " + toString(side), domain));
            } else if (side == Side::Left) {
                // (u_0 - g) / h
                triplets.push_back({0, 0, 1.0 / hLeft});
                boundaryTerms.push_back(onEdge(0, n + 1, condition.value * (-1.0 / hLeft), "dirichlet left", domain));
            } else {
                // (g - u_{N-1}) / h
                triplets.push_back({n, n - 1, -1.0 / hRight});
                boundaryTerms.push_back(onEdge(n, n + 1, condition.value * (1.0 / hRight), "dirichlet right", domain));
            }
        }
    }

    auto matrix = std::make_shared<const SparseMatrix>(n + 1, n, triplets);
    SymbolPtr out = std::make_shared<MatrixProduct>(matrix, child, "grad", domain);
    for (const SymbolPtr& term : boundaryTerms) {
        out = out + term;
    }
    return out;
}

// ============================================================================
// Divergence
// ============================================================================

SparseMatrix FiniteVolume::divergenceMatrix(const SubMesh1D& mesh)
{
    size_t n = mesh.npts();
    std::vector<double> areas = mesh.faceAreas();
    std::vector<double> volumes = mesh.cellVolumes();

    std::vector<SparseMatrix::Triplet> triplets;
    triplets.reserve(2 * n);
    for (size_t i = 0; i < n; ++i) {
        triplets.push_back({i, i, -areas[i] / volumes[i]});
        triplets.push_back({i, i + 1, areas[i + 1] / volumes[i]});
    }
    return SparseMatrix(n, n + 1, triplets);
}

SymbolPtr FiniteVolume::divergence(const SymbolPtr& child, const std::string& domain, const SubMesh1D& mesh) const
{
    auto matrix = std::make_shared<const SparseMatrix>(divergenceMatrix(mesh));
    return std::make_shared<MatrixProduct>(matrix, child, "div", domain);
}

// ============================================================================
// Boundary value and integral
// ============================================================================

SymbolPtr FiniteVolume::boundaryValue(const SymbolPtr& child, const SubMesh1D& mesh, Side side) const
{
    size_t n = mesh.npts();
    const std::vector<double>& edges = mesh.edges();
    const std::vector<double>& nodes = mesh.nodes();

    std::vector<SparseMatrix::Triplet> triplets;
    if (n == 1) {
        triplets.push_back({0, 0, 1.0});
    } else if (side == Side::Left) {
        // u_0 - w (u_1 - u_0), w = (x_0 - x_{1/2}) / (x_1 - x_0)
        double w = (nodes[0] - edges.front()) / mesh.dNode(0);
        triplets.push_back({0, 0, 1.0 + w});
        triplets.push_back({0, 1, -w});
    } else {
        // u_{N-1} + w (u_{N-1} - u_{N-2}), w = (x_{N+1/2} - x_{N-1}) / (x_{N-1} - x_{N-2})
        double w = (edges.back() - nodes[n - 1]) / mesh.dNode(n - 2);
        triplets.push_back({0, n - 1, 1.0 + w});
        triplets.push_back({0, n - 2, -w});
    }

    auto matrix = std::make_shared<const SparseMatrix>(1, n, triplets);
    return std::make_shared<MatrixProduct>(matrix, child, side == Side::Right ? "surf" : "boundary value left", "");
}

SymbolPtr FiniteVolume::integral(const SymbolPtr& child, const SubMesh1D& mesh) const
{
    std::vector<double> volumes = mesh.cellVolumes();
    double factor = angularFactor(mesh.coordinateSystem());

    std::vector<SparseMatrix::Triplet> triplets;
    triplets.reserve(volumes.size());
    for (size_t i = 0; i < volumes.size(); ++i) {
        triplets.push_back({0, i, factor * volumes[i]});
    }
    auto matrix = std::make_shared<const SparseMatrix>(1, volumes.size(), triplets);
    return std::make_shared<MatrixProduct>(matrix, child, "integral", "");
}
