#include <pdekit/mesh/SubMesh.h>
#include <pdekit/utils/Errors.h>
#include <cmath>
#include <stdexcept>

// ============================================================================
// SubMesh1D
// ============================================================================

SubMesh1D::SubMesh1D(std::vector<double> edges, std::string coordinateName, CoordinateSystem coordinateSystem)
    : _edges(std::move(edges)), _coordinateName(std::move(coordinateName)), _coordinateSystem(coordinateSystem)
{
    validate();

    _nodes.reserve(_edges.size() - 1);
    for (size_t i = 0; i + 1 < _edges.size(); ++i) {
        _nodes.push_back(0.5 * (_edges[i] + _edges[i + 1]));
    }
}

void SubMesh1D::validate() const
{
    if (_edges.size() < 2) {
        throw GeometryError("submesh for '" + _coordinateName + "' needs at least 2 edges");
    }
    for (size_t i = 0; i < _edges.size(); ++i) {
        if (!std::isfinite(_edges[i])) {
            throw GeometryError("submesh for '" + _coordinateName + "' has a non-finite edge");
        }
        if (i > 0 && _edges[i] <= _edges[i - 1]) {
            throw GeometryError("submesh edges for '" + _coordinateName + "' must be strictly increasing");
        }
    }
    if (_coordinateSystem != CoordinateSystem::Cartesian && _edges.front() < 0.0) {
        throw GeometryError("radial coordinate '" + _coordinateName + "' must be non-negative in "
                            + toString(_coordinateSystem) + " coordinates");
    }
}

double SubMesh1D::dEdge(size_t i) const
{
    if (i >= npts()) {
        throw std::out_of_range("SubMesh1D::dEdge: index out of range");
    }
    return _edges[i + 1] - _edges[i];
}

double SubMesh1D::dNode(size_t i) const
{
    if (i + 1 >= npts()) {
        throw std::out_of_range("SubMesh1D::dNode: index out of range");
    }
    return _nodes[i + 1] - _nodes[i];
}

std::vector<double> SubMesh1D::cellVolumes() const
{
    std::vector<double> volumes(npts());
    for (size_t i = 0; i < npts(); ++i) {
        double a = _edges[i];
        double b = _edges[i + 1];
        switch (_coordinateSystem) {
            case CoordinateSystem::Cartesian:
                volumes[i] = b - a;
                break;
            case CoordinateSystem::CylindricalPolar:
                volumes[i] = (b * b - a * a) / 2.0;
                break;
            case CoordinateSystem::SphericalPolar:
                volumes[i] = (b * b * b - a * a * a) / 3.0;
                break;
        }
    }
    return volumes;
}

std::vector<double> SubMesh1D::faceAreas() const
{
    std::vector<double> areas(_edges.size());
    for (size_t i = 0; i < _edges.size(); ++i) {
        double r = _edges[i];
        switch (_coordinateSystem) {
            case CoordinateSystem::Cartesian:
                areas[i] = 1.0;
                break;
            case CoordinateSystem::CylindricalPolar:
                areas[i] = r;
                break;
            case CoordinateSystem::SphericalPolar:
                areas[i] = r * r;
                break;
        }
    }
    return areas;
}

// ============================================================================
// Generators
// ============================================================================

void SubMeshGenerator::validateLimits(const CoordinateLimits& limits, size_t npts)
{
    if (!std::isfinite(limits.min) || !std::isfinite(limits.max)) {
        throw GeometryError("limits of '" + limits.name + "' must be finite");
    }
    if (limits.min >= limits.max) {
        throw GeometryError("min of '" + limits.name + "' (" + std::to_string(limits.min)
                            + ") must be less than max (" + std::to_string(limits.max) + ")");
    }
    if (npts < 1) {
        throw GeometryError("need at least 1 point for '" + limits.name + "'");
    }
}

SubMesh1D Uniform1DSubMesh::generate(const CoordinateLimits& limits, size_t npts) const
{
    validateLimits(limits, npts);

    // x_{i+1/2} = min + i * dx for i = 0, 1, ..., N
    double dx = (limits.max - limits.min) / static_cast<double>(npts);
    std::vector<double> edges;
    edges.reserve(npts + 1);
    for (size_t i = 0; i <= npts; ++i) {
        edges.push_back(limits.min + static_cast<double>(i) * dx);
    }
    edges.back() = limits.max;   // exact boundary value

    return SubMesh1D(std::move(edges), limits.name, limits.coordinateSystem);
}

Uniform1DSubMesh* Uniform1DSubMesh::clone() const
{
    return new Uniform1DSubMesh(*this);
}

Exponential1DSubMesh::Exponential1DSubMesh(Cluster cluster, double stretch)
    : _cluster(cluster), _stretch(stretch)
{
    if (!(stretch > 0.0)) {
        throw GeometryError("Exponential1DSubMesh: stretch must be positive");
    }
}

std::vector<double> Exponential1DSubMesh::stretchedEdges(double a, double b, size_t npts, double stretch)
{
    // Positive stretch clusters towards a, negative towards b
    std::vector<double> edges(npts + 1);
    double denom = std::exp(stretch) - 1.0;
    for (size_t i = 0; i <= npts; ++i) {
        double s = static_cast<double>(i) / static_cast<double>(npts);
        edges[i] = a + (b - a) * (std::exp(stretch * s) - 1.0) / denom;
    }
    edges.front() = a;
    edges.back() = b;
    return edges;
}

SubMesh1D Exponential1DSubMesh::generate(const CoordinateLimits& limits, size_t npts) const
{
    validateLimits(limits, npts);
    double a = limits.min;
    double b = limits.max;

    std::vector<double> edges;
    switch (_cluster) {
        case Cluster::Left:
            edges = stretchedEdges(a, b, npts, _stretch);
            break;
        case Cluster::Right:
            edges = stretchedEdges(a, b, npts, -_stretch);
            break;
        case Cluster::Symmetric: {
            if (npts < 2) {
                edges = {a, b};
                break;
            }
            size_t nLeft = npts / 2;
            size_t nRight = npts - nLeft;
            double mid = 0.5 * (a + b);
            edges = stretchedEdges(a, mid, nLeft, _stretch);
            std::vector<double> right = stretchedEdges(mid, b, nRight, -_stretch);
            edges.insert(edges.end(), right.begin() + 1, right.end());   // mid appears once
            break;
        }
    }
    return SubMesh1D(std::move(edges), limits.name, limits.coordinateSystem);
}

Exponential1DSubMesh* Exponential1DSubMesh::clone() const
{
    return new Exponential1DSubMesh(*this);
}

UserSupplied1DSubMesh::UserSupplied1DSubMesh(std::vector<double> edges) : _edges(std::move(edges))
{
    if (_edges.size() < 2) {
        throw GeometryError("UserSupplied1DSubMesh: need at least 2 edges");
    }
}

SubMesh1D UserSupplied1DSubMesh::generate(const CoordinateLimits& limits, size_t npts) const
{
    validateLimits(limits, npts);
    if (npts != _edges.size() - 1) {
        throw GeometryError("UserSupplied1DSubMesh: " + std::to_string(_edges.size()) + " edges given for "
                            + std::to_string(npts) + " points of '" + limits.name + "'");
    }
    if (_edges.front() != limits.min || _edges.back() != limits.max) {
        throw GeometryError("UserSupplied1DSubMesh: first and last edges must equal the limits of '"
                            + limits.name + "'");
    }
    return SubMesh1D(_edges, limits.name, limits.coordinateSystem);
}

UserSupplied1DSubMesh* UserSupplied1DSubMesh::clone() const
{
    return new UserSupplied1DSubMesh(*this);
}
