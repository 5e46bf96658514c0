#ifndef PDEKIT_SUBMESH_H
#define PDEKIT_SUBMESH_H

#include <pdekit/expression/Symbol.h>
#include <pdekit/geometry/Geometry.h>
#include <memory>
#include <string>
#include <vector>

/**
 * @class SubMesh1D
 * @brief Cell-centred 1D discretisation of one domain
 *
 * Structure (N cells):
 *   edges:  x_{1/2} = x_min, x_{3/2}, ..., x_{N+1/2} = x_max     (N+1 points)
 *   nodes:  x_i = (x_{i-1/2} + x_{i+1/2}) / 2                      (N points)
 */
class SubMesh1D
{
public:
    /**
     * Constructor from cell edges
     * @param edges Strictly increasing cell boundaries (at least 2)
     * @param coordinateName Name of the spatial variable, e.g. "r"
     * @param coordinateSystem Cartesian, cylindrical or spherical polar
     */
    SubMesh1D(std::vector<double> edges, std::string coordinateName,
              CoordinateSystem coordinateSystem = CoordinateSystem::Cartesian);

    // Accessors - Mesh Parameters
    size_t npts() const { return _nodes.size(); }          // number of cells
    const std::string& coordinateName() const { return _coordinateName; }
    CoordinateSystem coordinateSystem() const { return _coordinateSystem; }
    double min() const { return _edges.front(); }
    double max() const { return _edges.back(); }

    // Accessors - Mesh Values
    const std::vector<double>& edges() const { return _edges; }
    const std::vector<double>& nodes() const { return _nodes; }

    // Mesh Spacing Methods
    double dEdge(size_t i) const;   // cell width x_{i+1/2} - x_{i-1/2}
    double dNode(size_t i) const;   // centre spacing x_{i+1} - x_i, 0 <= i < N-1

    /**
     * Cell volumes in the coordinate system, without angular factors:
     *   cartesian:   x_{i+1/2} - x_{i-1/2}
     *   cylindrical: (r_{i+1/2}^2 - r_{i-1/2}^2) / 2
     *   spherical:   (r_{i+1/2}^3 - r_{i-1/2}^3) / 3
     */
    std::vector<double> cellVolumes() const;

    /**
     * Face area factor at each edge, without angular factors:
     *   cartesian 1, cylindrical r, spherical r^2
     */
    std::vector<double> faceAreas() const;

private:
    std::vector<double> _edges;
    std::vector<double> _nodes;
    std::string _coordinateName;
    CoordinateSystem _coordinateSystem;

    void validate() const;
};

// ============================================================================
// SUBMESH GENERATORS
// ============================================================================

/**
 * @class SubMeshGenerator
 * @brief Strategy turning coordinate limits and a point count into a SubMesh1D
 *
 * Throws GeometryError for invalid limits (min >= max) or a zero point count.
 */
class SubMeshGenerator
{
public:
    virtual ~SubMeshGenerator() = default;

    virtual SubMesh1D generate(const CoordinateLimits& limits, size_t npts) const = 0;
    virtual std::string name() const = 0;
    virtual SubMeshGenerator* clone() const = 0;

protected:
    static void validateLimits(const CoordinateLimits& limits, size_t npts);
};

// Equally spaced cells
class Uniform1DSubMesh : public SubMeshGenerator
{
public:
    SubMesh1D generate(const CoordinateLimits& limits, size_t npts) const override;
    std::string name() const override { return "Uniform1DSubMesh"; }
    Uniform1DSubMesh* clone() const override;
};

/**
 * Exponentially stretched cells, clustered towards one or both ends
 *
 *   Left:      x_i = a + (b - a) * (exp(s i / N) - 1) / (exp(s) - 1)
 *   Right:     x_i = a + (b - a) * (exp(-s i / N) - 1) / (exp(-s) - 1)
 *   Symmetric: Left on [a, (a+b)/2] and Right on [(a+b)/2, b]
 */
class Exponential1DSubMesh : public SubMeshGenerator
{
public:
    enum class Cluster { Left, Right, Symmetric };

    explicit Exponential1DSubMesh(Cluster cluster = Cluster::Symmetric, double stretch = 1.15);

    SubMesh1D generate(const CoordinateLimits& limits, size_t npts) const override;
    std::string name() const override { return "Exponential1DSubMesh"; }
    Exponential1DSubMesh* clone() const override;

    Cluster cluster() const { return _cluster; }
    double stretch() const { return _stretch; }

private:
    Cluster _cluster;
    double _stretch;

    static std::vector<double> stretchedEdges(double a, double b, size_t npts, double stretch);
};

// Edges given explicitly; they must span the coordinate limits
class UserSupplied1DSubMesh : public SubMeshGenerator
{
public:
    explicit UserSupplied1DSubMesh(std::vector<double> edges);

    SubMesh1D generate(const CoordinateLimits& limits, size_t npts) const override;
    std::string name() const override { return "UserSupplied1DSubMesh"; }
    UserSupplied1DSubMesh* clone() const override;

private:
    std::vector<double> _edges;
};

#endif // PDEKIT_SUBMESH_H
