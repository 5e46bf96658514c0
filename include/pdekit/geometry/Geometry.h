#ifndef PDEKIT_GEOMETRY_H
#define PDEKIT_GEOMETRY_H

#include <pdekit/expression/Symbol.h>
#include <map>
#include <string>
#include <vector>

/**
 * Spatial extent of one coordinate of a domain, e.g. r in [0, 1] (spherical polar)
 */
struct CoordinateLimits
{
    std::string name;                 // spatial variable name, e.g. "r"
    CoordinateSystem coordinateSystem = CoordinateSystem::Cartesian;
    double min = 0.0;
    double max = 1.0;
};

/**
 * @class Geometry
 * @brief Mapping domain -> coordinate -> {min, max}
 *
 * Example:
 *   Geometry geometry;
 *   geometry.add("particle", r, 0.0, 1.0);   // r spherical polar on "particle"
 *
 * Bounds are checked when the mesh is generated, not here.
 */
class Geometry
{
public:
    Geometry() = default;

    void add(const std::string& domain, const SpatialVariablePtr& variable, double min, double max);
    void add(const std::string& domain, const std::string& coordinateName,
             CoordinateSystem coordinateSystem, double min, double max);

    bool hasDomain(const std::string& domain) const { return _domains.count(domain) > 0; }
    const std::vector<CoordinateLimits>& coordinates(const std::string& domain) const;
    std::vector<std::string> domainNames() const;
    const std::map<std::string, std::vector<CoordinateLimits>>& domains() const { return _domains; }

private:
    std::map<std::string, std::vector<CoordinateLimits>> _domains;
};

#endif // PDEKIT_GEOMETRY_H
