#include <pdekit/geometry/Geometry.h>
#include <pdekit/utils/Errors.h>

void Geometry::add(const std::string& domain, const SpatialVariablePtr& variable, double min, double max)
{
    if (!variable) {
        throw GeometryError("Geometry::add: spatial variable for domain '" + domain + "' is null");
    }
    if (variable->domain() != domain) {
        throw GeometryError("spatial variable '" + variable->name() + "' belongs to domain '"
                            + variable->domain() + "', not '" + domain + "'");
    }
    add(domain, variable->name(), variable->coordinateSystem(), min, max);
}

void Geometry::add(const std::string& domain, const std::string& coordinateName,
                   CoordinateSystem coordinateSystem, double min, double max)
{
    if (domain.empty()) {
        throw GeometryError("Geometry::add: domain name cannot be empty");
    }
    std::vector<CoordinateLimits>& coords = _domains[domain];
    for (CoordinateLimits& existing : coords) {
        if (existing.name == coordinateName) {
            existing = {coordinateName, coordinateSystem, min, max};
            return;
        }
    }
    coords.push_back({coordinateName, coordinateSystem, min, max});
}

const std::vector<CoordinateLimits>& Geometry::coordinates(const std::string& domain) const
{
    auto it = _domains.find(domain);
    if (it == _domains.end()) {
        throw GeometryError("domain '" + domain + "' not found in geometry");
    }
    return it->second;
}

std::vector<std::string> Geometry::domainNames() const
{
    std::vector<std::string> names;
    names.reserve(_domains.size());
    for (const auto& [name, coords] : _domains) {
        names.push_back(name);
    }
    return names;
}
