#include <pdekit/mesh/Mesh.h>
#include <pdekit/utils/Errors.h>
#include <stdexcept>

Mesh::Mesh(const Geometry& geometry, const SubMeshTypes& submeshTypes, const VarPts& varPts)
{
    for (const auto& [domain, coordinates] : geometry.domains()) {
        if (coordinates.size() != 1) {
            throw GeometryError("domain '" + domain + "' has " + std::to_string(coordinates.size())
                                + " spatial variables; only 1D domains are supported");
        }
        const CoordinateLimits& limits = coordinates.front();

        auto typeIt = submeshTypes.find(domain);
        if (typeIt == submeshTypes.end() || !typeIt->second) {
            throw GeometryError("no submesh type given for domain '" + domain + "'");
        }
        auto ptsIt = varPts.find(limits.name);
        if (ptsIt == varPts.end()) {
            throw GeometryError("no number of points given for spatial variable '" + limits.name + "'");
        }

        _submeshes.emplace(domain, typeIt->second->generate(limits, ptsIt->second));
    }
}

const SubMesh1D& Mesh::operator[](const std::string& domain) const
{
    auto it = _submeshes.find(domain);
    if (it == _submeshes.end()) {
        throw std::out_of_range("Mesh: no submesh for domain '" + domain + "'");
    }
    return it->second;
}
