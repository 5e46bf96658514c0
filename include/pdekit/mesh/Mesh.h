#ifndef PDEKIT_MESH_H
#define PDEKIT_MESH_H

#include <pdekit/geometry/Geometry.h>
#include <pdekit/mesh/SubMesh.h>
#include <map>
#include <memory>
#include <string>

using SubMeshTypes = std::map<std::string, std::shared_ptr<const SubMeshGenerator>>;   // domain -> generator
using VarPts = std::map<std::string, size_t>;                                          // coordinate -> points

/**
 * @class Mesh
 * @brief One SubMesh1D per geometry domain
 *
 * Built from a Geometry, a submesh generator per domain and a point count
 * per spatial variable. Deterministic: identical inputs give identical
 * coordinates. Throws GeometryError for a domain without submesh type, a
 * coordinate without point count, invalid limits, or more than one
 * coordinate per domain.
 */
class Mesh
{
public:
    Mesh() = default;
    Mesh(const Geometry& geometry, const SubMeshTypes& submeshTypes, const VarPts& varPts);

    bool hasDomain(const std::string& domain) const { return _submeshes.count(domain) > 0; }
    const SubMesh1D& operator[](const std::string& domain) const;   // throws std::out_of_range
    const std::map<std::string, SubMesh1D>& submeshes() const { return _submeshes; }
    size_t size() const { return _submeshes.size(); }

private:
    std::map<std::string, SubMesh1D> _submeshes;
};

#endif // PDEKIT_MESH_H
