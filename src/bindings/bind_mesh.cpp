// bindings for Geometry, submesh generators and spatial methods
#include "bindings_common.h"
#include <pdekit/discretisation/SpatialMethod.h>
#include <pdekit/geometry/Geometry.h>
#include <pdekit/mesh/Mesh.h>
#include <pdekit/mesh/SubMesh.h>

void bind_mesh(py::module_ &m)
{
    py::class_<Geometry>(m, "Geometry", "Domain -> coordinate -> {min, max}")
        .def(py::init<>())
        .def("add", [](Geometry& geometry, const std::string& domain, const PyExpression& variable,
                       double min, double max) {
            geometry.add(domain, asSpatialVariable(variable), min, max);
        }, py::arg("domain"), py::arg("spatial_variable"), py::arg("min"), py::arg("max"))
        .def("has_domain", &Geometry::hasDomain)
        .def_property_readonly("domains", &Geometry::domainNames);

    py::class_<SubMesh1D>(m, "SubMesh1D", "Cell-centred 1D mesh of one domain")
        .def_property_readonly("npts", &SubMesh1D::npts)
        .def_property_readonly("edges", &SubMesh1D::edges)
        .def_property_readonly("nodes", &SubMesh1D::nodes)
        .def_property_readonly("coordinate_name", &SubMesh1D::coordinateName);

    py::class_<SubMeshGenerator, std::shared_ptr<SubMeshGenerator>>(m, "SubMeshGenerator")
        .def("generate", [](const SubMeshGenerator& generator, double min, double max, size_t npts,
                            const std::string& name, CoordinateSystem system) {
            return generator.generate(CoordinateLimits{name, system, min, max}, npts);
        }, py::arg("min"), py::arg("max"), py::arg("npts"), py::arg("name") = "x",
           py::arg("coord_sys") = CoordinateSystem::Cartesian)
        .def_property_readonly("name", &SubMeshGenerator::name);

    py::class_<Uniform1DSubMesh, SubMeshGenerator, std::shared_ptr<Uniform1DSubMesh>>(m, "Uniform1DSubMesh")
        .def(py::init<>());

    py::enum_<Exponential1DSubMesh::Cluster>(m, "Cluster", "Side towards which cells are clustered")
        .value("Left", Exponential1DSubMesh::Cluster::Left)
        .value("Right", Exponential1DSubMesh::Cluster::Right)
        .value("Symmetric", Exponential1DSubMesh::Cluster::Symmetric);

    py::class_<Exponential1DSubMesh, SubMeshGenerator, std::shared_ptr<Exponential1DSubMesh>>(m, "Exponential1DSubMesh")
        .def(py::init<Exponential1DSubMesh::Cluster, double>(),
             py::arg("side") = Exponential1DSubMesh::Cluster::Symmetric, py::arg("stretch") = 1.15);

    py::class_<UserSupplied1DSubMesh, SubMeshGenerator, std::shared_ptr<UserSupplied1DSubMesh>>(m, "UserSupplied1DSubMesh")
        .def(py::init<std::vector<double>>(), py::arg("edges"));

    py::class_<SpatialMethod, std::shared_ptr<SpatialMethod>>(m, "SpatialMethod")
        .def_property_readonly("name", &SpatialMethod::name);

    py::class_<FiniteVolume, SpatialMethod, std::shared_ptr<FiniteVolume>>(m, "FiniteVolume")
        .def(py::init<>());
}
