// bindings for errors, expression nodes and the builder functions
#include "bindings_common.h"
#include <pdekit/expression/Simplify.h>
#include <pdekit/expression/SymbolOperators.h>
#include <pdekit/utils/Errors.h>

VariablePtr asVariable(const PyExpression& expression)
{
    auto variable = std::dynamic_pointer_cast<const Variable>(expression.symbol);
    if (!variable) {
        throw ModelError("'" + expression.symbol->toString() + "' is not a Variable");
    }
    return variable;
}

SpatialVariablePtr asSpatialVariable(const PyExpression& expression)
{
    auto variable = std::dynamic_pointer_cast<const SpatialVariable>(expression.symbol);
    if (!variable) {
        throw ModelError("'" + expression.symbol->toString() + "' is not a SpatialVariable");
    }
    return variable;
}

void bind_errors(py::module_ &m)
{
    // Registered base first: later translators are tried first, so subclasses keep their own type
    auto &base = py::register_exception<PdeKitError>(m, "PdeKitError", PyExc_RuntimeError);
    py::register_exception<ModelError>(m, "ModelError", base.ptr());
    py::register_exception<GeometryError>(m, "GeometryError", base.ptr());
    py::register_exception<DiscretisationError>(m, "DiscretisationError", base.ptr());
    py::register_exception<SolverError>(m, "SolverError", base.ptr());
}

namespace
{
PyExpression wrap(SymbolPtr symbol)
{
    return PyExpression{std::move(symbol)};
}
}

void bind_expression(py::module_ &m)
{
    py::enum_<CoordinateSystem>(m, "CoordinateSystem", "Coordinate system of a spatial variable")
        .value("Cartesian", CoordinateSystem::Cartesian)
        .value("CylindricalPolar", CoordinateSystem::CylindricalPolar)
        .value("SphericalPolar", CoordinateSystem::SphericalPolar)
        .export_values();

    py::enum_<Side>(m, "Side", "Boundary side")
        .value("Left", Side::Left)
        .value("Right", Side::Right)
        .export_values();

    py::class_<PyExpression>(m, "Expression", "Immutable node of a symbolic expression")
        .def_property_readonly("name", [](const PyExpression& e) { return e.symbol->name(); })
        .def_property_readonly("domain", [](const PyExpression& e) { return e.symbol->domain(); })
        .def_property_readonly("id", [](const PyExpression& e) { return e.symbol->id(); })
        .def("evaluate", [](const PyExpression& e, double t, const std::vector<double>& y) {
            return e.symbol->evaluate(t, y);
        }, py::arg("t") = 0.0, py::arg("y") = std::vector<double>{},
           "Evaluate a discretised or constant expression")
        .def("__neg__", [](const PyExpression& a) { return wrap(-a.symbol); })
        .def("__abs__", [](const PyExpression& a) { return wrap(abs(a.symbol)); })
        .def("__add__", [](const PyExpression& a, const PyExpression& b) { return wrap(a.symbol + b.symbol); })
        .def("__add__", [](const PyExpression& a, double b) { return wrap(a.symbol + b); })
        .def("__radd__", [](const PyExpression& a, double b) { return wrap(b + a.symbol); })
        .def("__sub__", [](const PyExpression& a, const PyExpression& b) { return wrap(a.symbol - b.symbol); })
        .def("__sub__", [](const PyExpression& a, double b) { return wrap(a.symbol - b); })
        .def("__rsub__", [](const PyExpression& a, double b) { return wrap(b - a.symbol); })
        .def("__mul__", [](const PyExpression& a, const PyExpression& b) { return wrap(a.symbol * b.symbol); })
        .def("__mul__", [](const PyExpression& a, double b) { return wrap(a.symbol * b); })
        .def("__rmul__", [](const PyExpression& a, double b) { return wrap(b * a.symbol); })
        .def("__truediv__", [](const PyExpression& a, const PyExpression& b) { return wrap(a.symbol / b.symbol); })
        .def("__truediv__", [](const PyExpression& a, double b) { return wrap(a.symbol / b); })
        .def("__rtruediv__", [](const PyExpression& a, double b) { return wrap(b / a.symbol); })
        .def("__pow__", [](const PyExpression& a, const PyExpression& b) { return wrap(pow(a.symbol, b.symbol)); })
        .def("__pow__", [](const PyExpression& a, double b) { return wrap(pow(a.symbol, b)); })
        .def("__repr__", [](const PyExpression& e) { return e.symbol->toString(); });

    // Leaves
    m.def("Scalar", [](double value, const std::string& name) { return wrap(makeScalar(value, name)); },
          py::arg("value"), py::arg("name") = "", "Constant value");
    m.def("Parameter", [](const std::string& name) { return wrap(makeParameter(name)); },
          py::arg("name"), "Named placeholder bound by ParameterValues");
    m.def("Variable", [](const std::string& name, const std::string& domain) {
        return wrap(makeVariable(name, domain));
    }, py::arg("name"), py::arg("domain") = "", "Unknown field on a domain (0-D if domain is empty)");
    m.def("SpatialVariable", [](const std::string& name, const std::string& domain, CoordinateSystem system) {
        return wrap(makeSpatialVariable(name, domain, system));
    }, py::arg("name"), py::arg("domain"), py::arg("coord_sys") = CoordinateSystem::Cartesian,
       "Independent spatial coordinate");
    m.def("Time", []() { return wrap(makeTime()); }, "Time t");

    // Functions and spatial operators
    m.def("sqrt", [](const PyExpression& e) { return wrap(sqrt(e.symbol)); });
    m.def("exp", [](const PyExpression& e) { return wrap(exp(e.symbol)); });
    m.def("log", [](const PyExpression& e) { return wrap(log(e.symbol)); });
    m.def("sin", [](const PyExpression& e) { return wrap(sin(e.symbol)); });
    m.def("cos", [](const PyExpression& e) { return wrap(cos(e.symbol)); });
    m.def("tanh", [](const PyExpression& e) { return wrap(tanh(e.symbol)); });
    m.def("grad", [](const PyExpression& e) { return wrap(grad(e.symbol)); }, "Gradient");
    m.def("div", [](const PyExpression& e) { return wrap(div(e.symbol)); }, "Divergence");
    m.def("surf", [](const PyExpression& e) { return wrap(surf(e.symbol)); }, "Value at the right boundary");
    m.def("boundary_value", [](const PyExpression& e, Side side) { return wrap(boundaryValue(e.symbol, side)); },
          py::arg("child"), py::arg("side"));
    m.def("integral", [](const PyExpression& e, const PyExpression& x) {
        return wrap(integral(e.symbol, asSpatialVariable(x)));
    }, py::arg("child"), py::arg("spatial_variable"), "Integral over the domain of the child");
    m.def("simplify", [](const PyExpression& e) { return wrap(simplify(e.symbol)); });
}
