// bindings for Model and ParameterValues
#include "bindings_common.h"
#include <pdekit/expression/SymbolOperators.h>
#include <pdekit/model/Model.h>
#include <pdekit/model/ParameterValues.h>
#include <pdekit/utils/Errors.h>

namespace
{
// Accepts an Expression or a float
SymbolPtr toSymbol(const py::handle& value)
{
    if (py::isinstance<PyExpression>(value)) {
        return value.cast<const PyExpression&>().symbol;
    }
    return makeScalar(value.cast<double>());
}

BoundaryConditionType parseType(const std::string& type)
{
    if (type == "Neumann") return BoundaryConditionType::Neumann;
    if (type == "Dirichlet") return BoundaryConditionType::Dirichlet;
    throw ModelError("unknown boundary condition type '" + type + "'");
}

// {"left": (value, "Neumann"), "right": (value, "Dirichlet")}
BoundaryConditionSet parseConditions(const py::dict& conditions)
{
    BoundaryConditionSet out;
    for (const auto& [key, entry] : conditions) {
        std::string side = key.cast<std::string>();
        auto pair = entry.cast<py::tuple>();
        if (pair.size() != 2) {
            throw ModelError("boundary condition '" + side + "' must be a (value, type) pair");
        }
        BoundaryCondition condition{toSymbol(pair[0]), parseType(pair[1].cast<std::string>())};
        if (side == "left") {
            out[Side::Left] = condition;
        } else if (side == "right") {
            out[Side::Right] = condition;
        } else {
            throw ModelError("unknown boundary '" + side + "', expected 'left' or 'right'");
        }
    }
    return out;
}
}

void bind_model(py::module_ &m)
{
    py::class_<Model>(m, "Model", "Equations, boundary / initial conditions and outputs")
        .def(py::init<std::string>(), py::arg("name") = "Unnamed model")
        .def_property_readonly("name", &Model::name)
        .def("set_rhs", [](Model& model, const PyExpression& variable, const py::object& expression) {
            model.setRhs(asVariable(variable), toSymbol(expression));
        }, py::arg("variable"), py::arg("expression"))
        .def("set_algebraic", [](Model& model, const PyExpression& variable, const py::object& expression) {
            model.setAlgebraic(asVariable(variable), toSymbol(expression));
        }, py::arg("variable"), py::arg("expression"))
        .def("set_initial_condition", [](Model& model, const PyExpression& variable, const py::object& value) {
            model.setInitialCondition(asVariable(variable), toSymbol(value));
        }, py::arg("variable"), py::arg("value"))
        .def("set_boundary_conditions", [](Model& model, const PyExpression& variable, const py::dict& conditions) {
            model.setBoundaryConditions(asVariable(variable), parseConditions(conditions));
        }, py::arg("variable"), py::arg("conditions"),
           "conditions: {'left': (value, 'Neumann' | 'Dirichlet'), 'right': (...)}")
        .def("add_variable", [](Model& model, const std::string& name, const py::object& expression) {
            model.addVariable(name, toSymbol(expression));
        }, py::arg("name"), py::arg("expression"))
        .def("set_length_scale", &Model::setLengthScale, py::arg("domain"), py::arg("scale"))
        .def("check_well_posedness", &Model::checkWellPosedness)
        .def_property_readonly("variable_names", [](const Model& model) {
            std::vector<std::string> names;
            for (const auto& [name, expression] : model.variables()) names.push_back(name);
            return names;
        });

    py::class_<ParameterValues>(m, "ParameterValues", "Values bound to named parameters")
        .def(py::init<>())
        .def(py::init([](const std::map<std::string, double>& values) {
            ParameterValues out;
            for (const auto& [name, value] : values) out.set(name, value);
            return out;
        }), py::arg("values"))
        .def("__setitem__", &ParameterValues::set)
        .def("__getitem__", &ParameterValues::get)
        .def("__contains__", &ParameterValues::contains)
        .def("process_model", &ParameterValues::processModel, py::arg("model"))
        .def("process_symbol", [](const ParameterValues& values, const PyExpression& expression) {
            return PyExpression{values.process(expression.symbol)};
        }, py::arg("expression"));
}
