// common includes for all binding modules
#pragma once

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>
#include <pdekit/expression/Symbol.h>

namespace py = pybind11;

// Python-side handle on an immutable expression node
struct PyExpression
{
    SymbolPtr symbol;
};

// Downcasts used where the C++ API needs a specific node type (throws ModelError)
VariablePtr asVariable(const PyExpression& expression);
SpatialVariablePtr asSpatialVariable(const PyExpression& expression);

// forward declarations for bind functions
void bind_errors(py::module_ &m);
void bind_expression(py::module_ &m);
void bind_model(py::module_ &m);
void bind_mesh(py::module_ &m);
void bind_solvers(py::module_ &m);
