#ifndef PDEKIT_BOUNDARYCONDITIONS_H
#define PDEKIT_BOUNDARYCONDITIONS_H

#include <pdekit/expression/Symbol.h>
#include <map>
#include <string>

/**
 * Boundary conditions for a variable on a 1D domain
 *
 * Defines the behaviour of the solution at the spatial boundaries:
 *   - Left boundary:  x = x_min
 *   - Right boundary: x = x_max
 *
 * Supported:
 *   - Neumann:   du/dx(x_boundary, t) = value   (flux injected exactly at the face)
 *   - Dirichlet: u(x_boundary, t) = value       (half-cell ghost difference)
 *
 * The value is itself an expression: it may depend on time, parameters and
 * other variables (e.g. a flux depending on the surface value).
 */
enum class BoundaryConditionType { Neumann, Dirichlet };

std::string toString(BoundaryConditionType type);

struct BoundaryCondition
{
    SymbolPtr value;
    BoundaryConditionType type = BoundaryConditionType::Neumann;
};

using BoundaryConditionSet = std::map<Side, BoundaryCondition>;

#endif // PDEKIT_BOUNDARYCONDITIONS_H
