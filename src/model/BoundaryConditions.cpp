#include <pdekit/model/BoundaryConditions.h>

std::string toString(BoundaryConditionType type)
{
    return type == BoundaryConditionType::Neumann ? "Neumann" : "Dirichlet";
}
