#ifndef PDEKIT_SPATIALMETHOD_H
#define PDEKIT_SPATIALMETHOD_H

#include <pdekit/expression/Symbol.h>
#include <pdekit/mesh/SubMesh.h>
#include <pdekit/model/BoundaryConditions.h>
#include <string>

/**
 * =============================================================================
 * SPATIAL METHODS
 * =============================================================================
 * A spatial method replaces the continuous operators of one domain with
 * discrete ones acting on already discretised children:
 *
 *   SpatialVariable -> vector of cell centres                     (N)
 *   grad(u)         -> edge values                                (N+1)
 *   div(F)          -> cell values from edge fluxes               (N)
 *   u(boundary)     -> single value                               (1)
 *   integral(u)     -> single value                               (1)
 *
 * Every method returns a new expression built from MatrixProduct nodes and
 * arithmetic, so the discretised model can be evaluated like any other.
 */
class SpatialMethod
{
public:
    virtual ~SpatialMethod() = default;

    virtual SymbolPtr spatialVariable(const SpatialVariable& symbol, const SubMesh1D& mesh) const = 0;

    /**
     * @param child Discretised operand (cell values)
     * @param conditions Discretised boundary conditions of the operand, or nullptr
     *        when the operand is not a variable with boundary conditions
     */
    virtual SymbolPtr gradient(const SymbolPtr& child, const std::string& domain, const SubMesh1D& mesh,
                               const BoundaryConditionSet* conditions) const = 0;
    virtual SymbolPtr divergence(const SymbolPtr& child, const std::string& domain,
                                 const SubMesh1D& mesh) const = 0;
    virtual SymbolPtr boundaryValue(const SymbolPtr& child, const SubMesh1D& mesh, Side side) const = 0;
    virtual SymbolPtr integral(const SymbolPtr& child, const SubMesh1D& mesh) const = 0;

    virtual std::string name() const = 0;
    virtual SpatialMethod* clone() const = 0;
};

/**
 * @class FiniteVolume
 * @brief Cell-centred finite volumes on a 1D submesh
 *
 * Gradient on edge k (1 <= k <= N-1):  (u_k - u_{k-1}) / (x_k - x_{k-1})
 * Boundary edges:
 *   Neumann:   the condition value itself
 *   Dirichlet: (u_0 - g) / (x_0 - x_{1/2})  and  (g - u_{N-1}) / (x_{N+1/2} - x_{N-1})
 *   none:      0 (no flux)
 *
 * Divergence in cell i: (A_{i+1/2} F_{i+1/2} - A_{i-1/2} F_{i-1/2}) / V_i,
 * with A and V from SubMesh1D::faceAreas() / cellVolumes(). Summing V_i div_i
 * telescopes to the boundary fluxes, so the scheme is exactly conservative.
 */
class FiniteVolume : public SpatialMethod
{
public:
    SymbolPtr spatialVariable(const SpatialVariable& symbol, const SubMesh1D& mesh) const override;
    SymbolPtr gradient(const SymbolPtr& child, const std::string& domain, const SubMesh1D& mesh,
                       const BoundaryConditionSet* conditions) const override;
    SymbolPtr divergence(const SymbolPtr& child, const std::string& domain,
                         const SubMesh1D& mesh) const override;

    // Linear extrapolation from the two cells closest to the boundary
    SymbolPtr boundaryValue(const SymbolPtr& child, const SubMesh1D& mesh, Side side) const override;

    // sum_i V_i u_i times the angular factor (1, 2 pi or 4 pi)
    SymbolPtr integral(const SymbolPtr& child, const SubMesh1D& mesh) const override;

    std::string name() const override { return "FiniteVolume"; }
    FiniteVolume* clone() const override;

    // Discrete operators, exposed for testing
    static SparseMatrix gradientMatrix(const SubMesh1D& mesh);
    static SparseMatrix divergenceMatrix(const SubMesh1D& mesh);
};

#endif // PDEKIT_SPATIALMETHOD_H
