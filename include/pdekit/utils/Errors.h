#ifndef PDEKIT_ERRORS_H
#define PDEKIT_ERRORS_H

#include <stdexcept>
#include <string>

/**
 * Error hierarchy for the model -> mesh -> discretisation -> solver pipeline.
 *
 * Each stage validates its own inputs and throws the error of its kind:
 *   - ModelError:          inconsistent or missing equations / conditions / parameter values
 *   - GeometryError:       invalid spatial bounds or missing submesh mapping
 *   - DiscretisationError: missing spatial method or mesh for a domain, shape mismatch
 *   - SolverError:         non-convergence or invalid initial state
 *
 * Warnings (e.g. a missing length scale) are not errors; see ProcessedVariable.
 */
class PdeKitError : public std::runtime_error
{
public:
    explicit PdeKitError(const std::string& message) : std::runtime_error(message) {}
};

class ModelError : public PdeKitError
{
public:
    explicit ModelError(const std::string& message) : PdeKitError("ModelError: " + message) {}
};

class GeometryError : public PdeKitError
{
public:
    explicit GeometryError(const std::string& message) : PdeKitError("GeometryError: " + message) {}
};

class DiscretisationError : public PdeKitError
{
public:
    explicit DiscretisationError(const std::string& message) : PdeKitError("DiscretisationError: " + message) {}
};

class SolverError : public PdeKitError
{
public:
    explicit SolverError(const std::string& message) : PdeKitError("SolverError: " + message) {}
};

#endif // PDEKIT_ERRORS_H
