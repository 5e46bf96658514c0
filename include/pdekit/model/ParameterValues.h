#ifndef PDEKIT_PARAMETERVALUES_H
#define PDEKIT_PARAMETERVALUES_H

#include <pdekit/expression/Symbol.h>
#include <pdekit/model/Model.h>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>

/**
 * @class ParameterValues
 * @brief Binds numeric values to named Parameters
 *
 * Processing replaces every Parameter node with a Scalar carrying the bound
 * value. Shared nodes stay shared. A Parameter without a value is a ModelError.
 */
class ParameterValues
{
public:
    ParameterValues() = default;
    ParameterValues(std::initializer_list<std::pair<const std::string, double>> values);

    void set(const std::string& name, double value);
    double get(const std::string& name) const;   // throws ModelError if missing
    bool contains(const std::string& name) const { return _values.count(name) > 0; }
    const std::map<std::string, double>& values() const { return _values; }

    SymbolPtr process(const SymbolPtr& symbol) const;
    Model processModel(const Model& model) const;

private:
    std::map<std::string, double> _values;
};

#endif // PDEKIT_PARAMETERVALUES_H
