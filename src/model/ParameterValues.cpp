#include <pdekit/model/ParameterValues.h>
#include <pdekit/utils/Errors.h>
#include <cmath>
#include <memory>
#include <unordered_map>

namespace
{
class ParameterSubstitution
{
public:
    explicit ParameterSubstitution(const ParameterValues& values) : _values(values) {}

    SymbolPtr operator()(const SymbolPtr& symbol)
    {
        auto it = _cache.find(symbol.get());
        if (it != _cache.end()) {
            return it->second;
        }
        SymbolPtr result;
        if (symbol->kind() == Symbol::Kind::Parameter) {
            result = std::make_shared<Scalar>(_values.get(symbol->name()), symbol->name());
        } else {
            std::vector<SymbolPtr> children;
            children.reserve(symbol->children().size());
            for (const SymbolPtr& child : symbol->children()) {
                children.push_back((*this)(child));
            }
            result = symbol->withChildren(std::move(children));
        }
        _cache.emplace(symbol.get(), result);
        return result;
    }

private:
    const ParameterValues& _values;
    std::unordered_map<const Symbol*, SymbolPtr> _cache;
};
}

ParameterValues::ParameterValues(std::initializer_list<std::pair<const std::string, double>> values)
{
    for (const auto& [name, value] : values) {
        set(name, value);
    }
}

void ParameterValues::set(const std::string& name, double value)
{
    if (!std::isfinite(value)) {
        throw ModelError("value of parameter '" + name + "' must be finite");
    }
    _values[name] = value;
}

double ParameterValues::get(const std::string& name) const
{
    auto it = _values.find(name);
    if (it == _values.end()) {
        throw ModelError("parameter '" + name + "' not found in parameter values");
    }
    return it->second;
}

SymbolPtr ParameterValues::process(const SymbolPtr& symbol) const
{
    ParameterSubstitution substitution(*this);
    return substitution(symbol);
}

Model ParameterValues::processModel(const Model& model) const
{
    // One substitution for the whole model keeps shared subexpressions shared
    ParameterSubstitution substitution(*this);
    return model.transformed([&substitution](const SymbolPtr& symbol) { return substitution(symbol); });
}
