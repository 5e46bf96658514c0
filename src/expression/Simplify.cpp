#include <pdekit/expression/Simplify.h>
#include <memory>

namespace
{
bool isScalarValue(const SymbolPtr& symbol, double value)
{
    if (symbol->kind() != Symbol::Kind::Scalar) return false;
    return static_cast<const Scalar&>(*symbol).value() == value;
}
}

SymbolPtr Simplifier::operator()(const SymbolPtr& symbol)
{
    auto it = _cache.find(symbol.get());
    if (it != _cache.end()) {
        return it->second;
    }
    SymbolPtr result = simplifyNode(symbol);
    _cache.emplace(symbol.get(), result);
    return result;
}

SymbolPtr Simplifier::simplifyNode(const SymbolPtr& symbol)
{
    std::vector<SymbolPtr> children;
    children.reserve(symbol->children().size());
    for (const SymbolPtr& child : symbol->children()) {
        children.push_back((*this)(child));
    }
    SymbolPtr node = symbol->withChildren(children);

    if (!node->children().empty() && node->isConstant()) {
        return fold(node);
    }

    switch (node->kind()) {
        case Symbol::Kind::Add: {
            const SymbolPtr& a = node->children()[0];
            const SymbolPtr& b = node->children()[1];
            if (isScalarValue(a, 0.0)) return b;
            if (isScalarValue(b, 0.0)) return a;
            break;
        }
        case Symbol::Kind::Subtract: {
            const SymbolPtr& a = node->children()[0];
            const SymbolPtr& b = node->children()[1];
            if (isScalarValue(b, 0.0)) return a;
            if (isScalarValue(a, 0.0)) return std::make_shared<Negate>(b);
            break;
        }
        case Symbol::Kind::Multiply: {
            const SymbolPtr& a = node->children()[0];
            const SymbolPtr& b = node->children()[1];
            if (isScalarValue(a, 1.0)) return b;
            if (isScalarValue(b, 1.0)) return a;
            break;
        }
        case Symbol::Kind::Divide:
        case Symbol::Kind::Power:
            if (isScalarValue(node->children()[1], 1.0)) return node->children()[0];
            break;
        case Symbol::Kind::Negate: {
            const SymbolPtr& inner = node->children()[0];
            if (inner->kind() == Symbol::Kind::Negate) return inner->children()[0];
            break;
        }
        default:
            break;
    }
    return node;
}

SymbolPtr Simplifier::fold(const SymbolPtr& symbol)
{
    std::vector<double> value = symbol->evaluate();
    if (value.size() == 1) {
        return std::make_shared<Scalar>(value[0]);
    }
    return std::make_shared<VectorConstant>(std::move(value), symbol->toString(), symbol->domain());
}

SymbolPtr simplify(const SymbolPtr& symbol)
{
    Simplifier simplifier;
    return simplifier(symbol);
}
