#ifndef PDEKIT_SIMPLIFY_H
#define PDEKIT_SIMPLIFY_H

#include <pdekit/expression/Symbol.h>
#include <unordered_map>

/**
 * @class Simplifier
 * @brief Constant folding and identity removal on an expression DAG
 *
 * Rules:
 *   - a node whose subtree is constant is replaced by a Scalar / VectorConstant
 *   - x + 0, 0 + x, x - 0, x * 1, 1 * x, x / 1, x ** 1  ->  x
 *   - 0 - x  ->  -x,   -(-x)  ->  x
 *
 * A Simplifier memoises on node identity, so expressions that share nodes keep
 * sharing the simplified nodes. Use one instance per model.
 */
class Simplifier
{
public:
    SymbolPtr operator()(const SymbolPtr& symbol);

private:
    std::unordered_map<const Symbol*, SymbolPtr> _cache;

    SymbolPtr simplifyNode(const SymbolPtr& symbol);
    static SymbolPtr fold(const SymbolPtr& symbol);
};

// One-off simplification of a single expression
SymbolPtr simplify(const SymbolPtr& symbol);

#endif // PDEKIT_SIMPLIFY_H
