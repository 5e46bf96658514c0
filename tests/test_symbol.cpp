#include <gtest/gtest.h>
#include <pdekit/expression/SymbolOperators.h>
#include <pdekit/utils/Errors.h>
#include <cmath>
#include "test_utils.h"

// ============================================================================
// Evaluation
// ============================================================================

TEST(SymbolTest, ScalarArithmetic) {
    SymbolPtr a = makeScalar(3.0);
    SymbolPtr b = makeScalar(4.0);

    EXPECT_NEAR((a + b)->evaluate()[0], 7.0, EXACT_TOL);
    EXPECT_NEAR((a - b)->evaluate()[0], -1.0, EXACT_TOL);
    EXPECT_NEAR((a * b)->evaluate()[0], 12.0, EXACT_TOL);
    EXPECT_NEAR((a / b)->evaluate()[0], 0.75, EXACT_TOL);
    EXPECT_NEAR(pow(a, 2.0)->evaluate()[0], 9.0, EXACT_TOL);
    EXPECT_NEAR((-a)->evaluate()[0], -3.0, EXACT_TOL);
    EXPECT_NEAR(abs(a - b)->evaluate()[0], 1.0, EXACT_TOL);
    EXPECT_NEAR((2.0 * a + 1.0)->evaluate()[0], 7.0, EXACT_TOL);
}

TEST(SymbolTest, ElementwiseFunctions) {
    SymbolPtr x = makeScalar(0.25);
    EXPECT_NEAR(sqrt(x)->evaluate()[0], 0.5, EXACT_TOL);
    EXPECT_NEAR(exp(x)->evaluate()[0], std::exp(0.25), EXACT_TOL);
    EXPECT_NEAR(log(x)->evaluate()[0], std::log(0.25), EXACT_TOL);
    EXPECT_NEAR(sin(x)->evaluate()[0], std::sin(0.25), EXACT_TOL);
    EXPECT_NEAR(cos(x)->evaluate()[0], std::cos(0.25), EXACT_TOL);
    EXPECT_NEAR(tanh(x)->evaluate()[0], std::tanh(0.25), EXACT_TOL);
}

TEST(SymbolTest, StateVectorSlicesAndBroadcasts) {
    std::vector<double> y = {1.0, 2.0, 3.0, 4.0, 5.0};
    auto u = std::make_shared<StateVector>(1, 3, "u", "rod");
    SymbolPtr expr = 2.0 * SymbolPtr(u) + makeTime();

    std::vector<double> value = expr->evaluate(0.5, y);
    ASSERT_EQ(value.size(), 3u);
    EXPECT_NEAR(value[0], 4.5, EXACT_TOL);
    EXPECT_NEAR(value[1], 6.5, EXACT_TOL);
    EXPECT_NEAR(value[2], 8.5, EXACT_TOL);
}

TEST(SymbolTest, ShapeMismatchIsDiscretisationError) {
    std::vector<double> y = {1.0, 2.0, 3.0, 4.0, 5.0};
    SymbolPtr a = std::make_shared<StateVector>(0, 2, "a", "rod");
    SymbolPtr b = std::make_shared<StateVector>(2, 3, "b", "rod");
    EXPECT_THROW((a + b)->evaluate(0.0, y), DiscretisationError);
}

TEST(SymbolTest, StateVectorOutsideStateThrows) {
    auto u = std::make_shared<StateVector>(3, 3, "u", "rod");
    EXPECT_THROW(u->evaluate(0.0, {1.0, 2.0}), DiscretisationError);
}

TEST(SymbolTest, ContinuousNodesCannotBeEvaluated) {
    auto c = makeVariable("c", "particle");
    EXPECT_THROW(c->evaluate(), DiscretisationError);
    EXPECT_THROW(grad(c)->evaluate(), DiscretisationError);
    EXPECT_THROW(makeParameter("k")->evaluate(), ModelError);
}

TEST(SymbolTest, MatrixProductAppliesOperator) {
    auto matrix = std::make_shared<const SparseMatrix>(
        2, 3, std::vector<SparseMatrix::Triplet>{{0, 0, 1.0}, {0, 2, -1.0}, {1, 1, 2.0}});
    auto u = std::make_shared<StateVector>(0, 3, "u", "rod");
    auto product = std::make_shared<MatrixProduct>(matrix, u, "A", "rod");

    std::vector<double> value = product->evaluate(0.0, {1.0, 2.0, 5.0});
    ASSERT_EQ(value.size(), 2u);
    EXPECT_NEAR(value[0], -4.0, EXACT_TOL);
    EXPECT_NEAR(value[1], 4.0, EXACT_TOL);

    // A size-1 operand is broadcast to a column of equal values
    auto fromScalar = std::make_shared<MatrixProduct>(matrix, makeScalar(1.0), "A", "rod");
    value = fromScalar->evaluate();
    EXPECT_NEAR(value[0], 0.0, EXACT_TOL);
    EXPECT_NEAR(value[1], 2.0, EXACT_TOL);
}

// ============================================================================
// Structure
// ============================================================================

TEST(SymbolTest, DomainsPropagateAndMustMatch) {
    auto c = makeVariable("c", "particle");
    auto e = makeVariable("e", "electrolyte");

    EXPECT_EQ((2.0 * c)->domain(), "particle");
    EXPECT_EQ(grad(c)->domain(), "particle");
    EXPECT_EQ(surf(c)->domain(), "");
    EXPECT_THROW(c + e, ModelError);
}

TEST(SymbolTest, SpatialOperatorsNeedADomain) {
    auto v = makeVariable("voltage");
    EXPECT_THROW(grad(v), ModelError);
    EXPECT_THROW(surf(v), ModelError);
    EXPECT_THROW(makeSpatialVariable("x", ""), ModelError);

    auto c = makeVariable("c", "particle");
    auto x = makeSpatialVariable("x", "electrode");
    EXPECT_THROW(integral(c, x), ModelError);
}

TEST(SymbolTest, IdsAreUnique) {
    auto a = makeVariable("c", "particle");
    auto b = makeVariable("c", "particle");
    EXPECT_NE(a->id(), b->id());
}

TEST(SymbolTest, SharedSubexpressionIsOneNode) {
    auto c = makeVariable("c", "particle");
    SymbolPtr s = surf(c);
    SymbolPtr expr = s * (1.0 - s);

    EXPECT_EQ(expr->children()[0].get(), expr->children()[1]->children()[1].get());
    EXPECT_TRUE(expr->has(Symbol::Kind::BoundaryValue));
    EXPECT_FALSE(expr->has(Symbol::Kind::Gradient));
}

TEST(SymbolTest, WithChildrenReusesUnchangedNode) {
    auto c = makeVariable("c", "particle");
    SymbolPtr expr = c * 2.0;

    SymbolPtr same = expr->withChildren(expr->children());
    EXPECT_EQ(same.get(), expr.get());

    SymbolPtr replaced = expr->withChildren({makeScalar(3.0), expr->children()[1]});
    EXPECT_NE(replaced.get(), expr.get());
    EXPECT_EQ(replaced->kind(), Symbol::Kind::Multiply);
    EXPECT_NEAR(replaced->evaluate()[0], 6.0, EXACT_TOL);

    EXPECT_THROW(expr->withChildren({makeScalar(1.0)}), std::invalid_argument);
}

TEST(SymbolTest, ConstantDetection) {
    auto c = makeVariable("c", "particle");
    EXPECT_TRUE((makeScalar(1.0) + 2.0)->isConstant());
    EXPECT_FALSE((makeTime() * 2.0)->isConstant());
    EXPECT_FALSE((c + 1.0)->isConstant());
    EXPECT_FALSE(SymbolPtr(makeParameter("k"))->isConstant());
}

TEST(SymbolTest, KnownEvalsCacheSharedNodes) {
    auto u = std::make_shared<StateVector>(0, 2, "u", "rod");
    SymbolPtr shared = SymbolPtr(u) * 3.0;
    SymbolPtr expr = shared + shared;

    KnownEvals known;
    const std::vector<double>& value = expr->evaluate(0.0, {1.0, 2.0}, known);
    EXPECT_NEAR(value[0], 6.0, EXACT_TOL);
    EXPECT_NEAR(value[1], 12.0, EXACT_TOL);
    EXPECT_EQ(known.count(shared.get()), 1u);
    EXPECT_EQ(known.count(expr.get()), 1u);
}

TEST(SymbolTest, ToStringReadsLikeTheExpression) {
    auto c = makeVariable("c", "particle");
    EXPECT_EQ((c + 1.0)->toString(), "(c + 1)");
    EXPECT_EQ((-c)->toString(), "-c");
    EXPECT_EQ(grad(c)->toString(), "grad(c)");
}
