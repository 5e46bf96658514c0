#include <gtest/gtest.h>
#include <pdekit/expression/Simplify.h>
#include <pdekit/expression/SymbolOperators.h>
#include "test_utils.h"

TEST(SimplifyTest, FoldsConstantSubtrees) {
    SymbolPtr expr = (makeScalar(2.0) + 3.0) * sqrt(makeScalar(4.0));
    SymbolPtr folded = simplify(expr);

    ASSERT_EQ(folded->kind(), Symbol::Kind::Scalar);
    EXPECT_NEAR(static_cast<const Scalar&>(*folded).value(), 10.0, EXACT_TOL);
}

TEST(SimplifyTest, FoldsConstantVectors) {
    auto nodes = std::make_shared<VectorConstant>(std::vector<double>{1.0, 2.0, 3.0}, "x", "rod");
    SymbolPtr folded = simplify(2.0 * SymbolPtr(nodes));

    ASSERT_EQ(folded->kind(), Symbol::Kind::VectorConstant);
    EXPECT_EQ(folded->domain(), "rod");
    const auto& values = static_cast<const VectorConstant&>(*folded).values();
    ASSERT_EQ(values.size(), 3u);
    EXPECT_NEAR(values[2], 6.0, EXACT_TOL);
}

TEST(SimplifyTest, RemovesIdentities) {
    SymbolPtr u = std::make_shared<StateVector>(0, 2, "u", "rod");

    EXPECT_EQ(simplify(u + 0.0).get(), u.get());
    EXPECT_EQ(simplify(0.0 + u).get(), u.get());
    EXPECT_EQ(simplify(u - 0.0).get(), u.get());
    EXPECT_EQ(simplify(u * 1.0).get(), u.get());
    EXPECT_EQ(simplify(1.0 * u).get(), u.get());
    EXPECT_EQ(simplify(u / 1.0).get(), u.get());
    EXPECT_EQ(simplify(pow(u, 1.0)).get(), u.get());
    EXPECT_EQ(simplify(-(-u)).get(), u.get());

    SymbolPtr negated = simplify(0.0 - u);
    EXPECT_EQ(negated->kind(), Symbol::Kind::Negate);
    EXPECT_EQ(negated->children()[0].get(), u.get());
}

TEST(SimplifyTest, IdentityInsideConstantFold) {
    // (1 - 1) * u -> 0 * u is kept: multiplication by zero is not an identity
    SymbolPtr u = std::make_shared<StateVector>(0, 2, "u", "rod");
    SymbolPtr simplified = simplify((makeScalar(1.0) - 1.0) * u);
    EXPECT_EQ(simplified->kind(), Symbol::Kind::Multiply);

    std::vector<double> value = simplified->evaluate(0.0, {3.0, 4.0});
    EXPECT_NEAR(value[0], 0.0, EXACT_TOL);
    EXPECT_NEAR(value[1], 0.0, EXACT_TOL);
}

TEST(SimplifyTest, PreservesValue) {
    SymbolPtr u = std::make_shared<StateVector>(0, 3, "u", "rod");
    SymbolPtr expr = (u * 1.0 + 0.0) * (makeScalar(2.0) * 3.0) - exp(makeScalar(0.0)) + makeTime();
    std::vector<double> y = {0.5, 1.5, -2.0};

    std::vector<double> before = expr->evaluate(2.0, y);
    std::vector<double> after = simplify(expr)->evaluate(2.0, y);
    ASSERT_EQ(before.size(), after.size());
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_NEAR(before[i], after[i], EXACT_TOL);
    }
}

TEST(SimplifyTest, SharedNodesStayShared) {
    SymbolPtr u = std::make_shared<StateVector>(0, 2, "u", "rod");
    SymbolPtr shared = exp(u * 1.0 + makeTime());
    SymbolPtr first = shared + 1.0;
    SymbolPtr second = shared * 2.0;

    Simplifier simplifier;
    SymbolPtr a = simplifier(first);
    SymbolPtr b = simplifier(second);
    EXPECT_EQ(a->children()[0].get(), b->children()[0].get());
}

TEST(SimplifyTest, LeavesContinuousNodesAlone) {
    auto c = makeVariable("c", "particle");
    SymbolPtr expr = grad(c);
    EXPECT_EQ(simplify(expr).get(), expr.get());
}
