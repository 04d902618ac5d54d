// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "covenant/contract/observable.hpp"
#include <cmath>
#include <sstream>

namespace covenant {
namespace {

// ===========================================================================
// Construction
// ===========================================================================

TEST(ObservableTest, LeavesHaveDepthOne) {
    EXPECT_EQ(constant(1.0).depth(), 1u);
    EXPECT_EQ(underlying("AAPL").depth(), 1u);
    EXPECT_FALSE(constant(1.0).references_market());
    EXPECT_TRUE(underlying("AAPL").references_market());
}

TEST(ObservableTest, OperatorsBuildBinaryNodes) {
    auto expr = underlying("AAPL") - 100.0;
    const auto* op = std::get_if<observable::BinaryOp>(&expr.node().form);
    ASSERT_NE(op, nullptr);
    EXPECT_EQ(op->op, BinaryOperator::Subtract);
    EXPECT_EQ(expr.depth(), 2u);
    EXPECT_TRUE(expr.references_market());
    EXPECT_FALSE(expr.is_condition());
}

TEST(ObservableTest, ComparisonsAreConditions) {
    auto trigger = greater(underlying("AAPL"), 120.0);
    EXPECT_TRUE(trigger.is_condition());
    EXPECT_TRUE(less(constant(1.0), constant(2.0)).is_condition());
    EXPECT_TRUE(equal(underlying("X"), 0.0).is_condition());
    EXPECT_FALSE(max(0.0, underlying("X")).is_condition());
}

TEST(ObservableTest, SharedSubexpressionKeepsIdentity) {
    auto s = underlying("AAPL");
    auto a = s + s;
    const auto& op = std::get<observable::BinaryOp>(a.node().form);
    EXPECT_EQ(&op.lhs.node(), &op.rhs.node());
}

// ===========================================================================
// Folding
// ===========================================================================

TEST(ObservableTest, FoldConstantEvaluatesMarketFreeExpressions) {
    auto v = fold_constant(max(constant(3.0), constant(5.0)) * 2.0 - 1.0);
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 9.0);

    auto avg_v = fold_constant(avg(constant(2.0), constant(4.0)));
    ASSERT_TRUE(avg_v.has_value());
    EXPECT_DOUBLE_EQ(*avg_v, 3.0);

    auto cond = fold_constant(greater(constant(2.0), 1.0));
    ASSERT_TRUE(cond.has_value());
    EXPECT_DOUBLE_EQ(*cond, 1.0);
}

TEST(ObservableTest, FoldConstantRejectsMarketAndBadArithmetic) {
    EXPECT_FALSE(fold_constant(underlying("AAPL") * 2.0).has_value());
    EXPECT_FALSE(fold_constant(constant(1.0) / constant(0.0)).has_value());
    EXPECT_FALSE(fold_constant(constant(INFINITY)).has_value());
}

TEST(ObservableTest, ApplyOperators) {
    EXPECT_DOUBLE_EQ(apply_binary(BinaryOperator::Add, 2.0, 3.0), 5.0);
    EXPECT_DOUBLE_EQ(apply_binary(BinaryOperator::Min, 2.0, 3.0), 2.0);
    EXPECT_DOUBLE_EQ(apply_binary(BinaryOperator::Average, 2.0, 3.0), 2.5);
    EXPECT_TRUE(std::isinf(apply_binary(BinaryOperator::Divide, 1.0, 0.0)));

    EXPECT_TRUE(apply_comparison(Comparison::GreaterEqual, 2.0, 2.0));
    EXPECT_FALSE(apply_comparison(Comparison::Less, 2.0, 2.0));
    EXPECT_TRUE(apply_comparison(Comparison::LessEqual, 1.0, 2.0));
}

TEST(ObservableTest, CollectUnderlyingsVisitsBothSides) {
    std::set<std::string, std::less<>> names;
    collect_underlyings(greater(underlying("MSFT") - underlying("AAPL"), constant(5.0)), names);
    ASSERT_EQ(names.size(), 2u);
    EXPECT_TRUE(names.contains("AAPL"));
    EXPECT_TRUE(names.contains("MSFT"));
}

// ===========================================================================
// Printing
// ===========================================================================

TEST(ObservableTest, PrintsCallPayoff) {
    EXPECT_EQ(to_string(max(0.0, underlying("AAPL") - 100.0)), "max(0, (AAPL - 100))");
}

TEST(ObservableTest, PrintsCondition) {
    std::ostringstream os;
    os << greater(underlying("AAPL"), 120.0);
    EXPECT_EQ(os.str(), "(AAPL > 120)");
}

}  // namespace
}  // namespace covenant
