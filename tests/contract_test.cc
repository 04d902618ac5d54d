// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "covenant/contract/contract.hpp"
#include <sstream>

namespace covenant {
namespace {

Contract usd() { return one(Currency::USD); }

// ===========================================================================
// Construction and validation
// ===========================================================================

TEST(ContractTest, PrimitivesHaveExpectedForms) {
    EXPECT_TRUE(std::holds_alternative<contract::Zero>(zero().node().form));
    const auto* o = std::get_if<contract::One>(&usd().node().form);
    ASSERT_NE(o, nullptr);
    EXPECT_EQ(o->currency, Currency::USD);
    EXPECT_TRUE(std::holds_alternative<contract::Give>(give(usd()).node().form));
    EXPECT_TRUE(std::holds_alternative<contract::And>((usd() + usd()).node().form));
    EXPECT_TRUE(std::holds_alternative<contract::Or>((usd() | zero()).node().form));
    EXPECT_TRUE(std::holds_alternative<contract::Give>((-usd()).node().form));
}

TEST(ContractTest, ThenRejectsNegativeDay) {
    auto c = then(-1, usd());
    ASSERT_FALSE(c.has_value());
    EXPECT_EQ(c.error().code, ContractErrorCode::NegativeTimeOffset);
    EXPECT_DOUBLE_EQ(c.error().value, -1.0);

    EXPECT_TRUE(then(0, usd()).has_value());
}

TEST(ContractTest, TruncateRejectsNegativeDay) {
    auto c = truncate(-7, usd());
    ASSERT_FALSE(c.has_value());
    EXPECT_EQ(c.error().code, ContractErrorCode::NegativeTimeBound);
}

TEST(ContractTest, TriggersMustBeConditions) {
    auto numeric = underlying("AAPL") - 100.0;
    auto w = when(numeric, usd());
    ASSERT_FALSE(w.has_value());
    EXPECT_EQ(w.error().code, ContractErrorCode::TriggerNotCondition);

    auto a = anytime(numeric, usd());
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error().code, ContractErrorCode::TriggerNotCondition);

    EXPECT_TRUE(when(greater(underlying("AAPL"), 100.0), usd()).has_value());
    EXPECT_TRUE(anytime(less(underlying("AAPL"), 100.0), usd()).has_value());
}

TEST(ContractTest, DepthIncludesObservables) {
    EXPECT_EQ(usd().depth(), 1u);
    EXPECT_EQ(give(usd()).depth(), 2u);
    auto payoff = max(0.0, underlying("AAPL") - 100.0);  // depth 3
    auto c = then(90, scale(payoff, usd()));
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->depth(), 5u);
}

// ===========================================================================
// Queries
// ===========================================================================

TEST(ContractTest, SharedSubtreesCountedOnce) {
    auto leaf = scale(underlying("AAPL"), usd());
    auto shared = leaf + leaf;
    EXPECT_EQ(unique_node_count(shared), 3u);  // And, Scale, One

    auto distinct = scale(underlying("AAPL"), usd()) + scale(underlying("AAPL"), usd());
    EXPECT_EQ(unique_node_count(distinct), 5u);
}

TEST(ContractTest, ReferencedUnderlyingsIncludeTriggers) {
    auto c = when(greater(underlying("MSFT"), 300.0), scale(underlying("AAPL"), usd()));
    ASSERT_TRUE(c.has_value());
    auto names = referenced_underlyings(*c);
    EXPECT_EQ(names.size(), 2u);
    EXPECT_TRUE(names.contains("AAPL"));
    EXPECT_TRUE(names.contains("MSFT"));
    EXPECT_TRUE(referenced_underlyings(usd()).empty());
}

TEST(ContractTest, SettlementCurrencies) {
    auto mixed = usd() + give(one(Currency::EUR));
    auto currencies = settlement_currencies(mixed);
    EXPECT_EQ(currencies.size(), 2u);
    EXPECT_TRUE(currencies.contains(Currency::EUR));
    EXPECT_TRUE(settlement_currencies(zero()).empty());
}

TEST(ContractTest, PathApproximationDetection) {
    EXPECT_FALSE(uses_path_approximation(then(10, usd()).value() + zero()));
    EXPECT_TRUE(uses_path_approximation(truncate(10, usd()).value()));
    auto w = when(greater(underlying("AAPL"), 1.0), usd()).value();
    EXPECT_TRUE(uses_path_approximation(give(w)));
}

// ===========================================================================
// Printing
// ===========================================================================

TEST(ContractTest, PrintsEuropeanCall) {
    auto call = then(90, scale(max(0.0, underlying("AAPL") - 100.0), usd()));
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(to_string(*call), "Then(90, Scale(max(0, (AAPL - 100)), One(USD)))");
}

TEST(ContractTest, PrintsCompositeTree) {
    std::ostringstream os;
    os << (zero() + give(one(Currency::EUR)));
    EXPECT_EQ(os.str(), "And(Zero, Give(One(EUR)))");

    auto t = truncate(30, anytime(greater(underlying("X"), 1.0), usd()).value());
    EXPECT_EQ(to_string(t.value()), "Truncate(30, Anytime((X > 1), One(USD)))");
}

}  // namespace
}  // namespace covenant
