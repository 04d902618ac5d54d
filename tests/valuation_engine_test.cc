// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "covenant/contract/derived_contracts.hpp"
#include "covenant/pricing/valuation_engine.hpp"
#include "market_fixtures.hpp"
#include <cmath>
#include <memory>
#include <string>
#include <vector>

namespace covenant {
namespace {

using testing::flat_market;
using testing::two_asset_market;

constexpr Currency USD = Currency::USD;

// ===========================================================================
// Reference scenarios
// ===========================================================================

TEST(ValuationEngineTest, ZeroCouponBond) {
    auto bond = zcb(365, 1000.0, USD);
    ASSERT_TRUE(bond.has_value());
    auto v = value(*bond, flat_market());
    ASSERT_TRUE(v.has_value());
    EXPECT_NEAR(v->amount, 951.229424500714, 1e-9);
    EXPECT_EQ(v->currency, USD);
}

TEST(ValuationEngineTest, EuropeanCallAndPut) {
    auto market = flat_market();
    auto call = european_call("AAPL", 100.0, 90, USD);
    auto put = european_put("AAPL", 100.0, 90, USD);
    ASSERT_TRUE(call.has_value());
    ASSERT_TRUE(put.has_value());

    auto c = value(*call, market);
    auto p = value(*put, market);
    ASSERT_TRUE(c.has_value());
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(c->amount, 5.555864832239791, 1e-9);
    EXPECT_NEAR(p->amount, 4.330556908309688, 1e-9);
}

TEST(ValuationEngineTest, PutCallParity) {
    auto market = flat_market();
    auto call = european_call("AAPL", 100.0, 90, USD).value();
    auto put = european_put("AAPL", 100.0, 90, USD).value();
    auto fwd = forward_contract("AAPL", 100.0, 90, USD).value();

    auto lhs = value(call + give(put), market);
    auto rhs = value(fwd, market);
    ASSERT_TRUE(lhs.has_value());
    ASSERT_TRUE(rhs.has_value());
    EXPECT_NEAR(lhs->amount, 1.225307923930103, 1e-9);
    EXPECT_NEAR(lhs->amount, rhs->amount, 1e-9);
}

TEST(ValuationEngineTest, BullSpreadToday) {
    auto spread = bull_call_spread("AAPL", 100.0, 110.0, 90, USD);
    ASSERT_TRUE(spread.has_value());
    auto v = value(*spread, flat_market());
    ASSERT_TRUE(v.has_value());
    EXPECT_NEAR(v->amount, 3.6082734983151354, 1e-9);
}

TEST(ValuationEngineTest, BullSpreadAtMaturity) {
    auto spread = bull_call_spread("AAPL", 100.0, 110.0, 90, USD).value();
    auto v = value(spread, flat_market(150.0, 0.25, 0.05, 90));
    ASSERT_TRUE(v.has_value());
    EXPECT_NEAR(v->amount, 10.0, 1e-12);
}

TEST(ValuationEngineTest, PastMaturityPaysImmediately) {
    // Then() with a day already passed acquires now
    auto c = then(10, scale(5.0, one(USD))).value();
    auto v = value(c, flat_market(100.0, 0.25, 0.05, 20));
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(v->amount, 5.0);
}

TEST(ValuationEngineTest, PrimitiveAlgebra) {
    auto market = flat_market();
    EXPECT_DOUBLE_EQ(value(zero(), market)->amount, 0.0);
    EXPECT_DOUBLE_EQ(value(one(USD), market)->amount, 1.0);
    EXPECT_DOUBLE_EQ(value(give(one(USD)), market)->amount, -1.0);
    EXPECT_DOUBLE_EQ(value(one(USD) + one(USD), market)->amount, 2.0);
    EXPECT_DOUBLE_EQ(value(scale(underlying("AAPL"), one(USD)), market)->amount, 100.0);
    EXPECT_DOUBLE_EQ(value(give(one(USD)) | zero(), market)->amount, 0.0);
}

TEST(ValuationEngineTest, OrTakesBetterLeg) {
    auto market = flat_market();
    auto call = european_call("AAPL", 100.0, 90, USD).value();
    auto put = european_put("AAPL", 100.0, 90, USD).value();
    auto v = value(call | put, market);
    ASSERT_TRUE(v.has_value());
    EXPECT_NEAR(v->amount, 5.555864832239791, 1e-9);
}

TEST(ValuationEngineTest, EmptyCurrencySetUsesBaseCurrency) {
    MarketData data;
    data.quotes["AAPL"] = UnderlyingQuote{.spot = 100.0, .volatility = 0.2};
    data.base_currency = Currency::EUR;
    auto market = MarketModel::create(data).value();
    auto v = value(zero(), market);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->currency, Currency::EUR);
}

TEST(ValuationEngineTest, ValueOnLaterDay) {
    auto market = flat_market();
    auto call = european_call("AAPL", 100.0, 90, USD).value();
    ValuationEngine engine;
    auto today = engine.value(call, market);
    auto later = engine.value(call, market, 30);
    ASSERT_TRUE(today.has_value());
    ASSERT_TRUE(later.has_value());
    EXPECT_NEAR(later->amount * market.discount(30), today->amount, 1e-10);

    auto bond = zcb(365, 100.0, USD).value();
    EXPECT_NEAR(engine.value(bond, market, 365)->amount, 100.0, 1e-12);
}

TEST(ValuationEngineTest, ExoticsOnForwardPath) {
    auto market = two_asset_market();
    const double D90 = market.discount(90);

    // Forward 101.24 is above the strike: the digital pays on the forward path
    auto digital = digital_call("AAPL", 100.0, 10.0, 90, USD).value();
    EXPECT_NEAR(value(digital, market)->amount, 10.0 * D90, 1e-10);

    auto spread = spread_option("MSFT", "AAPL", 150.0, 90, USD).value();
    EXPECT_NEAR(value(spread, market)->amount, (300.0 - 100.0) - 150.0 * D90, 1e-10);

    std::vector<std::string> basket{"AAPL", "MSFT"};
    auto best = best_of_call(basket, 250.0, 90, USD).value();
    EXPECT_NEAR(value(best, market)->amount, 300.0 - 250.0 * D90, 1e-10);
    auto worst = worst_of_call(basket, 250.0, 90, USD).value();
    EXPECT_NEAR(value(worst, market)->amount, 0.0, 1e-12);
}

TEST(ValuationEngineTest, QuantoCallScalesTheClosedFormLeaf) {
    auto quanto = quanto_call("AAPL", 100.0, 1.25, 90, USD).value();
    auto v = value(quanto, flat_market());
    ASSERT_TRUE(v.has_value());
    EXPECT_NEAR(v->amount, 1.25 * 5.555864832239791, 1e-9);
    EXPECT_EQ(v->currency, USD);
}

TEST(ValuationEngineTest, SwapAtParRateIsWorthZero) {
    // Floating leg pays notional * index on each date; a constant index makes it a fixed leg
    MarketData data;
    data.quotes["LIBOR"] = UnderlyingQuote{.spot = 0.04, .volatility = 0.1};
    data.rate = 0.0;
    auto market = MarketModel::create(data).value();
    std::vector<int> days{90, 180, 270, 360};

    auto par = interest_rate_swap(1e6, 0.04, days, "LIBOR", USD).value();
    EXPECT_NEAR(value(par, market)->amount, 0.0, 1e-6);

    auto rich = interest_rate_swap(1e6, 0.05, days, "LIBOR", USD).value();
    EXPECT_NEAR(value(rich, market)->amount, 4.0 * 1e6 * 0.01, 1e-6);
}

TEST(ValuationEngineTest, CouponBondSumsDiscountedFlows) {
    auto market = flat_market();
    std::vector<int> coupons{182, 365};
    auto bond = coupon_bond(365, 100.0, 2.5, coupons, USD).value();
    double expected = 102.5 * market.discount(365) + 2.5 * market.discount(182);
    EXPECT_NEAR(value(bond, market)->amount, expected, 1e-10);
}

// ===========================================================================
// Validation errors
// ===========================================================================

TEST(ValuationEngineTest, MissingUnderlyingIsIncompleteMarket) {
    auto call = european_call("MSFT", 100.0, 90, USD).value();
    auto v = value(call, flat_market());
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, ValuationErrorCode::MarketModelIncomplete);
    EXPECT_EQ(v.error().subject, "MSFT");
}

TEST(ValuationEngineTest, MixedCurrencyRejected) {
    auto mixed = one(USD) + one(Currency::EUR);
    auto v = value(mixed, flat_market());
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, ValuationErrorCode::MixedSettlementCurrency);
}

TEST(ValuationEngineTest, StrictModeRejectsPathCombinators) {
    auto engine = ValuationEngine::create(EngineConfig{.strict = true});
    ASSERT_TRUE(engine.has_value());
    auto american = american_call("AAPL", 100.0, 90, USD).value();
    auto v = engine->value(american, flat_market());
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, ValuationErrorCode::UnsupportedApproximation);

    // Path-free contracts are still fine
    auto european = european_call("AAPL", 100.0, 90, USD).value();
    EXPECT_TRUE(engine->value(european, flat_market()).has_value());
}

TEST(ValuationEngineTest, DepthLimit) {
    auto engine = ValuationEngine::create(EngineConfig{.max_depth = 4});
    ASSERT_TRUE(engine.has_value());
    auto call = european_call("AAPL", 100.0, 90, USD).value();  // depth 5
    auto v = engine->value(call, flat_market());
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, ValuationErrorCode::DepthLimitExceeded);
    EXPECT_DOUBLE_EQ(v.error().value, 5.0);
}

TEST(ValuationEngineTest, NodeLimit) {
    auto engine = ValuationEngine::create(EngineConfig{.max_nodes = 2});
    ASSERT_TRUE(engine.has_value());
    auto v = engine->value(one(USD) + give(one(USD)), flat_market());
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, ValuationErrorCode::DepthLimitExceeded);
}

TEST(ValuationEngineTest, NestedSearchesShareOneBudget) {
    ValuationEngine engine;
    auto above = greater(underlying("AAPL"), 50.0);
    auto inner = anytime(above, then(4000, one(USD)).value()).value();
    auto nested = anytime(above, inner).value();

    // One unbounded search is 3651 candidate days; two nested ones multiply
    EXPECT_TRUE(engine.value(inner, flat_market()).has_value());
    auto v = engine.value(nested, flat_market());
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, ValuationErrorCode::DepthLimitExceeded);
    EXPECT_EQ(v.error().subject, "candidates");
    EXPECT_DOUBLE_EQ(v.error().value, 3651.0 * 3651.0);

    // A 31-day window bounds both searches
    auto bounded = truncate(30, nested).value();
    EXPECT_TRUE(engine.value(bounded, flat_market()).has_value());

    auto tight = ValuationEngine::create(EngineConfig{.max_candidate_evaluations = 900});
    ASSERT_TRUE(tight.has_value());
    auto rejected = tight->value(bounded, flat_market());
    ASSERT_FALSE(rejected.has_value());
    EXPECT_DOUBLE_EQ(rejected.error().value, 31.0 * 31.0);
}

TEST(ValuationEngineTest, DeepChainWithinDefaultLimit) {
    Contract c = one(USD);
    for (int i = 0; i < 200; ++i) {
        c = give(c);
    }
    auto v = value(c, flat_market());
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(v->amount, 1.0);
}

TEST(ValuationEngineTest, InvalidConfiguration) {
    auto step = ValuationEngine::create(EngineConfig{.exercise_step_days = 0});
    ASSERT_FALSE(step.has_value());
    EXPECT_EQ(step.error().code, ValuationErrorCode::InvalidConfiguration);
    EXPECT_EQ(step.error().subject, "exercise_step_days");

    auto horizon = ValuationEngine::create(EngineConfig{.unbounded_horizon_days = -1});
    ASSERT_FALSE(horizon.has_value());
    EXPECT_EQ(horizon.error().code, ValuationErrorCode::InvalidConfiguration);

    auto budget = ValuationEngine::create(EngineConfig{.max_candidate_evaluations = 0});
    ASSERT_FALSE(budget.has_value());
    EXPECT_EQ(budget.error().subject, "max_candidate_evaluations");
}

TEST(ValuationEngineTest, ValuationDayBeforeEvaluationDay) {
    ValuationEngine engine;
    auto v = engine.value(one(USD), flat_market(100.0, 0.25, 0.05, 10), 5);
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, ValuationErrorCode::NegativeTimeOffset);
}

TEST(ValuationEngineTest, RuntimeDomainErrorPropagates) {
    auto c = scale(underlying("AAPL") / (underlying("AAPL") - 100.0), one(USD));
    auto v = value(c, flat_market());
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, ValuationErrorCode::NumericDomainError);
}

TEST(ValuationEngineTest, ValidateReportsStructure) {
    ValuationEngine engine;
    auto spread = spread_option("MSFT", "AAPL", 150.0, 90, USD).value();
    auto checked = engine.validate(spread, two_asset_market());
    ASSERT_TRUE(checked.has_value());
    EXPECT_EQ(checked->currency, USD);
    EXPECT_EQ(checked->node_count, 3u);
    ASSERT_EQ(checked->underlyings.size(), 2u);
    EXPECT_EQ(checked->underlyings[0], "AAPL");
}

// ===========================================================================
// Leaf rule and pluggable pricer
// ===========================================================================

TEST(ValuationEngineTest, MatchVanillaPayoffForms) {
    auto s = underlying("AAPL");
    auto call1 = match_vanilla_payoff(max(0.0, s - 100.0));
    auto call2 = match_vanilla_payoff(max(s - 100.0, 0.0));
    auto put1 = match_vanilla_payoff(max(0.0, 100.0 - s));
    auto put2 = match_vanilla_payoff(max(100.0 - s, 0.0));
    ASSERT_TRUE(call1 && call2 && put1 && put2);
    EXPECT_EQ(call1->type, OptionType::CALL);
    EXPECT_EQ(call2->type, OptionType::CALL);
    EXPECT_EQ(put1->type, OptionType::PUT);
    EXPECT_EQ(put2->type, OptionType::PUT);
    EXPECT_EQ(call1->underlying, "AAPL");
    EXPECT_DOUBLE_EQ(put2->strike, 100.0);

    // Strike folded from a constant expression
    auto folded = match_vanilla_payoff(max(0.0, s - (constant(50.0) * 2.0)));
    ASSERT_TRUE(folded.has_value());
    EXPECT_DOUBLE_EQ(folded->strike, 100.0);
}

TEST(ValuationEngineTest, MatchVanillaPayoffRejects) {
    auto s = underlying("AAPL");
    EXPECT_FALSE(match_vanilla_payoff(s - 100.0).has_value());
    EXPECT_FALSE(match_vanilla_payoff(max(1.0, s - 100.0)).has_value());
    EXPECT_FALSE(match_vanilla_payoff(min(0.0, s - 100.0)).has_value());
    EXPECT_FALSE(match_vanilla_payoff(max(0.0, s - 0.0)).has_value());
    EXPECT_FALSE(match_vanilla_payoff(max(0.0, s - underlying("MSFT"))).has_value());
    EXPECT_FALSE(match_vanilla_payoff(max(0.0, s * 2.0)).has_value());
}

struct RecordingPricer {
    std::shared_ptr<std::vector<EuropeanQuery>> seen = std::make_shared<std::vector<EuropeanQuery>>();

    std::expected<EuropeanQuote, ValuationError>
    price_european(const EuropeanQuery& query, const MarketModel&) const {
        seen->push_back(query);
        return EuropeanQuote{.price = 42.0, .greeks = {}};
    }
};

TEST(ValuationEngineTest, LeavesGoToPluggedPricer) {
    RecordingPricer pricer;
    auto engine = ValuationEngine::create(EngineConfig{}, pricer);
    ASSERT_TRUE(engine.has_value());

    auto put = european_put("AAPL", 95.0, 120, USD).value();
    auto v = engine->value(put, flat_market());
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(v->amount, 42.0);

    ASSERT_EQ(pricer.seen->size(), 1u);
    const auto& q = pricer.seen->front();
    EXPECT_EQ(q.underlying, "AAPL");
    EXPECT_DOUBLE_EQ(q.strike, 95.0);
    EXPECT_EQ(q.maturity_day, 120);
    EXPECT_EQ(q.type, OptionType::PUT);
}

TEST(ValuationEngineTest, NonVanillaPayoffBypassesPricer) {
    RecordingPricer pricer;
    auto engine = ValuationEngine::create(EngineConfig{}, pricer).value();
    auto fwd = forward_contract("AAPL", 100.0, 90, USD).value();
    auto v = engine.value(fwd, flat_market());
    ASSERT_TRUE(v.has_value());
    EXPECT_TRUE(pricer.seen->empty());
    EXPECT_NEAR(v->amount, 1.225307923930103, 1e-9);
}

}  // namespace
}  // namespace covenant
