// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "covenant/market/market_model.hpp"
#include "market_fixtures.hpp"
#include <cmath>
#include <limits>

namespace covenant {
namespace {

using testing::flat_market;
using testing::two_asset_market;

// ===========================================================================
// Construction
// ===========================================================================

TEST(MarketModelTest, CreateFromFlatRate) {
    auto market = flat_market(100.0, 0.25, 0.05, 10);
    EXPECT_EQ(market.evaluation_day(), 10);
    EXPECT_EQ(market.curve_origin_day(), 10);
    EXPECT_EQ(market.variance_origin_day(), 10);
    EXPECT_EQ(market.base_currency(), Currency::USD);
    EXPECT_TRUE(market.has_underlying("AAPL"));
    EXPECT_FALSE(market.has_underlying("MSFT"));
    EXPECT_DOUBLE_EQ(market.spot("AAPL").value(), 100.0);
    EXPECT_DOUBLE_EQ(market.volatility("AAPL").value(), 0.25);
}

TEST(MarketModelTest, UnderlyingsAreSorted) {
    auto names = two_asset_market().underlyings();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "AAPL");
    EXPECT_EQ(names[1], "MSFT");
}

TEST(MarketModelTest, RejectsInvalidQuotes) {
    MarketData negative_spot;
    negative_spot.quotes["AAPL"] = UnderlyingQuote{.spot = -1.0, .volatility = 0.2};
    auto a = MarketModel::create(negative_spot);
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error().code, MarketErrorCode::InvalidSpot);
    EXPECT_EQ(a.error().underlying, "AAPL");

    MarketData zero_vol;
    zero_vol.quotes["AAPL"] = UnderlyingQuote{.spot = 100.0, .volatility = 0.0};
    auto b = MarketModel::create(zero_vol);
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error().code, MarketErrorCode::NonPositiveVolatility);

    MarketData empty_name;
    empty_name.quotes[""] = UnderlyingQuote{.spot = 100.0, .volatility = 0.2};
    auto c = MarketModel::create(empty_name);
    ASSERT_FALSE(c.has_value());
    EXPECT_EQ(c.error().code, MarketErrorCode::EmptyUnderlyingName);
}

TEST(MarketModelTest, ZeroSpotIsAccepted) {
    MarketData data;
    data.quotes["AAPL"] = UnderlyingQuote{.spot = 0.0, .volatility = 0.2};
    EXPECT_TRUE(MarketModel::create(data).has_value());
}

TEST(MarketModelTest, RejectsNonFiniteRate) {
    MarketData data;
    data.rate = std::numeric_limits<double>::quiet_NaN();
    auto market = MarketModel::create(data);
    ASSERT_FALSE(market.has_value());
    EXPECT_EQ(market.error().code, MarketErrorCode::NonFiniteRate);
}

TEST(MarketModelTest, RejectsEmptyCurve) {
    MarketData data;
    data.rate = YieldCurve{};
    auto market = MarketModel::create(data);
    ASSERT_FALSE(market.has_value());
    EXPECT_EQ(market.error().code, MarketErrorCode::InvalidYieldCurve);
}

TEST(MarketModelTest, UnknownUnderlying) {
    auto market = flat_market();
    auto s = market.spot("MSFT");
    ASSERT_FALSE(s.has_value());
    EXPECT_EQ(s.error().code, MarketErrorCode::UnknownUnderlying);
    EXPECT_FALSE(market.volatility("MSFT").has_value());
    EXPECT_FALSE(market.forward("MSFT", 10).has_value());
}

// ===========================================================================
// Discounting
// ===========================================================================

TEST(MarketModelTest, DiscountFromEvaluationDay) {
    auto market = flat_market(100.0, 0.25, 0.05, 0);
    EXPECT_NEAR(market.discount(365), std::exp(-0.05), 1e-12);
    EXPECT_NEAR(market.discount(0), 1.0, 1e-15);
    EXPECT_NEAR(market.discount(90, 455), std::exp(-0.05), 1e-12);
}

TEST(MarketModelTest, ForwardAtNinetyDays) {
    auto market = flat_market();
    EXPECT_NEAR(market.forward("AAPL", 90).value(), 101.2405, 1e-4);
    EXPECT_DOUBLE_EQ(market.forward("AAPL", 0).value(), 100.0);
}

TEST(MarketModelTest, CurveDrivenDiscount) {
    auto curve = YieldCurve::from_points({{0.0, 0.0}, {1.0, -0.03}, {2.0, -0.08}}).value();
    MarketData data;
    data.quotes["AAPL"] = UnderlyingQuote{.spot = 100.0, .volatility = 0.2};
    data.rate = curve;
    auto market = MarketModel::create(data).value();

    EXPECT_NEAR(market.discount(365), std::exp(-0.03), 1e-12);
    EXPECT_NEAR(market.discount(730), std::exp(-0.08), 1e-12);
    EXPECT_NEAR(market.forward_rate(500), 0.05, 1e-12);
}

TEST(MarketModelTest, VarianceTimeClampsAtOrigin) {
    auto market = flat_market(100.0, 0.25, 0.05, 20);
    EXPECT_DOUBLE_EQ(market.variance_time(20 + 73), 0.2);
    EXPECT_DOUBLE_EQ(market.variance_time(10), 0.0);
}

// ===========================================================================
// Bumping and rolling
// ===========================================================================

TEST(MarketModelTest, BumpsDoNotMutateOriginal) {
    auto market = flat_market();
    auto up = market.with_spot("AAPL", 101.0);
    ASSERT_TRUE(up.has_value());
    EXPECT_DOUBLE_EQ(up->spot("AAPL").value(), 101.0);
    EXPECT_DOUBLE_EQ(market.spot("AAPL").value(), 100.0);

    auto vol = market.with_volatility("AAPL", 0.3);
    ASSERT_TRUE(vol.has_value());
    EXPECT_DOUBLE_EQ(vol->volatility("AAPL").value(), 0.3);
    EXPECT_DOUBLE_EQ(market.volatility("AAPL").value(), 0.25);
}

TEST(MarketModelTest, BumpsAreValidated) {
    auto market = flat_market();
    auto s = market.with_spot("AAPL", -1.0);
    ASSERT_FALSE(s.has_value());
    EXPECT_EQ(s.error().code, MarketErrorCode::InvalidSpot);

    auto v = market.with_volatility("AAPL", 0.0);
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, MarketErrorCode::NonPositiveVolatility);

    auto u = market.with_spot("MSFT", 1.0);
    ASSERT_FALSE(u.has_value());
    EXPECT_EQ(u.error().code, MarketErrorCode::UnknownUnderlying);
}

TEST(MarketModelTest, RateShiftMovesDiscount) {
    auto market = flat_market();
    auto up = market.with_rate_shift(0.01);
    ASSERT_TRUE(up.has_value());
    EXPECT_NEAR(up->discount(365), std::exp(-0.06), 1e-12);
    EXPECT_FALSE(market.with_rate_shift(std::numeric_limits<double>::infinity()).has_value());
}

TEST(MarketModelTest, WithEvaluationDayMovesAllOrigins) {
    auto market = flat_market(100.0, 0.25, 0.05, 0);
    auto later = market.with_evaluation_day(5);
    EXPECT_EQ(later.evaluation_day(), 5);
    EXPECT_EQ(later.curve_origin_day(), 5);
    EXPECT_EQ(later.variance_origin_day(), 5);
    EXPECT_DOUBLE_EQ(later.spot("AAPL").value(), 100.0);
    EXPECT_NEAR(later.discount(370), std::exp(-0.05), 1e-12);
}

TEST(MarketModelTest, RolledToKeepsOriginsAndGrowsSpot) {
    auto market = flat_market();
    auto rolled = market.rolled_to(90);
    ASSERT_TRUE(rolled.has_value());
    EXPECT_EQ(rolled->evaluation_day(), 90);
    EXPECT_EQ(rolled->curve_origin_day(), 0);
    EXPECT_EQ(rolled->variance_origin_day(), 0);
    EXPECT_NEAR(rolled->spot("AAPL").value(), 101.2405, 1e-4);
    EXPECT_NEAR(rolled->variance_time(90), 90.0 / 365.0, 1e-15);
    EXPECT_NEAR(rolled->discount(455), std::exp(-0.05), 1e-12);
}

TEST(MarketModelTest, RolledToRejectsPastDay) {
    auto market = flat_market(100.0, 0.25, 0.05, 10);
    auto rolled = market.rolled_to(5);
    ASSERT_FALSE(rolled.has_value());
    EXPECT_EQ(rolled.error().code, ValuationErrorCode::NegativeTimeOffset);
}

}  // namespace
}  // namespace covenant
