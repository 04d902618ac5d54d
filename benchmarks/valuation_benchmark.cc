// SPDX-License-Identifier: MIT
/// @file valuation_benchmark.cc
/// @brief Per-contract latency for valuation and Greeks
///
/// Covers the closed-form leaf, analytic Greeks propagation, forward-path
/// searches (American exercise) and batch valuation of a strike ladder.
///
/// Usage:
///   ./valuation_benchmark --benchmark_filter=Greeks

#include "covenant/contract/derived_contracts.hpp"
#include "covenant/pricing/valuation_engine.hpp"
#include <benchmark/benchmark.h>
#include <vector>

using namespace covenant;

namespace {

MarketModel Market() {
    MarketData data;
    data.quotes["AAPL"] = UnderlyingQuote{.spot = 100.0, .volatility = 0.25};
    data.quotes["MSFT"] = UnderlyingQuote{.spot = 300.0, .volatility = 0.20};
    data.rate = 0.05;
    return MarketModel::create(std::move(data)).value();
}

/// Coupon bond with quarterly coupons and a call spread overlay
Contract StructuredNote() {
    std::vector<int> coupons{91, 182, 273, 365};
    auto bond = coupon_bond(365, 100.0, 1.25, coupons, Currency::USD).value();
    auto spread = bull_call_spread("AAPL", 100.0, 120.0, 365, Currency::USD).value();
    return bond + spread;
}

}  // namespace

// ===========================================================================
// Valuation
// ===========================================================================

static void BM_EuropeanCall(benchmark::State& state) {
    auto market = Market();
    auto call = european_call("AAPL", 100.0, 90, Currency::USD).value();
    ValuationEngine engine;
    for (auto _ : state) {
        auto v = engine.value(call, market);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_EuropeanCall);

static void BM_StructuredNote(benchmark::State& state) {
    auto market = Market();
    auto note = StructuredNote();
    ValuationEngine engine;
    for (auto _ : state) {
        auto v = engine.value(note, market);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_StructuredNote);

static void BM_AmericanPut(benchmark::State& state) {
    MarketData data;
    data.quotes["AAPL"] = UnderlyingQuote{.spot = 90.0, .volatility = 0.25};
    data.rate = 0.05;
    auto market = MarketModel::create(std::move(data)).value();
    auto put = american_put("AAPL", 100.0, static_cast<int>(state.range(0)), Currency::USD).value();
    ValuationEngine engine;
    for (auto _ : state) {
        auto v = engine.value(put, market);
        benchmark::DoNotOptimize(v);
    }
    state.SetLabel("daily exercise grid");
}
BENCHMARK(BM_AmericanPut)->Arg(30)->Arg(90)->Arg(365);

// ===========================================================================
// Greeks
// ===========================================================================

static void BM_Greeks_EuropeanCall(benchmark::State& state) {
    auto market = Market();
    auto call = european_call("AAPL", 100.0, 90, Currency::USD).value();
    ValuationEngine engine;
    for (auto _ : state) {
        auto g = engine.greeks(call, market);
        benchmark::DoNotOptimize(g);
    }
}
BENCHMARK(BM_Greeks_EuropeanCall);

static void BM_Greeks_StructuredNote(benchmark::State& state) {
    auto market = Market();
    auto note = StructuredNote();
    ValuationEngine engine;
    for (auto _ : state) {
        auto g = engine.greeks(note, market);
        benchmark::DoNotOptimize(g);
    }
}
BENCHMARK(BM_Greeks_StructuredNote);

// ===========================================================================
// Batch
// ===========================================================================

static void BM_BatchStrikeLadder(benchmark::State& state) {
    auto market = Market();
    std::vector<Contract> ladder;
    const int n = static_cast<int>(state.range(0));
    for (int i = 0; i < n; ++i) {
        double strike = 80.0 + 40.0 * i / n;
        ladder.push_back(european_call("AAPL", strike, 90 + i % 270, Currency::USD).value());
    }
    ValuationEngine engine;
    for (auto _ : state) {
        auto result = engine.value_batch(ladder, market);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_BatchStrikeLadder)->Arg(64)->Arg(1024);

BENCHMARK_MAIN();
