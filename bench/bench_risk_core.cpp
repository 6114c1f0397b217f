/**
 * @file  bench/bench_risk_core.cpp
 * @brief Google Benchmark suite for the hot paths of the risk core.
 *
 * Benchmarks
 * ----------
 *   BM_SafeMulDiv              - 128-bit checked multiply-divide
 *   BM_ValidatePrice           - full validation with a warm history
 *   BM_DetectorAssess          - manipulation checks over a full history
 *   BM_BreakerGate             - gate on an existing Closed key
 *   BM_ComputeLtv              - multi-asset LTV over N collateral assets
 *   BM_RiskCore_CheckLiquidation - facade path incl. price fetch
 *
 * Build (CMake):
 *   cmake -DOLEND_BENCH=ON ..
 *   cmake --build build --target bench_risk_core
 *   ./build/bench_risk_core --benchmark_format=json
 */

#include "benchmark/benchmark.h"

#include "olend/circuit_breaker.hpp"
#include "olend/clock.hpp"
#include "olend/events.hpp"
#include "olend/manipulation.hpp"
#include "olend/oracle.hpp"
#include "olend/risk.hpp"
#include "olend/risk_core.hpp"
#include "olend/safe_math.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace olend;

// ── Fixture helpers ────────────────────────────────────────────────────────────

namespace {

constexpr std::int64_t E8 = 100'000'000;

/// Quote source returning one fixed quote per asset, re-stamped at `clock`.
class FixedFeed final : public PriceFeed {
public:
    explicit FixedFeed(const Clock& clock) : clock_(clock) {}

    Result<oracle::RawQuote> latest(AssetId) override {
        return oracle::RawQuote{50'000 * E8, 0, -8, clock_.now()};
    }

private:
    const Clock& clock_;
};

/// A gently oscillating price path around 50 000.
std::vector<PricePoint> make_history(std::size_t n) {
    std::vector<PricePoint> v;
    v.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const Price base = static_cast<Price>(50'000 * E8);
        const Price p = i % 2 == 0 ? base + 10 * E8 : base - 10 * E8;
        v.push_back(PricePoint{p, 0, 1'000 * (i + 1)});
    }
    return v;
}

} // namespace

// ── Arithmetic ─────────────────────────────────────────────────────────────────

static void BM_SafeMulDiv(benchmark::State& state) {
    std::uint64_t a = 123'456'789'012ULL;
    for (auto _ : state) {
        auto r = math::safe_mul_div(a, 98'765'432'100ULL, 1'000'000'007ULL);
        benchmark::DoNotOptimize(r);
        ++a;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_SafeMulDiv);

// ── Price validation ───────────────────────────────────────────────────────────

static void BM_ValidatePrice(benchmark::State& state) {
    NullEventSink events;
    oracle::PriceValidator validator(events);
    const AssetId btc = AssetId::from_symbol("BTC");
    oracle::PriceFeedConfig feed;
    feed.symbol  = "BTC";
    feed.feed_id = "bench:btc";
    if (!validator.set_feed(btc, feed)) {
        state.SkipWithError("feed rejected");
        return;
    }

    Timestamp now = 1'000;
    std::int64_t price = 50'000 * E8;
    for (auto _ : state) {
        now += 1'000;
        price += (now / 1'000) % 2 == 0 ? E8 : -E8;
        auto r = validator.validate(btc, oracle::RawQuote{price, 0, -8, now}, now);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_ValidatePrice);

static void BM_DetectorAssess(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    PriceHistory history(n);
    for (const auto& p : make_history(n)) {
        if (!history.push(p)) {
            state.SkipWithError("history push failed");
            return;
        }
    }
    manipulation::ManipulationDetector detector;
    const PricePoint incoming{static_cast<Price>(50'500 * E8), 0, 1'000 * (n + 1)};
    for (auto _ : state) {
        auto r = detector.assess(history, incoming, 1'000);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_DetectorAssess)->RangeMultiplier(2)->Range(8, 100);

// ── Breakers ───────────────────────────────────────────────────────────────────

static void BM_BreakerGate(benchmark::State& state) {
    NullEventSink events;
    breaker::CircuitBreakerRegistry registry(events);
    const breaker::OperationKey key{breaker::OperationType::Borrow, AssetId::from_symbol("USDC")};
    Timestamp now = 1;
    for (auto _ : state) {
        auto d = registry.gate(key, ++now);
        benchmark::DoNotOptimize(d);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_BreakerGate);

// ── Risk engine ────────────────────────────────────────────────────────────────

static void BM_ComputeLtv(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    risk::CollateralPolicy policy;
    risk::PriceBook book;
    risk::BorrowPosition position;
    position.id = 1;
    position.borrower = "bench";

    for (std::size_t i = 0; i < n; ++i) {
        const AssetId a = AssetId::from_symbol("C" + std::to_string(i));
        policy.assets[a] = risk::AssetRiskParams{static_cast<risk::AssetClass>(i % 4), 8};
        book[a] = ValidatedPriceInfo{.price = static_cast<Price>(100 * E8), .confidence = 0,
                                     .timestamp = 1, .validation_score = 100,
                                     .manipulation_risk = ManipulationRisk::None,
                                     .is_valid = true};
        position.collateral[a] = 10 * static_cast<Amount>(E8);
    }
    const AssetId usd = AssetId::from_symbol("USD");
    policy.assets[usd] = risk::AssetRiskParams{risk::AssetClass::Stablecoin, 8};
    book[usd] = ValidatedPriceInfo{.price = static_cast<Price>(E8), .confidence = 0,
                                   .timestamp = 1, .validation_score = 100,
                                   .manipulation_risk = ManipulationRisk::None,
                                   .is_valid = true};
    position.borrowed_asset  = usd;
    position.borrowed_amount = 300 * static_cast<Amount>(n) * static_cast<Amount>(E8);

    const risk::RiskEngine engine(policy);
    for (auto _ : state) {
        auto r = engine.compute_ltv(position, book);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_ComputeLtv)->RangeMultiplier(2)->Range(1, 16);

static void BM_RiskCore_CheckLiquidation(benchmark::State& state) {
    ManualClock clock(1'000'000);
    FixedFeed feed(clock);
    StaticTierProvider tiers;
    NullEventSink events;
    const AdminCap cap = AdminCap::mint();

    const AssetId btc  = AssetId::from_symbol("BTC");
    const AssetId usdc = AssetId::from_symbol("USDC");
    RiskCoreConfig config;
    config.policy.assets[btc]  = risk::AssetRiskParams{risk::AssetClass::BlueChip, 8};
    config.policy.assets[usdc] = risk::AssetRiskParams{risk::AssetClass::Stablecoin, 8};

    auto created = RiskCore::create(cap, config, clock, feed, tiers, events);
    if (!created) {
        state.SkipWithError("core rejected config");
        return;
    }
    auto& core = *created;
    for (const char* symbol : {"BTC", "USDC"}) {
        oracle::PriceFeedConfig f;
        f.symbol  = symbol;
        f.feed_id = std::string("bench:") + symbol;
        f.max_deviation_bps = 10'000;
        if (!core->set_feed(cap, AssetId::from_symbol(symbol), f)) {
            state.SkipWithError("feed rejected");
            return;
        }
    }

    risk::BorrowPosition position;
    position.id = 7;
    position.borrower = "bench";
    position.collateral[btc] = static_cast<Amount>(E8);
    position.borrowed_asset  = usdc;
    position.borrowed_amount = 30'000 * static_cast<Amount>(E8);

    for (auto _ : state) {
        clock.advance(1'000);
        auto r = core->check_liquidation(position);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_RiskCore_CheckLiquidation);

BENCHMARK_MAIN();
