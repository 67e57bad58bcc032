#include <benchmark/benchmark.h>
#include "orderbook/book_metrics.hpp"
#include "orderbook/order_book_store.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>

using namespace booksync;

namespace {

// Prices step by one tick of 0.001 around 0.500
constexpr Price::underlying_type kTick = 1000;
constexpr Price::underlying_type kMid = 500000;

BookSnapshot make_snapshot(const InstrumentId& id, std::size_t levels) {
    BookSnapshot snapshot;
    snapshot.instrument_id = id;
    snapshot.bids.reserve(levels);
    snapshot.asks.reserve(levels);

    for (std::size_t i = 0; i < levels; ++i) {
        const auto offset = static_cast<Price::underlying_type>(i) * kTick;
        const Size size(10.0 + static_cast<double>(i));
        snapshot.bids.push_back(PriceLevel{Price::from_raw(kMid - kTick - offset), size});
        snapshot.asks.push_back(PriceLevel{Price::from_raw(kMid + kTick + offset), size});
    }
    return snapshot;
}

Config::Book bench_config() {
    Config::Book config;
    config.max_pending_deltas = 1000;
    return config;
}

}  // namespace

// Seeding both ladders from a snapshot of varying depth
static void BM_StoreSeedSnapshot(benchmark::State& state) {
    auto levels = static_cast<std::size_t>(state.range(0));
    auto snapshot = make_snapshot("111", levels);
    OrderBookStore store(bench_config());
    store.ensure_entry("111");

    for (auto _ : state) {
        benchmark::DoNotOptimize(store.seed_from_snapshot(snapshot));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(levels) * 2);  // bids + asks
}
BENCHMARK(BM_StoreSeedSnapshot)->Range(10, 400);

// Replace-at-price delta on an existing level
static void BM_StoreApplyDelta(benchmark::State& state) {
    OrderBookStore store(bench_config());
    store.ensure_entry("111");
    (void)store.seed_from_snapshot(make_snapshot("111", 100));

    Delta delta{"111", Side::Bid, Price::from_raw(kMid - kTick), Size(1.0), {}};
    bool flip = false;
    for (auto _ : state) {
        delta.size = flip ? Size(1.0) : Size(2.0);
        store.apply_delta(delta);
        flip = !flip;
    }
}
BENCHMARK(BM_StoreApplyDelta);

// Removing and restoring the best level
static void BM_StoreBestLevelChange(benchmark::State& state) {
    OrderBookStore store(bench_config());
    store.ensure_entry("111");
    (void)store.seed_from_snapshot(make_snapshot("111", 100));

    Delta remove{"111", Side::Ask, Price::from_raw(kMid + kTick), Size(0.0), {}};
    Delta restore{"111", Side::Ask, Price::from_raw(kMid + kTick), Size(10.0), {}};
    for (auto _ : state) {
        store.apply_delta(remove);
        store.apply_delta(restore);
        benchmark::DoNotOptimize(store.best_prices("111"));
    }
}
BENCHMARK(BM_StoreBestLevelChange);

// Best bid/ask read
static void BM_StoreBestPrices(benchmark::State& state) {
    OrderBookStore store(bench_config());
    store.ensure_entry("111");
    (void)store.seed_from_snapshot(make_snapshot("111", 100));

    for (auto _ : state) {
        benchmark::DoNotOptimize(store.best_prices("111"));
    }
}
BENCHMARK(BM_StoreBestPrices);

// Depth copy with varying truncation
static void BM_StoreDepth(benchmark::State& state) {
    auto max_levels = static_cast<std::size_t>(state.range(0));
    OrderBookStore store(bench_config());
    store.ensure_entry("111");
    (void)store.seed_from_snapshot(make_snapshot("111", 200));

    for (auto _ : state) {
        benchmark::DoNotOptimize(store.depth("111", max_levels));
    }
}
BENCHMARK(BM_StoreDepth)->Range(5, 200);

// Buffering before the snapshot, then seed and replay
static void BM_StoreBufferAndReplay(benchmark::State& state) {
    auto pending = static_cast<std::size_t>(state.range(0));
    auto snapshot = make_snapshot("111", 100);
    OrderBookStore store(bench_config());
    store.ensure_entry("111");

    for (auto _ : state) {
        store.reset("111");
        for (std::size_t i = 0; i < pending; ++i) {
            store.apply_delta(Delta{"111", Side::Bid,
                                    Price::from_raw(kMid - kTick * static_cast<Price::underlying_type>(i % 50 + 1)),
                                    Size(5.0), {}});
        }
        benchmark::DoNotOptimize(store.seed_from_snapshot(snapshot));
    }
}
BENCHMARK(BM_StoreBufferAndReplay)->Range(8, 512);

// Walking the asks for a market buy
static void BM_SimulateFill(benchmark::State& state) {
    OrderBookStore store(bench_config());
    store.ensure_entry("111");
    (void)store.seed_from_snapshot(make_snapshot("111", 100));
    auto depth = store.depth("111");
    const Size size(static_cast<double>(state.range(0)));

    for (auto _ : state) {
        benchmark::DoNotOptimize(book_metrics::simulate_fill(depth, Side::Bid, size));
    }
}
BENCHMARK(BM_SimulateFill)->Range(10, 10000);

int main(int argc, char** argv) {
    // Seeding logs at info level
    spdlog::set_level(spdlog::level::warn);

    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) {
        return 1;
    }
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}
