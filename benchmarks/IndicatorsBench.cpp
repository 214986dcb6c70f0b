#include <benchmark/benchmark.h>
#include "sta/ta/Indicators.hpp"
#include "sta/ta/AnyIndicator.hpp"
#include <random>
#include <vector>

static std::vector<double> makeSeries(std::size_t n) {
    std::mt19937 rng(42);
    std::normal_distribution<double> step(0.0, 1.0);
    std::vector<double> xs(n);
    double x = 100.0;
    for (auto& v : xs) { x += step(rng); v = x; }
    return xs;
}

template <typename Ind>
static void runNext(benchmark::State& state, Ind ind) {
    const auto xs = makeSeries(4096);
    std::size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(ind.next(xs[i]));
        i = (i + 1) & 4095;
    }
    state.SetItemsProcessed(state.iterations());
}

static void BM_SmaNext(benchmark::State& state) {
    runNext(state, sta::ta::Sma(static_cast<std::size_t>(state.range(0))));
}
BENCHMARK(BM_SmaNext)->Arg(9)->Arg(50)->Arg(200)->Unit(benchmark::kNanosecond);

static void BM_MaximumNext(benchmark::State& state) {
    runNext(state, sta::ta::Maximum(static_cast<std::size_t>(state.range(0))));
}
BENCHMARK(BM_MaximumNext)->Arg(14)->Arg(200)->Arg(1000)->Unit(benchmark::kNanosecond);

static void BM_WmaNext(benchmark::State& state) {
    runNext(state, sta::ta::Wma(static_cast<std::size_t>(state.range(0))));
}
BENCHMARK(BM_WmaNext)->Arg(9)->Arg(50)->Arg(200)->Unit(benchmark::kNanosecond);

static void BM_MacdNext(benchmark::State& state) {
    runNext(state, sta::ta::Macd(12, 26, 9));
}
BENCHMARK(BM_MacdNext)->Unit(benchmark::kNanosecond);

static void BM_BollingerNext(benchmark::State& state) {
    runNext(state, sta::ta::BollingerBands(static_cast<std::size_t>(state.range(0)), 2.0));
}
BENCHMARK(BM_BollingerNext)->Arg(20)->Arg(200)->Unit(benchmark::kNanosecond);

static void BM_AdapterNext(benchmark::State& state) {
    auto ind = sta::ta::makeIndicator(sta::ta::KeltnerChannel(20, 2.0));
    const auto xs = makeSeries(4096);
    std::size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(ind->next(xs[i]));
        i = (i + 1) & 4095;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AdapterNext)->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();
