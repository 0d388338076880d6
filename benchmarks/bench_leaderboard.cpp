#include <benchmark/benchmark.h>
#include "backtest/backtest_engine.hpp"
#include "backtest/leaderboard.hpp"
#include <algorithm>
#include <random>

using namespace optiscan;
using namespace optiscan::backtest;
using namespace std::chrono_literals;

namespace {

const Timestamp kT0 = convert::from_epoch_ms(1705000000000);

std::vector<BacktestResult> random_results(std::size_t count) {
    std::mt19937 rng(7);
    std::normal_distribution<double> return_dist(1.0, 12.0);
    const std::vector<std::chrono::minutes> horizons{1min, 5min, 10min, 15min, 20min};

    std::vector<BacktestResult> results;
    results.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        BacktestResult r;
        r.opportunity_id = static_cast<OpportunityId>(i + 1);
        r.alert_type = i % 3 == 0 ? "day_trading" : "whale_activity";
        r.contract = market::ContractKey{"SPY", market::OptionType::Call,
                                         400.0 + static_cast<double>(i % 100), "2024-01-19"};
        r.detected_at = kT0 + std::chrono::seconds{i};
        for (auto h : horizons) {
            // Some results stop short of the longer horizons
            if (h > 10min && i % 4 == 0) {
                break;
            }
            r.returns[h] = return_dist(rng);
        }
        results.push_back(std::move(r));
    }
    return results;
}

std::vector<market::HistoricalBar> minute_bars(std::size_t count) {
    std::mt19937 rng(11);
    std::normal_distribution<double> move(0.0, 0.02);
    std::vector<market::HistoricalBar> bars;
    bars.reserve(count);
    double price = 2.0;
    for (std::size_t i = 0; i < count; ++i) {
        price = std::max(0.01, price + move(rng));
        bars.push_back(market::HistoricalBar{
            .timestamp = kT0 + std::chrono::minutes{i}, .volume = 10.0, .price = price});
    }
    return bars;
}

}  // namespace

// Leaderboard aggregation over N results
static void BM_LeaderboardBuild(benchmark::State& state) {
    auto results = random_results(static_cast<std::size_t>(state.range(0)));
    LeaderboardBuilder builder(Config::Backtest{});

    for (auto _ : state) {
        auto summary = builder.build(results);
        benchmark::DoNotOptimize(summary);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_LeaderboardBuild)->Range(16, 16384);

// Forward-return evaluation over prefetched bars
static void BM_EvaluateBars(benchmark::State& state) {
    auto bars = minute_bars(static_cast<std::size_t>(state.range(0)));
    Config::Backtest config;
    detect::StoredOpportunity stored;
    stored.id = 1;
    stored.opportunity.detected_at = kT0;
    stored.opportunity.price = 2.0;

    for (auto _ : state) {
        auto result = BacktestEngine::evaluate_bars(stored, 2.0, bars, config);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_EvaluateBars)->Range(8, 512);

BENCHMARK_MAIN();
