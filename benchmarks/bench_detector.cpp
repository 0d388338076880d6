#include <benchmark/benchmark.h>
#include "detect/detector.hpp"
#include "market/message_parser.hpp"
#include "scoring/rule_based_scorer.hpp"
#include <random>
#include <string>

using namespace optiscan;
using namespace optiscan::detect;

namespace {

std::vector<market::OptionSnapshot> random_chain(std::size_t size) {
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> price_dist(0.05, 40.0);
    std::exponential_distribution<double> volume_dist(1.0 / 300.0);
    std::uniform_real_distribution<double> iv_dist(0.1, 1.2);

    std::vector<market::OptionSnapshot> chain;
    chain.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        market::OptionSnapshot snap;
        snap.symbol = "SPY";
        snap.option_type = i % 2 == 0 ? market::OptionType::Call : market::OptionType::Put;
        snap.strike = 400.0 + static_cast<double>(i / 2);
        snap.expiration = "2024-01-19";
        snap.price = price_dist(rng);
        snap.volume = static_cast<Contracts>(volume_dist(rng));
        snap.open_interest = 1000;
        snap.greeks = market::Greeks{.implied_volatility = iv_dist(rng)};
        snap.underlying_price = 450.0;
        chain.push_back(std::move(snap));
    }
    return chain;
}

DetectionContext fixed_baseline_context(scoring::ScorerRef scorer = std::nullopt) {
    DetectionContext ctx;
    ctx.baseline = [](const market::ContractKey&) {
        return Baseline{.average_volume = 150.0, .sample_count = 20};
    };
    ctx.scorer = scorer;
    return ctx;
}

}  // namespace

// Whale detector over a full chain
static void BM_WhaleDetectorChain(benchmark::State& state) {
    auto chain = random_chain(static_cast<std::size_t>(state.range(0)));
    Config::Whale config;
    config.min_notional_value = 100'000.0;
    Detector detector = WhaleActivityDetector(config);
    auto ctx = fixed_baseline_context();

    for (auto _ : state) {
        std::size_t found = 0;
        for (const auto& snap : chain) {
            found += evaluate(detector, "SPY", snap, ctx).has_value() ? 1 : 0;
        }
        benchmark::DoNotOptimize(found);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_WhaleDetectorChain)->Range(64, 4096);

// Every built-in detector with rule scoring attached
static void BM_AllDetectorsScored(benchmark::State& state) {
    auto chain = random_chain(1024);
    Config config;
    config.whale.min_notional_value = 100'000.0;
    auto detectors = make_detectors(config);
    scoring::RuleBasedScorer scorer;
    auto ctx = fixed_baseline_context(std::cref<scoring::Scorer>(scorer));

    for (auto _ : state) {
        std::size_t found = 0;
        for (const auto& snap : chain) {
            for (const auto& detector : detectors) {
                found += evaluate(detector, "SPY", snap, ctx).has_value() ? 1 : 0;
            }
        }
        benchmark::DoNotOptimize(found);
    }
    state.SetItemsProcessed(state.iterations() * 1024);
}
BENCHMARK(BM_AllDetectorsScored);

// Chain response parsing
static void BM_ParseOptionChain(benchmark::State& state) {
    std::string json = R"({"data":[)";
    for (int i = 0; i < state.range(0); ++i) {
        if (i > 0) {
            json += ',';
        }
        json += R"({"option_type":"call","strike":)" + std::to_string(400 + i) +
                R"(,"expiration":"20240119","last":2.5,"bid":2.4,"ask":2.6,"volume":1200,)"
                R"("open_interest":5000,"underlying_price":448.2,"timestamp":1705000000000,)"
                R"("greeks":{"implied_volatility":0.42,"delta":0.51}})";
    }
    json += "]}";

    auto fetched_at = convert::from_epoch_ms(1705000000000);
    for (auto _ : state) {
        auto chain = market::MessageParser::parse_option_chain(json, "SPY", fetched_at);
        benchmark::DoNotOptimize(chain);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ParseOptionChain)->Range(16, 2048);

BENCHMARK_MAIN();
