#include <gtest/gtest.h>
#include "backtest/backtest_engine.hpp"
#include "fakes/fake_market_data_client.hpp"
#include <cmath>

using namespace optiscan;
using namespace optiscan::backtest;
using namespace std::chrono_literals;
using optiscan::fakes::FakeMarketDataClient;

namespace {

const Timestamp kDetected = convert::from_epoch_ms(1705000000000);

detect::StoredOpportunity stored_opportunity(OpportunityId id, Price price = 2.0) {
    detect::Opportunity opp;
    opp.contract = market::ContractKey{"SPY", market::OptionType::Call, 450.0, "2024-01-19"};
    opp.detected_at = kDetected;
    opp.price = price;
    opp.volume = 500;
    opp.underlying_price = 448.0;
    opp.alert_type = "whale_activity";
    opp.strategy = "follow_smart_money";
    return detect::StoredOpportunity{id, opp};
}

/// One bar per minute starting at detection, with the given prices
std::vector<market::HistoricalBar> minute_bars(std::initializer_list<double> prices,
                                               Timestamp start = kDetected) {
    std::vector<market::HistoricalBar> bars;
    auto t = start;
    for (double p : prices) {
        bars.push_back(market::HistoricalBar{.timestamp = t, .volume = 10, .price = p});
        t += 1min;
    }
    return bars;
}

Config::Backtest short_horizons() {
    Config::Backtest config;
    config.horizons = {1min, 5min};
    config.ranking_horizon = 5min;
    config.profit_targets = {10.0, 20.0};
    config.stop_loss = -15.0;
    return config;
}

}  // namespace

// ============================================================================
// Price lookup
// ============================================================================

TEST(PriceAtTest, LastBarAtOrBeforeTarget) {
    auto bars = minute_bars({2.0, 2.1, 2.2, 2.3});

    auto price = BacktestEngine::price_at(bars, kDetected, kDetected + 2min + 30s);

    ASSERT_TRUE(price.has_value());
    EXPECT_DOUBLE_EQ(*price, 2.2);
}

TEST(PriceAtTest, IgnoresBarsBeforeDetection) {
    auto bars = minute_bars({9.0, 2.5, 2.6}, kDetected - 1min);

    auto price = BacktestEngine::price_at(bars, kDetected, kDetected);

    ASSERT_TRUE(price.has_value());
    EXPECT_DOUBLE_EQ(*price, 2.5);
}

TEST(PriceAtTest, FirstBarWhenAllAreLater) {
    auto bars = minute_bars({2.4, 2.5}, kDetected + 3min);

    auto price = BacktestEngine::price_at(bars, kDetected, kDetected + 1min);

    ASSERT_TRUE(price.has_value());
    EXPECT_DOUBLE_EQ(*price, 2.4);
}

TEST(PriceAtTest, AbsentWhenDataEndsBeforeTarget) {
    auto bars = minute_bars({2.0, 2.1});

    EXPECT_FALSE(BacktestEngine::price_at(bars, kDetected, kDetected + 5min).has_value());
}

TEST(PriceAtTest, AbsentWhenNoBars) {
    EXPECT_FALSE(BacktestEngine::price_at({}, kDetected, kDetected + 1min).has_value());
}

// ============================================================================
// Evaluation
// ============================================================================

TEST(BacktestEngineTest, PercentChange) {
    EXPECT_DOUBLE_EQ(percent_change(2.0, 2.2), 10.0);
    EXPECT_DOUBLE_EQ(percent_change(2.0, 1.5), -25.0);
}

TEST(BacktestEngineTest, TenPercentAfterFiveMinutes) {
    FakeMarketDataClient client;
    auto stored = stored_opportunity(1);
    client.set_contract_bars(stored.opportunity.contract,
                             minute_bars({2.0, 2.04, 2.06, 2.08, 2.1, 2.2, 2.3}));
    BacktestEngine engine(client, short_horizons());

    auto result = engine.evaluate(stored);

    ASSERT_TRUE(result.is_ok());
    const auto& r = result.value();
    EXPECT_EQ(r.opportunity_id, 1);
    EXPECT_DOUBLE_EQ(r.entry_price, 2.0);
    ASSERT_TRUE(r.return_at(1min).has_value());
    EXPECT_NEAR(*r.return_at(1min), 2.0, 1e-9);
    ASSERT_TRUE(r.return_at(5min).has_value());
    EXPECT_NEAR(*r.return_at(5min), 10.0, 1e-9);
    EXPECT_EQ(r.exit_outcome, ExitOutcome::TargetHit);
    EXPECT_NEAR(*r.exit_return, 10.0, 1e-9);
    EXPECT_NEAR(*r.peak_return, 10.0, 1e-9);  // 2.3 falls outside the window
}

TEST(BacktestEngineTest, EvaluationIsIdempotent) {
    FakeMarketDataClient client;
    auto stored = stored_opportunity(3);
    client.set_contract_bars(stored.opportunity.contract, minute_bars({2.0, 1.9, 2.1, 2.2, 2.0, 2.4}));
    BacktestEngine engine(client, short_horizons());

    auto first = engine.evaluate(stored);
    auto second = engine.evaluate(stored);

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), second.value());
}

TEST(BacktestEngineTest, HorizonBeyondDataIsAbsent) {
    FakeMarketDataClient client;
    auto stored = stored_opportunity(2);
    client.set_contract_bars(stored.opportunity.contract, minute_bars({2.0, 2.1, 2.2}));
    BacktestEngine engine(client, short_horizons());

    auto result = engine.evaluate(stored);

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().return_at(1min).has_value());
    EXPECT_FALSE(result.value().return_at(5min).has_value());
    EXPECT_EQ(result.value().returns.size(), 1u);
}

TEST(BacktestEngineTest, NoHistoryYieldsEmptyResult) {
    FakeMarketDataClient client;
    BacktestEngine engine(client, short_horizons());

    auto result = engine.evaluate(stored_opportunity(4));

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().returns.empty());
    EXPECT_FALSE(result.value().peak_return.has_value());
    EXPECT_EQ(result.value().exit_outcome, ExitOutcome::Open);
}

TEST(BacktestEngineTest, TransientFailureIsError) {
    FakeMarketDataClient client;
    auto stored = stored_opportunity(5);
    client.fail_contract_bars(stored.opportunity.contract, Error::transient("HTTP 503"));
    BacktestEngine engine(client, short_horizons());

    auto result = engine.evaluate(stored);

    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().is(ErrorKind::TransientFetch));
}

TEST(BacktestEngineTest, NonPositiveEntryIsError) {
    FakeMarketDataClient client;
    BacktestEngine engine(client, short_horizons());

    auto result = engine.evaluate(stored_opportunity(6, 0.0));

    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().is(ErrorKind::DataUnavailable));
    EXPECT_EQ(client.contract_bar_calls(), 0);
}

TEST(BacktestEngineTest, StopLossExit) {
    FakeMarketDataClient client;
    auto stored = stored_opportunity(7);
    client.set_contract_bars(stored.opportunity.contract, minute_bars({2.0, 1.8, 1.6, 2.5}));
    BacktestEngine engine(client, short_horizons());

    auto result = engine.evaluate(stored);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().exit_outcome, ExitOutcome::StoppedOut);
    EXPECT_NEAR(*result.value().exit_return, -20.0, 1e-9);
    EXPECT_NEAR(*result.value().peak_return, 25.0, 1e-9);
}

TEST(BacktestEngineTest, UnderlyingBasis) {
    FakeMarketDataClient client;
    auto stored = stored_opportunity(8);
    client.set_underlying_bars("SPY", minute_bars({448.0, 449.0, 450.0, 451.0, 452.0, 453.0}));
    auto config = short_horizons();
    config.price_basis = PriceBasis::Underlying;
    BacktestEngine engine(client, config);

    auto result = engine.evaluate(stored);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().basis, PriceBasis::Underlying);
    EXPECT_DOUBLE_EQ(result.value().entry_price, 448.0);
    EXPECT_NEAR(*result.value().return_at(5min), (453.0 - 448.0) / 448.0 * 100.0, 1e-9);
    EXPECT_EQ(client.underlying_bar_calls(), 1);
    EXPECT_EQ(client.contract_bar_calls(), 0);
}

TEST(BacktestEngineTest, RunBatchPreservesOrder) {
    FakeMarketDataClient client;
    std::vector<detect::StoredOpportunity> batch;
    for (OpportunityId id = 1; id <= 12; ++id) {
        auto stored = stored_opportunity(id);
        stored.opportunity.contract.strike = 400.0 + static_cast<double>(id);
        client.set_contract_bars(stored.opportunity.contract,
                                 minute_bars({2.0, 2.0, 2.0, 2.0, 2.0, 2.0 + 0.01 * static_cast<double>(id)}));
        batch.push_back(stored);
    }
    batch.push_back(stored_opportunity(99, -1.0));
    BacktestEngine engine(client, short_horizons());

    auto results = engine.run_batch(batch);

    ASSERT_EQ(results.size(), batch.size());
    for (std::size_t i = 0; i + 1 < results.size(); ++i) {
        ASSERT_TRUE(results[i].is_ok());
        EXPECT_EQ(results[i].value().opportunity_id, batch[i].id);
        EXPECT_NEAR(*results[i].value().return_at(5min),
                    0.5 * static_cast<double>(batch[i].id), 1e-9);
    }
    EXPECT_TRUE(results.back().is_err());
}

TEST(BacktestEngineTest, ExitOutcomeNames) {
    EXPECT_EQ(to_string(ExitOutcome::TargetHit), "target_hit");
    EXPECT_EQ(parse_exit_outcome("stopped_out"), ExitOutcome::StoppedOut);
    EXPECT_FALSE(parse_exit_outcome("sideways").has_value());
}
