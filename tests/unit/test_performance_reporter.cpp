#include <gtest/gtest.h>
#include "engine/performance_reporter.hpp"
#include "storage/in_memory_store.hpp"
#include "fakes/fake_market_data_client.hpp"

using namespace optiscan;
using namespace std::chrono_literals;
using optiscan::fakes::FakeMarketDataClient;
using optiscan::fakes::make_snapshot;

namespace {

const Timestamp kT0 = convert::from_epoch_ms(1705000000000);

std::vector<market::HistoricalBar> rising_bars(Price start, int minutes) {
    std::vector<market::HistoricalBar> bars;
    for (int i = 1; i <= minutes; ++i) {
        bars.push_back(market::HistoricalBar{
            .timestamp = kT0 + std::chrono::minutes{i},
            .volume = 10,
            .price = start + 0.1 * i,
        });
    }
    return bars;
}

}  // namespace

// ============================================================================
// Performance reporter
// ============================================================================

class PerformanceReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        snapshot = make_snapshot("SPY", 450.0, 2.0, 500, kT0);
        auto opp = detect::make_opportunity("SPY", snapshot, detect::kWhaleActivity, "follow_smart_money");
        id = store.save(opp).take_value();
    }

    /// Just past the largest horizon plus the give-up window
    Timestamp after_give_up() const {
        return kT0 + config.max_horizon() + config.give_up_after + 1min;
    }

    Config::Backtest config;  // 20m largest horizon, 24h give-up window
    FakeMarketDataClient client;
    storage::InMemoryOpportunityStore store;
    market::OptionSnapshot snapshot;
    OpportunityId id{0};
};

TEST_F(PerformanceReporterTest, EvaluatedResultIsPersisted) {
    client.set_contract_bars(snapshot.key(), rising_bars(2.0, 20));
    backtest::BacktestEngine engine(client, config);
    engine::PerformanceReporter reporter(config, engine, store);

    auto report = reporter.run(kT0 + 25min);

    EXPECT_EQ(report.pending, 1u);
    EXPECT_EQ(report.evaluated, 1u);
    EXPECT_EQ(report.closed, 0u);
    EXPECT_EQ(report.leaderboard.total_opportunities, 1u);
    EXPECT_EQ(report.leaderboard.by_strategy.at("follow_smart_money").count, 1u);
    EXPECT_EQ(reporter.run(kT0 + 30min).pending, 0u);
}

TEST_F(PerformanceReporterTest, MissingEntryPriceIsClosedOnFirstRun) {
    // Underlying basis with no underlying price can never be evaluated
    config.price_basis = PriceBasis::Underlying;
    storage::InMemoryOpportunityStore local;
    snapshot.underlying_price = 0.0;
    auto opp = detect::make_opportunity("SPY", snapshot, detect::kWhaleActivity, "follow_smart_money");
    auto local_id = local.save(opp).take_value();

    backtest::BacktestEngine engine(client, config);
    engine::PerformanceReporter reporter(config, engine, local);

    auto first = reporter.run(kT0 + 25min);
    EXPECT_EQ(first.pending, 1u);
    EXPECT_EQ(first.closed, 1u);
    EXPECT_EQ(first.failed, 0u);

    auto recorded = local.backtest_result(local_id);
    ASSERT_TRUE(recorded.has_value());
    EXPECT_TRUE(recorded->no_data);
    EXPECT_TRUE(recorded->returns.empty());

    auto second = reporter.run(kT0 + 90min);
    EXPECT_EQ(second.pending, 0u);
    EXPECT_EQ(second.leaderboard.total_opportunities, 0u);
    EXPECT_EQ(client.underlying_bar_calls(), 0);
}

TEST_F(PerformanceReporterTest, MissingHistoryDeferredUntilGiveUp) {
    backtest::BacktestEngine engine(client, config);
    engine::PerformanceReporter reporter(config, engine, store);

    auto early = reporter.run(kT0 + 25min);
    EXPECT_EQ(early.deferred, 1u);
    EXPECT_FALSE(store.backtest_result(id).has_value());

    auto later = reporter.run(kT0 + 2h);
    EXPECT_EQ(later.pending, 1u);
    EXPECT_EQ(later.deferred, 1u);

    auto stale = reporter.run(after_give_up());
    EXPECT_EQ(stale.deferred, 0u);
    EXPECT_EQ(stale.closed, 1u);
    ASSERT_TRUE(store.backtest_result(id).has_value());
    EXPECT_TRUE(store.backtest_result(id)->no_data);

    auto after = reporter.run(after_give_up() + 1h);
    EXPECT_EQ(after.pending, 0u);
    EXPECT_EQ(client.contract_bar_calls(), 3);
}

TEST_F(PerformanceReporterTest, TransientFailuresRetriedUntilGiveUp) {
    client.fail_contract_bars(snapshot.key(), Error::transient("HTTP 503"));
    backtest::BacktestEngine engine(client, config);
    engine::PerformanceReporter reporter(config, engine, store);

    auto early = reporter.run(kT0 + 25min);
    EXPECT_EQ(early.failed, 1u);
    EXPECT_EQ(early.closed, 0u);

    auto stale = reporter.run(after_give_up());
    EXPECT_EQ(stale.failed, 0u);
    EXPECT_EQ(stale.closed, 1u);
    EXPECT_EQ(reporter.run(after_give_up() + 1h).pending, 0u);
}
