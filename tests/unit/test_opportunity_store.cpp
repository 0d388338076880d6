#include <gtest/gtest.h>
#include "storage/in_memory_store.hpp"
#include "storage/jsonl_store.hpp"
#include <cstdio>
#include <fstream>
#include <thread>
#include <vector>

using namespace optiscan;
using namespace optiscan::storage;
using namespace std::chrono_literals;

namespace {

const Timestamp kT0 = convert::from_epoch_ms(1705000000000);

detect::Opportunity opportunity(const std::string& symbol, const std::string& alert_type,
                                Timestamp detected = kT0) {
    detect::Opportunity opp;
    opp.contract = market::ContractKey{symbol, market::OptionType::Put, 95.5, "2024-02-16"};
    opp.detected_at = detected;
    opp.price = 4.25;
    opp.volume = 2500;
    opp.open_interest = 900;
    opp.notional_value = convert::notional(opp.price, opp.volume);
    opp.underlying_price = 97.1;
    opp.greeks = market::Greeks{.implied_volatility = 0.61, .delta = -0.4};
    opp.baseline_average_volume = 500.0;
    opp.volume_ratio = 5.0;
    opp.alert_type = alert_type;
    opp.strategy = "follow_smart_money";
    opp.is_unusual_volume = true;
    opp.score = scoring::Score{80.0, "high", "Rule scoring: High volume"};
    return opp;
}

backtest::BacktestResult result_for(OpportunityId id, PercentChange five_minute) {
    backtest::BacktestResult r;
    r.opportunity_id = id;
    r.alert_type = "whale_activity";
    r.contract = market::ContractKey{"SPY", market::OptionType::Put, 95.5, "2024-02-16"};
    r.detected_at = kT0;
    r.entry_price = 4.25;
    r.returns[5min] = five_minute;
    r.peak_return = five_minute;
    r.exit_outcome = backtest::ExitOutcome::Open;
    r.strategy = "follow_smart_money";
    return r;
}

}  // namespace

// ============================================================================
// In-memory store
// ============================================================================

TEST(InMemoryStoreTest, AssignsIncreasingIds) {
    InMemoryOpportunityStore store;

    auto a = store.save(opportunity("SPY", "whale_activity"));
    auto b = store.save(opportunity("QQQ", "day_trading"));

    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(a.value(), 1);
    EXPECT_EQ(b.value(), 2);
    EXPECT_EQ(store.opportunity_count(), 2u);
}

TEST(InMemoryStoreTest, QueryFilters) {
    InMemoryOpportunityStore store;
    (void)store.save(opportunity("SPY", "whale_activity", kT0));
    (void)store.save(opportunity("QQQ", "whale_activity", kT0 + 10min));
    (void)store.save(opportunity("SPY", "day_trading", kT0 + 20min));

    EXPECT_EQ(store.query({}).size(), 3u);
    EXPECT_EQ(store.query({.alert_type = "whale_activity"}).size(), 2u);
    EXPECT_EQ(store.query({.symbol = "SPY"}).size(), 2u);

    auto window = store.query({.detected_after = kT0 + 10min, .detected_before = kT0 + 20min});
    ASSERT_EQ(window.size(), 1u);
    EXPECT_EQ(window[0].opportunity.symbol(), "QQQ");
}

TEST(InMemoryStoreTest, WithoutBacktestExcludesEvaluated) {
    InMemoryOpportunityStore store;
    auto id = store.save(opportunity("SPY", "whale_activity")).value();
    (void)store.save(opportunity("QQQ", "whale_activity"));

    ASSERT_TRUE(store.save(result_for(id, 3.0)).is_ok());

    auto pending = store.query({.without_backtest = true});
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].opportunity.symbol(), "QQQ");
}

TEST(InMemoryStoreTest, LatestBacktestWins) {
    InMemoryOpportunityStore store;
    auto id = store.save(opportunity("SPY", "whale_activity")).value();

    ASSERT_TRUE(store.save(result_for(id, 3.0)).is_ok());
    ASSERT_TRUE(store.save(result_for(id, 7.0)).is_ok());

    ASSERT_TRUE(store.backtest_result(id).has_value());
    EXPECT_DOUBLE_EQ(*store.backtest_result(id)->return_at(5min), 7.0);
    EXPECT_EQ(store.backtest_results().size(), 1u);
}

TEST(InMemoryStoreTest, BacktestForUnknownOpportunityFails) {
    InMemoryOpportunityStore store;

    auto status = store.save(result_for(42, 1.0));

    ASSERT_TRUE(status.is_err());
    EXPECT_TRUE(status.error().is(ErrorKind::Storage));
}

TEST(InMemoryStoreTest, ConcurrentSavesGetDistinctIds) {
    InMemoryOpportunityStore store;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store] {
            for (int i = 0; i < 50; ++i) {
                (void)store.save(opportunity("SPY", "whale_activity"));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(store.opportunity_count(), 200u);
    EXPECT_EQ(store.next_id(), 201);
}

// ============================================================================
// JSON-lines store
// ============================================================================

class JsonlStoreTest : public ::testing::Test {
protected:
    std::string path = "test_opportunity_store.jsonl";

    void SetUp() override { std::remove(path.c_str()); }
    void TearDown() override { std::remove(path.c_str()); }
};

TEST_F(JsonlStoreTest, ReopenRestoresOpportunitiesAndResults) {
    OpportunityId first_id = 0;
    {
        auto opened = JsonlOpportunityStore::open(path);
        ASSERT_TRUE(opened.is_ok());
        auto store = std::move(opened).take_value();

        first_id = store->save(opportunity("SPY", "whale_activity")).value();
        auto second_id = store->save(opportunity("QQQ", "day_trading", kT0 + 1min)).value();
        ASSERT_TRUE(store->save(result_for(first_id, 4.5)).is_ok());

        auto closed = result_for(second_id, 0.0);
        closed.returns.clear();
        closed.no_data = true;
        ASSERT_TRUE(store->save(closed).is_ok());
    }

    auto reopened = JsonlOpportunityStore::open(path);
    ASSERT_TRUE(reopened.is_ok());
    auto store = std::move(reopened).take_value();

    auto all = store->query({});
    ASSERT_EQ(all.size(), 2u);
    const auto& opp = all[0].opportunity;
    EXPECT_EQ(all[0].id, first_id);
    EXPECT_EQ(opp.contract, (market::ContractKey{"SPY", market::OptionType::Put, 95.5, "2024-02-16"}));
    EXPECT_EQ(opp.detected_at, kT0);
    EXPECT_DOUBLE_EQ(opp.price, 4.25);
    EXPECT_EQ(opp.volume, 2500);
    EXPECT_DOUBLE_EQ(*opp.volume_ratio, 5.0);
    EXPECT_TRUE(opp.is_unusual_volume);
    ASSERT_TRUE(opp.greeks.has_value());
    EXPECT_DOUBLE_EQ(opp.greeks->implied_volatility, 0.61);
    ASSERT_TRUE(opp.score.has_value());
    EXPECT_DOUBLE_EQ(opp.score->success_probability, 80.0);

    auto result = store->backtest_result(first_id);
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(*result->return_at(5min), 4.5);
    EXPECT_EQ(result->strategy, "follow_smart_money");
    EXPECT_FALSE(result->no_data);

    auto closed = store->backtest_result(all[1].id);
    ASSERT_TRUE(closed.has_value());
    EXPECT_TRUE(closed->no_data);
    EXPECT_TRUE(store->query({.without_backtest = true}).empty());

    // Ids keep increasing across restarts
    EXPECT_EQ(store->save(opportunity("IWM", "whale_activity")).value(), 3);
}

TEST_F(JsonlStoreTest, UnreadableLinesAreSkipped) {
    {
        auto store = JsonlOpportunityStore::open(path).take_value();
        (void)store->save(opportunity("SPY", "whale_activity"));
    }
    {
        std::ofstream out(path, std::ios::app);
        out << "not json\n";
        out << R"({"record":"mystery"})" << "\n";
        out << R"({"record":"opportunity","id":"x"})" << "\n";
    }

    auto store = JsonlOpportunityStore::open(path).take_value();

    EXPECT_EQ(store->skipped_lines(), 3u);
    EXPECT_EQ(store->query({}).size(), 1u);
}

TEST_F(JsonlStoreTest, BacktestForUnknownOpportunityNotWritten) {
    auto store = JsonlOpportunityStore::open(path).take_value();

    auto status = store->save(result_for(7, 1.0));

    ASSERT_TRUE(status.is_err());
    EXPECT_TRUE(status.error().is(ErrorKind::Storage));
    EXPECT_TRUE(store->backtest_results().empty());
}

TEST_F(JsonlStoreTest, UnwritablePathFails) {
    auto opened = JsonlOpportunityStore::open("/nonexistent-dir/optiscan/store.jsonl");

    ASSERT_TRUE(opened.is_err());
    EXPECT_TRUE(opened.error().is(ErrorKind::Storage));
}
