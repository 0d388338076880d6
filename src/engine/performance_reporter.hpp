#pragma once

#include "backtest/backtest_engine.hpp"
#include "backtest/leaderboard.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "notify/notification_channel.hpp"
#include "storage/opportunity_store.hpp"
#include <cstddef>

namespace optiscan::engine {

/// What one report run did
struct PerformanceReport {
    std::size_t pending{0};     // matured opportunities without a result
    std::size_t evaluated{0};   // results persisted this run
    std::size_t deferred{0};    // no history yet; retried next run
    std::size_t closed{0};      // recorded as no-data; never retried
    std::size_t failed{0};
    backtest::LeaderboardSummary leaderboard;
};

/// Backtests matured opportunities and publishes the leaderboard
///
/// An opportunity matures once its largest horizon has elapsed. Results
/// without any horizon are not persisted so later runs can retry them,
/// until give_up_after has also passed. From then on, and right away when
/// the opportunity has no entry price, a no-data result is saved so it
/// stops being pending.
class PerformanceReporter {
public:
    PerformanceReporter(
        Config::Backtest config,
        const backtest::BacktestEngine& engine,
        storage::OpportunityStore& store,
        notify::ChannelList channels = {}
    );

    /// Evaluate, persist, aggregate and send
    PerformanceReport run(Timestamp now = std::chrono::system_clock::now());

    /// Leaderboard over every stored result, without evaluating anything
    [[nodiscard]] backtest::LeaderboardSummary leaderboard() const;

private:
    void publish(const backtest::LeaderboardSummary& summary);
    [[nodiscard]] Status close_out(const detect::StoredOpportunity& stored);

    Config::Backtest config_;
    const backtest::BacktestEngine& engine_;
    storage::OpportunityStore& store_;
    notify::ChannelList channels_;
    backtest::LeaderboardBuilder builder_;
};

}  // namespace optiscan::engine
