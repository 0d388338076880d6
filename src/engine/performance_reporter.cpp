#include "engine/performance_reporter.hpp"
#include "output/report_formatter.hpp"
#include <spdlog/spdlog.h>

namespace optiscan::engine {

PerformanceReporter::PerformanceReporter(
    Config::Backtest config,
    const backtest::BacktestEngine& engine,
    storage::OpportunityStore& store,
    notify::ChannelList channels
)
    : config_(std::move(config))
    , engine_(engine)
    , store_(store)
    , channels_(std::move(channels))
    , builder_(config_)
{}

backtest::LeaderboardSummary PerformanceReporter::leaderboard() const {
    return builder_.build(store_.backtest_results());
}

PerformanceReport PerformanceReporter::run(Timestamp now) {
    PerformanceReport report;

    storage::OpportunityFilter filter;
    filter.detected_before = now - config_.max_horizon();
    filter.without_backtest = true;

    auto pending = store_.query(filter);
    report.pending = pending.size();
    spdlog::info("Backtesting {} matured opportunities", pending.size());

    const auto give_up_before = now - config_.max_horizon() - config_.give_up_after;

    auto results = engine_.run_batch(pending);
    for (std::size_t i = 0; i < results.size(); ++i) {
        const auto& stored = pending[i];
        const auto& result = results[i];
        const bool expired = stored.opportunity.detected_at <= give_up_before;

        // No entry price never resolves; stale opportunities stop being retried
        bool terminal = false;
        if (result.is_err()) {
            spdlog::warn("Backtest of opportunity {} failed: {}",
                         stored.id, result.error().describe());
            terminal = expired || result.error().is(ErrorKind::DataUnavailable);
            if (!terminal) {
                ++report.failed;
                continue;
            }
        } else if (result.value().returns.empty()) {
            terminal = expired;
            if (!terminal) {
                ++report.deferred;
                continue;
            }
        }

        if (terminal) {
            auto closed = close_out(stored);
            if (closed.is_err()) {
                ++report.failed;
                spdlog::warn("Could not close out opportunity {}: {}",
                             stored.id, closed.error().describe());
                continue;
            }
            ++report.closed;
            continue;
        }

        auto saved = store_.save(result.value());
        if (saved.is_err()) {
            ++report.failed;
            spdlog::warn("Could not persist backtest {}: {}",
                         stored.id, saved.error().describe());
            continue;
        }
        ++report.evaluated;
    }

    report.leaderboard = leaderboard();
    spdlog::info("Performance report: {} evaluated, {} deferred, {} closed, {} failed, {} total results",
                 report.evaluated, report.deferred, report.closed, report.failed,
                 report.leaderboard.total_opportunities);

    publish(report.leaderboard);
    return report;
}

Status PerformanceReporter::close_out(const detect::StoredOpportunity& stored) {
    auto entry = backtest::BacktestEngine::entry_price(stored.opportunity, config_.price_basis);
    auto result = backtest::BacktestEngine::evaluate_bars(stored, entry, {}, config_);
    result.no_data = true;

    auto saved = store_.save(result);
    if (saved.is_err()) {
        return Status::Err(saved.error());
    }
    spdlog::info("Opportunity {} ({}) closed without backtest data",
                 stored.id, stored.opportunity.contract.to_string());
    return ok_status();
}

void PerformanceReporter::publish(const backtest::LeaderboardSummary& summary) {
    for (const auto& channel : channels_) {
        try {
            auto text = output::ReportFormatter::format_leaderboard(summary, channel->markup());
            if (!channel->send(text)) {
                spdlog::warn("Leaderboard not delivered via {}", channel->name());
            }
        } catch (const std::exception& e) {
            spdlog::warn("Channel {} failed: {}", channel->name(), e.what());
        }
    }
}

}  // namespace optiscan::engine
