#include "backtest/leaderboard.hpp"
#include <algorithm>

namespace optiscan::backtest {

namespace {

/// Values in detection order
HorizonStats horizon_stats(const std::vector<PercentChange>& values) {
    HorizonStats stats;
    stats.samples = values.size();
    if (values.empty()) {
        return stats;
    }

    double sum = 0.0, gains = 0.0, losses = 0.0;
    std::size_t above_10 = 0, above_25 = 0, above_50 = 0;
    std::size_t win_run = 0, loss_run = 0;
    stats.max = values.front();
    stats.min = values.front();
    for (double v : values) {
        sum += v;
        stats.max = std::max(stats.max, v);
        stats.min = std::min(stats.min, v);
        above_10 += v > 10.0 ? 1 : 0;
        above_25 += v > 25.0 ? 1 : 0;
        above_50 += v > 50.0 ? 1 : 0;

        if (v > 0.0) {
            ++stats.profitable;
            gains += v;
            ++win_run;
            loss_run = 0;
        } else {
            losses += v;
            ++loss_run;
            win_run = 0;
        }
        stats.max_consecutive_wins = std::max(stats.max_consecutive_wins, win_run);
        stats.max_consecutive_losses = std::max(stats.max_consecutive_losses, loss_run);
    }

    auto n = static_cast<double>(values.size());
    stats.mean = sum / n;
    stats.win_rate = static_cast<double>(stats.profitable) / n;
    stats.share_above_10 = static_cast<double>(above_10) / n;
    stats.share_above_25 = static_cast<double>(above_25) / n;
    stats.share_above_50 = static_cast<double>(above_50) / n;

    auto loss_count = values.size() - stats.profitable;
    if (loss_count > 0) {
        stats.average_loss = losses / static_cast<double>(loss_count);
    }
    if (losses < 0.0) {
        stats.profit_factor = gains / -losses;
    }
    return stats;
}

}  // namespace

LeaderboardBuilder::LeaderboardBuilder(
    std::vector<std::chrono::minutes> horizons,
    std::chrono::minutes ranking_horizon,
    std::size_t top_n
)
    : horizons_(std::move(horizons))
    , ranking_horizon_(ranking_horizon)
    , top_n_(top_n)
{
    std::sort(horizons_.begin(), horizons_.end());
    horizons_.erase(std::unique(horizons_.begin(), horizons_.end()), horizons_.end());
}

LeaderboardBuilder::LeaderboardBuilder(const Config::Backtest& config)
    : LeaderboardBuilder(config.horizons, config.ranking_horizon, config.top_n)
{}

CategorySummary LeaderboardBuilder::summarize(std::vector<const BacktestResult*> group) const {
    CategorySummary summary;
    summary.count = group.size();

    std::stable_sort(group.begin(), group.end(), [](const BacktestResult* a, const BacktestResult* b) {
        return a->detected_at < b->detected_at;
    });

    for (auto horizon : horizons_) {
        std::vector<PercentChange> values;
        values.reserve(group.size());
        for (const auto* result : group) {
            if (auto value = result->return_at(horizon)) {
                values.push_back(*value);
            }
        }
        if (!values.empty()) {
            summary.horizons.emplace(horizon, horizon_stats(values));
        }
    }

    for (const auto* result : group) {
        for (const auto& [horizon, value] : result->returns) {
            if (!summary.best_return || value > *summary.best_return) {
                summary.best_return = value;
            }
            if (!summary.worst_return || value < *summary.worst_return) {
                summary.worst_return = value;
            }
        }
    }

    return summary;
}

LeaderboardSummary LeaderboardBuilder::build(const std::vector<BacktestResult>& results) const {
    LeaderboardSummary summary;
    summary.ranking_horizon = ranking_horizon_;

    std::vector<const BacktestResult*> all;
    std::map<std::string, std::vector<const BacktestResult*>> by_type;
    std::map<std::string, std::vector<const BacktestResult*>> by_strategy;
    all.reserve(results.size());
    for (const auto& result : results) {
        if (result.no_data) {
            continue;
        }
        all.push_back(&result);
        by_type[result.alert_type].push_back(&result);
        by_strategy[result.strategy].push_back(&result);
    }
    summary.total_opportunities = all.size();

    summary.overall = summarize(all);
    for (const auto& [alert_type, group] : by_type) {
        summary.by_alert_type.emplace(alert_type, summarize(group));
    }
    for (const auto& [strategy, group] : by_strategy) {
        summary.by_strategy.emplace(strategy, summarize(group));
    }

    std::vector<RankedResult> ranked;
    for (const auto* entry : all) {
        const auto& result = *entry;
        auto value = result.return_at(ranking_horizon_);
        if (!value) {
            continue;
        }
        ranked.push_back(RankedResult{
            .opportunity_id = result.opportunity_id,
            .alert_type = result.alert_type,
            .strategy = result.strategy,
            .contract = result.contract,
            .detected_at = result.detected_at,
            .ranking_return = *value,
        });
    }

    // Deterministic order: return desc, then earlier detection, then symbol, then id
    std::sort(ranked.begin(), ranked.end(), [](const RankedResult& a, const RankedResult& b) {
        if (a.ranking_return != b.ranking_return) {
            return a.ranking_return > b.ranking_return;
        }
        if (a.detected_at != b.detected_at) {
            return a.detected_at < b.detected_at;
        }
        if (a.contract.symbol != b.contract.symbol) {
            return a.contract.symbol < b.contract.symbol;
        }
        return a.opportunity_id < b.opportunity_id;
    });
    if (ranked.size() > top_n_) {
        ranked.resize(top_n_);
    }
    summary.top_performers = std::move(ranked);

    return summary;
}

}  // namespace optiscan::backtest
