#pragma once

#include "backtest/backtest_result.hpp"
#include "core/config.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace optiscan::backtest {

/// Return distribution at one horizon
/// Computed only over results that reached the horizon. A sample > 0 is a
/// win; anything else counts as a loss.
struct HorizonStats {
    std::size_t samples{0};
    double mean{0.0};
    double max{0.0};
    double min{0.0};
    std::size_t profitable{0};
    double win_rate{0.0};        // profitable / samples, in [0, 1]
    double share_above_10{0.0};  // share of samples > 10%
    double share_above_25{0.0};
    double share_above_50{0.0};

    std::optional<double> average_loss;   // mean of losing samples
    std::optional<double> profit_factor;  // gross gain / gross loss; absent without losses

    // Streaks in detection order
    std::size_t max_consecutive_wins{0};
    std::size_t max_consecutive_losses{0};
};

/// Summary of one alert type or strategy, or of every result
struct CategorySummary {
    std::size_t count{0};
    std::map<std::chrono::minutes, HorizonStats> horizons;  // horizons with samples only
    std::optional<PercentChange> best_return;               // best single value at any horizon
    std::optional<PercentChange> worst_return;

    [[nodiscard]] std::optional<double> average(std::chrono::minutes horizon) const {
        auto it = horizons.find(horizon);
        if (it == horizons.end()) {
            return std::nullopt;
        }
        return it->second.mean;
    }
};

/// One entry of the top performers list
struct RankedResult {
    OpportunityId opportunity_id{0};
    std::string alert_type;
    std::string strategy;
    market::ContractKey contract;
    Timestamp detected_at{};
    PercentChange ranking_return{0.0};
};

/// Leaderboard derived from backtest results; recomputed on demand
///
/// Results recorded as having no data are left out entirely.
struct LeaderboardSummary {
    std::size_t total_opportunities{0};
    std::chrono::minutes ranking_horizon{0};
    CategorySummary overall;
    std::map<std::string, CategorySummary> by_alert_type;
    std::map<std::string, CategorySummary> by_strategy;
    std::vector<RankedResult> top_performers;
};

/// Pure reduction of backtest results into a leaderboard
class LeaderboardBuilder {
public:
    LeaderboardBuilder(
        std::vector<std::chrono::minutes> horizons,
        std::chrono::minutes ranking_horizon,
        std::size_t top_n
    );

    explicit LeaderboardBuilder(const Config::Backtest& config);

    /// Empty input yields zero counts and no averages
    [[nodiscard]] LeaderboardSummary build(const std::vector<BacktestResult>& results) const;

private:
    [[nodiscard]] CategorySummary summarize(std::vector<const BacktestResult*> group) const;

    std::vector<std::chrono::minutes> horizons_;
    std::chrono::minutes ranking_horizon_;
    std::size_t top_n_;
};

}  // namespace optiscan::backtest
