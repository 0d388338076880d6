#pragma once

#include "backtest/backtest_result.hpp"
#include "backtest/leaderboard.hpp"
#include "core/status.hpp"
#include "core/types.hpp"
#include "detect/opportunity.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace optiscan::output {

/// JSON encoding of opportunities, backtest results and leaderboards
/// Used by the JSON-lines store and by --report output
class JsonFormatter {
public:
    /// {"record":"opportunity","id":N,...}
    [[nodiscard]] static nlohmann::json format_opportunity(const detect::StoredOpportunity& stored);

    /// {"record":"backtest","opportunity_id":N,...}
    [[nodiscard]] static nlohmann::json format_backtest(const backtest::BacktestResult& result);

    /// Leaderboard with per-horizon stats keyed by horizon label
    [[nodiscard]] static nlohmann::json format_leaderboard(const backtest::LeaderboardSummary& summary);

    [[nodiscard]] static Result<detect::StoredOpportunity, Error> parse_opportunity(const nlohmann::json& j);

    [[nodiscard]] static Result<backtest::BacktestResult, Error> parse_backtest(const nlohmann::json& j);

    /// ISO8601 UTC with milliseconds
    [[nodiscard]] static std::string iso_timestamp(Timestamp ts);
};

}  // namespace optiscan::output
