#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "market/types.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace optiscan::backtest {

/// How the trade would have ended under the configured targets and stop
enum class ExitOutcome {
    Open,
    TargetHit,
    StoppedOut
};

[[nodiscard]] constexpr std::string_view to_string(ExitOutcome outcome) noexcept {
    switch (outcome) {
        case ExitOutcome::Open: return "open";
        case ExitOutcome::TargetHit: return "target_hit";
        case ExitOutcome::StoppedOut: return "stopped_out";
    }
    return "open";
}

[[nodiscard]] std::optional<ExitOutcome> parse_exit_outcome(std::string_view text);

/// Forward returns of one opportunity at fixed horizons
///
/// A horizon is present only when historical data reaches it; missing
/// horizons are never filled with zero.
struct BacktestResult {
    OpportunityId opportunity_id{0};
    std::string alert_type;
    std::string strategy;
    market::ContractKey contract;
    Timestamp detected_at{};

    PriceBasis basis{PriceBasis::Option};
    Price entry_price{0.0};
    std::map<std::chrono::minutes, PercentChange> returns;

    std::optional<PercentChange> peak_return;
    ExitOutcome exit_outcome{ExitOutcome::Open};
    std::optional<PercentChange> exit_return;

    // Terminal record for an opportunity that can never be evaluated
    bool no_data{false};

    [[nodiscard]] std::optional<PercentChange> return_at(std::chrono::minutes horizon) const {
        auto it = returns.find(horizon);
        if (it == returns.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] bool operator==(const BacktestResult& other) const = default;
};

}  // namespace optiscan::backtest
