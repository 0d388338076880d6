#include "backtest/backtest_result.hpp"

namespace optiscan::backtest {

std::optional<ExitOutcome> parse_exit_outcome(std::string_view text) {
    if (text == "open") {
        return ExitOutcome::Open;
    }
    if (text == "target_hit") {
        return ExitOutcome::TargetHit;
    }
    if (text == "stopped_out") {
        return ExitOutcome::StoppedOut;
    }
    return std::nullopt;
}

}  // namespace optiscan::backtest
