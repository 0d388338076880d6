#pragma once

#include "backtest/backtest_result.hpp"
#include "core/config.hpp"
#include "core/status.hpp"
#include "detect/opportunity.hpp"
#include "market/market_data_client.hpp"
#include <optional>
#include <vector>

namespace optiscan::backtest {

/// Replays history after each detection and measures forward returns
///
/// Evaluations are independent and read-only against historical data,
/// so batches run in parallel.
class BacktestEngine {
public:
    BacktestEngine(market::MarketDataClient& client, Config::Backtest config);

    /// Backtest one stored opportunity
    /// Missing history yields a result without horizons; transient fetch
    /// failures and a non-positive entry price are errors
    [[nodiscard]] Result<BacktestResult, Error> evaluate(const detect::StoredOpportunity& stored) const;

    /// Backtest many opportunities on a bounded worker pool
    /// @return One result per input, in input order
    [[nodiscard]] std::vector<Result<BacktestResult, Error>> run_batch(
        const std::vector<detect::StoredOpportunity>& batch
    ) const;

    /// Entry price for the configured basis
    [[nodiscard]] static Price entry_price(const detect::Opportunity& opportunity, PriceBasis basis);

    /// Pure evaluation over already fetched bars
    [[nodiscard]] static BacktestResult evaluate_bars(
        const detect::StoredOpportunity& stored,
        Price entry_price,
        const std::vector<market::HistoricalBar>& bars,
        const Config::Backtest& config
    );

    /// Price observed at target
    ///
    /// Bars before detected_at are ignored. Absent when no bar remains or
    /// the last bar is earlier than target. Otherwise the last bar at or
    /// before target, or the first bar when every bar is later.
    [[nodiscard]] static std::optional<Price> price_at(
        const std::vector<market::HistoricalBar>& bars,
        Timestamp detected_at,
        Timestamp target
    );

    [[nodiscard]] const Config::Backtest& config() const noexcept { return config_; }

private:
    [[nodiscard]] Result<std::vector<market::HistoricalBar>, Error> fetch_bars(
        const detect::Opportunity& opportunity
    ) const;

    market::MarketDataClient& client_;
    Config::Backtest config_;
};

/// (price - entry) / entry * 100
[[nodiscard]] inline PercentChange percent_change(Price entry, Price price) {
    return (price - entry) / entry * 100.0;
}

}  // namespace optiscan::backtest
