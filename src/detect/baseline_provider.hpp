#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "market/market_data_client.hpp"
#include "market/types.hpp"
#include <atomic>
#include <cstddef>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace optiscan::detect {

/// Rolling mean of per-bar traded volume for one contract
///
/// Unknown (no history, failed fetch, or a mean of zero) is distinct
/// from a zero average so ratio math cannot flag false positives.
struct Baseline {
    std::optional<double> average_volume;
    std::size_t sample_count{0};

    [[nodiscard]] bool known() const noexcept { return average_volume.has_value(); }

    [[nodiscard]] static Baseline unknown() { return Baseline{}; }

    /// Mean volume over the bars; unknown when empty or zero
    [[nodiscard]] static Baseline from_bars(const std::vector<market::HistoricalBar>& bars);
};

/// Computes baselines from the market-data collaborator's historical bars
class BaselineProvider {
public:
    BaselineProvider(market::MarketDataClient& client, Config::Baseline config);

    /// Baseline over [as_of - lookback, as_of]
    /// Never fails: fetch errors are logged and yield an unknown baseline
    [[nodiscard]] Baseline compute(const market::ContractKey& contract, Timestamp as_of) const;

    [[nodiscard]] const Config::Baseline& config() const noexcept { return config_; }

private:
    market::MarketDataClient& client_;
    Config::Baseline config_;
};

/// Baselines memoized for one scan cycle
///
/// Thread-safe get-or-compute: concurrent lookups of the same contract
/// share one fetch. Construct a fresh cache per cycle.
class BaselineCache {
public:
    BaselineCache(const BaselineProvider& provider, Timestamp as_of);

    // Non-copyable, non-movable
    BaselineCache(const BaselineCache&) = delete;
    BaselineCache& operator=(const BaselineCache&) = delete;

    [[nodiscard]] Baseline get(const market::ContractKey& contract);

    /// Number of historical fetches issued
    [[nodiscard]] std::size_t fetch_count() const noexcept;

    /// Number of distinct contracts cached
    [[nodiscard]] std::size_t size() const;

private:
    const BaselineProvider& provider_;
    Timestamp as_of_;

    mutable std::mutex mutex_;
    std::unordered_map<market::ContractKey, std::shared_future<Baseline>, market::ContractKeyHash> entries_;
    std::atomic<std::size_t> fetches_{0};
};

}  // namespace optiscan::detect
