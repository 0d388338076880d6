#include "detect/baseline_provider.hpp"
#include <spdlog/spdlog.h>
#include <numeric>

namespace optiscan::detect {

Baseline Baseline::from_bars(const std::vector<market::HistoricalBar>& bars) {
    if (bars.empty()) {
        return unknown();
    }

    double total = std::accumulate(bars.begin(), bars.end(), 0.0,
        [](double sum, const market::HistoricalBar& bar) {
            return sum + bar.volume;
        });
    double mean = total / static_cast<double>(bars.size());

    Baseline baseline;
    baseline.sample_count = bars.size();
    // No trading history is not a zero baseline
    if (mean > 0.0) {
        baseline.average_volume = mean;
    }
    return baseline;
}

BaselineProvider::BaselineProvider(market::MarketDataClient& client, Config::Baseline config)
    : client_(client)
    , config_(config)
{}

Baseline BaselineProvider::compute(const market::ContractKey& contract, Timestamp as_of) const {
    auto start = as_of - std::chrono::hours{24} * config_.lookback_days;

    try {
        auto bars = client_.get_historical_bars(contract, start, as_of, config_.granularity);
        if (bars.is_err()) {
            const auto& err = bars.error();
            if (err.is(ErrorKind::DataUnavailable)) {
                spdlog::debug("No baseline history for {}", contract.to_string());
            } else {
                spdlog::warn("Baseline fetch failed for {}: {}",
                             contract.to_string(), err.describe());
            }
            return Baseline::unknown();
        }
        return Baseline::from_bars(bars.value());

    } catch (const std::exception& e) {
        spdlog::warn("Baseline fetch threw for {}: {}", contract.to_string(), e.what());
        return Baseline::unknown();
    }
}

BaselineCache::BaselineCache(const BaselineProvider& provider, Timestamp as_of)
    : provider_(provider)
    , as_of_(as_of)
{}

Baseline BaselineCache::get(const market::ContractKey& contract) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(contract);
    if (it != entries_.end()) {
        auto pending = it->second;
        lock.unlock();
        // Wait outside the lock for the first caller's fetch
        return pending.get();
    }

    std::promise<Baseline> promise;
    entries_.emplace(contract, promise.get_future().share());
    lock.unlock();

    fetches_.fetch_add(1, std::memory_order_relaxed);
    Baseline baseline = provider_.compute(contract, as_of_);
    promise.set_value(baseline);
    return baseline;
}

std::size_t BaselineCache::fetch_count() const noexcept {
    return fetches_.load(std::memory_order_relaxed);
}

std::size_t BaselineCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

}  // namespace optiscan::detect
