#pragma once

#include "core/config.hpp"
#include <chrono>
#include <cstddef>
#include <random>

namespace optiscan::network {

/// Bounded exponential backoff with random jitter for request retries
class RetryBackoff {
public:
    /// @param max_retries Retries allowed after the first attempt
    /// @param base_delay Delay before the first retry
    /// @param max_delay Maximum delay cap
    /// @param multiplier Backoff multiplier
    /// @param jitter_factor Random jitter factor (e.g., 0.3 for +/-30%)
    RetryBackoff(
        std::size_t max_retries,
        std::chrono::milliseconds base_delay = std::chrono::milliseconds{500},
        std::chrono::milliseconds max_delay = std::chrono::milliseconds{5000},
        double multiplier = 2.0,
        double jitter_factor = 0.3
    );

    /// Build from the market-data retry settings
    explicit RetryBackoff(const Config::MarketData& config);

    /// True while another retry is allowed
    [[nodiscard]] bool can_retry() const noexcept;

    /// Delay before the next retry, with jitter applied
    /// Counts one retry and grows the internal delay
    [[nodiscard]] std::chrono::milliseconds next_delay();

    /// Reset delay and retry count
    void reset();

    [[nodiscard]] std::chrono::milliseconds current_delay() const noexcept;
    [[nodiscard]] std::size_t retry_count() const noexcept;

private:
    std::size_t max_retries_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    std::chrono::milliseconds current_delay_;
    double multiplier_;
    double jitter_factor_;
    std::size_t retry_count_{0};

    std::mt19937 rng_{std::random_device{}()};
};

}  // namespace optiscan::network
