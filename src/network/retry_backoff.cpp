#include "network/retry_backoff.hpp"
#include <algorithm>
#include <cstdint>

namespace optiscan::network {

RetryBackoff::RetryBackoff(
    std::size_t max_retries,
    std::chrono::milliseconds base_delay,
    std::chrono::milliseconds max_delay,
    double multiplier,
    double jitter_factor
)
    : max_retries_(max_retries)
    , base_delay_(base_delay)
    , max_delay_(max_delay)
    , current_delay_(base_delay)
    , multiplier_(multiplier)
    , jitter_factor_(std::clamp(jitter_factor, 0.0, 1.0))
{}

RetryBackoff::RetryBackoff(const Config::MarketData& config)
    : RetryBackoff(
          config.max_retries,
          config.retry_delay_initial,
          config.retry_delay_max,
          config.retry_backoff_multiplier,
          config.retry_jitter_factor
      )
{}

bool RetryBackoff::can_retry() const noexcept {
    return retry_count_ < max_retries_;
}

std::chrono::milliseconds RetryBackoff::next_delay() {
    ++retry_count_;

    auto delay = std::min(current_delay_, max_delay_);

    // delay * (1 +/- jitter_factor)
    std::uniform_real_distribution<double> dist(
        1.0 - jitter_factor_,
        1.0 + jitter_factor_
    );
    auto jittered = std::chrono::milliseconds{static_cast<std::int64_t>(
        static_cast<double>(delay.count()) * dist(rng_)
    )};

    auto next_count = static_cast<std::int64_t>(
        static_cast<double>(current_delay_.count()) * multiplier_
    );
    current_delay_ = std::min(std::chrono::milliseconds{next_count}, max_delay_);

    return jittered;
}

void RetryBackoff::reset() {
    current_delay_ = base_delay_;
    retry_count_ = 0;
}

std::chrono::milliseconds RetryBackoff::current_delay() const noexcept {
    return current_delay_;
}

std::size_t RetryBackoff::retry_count() const noexcept {
    return retry_count_;
}

}  // namespace optiscan::network
