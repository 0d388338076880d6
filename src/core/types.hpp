#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace optiscan {

// Option and underlying prices in USD
using Price = double;

// Traded volume and open interest, in contracts
using Contracts = std::int64_t;

// Wall-clock time; detections and historical bars are both exchange time
using Timestamp = std::chrono::system_clock::time_point;

// Underlying ticker (e.g. "SPY")
using Symbol = std::string;

// Identifier assigned by persistence
using OpportunityId = std::int64_t;

// Percentage points (10.0 == +10%)
using PercentChange = double;

// Shares represented by one listed equity option contract
constexpr double kContractMultiplier = 100.0;

// Conversion utilities
namespace convert {

/// Milliseconds since the Unix epoch
[[nodiscard]] inline std::int64_t to_epoch_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()
    ).count();
}

/// Timestamp from milliseconds since the Unix epoch
[[nodiscard]] inline Timestamp from_epoch_ms(std::int64_t ms) {
    return Timestamp{std::chrono::milliseconds{ms}};
}

/// Dollar exposure: price x volume x contract multiplier
[[nodiscard]] inline double notional(Price price, Contracts volume) {
    return price * static_cast<double>(volume) * kContractMultiplier;
}

/// Horizon label used in reports ("5m", "1h")
[[nodiscard]] inline std::string horizon_label(std::chrono::minutes horizon) {
    auto count = horizon.count();
    if (count >= 60 && count % 60 == 0) {
        return std::to_string(count / 60) + "h";
    }
    return std::to_string(count) + "m";
}

}  // namespace convert

}  // namespace optiscan
