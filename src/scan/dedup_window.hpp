#pragma once

#include "core/types.hpp"
#include "market/types.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace optiscan::scan {

/// Remembers reported (contract, alert type) pairs for a time window
///
/// Not thread-safe; the orchestrator dispatches from one thread.
class DedupWindow {
public:
    explicit DedupWindow(std::chrono::seconds window);

    /// True when the pair was recorded less than one window before now
    [[nodiscard]] bool is_duplicate(
        const market::ContractKey& contract,
        std::string_view alert_type,
        Timestamp now
    ) const;

    /// Mark the pair as reported at now
    void record(const market::ContractKey& contract, std::string_view alert_type, Timestamp now);

    /// Drop entries older than one window
    void prune(Timestamp now);

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::chrono::seconds window() const noexcept { return window_; }

private:
    struct Key {
        market::ContractKey contract;
        std::string alert_type;

        [[nodiscard]] bool operator==(const Key& other) const = default;
    };

    struct KeyHash {
        [[nodiscard]] std::size_t operator()(const Key& key) const noexcept {
            auto seed = market::ContractKeyHash{}(key.contract);
            return seed ^ (std::hash<std::string>{}(key.alert_type) + 0x9e3779b97f4a7c15ULL +
                           (seed << 6) + (seed >> 2));
        }
    };

    std::chrono::seconds window_;
    std::unordered_map<Key, Timestamp, KeyHash> entries_;
};

}  // namespace optiscan::scan
