#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "detect/baseline_provider.hpp"
#include "detect/detector.hpp"
#include "market/market_data_client.hpp"
#include "notify/notification_channel.hpp"
#include "scan/dedup_window.hpp"
#include "scoring/scorer.hpp"
#include "storage/opportunity_store.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace optiscan::scan {

/// Per-symbol progress through a cycle
enum class SymbolState {
    Idle,
    Fetching,
    Detecting,
    Dispatching
};

[[nodiscard]] constexpr std::string_view to_string(SymbolState state) noexcept {
    switch (state) {
        case SymbolState::Idle: return "IDLE";
        case SymbolState::Fetching: return "FETCHING";
        case SymbolState::Detecting: return "DETECTING";
        case SymbolState::Dispatching: return "DISPATCHING";
    }
    return "UNKNOWN";
}

/// Counters for one completed cycle
struct CycleReport {
    Timestamp started_at{};
    std::chrono::milliseconds duration{0};
    std::size_t symbols_scanned{0};
    std::size_t symbols_failed{0};
    std::size_t contracts_evaluated{0};
    std::size_t contracts_failed{0};
    std::size_t opportunities_emitted{0};
    std::size_t duplicates_suppressed{0};
    std::size_t persist_failures{0};
    std::size_t notifications_failed{0};
    std::size_t baseline_fetches{0};
};

/// Runs detectors over the watchlist once per cycle and dispatches results
///
/// Chains are fetched concurrently (bounded by max_concurrency) and merged
/// in watchlist order before dispatch. A failing symbol or contract is
/// logged and skipped. Baselines are cached for one cycle only.
class ScanOrchestrator {
public:
    ScanOrchestrator(
        Config::Scanner config,
        market::MarketDataClient& client,
        const detect::BaselineProvider& baselines,
        std::vector<detect::Detector> detectors,
        storage::OpportunityStore& store,
        notify::ChannelList channels = {},
        scoring::ScorerRef scorer = std::nullopt
    );

    // Non-copyable, non-movable
    ScanOrchestrator(const ScanOrchestrator&) = delete;
    ScanOrchestrator& operator=(const ScanOrchestrator&) = delete;

    /// Run one full cycle
    /// @param now Cycle clock, used for baselines and deduplication
    /// @return Report, or nullopt when a cycle is already running
    std::optional<CycleReport> run_cycle(Timestamp now = std::chrono::system_clock::now());

    [[nodiscard]] bool cycle_in_progress() const noexcept;

    [[nodiscard]] SymbolState state(const Symbol& symbol) const;

    [[nodiscard]] const std::vector<detect::Detector>& detectors() const noexcept { return detectors_; }

private:
    struct SymbolOutcome {
        bool failed{false};
        std::size_t evaluated{0};
        std::size_t contract_failures{0};
        std::vector<detect::Opportunity> found;
    };

    [[nodiscard]] SymbolOutcome scan_symbol(const Symbol& symbol, const detect::DetectionContext& ctx);

    void dispatch(const Symbol& symbol, std::vector<detect::Opportunity>& found,
                  CycleReport& report, Timestamp now);

    void notify_all(const detect::StoredOpportunity& stored, CycleReport& report);

    void set_state(const Symbol& symbol, SymbolState state);

    Config::Scanner config_;
    market::MarketDataClient& client_;
    const detect::BaselineProvider& baselines_;
    std::vector<detect::Detector> detectors_;
    storage::OpportunityStore& store_;
    notify::ChannelList channels_;
    scoring::ScorerRef scorer_;

    DedupWindow dedup_;
    std::atomic<bool> running_{false};

    mutable std::mutex state_mutex_;
    std::unordered_map<Symbol, SymbolState> states_;
};

}  // namespace optiscan::scan
