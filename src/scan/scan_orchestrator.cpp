#include "scan/scan_orchestrator.hpp"
#include "output/report_formatter.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace optiscan::scan {

namespace {

/// Clears the running flag when a cycle ends, however it ends
class CycleGuard {
public:
    explicit CycleGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~CycleGuard() { flag_.store(false, std::memory_order_release); }

    CycleGuard(const CycleGuard&) = delete;
    CycleGuard& operator=(const CycleGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

}  // namespace

ScanOrchestrator::ScanOrchestrator(
    Config::Scanner config,
    market::MarketDataClient& client,
    const detect::BaselineProvider& baselines,
    std::vector<detect::Detector> detectors,
    storage::OpportunityStore& store,
    notify::ChannelList channels,
    scoring::ScorerRef scorer
)
    : config_(std::move(config))
    , client_(client)
    , baselines_(baselines)
    , detectors_(std::move(detectors))
    , store_(store)
    , channels_(std::move(channels))
    , scorer_(scorer)
    , dedup_(config_.dedup_window)
{
    for (const auto& symbol : config_.watchlist) {
        states_.emplace(symbol, SymbolState::Idle);
    }
}

bool ScanOrchestrator::cycle_in_progress() const noexcept {
    return running_.load(std::memory_order_acquire);
}

SymbolState ScanOrchestrator::state(const Symbol& symbol) const {
    std::lock_guard lock(state_mutex_);
    auto it = states_.find(symbol);
    return it == states_.end() ? SymbolState::Idle : it->second;
}

void ScanOrchestrator::set_state(const Symbol& symbol, SymbolState state) {
    std::lock_guard lock(state_mutex_);
    states_[symbol] = state;
}

std::optional<CycleReport> ScanOrchestrator::run_cycle(Timestamp now) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        spdlog::warn("Previous scan cycle still running; skipping this one");
        return std::nullopt;
    }
    CycleGuard guard(running_);

    auto started = std::chrono::steady_clock::now();
    CycleReport report;
    report.started_at = now;

    // Scoped to this cycle; discarded on return
    detect::BaselineCache cache(baselines_, now);
    const detect::DetectionContext ctx{
        .baseline = [&cache](const market::ContractKey& key) { return cache.get(key); },
        .scorer = scorer_,
    };

    const auto& watchlist = config_.watchlist;
    std::vector<SymbolOutcome> outcomes(watchlist.size());

    {
        boost::asio::thread_pool pool(std::max<std::size_t>(1, config_.max_concurrency));
        for (std::size_t i = 0; i < watchlist.size(); ++i) {
            boost::asio::post(pool, [this, &watchlist, &outcomes, &ctx, i] {
                try {
                    outcomes[i] = scan_symbol(watchlist[i], ctx);
                } catch (const std::exception& e) {
                    spdlog::warn("Scan worker for {} failed: {}", watchlist[i], e.what());
                    outcomes[i].failed = true;
                }
            });
        }
        pool.join();
    }

    dedup_.prune(now);
    for (std::size_t i = 0; i < watchlist.size(); ++i) {
        auto& outcome = outcomes[i];
        ++report.symbols_scanned;
        if (outcome.failed) {
            ++report.symbols_failed;
        }
        report.contracts_evaluated += outcome.evaluated;
        report.contracts_failed += outcome.contract_failures;
        dispatch(watchlist[i], outcome.found, report, now);
    }

    report.baseline_fetches = cache.fetch_count();
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    );

    spdlog::info("Scan cycle: {} symbols ({} failed), {} contracts, {} opportunities, "
                 "{} duplicates, {} baseline fetches in {}ms",
                 report.symbols_scanned, report.symbols_failed, report.contracts_evaluated,
                 report.opportunities_emitted, report.duplicates_suppressed,
                 report.baseline_fetches, report.duration.count());

    return report;
}

ScanOrchestrator::SymbolOutcome ScanOrchestrator::scan_symbol(
    const Symbol& symbol,
    const detect::DetectionContext& ctx
) {
    SymbolOutcome outcome;

    try {
        set_state(symbol, SymbolState::Fetching);
        auto chain = client_.get_option_chain(symbol);
        if (chain.is_err()) {
            const auto& err = chain.error();
            if (err.is(ErrorKind::DataUnavailable)) {
                spdlog::info("No option chain for {}: {}", symbol, err.message);
            } else {
                spdlog::warn("Option chain fetch failed for {}: {}", symbol, err.describe());
                outcome.failed = true;
            }
            set_state(symbol, SymbolState::Idle);
            return outcome;
        }

        set_state(symbol, SymbolState::Detecting);
        for (const auto& snapshot : chain.value()) {
            ++outcome.evaluated;
            try {
                for (const auto& detector : detectors_) {
                    if (auto opp = detect::evaluate(detector, symbol, snapshot, ctx)) {
                        outcome.found.push_back(std::move(*opp));
                    }
                }
            } catch (const std::exception& e) {
                ++outcome.contract_failures;
                spdlog::warn("Detection failed for {}: {}", snapshot.key().to_string(), e.what());
            }
        }

    } catch (const std::exception& e) {
        spdlog::warn("Scan of {} failed: {}", symbol, e.what());
        outcome.failed = true;
    }

    set_state(symbol, outcome.found.empty() ? SymbolState::Idle : SymbolState::Dispatching);
    return outcome;
}

void ScanOrchestrator::dispatch(
    const Symbol& symbol,
    std::vector<detect::Opportunity>& found,
    CycleReport& report,
    Timestamp now
) {
    for (auto& opp : found) {
        if (dedup_.is_duplicate(opp.contract, opp.alert_type, now)) {
            ++report.duplicates_suppressed;
            spdlog::debug("Suppressed duplicate {} {}", opp.alert_type, opp.contract.to_string());
            continue;
        }

        auto saved = store_.save(opp);
        if (saved.is_err()) {
            // Not recorded as reported, so the next cycle tries again
            ++report.persist_failures;
            spdlog::warn("Could not persist {} {}: {}",
                         opp.alert_type, opp.contract.to_string(), saved.error().describe());
            continue;
        }

        dedup_.record(opp.contract, opp.alert_type, now);
        ++report.opportunities_emitted;

        detect::StoredOpportunity stored{saved.value(), std::move(opp)};
        spdlog::info("Opportunity #{}: {} {} notional ${:.0f}",
                     stored.id, stored.opportunity.alert_type,
                     stored.opportunity.contract.to_string(),
                     stored.opportunity.notional_value);
        notify_all(stored, report);
    }

    set_state(symbol, SymbolState::Idle);
}

void ScanOrchestrator::notify_all(const detect::StoredOpportunity& stored, CycleReport& report) {
    for (const auto& channel : channels_) {
        try {
            auto text = output::ReportFormatter::format_alert(stored, channel->markup());
            if (!channel->send(text)) {
                ++report.notifications_failed;
            }
        } catch (const std::exception& e) {
            ++report.notifications_failed;
            spdlog::warn("Channel {} failed: {}", channel->name(), e.what());
        }
    }
}

}  // namespace optiscan::scan
