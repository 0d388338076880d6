#pragma once

#include "backtest/backtest_engine.hpp"
#include "core/config.hpp"
#include "core/status.hpp"
#include "detect/baseline_provider.hpp"
#include "engine/performance_reporter.hpp"
#include "market/market_data_client.hpp"
#include "notify/notification_channel.hpp"
#include "scan/scan_orchestrator.hpp"
#include "scoring/rule_based_scorer.hpp"
#include "storage/opportunity_store.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <memory>
#include <optional>

namespace optiscan::engine {

/// Wires collaborators together and drives the scan and report loops
///
/// Timers fire on the io_context; cycles and reports run on their own
/// single-thread pools so a slow cycle never blocks the timers. A tick
/// that finds the previous cycle still running is skipped, not queued.
class ScannerService {
public:
    /// @param config Validated configuration
    explicit ScannerService(const Config& config);

    ~ScannerService();

    // Non-copyable, non-movable
    ScannerService(const ScannerService&) = delete;
    ScannerService& operator=(const ScannerService&) = delete;

    /// Open the store and build the pipeline
    [[nodiscard]] Status open();

    /// Run scan and report loops until shutdown (blocks)
    void run();

    /// Run a single scan cycle
    std::optional<scan::CycleReport> run_once();

    /// Run a single performance report
    PerformanceReport report_once();

    /// Request graceful shutdown (thread-safe, async-signal-safe)
    void request_shutdown() noexcept;

    [[nodiscard]] bool shutdown_requested() const noexcept;

private:
    void setup_logging();
    void schedule_scan();
    void schedule_report();
    void on_scan_tick();
    void on_report_tick();

    const Config& config_;

    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::unique_ptr<market::MarketDataClient> market_data_;
    std::unique_ptr<storage::OpportunityStore> store_;
    std::optional<scoring::RuleBasedScorer> scorer_;
    notify::ChannelList channels_;

    std::unique_ptr<detect::BaselineProvider> baselines_;
    std::unique_ptr<scan::ScanOrchestrator> orchestrator_;
    std::unique_ptr<backtest::BacktestEngine> backtester_;
    std::unique_ptr<PerformanceReporter> reporter_;

    boost::asio::io_context ioc_;
    boost::asio::steady_timer scan_timer_;
    boost::asio::steady_timer report_timer_;
    boost::asio::thread_pool scan_pool_{1};
    boost::asio::thread_pool report_pool_{1};
    std::atomic<bool> report_running_{false};

    std::atomic<bool> shutdown_requested_{false};
};

}  // namespace optiscan::engine
