#include "engine/scanner_service.hpp"
#include "detect/detector.hpp"
#include "market/rest_market_data_client.hpp"
#include "network/ssl_context.hpp"
#include "notify/console_channel.hpp"
#include "notify/telegram_channel.hpp"
#include "storage/jsonl_store.hpp"
#include <boost/asio/post.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace optiscan::engine {

ScannerService::ScannerService(const Config& config)
    : config_(config)
    , ssl_ctx_(network::create_ssl_context())
    , scan_timer_(ioc_)
    , report_timer_(ioc_)
{
    setup_logging();

    market_data_ = std::make_unique<market::RestMarketDataClient>(config_.market_data, ssl_ctx_);

    if (config_.scoring.enabled) {
        scorer_.emplace();
    }

    if (config_.notify.console) {
        channels_.push_back(std::make_shared<notify::ConsoleChannel>());
    }
    if (config_.notify.telegram_enabled()) {
        channels_.push_back(std::make_shared<notify::TelegramChannel>(
            config_.notify, ssl_ctx_, config_.market_data.request_timeout
        ));
    }
}

ScannerService::~ScannerService() {
    request_shutdown();
    scan_pool_.join();
    report_pool_.join();
}

void ScannerService::setup_logging() {
    // Initialize async logging to avoid blocking scan workers
    spdlog::init_thread_pool(8192, 1);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!config_.logging.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config_.logging.file));
    }

    auto logger = std::make_shared<spdlog::async_logger>(
        "optiscan",
        sinks.begin(),
        sinks.end(),
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::overrun_oldest
    );

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(config_.logging.level));
    spdlog::flush_on(spdlog::level::warn);
}

Status ScannerService::open() {
    auto store = storage::JsonlOpportunityStore::open(config_.storage.path);
    if (store.is_err()) {
        return Status::Err(store.error());
    }
    store_ = std::move(store).take_value();

    scoring::ScorerRef scorer;
    if (scorer_) {
        scorer = std::cref(static_cast<const scoring::Scorer&>(*scorer_));
    }

    baselines_ = std::make_unique<detect::BaselineProvider>(*market_data_, config_.baseline);
    orchestrator_ = std::make_unique<scan::ScanOrchestrator>(
        config_.scanner,
        *market_data_,
        *baselines_,
        detect::make_detectors(config_),
        *store_,
        channels_,
        scorer
    );
    backtester_ = std::make_unique<backtest::BacktestEngine>(*market_data_, config_.backtest);
    reporter_ = std::make_unique<PerformanceReporter>(
        config_.backtest, *backtester_, *store_, channels_
    );

    std::string names;
    for (const auto& detector : orchestrator_->detectors()) {
        if (!names.empty()) {
            names += ", ";
        }
        names += detect::detector_name(detector);
    }
    spdlog::info("Detectors: {}", names);
    spdlog::info("Channels: {}, scoring {}", channels_.size(), scorer_ ? "on" : "off");

    return ok_status();
}

std::optional<scan::CycleReport> ScannerService::run_once() {
    return orchestrator_->run_cycle();
}

PerformanceReport ScannerService::report_once() {
    return reporter_->run();
}

void ScannerService::run() {
    spdlog::info("Starting optiscan: {} symbols every {}s",
                 config_.scanner.watchlist.size(), config_.scanner.scan_interval.count());

    // First scan right away; first report after one interval
    scan_timer_.expires_after(std::chrono::seconds{0});
    schedule_scan();
    report_timer_.expires_after(config_.backtest.report_interval);
    schedule_report();

    while (!shutdown_requested_.load()) {
        try {
            ioc_.run_for(std::chrono::milliseconds(100));
            if (ioc_.stopped()) {
                ioc_.restart();
            }
        } catch (const std::exception& e) {
            spdlog::error("Service loop exception: {}", e.what());
        }
    }

    scan_timer_.cancel();
    report_timer_.cancel();
    ioc_.poll();

    spdlog::info("Waiting for running work to finish");
    scan_pool_.join();
    report_pool_.join();

    spdlog::info("Service shutdown complete");
    spdlog::default_logger()->flush();
}

void ScannerService::schedule_scan() {
    scan_timer_.async_wait([this](boost::system::error_code ec) {
        if (ec || shutdown_requested_.load()) {
            return;
        }
        on_scan_tick();
        scan_timer_.expires_at(scan_timer_.expiry() + config_.scanner.scan_interval);
        schedule_scan();
    });
}

void ScannerService::schedule_report() {
    report_timer_.async_wait([this](boost::system::error_code ec) {
        if (ec || shutdown_requested_.load()) {
            return;
        }
        on_report_tick();
        report_timer_.expires_at(report_timer_.expiry() + config_.backtest.report_interval);
        schedule_report();
    });
}

void ScannerService::on_scan_tick() {
    if (orchestrator_->cycle_in_progress()) {
        spdlog::warn("Scan tick skipped: previous cycle still running");
        return;
    }

    boost::asio::post(scan_pool_, [this] {
        try {
            [[maybe_unused]] auto report = orchestrator_->run_cycle();
        } catch (const std::exception& e) {
            spdlog::error("Scan cycle aborted: {}", e.what());
        }
    });
}

void ScannerService::on_report_tick() {
    bool expected = false;
    if (!report_running_.compare_exchange_strong(expected, true)) {
        spdlog::warn("Report tick skipped: previous report still running");
        return;
    }

    boost::asio::post(report_pool_, [this] {
        try {
            [[maybe_unused]] auto report = reporter_->run();
        } catch (const std::exception& e) {
            spdlog::error("Performance report aborted: {}", e.what());
        }
        report_running_.store(false);
    });
}

void ScannerService::request_shutdown() noexcept {
    shutdown_requested_.store(true);
}

bool ScannerService::shutdown_requested() const noexcept {
    return shutdown_requested_.load();
}

}  // namespace optiscan::engine
