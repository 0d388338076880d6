#pragma once

#include "core/status.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace optiscan {

/// Price series a backtest measures returns against
enum class PriceBasis {
    Option,
    Underlying
};

/// Immutable configuration for optiscan
struct Config {
    /// Scan loop configuration
    struct Scanner {
        std::vector<std::string> watchlist{"SPY", "QQQ", "AAPL", "MSFT", "NVDA"};
        std::chrono::seconds scan_interval{300};
        std::size_t max_concurrency = 4;  // parallel chain fetches per cycle
        std::chrono::seconds dedup_window{3600};
    };

    /// Whale-activity detector thresholds
    struct Whale {
        bool enabled = true;
        double min_notional_value = 1'000'000.0;
        double unusual_volume_multiplier = 3.0;
        std::int64_t min_trade_size = 100;  // contracts
    };

    /// Day-trading detector thresholds
    struct DayTrading {
        bool enabled = true;
        std::int64_t min_volume = 100;
        std::int64_t min_open_interest = 500;
        double min_iv_percentile = 70.0;
    };

    /// Rolling volume baseline
    struct Baseline {
        int lookback_days = 30;
        std::chrono::minutes granularity{30};
    };

    /// Forward-return evaluation
    struct Backtest {
        std::vector<std::chrono::minutes> horizons{
            std::chrono::minutes{1}, std::chrono::minutes{5}, std::chrono::minutes{10},
            std::chrono::minutes{15}, std::chrono::minutes{20}
        };
        PriceBasis price_basis = PriceBasis::Option;
        std::chrono::minutes bar_granularity{1};
        std::size_t max_workers = 4;
        std::size_t top_n = 10;
        std::chrono::minutes ranking_horizon{5};
        std::vector<double> profit_targets{5.0, 10.0, 15.0, 20.0, 30.0};  // percent
        double stop_loss = -15.0;  // percent
        // Past max_horizon + give_up_after, unevaluable opportunities are closed out
        std::chrono::minutes give_up_after{24 * 60};
        std::chrono::seconds report_interval{3600};

        [[nodiscard]] std::chrono::minutes max_horizon() const;
    };

    /// Rule-based scoring collaborator
    struct Scoring {
        bool enabled = true;
    };

    /// Market-data REST endpoint
    struct MarketData {
        std::string host = "api.thetadata.net";
        std::string port = "443";
        std::string base_path = "/v1";
        std::string api_key;
        std::chrono::milliseconds request_timeout{10000};

        // Retry settings for transient failures
        std::size_t max_retries = 2;
        std::chrono::milliseconds retry_delay_initial{500};
        std::chrono::milliseconds retry_delay_max{5000};
        double retry_backoff_multiplier = 2.0;
        double retry_jitter_factor = 0.3;  // +/- 30%
    };

    /// Persistence
    struct Storage {
        std::string path = "optiscan_store.jsonl";
    };

    /// Notification channels
    struct Notify {
        bool console = true;
        std::string telegram_host = "api.telegram.org";
        std::string telegram_token;
        std::string telegram_chat_id;

        [[nodiscard]] bool telegram_enabled() const {
            return !telegram_token.empty() && !telegram_chat_id.empty();
        }
    };

    /// Logging
    struct Logging {
        std::string level = "info";
        std::string file;  // empty = console only
    };

    Scanner scanner;
    Whale whale;
    DayTrading day_trading;
    Baseline baseline;
    Backtest backtest;
    Scoring scoring;
    MarketData market_data;
    Storage storage;
    Notify notify;
    Logging logging;

    /// Create default configuration
    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, Configuration error on failure
    [[nodiscard]] static Result<Config, Error> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    /// @param config_path Optional path to JSON config file
    /// @return Loaded configuration
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);

    /// Check thresholds and ranges
    /// @return One message per violated rule; empty when the config is usable
    [[nodiscard]] std::vector<std::string> validate() const;
};

/// Split "SPY, QQQ,aapl" into upper-case symbols
[[nodiscard]] std::vector<std::string> parse_watchlist(const std::string& list);

/// Parse "option" / "underlying"
[[nodiscard]] std::optional<PriceBasis> parse_price_basis(const std::string& text);

[[nodiscard]] const char* to_string(PriceBasis basis) noexcept;

}  // namespace optiscan
