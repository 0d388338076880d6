#include "core/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>

namespace optiscan {

using json = nlohmann::json;

namespace {

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer (with optional range validation)
std::optional<int> get_env_int(const char* name, int min_val = std::numeric_limits<int>::min(),
                               int max_val = std::numeric_limits<int>::max()) {
    auto value = get_env(name);
    if (value) {
        try {
            int result = std::stoi(*value);
            if (result < min_val || result > max_val) {
                std::cerr << "Warning: " << name << " value " << result
                          << " out of range [" << min_val << ", " << max_val
                          << "], ignoring" << std::endl;
                return std::nullopt;
            }
            return result;
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid integer value for " << name
                      << ": " << *value << ", ignoring" << std::endl;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

/// Get environment variable as double
std::optional<double> get_env_double(const char* name) {
    auto value = get_env(name);
    if (value) {
        try {
            return std::stod(*value);
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid numeric value for " << name
                      << ": " << *value << ", ignoring" << std::endl;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    // Scanner overrides
    if (auto v = get_env("OPTISCAN_WATCHLIST")) {
        auto symbols = parse_watchlist(*v);
        if (!symbols.empty()) {
            config.scanner.watchlist = std::move(symbols);
        }
    }
    // Scan interval: 1 second to 1 day
    if (auto v = get_env_int("OPTISCAN_SCAN_INTERVAL_SECONDS", 1, 86400)) {
        config.scanner.scan_interval = std::chrono::seconds(*v);
    }
    if (auto v = get_env_int("OPTISCAN_MAX_CONCURRENCY", 1, 64)) {
        config.scanner.max_concurrency = static_cast<std::size_t>(*v);
    }

    // Whale detector overrides
    if (auto v = get_env_double("OPTISCAN_MIN_NOTIONAL_VALUE")) {
        if (*v >= 0.0) {
            config.whale.min_notional_value = *v;
        }
    }
    if (auto v = get_env_double("OPTISCAN_UNUSUAL_VOLUME_MULTIPLIER")) {
        if (*v > 0.0) {
            config.whale.unusual_volume_multiplier = *v;
        }
    }
    if (auto v = get_env_int("OPTISCAN_MIN_TRADE_SIZE", 0)) {
        config.whale.min_trade_size = *v;
    }

    // Baseline overrides
    if (auto v = get_env_int("OPTISCAN_LOOKBACK_DAYS", 1, 365)) {
        config.baseline.lookback_days = *v;
    }

    // Market data overrides
    if (auto v = get_env("OPTISCAN_MARKET_DATA_HOST")) {
        config.market_data.host = *v;
    }
    if (auto v = get_env("OPTISCAN_MARKET_DATA_PORT")) {
        config.market_data.port = *v;
    }
    if (auto v = get_env("OPTISCAN_MARKET_DATA_API_KEY")) {
        config.market_data.api_key = *v;
    }

    // Storage and notifications
    if (auto v = get_env("OPTISCAN_STORE_PATH")) {
        config.storage.path = *v;
    }
    if (auto v = get_env("OPTISCAN_TELEGRAM_TOKEN")) {
        config.notify.telegram_token = *v;
    }
    if (auto v = get_env("OPTISCAN_TELEGRAM_CHAT_ID")) {
        config.notify.telegram_chat_id = *v;
    }
    if (auto v = get_env("OPTISCAN_LOG_LEVEL")) {
        config.logging.level = *v;
    }
}

std::vector<std::chrono::minutes> read_minutes(const json& arr) {
    std::vector<std::chrono::minutes> out;
    for (const auto& item : arr) {
        out.emplace_back(item.get<int>());
    }
    return out;
}

}  // namespace

std::vector<std::string> parse_watchlist(const std::string& list) {
    std::vector<std::string> symbols;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        std::string symbol;
        for (char c : item) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                symbol.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
            }
        }
        if (!symbol.empty()) {
            symbols.push_back(std::move(symbol));
        }
    }
    return symbols;
}

std::chrono::minutes Config::Backtest::max_horizon() const {
    if (horizons.empty()) {
        return std::chrono::minutes{0};
    }
    return *std::max_element(horizons.begin(), horizons.end());
}

std::optional<PriceBasis> parse_price_basis(const std::string& text) {
    if (text == "option") {
        return PriceBasis::Option;
    }
    if (text == "underlying") {
        return PriceBasis::Underlying;
    }
    return std::nullopt;
}

const char* to_string(PriceBasis basis) noexcept {
    return basis == PriceBasis::Option ? "option" : "underlying";
}

Result<Config, Error> Config::load_from_file(const std::string& path) {
    // Read file contents
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, Error>::Err(Error::configuration("Failed to open config file: " + path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    // Parse JSON
    json j;
    try {
        j = json::parse(content);
    } catch (const json::exception& e) {
        return Result<Config, Error>::Err(
            Error::configuration("Failed to parse JSON: " + std::string(e.what())));
    }

    // Start with defaults
    Config config = Config::defaults();

    try {
        // Scanner section
        if (j.contains("scanner")) {
            const auto& sc = j["scanner"];
            if (sc.contains("watchlist")) {
                config.scanner.watchlist = sc["watchlist"].get<std::vector<std::string>>();
            }
            if (sc.contains("scan_interval_seconds")) {
                config.scanner.scan_interval =
                    std::chrono::seconds(sc["scan_interval_seconds"].get<int>());
            }
            if (sc.contains("max_concurrency")) {
                config.scanner.max_concurrency = sc["max_concurrency"].get<std::size_t>();
            }
            if (sc.contains("dedup_window_seconds")) {
                config.scanner.dedup_window =
                    std::chrono::seconds(sc["dedup_window_seconds"].get<int>());
            }
        }

        // Whale section
        if (j.contains("whale")) {
            const auto& wh = j["whale"];
            config.whale.enabled = wh.value("enabled", config.whale.enabled);
            config.whale.min_notional_value =
                wh.value("min_notional_value", config.whale.min_notional_value);
            config.whale.unusual_volume_multiplier =
                wh.value("unusual_volume_multiplier", config.whale.unusual_volume_multiplier);
            config.whale.min_trade_size = wh.value("min_trade_size", config.whale.min_trade_size);
        }

        // Day trading section
        if (j.contains("day_trading")) {
            const auto& dt = j["day_trading"];
            config.day_trading.enabled = dt.value("enabled", config.day_trading.enabled);
            config.day_trading.min_volume = dt.value("min_volume", config.day_trading.min_volume);
            config.day_trading.min_open_interest =
                dt.value("min_open_interest", config.day_trading.min_open_interest);
            config.day_trading.min_iv_percentile =
                dt.value("min_iv_percentile", config.day_trading.min_iv_percentile);
        }

        // Baseline section
        if (j.contains("baseline")) {
            const auto& bl = j["baseline"];
            config.baseline.lookback_days = bl.value("lookback_days", config.baseline.lookback_days);
            if (bl.contains("granularity_minutes")) {
                config.baseline.granularity =
                    std::chrono::minutes(bl["granularity_minutes"].get<int>());
            }
        }

        // Backtest section
        if (j.contains("backtest")) {
            const auto& bt = j["backtest"];
            if (bt.contains("horizons_minutes")) {
                config.backtest.horizons = read_minutes(bt["horizons_minutes"]);
            }
            if (bt.contains("price_basis")) {
                auto basis = parse_price_basis(bt["price_basis"].get<std::string>());
                if (!basis) {
                    return Result<Config, Error>::Err(Error::configuration(
                        "Unknown price_basis: " + bt["price_basis"].get<std::string>()));
                }
                config.backtest.price_basis = *basis;
            }
            if (bt.contains("bar_granularity_minutes")) {
                config.backtest.bar_granularity =
                    std::chrono::minutes(bt["bar_granularity_minutes"].get<int>());
            }
            config.backtest.max_workers = bt.value("max_workers", config.backtest.max_workers);
            config.backtest.top_n = bt.value("top_n", config.backtest.top_n);
            if (bt.contains("ranking_horizon_minutes")) {
                config.backtest.ranking_horizon =
                    std::chrono::minutes(bt["ranking_horizon_minutes"].get<int>());
            }
            if (bt.contains("profit_targets")) {
                config.backtest.profit_targets = bt["profit_targets"].get<std::vector<double>>();
            }
            config.backtest.stop_loss = bt.value("stop_loss", config.backtest.stop_loss);
            if (bt.contains("give_up_after_minutes")) {
                config.backtest.give_up_after =
                    std::chrono::minutes(bt["give_up_after_minutes"].get<int>());
            }
            if (bt.contains("report_interval_seconds")) {
                config.backtest.report_interval =
                    std::chrono::seconds(bt["report_interval_seconds"].get<int>());
            }
        }

        // Scoring section
        if (j.contains("scoring")) {
            config.scoring.enabled = j["scoring"].value("enabled", config.scoring.enabled);
        }

        // Market data section
        if (j.contains("market_data")) {
            const auto& md = j["market_data"];
            config.market_data.host = md.value("host", config.market_data.host);
            config.market_data.port = md.value("port", config.market_data.port);
            config.market_data.base_path = md.value("base_path", config.market_data.base_path);
            config.market_data.api_key = md.value("api_key", config.market_data.api_key);
            if (md.contains("request_timeout_ms")) {
                config.market_data.request_timeout =
                    std::chrono::milliseconds(md["request_timeout_ms"].get<int>());
            }
            config.market_data.max_retries = md.value("max_retries", config.market_data.max_retries);
            if (md.contains("retry_delay_initial_ms")) {
                config.market_data.retry_delay_initial =
                    std::chrono::milliseconds(md["retry_delay_initial_ms"].get<int>());
            }
            if (md.contains("retry_delay_max_ms")) {
                config.market_data.retry_delay_max =
                    std::chrono::milliseconds(md["retry_delay_max_ms"].get<int>());
            }
            config.market_data.retry_backoff_multiplier =
                md.value("retry_backoff_multiplier", config.market_data.retry_backoff_multiplier);
            config.market_data.retry_jitter_factor =
                md.value("retry_jitter_factor", config.market_data.retry_jitter_factor);
        }

        // Storage section
        if (j.contains("storage")) {
            config.storage.path = j["storage"].value("path", config.storage.path);
        }

        // Notify section
        if (j.contains("notify")) {
            const auto& nt = j["notify"];
            config.notify.console = nt.value("console", config.notify.console);
            config.notify.telegram_host = nt.value("telegram_host", config.notify.telegram_host);
            config.notify.telegram_token = nt.value("telegram_token", config.notify.telegram_token);
            config.notify.telegram_chat_id =
                nt.value("telegram_chat_id", config.notify.telegram_chat_id);
        }

        // Logging section
        if (j.contains("logging")) {
            config.logging.level = j["logging"].value("level", config.logging.level);
            config.logging.file = j["logging"].value("file", config.logging.file);
        }
    } catch (const json::exception& e) {
        return Result<Config, Error>::Err(
            Error::configuration("Error reading config field: " + std::string(e.what())));
    }

    return Result<Config, Error>::Ok(config);
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    // Load from file if path provided
    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            // Logging is not configured yet at this point
            std::cerr << "Warning: Failed to load config from '" << *config_path
                      << "': " << result.error().message
                      << " (using defaults with env overrides)" << std::endl;
        }
    }

    // Apply environment variable overrides (highest priority)
    apply_env_overrides(config);

    return config;
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> errors;

    if (scanner.watchlist.empty()) {
        errors.emplace_back("scanner.watchlist must not be empty");
    }
    if (scanner.scan_interval.count() <= 0) {
        errors.emplace_back("scanner.scan_interval_seconds must be positive");
    }
    if (scanner.max_concurrency == 0) {
        errors.emplace_back("scanner.max_concurrency must be at least 1");
    }
    if (scanner.dedup_window.count() < 0) {
        errors.emplace_back("scanner.dedup_window_seconds must not be negative");
    }

    if (!whale.enabled && !day_trading.enabled) {
        errors.emplace_back("at least one detector must be enabled");
    }
    if (whale.min_notional_value < 0.0) {
        errors.emplace_back("whale.min_notional_value must not be negative");
    }
    if (whale.unusual_volume_multiplier <= 0.0) {
        errors.emplace_back("whale.unusual_volume_multiplier must be positive");
    }
    if (whale.min_trade_size < 0) {
        errors.emplace_back("whale.min_trade_size must not be negative");
    }
    if (day_trading.min_volume < 0 || day_trading.min_open_interest < 0) {
        errors.emplace_back("day_trading volume thresholds must not be negative");
    }
    if (day_trading.min_iv_percentile < 0.0 || day_trading.min_iv_percentile > 100.0) {
        errors.emplace_back("day_trading.min_iv_percentile must be within [0, 100]");
    }

    if (baseline.lookback_days < 1) {
        errors.emplace_back("baseline.lookback_days must be at least 1");
    }
    if (baseline.granularity.count() < 1) {
        errors.emplace_back("baseline.granularity_minutes must be at least 1");
    }

    if (backtest.horizons.empty()) {
        errors.emplace_back("backtest.horizons_minutes must not be empty");
    } else {
        std::set<std::chrono::minutes> seen;
        for (auto h : backtest.horizons) {
            if (h.count() <= 0) {
                errors.emplace_back("backtest horizons must be positive");
                break;
            }
            if (!seen.insert(h).second) {
                errors.emplace_back("backtest horizons must be unique");
                break;
            }
        }
        if (std::find(backtest.horizons.begin(), backtest.horizons.end(),
                      backtest.ranking_horizon) == backtest.horizons.end()) {
            errors.emplace_back("backtest.ranking_horizon_minutes must be one of the horizons");
        }
    }
    if (backtest.bar_granularity.count() < 1) {
        errors.emplace_back("backtest.bar_granularity_minutes must be at least 1");
    }
    if (backtest.max_workers == 0) {
        errors.emplace_back("backtest.max_workers must be at least 1");
    }
    if (backtest.stop_loss >= 0.0) {
        errors.emplace_back("backtest.stop_loss must be negative");
    }
    if (backtest.give_up_after.count() <= 0) {
        errors.emplace_back("backtest.give_up_after_minutes must be positive");
    }
    if (backtest.report_interval.count() <= 0) {
        errors.emplace_back("backtest.report_interval_seconds must be positive");
    }

    if (market_data.host.empty()) {
        errors.emplace_back("market_data.host must not be empty");
    }
    if (storage.path.empty()) {
        errors.emplace_back("storage.path must not be empty");
    }

    static const std::set<std::string> kLevels{
        "trace", "debug", "info", "warn", "error", "critical", "off"
    };
    if (kLevels.count(logging.level) == 0) {
        errors.emplace_back("logging.level must be one of trace, debug, info, warn, error, critical, off");
    }

    return errors;
}

}  // namespace optiscan
