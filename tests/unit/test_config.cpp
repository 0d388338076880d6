#include <gtest/gtest.h>
#include "core/config.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace optiscan;

class ConfigTest : public ::testing::Test {
protected:
    std::string temp_config_path;

    void SetUp() override {
        temp_config_path = "test_config_temp.json";
    }

    void TearDown() override {
        std::remove(temp_config_path.c_str());
        unsetenv("OPTISCAN_WATCHLIST");
        unsetenv("OPTISCAN_MIN_NOTIONAL_VALUE");
        unsetenv("OPTISCAN_SCAN_INTERVAL_SECONDS");
    }

    void write_config(const std::string& content) {
        std::ofstream file(temp_config_path);
        file << content;
    }

    static bool mentions(const std::vector<std::string>& errors, const std::string& needle) {
        return std::any_of(errors.begin(), errors.end(), [&](const std::string& e) {
            return e.find(needle) != std::string::npos;
        });
    }
};

TEST_F(ConfigTest, DefaultsAreReasonable) {
    auto config = Config::defaults();

    EXPECT_EQ(config.scanner.scan_interval.count(), 300);
    EXPECT_FALSE(config.scanner.watchlist.empty());
    EXPECT_DOUBLE_EQ(config.whale.min_notional_value, 1'000'000.0);
    EXPECT_DOUBLE_EQ(config.whale.unusual_volume_multiplier, 3.0);
    EXPECT_EQ(config.whale.min_trade_size, 100);
    EXPECT_EQ(config.baseline.lookback_days, 30);
    EXPECT_EQ(config.baseline.granularity.count(), 30);
    ASSERT_EQ(config.backtest.horizons.size(), 5u);
    EXPECT_EQ(config.backtest.max_horizon().count(), 20);
    EXPECT_EQ(config.backtest.price_basis, PriceBasis::Option);
    EXPECT_TRUE(config.validate().empty());
}

TEST_F(ConfigTest, LoadFromFileSuccess) {
    write_config(R"({
        "scanner": { "watchlist": ["TSLA", "AMD"], "scan_interval_seconds": 60 },
        "whale": { "min_notional_value": 250000 }
    })");

    auto result = Config::load_from_file(temp_config_path);

    ASSERT_TRUE(result.is_ok());
    auto config = result.value();

    EXPECT_EQ(config.scanner.watchlist, (std::vector<std::string>{"TSLA", "AMD"}));
    EXPECT_EQ(config.scanner.scan_interval.count(), 60);
    EXPECT_DOUBLE_EQ(config.whale.min_notional_value, 250000.0);

    // Defaults preserved
    EXPECT_DOUBLE_EQ(config.whale.unusual_volume_multiplier, 3.0);
    EXPECT_EQ(config.market_data.host, "api.thetadata.net");
}

TEST_F(ConfigTest, LoadFromFileNotFound) {
    auto result = Config::load_from_file("nonexistent_file.json");

    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().is(ErrorKind::Configuration));
    EXPECT_NE(result.error().message.find("Failed to open"), std::string::npos);
}

TEST_F(ConfigTest, LoadFromFileInvalidJson) {
    write_config("{ invalid json }");

    auto result = Config::load_from_file(temp_config_path);

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().message.find("parse"), std::string::npos);
}

TEST_F(ConfigTest, LoadFromFileWrongFieldType) {
    write_config(R"({ "scanner": { "scan_interval_seconds": "soon" } })");

    auto result = Config::load_from_file(temp_config_path);

    EXPECT_TRUE(result.is_err());
}

TEST_F(ConfigTest, LoadFromFileUnknownPriceBasis) {
    write_config(R"({ "backtest": { "price_basis": "delta" } })");

    auto result = Config::load_from_file(temp_config_path);

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().message.find("price_basis"), std::string::npos);
}

TEST_F(ConfigTest, LoadFromFileAllSections) {
    write_config(R"({
        "scanner": { "max_concurrency": 2, "dedup_window_seconds": 600 },
        "whale": { "enabled": false, "unusual_volume_multiplier": 4.5, "min_trade_size": 250 },
        "day_trading": { "min_volume": 300, "min_open_interest": 1000, "min_iv_percentile": 55 },
        "baseline": { "lookback_days": 10, "granularity_minutes": 15 },
        "backtest": {
            "horizons_minutes": [5, 30, 60],
            "price_basis": "underlying",
            "ranking_horizon_minutes": 30,
            "top_n": 3,
            "profit_targets": [10, 20],
            "stop_loss": -25,
            "give_up_after_minutes": 120,
            "report_interval_seconds": 900
        },
        "scoring": { "enabled": false },
        "market_data": {
            "host": "md.example.com", "port": "8443", "api_key": "k",
            "request_timeout_ms": 2500, "max_retries": 5
        },
        "storage": { "path": "/tmp/opps.jsonl" },
        "notify": { "console": false, "telegram_token": "t", "telegram_chat_id": "c" },
        "logging": { "level": "debug", "file": "optiscan.log" }
    })");

    auto result = Config::load_from_file(temp_config_path);

    ASSERT_TRUE(result.is_ok());
    auto config = result.value();

    EXPECT_EQ(config.scanner.max_concurrency, 2u);
    EXPECT_EQ(config.scanner.dedup_window.count(), 600);
    EXPECT_FALSE(config.whale.enabled);
    EXPECT_DOUBLE_EQ(config.whale.unusual_volume_multiplier, 4.5);
    EXPECT_EQ(config.whale.min_trade_size, 250);
    EXPECT_EQ(config.day_trading.min_volume, 300);
    EXPECT_EQ(config.day_trading.min_open_interest, 1000);
    EXPECT_DOUBLE_EQ(config.day_trading.min_iv_percentile, 55.0);
    EXPECT_EQ(config.baseline.lookback_days, 10);
    EXPECT_EQ(config.baseline.granularity.count(), 15);
    EXPECT_EQ(config.backtest.horizons.size(), 3u);
    EXPECT_EQ(config.backtest.max_horizon().count(), 60);
    EXPECT_EQ(config.backtest.price_basis, PriceBasis::Underlying);
    EXPECT_EQ(config.backtest.ranking_horizon.count(), 30);
    EXPECT_EQ(config.backtest.top_n, 3u);
    EXPECT_DOUBLE_EQ(config.backtest.stop_loss, -25.0);
    EXPECT_EQ(config.backtest.give_up_after.count(), 120);
    EXPECT_FALSE(config.scoring.enabled);
    EXPECT_EQ(config.market_data.host, "md.example.com");
    EXPECT_EQ(config.market_data.request_timeout.count(), 2500);
    EXPECT_EQ(config.market_data.max_retries, 5u);
    EXPECT_EQ(config.storage.path, "/tmp/opps.jsonl");
    EXPECT_FALSE(config.notify.console);
    EXPECT_TRUE(config.notify.telegram_enabled());
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_TRUE(config.validate().empty());
}

TEST_F(ConfigTest, LoadWithPathLoadsFile) {
    write_config(R"({ "scanner": { "watchlist": ["IWM"] } })");

    auto config = Config::load(temp_config_path);

    EXPECT_EQ(config.scanner.watchlist, (std::vector<std::string>{"IWM"}));
}

TEST_F(ConfigTest, LoadFallsBackToDefaultsOnBadFile) {
    auto config = Config::load(std::string("nonexistent_file.json"));

    EXPECT_EQ(config.scanner.scan_interval.count(), 300);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    write_config(R"({
        "scanner": { "watchlist": ["IWM"], "scan_interval_seconds": 60 },
        "whale": { "min_notional_value": 10 }
    })");
    setenv("OPTISCAN_WATCHLIST", "spy, qqq", 1);
    setenv("OPTISCAN_MIN_NOTIONAL_VALUE", "500000", 1);
    setenv("OPTISCAN_SCAN_INTERVAL_SECONDS", "0", 1);  // out of range, ignored

    auto config = Config::load(temp_config_path);

    EXPECT_EQ(config.scanner.watchlist, (std::vector<std::string>{"SPY", "QQQ"}));
    EXPECT_DOUBLE_EQ(config.whale.min_notional_value, 500000.0);
    EXPECT_EQ(config.scanner.scan_interval.count(), 60);
}

TEST_F(ConfigTest, ParseWatchlistNormalizes) {
    EXPECT_EQ(parse_watchlist(" spy,,Qqq ,aapl"),
              (std::vector<std::string>{"SPY", "QQQ", "AAPL"}));
    EXPECT_TRUE(parse_watchlist(" , ").empty());
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigTest, ValidateRejectsBadThresholds) {
    auto config = Config::defaults();
    config.scanner.watchlist.clear();
    config.whale.unusual_volume_multiplier = 0.0;
    config.whale.min_notional_value = -1.0;
    config.baseline.lookback_days = 0;

    auto errors = config.validate();

    EXPECT_TRUE(mentions(errors, "watchlist"));
    EXPECT_TRUE(mentions(errors, "unusual_volume_multiplier"));
    EXPECT_TRUE(mentions(errors, "min_notional_value"));
    EXPECT_TRUE(mentions(errors, "lookback_days"));
}

TEST_F(ConfigTest, ValidateRejectsBadHorizons) {
    auto config = Config::defaults();
    config.backtest.horizons = {std::chrono::minutes{5}, std::chrono::minutes{5}};
    config.backtest.ranking_horizon = std::chrono::minutes{7};

    auto errors = config.validate();

    EXPECT_TRUE(mentions(errors, "unique"));
    EXPECT_TRUE(mentions(errors, "ranking_horizon"));
}

TEST_F(ConfigTest, ValidateRejectsNonPositiveGiveUpWindow) {
    auto config = Config::defaults();
    config.backtest.give_up_after = std::chrono::minutes{0};

    EXPECT_TRUE(mentions(config.validate(), "give_up_after_minutes"));
}

TEST_F(ConfigTest, ValidateRequiresADetector) {
    auto config = Config::defaults();
    config.whale.enabled = false;
    config.day_trading.enabled = false;

    EXPECT_TRUE(mentions(config.validate(), "detector"));
}

TEST_F(ConfigTest, ValidateRejectsUnknownLogLevel) {
    auto config = Config::defaults();
    config.logging.level = "loud";

    EXPECT_TRUE(mentions(config.validate(), "logging.level"));
}

TEST_F(ConfigTest, PriceBasisRoundTrip) {
    EXPECT_EQ(parse_price_basis("option"), PriceBasis::Option);
    EXPECT_EQ(parse_price_basis("underlying"), PriceBasis::Underlying);
    EXPECT_FALSE(parse_price_basis("delta").has_value());
    EXPECT_STREQ(to_string(PriceBasis::Underlying), "underlying");
}
