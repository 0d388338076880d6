#include <gtest/gtest.h>
#include "output/json_formatter.hpp"
#include "output/report_formatter.hpp"

using namespace optiscan;
using namespace optiscan::output;
using namespace std::chrono_literals;

namespace {

const Timestamp kT0 = convert::from_epoch_ms(1705000000123);

detect::StoredOpportunity whale_alert() {
    detect::Opportunity opp;
    opp.contract = market::ContractKey{"SPY", market::OptionType::Call, 450.0, "2024-01-19"};
    opp.detected_at = kT0;
    opp.price = 20.0;
    opp.volume = 500;
    opp.open_interest = 12345;
    opp.notional_value = 1'000'000.0;
    opp.underlying_price = 448.2;
    opp.greeks = market::Greeks{.implied_volatility = 0.42};
    opp.baseline_average_volume = 100.0;
    opp.volume_ratio = 5.0;
    opp.alert_type = "whale_activity";
    opp.strategy = "follow_smart_money";
    opp.is_unusual_volume = true;
    return detect::StoredOpportunity{17, opp};
}

}  // namespace

// ============================================================================
// Helpers
// ============================================================================

TEST(ReportFormatterTest, GroupThousands) {
    EXPECT_EQ(ReportFormatter::group_thousands(0), "0");
    EXPECT_EQ(ReportFormatter::group_thousands(999), "999");
    EXPECT_EQ(ReportFormatter::group_thousands(1234567), "1,234,567");
    EXPECT_EQ(ReportFormatter::group_thousands(1000000.5, 2), "1,000,000.50");
    EXPECT_EQ(ReportFormatter::group_thousands(-12345), "-12,345");
}

TEST(ReportFormatterTest, EscapeHtml) {
    EXPECT_EQ(ReportFormatter::escape_html("a < b & c > d"), "a &lt; b &amp; c &gt; d");
}

TEST(ReportFormatterTest, AlertTitle) {
    EXPECT_EQ(ReportFormatter::alert_title("whale_activity"), "WHALE ACTIVITY");
}

TEST(ReportFormatterTest, IsoTimestamp) {
    EXPECT_EQ(JsonFormatter::iso_timestamp(kT0), "2024-01-11T19:06:40.123Z");
}

// ============================================================================
// Alerts
// ============================================================================

TEST(ReportFormatterTest, PlainAlert) {
    auto text = ReportFormatter::format_alert(whale_alert());

    EXPECT_NE(text.find("WHALE ACTIVITY ALERT"), std::string::npos);
    EXPECT_NE(text.find("SPY CALL $450.00 2024-01-19"), std::string::npos);
    EXPECT_NE(text.find("Notional Value: $1,000,000.00"), std::string::npos);
    EXPECT_NE(text.find("Open Interest: 12,345"), std::string::npos);
    EXPECT_NE(text.find("Volume Ratio: 5.00x"), std::string::npos);
    EXPECT_NE(text.find("IV: 42.0%"), std::string::npos);
    EXPECT_NE(text.find("(#17)"), std::string::npos);
    EXPECT_EQ(text.find("<b>"), std::string::npos);
    EXPECT_EQ(text.find("SCORE"), std::string::npos);
}

TEST(ReportFormatterTest, HtmlAlertWithScore) {
    auto stored = whale_alert();
    stored.opportunity.score = scoring::Score{85.0, "high", "Rule scoring: Volume/OI ratio > 0.5"};

    auto text = ReportFormatter::format_alert(stored, Markup::Html);

    EXPECT_NE(text.find("<b>WHALE ACTIVITY ALERT</b>"), std::string::npos);
    EXPECT_NE(text.find("<b>85.0%</b> (high)"), std::string::npos);
    EXPECT_NE(text.find("ratio &gt; 0.5"), std::string::npos);
}

TEST(ReportFormatterTest, WhaleAlertWithoutBaseline) {
    auto stored = whale_alert();
    stored.opportunity.volume_ratio.reset();
    stored.opportunity.baseline_average_volume.reset();
    stored.opportunity.is_unusual_volume = false;

    auto text = ReportFormatter::format_alert(stored);

    EXPECT_NE(text.find("insufficient history"), std::string::npos);
}

// ============================================================================
// Leaderboard
// ============================================================================

TEST(ReportFormatterTest, EmptyLeaderboard) {
    backtest::LeaderboardSummary summary;

    auto text = ReportFormatter::format_leaderboard(summary);

    EXPECT_NE(text.find("PERFORMANCE LEADERBOARD"), std::string::npos);
    EXPECT_NE(text.find("Total Opportunities: 0"), std::string::npos);
    EXPECT_NE(text.find("No evaluated opportunities yet."), std::string::npos);
}

TEST(ReportFormatterTest, LeaderboardWithResults) {
    backtest::BacktestResult r;
    r.opportunity_id = 1;
    r.alert_type = "whale_activity";
    r.contract = whale_alert().opportunity.contract;
    r.detected_at = kT0;
    r.returns = {{5min, 10.0}, {1min, -2.5}};
    auto summary = backtest::LeaderboardBuilder({1min, 5min}, 5min, 10).build({r});

    auto text = ReportFormatter::format_leaderboard(summary);

    EXPECT_NE(text.find("Total Opportunities: 1"), std::string::npos);
    EXPECT_NE(text.find("5m: +10.00%"), std::string::npos);
    EXPECT_NE(text.find("1m: -2.50%"), std::string::npos);
    EXPECT_NE(text.find("WHALE ACTIVITY (1)"), std::string::npos);
    EXPECT_NE(text.find("1. SPY CALL $450.00 2024-01-19 - +10.00%"), std::string::npos);
}

// ============================================================================
// JSON
// ============================================================================

TEST(JsonFormatterTest, OpportunityRecordShape) {
    auto j = JsonFormatter::format_opportunity(whale_alert());

    EXPECT_EQ(j["record"], "opportunity");
    EXPECT_EQ(j["id"], 17);
    EXPECT_EQ(j["contract"]["symbol"], "SPY");
    EXPECT_EQ(j["detected_at"], 1705000000123);
    EXPECT_FALSE(j.contains("score"));
}

TEST(JsonFormatterTest, BacktestReturnsKeyedByMinutes) {
    backtest::BacktestResult r;
    r.opportunity_id = 4;
    r.alert_type = "day_trading";
    r.contract = whale_alert().opportunity.contract;
    r.detected_at = kT0;
    r.entry_price = 2.0;
    r.returns = {{5min, 10.0}};
    r.exit_outcome = backtest::ExitOutcome::TargetHit;
    r.exit_return = 10.0;

    auto j = JsonFormatter::format_backtest(r);
    EXPECT_EQ(j["returns"]["5"], 10.0);

    auto parsed = JsonFormatter::parse_backtest(j);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), r);
}

TEST(JsonFormatterTest, ParseRejectsMissingFields) {
    auto parsed = JsonFormatter::parse_opportunity(nlohmann::json{{"record", "opportunity"}});

    ASSERT_TRUE(parsed.is_err());
    EXPECT_TRUE(parsed.error().is(ErrorKind::Parse));
}
