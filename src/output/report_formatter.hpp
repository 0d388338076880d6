#pragma once

#include "backtest/leaderboard.hpp"
#include "detect/opportunity.hpp"
#include <string>
#include <string_view>

namespace optiscan::output {

/// Text markup understood by a notification channel
enum class Markup {
    Plain,
    Html
};

/// Human-readable alert and leaderboard text for notification channels
class ReportFormatter {
public:
    /// Alert for one detected opportunity
    [[nodiscard]] static std::string format_alert(
        const detect::StoredOpportunity& stored,
        Markup markup = Markup::Plain
    );

    /// Leaderboard: totals, per-horizon averages, categories, top performers
    [[nodiscard]] static std::string format_leaderboard(
        const backtest::LeaderboardSummary& summary,
        Markup markup = Markup::Plain
    );

    /// "1,234,567"
    [[nodiscard]] static std::string group_thousands(double value, int decimals = 0);

    /// Escape &, < and > for HTML parse mode
    [[nodiscard]] static std::string escape_html(std::string_view text);

    /// Upper-case alert type with spaces: "whale_activity" -> "WHALE ACTIVITY"
    [[nodiscard]] static std::string alert_title(std::string_view alert_type);
};

}  // namespace optiscan::output
