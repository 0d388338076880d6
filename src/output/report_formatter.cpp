#include "output/report_formatter.hpp"
#include "output/json_formatter.hpp"
#include <spdlog/fmt/fmt.h>
#include <cctype>
#include <cmath>
#include <optional>

namespace optiscan::output {

namespace {

/// Applies the channel markup; HTML text is escaped
class Writer {
public:
    explicit Writer(Markup markup) : markup_(markup) {}

    std::string text(std::string_view s) const {
        return markup_ == Markup::Html ? ReportFormatter::escape_html(s) : std::string(s);
    }

    std::string bold(std::string_view s) const {
        if (markup_ == Markup::Html) {
            return "<b>" + ReportFormatter::escape_html(s) + "</b>";
        }
        return std::string(s);
    }

private:
    Markup markup_;
};

std::string signed_percent(double value) {
    return fmt::format("{:+.2f}%", value);
}

std::string contract_line(const market::ContractKey& contract) {
    return fmt::format("{} {} ${:.2f} {}",
                       contract.symbol,
                       contract.option_type == market::OptionType::Call ? "CALL" : "PUT",
                       contract.strike,
                       contract.expiration);
}

std::string optional_percent(const std::optional<double>& value) {
    return value ? signed_percent(*value) : std::string("n/a");
}

std::string category_line(const std::string& title,
                          const backtest::CategorySummary& category,
                          std::chrono::minutes ranking_horizon) {
    auto line = fmt::format("  {} ({}): avg {} {}, best {}, worst {}",
                            title,
                            category.count,
                            convert::horizon_label(ranking_horizon),
                            optional_percent(category.average(ranking_horizon)),
                            optional_percent(category.best_return),
                            optional_percent(category.worst_return));
    auto it = category.horizons.find(ranking_horizon);
    if (it != category.horizons.end() && it->second.profit_factor) {
        line += fmt::format(", PF {:.2f}", *it->second.profit_factor);
    }
    return line + "\n";
}

}  // namespace

std::string ReportFormatter::group_thousands(double value, int decimals) {
    auto text = fmt::format("{:.{}f}", std::fabs(value), decimals);
    auto dot = text.find('.');
    auto int_end = dot == std::string::npos ? text.size() : dot;

    std::string grouped;
    for (std::size_t i = 0; i < int_end; ++i) {
        if (i > 0 && (int_end - i) % 3 == 0) {
            grouped.push_back(',');
        }
        grouped.push_back(text[i]);
    }
    grouped.append(text, int_end, std::string::npos);
    return value < 0 ? "-" + grouped : grouped;
}

std::string ReportFormatter::escape_html(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::string ReportFormatter::alert_title(std::string_view alert_type) {
    std::string out;
    out.reserve(alert_type.size());
    for (char c : alert_type) {
        out.push_back(c == '_' ? ' ' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string ReportFormatter::format_alert(const detect::StoredOpportunity& stored, Markup markup) {
    const Writer w(markup);
    const auto& opp = stored.opportunity;

    std::string msg;
    msg += w.bold(alert_title(opp.alert_type) + " ALERT") + "\n";
    msg += w.bold(contract_line(opp.contract)) + "\n\n";
    msg += fmt::format("Price: ${:.2f}\n", opp.price);
    msg += "Volume: " + group_thousands(static_cast<double>(opp.volume)) + "\n";
    msg += "Open Interest: " + group_thousands(static_cast<double>(opp.open_interest)) + "\n";
    msg += "Notional Value: $" + group_thousands(opp.notional_value, 2) + "\n";
    if (opp.underlying_price > 0.0) {
        msg += fmt::format("Underlying: ${:.2f}\n", opp.underlying_price);
    }
    if (opp.greeks) {
        msg += fmt::format("IV: {:.1f}%\n", opp.greeks->implied_volatility * 100.0);
    }

    if (opp.volume_ratio) {
        msg += fmt::format("Volume Ratio: {:.2f}x baseline ({})\n",
                           *opp.volume_ratio, group_thousands(*opp.baseline_average_volume, 1));
    } else if (opp.alert_type == detect::kWhaleActivity) {
        msg += "Volume Ratio: n/a (insufficient history)\n";
    }
    if (opp.is_unusual_volume) {
        msg += w.text("Unusual volume") + "\n";
    }
    msg += "Strategy: " + w.text(opp.strategy) + "\n";

    if (opp.score) {
        msg += "\n" + w.bold("SCORE") + "\n";
        msg += "Success Probability: " +
               w.bold(fmt::format("{:.1f}%", opp.score->success_probability)) +
               " (" + w.text(opp.score->confidence) + ")\n";
        msg += w.text(opp.score->reasoning) + "\n";
    }

    msg += "\nDetected: " + JsonFormatter::iso_timestamp(opp.detected_at);
    msg += fmt::format(" (#{})", stored.id);
    return msg;
}

std::string ReportFormatter::format_leaderboard(const backtest::LeaderboardSummary& summary, Markup markup) {
    const Writer w(markup);

    std::string msg;
    msg += w.bold("PERFORMANCE LEADERBOARD") + "\n\n";
    msg += fmt::format("Total Opportunities: {}\n", summary.total_opportunities);

    if (summary.total_opportunities == 0) {
        msg += "\nNo evaluated opportunities yet.";
        return msg;
    }

    msg += "\n" + w.bold("Average Return by Horizon:") + "\n";
    if (summary.overall.horizons.empty()) {
        msg += "  no horizon reached yet\n";
    }
    for (const auto& [horizon, stats] : summary.overall.horizons) {
        msg += fmt::format("  {}: {} (n={}, win {:.0f}%, max {}, min {})\n",
                           convert::horizon_label(horizon),
                           signed_percent(stats.mean),
                           stats.samples,
                           stats.win_rate * 100.0,
                           signed_percent(stats.max),
                           signed_percent(stats.min));
    }

    msg += "\n" + w.bold("By Alert Type:") + "\n";
    for (const auto& [alert_type, category] : summary.by_alert_type) {
        msg += category_line(w.text(alert_title(alert_type)), category, summary.ranking_horizon);
    }

    msg += "\n" + w.bold("By Strategy:") + "\n";
    for (const auto& [strategy, category] : summary.by_strategy) {
        msg += category_line(w.text(strategy.empty() ? std::string("unspecified") : strategy),
                             category, summary.ranking_horizon);
    }

    msg += "\n" + w.bold(fmt::format("Top Performers ({}):",
                                     convert::horizon_label(summary.ranking_horizon))) + "\n";
    if (summary.top_performers.empty()) {
        msg += "  none\n";
    }
    for (std::size_t i = 0; i < summary.top_performers.size(); ++i) {
        const auto& ranked = summary.top_performers[i];
        msg += fmt::format("{}. {} - {}\n",
                           i + 1,
                           w.text(contract_line(ranked.contract)),
                           signed_percent(ranked.ranking_return));
    }

    if (!msg.empty() && msg.back() == '\n') {
        msg.pop_back();
    }
    return msg;
}

}  // namespace optiscan::output
