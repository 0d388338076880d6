#include "output/json_formatter.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace optiscan::output {

using json = nlohmann::json;

namespace {

json format_contract(const market::ContractKey& contract) {
    return json{
        {"symbol", contract.symbol},
        {"option_type", std::string(market::to_string(contract.option_type))},
        {"strike", contract.strike},
        {"expiration", contract.expiration}
    };
}

market::ContractKey parse_contract(const json& j) {
    auto type = market::parse_option_type(j.at("option_type").get<std::string>());
    if (!type) {
        throw std::invalid_argument("unknown option_type");
    }
    return market::ContractKey{
        j.at("symbol").get<std::string>(),
        *type,
        j.at("strike").get<double>(),
        j.at("expiration").get<std::string>()
    };
}

template <typename T>
json optional_value(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

template <typename T>
std::optional<T> read_optional(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

json horizon_stats_json(const backtest::HorizonStats& stats) {
    return json{
        {"samples", stats.samples},
        {"mean", stats.mean},
        {"max", stats.max},
        {"min", stats.min},
        {"profitable", stats.profitable},
        {"win_rate", stats.win_rate},
        {"above_10", stats.share_above_10},
        {"above_25", stats.share_above_25},
        {"above_50", stats.share_above_50},
        {"average_loss", optional_value(stats.average_loss)},
        {"profit_factor", optional_value(stats.profit_factor)},
        {"max_consecutive_wins", stats.max_consecutive_wins},
        {"max_consecutive_losses", stats.max_consecutive_losses}
    };
}

json category_json(const backtest::CategorySummary& category) {
    json horizons = json::object();
    for (const auto& [horizon, stats] : category.horizons) {
        horizons[convert::horizon_label(horizon)] = horizon_stats_json(stats);
    }
    return json{
        {"count", category.count},
        {"best_return", optional_value(category.best_return)},
        {"worst_return", optional_value(category.worst_return)},
        {"horizons", std::move(horizons)}
    };
}

}  // namespace

json JsonFormatter::format_opportunity(const detect::StoredOpportunity& stored) {
    const auto& opp = stored.opportunity;

    json j{
        {"record", "opportunity"},
        {"id", stored.id},
        {"contract", format_contract(opp.contract)},
        {"detected_at", convert::to_epoch_ms(opp.detected_at)},
        {"detected_at_iso", iso_timestamp(opp.detected_at)},
        {"price", opp.price},
        {"volume", opp.volume},
        {"open_interest", opp.open_interest},
        {"notional_value", opp.notional_value},
        {"underlying_price", opp.underlying_price},
        {"baseline_average_volume", optional_value(opp.baseline_average_volume)},
        {"volume_ratio", optional_value(opp.volume_ratio)},
        {"alert_type", opp.alert_type},
        {"strategy", opp.strategy},
        {"is_unusual_volume", opp.is_unusual_volume}
    };

    if (opp.greeks) {
        j["greeks"] = json{
            {"implied_volatility", opp.greeks->implied_volatility},
            {"delta", opp.greeks->delta},
            {"gamma", opp.greeks->gamma},
            {"theta", opp.greeks->theta},
            {"vega", opp.greeks->vega}
        };
    }

    if (opp.score) {
        j["score"] = json{
            {"success_probability", opp.score->success_probability},
            {"confidence", opp.score->confidence},
            {"reasoning", opp.score->reasoning}
        };
    }

    return j;
}

Result<detect::StoredOpportunity, Error> JsonFormatter::parse_opportunity(const json& j) {
    try {
        detect::StoredOpportunity stored;
        stored.id = j.at("id").get<OpportunityId>();

        auto& opp = stored.opportunity;
        opp.contract = parse_contract(j.at("contract"));
        opp.detected_at = convert::from_epoch_ms(j.at("detected_at").get<std::int64_t>());
        opp.price = j.value("price", 0.0);
        opp.volume = j.value("volume", Contracts{0});
        opp.open_interest = j.value("open_interest", Contracts{0});
        opp.notional_value = j.value("notional_value", 0.0);
        opp.underlying_price = j.value("underlying_price", 0.0);
        opp.baseline_average_volume = read_optional<double>(j, "baseline_average_volume");
        opp.volume_ratio = read_optional<double>(j, "volume_ratio");
        opp.alert_type = j.at("alert_type").get<std::string>();
        opp.strategy = j.value("strategy", std::string{});
        opp.is_unusual_volume = j.value("is_unusual_volume", false);

        if (j.contains("greeks") && j["greeks"].is_object()) {
            const auto& g = j["greeks"];
            opp.greeks = market::Greeks{
                .implied_volatility = g.value("implied_volatility", 0.0),
                .delta = g.value("delta", 0.0),
                .gamma = g.value("gamma", 0.0),
                .theta = g.value("theta", 0.0),
                .vega = g.value("vega", 0.0),
            };
        }

        if (j.contains("score") && j["score"].is_object()) {
            const auto& s = j["score"];
            opp.score = scoring::Score{
                .success_probability = s.value("success_probability", 0.0),
                .confidence = s.value("confidence", std::string{}),
                .reasoning = s.value("reasoning", std::string{}),
            };
        }

        return Result<detect::StoredOpportunity, Error>::Ok(std::move(stored));

    } catch (const std::exception& e) {
        return Result<detect::StoredOpportunity, Error>::Err(
            Error::parse(std::string("Bad opportunity record: ") + e.what())
        );
    }
}

json JsonFormatter::format_backtest(const backtest::BacktestResult& result) {
    json returns = json::object();
    for (const auto& [horizon, value] : result.returns) {
        returns[std::to_string(horizon.count())] = value;
    }

    return json{
        {"record", "backtest"},
        {"opportunity_id", result.opportunity_id},
        {"alert_type", result.alert_type},
        {"strategy", result.strategy},
        {"contract", format_contract(result.contract)},
        {"detected_at", convert::to_epoch_ms(result.detected_at)},
        {"basis", to_string(result.basis)},
        {"entry_price", result.entry_price},
        {"returns", std::move(returns)},
        {"peak_return", optional_value(result.peak_return)},
        {"exit_outcome", std::string(backtest::to_string(result.exit_outcome))},
        {"exit_return", optional_value(result.exit_return)},
        {"no_data", result.no_data}
    };
}

Result<backtest::BacktestResult, Error> JsonFormatter::parse_backtest(const json& j) {
    try {
        backtest::BacktestResult result;
        result.opportunity_id = j.at("opportunity_id").get<OpportunityId>();
        result.alert_type = j.at("alert_type").get<std::string>();
        result.strategy = j.value("strategy", std::string{});
        result.contract = parse_contract(j.at("contract"));
        result.detected_at = convert::from_epoch_ms(j.at("detected_at").get<std::int64_t>());
        result.basis = parse_price_basis(j.value("basis", std::string{"option"}))
                           .value_or(PriceBasis::Option);
        result.entry_price = j.at("entry_price").get<double>();

        for (const auto& [key, value] : j.at("returns").items()) {
            result.returns[std::chrono::minutes{std::stoll(key)}] = value.get<double>();
        }

        result.peak_return = read_optional<double>(j, "peak_return");
        result.exit_outcome = backtest::parse_exit_outcome(j.value("exit_outcome", std::string{"open"}))
                                  .value_or(backtest::ExitOutcome::Open);
        result.exit_return = read_optional<double>(j, "exit_return");
        result.no_data = j.value("no_data", false);

        return Result<backtest::BacktestResult, Error>::Ok(std::move(result));

    } catch (const std::exception& e) {
        return Result<backtest::BacktestResult, Error>::Err(
            Error::parse(std::string("Bad backtest record: ") + e.what())
        );
    }
}

json JsonFormatter::format_leaderboard(const backtest::LeaderboardSummary& summary) {
    json by_type = json::object();
    for (const auto& [alert_type, category] : summary.by_alert_type) {
        by_type[alert_type] = category_json(category);
    }
    json by_strategy = json::object();
    for (const auto& [strategy, category] : summary.by_strategy) {
        by_strategy[strategy] = category_json(category);
    }

    json top = json::array();
    for (const auto& ranked : summary.top_performers) {
        top.push_back(json{
            {"opportunity_id", ranked.opportunity_id},
            {"alert_type", ranked.alert_type},
            {"strategy", ranked.strategy},
            {"contract", format_contract(ranked.contract)},
            {"detected_at", iso_timestamp(ranked.detected_at)},
            {"return", ranked.ranking_return}
        });
    }

    return json{
        {"type", "leaderboard"},
        {"total_opportunities", summary.total_opportunities},
        {"ranking_horizon", convert::horizon_label(summary.ranking_horizon)},
        {"overall", category_json(summary.overall)},
        {"by_alert_type", std::move(by_type)},
        {"by_strategy", std::move(by_strategy)},
        {"top_performers", std::move(top)}
    };
}

std::string JsonFormatter::iso_timestamp(Timestamp ts) {
    auto time_t_ts = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()
    ) % 1000;

    std::tm tm_utc{};
    gmtime_r(&time_t_ts, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace optiscan::output
