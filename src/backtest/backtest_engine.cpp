#include "backtest/backtest_engine.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>

namespace optiscan::backtest {

BacktestEngine::BacktestEngine(market::MarketDataClient& client, Config::Backtest config)
    : client_(client)
    , config_(std::move(config))
{}

Price BacktestEngine::entry_price(const detect::Opportunity& opportunity, PriceBasis basis) {
    return basis == PriceBasis::Underlying ? opportunity.underlying_price : opportunity.price;
}

std::optional<Price> BacktestEngine::price_at(
    const std::vector<market::HistoricalBar>& bars,
    Timestamp detected_at,
    Timestamp target
) {
    // Bars are sorted; skip anything before detection
    auto first = std::lower_bound(bars.begin(), bars.end(), detected_at,
        [](const market::HistoricalBar& bar, Timestamp ts) {
            return bar.timestamp < ts;
        });
    if (first == bars.end()) {
        return std::nullopt;
    }
    if (bars.back().timestamp < target) {
        return std::nullopt;
    }

    auto after = std::upper_bound(first, bars.end(), target,
        [](Timestamp ts, const market::HistoricalBar& bar) {
            return ts < bar.timestamp;
        });
    if (after == first) {
        return first->price;
    }
    return std::prev(after)->price;
}

BacktestResult BacktestEngine::evaluate_bars(
    const detect::StoredOpportunity& stored,
    Price entry,
    const std::vector<market::HistoricalBar>& bars,
    const Config::Backtest& config
) {
    const auto& opp = stored.opportunity;

    BacktestResult result;
    result.opportunity_id = stored.id;
    result.alert_type = opp.alert_type;
    result.strategy = opp.strategy;
    result.contract = opp.contract;
    result.detected_at = opp.detected_at;
    result.basis = config.price_basis;
    result.entry_price = entry;

    for (auto horizon : config.horizons) {
        auto price = price_at(bars, opp.detected_at, opp.detected_at + horizon);
        if (price) {
            result.returns[horizon] = percent_change(entry, *price);
        }
    }

    // Walk the bars inside the largest horizon for peak and exit
    const auto window_end = opp.detected_at + config.max_horizon();
    const auto min_target = config.profit_targets.empty()
        ? std::optional<double>{}
        : std::optional<double>{*std::min_element(config.profit_targets.begin(),
                                                  config.profit_targets.end())};

    for (const auto& bar : bars) {
        if (bar.timestamp < opp.detected_at) {
            continue;
        }
        if (bar.timestamp > window_end) {
            break;
        }

        auto change = percent_change(entry, bar.price);
        if (!result.peak_return || change > *result.peak_return) {
            result.peak_return = change;
        }

        if (result.exit_outcome == ExitOutcome::Open) {
            if (min_target && change >= *min_target) {
                result.exit_outcome = ExitOutcome::TargetHit;
                result.exit_return = change;
            } else if (change <= config.stop_loss) {
                result.exit_outcome = ExitOutcome::StoppedOut;
                result.exit_return = change;
            }
        }
    }

    return result;
}

Result<std::vector<market::HistoricalBar>, Error> BacktestEngine::fetch_bars(
    const detect::Opportunity& opp
) const {
    auto start = opp.detected_at;
    auto end = opp.detected_at + config_.max_horizon() + config_.bar_granularity;

    if (config_.price_basis == PriceBasis::Underlying) {
        return client_.get_underlying_bars(opp.symbol(), start, end, config_.bar_granularity);
    }
    return client_.get_historical_bars(opp.contract, start, end, config_.bar_granularity);
}

Result<BacktestResult, Error> BacktestEngine::evaluate(const detect::StoredOpportunity& stored) const {
    const auto& opp = stored.opportunity;

    Price entry = entry_price(opp, config_.price_basis);
    if (!(entry > 0.0)) {
        return Result<BacktestResult, Error>::Err(Error::data_unavailable(
            "No " + std::string(to_string(config_.price_basis)) +
            " entry price for opportunity " + std::to_string(stored.id)
        ));
    }

    try {
        auto bars = fetch_bars(opp);
        if (bars.is_err()) {
            if (bars.error().is(ErrorKind::DataUnavailable)) {
                spdlog::debug("No history yet for opportunity {} ({})",
                              stored.id, opp.contract.to_string());
                return Result<BacktestResult, Error>::Ok(
                    evaluate_bars(stored, entry, {}, config_)
                );
            }
            return Result<BacktestResult, Error>::Err(bars.error());
        }

        auto sorted = bars.value();
        std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
            return a.timestamp < b.timestamp;
        });
        return Result<BacktestResult, Error>::Ok(evaluate_bars(stored, entry, sorted, config_));

    } catch (const std::exception& e) {
        return Result<BacktestResult, Error>::Err(Error::transient(
            "Backtest of opportunity " + std::to_string(stored.id) + " threw: " + e.what()
        ));
    }
}

std::vector<Result<BacktestResult, Error>> BacktestEngine::run_batch(
    const std::vector<detect::StoredOpportunity>& batch
) const {
    std::vector<std::optional<Result<BacktestResult, Error>>> slots(batch.size());

    {
        boost::asio::thread_pool pool(std::max<std::size_t>(1, config_.max_workers));
        for (std::size_t i = 0; i < batch.size(); ++i) {
            boost::asio::post(pool, [this, &batch, &slots, i] {
                try {
                    slots[i].emplace(evaluate(batch[i]));
                } catch (const std::exception& e) {
                    slots[i].emplace(Result<BacktestResult, Error>::Err(
                        Error::transient(std::string("Backtest worker error: ") + e.what())
                    ));
                }
            });
        }
        pool.join();
    }

    std::vector<Result<BacktestResult, Error>> results;
    results.reserve(batch.size());
    for (auto& slot : slots) {
        results.push_back(std::move(*slot));
    }
    return results;
}

}  // namespace optiscan::backtest
