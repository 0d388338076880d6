#include "detect/day_trading_detector.hpp"

namespace optiscan::detect {

DayTradingDetector::DayTradingDetector(Config::DayTrading config)
    : config_(config)
{}

bool DayTradingDetector::qualifies(const market::OptionSnapshot& snapshot) const {
    if (snapshot.volume <= 0) {
        return false;
    }
    if (snapshot.volume < config_.min_volume) {
        return false;
    }
    if (snapshot.open_interest < config_.min_open_interest) {
        return false;
    }
    // Provider IV is a fraction; the threshold is configured in percent
    return snapshot.implied_volatility() >= config_.min_iv_percentile / 100.0;
}

std::optional<Opportunity> DayTradingDetector::evaluate(
    const Symbol& symbol,
    const market::OptionSnapshot& snapshot,
    const DetectionContext& ctx
) const {
    if (!qualifies(snapshot)) {
        return std::nullopt;
    }

    auto opp = make_opportunity(symbol, snapshot, kDayTrading, kStrategy);
    attach_score(opp, ctx.scorer);
    return opp;
}

}  // namespace optiscan::detect
