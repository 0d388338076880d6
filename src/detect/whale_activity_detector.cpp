#include "detect/whale_activity_detector.hpp"

namespace optiscan::detect {

WhaleActivityDetector::WhaleActivityDetector(Config::Whale config)
    : config_(config)
{}

std::optional<Opportunity> WhaleActivityDetector::evaluate(
    const Symbol& symbol,
    const market::OptionSnapshot& snapshot,
    const DetectionContext& ctx
) const {
    if (snapshot.volume <= 0) {
        return std::nullopt;
    }

    // Cheap filter first; below the minimum no baseline is fetched
    double notional = snapshot.notional_value();
    if (!(notional >= config_.min_notional_value)) {
        return std::nullopt;
    }

    auto opp = make_opportunity(symbol, snapshot, kWhaleActivity, kStrategy);

    auto baseline = ctx.lookup_baseline(opp.contract);
    if (baseline.known()) {
        opp.baseline_average_volume = baseline.average_volume;
        opp.volume_ratio = static_cast<double>(snapshot.volume) / *baseline.average_volume;
        opp.is_unusual_volume = *opp.volume_ratio >= config_.unusual_volume_multiplier;
    }

    if (!opp.is_unusual_volume && snapshot.volume < config_.min_trade_size) {
        return std::nullopt;
    }

    attach_score(opp, ctx.scorer);
    return opp;
}

}  // namespace optiscan::detect
