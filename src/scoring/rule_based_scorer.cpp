#include "scoring/rule_based_scorer.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace optiscan::scoring {

namespace {

constexpr double kHighVolume = 1000.0;
constexpr double kVolumeOiRatio = 0.5;
constexpr double kHighIv = 0.5;
constexpr double kCallMoneyness = 1.05;
constexpr double kPutMoneyness = 0.95;
constexpr double kLargeNotional = 1'000'000.0;

}  // namespace

std::string RuleBasedScorer::confidence_for(double probability) {
    if (probability > 85.0 || probability < 15.0) {
        return "very high";
    }
    if (probability > 75.0 || probability < 25.0) {
        return "high";
    }
    if (probability > 65.0 || probability < 35.0) {
        return "medium";
    }
    return "low";
}

Result<Score, Error> RuleBasedScorer::score(const detect::Opportunity& opp) const {
    if (!std::isfinite(opp.price) || !std::isfinite(opp.notional_value)) {
        return Result<Score, Error>::Err(
            Error::scoring("Non-finite market facts for " + opp.contract.to_string())
        );
    }

    double points = kNeutralScore;
    std::vector<std::string> reasons;

    auto volume = static_cast<double>(opp.volume);
    if (volume > kHighVolume) {
        points += 5.0;
        reasons.emplace_back("High volume");
    }

    if (opp.open_interest > 0 &&
        volume / static_cast<double>(opp.open_interest) > kVolumeOiRatio) {
        points += 10.0;
        reasons.emplace_back("Volume/OI ratio > 0.5");
    }

    if (opp.implied_volatility() > kHighIv) {
        points += 5.0;
        reasons.emplace_back("High implied volatility");
    }

    if (opp.underlying_price > 0.0) {
        const auto strike = opp.contract.strike;
        if (opp.contract.option_type == market::OptionType::Call &&
            strike < opp.underlying_price * kCallMoneyness) {
            points += 5.0;
            reasons.emplace_back("Call strike near or in-the-money");
        }
        if (opp.contract.option_type == market::OptionType::Put &&
            strike > opp.underlying_price * kPutMoneyness) {
            points += 5.0;
            reasons.emplace_back("Put strike near or in-the-money");
        }
    }

    if (opp.notional_value > kLargeNotional) {
        points += 10.0;
        reasons.emplace_back("Large notional value");
    }

    points = std::min(points, 100.0);

    std::string reasoning = "Rule scoring: ";
    if (reasons.empty()) {
        reasoning += "no factors matched";
    } else {
        for (std::size_t i = 0; i < reasons.size(); ++i) {
            if (i > 0) {
                reasoning += ", ";
            }
            reasoning += reasons[i];
        }
    }

    return Result<Score, Error>::Ok(Score{
        .success_probability = points,
        .confidence = confidence_for(points),
        .reasoning = std::move(reasoning),
    });
}

}  // namespace optiscan::scoring
