#pragma once

#include "scoring/scorer.hpp"
#include <string>

namespace optiscan::scoring {

/// Additive rule scoring over volume, open interest, IV, moneyness and size
///
/// Starts neutral at 50 and adds points per matched factor, capped at 100.
class RuleBasedScorer final : public Scorer {
public:
    [[nodiscard]] Result<Score, Error> score(const detect::Opportunity& opportunity) const override;

    /// Confidence label for a probability in [0, 100]
    /// Extreme probabilities in either direction are the confident ones
    [[nodiscard]] static std::string confidence_for(double probability);

    static constexpr double kNeutralScore = 50.0;
};

}  // namespace optiscan::scoring
