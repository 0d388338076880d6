#pragma once

#include "core/status.hpp"
#include "detect/opportunity.hpp"
#include "scoring/score.hpp"
#include <functional>
#include <optional>

namespace optiscan::scoring {

/// Optional collaborator estimating an opportunity's success probability
class Scorer {
public:
    virtual ~Scorer() = default;

    /// @return Score, or ScoringUnavailable when no estimate can be made
    [[nodiscard]] virtual Result<Score, Error> score(const detect::Opportunity& opportunity) const = 0;
};

/// A scorer that may not be wired up
using ScorerRef = std::optional<std::reference_wrapper<const Scorer>>;

}  // namespace optiscan::scoring
