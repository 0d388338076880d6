#pragma once

#include "detect/baseline_provider.hpp"
#include "detect/opportunity.hpp"
#include "scoring/scorer.hpp"
#include <functional>

namespace optiscan::detect {

/// Baseline lookup handed to detectors; usually a per-cycle BaselineCache
using BaselineLookup = std::function<Baseline(const market::ContractKey&)>;

/// Collaborators available to a detector while evaluating one snapshot
struct DetectionContext {
    BaselineLookup baseline;    // empty: every baseline is unknown
    scoring::ScorerRef scorer;  // empty: opportunities go out unscored

    [[nodiscard]] Baseline lookup_baseline(const market::ContractKey& contract) const {
        return baseline ? baseline(contract) : Baseline::unknown();
    }
};

/// Ask the scorer, if any, for a success probability
/// Failures leave the opportunity unscored; emission never depends on this
void attach_score(Opportunity& opportunity, const scoring::ScorerRef& scorer);

}  // namespace optiscan::detect
