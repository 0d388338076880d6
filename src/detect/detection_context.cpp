#include "detect/detection_context.hpp"
#include <spdlog/spdlog.h>

namespace optiscan::detect {

void attach_score(Opportunity& opportunity, const scoring::ScorerRef& scorer) {
    if (!scorer) {
        return;
    }

    try {
        auto result = scorer->get().score(opportunity);
        if (result.is_ok()) {
            opportunity.score = result.value();
        } else {
            spdlog::debug("Scoring unavailable for {}: {}",
                          opportunity.contract.to_string(), result.error().message);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Scorer threw for {}: {}", opportunity.contract.to_string(), e.what());
    }
}

}  // namespace optiscan::detect
