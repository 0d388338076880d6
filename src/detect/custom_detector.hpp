#pragma once

#include "detect/detection_context.hpp"
#include "detect/opportunity.hpp"
#include "market/types.hpp"
#include <functional>
#include <optional>
#include <string>

namespace optiscan::detect {

/// Detector defined by a predicate, registered in code
///
/// The predicate sees the snapshot and the detection context (baseline
/// lookup included). Zero-volume snapshots never reach it.
struct CustomDetector {
    using Predicate = std::function<bool(const market::OptionSnapshot&, const DetectionContext&)>;

    std::string name;
    std::string alert_type;
    std::string strategy;
    Predicate predicate;

    [[nodiscard]] std::optional<Opportunity> evaluate(
        const Symbol& symbol,
        const market::OptionSnapshot& snapshot,
        const DetectionContext& ctx
    ) const {
        if (snapshot.volume <= 0 || !predicate || !predicate(snapshot, ctx)) {
            return std::nullopt;
        }
        auto opp = make_opportunity(symbol, snapshot, alert_type, strategy);
        attach_score(opp, ctx.scorer);
        return opp;
    }
};

}  // namespace optiscan::detect
