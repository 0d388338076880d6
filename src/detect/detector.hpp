#pragma once

#include "core/config.hpp"
#include "detect/custom_detector.hpp"
#include "detect/day_trading_detector.hpp"
#include "detect/whale_activity_detector.hpp"
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace optiscan::detect {

/// Closed set of built-in detectors plus the predicate-based extension point
using Detector = std::variant<WhaleActivityDetector, DayTradingDetector, CustomDetector>;

/// Run one detector over one snapshot
[[nodiscard]] std::optional<Opportunity> evaluate(
    const Detector& detector,
    const Symbol& symbol,
    const market::OptionSnapshot& snapshot,
    const DetectionContext& ctx
);

/// Alert type the detector emits
[[nodiscard]] std::string_view detector_name(const Detector& detector);

/// Built-in detectors enabled in the configuration
[[nodiscard]] std::vector<Detector> make_detectors(const Config& config);

}  // namespace optiscan::detect
