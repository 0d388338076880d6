#include "detect/detector.hpp"
#include <type_traits>

namespace optiscan::detect {

std::optional<Opportunity> evaluate(
    const Detector& detector,
    const Symbol& symbol,
    const market::OptionSnapshot& snapshot,
    const DetectionContext& ctx
) {
    return std::visit([&](const auto& d) {
        return d.evaluate(symbol, snapshot, ctx);
    }, detector);
}

std::string_view detector_name(const Detector& detector) {
    return std::visit([](const auto& d) -> std::string_view {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, WhaleActivityDetector>) {
            return kWhaleActivity;
        } else if constexpr (std::is_same_v<T, DayTradingDetector>) {
            return kDayTrading;
        } else {
            return d.name;
        }
    }, detector);
}

std::vector<Detector> make_detectors(const Config& config) {
    std::vector<Detector> detectors;
    if (config.whale.enabled) {
        detectors.emplace_back(WhaleActivityDetector{config.whale});
    }
    if (config.day_trading.enabled) {
        detectors.emplace_back(DayTradingDetector{config.day_trading});
    }
    return detectors;
}

}  // namespace optiscan::detect
