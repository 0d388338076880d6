#pragma once

#include "core/config.hpp"
#include "detect/detection_context.hpp"
#include "detect/opportunity.hpp"
#include "market/types.hpp"
#include <optional>

namespace optiscan::detect {

/// Liquid, high-IV contracts suited to intraday momentum trades
class DayTradingDetector {
public:
    explicit DayTradingDetector(Config::DayTrading config);

    [[nodiscard]] std::optional<Opportunity> evaluate(
        const Symbol& symbol,
        const market::OptionSnapshot& snapshot,
        const DetectionContext& ctx
    ) const;

    /// Volume, open interest and IV all at or above their minimums
    [[nodiscard]] bool qualifies(const market::OptionSnapshot& snapshot) const;

    [[nodiscard]] const Config::DayTrading& config() const noexcept { return config_; }

    static constexpr std::string_view kStrategy = "momentum";

private:
    Config::DayTrading config_;
};

}  // namespace optiscan::detect
