#pragma once

#include "core/config.hpp"
#include "detect/detection_context.hpp"
#include "detect/opportunity.hpp"
#include "market/types.hpp"
#include <optional>

namespace optiscan::detect {

/// Flags large trades and volume far above the contract's baseline
///
/// A snapshot qualifies when its notional clears the minimum and either
/// the volume ratio reaches the multiplier or the raw volume reaches the
/// minimum trade size. Either condition alone is enough.
class WhaleActivityDetector {
public:
    explicit WhaleActivityDetector(Config::Whale config);

    /// @return Opportunity when the snapshot qualifies
    [[nodiscard]] std::optional<Opportunity> evaluate(
        const Symbol& symbol,
        const market::OptionSnapshot& snapshot,
        const DetectionContext& ctx
    ) const;

    [[nodiscard]] const Config::Whale& config() const noexcept { return config_; }

    static constexpr std::string_view kStrategy = "follow_smart_money";

private:
    Config::Whale config_;
};

}  // namespace optiscan::detect
