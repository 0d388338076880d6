#pragma once

#include "core/types.hpp"
#include "market/types.hpp"
#include "scoring/score.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace optiscan::detect {

inline constexpr std::string_view kWhaleActivity = "whale_activity";
inline constexpr std::string_view kDayTrading = "day_trading";

/// Anomalous contract activity produced by a detector
///
/// Identity is contract + detected_at. Mutated only to attach a score
/// before it is persisted; immutable afterwards.
struct Opportunity {
    market::ContractKey contract;
    Timestamp detected_at{};

    // Market facts at detection
    Price price{0.0};
    Contracts volume{0};
    Contracts open_interest{0};
    double notional_value{0.0};
    Price underlying_price{0.0};
    std::optional<market::Greeks> greeks;

    // Absent when the baseline is unknown
    std::optional<double> baseline_average_volume;
    std::optional<double> volume_ratio;

    std::string alert_type;
    std::string strategy;
    bool is_unusual_volume{false};

    std::optional<scoring::Score> score;

    [[nodiscard]] const Symbol& symbol() const noexcept { return contract.symbol; }

    [[nodiscard]] double implied_volatility() const {
        return greeks ? greeks->implied_volatility : 0.0;
    }

    [[nodiscard]] std::optional<double> success_probability() const {
        if (score) {
            return score->success_probability;
        }
        return std::nullopt;
    }
};

/// Opportunity with the id assigned by persistence
struct StoredOpportunity {
    OpportunityId id{0};
    Opportunity opportunity;
};

/// Copy the snapshot's market facts into a fresh opportunity
[[nodiscard]] Opportunity make_opportunity(
    const Symbol& symbol,
    const market::OptionSnapshot& snapshot,
    std::string_view alert_type,
    std::string_view strategy
);

}  // namespace optiscan::detect
