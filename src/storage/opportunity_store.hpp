#pragma once

#include "backtest/backtest_result.hpp"
#include "core/status.hpp"
#include "core/types.hpp"
#include "detect/opportunity.hpp"
#include <optional>
#include <string>
#include <vector>

namespace optiscan::storage {

/// Criteria for OpportunityStore::query; unset fields match everything
struct OpportunityFilter {
    std::optional<std::string> alert_type;
    std::optional<Symbol> symbol;
    std::optional<Timestamp> detected_after;   // inclusive
    std::optional<Timestamp> detected_before;  // exclusive
    bool without_backtest = false;

    [[nodiscard]] bool matches(const detect::StoredOpportunity& stored) const {
        const auto& opp = stored.opportunity;
        if (alert_type && opp.alert_type != *alert_type) {
            return false;
        }
        if (symbol && opp.symbol() != *symbol) {
            return false;
        }
        if (detected_after && opp.detected_at < *detected_after) {
            return false;
        }
        if (detected_before && !(opp.detected_at < *detected_before)) {
            return false;
        }
        return true;
    }
};

/// Persistence for opportunities (append-only) and backtest results
/// (keyed by opportunity id, latest wins). Implementations are thread-safe.
class OpportunityStore {
public:
    virtual ~OpportunityStore() = default;

    /// Append an opportunity and assign its id
    [[nodiscard]] virtual Result<OpportunityId, Error> save(const detect::Opportunity& opportunity) = 0;

    /// Store or replace the result for its opportunity id
    [[nodiscard]] virtual Status save(const backtest::BacktestResult& result) = 0;

    /// Opportunities matching the filter, in id order
    [[nodiscard]] virtual std::vector<detect::StoredOpportunity> query(const OpportunityFilter& filter) const = 0;

    [[nodiscard]] virtual std::optional<backtest::BacktestResult> backtest_result(OpportunityId id) const = 0;

    /// Every stored backtest result, in opportunity id order
    [[nodiscard]] virtual std::vector<backtest::BacktestResult> backtest_results() const = 0;
};

}  // namespace optiscan::storage
