#pragma once

#include "storage/opportunity_store.hpp"
#include <map>
#include <mutex>

namespace optiscan::storage {

/// Volatile store; also the index behind JsonlOpportunityStore
class InMemoryOpportunityStore final : public OpportunityStore {
public:
    [[nodiscard]] Result<OpportunityId, Error> save(const detect::Opportunity& opportunity) override;
    [[nodiscard]] Status save(const backtest::BacktestResult& result) override;

    [[nodiscard]] std::vector<detect::StoredOpportunity> query(const OpportunityFilter& filter) const override;
    [[nodiscard]] std::optional<backtest::BacktestResult> backtest_result(OpportunityId id) const override;
    [[nodiscard]] std::vector<backtest::BacktestResult> backtest_results() const override;

    /// Insert a previously persisted opportunity, keeping its id
    void restore(detect::StoredOpportunity stored);

    /// Id the next save will assign
    [[nodiscard]] OpportunityId next_id() const;

    [[nodiscard]] bool contains(OpportunityId id) const;
    [[nodiscard]] std::size_t opportunity_count() const;

private:
    mutable std::mutex mutex_;
    std::map<OpportunityId, detect::StoredOpportunity> opportunities_;
    std::map<OpportunityId, backtest::BacktestResult> results_;
    OpportunityId last_id_{0};
};

}  // namespace optiscan::storage
