#include "storage/in_memory_store.hpp"
#include <algorithm>

namespace optiscan::storage {

Result<OpportunityId, Error> InMemoryOpportunityStore::save(const detect::Opportunity& opportunity) {
    std::lock_guard lock(mutex_);
    auto id = ++last_id_;
    opportunities_.emplace(id, detect::StoredOpportunity{id, opportunity});
    return Result<OpportunityId, Error>::Ok(id);
}

Status InMemoryOpportunityStore::save(const backtest::BacktestResult& result) {
    std::lock_guard lock(mutex_);
    if (opportunities_.find(result.opportunity_id) == opportunities_.end()) {
        return Status::Err(Error::storage(
            "Backtest result for unknown opportunity " + std::to_string(result.opportunity_id)
        ));
    }
    results_.insert_or_assign(result.opportunity_id, result);
    return ok_status();
}

std::vector<detect::StoredOpportunity> InMemoryOpportunityStore::query(const OpportunityFilter& filter) const {
    std::lock_guard lock(mutex_);
    std::vector<detect::StoredOpportunity> out;
    for (const auto& [id, stored] : opportunities_) {
        if (!filter.matches(stored)) {
            continue;
        }
        if (filter.without_backtest && results_.find(id) != results_.end()) {
            continue;
        }
        out.push_back(stored);
    }
    return out;
}

std::optional<backtest::BacktestResult> InMemoryOpportunityStore::backtest_result(OpportunityId id) const {
    std::lock_guard lock(mutex_);
    auto it = results_.find(id);
    if (it == results_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<backtest::BacktestResult> InMemoryOpportunityStore::backtest_results() const {
    std::lock_guard lock(mutex_);
    std::vector<backtest::BacktestResult> out;
    out.reserve(results_.size());
    for (const auto& [id, result] : results_) {
        out.push_back(result);
    }
    return out;
}

void InMemoryOpportunityStore::restore(detect::StoredOpportunity stored) {
    std::lock_guard lock(mutex_);
    last_id_ = std::max(last_id_, stored.id);
    auto id = stored.id;
    opportunities_.insert_or_assign(id, std::move(stored));
}

OpportunityId InMemoryOpportunityStore::next_id() const {
    std::lock_guard lock(mutex_);
    return last_id_ + 1;
}

bool InMemoryOpportunityStore::contains(OpportunityId id) const {
    std::lock_guard lock(mutex_);
    return opportunities_.find(id) != opportunities_.end();
}

std::size_t InMemoryOpportunityStore::opportunity_count() const {
    std::lock_guard lock(mutex_);
    return opportunities_.size();
}

}  // namespace optiscan::storage
