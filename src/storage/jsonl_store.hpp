#pragma once

#include "storage/in_memory_store.hpp"
#include "storage/opportunity_store.hpp"
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace optiscan::storage {

/// Append-only JSON-lines file of opportunity and backtest records
///
/// The file is replayed into an in-memory index on open, so ids keep
/// increasing across restarts and the latest backtest line per
/// opportunity wins. Writes are flushed before a save returns.
class JsonlOpportunityStore final : public OpportunityStore {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Use open(); the tag keeps construction inside this class
    JsonlOpportunityStore(PrivateTag, std::string path);

    /// Open (creating if needed) and replay the file
    /// @return Storage error when the file cannot be opened
    [[nodiscard]] static Result<std::unique_ptr<JsonlOpportunityStore>, Error> open(const std::string& path);

    [[nodiscard]] Result<OpportunityId, Error> save(const detect::Opportunity& opportunity) override;
    [[nodiscard]] Status save(const backtest::BacktestResult& result) override;

    [[nodiscard]] std::vector<detect::StoredOpportunity> query(const OpportunityFilter& filter) const override;
    [[nodiscard]] std::optional<backtest::BacktestResult> backtest_result(OpportunityId id) const override;
    [[nodiscard]] std::vector<backtest::BacktestResult> backtest_results() const override;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    /// Lines skipped during replay because they did not parse
    [[nodiscard]] std::size_t skipped_lines() const noexcept { return skipped_lines_; }

private:
    [[nodiscard]] Status replay();
    [[nodiscard]] Status append_line(const std::string& line);

    std::string path_;
    std::ofstream out_;
    std::mutex write_mutex_;  // serializes id assignment and appends
    InMemoryOpportunityStore index_;
    std::size_t skipped_lines_{0};
};

}  // namespace optiscan::storage
