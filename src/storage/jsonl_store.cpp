#include "storage/jsonl_store.hpp"
#include "output/json_formatter.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace optiscan::storage {

using json = nlohmann::json;

JsonlOpportunityStore::JsonlOpportunityStore(PrivateTag, std::string path)
    : path_(std::move(path))
{}

Result<std::unique_ptr<JsonlOpportunityStore>, Error> JsonlOpportunityStore::open(const std::string& path) {
    using StoreResult = Result<std::unique_ptr<JsonlOpportunityStore>, Error>;

    auto store = std::make_unique<JsonlOpportunityStore>(PrivateTag{}, path);

    auto replayed = store->replay();
    if (replayed.is_err()) {
        return StoreResult::Err(replayed.error());
    }

    store->out_.open(path, std::ios::out | std::ios::app);
    if (!store->out_.is_open()) {
        return StoreResult::Err(Error::storage("Cannot open store for append: " + path));
    }

    spdlog::info("Store {}: {} opportunities, {} backtest results",
                 path, store->index_.opportunity_count(), store->index_.backtest_results().size());
    if (store->skipped_lines_ > 0) {
        spdlog::warn("Store {}: skipped {} unreadable lines", path, store->skipped_lines_);
    }

    return StoreResult::Ok(std::move(store));
}

Status JsonlOpportunityStore::replay() {
    std::ifstream in(path_);
    if (!in.is_open()) {
        // Nothing persisted yet
        return ok_status();
    }

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) {
            continue;
        }

        auto j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            ++skipped_lines_;
            continue;
        }

        auto record = j.value("record", std::string{});
        if (record == "opportunity") {
            auto stored = output::JsonFormatter::parse_opportunity(j);
            if (stored.is_err()) {
                spdlog::debug("{}:{}: {}", path_, line_no, stored.error().message);
                ++skipped_lines_;
                continue;
            }
            index_.restore(std::move(stored).take_value());
        } else if (record == "backtest") {
            auto result = output::JsonFormatter::parse_backtest(j);
            if (result.is_err()) {
                spdlog::debug("{}:{}: {}", path_, line_no, result.error().message);
                ++skipped_lines_;
                continue;
            }
            auto saved = index_.save(result.value());
            if (saved.is_err()) {
                spdlog::debug("{}:{}: {}", path_, line_no, saved.error().message);
                ++skipped_lines_;
            }
        } else {
            ++skipped_lines_;
        }
    }

    if (in.bad()) {
        return Status::Err(Error::storage("Read error while loading " + path_));
    }
    return ok_status();
}

Status JsonlOpportunityStore::append_line(const std::string& line) {
    out_ << line << '\n';
    out_.flush();
    if (!out_.good()) {
        out_.clear();
        return Status::Err(Error::storage("Write to " + path_ + " failed"));
    }
    return ok_status();
}

Result<OpportunityId, Error> JsonlOpportunityStore::save(const detect::Opportunity& opportunity) {
    std::lock_guard lock(write_mutex_);

    detect::StoredOpportunity stored{index_.next_id(), opportunity};
    auto written = append_line(output::JsonFormatter::format_opportunity(stored).dump());
    if (written.is_err()) {
        return Result<OpportunityId, Error>::Err(written.error());
    }

    auto id = stored.id;
    index_.restore(std::move(stored));
    return Result<OpportunityId, Error>::Ok(id);
}

Status JsonlOpportunityStore::save(const backtest::BacktestResult& result) {
    std::lock_guard lock(write_mutex_);

    if (!index_.contains(result.opportunity_id)) {
        return Status::Err(Error::storage(
            "Backtest result for unknown opportunity " + std::to_string(result.opportunity_id)
        ));
    }

    auto written = append_line(output::JsonFormatter::format_backtest(result).dump());
    if (written.is_err()) {
        return written;
    }
    return index_.save(result);
}

std::vector<detect::StoredOpportunity> JsonlOpportunityStore::query(const OpportunityFilter& filter) const {
    return index_.query(filter);
}

std::optional<backtest::BacktestResult> JsonlOpportunityStore::backtest_result(OpportunityId id) const {
    return index_.backtest_result(id);
}

std::vector<backtest::BacktestResult> JsonlOpportunityStore::backtest_results() const {
    return index_.backtest_results();
}

}  // namespace optiscan::storage
