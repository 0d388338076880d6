#include "scan/dedup_window.hpp"

namespace optiscan::scan {

DedupWindow::DedupWindow(std::chrono::seconds window)
    : window_(window)
{}

bool DedupWindow::is_duplicate(
    const market::ContractKey& contract,
    std::string_view alert_type,
    Timestamp now
) const {
    auto it = entries_.find(Key{contract, std::string(alert_type)});
    if (it == entries_.end()) {
        return false;
    }
    return now - it->second < window_;
}

void DedupWindow::record(const market::ContractKey& contract, std::string_view alert_type, Timestamp now) {
    entries_.insert_or_assign(Key{contract, std::string(alert_type)}, now);
}

void DedupWindow::prune(Timestamp now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second >= window_) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace optiscan::scan
