// src/data/snapshot_cache.cpp

#include "quant_engine/data/snapshot_cache.hpp"
#include "quant_engine/core/time_utils.hpp"

namespace quant_engine {

std::string SnapshotCache::make_key(const std::string& stock_code, const Timestamp& date,
                                    BacktestMode mode) {
    return stock_code + "|" + core::format_date(date) + "|" + backtest_mode_to_string(mode);
}

std::optional<DataSnapshot> InMemorySnapshotCache::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemorySnapshotCache::set(const std::string& key, const DataSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = snapshot;
}

void InMemorySnapshotCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t InMemorySnapshotCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace quant_engine
