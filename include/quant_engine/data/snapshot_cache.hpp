// include/quant_engine/data/snapshot_cache.hpp
#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "quant_engine/core/types.hpp"
#include "quant_engine/data/market_data.hpp"

namespace quant_engine {

/**
 * @brief Memoization of validated snapshots
 *
 * Keys are immutable historical coordinates, so entries never go stale and
 * need no expiry. Writing the same key twice stores the same value.
 */
class SnapshotCache {
public:
    virtual ~SnapshotCache() = default;

    virtual std::optional<DataSnapshot> get(const std::string& key) const = 0;
    virtual void set(const std::string& key, const DataSnapshot& snapshot) = 0;
    virtual void clear() = 0;
    virtual size_t size() const = 0;

    /**
     * @brief Cache key for a snapshot: "<stock>|<YYYY-MM-DD>|<mode>"
     */
    static std::string make_key(const std::string& stock_code, const Timestamp& date,
                                BacktestMode mode);
};

/**
 * @brief Process-local snapshot cache
 */
class InMemorySnapshotCache : public SnapshotCache {
public:
    std::optional<DataSnapshot> get(const std::string& key) const override;
    void set(const std::string& key, const DataSnapshot& snapshot) override;
    void clear() override;
    size_t size() const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, DataSnapshot> entries_;
};

}  // namespace quant_engine
