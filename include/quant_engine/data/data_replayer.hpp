// include/quant_engine/data/data_replayer.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "quant_engine/core/config_base.hpp"
#include "quant_engine/core/error.hpp"
#include "quant_engine/core/logger.hpp"
#include "quant_engine/core/types.hpp"
#include "quant_engine/data/market_data.hpp"
#include "quant_engine/data/snapshot_cache.hpp"
#include "quant_engine/factor/factor_combination.hpp"

namespace quant_engine {

/**
 * @brief Configuration for the data replayer
 */
struct ReplayConfig : public ConfigBase {
    std::string exchange{"SSE"};  // Calendar used to resolve trading days
    bool use_cache{true};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["exchange"] = exchange;
        j["use_cache"] = use_cache;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("exchange"))
            exchange = j.at("exchange").get<std::string>();
        if (j.contains("use_cache"))
            use_cache = j.at("use_cache").get<bool>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Outcome of building the snapshot for one date
 */
enum class SnapshotStatus {
    OK,     // Snapshot is valid and may be consumed
    SKIP,   // Date is unusable, continue with the next one
    FATAL   // Replay cannot continue
};

struct SnapshotOutcome {
    SnapshotStatus status{SnapshotStatus::SKIP};
    DataSnapshot snapshot;
    ErrorCode code{ErrorCode::NONE};
    std::string reason;

    static SnapshotOutcome ok(DataSnapshot snapshot) {
        SnapshotOutcome outcome;
        outcome.status = SnapshotStatus::OK;
        outcome.snapshot = std::move(snapshot);
        return outcome;
    }

    static SnapshotOutcome skip(ErrorCode code, std::string reason) {
        SnapshotOutcome outcome;
        outcome.status = SnapshotStatus::SKIP;
        outcome.code = code;
        outcome.reason = std::move(reason);
        return outcome;
    }

    static SnapshotOutcome fatal(ErrorCode code, std::string reason) {
        SnapshotOutcome outcome;
        outcome.status = SnapshotStatus::FATAL;
        outcome.code = code;
        outcome.reason = std::move(reason);
        return outcome;
    }
};

class DataReplayer;

/**
 * @brief Forward-only sequence of snapshots for one stock and date range
 *
 * Snapshots are fetched lazily on next(). Dates that cannot produce a valid
 * snapshot are skipped and counted. The stream refers to the replayer that
 * created it, which must outlive it.
 */
class SnapshotStream {
public:
    SnapshotStream() = default;

    /**
     * @brief Advance to the next valid snapshot
     * @return The snapshot, nullopt once the range is exhausted, or an error when
     *         replay cannot continue (provider failure, ordering violation)
     */
    Result<std::optional<DataSnapshot>> next();

    /**
     * @brief Drain the remaining snapshots into a vector
     */
    Result<std::vector<DataSnapshot>> collect();

    size_t total_dates() const {
        return dates_.size();
    }
    size_t remaining() const {
        return dates_.size() - position_;
    }
    size_t emitted() const {
        return emitted_;
    }
    size_t skipped() const {
        return skipped_;
    }

private:
    friend class DataReplayer;

    SnapshotStream(DataReplayer* replayer, std::string stock_code,
                   std::vector<Timestamp> dates, FactorCombination combination,
                   BacktestMode mode);

    DataReplayer* replayer_{nullptr};
    std::string stock_code_;
    std::vector<Timestamp> dates_;
    FactorCombination combination_;
    BacktestMode mode_{BacktestMode::HISTORICAL_SIMULATION};
    size_t position_{0};
    size_t emitted_{0};
    size_t skipped_{0};
    std::optional<Timestamp> last_timestamp_;
};

/**
 * @brief Builds chronologically ordered daily snapshots without look-ahead
 *
 * Price and factor data are requested per trading day; anything the provider
 * reports as knowable only after that day is discarded. Valid snapshots are
 * memoized in the injected cache keyed by (stock, date, mode); a cached entry
 * accumulates the factors of every combination that has read it.
 */
class DataReplayer {
public:
    /**
     * @brief Constructor
     * @param provider Source of prices, factors and calendars
     * @param cache Snapshot cache shared across runs, may be null to disable caching
     * @param config Replay settings
     */
    DataReplayer(std::shared_ptr<FactorSnapshotProvider> provider,
                 std::shared_ptr<SnapshotCache> cache, ReplayConfig config = ReplayConfig{});

    /**
     * @brief Start a replay over [start, end]
     * @param stock_code Stock to replay
     * @param start First date, inclusive
     * @param end Last date, inclusive
     * @param combination Factors to request for every day
     * @param mode Backtest mode, part of the cache key
     * @return Stream of snapshots; the trading calendar is resolved up front
     */
    Result<SnapshotStream> replay(const std::string& stock_code, const Timestamp& start,
                                  const Timestamp& end, const FactorCombination& combination,
                                  BacktestMode mode);

    /**
     * @brief Build, validate and cache the snapshot of one date
     */
    SnapshotOutcome get_snapshot(const std::string& stock_code, const Timestamp& date,
                                 const FactorCombination& combination, BacktestMode mode);

    /**
     * @brief Trading days within [start, end]
     *
     * Uses the provider's calendar and falls back to Monday to Friday when the
     * calendar is unavailable or empty.
     */
    Result<std::vector<Timestamp>> resolve_trading_dates(const Timestamp& start,
                                                         const Timestamp& end);

    /**
     * @brief Check price consistency and factor presence of a snapshot
     * @return INVALID_DATA describing the first violation
     */
    static Result<void> validate_snapshot(const DataSnapshot& snapshot);

    /**
     * @brief Check that timestamps are strictly increasing
     * @return ORDERING_ERROR naming the first offending position
     */
    static Result<void> validate_timeline(const std::vector<Timestamp>& timestamps);

    void clear_cache();
    size_t cache_size() const;

    const ReplayConfig& config() const {
        return config_;
    }

private:
    // A cached snapshot may come from a run with other factors; fetch the
    // requested ones it lacks and write the enlarged snapshot back
    SnapshotOutcome complete_cached(const std::string& key, DataSnapshot snapshot,
                                    const FactorCombination& combination);

    // Adds provider values for names to snapshot, dropping look-ahead observations
    Result<void> merge_factor_values(DataSnapshot& snapshot,
                                     const std::vector<std::string>& names);

    std::shared_ptr<FactorSnapshotProvider> provider_;
    std::shared_ptr<SnapshotCache> cache_;
    ReplayConfig config_;
};

}  // namespace quant_engine
