// src/data/data_replayer.cpp

#include "quant_engine/data/data_replayer.hpp"
#include <cmath>
#include <sstream>
#include "quant_engine/core/time_utils.hpp"

namespace quant_engine {

SnapshotStream::SnapshotStream(DataReplayer* replayer, std::string stock_code,
                               std::vector<Timestamp> dates, FactorCombination combination,
                               BacktestMode mode)
    : replayer_(replayer),
      stock_code_(std::move(stock_code)),
      dates_(std::move(dates)),
      combination_(std::move(combination)),
      mode_(mode) {}

Result<std::optional<DataSnapshot>> SnapshotStream::next() {
    if (!replayer_) {
        return make_error<std::optional<DataSnapshot>>(ErrorCode::NOT_INITIALIZED,
                                                       "Snapshot stream is not bound to a replayer",
                                                       "DataReplayer");
    }

    while (position_ < dates_.size()) {
        const Timestamp date = dates_[position_++];
        SnapshotOutcome outcome = replayer_->get_snapshot(stock_code_, date, combination_, mode_);

        switch (outcome.status) {
            case SnapshotStatus::SKIP:
                ++skipped_;
                WARN("Skipping " << stock_code_ << " on " << core::format_date(date) << ": "
                                 << outcome.reason);
                continue;

            case SnapshotStatus::FATAL:
                return make_error<std::optional<DataSnapshot>>(
                    outcome.code, "Replay aborted on " + core::format_date(date) + ": " +
                                      outcome.reason,
                    "DataReplayer");

            case SnapshotStatus::OK:
                break;
        }

        if (last_timestamp_ && outcome.snapshot.timestamp <= *last_timestamp_) {
            return make_error<std::optional<DataSnapshot>>(
                ErrorCode::ORDERING_ERROR,
                "Snapshot " + core::format_date(outcome.snapshot.timestamp) +
                    " does not follow " + core::format_date(*last_timestamp_),
                "DataReplayer");
        }

        last_timestamp_ = outcome.snapshot.timestamp;
        ++emitted_;
        return std::optional<DataSnapshot>(std::move(outcome.snapshot));
    }

    return std::optional<DataSnapshot>();
}

Result<std::vector<DataSnapshot>> SnapshotStream::collect() {
    std::vector<DataSnapshot> snapshots;
    while (true) {
        auto next_result = next();
        if (next_result.is_error()) {
            return forward_error<std::vector<DataSnapshot>>(next_result);
        }
        if (!next_result.value().has_value()) {
            break;
        }
        snapshots.push_back(*next_result.value());
    }
    return snapshots;
}

DataReplayer::DataReplayer(std::shared_ptr<FactorSnapshotProvider> provider,
                           std::shared_ptr<SnapshotCache> cache, ReplayConfig config)
    : provider_(std::move(provider)), cache_(std::move(cache)), config_(std::move(config)) {
    Logger::register_component("DataReplayer");
    if (!provider_) {
        throw std::invalid_argument("DataReplayer requires a snapshot provider");
    }
}

Result<SnapshotStream> DataReplayer::replay(const std::string& stock_code, const Timestamp& start,
                                            const Timestamp& end,
                                            const FactorCombination& combination,
                                            BacktestMode mode) {
    auto dates = resolve_trading_dates(start, end);
    if (dates.is_error()) {
        return forward_error<SnapshotStream>(dates);
    }

    DEBUG("Replaying " << stock_code << " over " << dates.value().size() << " trading days");
    return SnapshotStream(this, stock_code, dates.take_value(), combination, mode);
}

Result<std::vector<Timestamp>> DataReplayer::resolve_trading_dates(const Timestamp& start,
                                                                   const Timestamp& end) {
    const Timestamp first = core::floor_to_day(start);
    const Timestamp last = core::floor_to_day(end);
    if (first > last) {
        return make_error<std::vector<Timestamp>>(ErrorCode::INVALID_ARGUMENT,
                                                  "Replay start must not be after end",
                                                  "DataReplayer");
    }

    auto calendar = provider_->get_trading_calendar(config_.exchange, first, last);
    if (calendar.is_error() || calendar.value().empty()) {
        WARN("Trading calendar for " << config_.exchange << " unavailable ("
                                     << (calendar.is_error() ? calendar.error()->what()
                                                             : "no dates")
                                     << "), using business days");
        return core::business_days(first, last);
    }

    std::vector<Timestamp> dates;
    dates.reserve(calendar.value().size());
    for (const auto& date : calendar.value()) {
        Timestamp day = core::floor_to_day(date);
        if (day >= first && day <= last) {
            dates.push_back(day);
        }
    }

    auto ordered = validate_timeline(dates);
    if (ordered.is_error()) {
        return forward_error<std::vector<Timestamp>>(ordered);
    }
    return dates;
}

SnapshotOutcome DataReplayer::get_snapshot(const std::string& stock_code, const Timestamp& date,
                                           const FactorCombination& combination,
                                           BacktestMode mode) {
    const Timestamp day = core::floor_to_day(date);
    const std::string key = SnapshotCache::make_key(stock_code, day, mode);

    if (config_.use_cache && cache_) {
        if (auto cached = cache_->get(key)) {
            TRACE("Cache hit for " << key);
            return complete_cached(key, std::move(*cached), combination);
        }
    }

    auto price = provider_->get_price_on_date(stock_code, day);
    if (price.is_error()) {
        if (price.error()->code() == ErrorCode::DATA_NOT_FOUND) {
            return SnapshotOutcome::skip(ErrorCode::DATA_NOT_FOUND, price.error()->what());
        }
        return SnapshotOutcome::fatal(price.error()->code(), price.error()->what());
    }

    const Timestamp price_day = core::floor_to_day(price.value().trade_date);
    if (price_day != day) {
        return SnapshotOutcome::skip(
            ErrorCode::INVALID_DATA,
            "price dated " + core::format_date(price_day) + " does not belong to this day");
    }

    DataSnapshot snapshot;
    snapshot.timestamp = day;
    snapshot.stock_code = stock_code;
    snapshot.price = price.value();

    auto merged = merge_factor_values(snapshot, combination.factor_names());
    if (merged.is_error()) {
        return SnapshotOutcome::fatal(merged.error()->code(), merged.error()->what());
    }

    auto valid = validate_snapshot(snapshot);
    if (valid.is_error()) {
        return SnapshotOutcome::skip(valid.error()->code(), valid.error()->what());
    }

    if (config_.use_cache && cache_) {
        cache_->set(key, snapshot);
    }
    return SnapshotOutcome::ok(std::move(snapshot));
}

SnapshotOutcome DataReplayer::complete_cached(const std::string& key, DataSnapshot snapshot,
                                              const FactorCombination& combination) {
    std::vector<std::string> missing;
    for (const auto& name : combination.factor_names()) {
        if (snapshot.factor_data.count(name) == 0) {
            missing.push_back(name);
        }
    }
    if (missing.empty()) {
        return SnapshotOutcome::ok(std::move(snapshot));
    }

    const size_t before = snapshot.factor_data.size();
    auto merged = merge_factor_values(snapshot, missing);
    if (merged.is_error()) {
        return SnapshotOutcome::fatal(merged.error()->code(), merged.error()->what());
    }
    if (snapshot.factor_data.size() > before) {
        DEBUG("Added " << snapshot.factor_data.size() - before << " factor(s) to cached " << key);
        cache_->set(key, snapshot);
    }
    return SnapshotOutcome::ok(std::move(snapshot));
}

Result<void> DataReplayer::merge_factor_values(DataSnapshot& snapshot,
                                               const std::vector<std::string>& names) {
    const Timestamp day = snapshot.timestamp;
    auto factors = provider_->get_factor_values(snapshot.stock_code, day, names);
    if (factors.is_error()) {
        if (factors.error()->code() == ErrorCode::DATA_NOT_FOUND) {
            return Result<void>();
        }
        return forward_error<void>(factors);
    }

    for (const auto& [name, observation] : factors.value()) {
        if (core::floor_to_day(observation.as_of) > day) {
            WARN("Dropping factor " << name << " for " << snapshot.stock_code << " on "
                                    << core::format_date(day) << ": known only from "
                                    << core::format_date(observation.as_of));
            continue;
        }
        snapshot.factor_data[name] = observation.value;
    }
    return Result<void>();
}

Result<void> DataReplayer::validate_snapshot(const DataSnapshot& snapshot) {
    const PriceData& p = snapshot.price;

    for (double field : {p.open, p.high, p.low, p.close}) {
        if (!std::isfinite(field) || field <= 0.0) {
            return make_error<void>(ErrorCode::INVALID_DATA, "OHLC prices must be positive",
                                    "DataReplayer");
        }
    }

    if (p.low > p.open || p.low > p.close || p.high < p.open || p.high < p.close) {
        std::ostringstream os;
        os << "Inconsistent OHLC: open=" << p.open << " high=" << p.high << " low=" << p.low
           << " close=" << p.close;
        return make_error<void>(ErrorCode::INVALID_DATA, os.str(), "DataReplayer");
    }

    if (snapshot.factor_data.empty()) {
        return make_error<void>(ErrorCode::INVALID_DATA, "No factor values available",
                                "DataReplayer");
    }

    for (const auto& [name, value] : snapshot.factor_data) {
        if (!std::isfinite(value)) {
            WARN("Factor " << name << " is not finite for " << snapshot.stock_code << " on "
                           << core::format_date(snapshot.timestamp));
        }
    }

    return Result<void>();
}

Result<void> DataReplayer::validate_timeline(const std::vector<Timestamp>& timestamps) {
    for (size_t i = 1; i < timestamps.size(); ++i) {
        if (timestamps[i] <= timestamps[i - 1]) {
            return make_error<void>(ErrorCode::ORDERING_ERROR,
                                    "Timestamp at position " + std::to_string(i) + " (" +
                                        core::format_date(timestamps[i]) +
                                        ") is not after its predecessor",
                                    "DataReplayer");
        }
    }
    return Result<void>();
}

void DataReplayer::clear_cache() {
    if (cache_) {
        cache_->clear();
        INFO("Snapshot cache cleared");
    }
}

size_t DataReplayer::cache_size() const {
    return cache_ ? cache_->size() : 0;
}

}  // namespace quant_engine
