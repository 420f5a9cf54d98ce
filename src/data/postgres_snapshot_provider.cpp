// src/data/postgres_snapshot_provider.cpp
#include "quant_engine/data/postgres_snapshot_provider.hpp"
#include <stdexcept>
#include "quant_engine/core/time_utils.hpp"
#include "quant_engine/data/conversion_utils.hpp"

namespace quant_engine {

PostgresSnapshotProvider::PostgresSnapshotProvider(std::shared_ptr<PostgresDatabase> db)
    : db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("PostgresSnapshotProvider requires a database");
    }
    Logger::register_component("PostgresSnapshotProvider");
}

Result<PriceData> PostgresSnapshotProvider::get_price_on_date(const std::string& stock_code,
                                                              const Timestamp& date) {
    auto table = db_->get_daily_price(stock_code, date);
    if (table.is_error()) {
        return forward_error<PriceData>(table);
    }

    auto prices = DataConversionUtils::arrow_table_to_prices(table.value());
    if (prices.is_error()) {
        return forward_error<PriceData>(prices);
    }
    if (prices.value().empty()) {
        return make_error<PriceData>(
            ErrorCode::DATA_NOT_FOUND,
            "No price for " + stock_code + " on " + core::format_date(date),
            "PostgresSnapshotProvider");
    }
    return prices.value().front();
}

Result<std::unordered_map<std::string, FactorObservation>>
PostgresSnapshotProvider::get_factor_values(const std::string& stock_code, const Timestamp& date,
                                            const std::vector<std::string>& factor_names) {
    using ObservationMap = std::unordered_map<std::string, FactorObservation>;
    if (factor_names.empty()) {
        return ObservationMap{};
    }

    auto table = db_->get_factor_values(stock_code, date, factor_names);
    if (table.is_error()) {
        return forward_error<ObservationMap>(table);
    }
    return DataConversionUtils::arrow_table_to_factor_observations(table.value());
}

Result<std::vector<Timestamp>> PostgresSnapshotProvider::get_trading_calendar(
    const std::string& exchange, const Timestamp& start, const Timestamp& end) {
    return db_->get_trading_calendar(exchange, start, end);
}

}  // namespace quant_engine
