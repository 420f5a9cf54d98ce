// include/quant_engine/data/postgres_snapshot_provider.hpp
#pragma once

#include <memory>
#include "quant_engine/data/market_data.hpp"
#include "quant_engine/storage/postgres_database.hpp"

namespace quant_engine {

/**
 * @brief FactorSnapshotProvider reading stock_daily, factor_values and trade_calendar
 */
class PostgresSnapshotProvider : public FactorSnapshotProvider {
public:
    explicit PostgresSnapshotProvider(std::shared_ptr<PostgresDatabase> db);

    Result<PriceData> get_price_on_date(const std::string& stock_code,
                                        const Timestamp& date) override;

    Result<std::unordered_map<std::string, FactorObservation>> get_factor_values(
        const std::string& stock_code, const Timestamp& date,
        const std::vector<std::string>& factor_names) override;

    Result<std::vector<Timestamp>> get_trading_calendar(const std::string& exchange,
                                                        const Timestamp& start,
                                                        const Timestamp& end) override;

private:
    std::shared_ptr<PostgresDatabase> db_;
};

}  // namespace quant_engine
