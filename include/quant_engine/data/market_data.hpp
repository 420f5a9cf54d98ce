// include/quant_engine/data/market_data.hpp
#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "quant_engine/core/error.hpp"
#include "quant_engine/core/types.hpp"

namespace quant_engine {

/**
 * @brief Daily price fields of one stock
 */
struct PriceData {
    Timestamp trade_date;
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
    double amount{0.0};
    double pct_chg{0.0};
};

/**
 * @brief A factor value and the date from which it was knowable
 */
struct FactorObservation {
    double value{0.0};
    Timestamp as_of;
};

/**
 * @brief One trading day's price and factor data for one stock
 */
struct DataSnapshot {
    Timestamp timestamp;
    std::string stock_code;
    PriceData price;
    std::unordered_map<std::string, double> factor_data;
};

/**
 * @brief Source of historical prices, factor values and trading calendars
 */
class FactorSnapshotProvider {
public:
    virtual ~FactorSnapshotProvider() = default;

    /**
     * @brief Daily prices of a stock on a date
     * @return Price fields, or DATA_NOT_FOUND when the stock did not trade that day
     */
    virtual Result<PriceData> get_price_on_date(const std::string& stock_code,
                                                const Timestamp& date) = 0;

    /**
     * @brief Factor values of a stock as known on a date
     *
     * Names without a value are omitted from the result rather than reported as errors.
     */
    virtual Result<std::unordered_map<std::string, FactorObservation>> get_factor_values(
        const std::string& stock_code, const Timestamp& date,
        const std::vector<std::string>& factor_names) = 0;

    /**
     * @brief Open trading days of an exchange within [start, end]
     * @return Ascending dates; any error means the calendar is unavailable
     */
    virtual Result<std::vector<Timestamp>> get_trading_calendar(const std::string& exchange,
                                                                const Timestamp& start,
                                                                const Timestamp& end) = 0;
};

}  // namespace quant_engine
