// include/quant_engine/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <arrow/type_traits.h>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "quant_engine/core/error.hpp"
#include "quant_engine/core/types.hpp"
#include "quant_engine/data/market_data.hpp"

namespace quant_engine {

class DataConversionUtils {
public:
    /**
     * @brief Convert an Arrow table of daily bars to PriceData rows
     * @param table Columns trade_date, open, high, low, close and optionally
     *              volume, amount, pct_chg (nulls read as 0)
     * @return Result containing one PriceData per row
     */
    static Result<std::vector<PriceData>> arrow_table_to_prices(
        const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Convert an Arrow table of factor rows to observations keyed by factor name
     * @param table Columns factor_name, value, trade_date
     * @return Result containing the observations; a null value becomes NaN
     */
    static Result<std::unordered_map<std::string, FactorObservation>>
    arrow_table_to_factor_observations(const std::shared_ptr<arrow::Table>& table);

private:
    static Result<std::shared_ptr<arrow::Table>> combine(
        const std::shared_ptr<arrow::Table>& table, const std::vector<std::string>& columns);

    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                               int64_t index);

    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);

    static Result<std::string> extract_string(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index);

    static double extract_double_or(const std::shared_ptr<arrow::Array>& array, int64_t index,
                                    double fallback);
};

}  // namespace quant_engine
