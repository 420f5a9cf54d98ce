// src/data/conversion_utils.cpp
#include "quant_engine/data/conversion_utils.hpp"
#include <limits>

namespace quant_engine {

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::combine(
    const std::shared_ptr<arrow::Table>& table, const std::vector<std::string>& columns) {
    if (!table) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::INVALID_ARGUMENT, "Table pointer is null", "DataConversionUtils");
    }

    for (const auto& col : columns) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::INVALID_DATA, "Missing required column: " + col,
                "DataConversionUtils");
        }
    }

    // One chunk per column so rows can be addressed by index
    auto combined = table->CombineChunks();
    if (!combined.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to combine chunks: " + combined.status().ToString(), "DataConversionUtils");
    }
    return combined.ValueOrDie();
}

Result<std::vector<PriceData>> DataConversionUtils::arrow_table_to_prices(
    const std::shared_ptr<arrow::Table>& table) {
    auto combined = combine(table, {"trade_date", "open", "high", "low", "close"});
    if (combined.is_error()) {
        return forward_error<std::vector<PriceData>>(combined);
    }
    const auto& flat = combined.value();

    std::vector<PriceData> prices;
    if (flat->num_rows() == 0) {
        return prices;
    }

    try {
        auto optional_column = [&flat](const char* name) -> std::shared_ptr<arrow::Array> {
            auto column = flat->GetColumnByName(name);
            return column ? column->chunk(0) : nullptr;
        };

        auto date_array = flat->GetColumnByName("trade_date")->chunk(0);
        auto open_array = flat->GetColumnByName("open")->chunk(0);
        auto high_array = flat->GetColumnByName("high")->chunk(0);
        auto low_array = flat->GetColumnByName("low")->chunk(0);
        auto close_array = flat->GetColumnByName("close")->chunk(0);
        auto volume_array = optional_column("volume");
        auto amount_array = optional_column("amount");
        auto pct_chg_array = optional_column("pct_chg");

        prices.reserve(flat->num_rows());
        for (int64_t i = 0; i < flat->num_rows(); ++i) {
            auto ts_result = extract_timestamp(date_array, i);
            if (ts_result.is_error()) {
                return make_error<std::vector<PriceData>>(
                    ts_result.error()->code(), ts_result.error()->what(), "DataConversionUtils");
            }

            auto open_result = extract_double(open_array, i);
            auto high_result = extract_double(high_array, i);
            auto low_result = extract_double(low_array, i);
            auto close_result = extract_double(close_array, i);
            if (open_result.is_error() || high_result.is_error() || low_result.is_error() ||
                close_result.is_error()) {
                return make_error<std::vector<PriceData>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Error extracting OHLC values at row " + std::to_string(i),
                    "DataConversionUtils");
            }

            PriceData price;
            price.trade_date = ts_result.value();
            price.open = open_result.value();
            price.high = high_result.value();
            price.low = low_result.value();
            price.close = close_result.value();
            price.volume = extract_double_or(volume_array, i, 0.0);
            price.amount = extract_double_or(amount_array, i, 0.0);
            price.pct_chg = extract_double_or(pct_chg_array, i, 0.0);
            prices.push_back(price);
        }

        return prices;

    } catch (const std::exception& e) {
        return make_error<std::vector<PriceData>>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to prices: ") + e.what(), "DataConversionUtils");
    }
}

Result<std::unordered_map<std::string, FactorObservation>>
DataConversionUtils::arrow_table_to_factor_observations(
    const std::shared_ptr<arrow::Table>& table) {
    using ObservationMap = std::unordered_map<std::string, FactorObservation>;

    auto combined = combine(table, {"factor_name", "value", "trade_date"});
    if (combined.is_error()) {
        return forward_error<ObservationMap>(combined);
    }
    const auto& flat = combined.value();

    ObservationMap observations;
    if (flat->num_rows() == 0) {
        return observations;
    }

    try {
        auto name_array = flat->GetColumnByName("factor_name")->chunk(0);
        auto value_array = flat->GetColumnByName("value")->chunk(0);
        auto date_array = flat->GetColumnByName("trade_date")->chunk(0);

        for (int64_t i = 0; i < flat->num_rows(); ++i) {
            auto name_result = extract_string(name_array, i);
            if (name_result.is_error()) {
                return forward_error<ObservationMap>(name_result);
            }
            auto ts_result = extract_timestamp(date_array, i);
            if (ts_result.is_error()) {
                return forward_error<ObservationMap>(ts_result);
            }

            FactorObservation observation;
            observation.value =
                extract_double_or(value_array, i, std::numeric_limits<double>::quiet_NaN());
            observation.as_of = ts_result.value();

            // Keep the most recent observation when a name repeats
            auto it = observations.find(name_result.value());
            if (it == observations.end() || it->second.as_of < observation.as_of) {
                observations[name_result.value()] = observation;
            }
        }

        return observations;

    } catch (const std::exception& e) {
        return make_error<ObservationMap>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to factor values: ") + e.what(),
            "DataConversionUtils");
    }
}

Result<Timestamp> DataConversionUtils::extract_timestamp(
    const std::shared_ptr<arrow::Array>& array, int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     "DataConversionUtils");
    }
    if (array->type_id() != arrow::Type::TIMESTAMP) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Expected timestamp array, got " + array->type()->ToString(),
                                     "DataConversionUtils");
    }

    auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
    if (ts_array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null timestamp value at index " + std::to_string(index),
                                     "DataConversionUtils");
    }

    const auto& type = static_cast<const arrow::TimestampType&>(*ts_array->type());
    const int64_t raw = ts_array->Value(index);
    switch (type.unit()) {
        case arrow::TimeUnit::SECOND:
            return Timestamp(std::chrono::seconds(raw));
        case arrow::TimeUnit::MILLI:
            return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                std::chrono::milliseconds(raw)));
        case arrow::TimeUnit::MICRO:
            return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                std::chrono::microseconds(raw)));
        case arrow::TimeUnit::NANO:
            return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                std::chrono::nanoseconds(raw)));
    }
    return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR, "Unknown timestamp unit",
                                 "DataConversionUtils");
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  "DataConversionUtils");
    }
    if (array->type_id() != arrow::Type::DOUBLE) {
        return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                  "Expected double array, got " + array->type()->ToString(),
                                  "DataConversionUtils");
    }

    auto double_array = std::static_pointer_cast<arrow::DoubleArray>(array);
    if (double_array->IsNull(index)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null double value at index " + std::to_string(index),
                                  "DataConversionUtils");
    }
    return double_array->Value(index);
}

Result<std::string> DataConversionUtils::extract_string(
    const std::shared_ptr<arrow::Array>& array, int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                       "DataConversionUtils");
    }
    if (array->type_id() != arrow::Type::STRING) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       "Expected string array, got " + array->type()->ToString(),
                                       "DataConversionUtils");
    }

    auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
    if (string_array->IsNull(index)) {
        return make_error<std::string>(ErrorCode::INVALID_DATA,
                                       "Null string value at index " + std::to_string(index),
                                       "DataConversionUtils");
    }
    return string_array->GetString(index);
}

double DataConversionUtils::extract_double_or(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index, double fallback) {
    auto value = extract_double(array, index);
    return value.is_error() ? fallback : value.value();
}

}  // namespace quant_engine
