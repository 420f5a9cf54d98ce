// include/quant_engine/core/time_utils.hpp
#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <vector>
#include "quant_engine/core/error.hpp"
#include "quant_engine/core/types.hpp"

namespace quant_engine {
namespace core {

// Reentrant replacements for localtime, gmtime and timegm; nullptr or -1 on failure
std::tm* safe_localtime(const std::time_t* time, std::tm* result);
std::tm* safe_gmtime(const std::time_t* time, std::tm* result);
std::time_t safe_timegm(std::tm* time_info);

/**
 * @brief Current wall-clock time rendered with a strftime format
 * @param use_local_time Local time zone when true, UTC otherwise
 */
std::string get_formatted_time(const char* format, bool use_local_time = true);

/**
 * @brief Parse a calendar date in YYYY-MM-DD form
 * @return Midnight UTC of that date, or VALIDATION_ERROR
 */
Result<Timestamp> parse_date(const std::string& date);

/**
 * @brief Build a date from its components (month is 1-based)
 */
Timestamp make_date(int year, int month, int day);

/**
 * @brief Format a timestamp as YYYY-MM-DD (UTC)
 */
std::string format_date(const Timestamp& ts);

/**
 * @brief Format a timestamp as YYYY-MM-DD HH:MM:SS (UTC)
 */
std::string format_timestamp(const Timestamp& ts);

/**
 * @brief Truncate a timestamp to midnight UTC of the same day
 */
Timestamp floor_to_day(const Timestamp& ts);

Timestamp add_days(const Timestamp& ts, int days);

bool is_weekend(const Timestamp& ts);

/**
 * @brief Inclusive Monday to Friday dates between start and end
 */
std::vector<Timestamp> business_days(const Timestamp& start, const Timestamp& end);

}  // namespace core
}  // namespace quant_engine
