// src/core/time_utils.cpp

#include "quant_engine/core/time_utils.hpp"
#include <time.h>
#include <iomanip>
#include <sstream>

namespace quant_engine {
namespace core {

namespace {
constexpr auto ONE_DAY = std::chrono::hours(24);
}

std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    return localtime_s(result, time) == 0 ? result : nullptr;
#else
    return localtime_r(time, result);
#endif
}

std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

std::time_t safe_timegm(std::tm* time_info) {
#ifdef _WIN32
    return _mkgmtime(time_info);
#else
    return timegm(time_info);
#endif
}

std::string get_formatted_time(const char* format, bool use_local_time) {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm parts{};
    std::tm* converted = use_local_time ? safe_localtime(&now, &parts) : safe_gmtime(&now, &parts);
    if (!converted) {
        return std::string();
    }

    char buffer[128];
    const size_t written = std::strftime(buffer, sizeof(buffer), format, converted);
    return std::string(buffer, written);
}

Result<Timestamp> parse_date(const std::string& date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
        return make_error<Timestamp>(ErrorCode::VALIDATION_ERROR,
                                     "Invalid date format, expected YYYY-MM-DD: " + date,
                                     "TimeUtils");
    }

    std::tm time_info{};
    std::istringstream ss(date);
    ss >> std::get_time(&time_info, "%Y-%m-%d");
    if (ss.fail()) {
        return make_error<Timestamp>(ErrorCode::VALIDATION_ERROR,
                                     "Invalid date format, expected YYYY-MM-DD: " + date,
                                     "TimeUtils");
    }

    // Reject dates that timegm would silently normalize, e.g. 2024-02-31
    int year = time_info.tm_year;
    int month = time_info.tm_mon;
    int day = time_info.tm_mday;
    std::time_t seconds = safe_timegm(&time_info);
    if (time_info.tm_year != year || time_info.tm_mon != month || time_info.tm_mday != day) {
        return make_error<Timestamp>(ErrorCode::VALIDATION_ERROR,
                                     "Date does not exist: " + date, "TimeUtils");
    }

    return Result<Timestamp>(std::chrono::system_clock::from_time_t(seconds));
}

Timestamp make_date(int year, int month, int day) {
    std::tm time_info{};
    time_info.tm_year = year - 1900;
    time_info.tm_mon = month - 1;
    time_info.tm_mday = day;
    return std::chrono::system_clock::from_time_t(safe_timegm(&time_info));
}

std::string format_date(const Timestamp& ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::tm time_info{};
    safe_gmtime(&time_t, &time_info);
    std::ostringstream ss;
    ss << std::put_time(&time_info, "%Y-%m-%d");
    return ss.str();
}

std::string format_timestamp(const Timestamp& ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::tm time_info{};
    safe_gmtime(&time_t, &time_info);
    std::ostringstream ss;
    ss << std::put_time(&time_info, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

Timestamp floor_to_day(const Timestamp& ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::tm time_info{};
    safe_gmtime(&time_t, &time_info);
    time_info.tm_hour = 0;
    time_info.tm_min = 0;
    time_info.tm_sec = 0;
    return std::chrono::system_clock::from_time_t(safe_timegm(&time_info));
}

Timestamp add_days(const Timestamp& ts, int days) {
    return ts + days * ONE_DAY;
}

bool is_weekend(const Timestamp& ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::tm time_info{};
    safe_gmtime(&time_t, &time_info);
    return time_info.tm_wday == 0 || time_info.tm_wday == 6;
}

std::vector<Timestamp> business_days(const Timestamp& start, const Timestamp& end) {
    std::vector<Timestamp> days;
    for (Timestamp current = floor_to_day(start); current <= end; current = add_days(current, 1)) {
        if (!is_weekend(current)) {
            days.push_back(current);
        }
    }
    return days;
}

}  // namespace core
}  // namespace quant_engine
