// include/quant_engine/core/id_generator.hpp
// Utility for generating task, batch and result identifiers
#pragma once

#include <string>
#include "quant_engine/core/types.hpp"

namespace quant_engine {

/**
 * @brief Generates identifiers for persisted entities
 *
 * Identifiers combine a prefix, a UTC timestamp and a random suffix:
 * "bt_20240105_093000_1f3a9c0e". The timestamp keeps ids roughly sortable by
 * creation time; the suffix keeps ids unique within the same second.
 */
class IdGenerator {
public:
    static std::string generate_task_id(const Timestamp& timestamp);
    static std::string generate_batch_id(const Timestamp& timestamp);
    static std::string generate_result_id(const Timestamp& timestamp);

    /**
     * @brief Generate an id with an arbitrary prefix
     * @param prefix Prefix without trailing underscore
     * @param timestamp Creation time, formatted as YYYYMMDD_HHMMSS in UTC
     */
    static std::string generate(const std::string& prefix, const Timestamp& timestamp);

private:
    static std::string generate_timestamp_string(const Timestamp& timestamp);
    static std::string random_suffix();
};

}  // namespace quant_engine
