// src/core/id_generator.cpp

#include "quant_engine/core/id_generator.hpp"
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include "quant_engine/core/time_utils.hpp"

namespace quant_engine {

std::string IdGenerator::generate_task_id(const Timestamp& timestamp) {
    return generate("bt", timestamp);
}

std::string IdGenerator::generate_batch_id(const Timestamp& timestamp) {
    return generate("batch", timestamp);
}

std::string IdGenerator::generate_result_id(const Timestamp& timestamp) {
    return generate("result", timestamp);
}

std::string IdGenerator::generate(const std::string& prefix, const Timestamp& timestamp) {
    return prefix + "_" + generate_timestamp_string(timestamp) + "_" + random_suffix();
}

std::string IdGenerator::generate_timestamp_string(const Timestamp& timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm time_info{};
    core::safe_gmtime(&time_t, &time_info);

    std::stringstream ss;
    ss << std::put_time(&time_info, "%Y%m%d_%H%M%S");
    return ss.str();
}

std::string IdGenerator::random_suffix() {
    static std::mutex rng_mutex;
    static std::mt19937 rng{std::random_device{}()};

    uint32_t value;
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        value = static_cast<uint32_t>(rng());
    }

    std::stringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(8) << value;
    return ss.str();
}

}  // namespace quant_engine
