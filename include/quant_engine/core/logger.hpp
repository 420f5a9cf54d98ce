// include/quant_engine/core/logger.hpp
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "quant_engine/core/config_base.hpp"
#include "quant_engine/core/error.hpp"

namespace quant_engine {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARNING,  // Recoverable: skipped dates, dropped factors
    ERR,      // A task or poll cycle failed
    FATAL     // The scheduler cannot continue
};

enum class LogDestination { CONSOLE, FILE, BOTH };

std::string level_to_string(LogLevel level);

/**
 * @brief Parse a level name ("WARN" and "WARNING" both accepted)
 * @return The parsed level, or fallback when the name is unknown
 */
LogLevel level_from_string(const std::string& name, LogLevel fallback);

std::string log_destination_to_string(LogDestination destination);
LogDestination log_destination_from_string(const std::string& name, LogDestination fallback);

/**
 * @brief Logger settings, the "logger" section of the engine configuration
 *
 * Files are named <filename_prefix>_<YYYYMMDD_HHMMSS>_part<N>.log and rotate
 * once they reach max_file_size; at most max_files are kept in log_directory.
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"quant_engine"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};  // 50MB
    size_t max_files{10};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    Result<void> validate() const override;
};

/**
 * @brief Process-wide thread-safe logger
 *
 * Every line carries the component registered on the writing thread and,
 * while a LogContext is alive on that thread, the id of the task being run.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Apply a configuration, opening a fresh log file for file destinations
     * @throws std::runtime_error when the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Drop the configuration and close the file so tests start clean
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag subsequent messages from the calling thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

    static const std::string& current_component() {
        return current_component_;
    }

    static const std::string& current_task() {
        return current_task_;
    }

private:
    friend class LogContext;

    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // All *_unsafe members expect mutex_ to be held
    void open_session_unsafe();
    void rotate_unsafe();
    void enforce_retention_unsafe(const std::filesystem::path& log_dir);
    std::filesystem::path current_log_path_unsafe() const;
    void write_to_file_unsafe(const std::string& line);
    void write_to_console_unsafe(LogLevel level, const std::string& line);
    std::string format_line(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};

    std::string session_timestamp_;  // YYYYMMDD_HHMMSS of the current process session
    int part_number_{1};

    static thread_local std::string current_component_;
    static thread_local std::string current_task_;
};

/**
 * @brief Tags log lines of the calling thread with a task id for its lifetime
 *
 * Contexts nest; the previous task id is restored on destruction.
 */
class LogContext {
public:
    explicit LogContext(const std::string& task_id) : previous_(Logger::current_task_) {
        Logger::current_task_ = task_id;
    }

    ~LogContext() {
        Logger::current_task_ = previous_;
    }

    LogContext(const LogContext&) = delete;
    LogContext& operator=(const LogContext&) = delete;

private:
    std::string previous_;
};

/**
 * @brief Stream-style logging, e.g. LOG(LogLevel::INFO, "claimed " << id)
 */
#define LOG(level, message)                                \
    do {                                                   \
        if (level >= Logger::instance().get_min_level()) { \
            std::ostringstream os;                         \
            os << message;                                 \
            Logger::instance().log(level, os.str());       \
        }                                                  \
    } while (0)

#define TRACE(message) LOG(LogLevel::TRACE, message)
#define DEBUG(message) LOG(LogLevel::DEBUG, message)
#define INFO(message) LOG(LogLevel::INFO, message)
#define WARN(message) LOG(LogLevel::WARNING, message)
#define ERROR(message) LOG(LogLevel::ERR, message)
#define FATAL(message) LOG(LogLevel::FATAL, message)

}  // namespace quant_engine
