// src/core/logger.cpp

#include "quant_engine/core/logger.hpp"
#include <algorithm>
#include <vector>
#include "quant_engine/core/time_utils.hpp"

namespace quant_engine {

thread_local std::string Logger::current_component_;
thread_local std::string Logger::current_task_;

// ========== Names ==========

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
    }
    return "UNKNOWN";
}

LogLevel level_from_string(const std::string& name, LogLevel fallback) {
    if (name == "TRACE")
        return LogLevel::TRACE;
    if (name == "DEBUG")
        return LogLevel::DEBUG;
    if (name == "INFO")
        return LogLevel::INFO;
    if (name == "WARNING" || name == "WARN")
        return LogLevel::WARNING;
    if (name == "ERROR")
        return LogLevel::ERR;
    if (name == "FATAL")
        return LogLevel::FATAL;
    return fallback;
}

std::string log_destination_to_string(LogDestination destination) {
    switch (destination) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
    }
    return "UNKNOWN";
}

LogDestination log_destination_from_string(const std::string& name, LogDestination fallback) {
    if (name == "CONSOLE")
        return LogDestination::CONSOLE;
    if (name == "FILE")
        return LogDestination::FILE;
    if (name == "BOTH")
        return LogDestination::BOTH;
    return fallback;
}

// ========== LoggerConfig ==========

nlohmann::json LoggerConfig::to_json() const {
    nlohmann::json j;
    j["min_level"] = level_to_string(min_level);
    j["destination"] = log_destination_to_string(destination);
    j["log_directory"] = log_directory;
    j["filename_prefix"] = filename_prefix;
    j["include_timestamp"] = include_timestamp;
    j["include_level"] = include_level;
    j["max_file_size"] = max_file_size;
    j["max_files"] = max_files;
    j["version"] = version;
    return j;
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level"))
        min_level = level_from_string(j.at("min_level").get<std::string>(), min_level);
    if (j.contains("destination"))
        destination =
            log_destination_from_string(j.at("destination").get<std::string>(), destination);
    if (j.contains("log_directory"))
        log_directory = j.at("log_directory").get<std::string>();
    if (j.contains("filename_prefix"))
        filename_prefix = j.at("filename_prefix").get<std::string>();
    if (j.contains("include_timestamp"))
        include_timestamp = j.at("include_timestamp").get<bool>();
    if (j.contains("include_level"))
        include_level = j.at("include_level").get<bool>();
    if (j.contains("max_file_size"))
        max_file_size = j.at("max_file_size").get<size_t>();
    if (j.contains("max_files"))
        max_files = j.at("max_files").get<size_t>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> LoggerConfig::validate() const {
    if (max_files == 0 || max_file_size == 0) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "Logger max_files and max_file_size must be positive",
                                "LoggerConfig");
    }
    if (destination != LogDestination::CONSOLE &&
        (log_directory.empty() || filename_prefix.empty())) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "File logging needs a log_directory and filename_prefix",
                                "LoggerConfig");
    }
    return Result<void>();
}

// ========== Logger ==========

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.config_ = LoggerConfig{};
    logger.session_timestamp_.clear();
    logger.part_number_ = 1;
    current_task_.clear();
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (log_file_.is_open()) {
        log_file_.close();
    }
    if (config_.destination != LogDestination::CONSOLE) {
        open_session_unsafe();
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::open_session_unsafe() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create log directory: " + log_dir.string() + " - " +
                                 ec.message());
    }

    // Make room for the file about to be opened
    enforce_retention_unsafe(log_dir);

    session_timestamp_ = core::get_formatted_time("%Y%m%d_%H%M%S");
    part_number_ = 1;

    std::filesystem::path log_path = current_log_path_unsafe();
    log_file_.open(log_path, std::ios::app);
    if (!log_file_.is_open()) {
        throw std::runtime_error("Failed to open log file: " + log_path.string());
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    const std::string line = format_line(level, message);
    if (config_.destination != LogDestination::FILE) {
        write_to_console_unsafe(level, line);
    }
    if (config_.destination != LogDestination::CONSOLE) {
        write_to_file_unsafe(line);
    }
}

std::string Logger::format_line(LogLevel level, const std::string& message) const {
    std::ostringstream ss;
    if (config_.include_timestamp) {
        ss << core::get_formatted_time("%Y-%m-%d %H:%M:%S") << " ";
    }
    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }
    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }
    if (!current_task_.empty()) {
        ss << "[task=" << current_task_ << "] ";
    }
    ss << message;
    return ss.str();
}

void Logger::write_to_console_unsafe(LogLevel level, const std::string& line) {
    if (level >= LogLevel::ERR) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

void Logger::write_to_file_unsafe(const std::string& line) {
    if (!log_file_.is_open()) {
        return;
    }

    log_file_ << line << std::endl;
    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        rotate_unsafe();
    }
}

std::filesystem::path Logger::current_log_path_unsafe() const {
    return std::filesystem::absolute(config_.log_directory) /
           (config_.filename_prefix + "_" + session_timestamp_ + "_part" +
            std::to_string(part_number_) + ".log");
}

void Logger::enforce_retention_unsafe(const std::filesystem::path& log_dir) {
    const std::string prefix = config_.filename_prefix + "_";
    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        const auto& path = entry.path();
        if (entry.is_regular_file() && path.extension() == ".log" &&
            path.filename().string().rfind(prefix, 0) == 0) {
            log_files.push_back(path);
        }
    }

    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    // Keep max_files - 1 so the file about to be opened stays within the limit
    size_t excess = log_files.size() + 1 > config_.max_files
                        ? log_files.size() + 1 - config_.max_files
                        : 0;
    for (size_t i = 0; i < excess; ++i) {
        std::error_code ec;
        std::filesystem::remove(log_files[i], ec);
        if (ec) {
            std::cerr << "WARNING: Failed to remove old log file " << log_files[i] << ": "
                      << ec.message() << std::endl;
        }
    }
}

void Logger::rotate_unsafe() {
    log_file_.close();
    enforce_retention_unsafe(std::filesystem::absolute(config_.log_directory));

    ++part_number_;
    log_file_.open(current_log_path_unsafe(), std::ios::app);
    if (!log_file_.is_open()) {
        std::cerr << "WARNING: Failed to open rotated log file " << current_log_path_unsafe()
                  << std::endl;
    }
}

}  // namespace quant_engine
