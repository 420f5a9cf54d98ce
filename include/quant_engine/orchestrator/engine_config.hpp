// include/quant_engine/orchestrator/engine_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "quant_engine/core/config_base.hpp"
#include "quant_engine/core/error.hpp"
#include "quant_engine/core/logger.hpp"
#include "quant_engine/data/data_replayer.hpp"
#include "quant_engine/portfolio/portfolio_simulator.hpp"
#include "quant_engine/signal/signal_generator.hpp"
#include "quant_engine/storage/postgres_database.hpp"

namespace quant_engine {

/**
 * @brief Poll loop settings
 */
struct OrchestratorConfig : public ConfigBase {
    int poll_interval_seconds{30};
    size_t batch_limit{50};        // Pending tasks examined per poll cycle
    double progress_step{10.0};    // Percent between progress writes

    // Minimum gap between reads of a running task's cancel flag; 0 reads it
    // before every snapshot
    int cancel_check_interval_ms{1000};

    // Attempts for a status write that failed with a storage error. A terminal
    // status that still cannot be written is retried at the next poll cycle.
    int status_write_attempts{3};
    int status_retry_delay_ms{100};  // Doubles after each failed attempt

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["poll_interval_seconds"] = poll_interval_seconds;
        j["batch_limit"] = batch_limit;
        j["progress_step"] = progress_step;
        j["cancel_check_interval_ms"] = cancel_check_interval_ms;
        j["status_write_attempts"] = status_write_attempts;
        j["status_retry_delay_ms"] = status_retry_delay_ms;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("poll_interval_seconds"))
            poll_interval_seconds = j.at("poll_interval_seconds").get<int>();
        if (j.contains("batch_limit"))
            batch_limit = j.at("batch_limit").get<size_t>();
        if (j.contains("progress_step"))
            progress_step = j.at("progress_step").get<double>();
        if (j.contains("cancel_check_interval_ms"))
            cancel_check_interval_ms = j.at("cancel_check_interval_ms").get<int>();
        if (j.contains("status_write_attempts"))
            status_write_attempts = j.at("status_write_attempts").get<int>();
        if (j.contains("status_retry_delay_ms"))
            status_retry_delay_ms = j.at("status_retry_delay_ms").get<int>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }

    Result<void> validate() const override;
};

/**
 * @brief Root configuration of the scheduler process
 */
struct EngineConfig : public ConfigBase {
    LoggerConfig logger;
    DatabaseConfig database;
    ReplayConfig replay;
    SignalThresholds thresholds;
    PositionSizingConfig sizing;
    SimulatorConfig simulator;
    OrchestratorConfig orchestrator;

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Check every section
     * @return VALIDATION_ERROR naming the first offending setting
     */
    Result<void> validate() const override;
};

}  // namespace quant_engine
