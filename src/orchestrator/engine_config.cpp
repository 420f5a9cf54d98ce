// src/orchestrator/engine_config.cpp

#include "quant_engine/orchestrator/engine_config.hpp"

namespace quant_engine {

Result<void> OrchestratorConfig::validate() const {
    if (poll_interval_seconds <= 0) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "poll_interval_seconds must be positive", "EngineConfig");
    }
    if (batch_limit == 0) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR, "batch_limit must be positive",
                                "EngineConfig");
    }
    if (progress_step <= 0.0 || progress_step > 100.0) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "progress_step must be in (0, 100]", "EngineConfig");
    }
    if (cancel_check_interval_ms < 0 || status_retry_delay_ms < 0) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "cancel_check_interval_ms and status_retry_delay_ms must not "
                                "be negative",
                                "EngineConfig");
    }
    if (status_write_attempts < 1) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "status_write_attempts must be at least 1", "EngineConfig");
    }
    return Result<void>();
}

nlohmann::json EngineConfig::to_json() const {
    nlohmann::json j;
    j["logger"] = logger.to_json();
    j["database"] = database.to_json();
    j["replay"] = replay.to_json();
    j["thresholds"] = thresholds.to_json();
    j["sizing"] = sizing.to_json();
    j["simulator"] = simulator.to_json();
    j["orchestrator"] = orchestrator.to_json();
    j["version"] = version;
    return j;
}

void EngineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("logger"))
        logger.from_json(j.at("logger"));
    if (j.contains("database"))
        database.from_json(j.at("database"));
    if (j.contains("replay"))
        replay.from_json(j.at("replay"));
    if (j.contains("thresholds"))
        thresholds.from_json(j.at("thresholds"));
    if (j.contains("sizing"))
        sizing.from_json(j.at("sizing"));
    if (j.contains("simulator"))
        simulator.from_json(j.at("simulator"));
    if (j.contains("orchestrator"))
        orchestrator.from_json(j.at("orchestrator"));
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> EngineConfig::validate() const {
    auto database_check = database.validate();
    if (database_check.is_error()) {
        return database_check;
    }
    if (replay.exchange.empty()) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR, "Replay exchange is required",
                                "EngineConfig");
    }
    auto logger_check = logger.validate();
    if (logger_check.is_error()) {
        return logger_check;
    }
    if (sizing.max_position < 0.0 || sizing.max_position > 1.0 || sizing.min_confidence < 0.0 ||
        sizing.min_confidence > 1.0 || sizing.risk_multiplier <= 0.0) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "Position sizing settings out of range", "EngineConfig");
    }

    auto threshold_check = thresholds.validate();
    if (threshold_check.is_error()) {
        return threshold_check;
    }
    auto simulator_check = simulator.validate();
    if (simulator_check.is_error()) {
        return simulator_check;
    }
    return orchestrator.validate();
}

}  // namespace quant_engine
