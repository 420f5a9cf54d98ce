// src/task/task_types.cpp

#include "quant_engine/task/task_types.hpp"
#include "quant_engine/core/time_utils.hpp"

namespace quant_engine {

std::string task_status_to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING:
            return "pending";
        case TaskStatus::RUNNING:
            return "running";
        case TaskStatus::COMPLETED:
            return "completed";
        case TaskStatus::FAILED:
            return "failed";
        case TaskStatus::CANCELLED:
            return "cancelled";
        default:
            return "unknown";
    }
}

Result<TaskStatus> task_status_from_string(const std::string& name) {
    if (name == "pending")
        return TaskStatus::PENDING;
    if (name == "running")
        return TaskStatus::RUNNING;
    if (name == "completed")
        return TaskStatus::COMPLETED;
    if (name == "failed")
        return TaskStatus::FAILED;
    if (name == "cancelled")
        return TaskStatus::CANCELLED;
    return make_error<TaskStatus>(ErrorCode::INVALID_DATA, "Unknown task status: " + name,
                                  "TaskTypes");
}

nlohmann::json TaskConfig::to_json() const {
    nlohmann::json j;
    j["backtest_mode"] = backtest_mode_to_string(backtest_mode);
    if (thresholds) {
        j["thresholds"] = thresholds->to_json();
    }
    j["extensions"] = extensions;
    j["version"] = version;
    return j;
}

void TaskConfig::from_json(const nlohmann::json& j) {
    if (j.contains("backtest_mode")) {
        BacktestMode parsed;
        if (backtest_mode_from_string(j.at("backtest_mode").get<std::string>(), parsed)) {
            backtest_mode = parsed;
        }
    }
    if (j.contains("thresholds") && j.at("thresholds").is_object()) {
        SignalThresholds overrides;
        overrides.from_json(j.at("thresholds"));
        thresholds = overrides;
    }
    if (j.contains("extensions") && j.at("extensions").is_object())
        extensions = j.at("extensions");
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<TaskConfig> TaskConfig::parse(const nlohmann::json& j) {
    if (j.is_null()) {
        return TaskConfig{};
    }
    if (!j.is_object()) {
        return make_error<TaskConfig>(ErrorCode::VALIDATION_ERROR,
                                      "Task config must be a JSON object", "TaskConfig");
    }

    try {
        TaskConfig config;
        if (j.contains("backtest_mode")) {
            const std::string mode = j.at("backtest_mode").get<std::string>();
            if (!backtest_mode_from_string(mode, config.backtest_mode)) {
                return make_error<TaskConfig>(ErrorCode::VALIDATION_ERROR,
                                              "Unknown backtest mode: " + mode, "TaskConfig");
            }
        }
        config.from_json(j);

        if (config.thresholds) {
            auto valid = config.thresholds->validate();
            if (valid.is_error()) {
                return make_error<TaskConfig>(ErrorCode::VALIDATION_ERROR, valid.error()->what(),
                                              "TaskConfig");
            }
        }
        return config;
    } catch (const nlohmann::json::exception& e) {
        return make_error<TaskConfig>(ErrorCode::VALIDATION_ERROR,
                                      std::string("Malformed task config: ") + e.what(),
                                      "TaskConfig");
    }
}

nlohmann::json Task::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["batch_id"] = batch_id;
    j["name"] = name;
    j["description"] = description;
    j["stock_code"] = stock_code;
    j["start_date"] = core::format_date(start_date);
    j["end_date"] = core::format_date(end_date);
    j["initial_capital"] = initial_capital;
    j["factor_combination_id"] = factor_combination_id;
    j["config"] = config.to_json();
    j["status"] = task_status_to_string(status);
    j["progress"] = progress;
    j["error_message"] = error_message ? nlohmann::json(*error_message) : nlohmann::json(nullptr);
    j["result_id"] = result_id ? nlohmann::json(*result_id) : nlohmann::json(nullptr);
    j["cancel_requested"] = cancel_requested;
    j["created_at"] = core::format_timestamp(created_at);
    j["updated_at"] = core::format_timestamp(updated_at);
    j["started_at"] =
        started_at ? nlohmann::json(core::format_timestamp(*started_at)) : nlohmann::json(nullptr);
    j["completed_at"] = completed_at ? nlohmann::json(core::format_timestamp(*completed_at))
                                     : nlohmann::json(nullptr);
    return j;
}

void BatchSummary::count(TaskStatus status) {
    ++total;
    switch (status) {
        case TaskStatus::PENDING:
            ++pending;
            break;
        case TaskStatus::RUNNING:
            ++running;
            break;
        case TaskStatus::COMPLETED:
            ++completed;
            break;
        case TaskStatus::FAILED:
            ++failed;
            break;
        case TaskStatus::CANCELLED:
            ++cancelled;
            break;
    }
}

nlohmann::json BatchSummary::to_json() const {
    nlohmann::json j;
    j["batch_id"] = batch_id;
    j["total"] = total;
    j["pending"] = pending;
    j["running"] = running;
    j["completed"] = completed;
    j["failed"] = failed;
    j["cancelled"] = cancelled;
    return j;
}

}  // namespace quant_engine
