// include/quant_engine/task/task_types.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "quant_engine/core/config_base.hpp"
#include "quant_engine/core/error.hpp"
#include "quant_engine/core/types.hpp"
#include "quant_engine/signal/signal_generator.hpp"

namespace quant_engine {

/**
 * @brief Lifecycle state of a backtest task
 */
enum class TaskStatus { PENDING, RUNNING, COMPLETED, FAILED, CANCELLED };

std::string task_status_to_string(TaskStatus status);
Result<TaskStatus> task_status_from_string(const std::string& name);

inline bool is_terminal(TaskStatus status) {
    return status == TaskStatus::COMPLETED || status == TaskStatus::FAILED ||
           status == TaskStatus::CANCELLED;
}

/**
 * @brief Per-task settings stored with the task
 *
 * Known settings are typed fields; anything else a client sends is kept in
 * extensions and round-tripped untouched.
 */
struct TaskConfig : public ConfigBase {
    BacktestMode backtest_mode{BacktestMode::HISTORICAL_SIMULATION};
    std::optional<SignalThresholds> thresholds;  // Overrides the engine defaults
    nlohmann::json extensions = nlohmann::json::object();

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;

    /**
     * @brief Load from JSON; an unknown backtest_mode leaves the current mode
     */
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Strict parse used when accepting client input
     * @return VALIDATION_ERROR for an unknown backtest mode or malformed fields
     */
    static Result<TaskConfig> parse(const nlohmann::json& j);
};

/**
 * @brief Client request to run a backtest
 */
struct TaskRequest {
    std::string name;
    std::string description;
    std::string stock_code;
    std::string start_date;  // YYYY-MM-DD
    std::string end_date;    // YYYY-MM-DD
    double initial_capital{1000000.0};
    std::string factor_combination_id;  // Empty selects the default combination
    std::optional<std::string> batch_id;
    TaskConfig config;
};

/**
 * @brief Persisted backtest task
 */
struct Task {
    std::string id;
    std::string batch_id;
    std::string name;
    std::string description;
    std::string stock_code;
    Timestamp start_date;
    Timestamp end_date;
    double initial_capital{0.0};
    std::string factor_combination_id;
    TaskConfig config;

    TaskStatus status{TaskStatus::PENDING};
    double progress{0.0};  // [0, 100]
    std::optional<std::string> error_message;
    std::optional<std::string> result_id;
    bool cancel_requested{false};  // Set while RUNNING; any transition clears it

    Timestamp created_at;
    Timestamp updated_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;

    nlohmann::json to_json() const;
};

/**
 * @brief Status change written through a task store
 */
struct TaskStatusUpdate {
    std::string task_id;
    TaskStatus status{TaskStatus::PENDING};
    std::optional<std::string> error_message;
    std::optional<std::string> result_id;
    std::optional<double> progress;
};

/**
 * @brief Task counts of a batch, derived from its member tasks
 */
struct BatchSummary {
    std::string batch_id;
    int total{0};
    int pending{0};
    int running{0};
    int completed{0};
    int failed{0};
    int cancelled{0};

    void count(TaskStatus status);

    /**
     * @brief True once no member task is pending or running
     */
    bool is_finished() const {
        return total > 0 && pending == 0 && running == 0;
    }

    nlohmann::json to_json() const;
};

}  // namespace quant_engine
