// include/quant_engine/orchestrator/task_orchestrator.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "quant_engine/core/error.hpp"
#include "quant_engine/core/logger.hpp"
#include "quant_engine/factor/factor_combination.hpp"
#include "quant_engine/orchestrator/backtest_runner.hpp"
#include "quant_engine/orchestrator/engine_config.hpp"
#include "quant_engine/storage/task_store.hpp"
#include "quant_engine/task/task_types.hpp"

namespace quant_engine {

/**
 * @brief Counts of one poll cycle
 */
struct DispatchSummary {
    size_t examined{0};   // Pending tasks listed
    size_t claimed{0};
    size_t completed{0};
    size_t failed{0};
    size_t cancelled{0};
    size_t skipped{0};    // Claimed elsewhere or claim failed

    nlohmann::json to_json() const;
};

/**
 * @brief Snapshot of the poll loop state
 */
struct OrchestratorStatus {
    bool running{false};
    size_t cycles{0};
    size_t failed_cycles{0};
    std::optional<Timestamp> last_poll_at;
    DispatchSummary last_summary;
    DispatchSummary totals;
    size_t unrecorded_updates{0};  // Terminal statuses waiting to be written

    nlohmann::json to_json() const;
};

/**
 * @brief Owns the task lifecycle: submission, polling, execution and persistence
 *
 * Tasks are claimed atomically through the store, so several orchestrators may
 * share one store. Within a poll cycle tasks run one after another in creation
 * order. A task's result and its COMPLETED status are written in one
 * transaction; when that transaction fails the task is marked FAILED instead.
 * A terminal status the store rejects after all retries is kept and written
 * again at the start of the next poll cycle, so no task is left RUNNING.
 */
class TaskOrchestrator {
public:
    TaskOrchestrator(std::shared_ptr<TaskStore> store,
                     std::shared_ptr<FactorCombinationStore> combinations,
                     std::shared_ptr<BacktestRunner> runner,
                     OrchestratorConfig config = OrchestratorConfig{});

    ~TaskOrchestrator();

    TaskOrchestrator(const TaskOrchestrator&) = delete;
    TaskOrchestrator& operator=(const TaskOrchestrator&) = delete;

    /**
     * @brief Validate and enqueue a task
     * @return The stored PENDING task, or VALIDATION_ERROR without storing anything
     */
    Result<Task> submit(const TaskRequest& request);

    /**
     * @brief Enqueue several tasks under one new batch id
     *
     * All requests are validated before any is stored. Requests without a
     * name are named after the batch.
     */
    Result<std::vector<Task>> submit_batch(const std::vector<TaskRequest>& requests,
                                           const std::optional<std::string>& batch_name =
                                               std::nullopt);

    /**
     * @brief Run one poll cycle: write any statuses left over from earlier
     *        cycles, then claim and execute up to batch_limit pending tasks
     */
    Result<DispatchSummary> poll_and_dispatch();

    /**
     * @brief Cancel a PENDING task, or ask a RUNNING one to stop after its current snapshot
     *
     * The request for a running task is stored with the task, so it reaches the
     * orchestrator executing it even when that is another process.
     * @return INVALID_TRANSITION for terminal tasks
     */
    Result<void> cancel(const std::string& task_id);

    /**
     * @brief Move a FAILED or CANCELLED task back to PENDING
     */
    Result<Task> requeue(const std::string& task_id);

    Result<Task> get_task(const std::string& task_id);

    /**
     * @brief Result of a COMPLETED task
     * @return DATA_NOT_FOUND when the task has no result
     */
    Result<BacktestResult> get_task_result(const std::string& task_id);

    Result<std::vector<Task>> list_tasks(const TaskQuery& query);
    Result<BatchSummary> get_batch_summary(const std::string& batch_id);

    /**
     * @brief Start the background poll loop
     */
    Result<void> start();

    /**
     * @brief Stop the poll loop after the current cycle
     */
    void stop();

    bool is_running() const {
        return running_.load();
    }

    OrchestratorStatus status() const;

    Result<bool> is_cancel_requested(const std::string& task_id);

private:
    enum class TaskFate { COMPLETED, FAILED, CANCELLED };

    Result<Task> build_task(const TaskRequest& request, const std::string& batch_id,
                            const Timestamp& now) const;
    TaskFate execute_task(const Task& task);
    Result<FactorCombination> load_combination(const Task& task);
    Result<std::string> persist_result(const Task& task, const BacktestResult& result);
    void fail_task(const std::string& task_id, const std::string& message);

    // Status write retried with backoff on storage errors
    Result<void> write_status(const TaskStatusUpdate& update);

    // Writes a terminal status or keeps it for the next cycle; true if written now
    bool record_terminal(const TaskStatusUpdate& update);
    void flush_unrecorded();

    void run_loop();

    std::shared_ptr<TaskStore> store_;
    std::shared_ptr<FactorCombinationStore> combinations_;
    std::shared_ptr<BacktestRunner> runner_;
    OrchestratorConfig config_;

    std::mutex dispatch_mutex_;  // One poll cycle at a time

    mutable std::mutex unrecorded_mutex_;
    std::vector<TaskStatusUpdate> unrecorded_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    bool stop_requested_{false};

    mutable std::mutex status_mutex_;
    OrchestratorStatus status_;
};

}  // namespace quant_engine
