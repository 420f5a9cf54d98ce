// include/quant_engine/storage/task_store.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "quant_engine/core/error.hpp"
#include "quant_engine/task/backtest_result.hpp"
#include "quant_engine/task/task_types.hpp"

namespace quant_engine {

/**
 * @brief Unit of work against a task store
 *
 * Writes become visible together on commit(). Destroying an uncommitted
 * transaction discards its writes.
 */
class TaskStoreTransaction {
public:
    virtual ~TaskStoreTransaction() = default;

    /**
     * @brief Stage a result
     * @return Id under which the result will be stored
     */
    virtual Result<std::string> save_result(const BacktestResult& result) = 0;

    /**
     * @brief Stage a status change; the transition is checked against the current status
     */
    virtual Result<void> update_task_status(const TaskStatusUpdate& update) = 0;

    virtual Result<void> commit() = 0;
};

/**
 * @brief Filter for listing tasks
 */
struct TaskQuery {
    std::optional<TaskStatus> status;
    std::optional<std::string> batch_id;
    size_t offset{0};
    size_t limit{100};
};

/**
 * @brief Durable record of tasks, batches and results
 */
class TaskStore {
public:
    virtual ~TaskStore() = default;

    /**
     * @brief Persist a new task
     * @return DATABASE_ERROR on storage failure, VALIDATION_ERROR on duplicate id
     */
    virtual Result<void> create_task(const Task& task) = 0;

    /**
     * @return The task, or TASK_NOT_FOUND
     */
    virtual Result<Task> get_task_by_id(const std::string& task_id) = 0;

    /**
     * @brief Pending tasks, oldest first
     * @param limit Maximum number of tasks to return
     */
    virtual Result<std::vector<Task>> list_pending_tasks(size_t limit) = 0;

    virtual Result<std::vector<Task>> list_tasks(const TaskQuery& query) = 0;

    /**
     * @brief Tasks of a batch, oldest first
     */
    virtual Result<std::vector<Task>> get_tasks_by_batch(const std::string& batch_id) = 0;

    /**
     * @brief Task counts of a batch
     * @return TASK_NOT_FOUND when the batch has no tasks
     */
    virtual Result<BatchSummary> get_batch_summary(const std::string& batch_id) = 0;

    /**
     * @brief Atomically move a task from PENDING to RUNNING
     * @return true if this caller claimed the task, false if it was no longer pending
     */
    virtual Result<bool> claim_task(const std::string& task_id) = 0;

    /**
     * @brief Atomically flag a RUNNING task for cancellation
     *
     * The flag lives with the task, so the orchestrator executing it sees the
     * request wherever it was made. Any status change clears it.
     * @return true if the flag was set, false if the task is not running
     */
    virtual Result<bool> request_cancel(const std::string& task_id) = 0;

    /**
     * @return Whether cancellation was requested, or TASK_NOT_FOUND
     */
    virtual Result<bool> is_cancel_requested(const std::string& task_id) = 0;

    /**
     * @brief Record progress of a running task without changing its status
     */
    virtual Result<void> update_task_progress(const std::string& task_id, double progress) = 0;

    /**
     * @brief Apply a status change in its own transaction
     */
    virtual Result<void> update_task_status(const TaskStatusUpdate& update) = 0;

    /**
     * @return The stored result, or DATA_NOT_FOUND
     */
    virtual Result<BacktestResult> get_result(const std::string& result_id) = 0;

    /**
     * @brief Open a transaction for writes that must land together
     */
    virtual Result<std::unique_ptr<TaskStoreTransaction>> begin() = 0;
};

}  // namespace quant_engine
