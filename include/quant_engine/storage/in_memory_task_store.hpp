// include/quant_engine/storage/in_memory_task_store.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "quant_engine/factor/factor_combination.hpp"
#include "quant_engine/storage/task_store.hpp"

namespace quant_engine {

/**
 * @brief Task store kept in process memory
 *
 * Used for tests and for running the scheduler without a database. Writes made
 * through a transaction are staged and applied under the store lock on commit.
 */
class InMemoryTaskStore : public TaskStore {
public:
    InMemoryTaskStore() = default;

    Result<void> create_task(const Task& task) override;
    Result<Task> get_task_by_id(const std::string& task_id) override;
    Result<std::vector<Task>> list_pending_tasks(size_t limit) override;
    Result<std::vector<Task>> list_tasks(const TaskQuery& query) override;
    Result<std::vector<Task>> get_tasks_by_batch(const std::string& batch_id) override;
    Result<BatchSummary> get_batch_summary(const std::string& batch_id) override;
    Result<bool> claim_task(const std::string& task_id) override;
    Result<bool> request_cancel(const std::string& task_id) override;
    Result<bool> is_cancel_requested(const std::string& task_id) override;
    Result<void> update_task_progress(const std::string& task_id, double progress) override;
    Result<void> update_task_status(const TaskStatusUpdate& update) override;
    Result<BacktestResult> get_result(const std::string& result_id) override;
    Result<std::unique_ptr<TaskStoreTransaction>> begin() override;

    /**
     * @brief Make commits that carry a result fail, to exercise rollback
     */
    void fail_result_commits(bool fail) {
        fail_result_commits_.store(fail);
    }

    size_t result_count() const;

private:
    friend class InMemoryTransaction;

    // Callers hold mutex_
    Result<void> apply_update_locked(const TaskStatusUpdate& update, const Timestamp& now);
    std::vector<Task> sorted_tasks_locked() const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Task> tasks_;
    std::unordered_map<std::string, uint64_t> sequence_;  // Insertion order tie-breaker
    std::unordered_map<std::string, BacktestResult> results_;
    uint64_t next_sequence_{0};
    std::atomic<bool> fail_result_commits_{false};
};

/**
 * @brief Factor combinations kept in process memory
 */
class InMemoryFactorCombinationStore : public FactorCombinationStore {
public:
    Result<FactorCombination> get_combination(const std::string& id) override;
    Result<void> save_combination(const FactorCombination& combination) override;

private:
    std::mutex mutex_;
    std::map<std::string, FactorCombination> combinations_;
};

}  // namespace quant_engine
