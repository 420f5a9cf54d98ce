// src/storage/in_memory_task_store.cpp

#include "quant_engine/storage/in_memory_task_store.hpp"
#include <algorithm>
#include <limits>
#include "quant_engine/core/id_generator.hpp"
#include "quant_engine/task/task_state_machine.hpp"

namespace quant_engine {

class InMemoryTransaction : public TaskStoreTransaction {
public:
    explicit InMemoryTransaction(InMemoryTaskStore& store) : store_(store) {}

    Result<std::string> save_result(const BacktestResult& result) override {
        if (committed_) {
            return make_error<std::string>(ErrorCode::DATABASE_ERROR,
                                           "Transaction already committed", "InMemoryTaskStore");
        }
        BacktestResult staged = result;
        if (staged.result_id.empty()) {
            staged.result_id = IdGenerator::generate_result_id(std::chrono::system_clock::now());
        }
        std::string id = staged.result_id;
        results_.push_back(std::move(staged));
        return id;
    }

    Result<void> update_task_status(const TaskStatusUpdate& update) override {
        if (committed_) {
            return make_error<void>(ErrorCode::DATABASE_ERROR, "Transaction already committed",
                                    "InMemoryTaskStore");
        }

        // Check the transition against the status this transaction would leave behind
        TaskStatus current;
        {
            std::lock_guard<std::mutex> lock(store_.mutex_);
            auto it = store_.tasks_.find(update.task_id);
            if (it == store_.tasks_.end()) {
                return make_error<void>(ErrorCode::TASK_NOT_FOUND,
                                        "Task not found: " + update.task_id, "InMemoryTaskStore");
            }
            current = it->second.status;
        }
        for (const auto& staged : updates_) {
            if (staged.task_id == update.task_id) {
                current = staged.status;
            }
        }

        auto valid = TaskStateMachine::validate_transition(current, update.status);
        if (valid.is_error()) {
            return valid;
        }
        updates_.push_back(update);
        return Result<void>();
    }

    Result<void> commit() override {
        if (committed_) {
            return make_error<void>(ErrorCode::DATABASE_ERROR, "Transaction already committed",
                                    "InMemoryTaskStore");
        }
        if (!results_.empty() && store_.fail_result_commits_.load()) {
            return make_error<void>(ErrorCode::DATABASE_ERROR, "Simulated result write failure",
                                    "InMemoryTaskStore");
        }

        std::lock_guard<std::mutex> lock(store_.mutex_);

        // Validate everything before touching the store so a failure leaves it unchanged
        std::unordered_map<std::string, TaskStatus> projected;
        for (const auto& update : updates_) {
            auto it = store_.tasks_.find(update.task_id);
            if (it == store_.tasks_.end()) {
                return make_error<void>(ErrorCode::TASK_NOT_FOUND,
                                        "Task not found: " + update.task_id, "InMemoryTaskStore");
            }
            TaskStatus from = projected.count(update.task_id) ? projected[update.task_id]
                                                              : it->second.status;
            auto valid = TaskStateMachine::validate_transition(from, update.status);
            if (valid.is_error()) {
                return valid;
            }
            projected[update.task_id] = update.status;
        }

        const Timestamp now = std::chrono::system_clock::now();
        for (auto& result : results_) {
            store_.results_[result.result_id] = std::move(result);
        }
        for (const auto& update : updates_) {
            auto applied = store_.apply_update_locked(update, now);
            if (applied.is_error()) {
                return applied;
            }
        }

        committed_ = true;
        return Result<void>();
    }

private:
    InMemoryTaskStore& store_;
    std::vector<BacktestResult> results_;
    std::vector<TaskStatusUpdate> updates_;
    bool committed_{false};
};

Result<void> InMemoryTaskStore::create_task(const Task& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.count(task.id)) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR, "Task already exists: " + task.id,
                                "InMemoryTaskStore");
    }
    tasks_[task.id] = task;
    sequence_[task.id] = next_sequence_++;
    return Result<void>();
}

Result<Task> InMemoryTaskStore::get_task_by_id(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return make_error<Task>(ErrorCode::TASK_NOT_FOUND, "Task not found: " + task_id,
                                "InMemoryTaskStore");
    }
    return it->second;
}

std::vector<Task> InMemoryTaskStore::sorted_tasks_locked() const {
    std::vector<Task> tasks;
    tasks.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
        tasks.push_back(task);
    }
    std::sort(tasks.begin(), tasks.end(), [this](const Task& a, const Task& b) {
        if (a.created_at != b.created_at) {
            return a.created_at < b.created_at;
        }
        return sequence_.at(a.id) < sequence_.at(b.id);
    });
    return tasks;
}

Result<std::vector<Task>> InMemoryTaskStore::list_pending_tasks(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Task> pending;
    for (auto& task : sorted_tasks_locked()) {
        if (pending.size() >= limit) {
            break;
        }
        if (task.status == TaskStatus::PENDING) {
            pending.push_back(std::move(task));
        }
    }
    return pending;
}

Result<std::vector<Task>> InMemoryTaskStore::list_tasks(const TaskQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Task> matching;
    size_t skipped = 0;
    for (auto& task : sorted_tasks_locked()) {
        if (query.status && task.status != *query.status) {
            continue;
        }
        if (query.batch_id && task.batch_id != *query.batch_id) {
            continue;
        }
        if (skipped < query.offset) {
            ++skipped;
            continue;
        }
        if (matching.size() >= query.limit) {
            break;
        }
        matching.push_back(std::move(task));
    }
    return matching;
}

Result<std::vector<Task>> InMemoryTaskStore::get_tasks_by_batch(const std::string& batch_id) {
    TaskQuery query;
    query.batch_id = batch_id;
    query.limit = std::numeric_limits<size_t>::max();
    return list_tasks(query);
}

Result<BatchSummary> InMemoryTaskStore::get_batch_summary(const std::string& batch_id) {
    auto tasks = get_tasks_by_batch(batch_id);
    if (tasks.is_error()) {
        return forward_error<BatchSummary>(tasks);
    }
    if (tasks.value().empty()) {
        return make_error<BatchSummary>(ErrorCode::TASK_NOT_FOUND, "Batch not found: " + batch_id,
                                        "InMemoryTaskStore");
    }

    BatchSummary summary;
    summary.batch_id = batch_id;
    for (const auto& task : tasks.value()) {
        summary.count(task.status);
    }
    return summary;
}

Result<bool> InMemoryTaskStore::claim_task(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return make_error<bool>(ErrorCode::TASK_NOT_FOUND, "Task not found: " + task_id,
                                "InMemoryTaskStore");
    }
    if (it->second.status != TaskStatus::PENDING) {
        return false;
    }

    auto applied = TaskStateMachine::apply(it->second, TaskStatus::RUNNING, std::nullopt,
                                           std::chrono::system_clock::now());
    if (applied.is_error()) {
        return forward_error<bool>(applied);
    }
    return true;
}

Result<bool> InMemoryTaskStore::request_cancel(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return make_error<bool>(ErrorCode::TASK_NOT_FOUND, "Task not found: " + task_id,
                                "InMemoryTaskStore");
    }
    if (it->second.status != TaskStatus::RUNNING) {
        return false;
    }
    it->second.cancel_requested = true;
    it->second.updated_at = std::chrono::system_clock::now();
    return true;
}

Result<bool> InMemoryTaskStore::is_cancel_requested(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return make_error<bool>(ErrorCode::TASK_NOT_FOUND, "Task not found: " + task_id,
                                "InMemoryTaskStore");
    }
    return it->second.cancel_requested;
}

Result<void> InMemoryTaskStore::update_task_progress(const std::string& task_id,
                                                     double progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return make_error<void>(ErrorCode::TASK_NOT_FOUND, "Task not found: " + task_id,
                                "InMemoryTaskStore");
    }
    it->second.progress = std::clamp(progress, 0.0, 100.0);
    it->second.updated_at = std::chrono::system_clock::now();
    return Result<void>();
}

Result<void> InMemoryTaskStore::update_task_status(const TaskStatusUpdate& update) {
    auto txn = begin();
    if (txn.is_error()) {
        return forward_error<void>(txn);
    }
    auto staged = txn.value()->update_task_status(update);
    if (staged.is_error()) {
        return staged;
    }
    return txn.value()->commit();
}

Result<void> InMemoryTaskStore::apply_update_locked(const TaskStatusUpdate& update,
                                                    const Timestamp& now) {
    auto it = tasks_.find(update.task_id);
    if (it == tasks_.end()) {
        return make_error<void>(ErrorCode::TASK_NOT_FOUND, "Task not found: " + update.task_id,
                                "InMemoryTaskStore");
    }

    Task& task = it->second;
    auto applied = TaskStateMachine::apply(task, update.status, update.error_message, now);
    if (applied.is_error()) {
        return applied;
    }
    if (update.result_id) {
        task.result_id = update.result_id;
    }
    if (update.progress) {
        task.progress = std::clamp(*update.progress, 0.0, 100.0);
    }
    return Result<void>();
}

Result<BacktestResult> InMemoryTaskStore::get_result(const std::string& result_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = results_.find(result_id);
    if (it == results_.end()) {
        return make_error<BacktestResult>(ErrorCode::DATA_NOT_FOUND,
                                          "Result not found: " + result_id, "InMemoryTaskStore");
    }
    return it->second;
}

Result<std::unique_ptr<TaskStoreTransaction>> InMemoryTaskStore::begin() {
    return std::unique_ptr<TaskStoreTransaction>(std::make_unique<InMemoryTransaction>(*this));
}

size_t InMemoryTaskStore::result_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

Result<FactorCombination> InMemoryFactorCombinationStore::get_combination(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = combinations_.find(id);
    if (it == combinations_.end()) {
        return make_error<FactorCombination>(ErrorCode::DATA_NOT_FOUND,
                                             "Factor combination not found: " + id,
                                             "InMemoryFactorCombinationStore");
    }
    return it->second;
}

Result<void> InMemoryFactorCombinationStore::save_combination(
    const FactorCombination& combination) {
    auto report = combination.validate();
    if (!report.is_valid()) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR, report.errors.front(),
                                "InMemoryFactorCombinationStore");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    combinations_[combination.id()] = combination;
    return Result<void>();
}

}  // namespace quant_engine
