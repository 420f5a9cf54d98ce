// src/orchestrator/task_orchestrator.cpp

#include "quant_engine/orchestrator/task_orchestrator.hpp"
#include <chrono>
#include <cmath>
#include <regex>
#include <stdexcept>
#include <thread>
#include "quant_engine/core/id_generator.hpp"
#include "quant_engine/core/time_utils.hpp"
#include "quant_engine/task/task_state_machine.hpp"

namespace quant_engine {

namespace {

const std::regex STOCK_CODE_PATTERN("^\\d{6}\\.(SH|SZ)$");

// Re-reads allowed when a task changes status while it is being cancelled
constexpr int MAX_CANCEL_ATTEMPTS = 3;

bool is_storage_error(ErrorCode code) {
    return code == ErrorCode::DATABASE_ERROR || code == ErrorCode::CONNECTION_ERROR;
}

void accumulate(DispatchSummary& totals, const DispatchSummary& cycle) {
    totals.examined += cycle.examined;
    totals.claimed += cycle.claimed;
    totals.completed += cycle.completed;
    totals.failed += cycle.failed;
    totals.cancelled += cycle.cancelled;
    totals.skipped += cycle.skipped;
}

}  // namespace

nlohmann::json DispatchSummary::to_json() const {
    nlohmann::json j;
    j["examined"] = examined;
    j["claimed"] = claimed;
    j["completed"] = completed;
    j["failed"] = failed;
    j["cancelled"] = cancelled;
    j["skipped"] = skipped;
    return j;
}

nlohmann::json OrchestratorStatus::to_json() const {
    nlohmann::json j;
    j["running"] = running;
    j["cycles"] = cycles;
    j["failed_cycles"] = failed_cycles;
    j["last_poll_at"] = last_poll_at ? nlohmann::json(core::format_timestamp(*last_poll_at))
                                     : nlohmann::json(nullptr);
    j["last_summary"] = last_summary.to_json();
    j["totals"] = totals.to_json();
    j["unrecorded_updates"] = unrecorded_updates;
    return j;
}

TaskOrchestrator::TaskOrchestrator(std::shared_ptr<TaskStore> store,
                                   std::shared_ptr<FactorCombinationStore> combinations,
                                   std::shared_ptr<BacktestRunner> runner,
                                   OrchestratorConfig config)
    : store_(std::move(store)),
      combinations_(std::move(combinations)),
      runner_(std::move(runner)),
      config_(std::move(config)) {
    if (!store_ || !runner_) {
        throw std::invalid_argument("TaskOrchestrator requires a task store and a runner");
    }
    Logger::register_component("TaskOrchestrator");
}

TaskOrchestrator::~TaskOrchestrator() {
    stop();
}

// ========== Submission ==========

Result<Task> TaskOrchestrator::build_task(const TaskRequest& request,
                                          const std::string& batch_id,
                                          const Timestamp& now) const {
    if (request.name.empty()) {
        return make_error<Task>(ErrorCode::VALIDATION_ERROR, "Task name is required",
                                "TaskOrchestrator");
    }
    if (!std::regex_match(request.stock_code, STOCK_CODE_PATTERN)) {
        return make_error<Task>(ErrorCode::VALIDATION_ERROR,
                                "Invalid stock code '" + request.stock_code +
                                    "', expected six digits followed by .SH or .SZ",
                                "TaskOrchestrator");
    }

    auto start = core::parse_date(request.start_date);
    if (start.is_error()) {
        return forward_error<Task>(start);
    }
    auto end = core::parse_date(request.end_date);
    if (end.is_error()) {
        return forward_error<Task>(end);
    }
    if (end.value() <= start.value()) {
        return make_error<Task>(ErrorCode::VALIDATION_ERROR,
                                "End date " + request.end_date + " must be after start date " +
                                    request.start_date,
                                "TaskOrchestrator");
    }
    if (end.value() > core::floor_to_day(now)) {
        return make_error<Task>(ErrorCode::VALIDATION_ERROR,
                                "End date " + request.end_date + " is in the future",
                                "TaskOrchestrator");
    }
    if (!std::isfinite(request.initial_capital) || request.initial_capital <= 0.0) {
        return make_error<Task>(ErrorCode::VALIDATION_ERROR,
                                "Initial capital must be positive", "TaskOrchestrator");
    }
    if (request.config.thresholds) {
        auto thresholds = request.config.thresholds->validate();
        if (thresholds.is_error()) {
            return forward_error<Task>(thresholds);
        }
    }

    Task task;
    task.id = IdGenerator::generate_task_id(now);
    task.batch_id = batch_id;
    task.name = request.name;
    task.description = request.description;
    task.stock_code = request.stock_code;
    task.start_date = start.value();
    task.end_date = end.value();
    task.initial_capital = request.initial_capital;
    task.factor_combination_id = request.factor_combination_id;
    task.config = request.config;
    task.status = TaskStatus::PENDING;
    task.progress = 0.0;
    task.created_at = now;
    task.updated_at = now;
    return task;
}

Result<Task> TaskOrchestrator::submit(const TaskRequest& request) {
    const Timestamp now = std::chrono::system_clock::now();
    const std::string batch_id =
        request.batch_id && !request.batch_id->empty() ? *request.batch_id
                                                       : IdGenerator::generate_batch_id(now);

    auto task = build_task(request, batch_id, now);
    if (task.is_error()) {
        WARN("Rejected task '" << request.name << "': " << task.error()->what());
        return task;
    }

    auto created = store_->create_task(task.value());
    if (created.is_error()) {
        return forward_error<Task>(created);
    }

    INFO("Submitted task " << task.value().id << " (" << task.value().stock_code << " "
                           << request.start_date << " to " << request.end_date << ", batch "
                           << batch_id << ")");
    return task;
}

Result<std::vector<Task>> TaskOrchestrator::submit_batch(
    const std::vector<TaskRequest>& requests, const std::optional<std::string>& batch_name) {
    if (requests.empty()) {
        return make_error<std::vector<Task>>(ErrorCode::VALIDATION_ERROR,
                                             "A batch needs at least one task",
                                             "TaskOrchestrator");
    }

    const Timestamp now = std::chrono::system_clock::now();
    const std::string batch_id = IdGenerator::generate_batch_id(now);
    const std::string label = batch_name.value_or(batch_id);

    std::vector<Task> tasks;
    tasks.reserve(requests.size());
    for (size_t i = 0; i < requests.size(); ++i) {
        TaskRequest request = requests[i];
        if (request.name.empty()) {
            request.name = label + " #" + std::to_string(i + 1);
        }
        auto task = build_task(request, batch_id, now);
        if (task.is_error()) {
            return make_error<std::vector<Task>>(
                task.error()->code(),
                "Batch task " + std::to_string(i + 1) + ": " + task.error()->what(),
                "TaskOrchestrator");
        }
        tasks.push_back(task.take_value());
    }

    for (const auto& task : tasks) {
        auto created = store_->create_task(task);
        if (created.is_error()) {
            return forward_error<std::vector<Task>>(created);
        }
    }

    INFO("Submitted batch " << batch_id << " '" << label << "' with " << tasks.size()
                            << " tasks");
    return tasks;
}

// ========== Dispatch ==========

Result<DispatchSummary> TaskOrchestrator::poll_and_dispatch() {
    std::lock_guard<std::mutex> dispatch_lock(dispatch_mutex_);
    Logger::register_component("TaskOrchestrator");

    flush_unrecorded();

    DispatchSummary summary;
    auto pending = store_->list_pending_tasks(config_.batch_limit);
    if (pending.is_error()) {
        std::lock_guard<std::mutex> lock(status_mutex_);
        ++status_.cycles;
        ++status_.failed_cycles;
        status_.last_poll_at = std::chrono::system_clock::now();
        return forward_error<DispatchSummary>(pending);
    }

    summary.examined = pending.value().size();
    for (const auto& task : pending.value()) {
        auto claimed = store_->claim_task(task.id);
        if (claimed.is_error()) {
            ERROR("Failed to claim task " << task.id << ": " << claimed.error()->what());
            ++summary.skipped;
            continue;
        }
        if (!claimed.value()) {
            DEBUG("Task " << task.id << " was claimed elsewhere");
            ++summary.skipped;
            continue;
        }

        ++summary.claimed;
        INFO("Claimed task " << task.id << " (" << task.name << ")");

        switch (execute_task(task)) {
            case TaskFate::COMPLETED:
                ++summary.completed;
                break;
            case TaskFate::FAILED:
                ++summary.failed;
                break;
            case TaskFate::CANCELLED:
                ++summary.cancelled;
                break;
        }
    }

    INFO("Poll cycle: examined " << summary.examined << ", claimed " << summary.claimed
                                 << ", completed " << summary.completed << ", failed "
                                 << summary.failed << ", cancelled " << summary.cancelled
                                 << ", skipped " << summary.skipped);

    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        ++status_.cycles;
        status_.last_poll_at = std::chrono::system_clock::now();
        status_.last_summary = summary;
        accumulate(status_.totals, summary);
    }
    return summary;
}

Result<FactorCombination> TaskOrchestrator::load_combination(const Task& task) {
    if (task.factor_combination_id.empty() || task.factor_combination_id == "default") {
        return FactorCombination::default_combination();
    }
    if (!combinations_) {
        return make_error<FactorCombination>(ErrorCode::NOT_INITIALIZED,
                                             "No factor combination store configured",
                                             "TaskOrchestrator");
    }

    auto combination = combinations_->get_combination(task.factor_combination_id);
    if (combination.is_error()) {
        return combination;
    }

    auto report = combination.value().validate();
    for (const auto& warning : report.warnings) {
        WARN("Combination " << task.factor_combination_id << ": " << warning);
    }
    if (!report.is_valid()) {
        return make_error<FactorCombination>(
            ErrorCode::VALIDATION_ERROR,
            "Invalid factor combination " + task.factor_combination_id + ": " +
                report.errors.front(),
            "TaskOrchestrator");
    }
    return combination;
}

TaskOrchestrator::TaskFate TaskOrchestrator::execute_task(const Task& task) {
    LogContext log_context(task.id);

    auto combination = load_combination(task);
    if (combination.is_error()) {
        fail_task(task.id, error_code_to_string(combination.error()->code()) + ": " +
                               combination.error()->what());
        return TaskFate::FAILED;
    }

    double next_progress = config_.progress_step;
    auto on_progress = [this, &task, &next_progress](double progress) {
        if (progress + 1e-9 < next_progress || progress >= 100.0) {
            return;
        }
        auto written = store_->update_task_progress(task.id, progress);
        if (written.is_error()) {
            WARN("Failed to record progress of " << task.id << ": " << written.error()->what());
        }
        while (next_progress <= progress + 1e-9) {
            next_progress += config_.progress_step;
        }
    };
    std::optional<std::chrono::steady_clock::time_point> last_cancel_check;
    auto cancel_check = [this, &task, &last_cancel_check]() {
        const auto now = std::chrono::steady_clock::now();
        if (last_cancel_check &&
            now - *last_cancel_check <
                std::chrono::milliseconds(config_.cancel_check_interval_ms)) {
            return false;
        }
        last_cancel_check = now;

        auto requested = store_->is_cancel_requested(task.id);
        if (requested.is_error()) {
            WARN("Could not read cancel flag of " << task.id << ": "
                                                  << requested.error()->what());
            return false;
        }
        return requested.value();
    };

    std::optional<RunOutcome> outcome;
    std::string failure;
    try {
        auto run = runner_->run(task, combination.value(), cancel_check, on_progress);
        if (run.is_error()) {
            failure = error_code_to_string(run.error()->code()) + ": " + run.error()->what();
        } else {
            outcome = run.take_value();
        }
    } catch (const std::exception& e) {
        failure = error_code_to_string(ErrorCode::EXECUTION_ERROR) + ": " + e.what();
    }
    Logger::register_component("TaskOrchestrator");

    TaskFate fate = TaskFate::FAILED;
    if (!outcome) {
        fail_task(task.id, failure);
    } else if (outcome->cancelled) {
        TaskStatusUpdate update;
        update.task_id = task.id;
        update.status = TaskStatus::CANCELLED;
        update.error_message = TaskStateMachine::CANCELLED_MESSAGE;
        if (record_terminal(update)) {
            INFO("Task " << task.id << " cancelled");
        }
        fate = TaskFate::CANCELLED;
    } else {
        auto persisted = persist_result(task, *outcome->result);
        if (persisted.is_error()) {
            fail_task(task.id, error_code_to_string(persisted.error()->code()) + ": " +
                                   persisted.error()->what());
        } else {
            INFO("Task " << task.id << " completed with result " << persisted.value());
            fate = TaskFate::COMPLETED;
        }
    }

    return fate;
}

Result<std::string> TaskOrchestrator::persist_result(const Task& task,
                                                     const BacktestResult& result) {
    try {
        auto txn = store_->begin();
        if (txn.is_error()) {
            return forward_error<std::string>(txn);
        }
        const auto& transaction = txn.value();

        auto saved = transaction->save_result(result);
        if (saved.is_error()) {
            return saved;
        }

        TaskStatusUpdate update;
        update.task_id = task.id;
        update.status = TaskStatus::COMPLETED;
        update.result_id = saved.value();
        update.progress = 100.0;
        auto staged = transaction->update_task_status(update);
        if (staged.is_error()) {
            return forward_error<std::string>(staged);
        }

        auto committed = transaction->commit();
        if (committed.is_error()) {
            return forward_error<std::string>(committed);
        }
        return saved;

    } catch (const std::exception& e) {
        return make_error<std::string>(ErrorCode::EXECUTION_ERROR,
                                       "Failed to persist result: " + std::string(e.what()),
                                       "TaskOrchestrator");
    }
}

void TaskOrchestrator::fail_task(const std::string& task_id, const std::string& message) {
    ERROR("Task " << task_id << " failed: " << message);

    TaskStatusUpdate update;
    update.task_id = task_id;
    update.status = TaskStatus::FAILED;
    update.error_message = message.empty() ? TaskStateMachine::DEFAULT_FAILURE_MESSAGE : message;
    record_terminal(update);
}

// ========== Status writes ==========

Result<void> TaskOrchestrator::write_status(const TaskStatusUpdate& update) {
    std::chrono::milliseconds delay(config_.status_retry_delay_ms);
    for (int attempt = 1;; ++attempt) {
        auto written = store_->update_task_status(update);
        if (written.is_ok() || !is_storage_error(written.error()->code()) ||
            attempt >= config_.status_write_attempts) {
            return written;
        }

        WARN("Status write for " << update.task_id << " failed, retrying (attempt " << attempt
                                 << " of " << config_.status_write_attempts
                                 << "): " << written.error()->what());
        std::this_thread::sleep_for(delay);
        delay *= 2;
    }
}

bool TaskOrchestrator::record_terminal(const TaskStatusUpdate& update) {
    auto written = write_status(update);
    if (written.is_ok()) {
        return true;
    }

    if (!is_storage_error(written.error()->code())) {
        ERROR("Cannot mark task " << update.task_id << " "
                                  << task_status_to_string(update.status) << ": "
                                  << written.error()->to_string());
        return false;
    }

    ERROR("Failed to mark task " << update.task_id << " " << task_status_to_string(update.status)
                                 << ", will retry next cycle: " << written.error()->what());
    std::lock_guard<std::mutex> lock(unrecorded_mutex_);
    unrecorded_.push_back(update);
    return false;
}

void TaskOrchestrator::flush_unrecorded() {
    std::vector<TaskStatusUpdate> updates;
    {
        std::lock_guard<std::mutex> lock(unrecorded_mutex_);
        updates.swap(unrecorded_);
    }

    std::vector<TaskStatusUpdate> still_unrecorded;
    for (const auto& update : updates) {
        auto written = write_status(update);
        if (written.is_ok()) {
            INFO("Recorded deferred status " << task_status_to_string(update.status)
                                             << " of task " << update.task_id);
        } else if (is_storage_error(written.error()->code())) {
            still_unrecorded.push_back(update);
        } else {
            WARN("Dropping deferred status of task " << update.task_id << ": "
                                                     << written.error()->to_string());
        }
    }

    if (!still_unrecorded.empty()) {
        ERROR(still_unrecorded.size() << " task status update(s) still unrecorded");
        std::lock_guard<std::mutex> lock(unrecorded_mutex_);
        unrecorded_.insert(unrecorded_.begin(), still_unrecorded.begin(),
                           still_unrecorded.end());
    }
}

// ========== Cancellation and requeue ==========

Result<bool> TaskOrchestrator::is_cancel_requested(const std::string& task_id) {
    return store_->is_cancel_requested(task_id);
}

Result<void> TaskOrchestrator::cancel(const std::string& task_id) {
    // The status can change between the read and the write; each retry starts
    // from a fresh read
    for (int attempt = 0; attempt < MAX_CANCEL_ATTEMPTS; ++attempt) {
        auto task = store_->get_task_by_id(task_id);
        if (task.is_error()) {
            return forward_error<void>(task);
        }

        const TaskStatus status = task.value().status;
        if (status == TaskStatus::PENDING) {
            TaskStatusUpdate update;
            update.task_id = task_id;
            update.status = TaskStatus::CANCELLED;
            update.error_message = TaskStateMachine::CANCELLED_MESSAGE;
            auto written = store_->update_task_status(update);
            if (written.is_ok()) {
                INFO("Cancelled pending task " << task_id);
                return written;
            }
            if (written.error()->code() != ErrorCode::INVALID_TRANSITION) {
                return written;
            }
            continue;  // Claimed in the meantime
        }

        if (status == TaskStatus::RUNNING) {
            auto flagged = store_->request_cancel(task_id);
            if (flagged.is_error()) {
                return forward_error<void>(flagged);
            }
            if (flagged.value()) {
                INFO("Cancellation requested for running task " << task_id);
                return Result<void>();
            }
            continue;  // Finished in the meantime
        }

        return TaskStateMachine::validate_transition(status, TaskStatus::CANCELLED);
    }

    return make_error<void>(ErrorCode::INVALID_TRANSITION,
                            "Task " + task_id + " kept changing status while being cancelled",
                            "TaskOrchestrator");
}

Result<Task> TaskOrchestrator::requeue(const std::string& task_id) {
    auto task = store_->get_task_by_id(task_id);
    if (task.is_error()) {
        return task;
    }

    auto allowed = TaskStateMachine::validate_transition(task.value().status, TaskStatus::PENDING);
    if (allowed.is_error()) {
        return forward_error<Task>(allowed);
    }

    TaskStatusUpdate update;
    update.task_id = task_id;
    update.status = TaskStatus::PENDING;
    auto written = store_->update_task_status(update);
    if (written.is_error()) {
        return forward_error<Task>(written);
    }
    INFO("Requeued task " << task_id);
    return store_->get_task_by_id(task_id);
}

// ========== Queries ==========

Result<Task> TaskOrchestrator::get_task(const std::string& task_id) {
    return store_->get_task_by_id(task_id);
}

Result<BacktestResult> TaskOrchestrator::get_task_result(const std::string& task_id) {
    auto task = store_->get_task_by_id(task_id);
    if (task.is_error()) {
        return forward_error<BacktestResult>(task);
    }
    if (task.value().status != TaskStatus::COMPLETED || !task.value().result_id) {
        return make_error<BacktestResult>(
            ErrorCode::DATA_NOT_FOUND,
            "Task " + task_id + " has no result (status " +
                task_status_to_string(task.value().status) + ")",
            "TaskOrchestrator");
    }
    return store_->get_result(*task.value().result_id);
}

Result<std::vector<Task>> TaskOrchestrator::list_tasks(const TaskQuery& query) {
    return store_->list_tasks(query);
}

Result<BatchSummary> TaskOrchestrator::get_batch_summary(const std::string& batch_id) {
    return store_->get_batch_summary(batch_id);
}

// ========== Poll loop ==========

Result<void> TaskOrchestrator::start() {
    auto valid = config_.validate();
    if (valid.is_error()) {
        return valid;
    }
    if (running_.exchange(true)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Orchestrator already running",
                                "TaskOrchestrator");
    }

    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        stop_requested_ = false;
    }
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.running = true;
    }
    worker_ = std::thread(&TaskOrchestrator::run_loop, this);
    INFO("Orchestrator started, polling every " << config_.poll_interval_seconds << "s");
    return Result<void>();
}

void TaskOrchestrator::stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        stop_requested_ = true;
    }
    loop_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
        INFO("Orchestrator stopped");
    }
    running_.store(false);
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.running = false;
}

void TaskOrchestrator::run_loop() {
    Logger::register_component("TaskOrchestrator");

    while (true) {
        {
            std::lock_guard<std::mutex> lock(loop_mutex_);
            if (stop_requested_) {
                break;
            }
        }

        auto cycle = poll_and_dispatch();
        if (cycle.is_error()) {
            ERROR("Poll cycle failed: " << cycle.error()->to_string());
        }

        std::unique_lock<std::mutex> lock(loop_mutex_);
        if (loop_cv_.wait_for(lock, std::chrono::seconds(config_.poll_interval_seconds),
                              [this]() { return stop_requested_; })) {
            break;
        }
    }
}

OrchestratorStatus TaskOrchestrator::status() const {
    OrchestratorStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        snapshot = status_;
    }
    std::lock_guard<std::mutex> lock(unrecorded_mutex_);
    snapshot.unrecorded_updates = unrecorded_.size();
    return snapshot;
}

}  // namespace quant_engine
