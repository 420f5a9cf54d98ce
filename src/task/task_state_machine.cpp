// src/task/task_state_machine.cpp

#include "quant_engine/task/task_state_machine.hpp"

namespace quant_engine {

bool TaskStateMachine::can_transition(TaskStatus from, TaskStatus to) {
    switch (from) {
        case TaskStatus::PENDING:
            return to == TaskStatus::RUNNING || to == TaskStatus::CANCELLED;
        case TaskStatus::RUNNING:
            return to == TaskStatus::COMPLETED || to == TaskStatus::FAILED ||
                   to == TaskStatus::CANCELLED;
        case TaskStatus::FAILED:
            return to == TaskStatus::PENDING;
        case TaskStatus::CANCELLED:
            return to == TaskStatus::PENDING;
        case TaskStatus::COMPLETED:
            return false;
    }
    return false;
}

Result<void> TaskStateMachine::validate_transition(TaskStatus from, TaskStatus to) {
    if (!can_transition(from, to)) {
        return make_error<void>(ErrorCode::INVALID_TRANSITION,
                                "Invalid state transition from " + task_status_to_string(from) +
                                    " to " + task_status_to_string(to),
                                "TaskStateMachine");
    }
    return Result<void>();
}

std::vector<TaskStatus> TaskStateMachine::allowed_transitions(TaskStatus from) {
    std::vector<TaskStatus> allowed;
    for (TaskStatus to : {TaskStatus::PENDING, TaskStatus::RUNNING, TaskStatus::COMPLETED,
                          TaskStatus::FAILED, TaskStatus::CANCELLED}) {
        if (can_transition(from, to)) {
            allowed.push_back(to);
        }
    }
    return allowed;
}

Result<void> TaskStateMachine::apply(Task& task, TaskStatus to,
                                     const std::optional<std::string>& error_message,
                                     const Timestamp& now) {
    auto validation = validate_transition(task.status, to);
    if (validation.is_error()) {
        return validation;
    }

    switch (to) {
        case TaskStatus::PENDING:
            task.error_message.reset();
            task.result_id.reset();
            task.progress = 0.0;
            task.started_at.reset();
            task.completed_at.reset();
            break;
        case TaskStatus::RUNNING:
            task.started_at = now;
            break;
        case TaskStatus::COMPLETED:
            task.progress = 100.0;
            task.error_message.reset();
            task.completed_at = now;
            break;
        case TaskStatus::FAILED:
            task.error_message = error_message ? *error_message : DEFAULT_FAILURE_MESSAGE;
            task.completed_at = now;
            break;
        case TaskStatus::CANCELLED:
            task.error_message = error_message ? *error_message : CANCELLED_MESSAGE;
            task.completed_at = now;
            break;
    }

    task.status = to;
    task.cancel_requested = false;
    task.updated_at = now;
    return Result<void>();
}

}  // namespace quant_engine
