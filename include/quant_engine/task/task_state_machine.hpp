// include/quant_engine/task/task_state_machine.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "quant_engine/core/error.hpp"
#include "quant_engine/core/types.hpp"
#include "quant_engine/task/task_types.hpp"

namespace quant_engine {

/**
 * @brief Transition table of the task lifecycle
 *
 *   PENDING   -> RUNNING, CANCELLED
 *   RUNNING   -> COMPLETED, FAILED, CANCELLED
 *   FAILED    -> PENDING
 *   CANCELLED -> PENDING
 *   COMPLETED is terminal.
 *
 * Every status change of a task goes through this table.
 */
class TaskStateMachine {
public:
    static constexpr const char* DEFAULT_FAILURE_MESSAGE = "task execution failed";
    static constexpr const char* CANCELLED_MESSAGE = "cancelled by user";

    static bool can_transition(TaskStatus from, TaskStatus to);

    /**
     * @brief Check a transition against the table
     * @return INVALID_TRANSITION naming both states when not allowed
     */
    static Result<void> validate_transition(TaskStatus from, TaskStatus to);

    /**
     * @brief States reachable from a state
     */
    static std::vector<TaskStatus> allowed_transitions(TaskStatus from);

    /**
     * @brief Move a task to a new status and update the fields that go with it
     *
     * RUNNING stamps started_at. Terminal states stamp completed_at. COMPLETED
     * sets progress to 100 and clears the error. FAILED records the error, or a
     * default message. PENDING clears the error, result, progress and timestamps
     * of the previous attempt. The task is left untouched when the transition
     * is not allowed.
     *
     * @param task Task to update
     * @param to Target status
     * @param error_message Error to record for FAILED or CANCELLED
     * @param now Time of the transition
     */
    static Result<void> apply(Task& task, TaskStatus to,
                              const std::optional<std::string>& error_message,
                              const Timestamp& now);
};

}  // namespace quant_engine
