/**
 * @file task_runner.hpp
 * @brief Runs one attempt of a task function under a deadline.
 */

#pragma once

#include "core/types.hpp"
#include "workflow/task.hpp"

#include <optional>
#include <stop_token>
#include <string>

namespace dag_scheduler {

struct AttemptRequest {
    TaskId task_id;
    uint32_t attempt = 1;
    Args args;
    Kwargs kwargs;
    Seconds timeout = kDefaultTaskTimeout;
};

struct AttemptOutcome {
    TaskStatus final_status = TaskStatus::Failed;   ///< Completed or Failed
    std::optional<Value> result;
    std::optional<std::string> error;
    Duration actual_duration{0};
    bool timed_out = false;
};

/**
 * @brief Executes task functions on a dedicated worker thread per attempt.
 *
 * The caller blocks until the function returns or the deadline passes. On
 * expiry the worker's stop token is requested and the worker is detached:
 * the attempt is reported as failed immediately, and a function that ignores
 * its stop token keeps running in the background until it returns.
 * `cancel` is forwarded into the worker's stop token as well.
 */
class TaskRunner {
public:
    AttemptOutcome execute(const TaskFunction& function,
                           AttemptRequest request,
                           std::stop_token cancel = {});
};

/// "timed out after 0.05s"
std::string timeout_message(Seconds timeout);

}  // namespace dag_scheduler
