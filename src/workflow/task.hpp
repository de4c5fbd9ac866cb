/**
 * @file task.hpp
 * @brief Task record: identity, work reference, dependencies, runtime state.
 *
 * A Task's identity fields are set by the caller; its runtime fields are
 * written only by the Scheduler while the owning workflow executes.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

namespace dag_scheduler {

/**
 * @brief Everything a task function receives for one attempt.
 *
 * `stop` is requested when the attempt's deadline expires or the workflow is
 * cancelled. Long-running functions should poll it and return early; the
 * engine cannot interrupt a function that ignores it.
 */
struct TaskContext {
    const TaskId& task_id;
    uint32_t attempt;           ///< 1 for the first try, 2 for the first retry, ...
    const Args& args;
    const Kwargs& kwargs;
    std::stop_token stop;

    [[nodiscard]] bool stop_requested() const noexcept { return stop.stop_requested(); }
};

/// Returns the task result, or throws to fail the attempt.
using TaskFunction = std::function<Value(const TaskContext&)>;

/// Direct callable handle, or the name of a registered function.
using WorkRef = std::variant<TaskFunction, std::string>;

inline constexpr Seconds kDefaultTaskTimeout{300.0};

/**
 * @brief A single schedulable unit of work.
 */
struct Task {
    TaskId task_id;
    std::string name;
    WorkRef work;
    Args args;
    Kwargs kwargs;
    std::vector<TaskId> dependencies;
    Metadata metadata;
    uint32_t max_retries = 0;
    Seconds timeout = kDefaultTaskTimeout;

    // ── Runtime state ────────────────────────
    TaskStatus status = TaskStatus::Pending;
    std::optional<Value> result;
    std::optional<std::string> error;
    std::optional<Timestamp> start_time;
    std::optional<Timestamp> end_time;
    uint32_t retry_count = 0;

    /// Pending, and every dependency is in `completed_ids`.
    [[nodiscard]] bool is_ready(const std::unordered_set<TaskId>& completed_ids) const;

    /// Failed with retry budget left.
    [[nodiscard]] bool can_retry() const noexcept;

    [[nodiscard]] bool is_permanently_failed() const noexcept {
        return status == TaskStatus::Failed && retry_count >= max_retries;
    }

    /// Registered function name, or "<callable>" for a direct handle.
    [[nodiscard]] std::string work_name() const;

    /// Clear runtime state back to a fresh Pending task.
    void reset_runtime_state();
};

}  // namespace dag_scheduler
