/**
 * @file types.hpp
 * @brief Fundamental types used throughout the DAG scheduler.
 *
 * Defines TaskId, WorkflowId, the dynamic Value type passed to and returned
 * from task functions, and the task/workflow status enumerations.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dag_scheduler {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using WorkflowId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using Seconds = std::chrono::duration<double>;
using Metadata = std::map<std::string, std::string>;

// ─────────────────────────────────────────────
// Task Values
// ─────────────────────────────────────────────

/**
 * @brief Dynamically typed argument or result of a task function.
 *
 * std::monostate is the "none" value; a task that returns nothing
 * meaningful completes with it.
 */
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

using Args = std::vector<Value>;
using Kwargs = std::map<std::string, Value, std::less<>>;

/**
 * @brief Render a Value for log lines and error messages.
 */
std::string to_string(const Value& value);

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Pending,       ///< Waiting for dependencies (or re-queued for retry)
    Ready,         ///< Part of the wave about to be dispatched
    Running,       ///< Attempt in progress
    Completed,     ///< Finished successfully
    Failed,        ///< Attempt failed
    Cancelled,     ///< Workflow was cancelled while the attempt was running
    Skipped        ///< Reserved, never assigned by the engine
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:   return "pending";
        case TaskStatus::Ready:     return "ready";
        case TaskStatus::Running:   return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed:    return "failed";
        case TaskStatus::Cancelled: return "cancelled";
        case TaskStatus::Skipped:   return "skipped";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Workflow Status
// ─────────────────────────────────────────────

enum class WorkflowStatus : uint8_t {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled,
    Paused         ///< Reserved, never assigned by the engine
};

[[nodiscard]] constexpr std::string_view to_string(WorkflowStatus status) noexcept {
    switch (status) {
        case WorkflowStatus::Pending:   return "pending";
        case WorkflowStatus::Running:   return "running";
        case WorkflowStatus::Completed: return "completed";
        case WorkflowStatus::Failed:    return "failed";
        case WorkflowStatus::Cancelled: return "cancelled";
        case WorkflowStatus::Paused:    return "paused";
    }
    return "unknown";
}

}  // namespace dag_scheduler
