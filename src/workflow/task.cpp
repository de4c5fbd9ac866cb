/**
 * @file task.cpp
 * @brief Task readiness and retry predicates.
 */

#include "workflow/task.hpp"

#include <algorithm>

namespace dag_scheduler {

bool Task::is_ready(const std::unordered_set<TaskId>& completed_ids) const {
    if (status != TaskStatus::Pending) return false;
    return std::all_of(dependencies.begin(), dependencies.end(),
        [&](const TaskId& dep) { return completed_ids.contains(dep); });
}

bool Task::can_retry() const noexcept {
    return status == TaskStatus::Failed && retry_count < max_retries;
}

std::string Task::work_name() const {
    if (const auto* name = std::get_if<std::string>(&work)) {
        return *name;
    }
    return "<callable>";
}

void Task::reset_runtime_state() {
    status = TaskStatus::Pending;
    result.reset();
    error.reset();
    start_time.reset();
    end_time.reset();
    retry_count = 0;
}

}  // namespace dag_scheduler
