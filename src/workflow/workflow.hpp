/**
 * @file workflow.hpp
 * @brief Workflow aggregate: a named DAG of tasks.
 *
 * Edges point from a task to the tasks it depends on. Provides cycle
 * detection, ready-task queries and a static wave plan.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workflow/task.hpp"

#include <atomic>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace dag_scheduler {

/**
 * @brief A dependency that names a task the workflow does not contain.
 */
struct MissingDependency {
    TaskId task_id;
    TaskId dependency;

    bool operator==(const MissingDependency&) const = default;
};

/**
 * @brief Aggregate root owning a map of task_id → Task.
 *
 * Not synchronized. The Scheduler serializes all runtime-state access through
 * its own state lock; callers must not add tasks while the workflow runs.
 */
class Workflow {
public:
    Workflow(WorkflowId id, std::string name, std::string description = {},
             Metadata metadata = {});

    Workflow(const Workflow&) = delete;
    Workflow& operator=(const Workflow&) = delete;

    // ── Construction ──────────────────────────
    Result<void> add_task(Task task);

    // ── Graph queries ─────────────────────────
    [[nodiscard]] Result<void> validate_dag() const;
    [[nodiscard]] std::vector<Task*> get_ready_tasks(const std::unordered_set<TaskId>& completed_ids);
    [[nodiscard]] std::vector<std::vector<TaskId>> plan_waves() const;
    [[nodiscard]] std::vector<MissingDependency> missing_dependencies() const;

    [[nodiscard]] Task* find_task(const TaskId& id);
    [[nodiscard]] const Task* find_task(const TaskId& id) const;
    [[nodiscard]] std::unordered_map<TaskId, Task>& tasks() noexcept { return tasks_; }
    [[nodiscard]] const std::unordered_map<TaskId, Task>& tasks() const noexcept { return tasks_; }
    [[nodiscard]] size_t task_count() const noexcept { return tasks_.size(); }
    [[nodiscard]] std::vector<TaskId> sorted_task_ids() const;

    // ── Identity ──────────────────────────────
    [[nodiscard]] const WorkflowId& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    [[nodiscard]] const Metadata& metadata() const noexcept { return metadata_; }
    [[nodiscard]] Timestamp created_time() const noexcept { return created_time_; }

    // ── Runtime state (written by the Scheduler) ──
    [[nodiscard]] WorkflowStatus status() const noexcept { return status_.load(); }
    [[nodiscard]] std::optional<Timestamp> start_time() const noexcept { return start_time_; }
    [[nodiscard]] std::optional<Timestamp> end_time() const noexcept { return end_time_; }

    void set_status(WorkflowStatus status) noexcept { status_.store(status); }
    void set_start_time(std::optional<Timestamp> t) noexcept { start_time_ = t; }
    void set_end_time(std::optional<Timestamp> t) noexcept { end_time_ = t; }

private:
    WorkflowId id_;
    std::string name_;
    std::string description_;
    Metadata metadata_;
    Timestamp created_time_;

    std::atomic<WorkflowStatus> status_{WorkflowStatus::Pending};
    std::optional<Timestamp> start_time_;
    std::optional<Timestamp> end_time_;

    std::unordered_map<TaskId, Task> tasks_;
};

}  // namespace dag_scheduler
