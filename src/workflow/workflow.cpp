/**
 * @file workflow.cpp
 * @brief Workflow implementation: cycle detection, readiness, wave plan.
 *
 * Cycle detection is an iterative three-color DFS along "depends on" edges,
 * O(V+E). Dependencies on ids the workflow does not contain are ignored by
 * every graph algorithm here; at run time they simply keep the referencing
 * task from ever becoming ready.
 */

#include "workflow/workflow.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace dag_scheduler {

Workflow::Workflow(WorkflowId id, std::string name, std::string description,
                   Metadata metadata)
    : id_(std::move(id))
    , name_(std::move(name))
    , description_(std::move(description))
    , metadata_(std::move(metadata))
    , created_time_(std::chrono::system_clock::now()) {}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<void> Workflow::add_task(Task task) {
    if (task.task_id.empty()) {
        return Error{ErrorCode::InvalidArgument, "task_id must not be empty"};
    }
    if (!(task.timeout.count() > 0.0) || !std::isfinite(task.timeout.count())) {
        return Error{ErrorCode::InvalidArgument,
                     std::format("task '{}': timeout must be positive and finite", task.task_id)};
    }
    if (status() == WorkflowStatus::Running) {
        return Error{ErrorCode::InvalidState,
                     std::format("cannot add task '{}' while workflow '{}' is running",
                                 task.task_id, id_)};
    }
    if (tasks_.contains(task.task_id)) {
        return Error{ErrorCode::DuplicateId,
                     std::format("task '{}' already exists in workflow '{}'", task.task_id, id_)};
    }
    auto id = task.task_id;
    tasks_.emplace(std::move(id), std::move(task));
    return {};
}

// ─────────────────────────────────────────────
// Cycle Detection
// ─────────────────────────────────────────────

Result<void> Workflow::validate_dag() const {
    enum class Color : uint8_t { White, Gray, Black };
    std::unordered_map<TaskId, Color> color;
    color.reserve(tasks_.size());
    for (const auto& [id, _] : tasks_) {
        color[id] = Color::White;
    }

    struct Frame {
        const Task* task;
        size_t dep_idx;
    };

    // Sorted roots keep the reported cycle stable across runs.
    for (const auto& start_id : sorted_task_ids()) {
        if (color[start_id] != Color::White) continue;

        std::vector<Frame> path;
        path.push_back({&tasks_.at(start_id), 0});
        color[start_id] = Color::Gray;

        while (!path.empty()) {
            Frame& top = path.back();
            const auto& deps = top.task->dependencies;

            if (top.dep_idx >= deps.size()) {
                color[top.task->task_id] = Color::Black;
                path.pop_back();
                continue;
            }

            const TaskId& dep = deps[top.dep_idx++];
            auto dep_it = tasks_.find(dep);
            if (dep_it == tasks_.end()) continue;

            Color& dep_color = color[dep];
            if (dep_color == Color::Gray) {
                auto first = std::find_if(path.begin(), path.end(),
                    [&](const Frame& f) { return f.task->task_id == dep; });
                std::string cycle;
                for (auto it = first; it != path.end(); ++it) {
                    cycle += it->task->task_id;
                    cycle += " -> ";
                }
                cycle += dep;
                return Error{ErrorCode::CycleDetected,
                             std::format("dependency cycle detected at task '{}': {}", dep, cycle)};
            }
            if (dep_color == Color::White) {
                dep_color = Color::Gray;
                path.push_back({&dep_it->second, 0});
            }
        }
    }

    return {};
}

// ─────────────────────────────────────────────
// Ready Tasks
// ─────────────────────────────────────────────

std::vector<Task*> Workflow::get_ready_tasks(const std::unordered_set<TaskId>& completed_ids) {
    std::vector<Task*> ready;
    for (auto& [id, task] : tasks_) {
        if (task.is_ready(completed_ids)) {
            ready.push_back(&task);
        }
    }
    return ready;
}

// ─────────────────────────────────────────────
// Static Wave Plan
// ─────────────────────────────────────────────

std::vector<std::vector<TaskId>> Workflow::plan_waves() const {
    if (!validate_dag()) return {};

    // Tasks that can never run because a transitive dependency is missing.
    std::unordered_set<TaskId> blocked;
    for (const auto& missing : missing_dependencies()) {
        blocked.insert(missing.task_id);
    }
    bool changed = !blocked.empty();
    while (changed) {
        changed = false;
        for (const auto& [id, task] : tasks_) {
            if (blocked.contains(id)) continue;
            for (const auto& dep : task.dependencies) {
                if (blocked.contains(dep)) {
                    blocked.insert(id);
                    changed = true;
                    break;
                }
            }
        }
    }

    // Kahn's algorithm, one layer at a time.
    std::unordered_map<TaskId, size_t> remaining;
    std::unordered_map<TaskId, std::vector<TaskId>> dependents;
    for (const auto& [id, task] : tasks_) {
        if (blocked.contains(id)) continue;
        remaining[id] = task.dependencies.size();
        for (const auto& dep : task.dependencies) {
            dependents[dep].push_back(id);
        }
    }

    std::vector<TaskId> layer;
    for (const auto& [id, count] : remaining) {
        if (count == 0) layer.push_back(id);
    }

    std::vector<std::vector<TaskId>> waves;
    while (!layer.empty()) {
        std::sort(layer.begin(), layer.end());
        std::vector<TaskId> next;
        for (const auto& id : layer) {
            auto it = dependents.find(id);
            if (it == dependents.end()) continue;
            for (const auto& child : it->second) {
                if (--remaining[child] == 0) {
                    next.push_back(child);
                }
            }
        }
        waves.push_back(std::move(layer));
        layer = std::move(next);
    }
    return waves;
}

std::vector<MissingDependency> Workflow::missing_dependencies() const {
    std::vector<MissingDependency> missing;
    for (const auto& id : sorted_task_ids()) {
        for (const auto& dep : tasks_.at(id).dependencies) {
            if (!tasks_.contains(dep)) {
                missing.push_back({id, dep});
            }
        }
    }
    return missing;
}

// ─────────────────────────────────────────────
// Lookup
// ─────────────────────────────────────────────

Task* Workflow::find_task(const TaskId& id) {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

const Task* Workflow::find_task(const TaskId& id) const {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

std::vector<TaskId> Workflow::sorted_task_ids() const {
    std::vector<TaskId> ids;
    ids.reserve(tasks_.size());
    for (const auto& [id, _] : tasks_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace dag_scheduler
