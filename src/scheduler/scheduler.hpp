/**
 * @file scheduler.hpp
 * @brief Workflow engine: owns workflows and drives wave-by-wave execution.
 *
 * Execution model:
 *   1. validate the DAG once per run
 *   2. ready = tasks whose dependencies are all COMPLETED
 *   3. dispatch the whole wave, at most max_concurrent_tasks attempts running
 *   4. join the wave, re-queue retryable failures, repeat until nothing is ready
 *   5. derive the workflow status from the final task states
 *
 * A slow task delays the next wave even for tasks that do not depend on it.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/function_registry.hpp"
#include "executor/task_runner.hpp"
#include "executor/thread_pool.hpp"
#include "workflow/workflow.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <set>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace dag_scheduler {

/**
 * @brief Outcome of one execute_workflow() call.
 */
struct ExecutionSummary {
    WorkflowId workflow_id;
    WorkflowStatus status = WorkflowStatus::Pending;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;        ///< Permanently failed
    size_t total_tasks = 0;
    Duration execution_time{0};
    size_t waves = 0;
};

struct TaskSnapshot {
    TaskId task_id;
    std::string name;
    TaskStatus status = TaskStatus::Pending;
    uint32_t retry_count = 0;
    uint32_t max_retries = 0;
    std::optional<Value> result;
    std::optional<std::string> error;
    std::optional<Timestamp> start_time;
    std::optional<Timestamp> end_time;

    bool operator==(const TaskSnapshot&) const = default;
};

/**
 * @brief Point-in-time copy of a workflow's state. Tasks are sorted by id.
 */
struct WorkflowStatusSnapshot {
    WorkflowId workflow_id;
    std::string name;
    WorkflowStatus status = WorkflowStatus::Pending;
    Timestamp created_time;
    std::optional<Timestamp> start_time;
    std::optional<Timestamp> end_time;
    size_t total_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    size_t running_tasks = 0;
    size_t pending_tasks = 0;
    std::vector<TaskSnapshot> tasks;

    bool operator==(const WorkflowStatusSnapshot&) const = default;
};

struct RunningTask {
    WorkflowId workflow_id;
    TaskId task_id;

    auto operator<=>(const RunningTask&) const = default;
};

/**
 * @brief The workflow engine.
 *
 * Constructed explicitly and passed by reference to whatever submits or
 * queries workflows. Several workflows may execute at once from different
 * threads; they share the admission-control bound.
 */
class Scheduler {
public:
    struct Options {
        EngineConfig config;
        std::unique_ptr<ILogSink> log_sink;     ///< nullptr discards logs
        LogLevel log_level = LogLevel::Info;
    };

    explicit Scheduler(Options opts);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// Build a scheduler from a loaded Config, including its log sink.
    static Result<std::unique_ptr<Scheduler>> from_config(const Config& config);

    // ── Workflows ────────────────────────────
    Result<std::shared_ptr<Workflow>> create_workflow(WorkflowId id,
                                                      std::string name,
                                                      std::string description = {},
                                                      Metadata metadata = {});
    [[nodiscard]] std::shared_ptr<Workflow> get_workflow(const WorkflowId& id) const;
    [[nodiscard]] std::optional<WorkflowStatusSnapshot> get_workflow_status(const WorkflowId& id) const;
    [[nodiscard]] std::vector<WorkflowId> list_workflows() const;
    Result<void> remove_workflow(const WorkflowId& id);

    // ── Execution ────────────────────────────
    Result<ExecutionSummary> execute_workflow(const WorkflowId& id);

    /**
     * @brief Mark a running workflow and its running tasks CANCELLED.
     *
     * Stops further waves and requests stop on every in-flight attempt's
     * token. Functions that do not poll their token keep running until they
     * return or hit their deadline; their outcome is then discarded.
     *
     * @return false if the workflow is unknown or not RUNNING.
     */
    bool cancel_workflow(const WorkflowId& id);

    // ── Functions ────────────────────────────
    void register_function(std::string name, TaskFunction function);
    [[nodiscard]] FunctionRegistry& registry() noexcept { return registry_; }

    // ── Introspection ────────────────────────
    [[nodiscard]] std::vector<RunningTask> running_tasks() const;
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] Logger& logger() noexcept { return logger_; }

private:
    struct RunState {
        std::unordered_set<TaskId> completed_ids;
        std::unordered_set<TaskId> permanently_failed_ids;
        size_t waves = 0;
    };

    void prepare_run(Workflow& workflow, RunState& run);
    void run_waves(Workflow& workflow, RunState& run, std::stop_token cancel);
    void execute_task(Workflow& workflow, Task& task, std::stop_token cancel);
    void settle_wave(Workflow& workflow, const std::vector<Task*>& wave, RunState& run);
    [[nodiscard]] WorkflowStatus aggregate_status(const Workflow& workflow, const RunState& run) const;
    [[nodiscard]] WorkflowStatusSnapshot snapshot_locked(const Workflow& workflow) const;

    EngineConfig config_;
    Logger logger_;
    FunctionRegistry registry_;
    TaskRunner runner_;
    std::counting_semaphore<> admission_;

    mutable std::mutex workflows_mutex_;
    std::unordered_map<WorkflowId, std::shared_ptr<Workflow>> workflows_;

    // Guards every task's runtime fields, workflow status/timestamps,
    // the running-set and the per-run cancellation sources.
    mutable std::mutex state_mutex_;
    std::set<RunningTask> running_;
    // One entry per run in flight, cancelled or not, until its wave loop returns.
    std::unordered_map<WorkflowId, std::stop_source> cancel_sources_;

    // Last member: its workers reference everything above.
    ThreadPool dispatch_pool_;
};

}  // namespace dag_scheduler
