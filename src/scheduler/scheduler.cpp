/**
 * @file scheduler.cpp
 * @brief Scheduler implementation: wave loop, dispatch, retry bookkeeping.
 */

#include "scheduler/scheduler.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <future>
#include <thread>

namespace dag_scheduler {

namespace {

std::ptrdiff_t admission_slots(const EngineConfig& config) {
    return static_cast<std::ptrdiff_t>(std::max<uint32_t>(config.max_concurrent_tasks, 1));
}

size_t dispatch_thread_count(const EngineConfig& config) {
    // Never fewer workers than admission slots, or the pool would lower the bound.
    if (config.dispatch_threads != 0) {
        return std::max<size_t>(config.dispatch_threads, config.max_concurrent_tasks);
    }
    size_t hw = std::thread::hardware_concurrency();
    return std::max<size_t>({hw, config.max_concurrent_tasks, 1});
}

std::string join_ids(const std::vector<Task*>& tasks) {
    std::vector<std::string> ids;
    ids.reserve(tasks.size());
    for (const auto* task : tasks) ids.push_back(task->task_id);
    std::sort(ids.begin(), ids.end());

    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ',';
        out += id;
    }
    return out;
}

Timestamp now() {
    return std::chrono::system_clock::now();
}

std::unique_ptr<ILogSink> or_null_sink(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Scheduler::Scheduler(Options opts)
    : config_(opts.config)
    , logger_(or_null_sink(std::move(opts.log_sink)), opts.log_level)
    , admission_(admission_slots(config_))
    , dispatch_pool_(dispatch_thread_count(config_)) {
    if (config_.max_concurrent_tasks == 0) {
        logger_.warn("max_concurrent_tasks = 0, using 1");
        config_.max_concurrent_tasks = 1;
    }
    logger_.info(std::format("scheduler ready: max_concurrent_tasks={} dispatch_threads={}",
                             config_.max_concurrent_tasks, dispatch_pool_.thread_count()));
}

Scheduler::~Scheduler() {
    logger_.flush();
}

Result<std::unique_ptr<Scheduler>> Scheduler::from_config(const Config& config) {
    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    auto level = parse_log_level(config.logging.log_level);
    if (!level) return level.error();

    auto sink = make_log_sink(config.logging);
    if (!sink) return sink.error();

    return std::make_unique<Scheduler>(Options{
        .config = config.engine,
        .log_sink = std::move(*sink),
        .log_level = *level
    });
}

// ─────────────────────────────────────────────
// Workflow Registry
// ─────────────────────────────────────────────

Result<std::shared_ptr<Workflow>> Scheduler::create_workflow(WorkflowId id,
                                                             std::string name,
                                                             std::string description,
                                                             Metadata metadata) {
    if (id.empty()) {
        return Error{ErrorCode::InvalidArgument, "workflow_id must not be empty"};
    }

    std::shared_ptr<Workflow> workflow;
    {
        std::lock_guard lock(workflows_mutex_);
        if (workflows_.contains(id)) {
            return Error{ErrorCode::DuplicateId,
                         std::format("workflow '{}' already exists", id)};
        }
        workflow = std::make_shared<Workflow>(id, std::move(name), std::move(description),
                                              std::move(metadata));
        workflows_.emplace(id, workflow);
    }

    logger_.info(std::format("workflow created: id={} name={}", workflow->id(), workflow->name()));
    return workflow;
}

std::shared_ptr<Workflow> Scheduler::get_workflow(const WorkflowId& id) const {
    std::lock_guard lock(workflows_mutex_);
    auto it = workflows_.find(id);
    return it == workflows_.end() ? nullptr : it->second;
}

std::optional<WorkflowStatusSnapshot> Scheduler::get_workflow_status(const WorkflowId& id) const {
    auto workflow = get_workflow(id);
    if (!workflow) return std::nullopt;

    std::lock_guard lock(state_mutex_);
    return snapshot_locked(*workflow);
}

std::vector<WorkflowId> Scheduler::list_workflows() const {
    std::vector<WorkflowId> ids;
    {
        std::lock_guard lock(workflows_mutex_);
        ids.reserve(workflows_.size());
        for (const auto& [id, _] : workflows_) ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

Result<void> Scheduler::remove_workflow(const WorkflowId& id) {
    std::lock_guard lock(workflows_mutex_);
    auto it = workflows_.find(id);
    if (it == workflows_.end()) {
        return Error{ErrorCode::NotFound, std::format("workflow not found: {}", id)};
    }
    {
        std::lock_guard state_lock(state_mutex_);
        if (cancel_sources_.contains(id)) {
            return Error{ErrorCode::InvalidState,
                         std::format("workflow '{}' is running and cannot be removed", id)};
        }
    }
    workflows_.erase(it);
    logger_.info(std::format("workflow removed: id={}", id));
    return {};
}

void Scheduler::register_function(std::string name, TaskFunction function) {
    logger_.debug(std::format("function registered: {}", name));
    registry_.register_function(std::move(name), std::move(function));
}

std::vector<RunningTask> Scheduler::running_tasks() const {
    std::lock_guard lock(state_mutex_);
    return std::vector<RunningTask>(running_.begin(), running_.end());
}

// ─────────────────────────────────────────────
// execute_workflow
// ─────────────────────────────────────────────

Result<ExecutionSummary> Scheduler::execute_workflow(const WorkflowId& id) {
    auto workflow = get_workflow(id);
    if (!workflow) {
        return Error{ErrorCode::NotFound, std::format("workflow not found: {}", id)};
    }

    {
        // A cancelled run is no longer RUNNING but may still be draining its wave.
        std::lock_guard lock(state_mutex_);
        if (cancel_sources_.contains(id)) {
            return Error{ErrorCode::InvalidState,
                         std::format("workflow '{}' is already running", id)};
        }
    }

    if (auto valid = workflow->validate_dag(); !valid) {
        {
            std::lock_guard lock(state_mutex_);
            workflow->set_status(WorkflowStatus::Failed);
            workflow->set_end_time(now());
        }
        logger_.error(std::format("workflow {} rejected: {}", id, valid.error().message));
        return valid.error();
    }

    for (const auto& missing : workflow->missing_dependencies()) {
        logger_.warn(std::format("workflow {}: task '{}' depends on unknown task '{}' and will never run",
                                 id, missing.task_id, missing.dependency));
    }

    if (logger_.enabled(LogLevel::Debug)) {
        auto plan = workflow->plan_waves();
        for (size_t i = 0; i < plan.size(); ++i) {
            std::string ids;
            for (const auto& task_id : plan[i]) {
                if (!ids.empty()) ids += ',';
                ids += task_id;
            }
            logger_.debug(std::format("workflow {} planned wave {}: [{}]", id, i + 1, ids));
        }
    }

    RunState run;
    std::stop_source cancel;
    {
        std::lock_guard lock(state_mutex_);
        if (cancel_sources_.contains(id)) {
            return Error{ErrorCode::InvalidState,
                         std::format("workflow '{}' is already running", id)};
        }
        prepare_run(*workflow, run);
        workflow->set_status(WorkflowStatus::Running);
        workflow->set_start_time(now());
        workflow->set_end_time(std::nullopt);
        cancel_sources_[id] = cancel;
    }

    logger_.info(std::format("workflow started: id={} tasks={} already_completed={}",
                             id, workflow->task_count(), run.completed_ids.size()));
    auto started = std::chrono::steady_clock::now();

    try {
        run_waves(*workflow, run, cancel.get_token());

        std::lock_guard lock(state_mutex_);
        if (workflow->status() != WorkflowStatus::Cancelled) {
            workflow->set_status(aggregate_status(*workflow, run));
        }
    } catch (const std::exception& e) {
        std::lock_guard lock(state_mutex_);
        workflow->set_status(WorkflowStatus::Failed);
        logger_.error(std::format("workflow {} aborted by engine error: {}", id, e.what()));
    }

    WorkflowStatus final_status;
    {
        std::lock_guard lock(state_mutex_);
        if (workflow->status() != WorkflowStatus::Cancelled || !workflow->end_time()) {
            workflow->set_end_time(now());
        }
        cancel_sources_.erase(id);
        final_status = workflow->status();
    }

    ExecutionSummary summary{
        .workflow_id = id,
        .status = final_status,
        .completed_tasks = run.completed_ids.size(),
        .failed_tasks = run.permanently_failed_ids.size(),
        .total_tasks = workflow->task_count(),
        .execution_time = std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - started),
        .waves = run.waves
    };

    auto line = std::format("workflow finished: id={} status={} completed={} failed={} total={} waves={} elapsed_us={}",
                            id, to_string(summary.status), summary.completed_tasks,
                            summary.failed_tasks, summary.total_tasks, summary.waves,
                            summary.execution_time.count());
    if (summary.status == WorkflowStatus::Completed) {
        logger_.info(line);
    } else {
        logger_.warn(line);
    }
    return summary;
}

// Re-running a workflow resumes it: completed tasks keep their results and
// count as satisfied dependencies, everything else starts over.
void Scheduler::prepare_run(Workflow& workflow, RunState& run) {
    for (auto& [task_id, task] : workflow.tasks()) {
        if (task.status == TaskStatus::Completed) {
            run.completed_ids.insert(task_id);
        } else {
            task.reset_runtime_state();
        }
    }
}

void Scheduler::run_waves(Workflow& workflow, RunState& run, std::stop_token cancel) {
    while (!cancel.stop_requested()) {
        std::vector<Task*> wave;
        {
            std::lock_guard lock(state_mutex_);
            wave = workflow.get_ready_tasks(run.completed_ids);
            for (auto* task : wave) {
                task->status = TaskStatus::Ready;
            }
        }
        if (wave.empty()) break;

        ++run.waves;
        logger_.debug(std::format("workflow {} wave {}: dispatching {} task(s) [{}]",
                                  workflow.id(), run.waves, wave.size(), join_ids(wave)));

        std::vector<std::future<void>> joins;
        joins.reserve(wave.size());
        for (auto* task : wave) {
            joins.push_back(dispatch_pool_.submit([this, &workflow, task, cancel] {
                execute_task(workflow, *task, cancel);
            }));
        }

        // Barrier: every attempt must finish before results are read.
        for (auto& join : joins) join.wait();
        for (auto& join : joins) join.get();

        settle_wave(workflow, wave, run);
    }
}

void Scheduler::settle_wave(Workflow& workflow, const std::vector<Task*>& wave, RunState& run) {
    std::vector<std::string> notes;
    {
        std::lock_guard lock(state_mutex_);
        for (auto* task : wave) {
            switch (task->status) {
                case TaskStatus::Completed:
                    run.completed_ids.insert(task->task_id);
                    break;
                case TaskStatus::Failed:
                    if (task->can_retry()) {
                        ++task->retry_count;
                        notes.push_back(std::format("task {}/{} will retry ({}/{}): {}",
                            workflow.id(), task->task_id, task->retry_count, task->max_retries,
                            task->error.value_or("")));
                        task->status = TaskStatus::Pending;
                        task->error.reset();
                    } else {
                        run.permanently_failed_ids.insert(task->task_id);
                        notes.push_back(std::format("task {}/{} permanently failed after {} retries: {}",
                            workflow.id(), task->task_id, task->retry_count,
                            task->error.value_or("")));
                    }
                    break;
                default:
                    // Cancelled, or left Ready/Pending because cancellation
                    // arrived before the attempt was admitted.
                    break;
            }
        }
    }
    for (const auto& note : notes) {
        logger_.warn(note);
    }
}

WorkflowStatus Scheduler::aggregate_status(const Workflow& workflow, const RunState& run) const {
    bool all_completed = std::all_of(workflow.tasks().begin(), workflow.tasks().end(),
        [](const auto& entry) { return entry.second.status == TaskStatus::Completed; });
    if (all_completed) return WorkflowStatus::Completed;
    if (!run.permanently_failed_ids.empty()) return WorkflowStatus::Failed;
    // Only tasks stuck behind unknown dependencies remain.
    return WorkflowStatus::Completed;
}

// ─────────────────────────────────────────────
// execute_task (one attempt)
// ─────────────────────────────────────────────

void Scheduler::execute_task(Workflow& workflow, Task& task, std::stop_token cancel) {
    admission_.acquire();
    struct SlotGuard {
        std::counting_semaphore<>& sem;
        ~SlotGuard() { sem.release(); }
    } slot{admission_};

    const RunningTask key{workflow.id(), task.task_id};
    WorkRef work;
    AttemptRequest request;
    {
        std::lock_guard lock(state_mutex_);
        if (cancel.stop_requested()) {
            task.status = TaskStatus::Pending;
            return;
        }
        task.status = TaskStatus::Running;
        task.start_time = now();
        task.end_time.reset();
        task.result.reset();
        task.error.reset();
        running_.insert(key);

        work = task.work;
        request = AttemptRequest{
            .task_id = task.task_id,
            .attempt = task.retry_count + 1,
            .args = task.args,
            .kwargs = task.kwargs,
            .timeout = task.timeout
        };
    }

    AttemptOutcome outcome;
    try {
        logger_.debug(std::format("task {}/{} running: function={} attempt={}",
                                  workflow.id(), task.task_id, task.work_name(), request.attempt));

        auto function = resolve_work(work, registry_);
        if (!function) {
            outcome.final_status = TaskStatus::Failed;
            outcome.error = function.error().message;
        } else {
            outcome = runner_.execute(*function, std::move(request), cancel);
        }
    } catch (const std::exception& e) {
        // The attempt must still be settled below, or the task stays RUNNING.
        outcome = AttemptOutcome{};
        outcome.final_status = TaskStatus::Failed;
        outcome.error = std::format("engine error: {}", e.what());
    }

    bool cancelled = false;
    {
        std::lock_guard lock(state_mutex_);
        task.end_time = now();
        running_.erase(key);
        if (task.status == TaskStatus::Cancelled) {
            cancelled = true;
        } else if (outcome.final_status == TaskStatus::Completed) {
            task.status = TaskStatus::Completed;
            task.result = std::move(outcome.result);
        } else {
            task.status = TaskStatus::Failed;
            task.error = outcome.error.value_or("unknown error");
        }
    }

    if (cancelled) {
        logger_.info(std::format("task {}/{} finished after cancellation, outcome discarded",
                                 workflow.id(), task.task_id));
    } else if (outcome.final_status == TaskStatus::Completed) {
        logger_.debug(std::format("task {}/{} completed in {}us",
                                  workflow.id(), task.task_id, outcome.actual_duration.count()));
    } else if (outcome.timed_out) {
        logger_.warn(std::format("task {}/{} {}", workflow.id(), task.task_id,
                                 outcome.error.value_or("timed out")));
    } else {
        logger_.warn(std::format("task {}/{} failed: {}", workflow.id(), task.task_id,
                                 outcome.error.value_or("unknown error")));
    }
}

// ─────────────────────────────────────────────
// Cancellation
// ─────────────────────────────────────────────

bool Scheduler::cancel_workflow(const WorkflowId& id) {
    auto workflow = get_workflow(id);
    if (!workflow) return false;

    std::stop_source cancel{std::nostopstate};
    size_t marked = 0;
    {
        std::lock_guard lock(state_mutex_);
        if (workflow->status() != WorkflowStatus::Running) return false;

        auto stamp = now();
        workflow->set_status(WorkflowStatus::Cancelled);
        workflow->set_end_time(stamp);
        for (auto& [task_id, task] : workflow->tasks()) {
            if (task.status == TaskStatus::Running) {
                task.status = TaskStatus::Cancelled;
                task.error = "cancelled";
                task.end_time = stamp;
                ++marked;
            }
        }
        if (auto it = cancel_sources_.find(id); it != cancel_sources_.end()) {
            cancel = it->second;
        }
    }

    // Outside the lock: stop callbacks run synchronously.
    if (cancel.stop_possible()) {
        cancel.request_stop();
    }
    logger_.warn(std::format("workflow cancelled: id={} running_tasks_marked={}", id, marked));
    return true;
}

// ─────────────────────────────────────────────
// Snapshots
// ─────────────────────────────────────────────

WorkflowStatusSnapshot Scheduler::snapshot_locked(const Workflow& workflow) const {
    WorkflowStatusSnapshot snap{
        .workflow_id = workflow.id(),
        .name = workflow.name(),
        .status = workflow.status(),
        .created_time = workflow.created_time(),
        .start_time = workflow.start_time(),
        .end_time = workflow.end_time(),
        .total_tasks = workflow.task_count()
    };

    for (const auto& task_id : workflow.sorted_task_ids()) {
        const Task& task = *workflow.find_task(task_id);
        switch (task.status) {
            case TaskStatus::Completed: ++snap.completed_tasks; break;
            case TaskStatus::Failed:    ++snap.failed_tasks; break;
            case TaskStatus::Running:   ++snap.running_tasks; break;
            case TaskStatus::Pending:
            case TaskStatus::Ready:     ++snap.pending_tasks; break;
            default: break;
        }
        snap.tasks.push_back(TaskSnapshot{
            .task_id = task.task_id,
            .name = task.name,
            .status = task.status,
            .retry_count = task.retry_count,
            .max_retries = task.max_retries,
            .result = task.result,
            .error = task.error,
            .start_time = task.start_time,
            .end_time = task.end_time
        });
    }
    return snap;
}

}  // namespace dag_scheduler
