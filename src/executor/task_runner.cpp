/**
 * @file task_runner.cpp
 * @brief TaskRunner implementation with per-attempt deadline enforcement.
 */

#include "executor/task_runner.hpp"

#include <chrono>
#include <exception>
#include <format>
#include <future>
#include <memory>
#include <thread>

namespace dag_scheduler {

namespace {

// Owned jointly by the caller and the worker, so a detached worker never
// touches the caller's stack.
struct AttemptState {
    TaskFunction function;
    AttemptRequest request;
    std::promise<Value> promise;
};

// Longer deadlines overflow steady_clock's tick count; treat them as unbounded.
constexpr Seconds kLongestDeadline = std::chrono::hours(24 * 365 * 100);

}  // anonymous namespace

std::string timeout_message(Seconds timeout) {
    return std::format("timed out after {}s", timeout.count());
}

AttemptOutcome TaskRunner::execute(const TaskFunction& function,
                                   AttemptRequest request,
                                   std::stop_token cancel) {
    auto start = std::chrono::steady_clock::now();
    auto timeout = request.timeout;

    auto state = std::make_shared<AttemptState>();
    state->function = function;
    state->request = std::move(request);
    auto future = state->promise.get_future();

    std::jthread worker([state](std::stop_token stop) {
        const auto& req = state->request;
        TaskContext ctx{req.task_id, req.attempt, req.args, req.kwargs, stop};
        try {
            state->promise.set_value(state->function(ctx));
        } catch (...) {
            state->promise.set_exception(std::current_exception());
        }
    });

    std::stop_callback forward_cancel(cancel, [stop = worker.get_stop_source()]() mutable {
        stop.request_stop();
    });

    auto wait_status = std::future_status::ready;
    if (timeout < kLongestDeadline) {
        wait_status = future.wait_for(
            std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout));
    } else {
        future.wait();
    }

    AttemptOutcome outcome;

    if (wait_status == std::future_status::timeout) {
        worker.request_stop();
        worker.detach();
        outcome.final_status = TaskStatus::Failed;
        outcome.error = timeout_message(timeout);
        outcome.timed_out = true;
    } else {
        worker.join();
        try {
            outcome.result = future.get();
            outcome.final_status = TaskStatus::Completed;
        } catch (const std::exception& e) {
            outcome.final_status = TaskStatus::Failed;
            outcome.error = e.what();
        } catch (...) {
            outcome.final_status = TaskStatus::Failed;
            outcome.error = "unknown exception";
        }
    }

    outcome.actual_duration = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - start);
    return outcome;
}

}  // namespace dag_scheduler
