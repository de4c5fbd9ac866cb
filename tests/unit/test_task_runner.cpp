/**
 * @file test_task_runner.cpp
 * @brief Unit tests for TaskRunner deadline and exception handling.
 */

#include "executor/task_runner.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <thread>

using namespace dag_scheduler;
using namespace std::chrono_literals;

namespace {

AttemptRequest request(Seconds timeout = Seconds{5.0}) {
    return AttemptRequest{.task_id = "t", .attempt = 1, .timeout = timeout};
}

}  // namespace

TEST(TaskRunnerTest, ReturnsResult) {
    TaskRunner runner;
    auto outcome = runner.execute([](const TaskContext&) { return Value{int64_t{42}}; }, request());

    EXPECT_EQ(outcome.final_status, TaskStatus::Completed);
    ASSERT_TRUE(outcome.result.has_value());
    EXPECT_EQ(*outcome.result, Value{int64_t{42}});
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_FALSE(outcome.timed_out);
}

TEST(TaskRunnerTest, DeadlineBeyondClockRangeWaitsForCompletion) {
    TaskRunner runner;
    auto fn = [](const TaskContext&) { return Value{std::string{"done"}}; };

    for (auto timeout : {Seconds{1e10}, Seconds{std::numeric_limits<double>::infinity()}}) {
        auto outcome = runner.execute(fn, request(timeout));
        EXPECT_EQ(outcome.final_status, TaskStatus::Completed);
        EXPECT_FALSE(outcome.timed_out);
        EXPECT_EQ(outcome.result, Value{std::string{"done"}});
    }
}

TEST(TaskRunnerTest, PassesArgumentsAndAttempt) {
    TaskRunner runner;
    auto req = request();
    req.task_id = "adder";
    req.attempt = 3;
    req.args = {Value{int64_t{2}}, Value{int64_t{5}}};
    req.kwargs = {{"scale", Value{int64_t{10}}}};

    auto outcome = runner.execute([](const TaskContext& ctx) {
        EXPECT_EQ(ctx.task_id, "adder");
        EXPECT_EQ(ctx.attempt, 3u);
        auto sum = std::get<int64_t>(ctx.args[0]) + std::get<int64_t>(ctx.args[1]);
        return Value{sum * std::get<int64_t>(ctx.kwargs.at("scale"))};
    }, std::move(req));

    ASSERT_EQ(outcome.final_status, TaskStatus::Completed);
    EXPECT_EQ(*outcome.result, Value{int64_t{70}});
}

TEST(TaskRunnerTest, ExceptionBecomesError) {
    TaskRunner runner;
    auto outcome = runner.execute([](const TaskContext&) -> Value {
        throw std::runtime_error("disk on fire");
    }, request());

    EXPECT_EQ(outcome.final_status, TaskStatus::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, "disk on fire");
    EXPECT_FALSE(outcome.timed_out);
}

TEST(TaskRunnerTest, NonStandardExceptionBecomesError) {
    TaskRunner runner;
    auto outcome = runner.execute([](const TaskContext&) -> Value { throw 17; }, request());
    EXPECT_EQ(outcome.final_status, TaskStatus::Failed);
    EXPECT_EQ(outcome.error, "unknown exception");
}

TEST(TaskRunnerTest, TimeoutReturnsPromptly) {
    TaskRunner runner;
    auto start = std::chrono::steady_clock::now();

    auto outcome = runner.execute([](const TaskContext&) {
        std::this_thread::sleep_for(1s);
        return Value{};
    }, request(Seconds{0.05}));

    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, 800ms);
    EXPECT_EQ(outcome.final_status, TaskStatus::Failed);
    EXPECT_TRUE(outcome.timed_out);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_NE(outcome.error->find("timed out"), std::string::npos);
}

TEST(TaskRunnerTest, TimeoutRequestsStop) {
    TaskRunner runner;
    auto observed = std::make_shared<std::atomic<bool>>(false);

    auto outcome = runner.execute([observed](const TaskContext& ctx) {
        while (!ctx.stop_requested()) {
            std::this_thread::sleep_for(1ms);
        }
        observed->store(true);
        return Value{};
    }, request(Seconds{0.02}));

    EXPECT_TRUE(outcome.timed_out);
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!observed->load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_TRUE(observed->load());
}

TEST(TaskRunnerTest, CancelTokenReachesFunction) {
    TaskRunner runner;
    std::stop_source cancel;

    std::jthread canceller([&cancel] {
        std::this_thread::sleep_for(20ms);
        cancel.request_stop();
    });

    auto outcome = runner.execute([](const TaskContext& ctx) -> Value {
        while (!ctx.stop_requested()) {
            std::this_thread::sleep_for(1ms);
        }
        throw std::runtime_error("stopped");
    }, request(), cancel.get_token());

    EXPECT_EQ(outcome.final_status, TaskStatus::Failed);
    EXPECT_EQ(outcome.error, "stopped");
    EXPECT_FALSE(outcome.timed_out);
}

TEST(TaskRunnerTest, TimeoutMessage) {
    EXPECT_EQ(timeout_message(Seconds{0.05}), "timed out after 0.05s");
    EXPECT_EQ(timeout_message(Seconds{2.0}), "timed out after 2s");
}
