/**
 * @file test_workflow.cpp
 * @brief Unit tests for Workflow: construction, cycle detection, wave plan.
 */

#include "workflow/workflow.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <limits>

using namespace dag_scheduler;

namespace {

Task make_task(TaskId id, std::vector<TaskId> deps = {}) {
    return Task{
        .task_id = std::move(id),
        .name = "task",
        .work = std::string{"noop"},
        .dependencies = std::move(deps)
    };
}

void add_all(Workflow& wf, std::vector<Task> tasks) {
    for (auto& t : tasks) {
        ASSERT_TRUE(wf.add_task(std::move(t)).has_value());
    }
}

std::vector<TaskId> ids(const std::vector<Task*>& tasks) {
    std::vector<TaskId> out;
    for (const auto* t : tasks) out.push_back(t->task_id);
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace

// ─── Construction ────────────────────────────

TEST(WorkflowTest, Identity) {
    Workflow wf("wf-1", "Nightly", "desc", {{"owner", "ops"}});
    EXPECT_EQ(wf.id(), "wf-1");
    EXPECT_EQ(wf.name(), "Nightly");
    EXPECT_EQ(wf.description(), "desc");
    EXPECT_EQ(wf.metadata().at("owner"), "ops");
    EXPECT_EQ(wf.status(), WorkflowStatus::Pending);
    EXPECT_FALSE(wf.start_time().has_value());
    EXPECT_EQ(wf.task_count(), 0u);
}

TEST(WorkflowTest, AddTask) {
    Workflow wf("wf", "wf");
    ASSERT_TRUE(wf.add_task(make_task("a")).has_value());
    EXPECT_EQ(wf.task_count(), 1u);
    ASSERT_NE(wf.find_task("a"), nullptr);
    EXPECT_EQ(wf.find_task("missing"), nullptr);
}

TEST(WorkflowTest, DuplicateTaskRejected) {
    Workflow wf("wf", "wf");
    ASSERT_TRUE(wf.add_task(make_task("a")).has_value());
    auto result = wf.add_task(make_task("a"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DuplicateId);
    EXPECT_EQ(wf.task_count(), 1u);
}

TEST(WorkflowTest, EmptyIdRejected) {
    Workflow wf("wf", "wf");
    auto result = wf.add_task(make_task(""));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST(WorkflowTest, NonPositiveTimeoutRejected) {
    Workflow wf("wf", "wf");
    auto task = make_task("a");
    task.timeout = Seconds{0.0};
    auto result = wf.add_task(std::move(task));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST(WorkflowTest, NonFiniteTimeoutRejected) {
    Workflow wf("wf", "wf");
    for (double bad : {std::numeric_limits<double>::infinity(),
                       std::numeric_limits<double>::quiet_NaN()}) {
        auto task = make_task("a");
        task.timeout = Seconds{bad};
        auto result = wf.add_task(std::move(task));
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    }
    EXPECT_EQ(wf.task_count(), 0u);
}

TEST(WorkflowTest, AddWhileRunningRejected) {
    Workflow wf("wf", "wf");
    wf.set_status(WorkflowStatus::Running);
    auto result = wf.add_task(make_task("a"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidState);
}

// ─── Cycle Detection ─────────────────────────

TEST(WorkflowTest, AcyclicValidates) {
    Workflow wf("wf", "wf");
    add_all(wf, {make_task("a"), make_task("b", {"a"}), make_task("c", {"a", "b"})});
    EXPECT_TRUE(wf.validate_dag().has_value());
}

TEST(WorkflowTest, ThreeNodeCycleDetected) {
    Workflow wf("wf", "wf");
    add_all(wf, {make_task("A", {"C"}), make_task("B", {"A"}), make_task("C", {"B"})});

    auto result = wf.validate_dag();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::CycleDetected);

    const auto& msg = result.error().message;
    bool names_member = msg.find("'A'") != std::string::npos
                     || msg.find("'B'") != std::string::npos
                     || msg.find("'C'") != std::string::npos;
    EXPECT_TRUE(names_member) << msg;
}

TEST(WorkflowTest, SelfLoopDetected) {
    Workflow wf("wf", "wf");
    add_all(wf, {make_task("solo", {"solo"})});
    auto result = wf.validate_dag();
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("solo"), std::string::npos);
}

TEST(WorkflowTest, CycleBehindAcyclicPrefix) {
    Workflow wf("wf", "wf");
    add_all(wf, {make_task("a"), make_task("b", {"a", "d"}), make_task("c", {"b"}),
                 make_task("d", {"c"})});
    EXPECT_FALSE(wf.validate_dag().has_value());
}

TEST(WorkflowTest, MissingDependencyIsNotACycle) {
    Workflow wf("wf", "wf");
    add_all(wf, {make_task("a", {"ghost"})});
    EXPECT_TRUE(wf.validate_dag().has_value());

    auto missing = wf.missing_dependencies();
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0], (MissingDependency{"a", "ghost"}));
}

// ─── Ready Tasks ─────────────────────────────

TEST(WorkflowTest, ReadyTasksFollowCompletion) {
    Workflow wf("wf", "wf");
    add_all(wf, {make_task("a"), make_task("b"), make_task("c", {"a", "b"})});

    EXPECT_EQ(ids(wf.get_ready_tasks({})), (std::vector<TaskId>{"a", "b"}));

    wf.find_task("a")->status = TaskStatus::Completed;
    wf.find_task("b")->status = TaskStatus::Completed;
    EXPECT_EQ(ids(wf.get_ready_tasks({"a"})), std::vector<TaskId>{});
    EXPECT_EQ(ids(wf.get_ready_tasks({"a", "b"})), std::vector<TaskId>{"c"});
}

// ─── Wave Plan ───────────────────────────────

TEST(WorkflowTest, PlanWavesDiamond) {
    Workflow wf("wf", "wf");
    add_all(wf, {make_task("A"), make_task("B", {"A"}), make_task("C", {"A"}),
                 make_task("D", {"B", "C"})});

    auto waves = wf.plan_waves();
    ASSERT_EQ(waves.size(), 3u);
    EXPECT_EQ(waves[0], std::vector<TaskId>{"A"});
    EXPECT_EQ(waves[1], (std::vector<TaskId>{"B", "C"}));
    EXPECT_EQ(waves[2], std::vector<TaskId>{"D"});
}

TEST(WorkflowTest, PlanWavesEmptyOnCycle) {
    Workflow wf("wf", "wf");
    add_all(wf, {make_task("a", {"b"}), make_task("b", {"a"})});
    EXPECT_TRUE(wf.plan_waves().empty());
}

TEST(WorkflowTest, PlanWavesExcludesBlockedTasks) {
    Workflow wf("wf", "wf");
    add_all(wf, {make_task("a"), make_task("b", {"ghost"}), make_task("c", {"b"})});

    auto waves = wf.plan_waves();
    ASSERT_EQ(waves.size(), 1u);
    EXPECT_EQ(waves[0], std::vector<TaskId>{"a"});
}

TEST(WorkflowTest, SortedTaskIds) {
    Workflow wf("wf", "wf");
    add_all(wf, {make_task("c"), make_task("a"), make_task("b")});
    EXPECT_EQ(wf.sorted_task_ids(), (std::vector<TaskId>{"a", "b", "c"}));
}
