/**
 * @file generator.cpp
 * @brief WorkflowGenerator: synthetic DAG topologies.
 */

#include "workflow/generator.hpp"

#include <format>

namespace dag_scheduler {

namespace {

Task make(std::string id, std::string name, const std::string& function,
          std::vector<TaskId> deps = {}) {
    return Task{
        .task_id = std::move(id),
        .name = std::move(name),
        .work = function,
        .dependencies = std::move(deps)
    };
}

}  // anonymous namespace

std::vector<Task> WorkflowGenerator::linear_chain(size_t num_tasks, const std::string& function) {
    std::vector<Task> tasks;
    tasks.reserve(num_tasks);
    for (size_t i = 0; i < num_tasks; ++i) {
        std::vector<TaskId> deps;
        if (i > 0) deps.push_back(std::format("chain_{}", i - 1));
        tasks.push_back(make(std::format("chain_{}", i), std::format("Chain Task {}", i),
                             function, std::move(deps)));
    }
    return tasks;
}

std::vector<Task> WorkflowGenerator::fan_out_fan_in(size_t width, const std::string& function) {
    std::vector<Task> tasks;
    tasks.reserve(width + 2);
    tasks.push_back(make("fan_source", "Source", function));

    std::vector<TaskId> branches;
    for (size_t i = 0; i < width; ++i) {
        auto branch_id = std::format("fan_branch_{}", i);
        tasks.push_back(make(branch_id, std::format("Branch {}", i), function, {"fan_source"}));
        branches.push_back(std::move(branch_id));
    }

    tasks.push_back(make("fan_sink", "Sink", function, std::move(branches)));
    return tasks;
}

std::vector<Task> WorkflowGenerator::diamond(size_t depth, size_t width, const std::string& function) {
    std::vector<Task> tasks;
    TaskId previous;

    for (size_t d = 0; d < depth; ++d) {
        auto hub_id = std::format("hub_{}", d);
        std::vector<TaskId> hub_deps;
        if (!previous.empty()) hub_deps.push_back(previous);
        tasks.push_back(make(hub_id, std::format("Hub {}", d), function, std::move(hub_deps)));

        std::vector<TaskId> branches;
        for (size_t w = 0; w < width; ++w) {
            auto branch_id = std::format("diamond_{}_{}", d, w);
            tasks.push_back(make(branch_id, std::format("Diamond D{} B{}", d, w), function, {hub_id}));
            branches.push_back(std::move(branch_id));
        }

        auto merge_id = std::format("merge_{}", d);
        tasks.push_back(make(merge_id, std::format("Merge {}", d), function, std::move(branches)));
        previous = merge_id;
    }
    return tasks;
}

std::vector<Task> WorkflowGenerator::independent(size_t num_tasks, const std::string& function) {
    std::vector<Task> tasks;
    tasks.reserve(num_tasks);
    for (size_t i = 0; i < num_tasks; ++i) {
        tasks.push_back(make(std::format("task_{}", i), std::format("Task {}", i), function));
    }
    return tasks;
}

std::vector<Task> WorkflowGenerator::random_dag(size_t num_tasks,
                                                float edge_probability,
                                                const std::string& function,
                                                std::mt19937& rng) {
    std::bernoulli_distribution edge(static_cast<double>(edge_probability));
    std::vector<Task> tasks;
    tasks.reserve(num_tasks);

    // Edges only point from lower to higher index, so the result is acyclic.
    for (size_t j = 0; j < num_tasks; ++j) {
        std::vector<TaskId> deps;
        for (size_t i = 0; i < j; ++i) {
            if (edge(rng)) deps.push_back(std::format("rand_{}", i));
        }
        tasks.push_back(make(std::format("rand_{}", j), std::format("Random Task {}", j),
                             function, std::move(deps)));
    }
    return tasks;
}

Result<void> WorkflowGenerator::populate(Workflow& workflow, std::vector<Task> tasks) {
    for (auto& task : tasks) {
        if (auto added = workflow.add_task(std::move(task)); !added) {
            return added.error();
        }
    }
    return {};
}

}  // namespace dag_scheduler
