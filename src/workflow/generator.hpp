/**
 * @file generator.hpp
 * @brief Synthetic workflow shapes for testing and benchmarking.
 */

#pragma once

#include "core/result.hpp"
#include "workflow/task.hpp"
#include "workflow/workflow.hpp"

#include <random>
#include <string>
#include <vector>

namespace dag_scheduler {

/**
 * @brief Factory for task sets with common DAG topologies.
 *
 * Every generated task references `function` by registry name.
 */
class WorkflowGenerator {
public:
    /// Linear chain: T1 → T2 → ... → Tn
    static std::vector<Task> linear_chain(size_t num_tasks, const std::string& function);

    /// Fan-out / fan-in: source → {branch_0..branch_w-1} → sink
    static std::vector<Task> fan_out_fan_in(size_t width, const std::string& function);

    /// Repeated fan-out/fan-in, one hub and one merge task per depth level
    static std::vector<Task> diamond(size_t depth, size_t width, const std::string& function);

    /// `num_tasks` tasks with no dependencies; a single wave
    static std::vector<Task> independent(size_t num_tasks, const std::string& function);

    /// Random DAG: edge i → j (i < j) with the given probability
    static std::vector<Task> random_dag(size_t num_tasks,
                                        float edge_probability,
                                        const std::string& function,
                                        std::mt19937& rng);

    /// Add every task to `workflow`, stopping at the first error.
    static Result<void> populate(Workflow& workflow, std::vector<Task> tasks);
};

}  // namespace dag_scheduler
