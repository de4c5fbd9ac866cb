/**
 * @file definition_loader.hpp
 * @brief Declarative workflow definitions in TOML.
 *
 * Format:
 *
 *   [workflow]
 *   id = "nightly-etl"
 *   name = "Nightly ETL"
 *   description = "..."
 *   [workflow.metadata]
 *   owner = "data-team"
 *
 *   [[tasks]]
 *   id = "extract"
 *   function = "extract_rows"      # registry key
 *   dependencies = []
 *   args = ["s3://bucket", 3]
 *   max_retries = 2
 *   timeout = 30.0                 # seconds
 *   [tasks.kwargs]
 *   batch = 500
 *
 * Tasks defined here always reference functions by name.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "workflow/workflow.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dag_scheduler {

class Scheduler;

struct TaskDefinition {
    TaskId id;
    std::string name;
    std::string function;
    std::vector<TaskId> dependencies;
    Args args;
    Kwargs kwargs;
    Metadata metadata;
    std::optional<uint32_t> max_retries;    ///< Engine default when absent
    std::optional<Seconds> timeout;         ///< Engine default when absent
};

struct WorkflowDefinition {
    WorkflowId id;
    std::string name;
    std::string description;
    Metadata metadata;
    std::vector<TaskDefinition> tasks;
};

Result<WorkflowDefinition> parse_workflow_definition(std::string_view toml_text);
Result<WorkflowDefinition> load_workflow_definition(const std::filesystem::path& path);

/// Build the Task a definition describes, filling gaps from `defaults`.
Task make_task(const TaskDefinition& definition, const EngineConfig& defaults);

/**
 * @brief Create the workflow in `scheduler` and add every defined task.
 *
 * On a task error the half-built workflow is removed again.
 */
Result<std::shared_ptr<Workflow>> instantiate_workflow(Scheduler& scheduler,
                                                       const WorkflowDefinition& definition);

}  // namespace dag_scheduler
