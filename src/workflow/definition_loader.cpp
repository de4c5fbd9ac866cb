/**
 * @file definition_loader.cpp
 * @brief TOML workflow definitions using toml++.
 */

#include "workflow/definition_loader.hpp"
#include "scheduler/scheduler.hpp"

#include <cmath>
#include <format>
#include <fstream>
#include <sstream>

#include <toml++/toml.hpp>

namespace dag_scheduler {

namespace {

Result<Value> to_value(const toml::node& node, std::string_view where) {
    if (auto v = node.as_boolean())         return Value{v->get()};
    if (auto v = node.as_integer())         return Value{v->get()};
    if (auto v = node.as_floating_point())  return Value{v->get()};
    if (auto v = node.as_string())          return Value{v->get()};
    return Error{ErrorCode::InvalidArgument,
                 std::format("{}: only booleans, integers, floats and strings are supported", where)};
}

Result<Metadata> read_metadata(const toml::node_view<const toml::node>& node, std::string_view where) {
    Metadata metadata;
    if (!node) return metadata;
    const auto* table = node.as_table();
    if (!table) {
        return Error{ErrorCode::InvalidArgument, std::format("{} must be a table", where)};
    }
    for (const auto& [key, value] : *table) {
        auto text = value.value<std::string>();
        if (!text) {
            return Error{ErrorCode::InvalidArgument,
                         std::format("{}.{} must be a string", where, key.str())};
        }
        metadata.emplace(std::string{key.str()}, std::move(*text));
    }
    return metadata;
}

Result<TaskDefinition> read_task(const toml::table& tbl, size_t index) {
    TaskDefinition def;
    auto where = std::format("tasks[{}]", index);

    auto id = tbl["id"].value<std::string>();
    if (!id || id->empty()) {
        return Error{ErrorCode::InvalidArgument, where + ": missing 'id'"};
    }
    def.id = std::move(*id);
    where = std::format("task '{}'", def.id);

    auto function = tbl["function"].value<std::string>();
    if (!function || function->empty()) {
        return Error{ErrorCode::InvalidArgument, where + ": missing 'function'"};
    }
    def.function = std::move(*function);
    def.name = tbl["name"].value_or(def.id);

    if (auto deps = tbl["dependencies"]; deps) {
        const auto* arr = deps.as_array();
        if (!arr) {
            return Error{ErrorCode::InvalidArgument, where + ": 'dependencies' must be an array"};
        }
        for (const auto& dep : *arr) {
            auto dep_id = dep.value<std::string>();
            if (!dep_id) {
                return Error{ErrorCode::InvalidArgument, where + ": dependencies must be strings"};
            }
            def.dependencies.push_back(std::move(*dep_id));
        }
    }

    if (auto args = tbl["args"]; args) {
        const auto* arr = args.as_array();
        if (!arr) {
            return Error{ErrorCode::InvalidArgument, where + ": 'args' must be an array"};
        }
        for (size_t i = 0; i < arr->size(); ++i) {
            auto value = to_value((*arr)[i], std::format("{} args[{}]", where, i));
            if (!value) return value.error();
            def.args.push_back(std::move(*value));
        }
    }

    if (auto kwargs = tbl["kwargs"]; kwargs) {
        const auto* table = kwargs.as_table();
        if (!table) {
            return Error{ErrorCode::InvalidArgument, where + ": 'kwargs' must be a table"};
        }
        for (const auto& [key, node] : *table) {
            auto value = to_value(node, std::format("{} kwargs.{}", where, key.str()));
            if (!value) return value.error();
            def.kwargs.emplace(std::string{key.str()}, std::move(*value));
        }
    }

    auto metadata = read_metadata(tbl["metadata"], where + " metadata");
    if (!metadata) return metadata.error();
    def.metadata = std::move(*metadata);

    if (auto retries = tbl["max_retries"].value<int64_t>()) {
        if (*retries < 0) {
            return Error{ErrorCode::InvalidArgument, where + ": max_retries must be >= 0"};
        }
        def.max_retries = static_cast<uint32_t>(*retries);
    }

    if (auto timeout = tbl["timeout"].value<double>()) {
        if (!(*timeout > 0.0) || !std::isfinite(*timeout)) {
            return Error{ErrorCode::InvalidArgument, where + ": timeout must be positive and finite"};
        }
        def.timeout = Seconds{*timeout};
    }

    return def;
}

Result<WorkflowDefinition> from_table(const toml::table& tbl) {
    WorkflowDefinition def;

    const auto* workflow = tbl["workflow"].as_table();
    if (!workflow) {
        return Error{ErrorCode::InvalidArgument, "missing [workflow] table"};
    }

    auto id = (*workflow)["id"].value<std::string>();
    if (!id || id->empty()) {
        return Error{ErrorCode::InvalidArgument, "[workflow] is missing 'id'"};
    }
    def.id = std::move(*id);
    def.name = (*workflow)["name"].value_or(def.id);
    def.description = (*workflow)["description"].value_or(std::string{});

    auto metadata = read_metadata((*workflow)["metadata"], "workflow.metadata");
    if (!metadata) return metadata.error();
    def.metadata = std::move(*metadata);

    if (auto tasks = tbl["tasks"]; tasks) {
        const auto* arr = tasks.as_array();
        if (!arr || !arr->is_array_of_tables()) {
            return Error{ErrorCode::InvalidArgument, "'tasks' must be an array of tables ([[tasks]])"};
        }
        for (size_t i = 0; i < arr->size(); ++i) {
            auto task = read_task(*(*arr)[i].as_table(), i);
            if (!task) return task.error();
            def.tasks.push_back(std::move(*task));
        }
    }

    return def;
}

}  // anonymous namespace

Result<WorkflowDefinition> parse_workflow_definition(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<WorkflowDefinition> load_workflow_definition(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::IoError, "Workflow definition not readable: " + path.string()};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_workflow_definition(buffer.str());
}

Task make_task(const TaskDefinition& definition, const EngineConfig& defaults) {
    return Task{
        .task_id = definition.id,
        .name = definition.name,
        .work = definition.function,
        .args = definition.args,
        .kwargs = definition.kwargs,
        .dependencies = definition.dependencies,
        .metadata = definition.metadata,
        .max_retries = definition.max_retries.value_or(defaults.default_max_retries),
        .timeout = definition.timeout.value_or(Seconds{defaults.default_task_timeout_s})
    };
}

Result<std::shared_ptr<Workflow>> instantiate_workflow(Scheduler& scheduler,
                                                       const WorkflowDefinition& definition) {
    auto created = scheduler.create_workflow(definition.id, definition.name,
                                             definition.description, definition.metadata);
    if (!created) return created.error();
    auto workflow = *created;

    for (const auto& task_def : definition.tasks) {
        if (auto added = workflow->add_task(make_task(task_def, scheduler.config())); !added) {
            if (auto removed = scheduler.remove_workflow(definition.id); !removed) {
                scheduler.logger().warn("could not roll back workflow " + definition.id
                                        + ": " + removed.error().message);
            }
            return added.error();
        }
    }

    scheduler.logger().info(std::format("workflow {} instantiated from definition with {} task(s)",
                                        definition.id, definition.tasks.size()));
    return workflow;
}

}  // namespace dag_scheduler
