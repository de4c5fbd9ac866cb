/**
 * @file function_registry.hpp
 * @brief Name → TaskFunction lookup and work-reference resolution.
 */

#pragma once

#include "core/result.hpp"
#include "workflow/task.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dag_scheduler {

/**
 * @brief Resolves registry keys to callables at dispatch time.
 */
class IFunctionResolver {
public:
    virtual ~IFunctionResolver() = default;

    [[nodiscard]] virtual std::optional<TaskFunction> lookup(std::string_view name) const = 0;
};

/**
 * @brief Thread-safe function registry. Re-registering a name replaces the
 *        previous callable.
 */
class FunctionRegistry : public IFunctionResolver {
public:
    void register_function(std::string name, TaskFunction function);

    [[nodiscard]] std::optional<TaskFunction> lookup(std::string_view name) const override;
    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, TaskFunction, std::less<>> functions_;
};

/**
 * @brief Turn a task's work reference into something callable.
 *
 * Direct handles are returned as is. Names go through `resolver`; an unknown
 * name yields a NotFound error that the Scheduler records on the task.
 */
Result<TaskFunction> resolve_work(const WorkRef& work, const IFunctionResolver& resolver);

}  // namespace dag_scheduler
