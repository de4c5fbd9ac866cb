/**
 * @file function_registry.cpp
 * @brief FunctionRegistry implementation.
 */

#include "executor/function_registry.hpp"

#include <format>

namespace dag_scheduler {

void FunctionRegistry::register_function(std::string name, TaskFunction function) {
    std::lock_guard lock(mutex_);
    functions_.insert_or_assign(std::move(name), std::move(function));
}

std::optional<TaskFunction> FunctionRegistry::lookup(std::string_view name) const {
    std::lock_guard lock(mutex_);
    auto it = functions_.find(name);
    if (it == functions_.end()) return std::nullopt;
    return it->second;
}

bool FunctionRegistry::contains(std::string_view name) const {
    std::lock_guard lock(mutex_);
    return functions_.find(name) != functions_.end();
}

size_t FunctionRegistry::size() const {
    std::lock_guard lock(mutex_);
    return functions_.size();
}

std::vector<std::string> FunctionRegistry::names() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    out.reserve(functions_.size());
    for (const auto& [name, _] : functions_) {
        out.push_back(name);
    }
    return out;
}

Result<TaskFunction> resolve_work(const WorkRef& work, const IFunctionResolver& resolver) {
    if (const auto* fn = std::get_if<TaskFunction>(&work)) {
        if (!*fn) {
            return Error{ErrorCode::InvalidArgument, "task has an empty callable"};
        }
        return *fn;
    }

    const auto& name = std::get<std::string>(work);
    auto fn = resolver.lookup(name);
    if (!fn || !*fn) {
        return Error{ErrorCode::NotFound, std::format("function not registered: {}", name)};
    }
    return std::move(*fn);
}

}  // namespace dag_scheduler
