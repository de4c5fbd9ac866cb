/**
 * @file types.cpp
 * @brief Value rendering helpers.
 */

#include "core/types.hpp"

#include <format>
#include <type_traits>

namespace dag_scheduler {

std::string to_string(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "none";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return std::format("{}", v);
        }
    }, value);
}

}  // namespace dag_scheduler
