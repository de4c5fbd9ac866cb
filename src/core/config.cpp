/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <cmath>
#include <format>

#include <toml++/toml.hpp>

namespace dag_scheduler {

namespace {

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // [engine]
    if (auto engine = tbl["engine"]; engine.is_table()) {
        int64_t max_concurrent = engine["max_concurrent_tasks"].value_or(int64_t{10});
        if (max_concurrent < 1) {
            return Error{ErrorCode::InvalidArgument,
                         std::format("engine.max_concurrent_tasks must be >= 1, got {}", max_concurrent)};
        }
        config.engine.max_concurrent_tasks = static_cast<uint32_t>(max_concurrent);

        int64_t threads = engine["dispatch_threads"].value_or(int64_t{0});
        if (threads < 0) {
            return Error{ErrorCode::InvalidArgument,
                         std::format("engine.dispatch_threads must be >= 0, got {}", threads)};
        }
        config.engine.dispatch_threads = static_cast<uint32_t>(threads);

        config.engine.default_task_timeout_s =
            engine["default_task_timeout_s"].value_or(300.0);

        int64_t retries = engine["default_max_retries"].value_or(int64_t{0});
        if (retries < 0) {
            return Error{ErrorCode::InvalidArgument,
                         std::format("engine.default_max_retries must be >= 0, got {}", retries)};
        }
        config.engine.default_max_retries = static_cast<uint32_t>(retries);
    }

    // [logging]
    if (auto logging = tbl["logging"]; logging.is_table()) {
        config.logging.sink = logging["sink"].value_or(std::string{"stdout"});
        config.logging.log_dir = logging["log_dir"].value_or(std::string{"./logs"});
        config.logging.log_level = logging["log_level"].value_or(std::string{"info"});

        int64_t max_size = logging["max_file_size_mb"].value_or(int64_t{50});
        if (max_size < 1) {
            return Error{ErrorCode::InvalidArgument,
                         std::format("logging.max_file_size_mb must be >= 1, got {}", max_size)};
        }
        config.logging.max_file_size_mb = static_cast<uint32_t>(max_size);

        int64_t rotate = logging["rotate_count"].value_or(int64_t{5});
        if (rotate < 0) {
            return Error{ErrorCode::InvalidArgument,
                         std::format("logging.rotate_count must be >= 0, got {}", rotate)};
        }
        config.logging.rotate_count = static_cast<uint32_t>(rotate);
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::IoError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ParseError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<void> validate_config(const Config& config) {
    if (config.engine.max_concurrent_tasks == 0) {
        return Error{ErrorCode::InvalidArgument, "engine.max_concurrent_tasks must be >= 1"};
    }
    if (!(config.engine.default_task_timeout_s > 0.0) ||
        !std::isfinite(config.engine.default_task_timeout_s)) {
        return Error{ErrorCode::InvalidArgument,
                     std::format("engine.default_task_timeout_s must be finite and > 0, got {}",
                                 config.engine.default_task_timeout_s)};
    }
    if (auto level = parse_log_level(config.logging.log_level); !level) {
        return Error{ErrorCode::InvalidArgument, "logging.log_level: " + level.error().message};
    }
    if (config.logging.max_file_size_mb == 0) {
        return Error{ErrorCode::InvalidArgument, "logging.max_file_size_mb must be >= 1"};
    }
    const auto& sink = config.logging.sink;
    if (sink != "stdout" && sink != "file" && sink != "null") {
        return Error{ErrorCode::InvalidArgument,
                     std::format("logging.sink must be stdout, file or null, got '{}'", sink)};
    }
    return {};
}

Config default_config() {
    return Config{};
}

}  // namespace dag_scheduler
