/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/result.hpp"

namespace dag_scheduler {

struct EngineConfig {
    uint32_t max_concurrent_tasks = 10;     ///< Admission-control bound, >= 1
    uint32_t dispatch_threads = 0;          ///< 0 = max(max_concurrent_tasks, hw threads); never fewer than max_concurrent_tasks
    double default_task_timeout_s = 300.0;  ///< Applied by the definition loader
    uint32_t default_max_retries = 0;
};

struct LoggingConfig {
    std::string sink = "stdout";            ///< "stdout", "file", "null"
    std::filesystem::path log_dir = "./logs";
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level scheduler configuration.
 */
struct Config {
    EngineConfig engine;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Check value ranges. Called by both loaders.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace dag_scheduler
