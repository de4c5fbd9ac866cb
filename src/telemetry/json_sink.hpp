/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, stdout, in-memory, null.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dag_scheduler {

/**
 * @brief Writes NDJSON to size-rotated log files.
 *
 * The active file is `<prefix>.ndjson`. When it exceeds the size limit it is
 * renamed to `<prefix>.1.ndjson`, older generations shift up by one, and
 * anything beyond `max_files` generations is deleted.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;

    /// Byte-level limit override, for tests that cannot write megabytes.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path generation_path(uint32_t generation) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout: useful for development/debugging.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output: useful for benchmarking.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Keeps lines in memory. Used by tests to assert on log output.
 *
 * The buffer is shared so a test can keep a handle after the sink itself
 * has been moved into a Logger.
 */
class MemorySink : public ILogSink {
public:
    struct Buffer {
        std::mutex mutex;
        std::vector<std::string> lines;
    };

    MemorySink() : buffer_(std::make_shared<Buffer>()) {}

    void write(std::string_view json_line) override;
    void flush() override {}

    [[nodiscard]] std::shared_ptr<Buffer> buffer() const { return buffer_; }

private:
    std::shared_ptr<Buffer> buffer_;
};

/**
 * @brief Build the sink selected by the [logging] section.
 */
Result<std::unique_ptr<ILogSink>> make_log_sink(const LoggingConfig& config);

}  // namespace dag_scheduler
