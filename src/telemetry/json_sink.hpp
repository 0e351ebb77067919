/**
 * @file json_sink.hpp
 * @brief NDJSON file log sink with rotation support.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace code_sandbox {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * The active file is `<prefix>.ndjson`; on rotation it becomes
 * `<prefix>.1.ndjson`, older generations shift up, and anything beyond
 * `max_files` is deleted.
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

    /// Byte threshold used by rotate_if_needed(); exposed for tests.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

    [[nodiscard]] std::filesystem::path current_path() const;

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path generation_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout, useful for development/debugging.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output, useful for tests and benchmarks.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace code_sandbox
