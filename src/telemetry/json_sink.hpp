/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, stdout, in-memory and null.
 */

#pragma once

#include "core/logger.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace workload_router {

/**
 * @brief Writes NDJSON to size-rotated log files.
 *
 * The active file is `<prefix>.ndjson`. When it reaches the size limit it
 * becomes `<prefix>.1.ndjson`, older files shift up by one and anything past
 * `max_files` is deleted. Callers serialize access (Logger holds a mutex).
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
    [[nodiscard]] bool healthy() const noexcept override;

    [[nodiscard]] std::filesystem::path current_path() const;

    /// Byte limit override, mainly for exercising rotation.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

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
 * @brief Discards all output, useful for benchmarking.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Keeps lines in memory; can be switched unhealthy to simulate a
 *        failing destination.
 */
class MemorySink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override {}
    [[nodiscard]] bool healthy() const noexcept override { return healthy_.load(); }

    void set_healthy(bool healthy) noexcept { healthy_.store(healthy); }
    [[nodiscard]] std::vector<std::string> lines() const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    std::atomic<bool> healthy_{true};
};

}  // namespace workload_router
