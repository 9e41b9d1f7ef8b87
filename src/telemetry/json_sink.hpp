/**
 * @file json_sink.hpp
 * @brief Destinations for pipeflow's NDJSON records.
 *
 * The same sinks carry the run log written through Logger and the run
 * journal written through RunJournal; both hand over one complete JSON
 * object per write() call.
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace pipeflow {

/**
 * @brief Appends records to `<log_dir>/<prefix>.ndjson`, one per line.
 *
 * An existing file is continued, so consecutive runs share one log. Once
 * the file has reached max_file_size_mb, the next write first moves it to
 * `<prefix>.1.ndjson`, shifting `<prefix>.N` to `<prefix>.N+1` and
 * dropping anything beyond rotate_count. A rotate_count of 0 truncates instead of keeping history;
 * a max_file_size_mb of 0 never rotates.
 *
 * Open and rename failures are not reported; records written while the
 * file cannot be opened are lost.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t rotate_count = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    /// `<log_dir>/<prefix>.ndjson`
    [[nodiscard]] std::filesystem::path active_path() const;

private:
    void open_active();
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t n) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t rotate_count_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/// Echoes records to the terminal; used when `logging.log_dir` is empty.
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace pipeflow
