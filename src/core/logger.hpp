/**
 * @file logger.hpp
 * @brief Run log for pipeflow: levels, JSON escaping and the Logger.
 *
 * Every message becomes a single line
 * `{"level":"info","ts":"2024-05-01T12:00:00.000Z","msg":"..."}`
 * handed to an ILogSink. Scheduler, RunController and the CLI all log
 * through one Logger shared by reference.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace pipeflow {

// ── Levels ───────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/// Inverse of to_string(LogLevel); anything else is a Config error.
Result<LogLevel> parse_log_level(std::string_view name);

/// Quotes, backslashes and control characters escaped; quotes not added.
std::string json_escape(std::string_view text);

// ── Sinks and Logger ─────────────────────────

/**
 * @brief Receives finished NDJSON records, without trailing newline.
 *
 * A sink owned by a Logger or RunJournal is only called under that
 * owner's mutex.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Formats and forwards messages at or above the minimum level.
 *
 * Safe to call from any thread.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

}  // namespace pipeflow
