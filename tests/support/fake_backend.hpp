/**
 * @file fake_backend.hpp
 * @brief Scripted in-process execution backend for scheduler tests.
 *
 * Records start/finish events and tracks the cpus, memory and task count
 * running concurrently, so tests can assert ordering and budget bounds.
 */

#pragma once

#include "core/logger.hpp"
#include "executor/backend.hpp"
#include "workflow/task.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace pipeflow::test_support {

class FakeBackend : public IExecutionBackend {
public:
    struct Script {
        bool fail = false;
        int exit_code = 1;
        std::chrono::milliseconds delay{0};
        bool block_until_stop = false;
        bool throws = false;
    };

    /// Behaviour for every task with this analysis name.
    void script(const std::string& name, Script s) {
        std::lock_guard lock(mutex_);
        scripts_[name] = s;
    }

    void set_default_delay(std::chrono::milliseconds delay) {
        std::lock_guard lock(mutex_);
        default_delay_ = delay;
    }

    ExecutionResult execute(const Task& task, std::stop_token stop) override {
        Script s;
        {
            std::lock_guard lock(mutex_);
            if (auto it = scripts_.find(task.analysis_name); it != scripts_.end()) {
                s = it->second;
            } else {
                s.delay = default_delay_;
            }
            cpus_ += task.resources.cpus;
            memory_ += task.resources.memory_mb;
            ++running_;
            peak_cpus_ = std::max(peak_cpus_, cpus_);
            peak_memory_ = std::max(peak_memory_, memory_);
            peak_running_ = std::max(peak_running_, running_);
            events_.push_back("start:" + task.analysis_name);
            started_.push_back(task.analysis_name);
        }
        started_cv_.notify_all();

        auto begin = std::chrono::steady_clock::now();
        bool stopped = false;
        if (s.block_until_stop) {
            // Bounded so a broken cancel path fails the test instead of hanging it.
            auto deadline = begin + std::chrono::seconds(10);
            while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            stopped = stop.stop_requested();
        } else {
            auto deadline = begin + s.delay;
            while (std::chrono::steady_clock::now() < deadline) {
                if (stop.stop_requested()) {
                    stopped = true;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }

        finish(task);
        if (s.throws) throw std::runtime_error("scripted backend failure");

        ExecutionResult result;
        result.duration = std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - begin);
        if (stopped) {
            result.final_state = TaskState::Cancelled;
            result.failure = ErrorCode::Cancelled;
            result.error_message = "stopped";
        } else if (s.fail) {
            result.final_state = TaskState::Failed;
            result.exit_code = s.exit_code;
            result.failure = ErrorCode::TaskExecutionFailed;
            result.error_message = "exited with code " + std::to_string(s.exit_code);
            result.stderr_summary = task.analysis_name + " failed";
        } else {
            result.final_state = TaskState::Succeeded;
            result.exit_code = 0;
            result.stdout_summary = task.analysis_name + " ok";
        }
        return result;
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "fake"; }

    /// Block until `name` has started (or the timeout passes).
    bool wait_started(const std::string& name,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mutex_);
        return started_cv_.wait_for(lock, timeout, [&] {
            return std::find(started_.begin(), started_.end(), name) != started_.end();
        });
    }

    [[nodiscard]] std::vector<std::string> started() const {
        std::lock_guard lock(mutex_);
        return started_;
    }

    [[nodiscard]] std::vector<std::string> events() const {
        std::lock_guard lock(mutex_);
        return events_;
    }

    [[nodiscard]] size_t execution_count() const {
        std::lock_guard lock(mutex_);
        return started_.size();
    }

    [[nodiscard]] bool ran(const std::string& name) const {
        std::lock_guard lock(mutex_);
        return std::find(started_.begin(), started_.end(), name) != started_.end();
    }

    /// Position of an event such as "start:b" or "end:a"; -1 if absent.
    [[nodiscard]] long position(const std::string& event) const {
        std::lock_guard lock(mutex_);
        auto it = std::find(events_.begin(), events_.end(), event);
        return it == events_.end() ? -1 : static_cast<long>(it - events_.begin());
    }

    [[nodiscard]] int64_t peak_cpus() const { std::lock_guard l(mutex_); return peak_cpus_; }
    [[nodiscard]] int64_t peak_memory() const { std::lock_guard l(mutex_); return peak_memory_; }
    [[nodiscard]] size_t peak_running() const { std::lock_guard l(mutex_); return peak_running_; }

private:
    void finish(const Task& task) {
        std::lock_guard lock(mutex_);
        cpus_ -= task.resources.cpus;
        memory_ -= task.resources.memory_mb;
        --running_;
        events_.push_back("end:" + task.analysis_name);
    }

    mutable std::mutex mutex_;
    std::condition_variable started_cv_;
    std::map<std::string, Script> scripts_;
    std::chrono::milliseconds default_delay_{0};

    int64_t cpus_{0};
    int64_t memory_{0};
    size_t running_{0};
    int64_t peak_cpus_{0};
    int64_t peak_memory_{0};
    size_t peak_running_{0};

    std::vector<std::string> events_;
    std::vector<std::string> started_;
};

/// Complete resources for tests.
inline Resources test_resources(int64_t cpus = 1, int64_t memory_mb = 100,
                                int64_t minutes = 10) {
    return Resources{cpus, memory_mb, minutes, "docker://busybox", ""};
}

/// Task with absolute-looking paths under /d.
inline Task make_task(std::string name, std::vector<std::string> inputs,
                      std::vector<std::string> outputs,
                      Resources res = test_resources()) {
    Task task;
    task.analysis_name = std::move(name);
    task.command = "run " + task.analysis_name;
    task.inputs = std::move(inputs);
    task.outputs = std::move(outputs);
    task.resources = std::move(res);
    return task;
}

/// Captures log records in memory.
class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

}  // namespace pipeflow::test_support
