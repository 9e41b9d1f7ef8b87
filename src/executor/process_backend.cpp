/**
 * @file process_backend.cpp
 * @brief ProcessBackend: fork/exec with wall-clock enforcement.
 *
 * Launch sequence:
 *   parent opens the log files and a CLOEXEC error pipe, builds argv/envp,
 *   then forks. The child starts a new session, redirects stdio, applies
 *   rlimits and execs. If exec fails the child writes errno to the pipe, so
 *   an EOF on the pipe means the exec succeeded.
 * The parent polls waitpid() until the child exits, the limit expires or a
 * stop is requested, then kills the process group and reaps it.
 */

#include "executor/process_backend.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>

namespace pipeflow {

namespace {

/// Owns a file descriptor.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.release();
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset() noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_{-1};
};

std::string errno_text(int err) {
    return std::error_code(err, std::generic_category()).message();
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) out.push_back(word);
    return out;
}

std::string sanitize(const std::string& name) {
    std::string out = name.empty() ? std::string{"task"} : name;
    for (auto& c : out) {
        if (c == '/' || c == ' ' || c == '\t' || c == '\\') c = '_';
    }
    return out;
}

/// Last `max_bytes` bytes of a file (empty if unreadable).
std::string read_tail(const std::filesystem::path& path, size_t max_bytes) {
    if (max_bytes == 0) return {};
    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs) return {};
    auto size = static_cast<size_t>(ifs.tellg());
    size_t start = size > max_bytes ? size - max_bytes : 0;
    ifs.seekg(static_cast<std::streamoff>(start));
    std::string out(size - start, '\0');
    ifs.read(out.data(), static_cast<std::streamsize>(out.size()));
    out.resize(static_cast<size_t>(ifs.gcount()));
    return out;
}

/// NUL-terminated copies kept alive for execvpe.
struct CStringArray {
    std::vector<std::string> storage;
    std::vector<char*> pointers;

    explicit CStringArray(std::vector<std::string> items) : storage(std::move(items)) {
        pointers.reserve(storage.size() + 1);
        for (auto& s : storage) pointers.push_back(s.data());
        pointers.push_back(nullptr);
    }

    char** data() noexcept { return pointers.data(); }
};

std::vector<std::string> child_environment(const Task& task) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry{*e};
        if (entry.starts_with("FLOW_CPUS=") || entry.starts_with("FLOW_MEMORY_MB=")) continue;
        env.emplace_back(entry);
    }
    env.push_back("FLOW_CPUS=" + std::to_string(task.resources.cpus));
    env.push_back("FLOW_MEMORY_MB=" + std::to_string(task.resources.memory_mb));
    return env;
}

ExecutionResult launch_failure(std::string message, Duration elapsed) {
    ExecutionResult result;
    result.final_state = TaskState::Failed;
    result.exit_code = -1;
    result.duration = elapsed;
    result.failure = ErrorCode::TaskExecutionFailed;
    result.error_message = std::move(message);
    return result;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<ProcessBackend::Options> ProcessBackend::options_from(const Config& config) {
    if (config.job_runner != "local" && config.job_runner != "shell") {
        return Error{ErrorCode::Config, "unknown job_runner: " + config.job_runner,
                     {"job_runner"}};
    }
    Options options;
    options.job_runner = config.job_runner;
    options.singularity_bin = config.singularity_bin;
    options.log_dir = config.flowdir / "logs";
    options.poll_interval = std::chrono::milliseconds{
        config.executor.poll_interval_ms == 0 ? 1 : config.executor.poll_interval_ms};
    options.summary_bytes = config.executor.summary_bytes;
    options.apply_memory_rlimit = config.executor.apply_memory_rlimit;
    return options;
}

ProcessBackend::ProcessBackend(Options options) : options_(std::move(options)) {}

std::filesystem::path ProcessBackend::log_dir() const {
    if (!options_.log_dir.empty()) return options_.log_dir;
    return std::filesystem::temp_directory_path() / "pipeflow";
}

std::vector<std::string> ProcessBackend::build_argv(const Task& task) const {
    std::vector<std::string> argv;
    if (options_.job_runner == "local") {
        argv.push_back(options_.singularity_bin);
        argv.emplace_back("exec");
        for (auto& arg : split_whitespace(task.resources.extra_runtime_args)) {
            argv.push_back(std::move(arg));
        }
        argv.push_back(task.resources.container);
    }
    argv.emplace_back("/bin/sh");
    argv.emplace_back("-c");
    argv.push_back(task.command);
    return argv;
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

ExecutionResult ProcessBackend::execute(const Task& task, std::stop_token stop) {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start] {
        return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
    };

    if (stop.stop_requested()) {
        ExecutionResult result;
        result.final_state = TaskState::Cancelled;
        result.failure = ErrorCode::Cancelled;
        result.error_message = "cancelled before launch";
        return result;
    }

    std::error_code ec;
    auto dir = log_dir();
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return launch_failure("cannot create log directory " + dir.string() + ": "
                                  + ec.message(), elapsed());
    }

    auto seq = ++sequence_;
    auto base = sanitize(task.analysis_name) + "-" + std::to_string(seq);
    auto out_path = dir / (base + ".out");
    auto err_path = dir / (base + ".err");

    UniqueFd null_in(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    UniqueFd out_fd(::open(out_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    UniqueFd err_fd(::open(err_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!null_in.valid() || !out_fd.valid() || !err_fd.valid()) {
        return launch_failure("cannot open task log files in " + dir.string() + ": "
                                  + errno_text(errno), elapsed());
    }

    int pipe_fds[2];
    if (::pipe2(pipe_fds, O_CLOEXEC) == -1) {
        return launch_failure("pipe2: " + errno_text(errno), elapsed());
    }
    UniqueFd error_read(pipe_fds[0]);
    UniqueFd error_write(pipe_fds[1]);

    CStringArray argv(build_argv(task));
    CStringArray envp(child_environment(task));
    rlim_t memory_limit = static_cast<rlim_t>(task.resources.memory_mb) * 1024 * 1024;
    bool apply_rlimit = options_.apply_memory_rlimit && task.resources.memory_mb > 0;

    pid_t pid = ::fork();
    if (pid == -1) {
        return launch_failure("fork: " + errno_text(errno), elapsed());
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        auto die = [fd = error_write.get()](int err) {
            ssize_t ignored = ::write(fd, &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        };
        if (::setsid() == -1) die(errno);
        if (::dup2(null_in.get(), STDIN_FILENO) == -1) die(errno);
        if (::dup2(out_fd.get(), STDOUT_FILENO) == -1) die(errno);
        if (::dup2(err_fd.get(), STDERR_FILENO) == -1) die(errno);
        if (apply_rlimit) {
            struct rlimit rlim {};
            rlim.rlim_cur = memory_limit;
            rlim.rlim_max = memory_limit;
            if (::setrlimit(RLIMIT_AS, &rlim) == -1) die(errno);
        }
        ::execvpe(argv.data()[0], argv.data(), envp.data());
        die(errno);
    }

    // Parent
    error_write.reset();
    int child_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(error_read.get(), &child_errno, sizeof(child_errno));
    } while (got == -1 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
        return launch_failure("failed to launch " + argv.storage.front() + ": "
                                  + errno_text(child_errno), elapsed());
    }

    const auto limit = task.resources.time_limit_minutes > 0
        ? options_.time_unit * task.resources.time_limit_minutes
        : std::chrono::milliseconds::max();

    int status = 0;
    bool exited = false;
    bool timed_out = false;
    bool cancelled = false;
    std::string wait_error;

    while (true) {
        pid_t ret = ::waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            exited = true;
            break;
        }
        if (ret == -1 && errno != EINTR) {
            wait_error = "waitpid: " + errno_text(errno);
            break;
        }
        if (stop.stop_requested()) {
            cancelled = true;
            break;
        }
        if (elapsed() >= limit) {
            timed_out = true;
            break;
        }
        std::this_thread::sleep_for(options_.poll_interval);
    }

    // Tear down whatever is left of the process group, then reap.
    ::kill(-pid, SIGKILL);
    if (!exited && wait_error.empty()) {
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
    }

    ExecutionResult result;
    result.duration = elapsed();
    result.stdout_summary = read_tail(out_path, options_.summary_bytes);
    result.stderr_summary = read_tail(err_path, options_.summary_bytes);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (!wait_error.empty()) {
        result.final_state = TaskState::Failed;
        result.failure = ErrorCode::TaskExecutionFailed;
        result.error_message = wait_error;
    } else if (cancelled) {
        result.final_state = TaskState::Cancelled;
        result.failure = ErrorCode::Cancelled;
        result.error_message = "terminated by cancel request";
    } else if (timed_out) {
        result.final_state = TaskState::Failed;
        result.failure = ErrorCode::TimeLimitExceeded;
        result.error_message = "time limit of " + std::to_string(task.resources.time_limit_minutes)
                               + " minutes exceeded";
    } else if (WIFEXITED(status) && result.exit_code == 0) {
        result.final_state = TaskState::Succeeded;
    } else {
        result.final_state = TaskState::Failed;
        result.failure = ErrorCode::TaskExecutionFailed;
        result.error_message = WIFSIGNALED(status)
            ? "killed by signal " + std::to_string(WTERMSIG(status))
            : "exited with code " + std::to_string(result.exit_code);
    }

    return result;
}

}  // namespace pipeflow
