/**
 * @file result.hpp
 * @brief Monadic error handling type for pipeflow.
 *
 * Provides Result<T, E> as the error-handling mechanism for every fallible
 * operation. Structural workflow errors (missing resources, ambiguous
 * producers, cycles) travel through it to the caller instead of aborting
 * the process.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pipeflow {

// ─────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    Generic,
    Config,
    Io,
    InvalidWorkflow,
    MissingResourceSpec,
    UnsatisfiableResources,
    AmbiguousProducer,
    CyclicDependency,
    TaskExecutionFailed,
    TimeLimitExceeded,
    Cancelled,
    InternalSchedulingError
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Generic:                 return "Generic";
        case ErrorCode::Config:                  return "Config";
        case ErrorCode::Io:                      return "Io";
        case ErrorCode::InvalidWorkflow:         return "InvalidWorkflow";
        case ErrorCode::MissingResourceSpec:     return "MissingResourceSpec";
        case ErrorCode::UnsatisfiableResources:  return "UnsatisfiableResources";
        case ErrorCode::AmbiguousProducer:       return "AmbiguousProducer";
        case ErrorCode::CyclicDependency:        return "CyclicDependency";
        case ErrorCode::TaskExecutionFailed:     return "TaskExecutionFailed";
        case ErrorCode::TimeLimitExceeded:       return "TimeLimitExceeded";
        case ErrorCode::Cancelled:               return "Cancelled";
        case ErrorCode::InternalSchedulingError: return "InternalSchedulingError";
    }
    return "Unknown";
}

/**
 * @brief Error type carrying a code, a descriptive message, and the
 *        names of the tasks or keys it concerns.
 */
struct Error {
    ErrorCode code{ErrorCode::Generic};
    std::string message;
    std::vector<std::string> subjects;

    explicit Error(std::string msg) : message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::vector<std::string> subj = {})
        : code(c), message(std::move(msg)), subjects(std::move(subj)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// "Code: message", the form used in logs and CLI output.
    [[nodiscard]] std::string describe() const {
        return std::string{to_string(code)} + ": " + message;
    }
};

/**
 * @brief Result<T, E>: holds either a success value or an error.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that can fail but return nothing.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorCode code, std::string message,
                        std::vector<std::string> subjects = {}) {
    return Result<T, E>(E{code, std::move(message), std::move(subjects)});
}

}  // namespace pipeflow
