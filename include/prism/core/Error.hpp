#pragma once

/**
 * @file Error.hpp
 * @brief Consolidated error handling for Prism
 *
 * Provides a flattened exception hierarchy. Each category carries contextual
 * information (stderr, deadline, path) rather than many subclasses.
 */

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace prism {

// =============================================================================
// Error Severity
// =============================================================================

enum class Severity : uint8_t {
    INFO,    ///< Informational (logged, no action)
    WARNING, ///< Warning (may trigger graceful degradation)
    ERROR,   ///< Error (operation failed, caller may retry)
    FATAL    ///< Fatal (programming error, must not be retried)
};

// =============================================================================
// Error Kind
// =============================================================================

/**
 * @brief Error taxonomy used when failures become data (sweep/optimizer records)
 */
enum class ErrorKind : uint8_t {
    InvalidArgument,  ///< Rejected input or missing required field
    SimulationFailed, ///< Simulator exited non-zero
    Timeout,          ///< Deadline exceeded at any stage
    CacheUnavailable, ///< Distributed cache unreachable (never surfaced)
    Config,           ///< Configuration errors
    IO,               ///< File I/O errors
    Lifecycle,        ///< Misuse of the executor/driver lifecycle
    Internal          ///< Anything not raised by Prism itself
};

[[nodiscard]] inline const char *ErrorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    case ErrorKind::SimulationFailed:
        return "SimulationFailed";
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::CacheUnavailable:
        return "CacheUnavailable";
    case ErrorKind::Config:
        return "ConfigError";
    case ErrorKind::IO:
        return "IOError";
    case ErrorKind::Lifecycle:
        return "LifecycleError";
    case ErrorKind::Internal:
        return "InternalError";
    }
    return "Unknown";
}

// =============================================================================
// Base Exception
// =============================================================================

/**
 * @brief Base class for all Prism exceptions
 *
 * All Prism exceptions carry:
 * - A severity level (defaults to ERROR)
 * - A category string for logging context
 * - An ErrorKind for classification in sweep/optimizer records
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg, Severity severity = Severity::ERROR,
                   std::string category = "general", ErrorKind kind = ErrorKind::Internal)
        : std::runtime_error("[prism] " + msg), severity_(severity),
          category_(std::move(category)), kind_(kind) {}

    [[nodiscard]] Severity severity() const { return severity_; }
    [[nodiscard]] const std::string &category() const { return category_; }
    [[nodiscard]] ErrorKind kind() const { return kind_; }

  protected:
    Severity severity_;
    std::string category_;
    ErrorKind kind_;
};

// =============================================================================
// Invalid Argument
// =============================================================================

/**
 * @brief Rejected caller input. Reported immediately, never retried.
 */
class InvalidArgumentError : public Error {
  public:
    explicit InvalidArgumentError(const std::string &msg)
        : Error("Invalid argument: " + msg, Severity::ERROR, "argument",
                ErrorKind::InvalidArgument) {}

    InvalidArgumentError(const std::string &field, const std::string &reason)
        : Error("Invalid argument '" + field + "': " + reason, Severity::ERROR, "argument",
                ErrorKind::InvalidArgument),
          field_(field) {}

    /// Missing required field
    static InvalidArgumentError Missing(const std::string &field) {
        return {field, "required field is missing"};
    }

    [[nodiscard]] const std::string &field() const { return field_; }

  private:
    std::string field_;
};

// =============================================================================
// Simulation Failures
// =============================================================================

/**
 * @brief The external simulator exited with a non-zero status
 */
class SimulationFailedError : public Error {
  public:
    SimulationFailedError(const std::string &command, int exit_code, std::string stderr_text)
        : Error(FormatMessage(command, exit_code, stderr_text), Severity::ERROR, "simulation",
                ErrorKind::SimulationFailed),
          exit_code_(exit_code), stderr_(std::move(stderr_text)) {}

    [[nodiscard]] int exit_code() const { return exit_code_; }
    [[nodiscard]] const std::string &stderr_text() const { return stderr_; }

  private:
    static std::string FormatMessage(const std::string &command, int exit_code,
                                     const std::string &stderr_text) {
        if (stderr_text.empty()) {
            return "Simulation: " + command + " failed (exit code " + std::to_string(exit_code) +
                   ")";
        }
        return "Simulation: " + stderr_text;
    }

    int exit_code_;
    std::string stderr_;
};

// =============================================================================
// Timeouts
// =============================================================================

/**
 * @brief A deadline was exceeded. Distinguishable so callers can retry.
 */
class TimeoutError : public Error {
  public:
    TimeoutError(const std::string &stage, std::chrono::milliseconds deadline)
        : Error("Timeout: " + stage + " exceeded " + FormatDeadline(deadline), Severity::ERROR,
                "timeout", ErrorKind::Timeout),
          stage_(stage), deadline_(deadline) {}

    [[nodiscard]] const std::string &stage() const { return stage_; }
    [[nodiscard]] std::chrono::milliseconds deadline() const { return deadline_; }

  private:
    static std::string FormatDeadline(std::chrono::milliseconds deadline) {
        auto ms = deadline.count();
        if (ms % 1000 == 0) {
            return std::to_string(ms / 1000) + "s";
        }
        return std::to_string(ms) + "ms";
    }

    std::string stage_;
    std::chrono::milliseconds deadline_;
};

// =============================================================================
// Cache Errors
// =============================================================================

/**
 * @brief Distributed cache failure. Caught by the cache layer, never surfaced.
 */
class CacheUnavailableError : public Error {
  public:
    explicit CacheUnavailableError(const std::string &msg)
        : Error("Cache: " + msg, Severity::WARNING, "cache", ErrorKind::CacheUnavailable) {}
};

// =============================================================================
// Configuration Errors
// =============================================================================

/**
 * @brief Configuration/parsing errors with optional file context
 */
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg)
        : Error("Config: " + msg, Severity::ERROR, "config", ErrorKind::Config) {}

    ConfigError(const std::string &message, const std::string &file, int line = -1,
                const std::string &hint = "")
        : Error(FormatMessage(message, file, line, hint), Severity::ERROR, "config",
                ErrorKind::Config),
          file_(file), line_(line), hint_(hint) {}

    [[nodiscard]] const std::string &file() const { return file_; }
    [[nodiscard]] int line() const { return line_; }
    [[nodiscard]] const std::string &hint() const { return hint_; }

  private:
    static std::string FormatMessage(const std::string &msg, const std::string &file, int line,
                                     const std::string &hint) {
        std::string result = "Config: " + msg;
        if (!file.empty()) {
            result += "\n  at: " + file;
            if (line >= 0) {
                result += ":" + std::to_string(line);
            }
        }
        if (!hint.empty()) {
            result += "\n  hint: " + hint;
        }
        return result;
    }

    std::string file_;
    int line_ = -1;
    std::string hint_;
};

// =============================================================================
// I/O Errors
// =============================================================================

/**
 * @brief File and I/O operation errors
 */
class IOError : public Error {
  public:
    explicit IOError(const std::string &msg)
        : Error("IO: " + msg, Severity::ERROR, "io", ErrorKind::IO) {}

    IOError(const std::string &operation, const std::string &path, const std::string &reason)
        : Error("IO: " + operation + " '" + path + "': " + reason, Severity::ERROR, "io",
                ErrorKind::IO),
          path_(path) {}

    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
};

// =============================================================================
// Lifecycle Errors
// =============================================================================

/**
 * @brief Misuse of the execution model (e.g. blocking on the coordinator)
 */
class LifecycleError : public Error {
  public:
    explicit LifecycleError(const std::string &msg)
        : Error("Lifecycle: " + msg, Severity::FATAL, "lifecycle", ErrorKind::Lifecycle) {}
};

// =============================================================================
// Classification
// =============================================================================

/**
 * @brief Captured failure, ready to be stored as data
 */
struct FailureInfo {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
};

/**
 * @brief Classify a captured exception without rethrowing it to the caller
 */
[[nodiscard]] inline FailureInfo DescribeFailure(const std::exception_ptr &eptr) {
    try {
        std::rethrow_exception(eptr);
    } catch (const Error &e) {
        return {e.kind(), e.what()};
    } catch (const std::exception &e) {
        return {ErrorKind::Internal, e.what()};
    }
}

} // namespace prism
