#pragma once

/**
 * @file LogService.hpp
 * @brief Unified logging service for Prism
 *
 * Entries are written to the sinks as they are logged. Each carries a
 * wall-clock timestamp and a thread-local context (component + run id), so
 * logs from the coordinator, the worker pool and the optimizer loop can be
 * told apart.
 */

#include <prism/io/Console.hpp>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace prism {

// =============================================================================
// LogContext
// =============================================================================

/**
 * @brief Log context - set by whoever is executing on the current thread
 *
 * The context is thread-local. Workers set it before running an evaluation so
 * log lines emitted deep inside the runner are tagged with the run.
 */
struct LogContext {
    std::string component; ///< Emitting component (e.g., "evaluation", "sweep")
    std::string run_id;    ///< Run identifier, if any

    /// "component/run" or just "component"
    [[nodiscard]] std::string FullPath() const {
        if (run_id.empty()) {
            return component;
        }
        return component + "/" + run_id.substr(0, 8);
    }

    [[nodiscard]] bool IsSet() const { return !component.empty(); }
};

// =============================================================================
// LogEntry
// =============================================================================

/**
 * @brief A single log entry with full context
 *
 * Immutable after creation.
 */
struct LogEntry {
    LogLevel level;      ///< Severity level
    std::string message; ///< Log message
    LogContext context;  ///< Component/run context

    std::chrono::system_clock::time_point wall_time;

    static LogEntry Create(LogLevel level, std::string_view message, const LogContext &ctx) {
        LogEntry entry;
        entry.level = level;
        entry.message = std::string(message);
        entry.context = ctx;
        entry.wall_time = std::chrono::system_clock::now();
        return entry;
    }

    /// "HH:MM:SS.mmm" in UTC
    [[nodiscard]] std::string FormatTime() const {
        auto t = std::chrono::system_clock::to_time_t(wall_time);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      wall_time.time_since_epoch()) %
                  1000;
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%H:%M:%S") << "." << std::setfill('0') << std::setw(3)
            << ms.count();
        return oss.str();
    }

    /// Format for output: "[time] [LEVEL] [component/run] message"
    [[nodiscard]] std::string Format(bool include_context = true) const {
        std::ostringstream oss;
        oss << "[" << FormatTime() << "] ";
        oss << "[" << GetLevelString(level) << "] ";

        if (include_context && context.IsSet()) {
            oss << "[" << context.FullPath() << "] ";
        }

        oss << message;
        return oss.str();
    }

    /// Format with colors (for terminal)
    [[nodiscard]] std::string FormatColored(const Console &console) const {
        std::ostringstream oss;

        oss << console.Colorize("[" + FormatTime() + "]", AnsiColor::Dim) << " ";
        oss << console.Colorize("[" + std::string(GetLevelString(level)) + "]",
                                Console::GetLevelColor(level))
            << " ";

        if (context.IsSet()) {
            oss << console.Colorize("[" + context.FullPath() + "]", AnsiColor::Cyan) << " ";
        }

        oss << message;
        return oss.str();
    }

    [[nodiscard]] static const char *GetLevelString(LogLevel level) {
        switch (level) {
        case LogLevel::Trace:
            return "TRC";
        case LogLevel::Debug:
            return "DBG";
        case LogLevel::Info:
            return "INF";
        case LogLevel::Event:
            return "EVT";
        case LogLevel::Warning:
            return "WRN";
        case LogLevel::Error:
            return "ERR";
        case LogLevel::Fatal:
            return "FTL";
        }
        return "???";
    }
};

// =============================================================================
// LogContextManager
// =============================================================================

/**
 * @brief Thread-local log context manager
 */
class LogContextManager {
  public:
    static void SetContext(const LogContext &ctx) { current_context_ = ctx; }

    static void ClearContext() { current_context_ = LogContext{}; }

    [[nodiscard]] static const LogContext &GetContext() { return current_context_; }

    /**
     * @brief RAII guard for automatic context management
     */
    class ScopedContext {
      public:
        explicit ScopedContext(const std::string &component, const std::string &run_id = "")
            : previous_(current_context_) {
            current_context_.component = component;
            current_context_.run_id = run_id;
        }

        ~ScopedContext() { current_context_ = previous_; }

        // Non-copyable, non-movable
        ScopedContext(const ScopedContext &) = delete;
        ScopedContext &operator=(const ScopedContext &) = delete;
        ScopedContext(ScopedContext &&) = delete;
        ScopedContext &operator=(ScopedContext &&) = delete;

      private:
        LogContext previous_;
    };

  private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    static inline thread_local LogContext current_context_;
};

// =============================================================================
// LogService
// =============================================================================

/**
 * @brief Unified logging service for Prism
 *
 * ALL logging goes through this service. Every entry at or above the
 * minimum level is handed to each sink whose own level admits it.
 */
class LogService {
  public:
    /// Sink callback type: receives batch of entries to output
    using Sink = std::function<void(const std::vector<LogEntry> &)>;

    LogService() = default;

    // === Configuration ===

    /// Set minimum level (below this = dropped)
    void SetMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }
    [[nodiscard]] LogLevel GetMinLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    /// Add an output sink
    void AddSink(Sink sink) { AddSink(std::move(sink), LogLevel::Trace); }

    /// Add a sink that only receives entries at or above a level
    void AddSink(Sink sink, LogLevel min_level) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.emplace_back(std::move(sink), min_level);
    }

    void ClearSinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    // === Logging API ===

    /// Log a message (uses current thread-local context)
    void Log(LogLevel level, std::string_view message) {
        Log(level, message, LogContextManager::GetContext());
    }

    /// Log with explicit context (bypasses thread-local)
    void Log(LogLevel level, std::string_view message, const LogContext &ctx) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) {
            return;
        }

        auto entry = LogEntry::Create(level, message, ctx);

        if (level == LogLevel::Error) {
            ++error_count_;
        } else if (level == LogLevel::Fatal) {
            ++fatal_count_;
        } else if (level == LogLevel::Warning) {
            ++warning_count_;
        }

        FlushEntry(entry);
    }

    void Trace(std::string_view msg) { Log(LogLevel::Trace, msg); }
    void Debug(std::string_view msg) { Log(LogLevel::Debug, msg); }
    void Info(std::string_view msg) { Log(LogLevel::Info, msg); }
    void Event(std::string_view msg) { Log(LogLevel::Event, msg); }
    void Warning(std::string_view msg) { Log(LogLevel::Warning, msg); }
    void Error(std::string_view msg) { Log(LogLevel::Error, msg); }
    void Fatal(std::string_view msg) { Log(LogLevel::Fatal, msg); }

    // === Query API ===

    [[nodiscard]] std::size_t ErrorCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_count_;
    }

    [[nodiscard]] std::size_t WarningCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return warning_count_;
    }

    [[nodiscard]] std::size_t FatalCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fatal_count_;
    }

    void ResetCounts() {
        std::lock_guard<std::mutex> lock(mutex_);
        error_count_ = 0;
        warning_count_ = 0;
        fatal_count_ = 0;
    }

  private:
    std::vector<std::pair<Sink, LogLevel>> sinks_; ///< sink + min level
    LogLevel min_level_ = LogLevel::Info;

    std::size_t error_count_ = 0;
    std::size_t warning_count_ = 0;
    std::size_t fatal_count_ = 0;

    mutable std::mutex mutex_;

    void FlushEntry(const LogEntry &entry) {
        for (const auto &[sink, min_level] : sinks_) {
            if (entry.level >= min_level) {
                sink({entry});
            }
        }
    }
};

/**
 * @brief Global log service singleton
 */
inline LogService &GetLogService() {
    static LogService instance;
    return instance;
}

} // namespace prism
