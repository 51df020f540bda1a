#pragma once

/**
 * @file Console.hpp
 * @brief Console abstraction with ANSI color support
 *
 * Diagnostics go to stderr: stdout is reserved for operation results so the
 * CLI output stays machine-readable.
 */

#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <unistd.h>

namespace prism {

// =============================================================================
// LogLevel
// =============================================================================

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    Trace,   ///< Most verbose, internal debugging
    Debug,   ///< Debugging info
    Info,    ///< Normal operation
    Event,   ///< Run lifecycle events (sweep started, best improved, ...)
    Warning, ///< Potential issues, graceful degradation
    Error,   ///< Recoverable errors
    Fatal    ///< Unrecoverable errors
};

/**
 * @brief Parse a level name ("trace", "debug", "info", "event", "warning", "error", "fatal")
 */
[[nodiscard]] inline std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    if (name == "trace")
        return LogLevel::Trace;
    if (name == "debug")
        return LogLevel::Debug;
    if (name == "info")
        return LogLevel::Info;
    if (name == "event")
        return LogLevel::Event;
    if (name == "warning" || name == "warn")
        return LogLevel::Warning;
    if (name == "error")
        return LogLevel::Error;
    if (name == "fatal")
        return LogLevel::Fatal;
    return std::nullopt;
}

// =============================================================================
// AnsiColor
// =============================================================================

/**
 * @brief ANSI color codes
 */
struct AnsiColor {
    static constexpr const char *Reset = "\033[0m";
    static constexpr const char *Bold = "\033[1m";
    static constexpr const char *Dim = "\033[2m";

    static constexpr const char *Red = "\033[31m";
    static constexpr const char *Green = "\033[32m";
    static constexpr const char *Yellow = "\033[33m";
    static constexpr const char *Cyan = "\033[36m";
    static constexpr const char *White = "\033[37m";
    static constexpr const char *Gray = "\033[90m";

    static constexpr const char *BgRed = "\033[41m";
};

// =============================================================================
// Console
// =============================================================================

/**
 * @brief Console output with color and formatting support
 *
 * Detects if stderr is a terminal and enables/disables ANSI colors accordingly.
 */
class Console {
  public:
    Console() : is_tty_(isatty(STDERR_FILENO) != 0), color_enabled_(is_tty_) {}

    /// Check if stderr is a terminal (supports ANSI codes)
    [[nodiscard]] bool IsTerminal() const { return is_tty_; }

    /// Enable/disable color output (auto-detected by default)
    void SetColorEnabled(bool enabled) { color_enabled_ = enabled; }
    [[nodiscard]] bool IsColorEnabled() const { return color_enabled_; }

    /// Apply color if enabled
    [[nodiscard]] std::string Colorize(std::string_view text, const char *color) const {
        if (!color_enabled_) {
            return std::string(text);
        }
        return std::string(color) + std::string(text) + AnsiColor::Reset;
    }

    /// Pad string to width (left-aligned text)
    [[nodiscard]] static std::string PadRight(std::string_view text, std::size_t width) {
        if (text.size() >= width) {
            return std::string(text);
        }
        return std::string(text) + std::string(width - text.size(), ' ');
    }

    /// Write raw line to stderr
    void WriteLine(std::string_view text = "") const { std::cerr << text << "\n"; }

    /// Flush output
    void Flush() const { std::cerr.flush(); }

    [[nodiscard]] static const char *GetLevelColor(LogLevel level) {
        switch (level) {
        case LogLevel::Trace:
            return AnsiColor::Gray;
        case LogLevel::Debug:
            return AnsiColor::Cyan;
        case LogLevel::Info:
            return AnsiColor::White;
        case LogLevel::Event:
            return AnsiColor::Green;
        case LogLevel::Warning:
            return AnsiColor::Yellow;
        case LogLevel::Error:
            return AnsiColor::Red;
        case LogLevel::Fatal:
            return AnsiColor::BgRed;
        }
        return AnsiColor::White;
    }

  private:
    bool is_tty_ = false;
    bool color_enabled_ = false;
};

} // namespace prism
