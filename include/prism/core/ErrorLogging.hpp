#pragma once

/**
 * @file ErrorLogging.hpp
 * @brief Integration between Error types and LogService
 *
 * Routes errors to the log service at the level their severity maps to.
 * This file bridges Error.hpp and LogService.hpp.
 */

#include <prism/core/Error.hpp>
#include <prism/io/LogService.hpp>

namespace prism {

/**
 * @brief Convert error severity to log level
 */
inline LogLevel SeverityToLogLevel(Severity severity) {
    switch (severity) {
    case Severity::INFO:
        return LogLevel::Info;
    case Severity::WARNING:
        return LogLevel::Warning;
    case Severity::ERROR:
        return LogLevel::Error;
    case Severity::FATAL:
        return LogLevel::Fatal;
    }
    return LogLevel::Error;
}

/**
 * @brief Log an error to the global LogService
 */
inline void LogError(const Error &error, const std::string &component = "") {
    LogLevel level = SeverityToLogLevel(error.severity());

    if (!component.empty()) {
        LogContext ctx = LogContextManager::GetContext();
        ctx.component = component;
        GetLogService().Log(level, error.what(), ctx);
    } else {
        GetLogService().Log(level, error.what());
    }
}

} // namespace prism
