#pragma once

/**
 * @file LogSetup.hpp
 * @brief Apply a LoggingConfig to a LogService
 */

#include <prism/io/Config.hpp>
#include <prism/io/Console.hpp>
#include <prism/io/LogService.hpp>
#include <prism/io/LogSink.hpp>

#include <algorithm>
#include <memory>

namespace prism {

/**
 * @brief Replace the service's sinks with those named in the config
 *
 * Console (stderr) at console_level, or Error when quiet. File and JSON
 * Lines sinks, when configured, receive Debug and above.
 */
inline void ConfigureLogging(const LoggingConfig &config, LogService &service = GetLogService()) {
    service.ClearSinks();

    const LogLevel console_level = config.quiet ? LogLevel::Error : config.console_level;
    service.AddSink(LogSinks::Console(std::make_shared<const Console>()), console_level);

    LogLevel min_level = console_level;
    if (!config.file_path.empty()) {
        service.AddSink(LogSinks::File(config.file_path), LogLevel::Debug);
        min_level = std::min(min_level, LogLevel::Debug);
    }
    if (!config.json_path.empty()) {
        service.AddSink(LogSinks::JsonLines(config.json_path), LogLevel::Debug);
        min_level = std::min(min_level, LogLevel::Debug);
    }
    service.SetMinLevel(min_level);
}

} // namespace prism
