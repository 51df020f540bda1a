#pragma once

/**
 * @file LogSink.hpp
 * @brief Pre-built log sinks for common output destinations
 */

#include <prism/io/Console.hpp>
#include <prism/io/LogService.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

namespace prism {

/**
 * @brief Factory for common log sinks
 */
class LogSinks {
  public:
    /// Console sink with colors (respects TTY detection), writes to stderr
    static LogService::Sink Console(std::shared_ptr<const class Console> console) {
        return [console = std::move(console)](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                if (console->IsColorEnabled()) {
                    std::cerr << entry.FormatColored(*console) << "\n";
                } else {
                    std::cerr << entry.Format() << "\n";
                }
            }
            std::cerr.flush();
        };
    }

    /// File sink (plain text, no colors)
    static LogService::Sink File(const std::string &path) {
        auto file = std::make_shared<std::ofstream>(path, std::ios::app);
        return [file](const std::vector<LogEntry> &entries) {
            if (!file->is_open()) {
                return;
            }
            for (const auto &entry : entries) {
                *file << entry.Format() << "\n";
            }
            file->flush();
        };
    }

    /// JSON Lines sink (for log aggregation)
    static LogService::Sink JsonLines(const std::string &path) {
        auto file = std::make_shared<std::ofstream>(path, std::ios::app);
        return [file](const std::vector<LogEntry> &entries) {
            if (!file->is_open()) {
                return;
            }
            for (const auto &entry : entries) {
                nlohmann::json line;
                line["time"] = std::chrono::duration<double>(entry.wall_time.time_since_epoch())
                                   .count();
                line["level"] = LogEntry::GetLevelString(entry.level);
                line["component"] = entry.context.component;
                line["run_id"] = entry.context.run_id;
                line["message"] = entry.message;
                *file << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                      << "\n";
            }
            file->flush();
        };
    }

    /// Callback sink (custom handling)
    static LogService::Sink Callback(std::function<void(const LogEntry &)> handler) {
        return [handler = std::move(handler)](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                handler(entry);
            }
        };
    }
};

} // namespace prism
