#pragma once

/**
 * @file ArgumentSanitizer.hpp
 * @brief Allow-list filter for free-form extra command-line flags
 *
 * Extra flags are the only caller-controlled text that reaches the simulator's
 * argument vector. Anything not shaped like `--flag` or `--flag=value` is
 * dropped with a warning; the call itself is never blocked.
 */

#include <prism/io/LogService.hpp>

#include <regex>
#include <string>
#include <vector>

namespace prism {

class ArgumentSanitizer {
  public:
    /// True if a single argument is an acceptable extra flag
    [[nodiscard]] static bool IsAllowed(const std::string &arg) {
        return std::regex_match(arg, Pattern());
    }

    /**
     * @brief Keep only allowed flags, preserving order
     *
     * Rejected entries are logged at warning level and never appear in the
     * returned list.
     */
    [[nodiscard]] static std::vector<std::string> Sanitize(const std::vector<std::string> &args) {
        std::vector<std::string> accepted;
        accepted.reserve(args.size());
        for (const auto &arg : args) {
            if (IsAllowed(arg)) {
                accepted.push_back(arg);
            } else {
                GetLogService().Warning("Skipping suspicious extra arg: " + arg);
            }
        }
        return accepted;
    }

  private:
    static const std::regex &Pattern() {
        static const std::regex pattern(R"(^--[a-z][A-Za-z0-9-]*(?:=[A-Za-z0-9_.+\-]+)?$)",
                                        std::regex::ECMAScript | std::regex::optimize);
        return pattern;
    }
};

} // namespace prism
