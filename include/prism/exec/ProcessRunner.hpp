#pragma once

/**
 * @file ProcessRunner.hpp
 * @brief Invocation of the external simulator
 *
 * ProcessRunner is the seam between the evaluation service and the
 * simulator binary. SubprocessRunner spawns a real process; tests substitute
 * counting, failing or sleeping stubs.
 */

#include <prism/core/Error.hpp>
#include <prism/io/Config.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace prism {

/**
 * @brief Captured result of one process run
 */
struct ProcessOutput {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
};

/**
 * @brief Abstract simulator invocation
 *
 * Run() blocks the calling thread. It must only be called from worker
 * threads, never from the coordinator.
 */
class ProcessRunner {
  public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Run the simulator with the given operation arguments
     *
     * @param args Arguments after the simulator prefix (e.g. {"cascade", "--beta", "30"})
     * @param timeout Kill the process and throw TimeoutError past this deadline
     * @return Exit code and captured streams (non-zero exit is NOT an error here)
     */
    virtual ProcessOutput Run(const std::vector<std::string> &args,
                              std::chrono::milliseconds timeout) = 0;

    /// Human-readable description used in logs and errors
    [[nodiscard]] virtual std::string Describe() const = 0;
};

/**
 * @brief Real subprocess runner (boost::process)
 *
 * Command line: `executable prefix_args... args...`. The inherited
 * environment is extended with `source_dir` on `search_path_var`, only if
 * that directory exists.
 */
class SubprocessRunner : public ProcessRunner {
  public:
    explicit SubprocessRunner(SimulatorConfig config);

    ProcessOutput Run(const std::vector<std::string> &args,
                      std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::string Describe() const override;

    /// Value of search_path_var for the child, or empty if unchanged
    [[nodiscard]] static std::string ExtendSearchPath(const std::string &existing,
                                                      const std::string &source_dir);

  private:
    SimulatorConfig config_;
};

// =============================================================================
// Output helpers
// =============================================================================

/**
 * @brief Parse stdout as JSON, falling back to {"raw": text}
 *
 * Never throws: simulators may print diagnostics instead of JSON.
 */
[[nodiscard]] inline nlohmann::json ParseJsonOrRaw(const std::string &text) {
    auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return nlohmann::json{{"raw", text}};
    }
    return parsed;
}

/// Trim trailing/leading whitespace (stderr messages)
[[nodiscard]] inline std::string TrimWhitespace(const std::string &s) {
    const char *ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

/**
 * @brief Throw SimulationFailedError when the process exited non-zero
 */
inline void RequireSuccess(const ProcessOutput &out, const std::string &command) {
    if (out.exit_code != 0) {
        throw SimulationFailedError(command, out.exit_code, TrimWhitespace(out.stderr_text));
    }
}

} // namespace prism
