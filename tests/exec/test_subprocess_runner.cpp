/**
 * @file test_subprocess_runner.cpp
 * @brief Tests for SubprocessRunner using /bin/sh as the simulator
 */

#include <prism/exec/ProcessRunner.hpp>

#include <gtest/gtest.h>

#include <filesystem>

using namespace prism;
using namespace std::chrono_literals;

namespace {

SimulatorConfig ShellConfig() {
    SimulatorConfig cfg;
    cfg.executable = "/bin/sh";
    cfg.prefix_args = {"-c"};
    cfg.source_dir = "";
    return cfg;
}

} // namespace

// =============================================================================
// Run
// =============================================================================

TEST(SubprocessRunner, CapturesStdoutAndExitCode) {
    SubprocessRunner runner(ShellConfig());
    auto out = runner.Run({"printf '{\"logic_margin\": 0.5}'"}, 10s);
    EXPECT_EQ(out.exit_code, 0);
    EXPECT_EQ(out.stdout_text, "{\"logic_margin\": 0.5}");
    EXPECT_TRUE(out.stderr_text.empty());
}

TEST(SubprocessRunner, NonZeroExitIsReportedNotThrown) {
    SubprocessRunner runner(ShellConfig());
    auto out = runner.Run({"echo bad beta >&2; exit 3"}, 10s);
    EXPECT_EQ(out.exit_code, 3);
    EXPECT_EQ(TrimWhitespace(out.stderr_text), "bad beta");
    EXPECT_THROW(RequireSuccess(out, "cascade"), SimulationFailedError);
}

TEST(SubprocessRunner, TimeoutKillsProcess) {
    SubprocessRunner runner(ShellConfig());
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(runner.Run({"sleep 5"}, 200ms), TimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
}

TEST(SubprocessRunner, MissingExecutable) {
    auto cfg = ShellConfig();
    cfg.executable = "prism-no-such-simulator";
    SubprocessRunner runner(cfg);
    EXPECT_THROW(runner.Run({"cascade"}, 1s), SimulationFailedError);
}

TEST(SubprocessRunner, ExtendsSearchPathForChild) {
    auto dir = std::filesystem::temp_directory_path();
    auto cfg = ShellConfig();
    cfg.search_path_var = "PRISM_TEST_SEARCH_PATH";
    cfg.source_dir = dir.string();
    SubprocessRunner runner(cfg);

    auto out = runner.Run({"printf %s \"$PRISM_TEST_SEARCH_PATH\""}, 10s);
    EXPECT_EQ(out.stdout_text, dir.string());
}

TEST(SubprocessRunner, DescribeIncludesPrefix) {
    SubprocessRunner runner(ShellConfig());
    EXPECT_EQ(runner.Describe(), "/bin/sh -c");
}

// =============================================================================
// Helpers
// =============================================================================

TEST(SubprocessRunner, ExtendSearchPathOnlyForExistingDirectory) {
    auto dir = std::filesystem::temp_directory_path().string();
    EXPECT_EQ(SubprocessRunner::ExtendSearchPath("", dir), dir);
    EXPECT_EQ(SubprocessRunner::ExtendSearchPath("/opt/lib", dir), "/opt/lib:" + dir);
    EXPECT_EQ(SubprocessRunner::ExtendSearchPath("/opt/lib", "/no/such/prism/dir"), "");
    EXPECT_EQ(SubprocessRunner::ExtendSearchPath("/opt/lib", ""), "");
}

TEST(ProcessOutputHelpers, ParseJsonOrRaw) {
    EXPECT_EQ(ParseJsonOrRaw("{\"a\": 1}")["a"], 1);
    auto raw = ParseJsonOrRaw("margin = 0.3");
    ASSERT_TRUE(raw.contains("raw"));
    EXPECT_EQ(raw["raw"], "margin = 0.3");
}

TEST(ProcessOutputHelpers, TrimWhitespace) {
    EXPECT_EQ(TrimWhitespace("  x y \n"), "x y");
    EXPECT_EQ(TrimWhitespace(" \t\n"), "");
}
