/**
 * @file test_logging.cpp
 * @brief Unit tests for the log service, sinks and logging setup
 */

#include <prism/io/LogService.hpp>
#include <prism/io/LogSetup.hpp>
#include <prism/io/LogSink.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace prism;

// =============================================================================
// LogContext
// =============================================================================

TEST(LogContext, FullPathTruncatesRunId) {
    LogContext ctx{"sweep", "0123456789abcdef"};
    EXPECT_EQ(ctx.FullPath(), "sweep/01234567");
    EXPECT_EQ((LogContext{"cache", ""}.FullPath()), "cache");
}

TEST(LogContext, ScopedContextRestores) {
    LogContextManager::ClearContext();
    {
        LogContextManager::ScopedContext outer("optimizer", "run-a");
        {
            LogContextManager::ScopedContext inner("evaluation");
            EXPECT_EQ(LogContextManager::GetContext().component, "evaluation");
        }
        EXPECT_EQ(LogContextManager::GetContext().component, "optimizer");
        EXPECT_EQ(LogContextManager::GetContext().run_id, "run-a");
    }
    EXPECT_FALSE(LogContextManager::GetContext().IsSet());
}

TEST(LogContext, ThreadLocal) {
    LogContextManager::ScopedContext ctx("coordinator");
    std::string seen = "unset";
    std::thread t([&seen] { seen = LogContextManager::GetContext().component; });
    t.join();
    EXPECT_EQ(seen, "");
}

// =============================================================================
// LogService
// =============================================================================

TEST(LogService, MinLevelFilters) {
    LogService service;
    std::vector<LogEntry> captured;
    service.AddSink(LogSinks::Callback([&](const LogEntry &e) { captured.push_back(e); }));
    service.SetMinLevel(LogLevel::Warning);

    service.Info("dropped");
    service.Warning("kept");
    service.Error("kept too");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0].message, "kept");
    EXPECT_EQ(service.WarningCount(), 1u);
    EXPECT_EQ(service.ErrorCount(), 1u);
}

TEST(LogService, PerSinkLevels) {
    LogService service;
    service.SetMinLevel(LogLevel::Debug);
    int all = 0;
    int errors_only = 0;
    service.AddSink(LogSinks::Callback([&](const LogEntry &) { ++all; }), LogLevel::Debug);
    service.AddSink(LogSinks::Callback([&](const LogEntry &) { ++errors_only; }), LogLevel::Error);

    service.Debug("a");
    service.Info("b");
    service.Error("c");
    EXPECT_EQ(all, 3);
    EXPECT_EQ(errors_only, 1);
}

TEST(LogService, EntriesCarryContext) {
    LogService service;
    std::vector<LogEntry> seen;
    service.AddSink(LogSinks::Callback([&](const LogEntry &e) { seen.push_back(e); }));
    {
        LogContextManager::ScopedContext ctx("sweep", "run-42");
        service.Info("started");
        ASSERT_EQ(seen.size(), 1u);
    }
    EXPECT_EQ(seen[0].context.run_id, "run-42");
    EXPECT_NE(seen[0].Format().find("[INF] [sweep/run-42] started"), std::string::npos);
}

// =============================================================================
// Setup
// =============================================================================

TEST(LogSetup, JsonLinesSinkWritesRecords) {
    auto path = std::filesystem::temp_directory_path() / "prism_log_setup_test.jsonl";
    std::filesystem::remove(path);

    LogService service;
    LoggingConfig cfg;
    cfg.quiet = true;
    cfg.json_path = path.string();
    ConfigureLogging(cfg, service);
    EXPECT_EQ(service.GetMinLevel(), LogLevel::Debug);

    {
        LogContextManager::ScopedContext ctx("cache");
        service.Debug("fell back to local");
    }

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    auto record = nlohmann::json::parse(line);
    EXPECT_EQ(record["level"], "DBG");
    EXPECT_EQ(record["component"], "cache");
    EXPECT_EQ(record["message"], "fell back to local");
    std::filesystem::remove(path);
}

TEST(LogSetup, ConsoleOnlyUsesConsoleLevel) {
    LogService service;
    LoggingConfig cfg;
    cfg.console_level = LogLevel::Warning;
    ConfigureLogging(cfg, service);
    EXPECT_EQ(service.GetMinLevel(), LogLevel::Warning);
}
