#include <gtest/gtest.h>
#include "core/logging.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

class LoggingTest : public ::testing::Test {
protected:
    std::string logs_dir;

    void SetUp() override {
        logs_dir = (fs::temp_directory_path() / ("relaycraft-logs-" + std::to_string(::getpid()))).string();
        fs::remove_all(logs_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(logs_dir, ec);
    }

    std::vector<std::string> read_lines(const std::string& file) {
        std::vector<std::string> out;
        std::ifstream fin(fs::path(logs_dir) / file);
        std::string line;
        while (std::getline(fin, line)) out.push_back(line);
        return out;
    }
};

TEST(LogSinkNames, FileForDomain) {
    EXPECT_EQ(FileLogSink::file_for_domain("engine"), "engine.log");
    EXPECT_EQ(FileLogSink::file_for_domain("proxy"), "engine.log");
    EXPECT_EQ(FileLogSink::file_for_domain("script"), "script.log");
    EXPECT_EQ(FileLogSink::file_for_domain("plugin"), "plugin.log");
    EXPECT_EQ(FileLogSink::file_for_domain("audit"), "audit.log");
    EXPECT_EQ(FileLogSink::file_for_domain("crash"), "crash.log");
    EXPECT_EQ(FileLogSink::file_for_domain("something"), "custom.log");
}

TEST(LogSinkNames, DomainPrefix) {
    EXPECT_EQ(FileLogSink::with_domain_prefix("crash", "engine died"), "[CRASH] engine died");
    EXPECT_EQ(FileLogSink::with_domain_prefix("script", "[SCRIPT] hi"), "[SCRIPT] hi");
    EXPECT_EQ(FileLogSink::with_domain_prefix("engine", "listening"), "listening");
}

TEST_F(LoggingTest, WritesTimestampedLinesPerDomain) {
    {
        FileLogSink sink(logs_dir);
        sink.write("engine", "proxy up");
        sink.write("crash", "it broke");
        sink.write("script", "[SCRIPT] hello");
    }

    auto engine = read_lines("engine.log");
    ASSERT_EQ(engine.size(), 1u);
    EXPECT_EQ(engine[0].front(), '[');
    EXPECT_NE(engine[0].find("] proxy up"), std::string::npos);

    auto crash = read_lines("crash.log");
    ASSERT_EQ(crash.size(), 1u);
    EXPECT_NE(crash[0].find("[CRASH] it broke"), std::string::npos);

    auto script = read_lines("script.log");
    ASSERT_EQ(script.size(), 1u);
    // Already tagged lines are not tagged twice
    EXPECT_EQ(script[0].find("[SCRIPT] [SCRIPT]"), std::string::npos);
}

TEST_F(LoggingTest, WriteToUnwritableDirDoesNotThrow) {
    FileLogSink sink("/proc/relaycraft-cannot-exist");
    EXPECT_NO_THROW(sink.write("engine", "dropped"));
}

TEST_F(LoggingTest, TailReturnsLastLines) {
    fs::create_directories(logs_dir);
    {
        std::ofstream fout(fs::path(logs_dir) / "engine.log");
        for (int i = 1; i <= 10; ++i) fout << "line " << i << "\n";
    }

    auto tail = tail_domain_log(logs_dir, "proxy", 3);
    ASSERT_TRUE(tail.success);
    ASSERT_EQ(tail.lines.size(), 3u);
    EXPECT_EQ(tail.lines[0], "line 8");
    EXPECT_EQ(tail.lines[2], "line 10");
}

TEST_F(LoggingTest, TailMissingFile) {
    auto tail = tail_domain_log(logs_dir, "crash", 50);
    ASSERT_TRUE(tail.success);
    ASSERT_EQ(tail.lines.size(), 1u);
    EXPECT_EQ(tail.lines[0], "Log file crash.log not found.");
}

TEST_F(LoggingTest, TailUnknownName) {
    auto tail = tail_domain_log(logs_dir, "kernel", 50);
    EXPECT_FALSE(tail.success);
    EXPECT_NE(tail.error.find("kernel"), std::string::npos);
}

TEST_F(LoggingTest, InitLoggingCreatesAppLog) {
    init_logging(logs_dir, true);
    spdlog::info("hello from test");
    spdlog::default_logger()->flush();
    EXPECT_TRUE(fs::exists(fs::path(logs_dir) / "app.log"));
    // Leave a stderr-only logger behind
    init_logging("", false);
}
