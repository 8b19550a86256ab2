//! # Logger Unit Tests
//!
//! LogFilter parsing, line formatting, level filtering through the global
//! logger, command-line option parsing and concurrent logging.

#include "log/log.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace forge::log;
using forge::test::LogCapture;
using forge::test::TempDir;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("scheduler=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "scheduler"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "scheduler"));

    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "cache"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "cache"));
}

TEST_F(LogFilterTest, BareModuleNameEnablesTrace) {
    filter.parse("cache");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "cache"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "scheduler"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("generate=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "generate"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "build"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("scheduler=trace,*=error");

    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptyFilterUsesInfo) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

TEST(LogLevelTest, ParseLevelNames) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("bogus"), LogLevel::Info);
    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
}

// ============================================================================
// Formatting
// ============================================================================

TEST(LogFormatTest, JsonLineEscapesMessage) {
    LogRecord record{LogLevel::Warn, "cache", "bad \"entry\"\n\tat\\path", "f.cpp", 1, 1234};

    std::string line = format_json_line(record);

    EXPECT_EQ(line, "{\"ts\":1234,\"level\":\"WARN\",\"module\":\"cache\","
                    "\"msg\":\"bad \\\"entry\\\"\\n\\tat\\\\path\"}");
}

TEST(LogFormatTest, JsonLineEscapesControlCharacters) {
    LogRecord record{LogLevel::Info, "generate", std::string("a\bb\x01" "c\x1f", 6), "f.cpp", 1, 7};

    std::string line = format_json_line(record);

    EXPECT_EQ(line, "{\"ts\":7,\"level\":\"INFO\",\"module\":\"generate\","
                    "\"msg\":\"a\\u0008b\\u0001c\\u001f\"}");
}

TEST(LogFormatTest, TextLineHasLevelAndModule) {
    LogRecord record{LogLevel::Info, "scheduler", "Launching pkg.a", "f.cpp", 1, 0};

    std::string line = format_text_line(record);

    EXPECT_NE(line.find("INFO  [scheduler] Launching pkg.a"), std::string::npos);
}

// ============================================================================
// Global Logger
// ============================================================================

TEST(LoggerTest, MacrosRespectLevel) {
    LogCapture capture(LogLevel::Info);

    FORGE_LOG_DEBUG("scheduler", "hidden " << 1);
    FORGE_LOG_INFO("scheduler", "shown " << 2);
    FORGE_LOG_ERROR("cache", "broken " << 3);

    auto lines = capture.sink().lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "INFO [scheduler] shown 2");
    EXPECT_EQ(lines[1], "ERROR [cache] broken 3");
}

TEST(LoggerTest, FilterOverridesPerModule) {
    LogCapture capture(LogLevel::Warn);
    Logger::instance().set_filter("cache=debug,*=warn");

    FORGE_LOG_DEBUG("cache", "cache detail");
    FORGE_LOG_DEBUG("scheduler", "scheduler detail");

    EXPECT_TRUE(capture.contains("cache detail"));
    EXPECT_FALSE(capture.contains("scheduler detail"));
}

TEST(LoggerTest, FileSinkWritesJsonLines) {
    TempDir dir;
    auto path = dir.path() / "forge.log";
    {
        FileSink sink(path.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.set_format(LogFormat::JSON);
        sink.write(LogRecord{LogLevel::Error, "build", "disk full", "f.cpp", 1, 7});
    }

    EXPECT_EQ(dir.read("forge.log"),
              "{\"ts\":7,\"level\":\"ERROR\",\"module\":\"build\",\"msg\":\"disk full\"}\n");
}

TEST(LoggerTest, ConcurrentWritersKeepEveryRecord) {
    LogCapture capture(LogLevel::Info);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 50; ++i) {
                FORGE_LOG_INFO("generate", "worker " << t << " record " << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(capture.sink().lines().size(), 200u);
}

// ============================================================================
// Command-Line Options
// ============================================================================

TEST(LogOptionsTest, VerbosityFlags) {
    char prog[] = "forge";
    char cmd[] = "build";
    char vv[] = "-vv";
    char* argv[] = {prog, cmd, vv};

    auto config = parse_log_options(3, argv);

    EXPECT_EQ(config.level, LogLevel::Debug);
}

TEST(LogOptionsTest, ExplicitLevelBeatsVerbosity) {
    char prog[] = "forge";
    char level[] = "--log-level=error";
    char v[] = "-v";
    char format[] = "--log-format=json";
    char* argv[] = {prog, level, v, format};

    auto config = parse_log_options(4, argv);

    EXPECT_EQ(config.level, LogLevel::Error);
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST(LogOptionsTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("-v"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("--log-filter=cache=trace"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_FALSE(is_log_option("--verbose-ish"));
    EXPECT_FALSE(is_log_option("--jobs"));
    EXPECT_FALSE(is_log_option("-j"));
}
