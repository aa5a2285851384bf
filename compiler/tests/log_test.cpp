//! # Logger Unit Tests
//!
//! Tests for the letc logging system: LogFilter parsing, ConsoleSink and
//! FileSink output, JSON records, command-line and LETC_LOG configuration,
//! and thread safety.

#include "letc/log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace letc::log;
namespace fs = std::filesystem;

namespace {

auto make_record(LogLevel level, std::string_view module, const std::string& message)
    -> LogRecord {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = message;
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = epoch_ms();
    return record;
}

} // anonymous namespace

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("parser=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "parser"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "parser"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "parser"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "lexer"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "lexer"));
}

TEST_F(LogFilterTest, ParseAllTrace) {
    filter.parse("*=trace");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "codegen"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "cli"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("lexer=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "parser"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    // No "=level" means everything for that module
    filter.parse("codegen");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "codegen"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "parser"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("parser=trace,lexer=info,cli=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "parser"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "lexer"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "cli"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "driver"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "driver"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("parser=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, MinLevelDefaultOnly) {
    filter.set_default_level(LogLevel::Error);
    EXPECT_EQ(filter.min_level(), LogLevel::Error);
}

TEST_F(LogFilterTest, EmptyFilter) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

// ============================================================================
// Helper: Capture sink that stores records in memory
// ============================================================================

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    std::vector<Entry> records;
};

// ============================================================================
// ConsoleSink
// ============================================================================

TEST(ConsoleSinkTest, TextFormatContainsLevelAndModule) {
    std::ostringstream out;
    ConsoleSink sink(true, out); // colors only ever apply to stderr
    sink.write(make_record(LogLevel::Info, "parser", "hello"));

    std::string text = out.str();
    EXPECT_NE(text.find("INFO "), std::string::npos);
    EXPECT_NE(text.find("[parser] hello\n"), std::string::npos);
    EXPECT_EQ(text.find("\033["), std::string::npos);
}

TEST(ConsoleSinkTest, JsonFormatOutput) {
    std::ostringstream out;
    ConsoleSink sink(false, out);
    sink.set_format(LogFormat::JSON);

    auto record = make_record(LogLevel::Warn, "cli", "test message");
    record.timestamp_ms = 1234567890;
    sink.write(record);

    EXPECT_EQ(out.str(),
              "{\"ts\":1234567890,\"level\":\"WARN\",\"module\":\"cli\",\"msg\":\"test "
              "message\"}\n");
}

TEST(FormatTest, TextLayout) {
    auto line = format_text(make_record(LogLevel::Warn, "lexer", "x"));
    // HH:MM:SS.mmm LEVEL [module] message
    ASSERT_GT(line.size(), 13u);
    EXPECT_EQ(line[12], ' ');
    EXPECT_EQ(line.substr(13), "WARN  [lexer] x\n");
}

TEST(FormatTest, JsonEscapesSpecialCharacters) {
    auto record = make_record(LogLevel::Info, "escape", "line1\nline2\ttab\"quote\\backslash");
    auto json = format_json(record);

    EXPECT_NE(json.find("line1\\nline2\\ttab\\\"quote\\\\backslash"), std::string::npos);
    EXPECT_EQ(json.back(), '\n');
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "letc_log_test.log";
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    void TearDown() override {
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path);
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return content;
    }
};

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "driver", "file sink test"));
        sink.flush();
    }

    ASSERT_TRUE(fs::exists(temp_file));
    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[driver]"), std::string::npos);
    EXPECT_NE(content.find("file sink test"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "m1", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Warn, "m2", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, TruncatesWithoutAppend) {
    {
        FileSink sink(temp_file.string(), false);
        sink.write(make_record(LogLevel::Info, "m1", "first"));
    }
    {
        FileSink sink(temp_file.string(), false);
        sink.write(make_record(LogLevel::Info, "m2", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_EQ(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormatCreatesValidLines) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        ASSERT_TRUE(sink.is_open());

        auto record = make_record(LogLevel::Error, "json_test", "error occurred");
        record.timestamp_ms = 9999999;
        sink.write(record);
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("{\"ts\":9999999"), std::string::npos);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"module\":\"json_test\""), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"error occurred\""), std::string::npos);
}

TEST(FileSinkOpenTest, UnwritablePathIsNotOpen) {
    FileSink sink("/nonexistent-dir/letc/test.log");
    EXPECT_FALSE(sink.is_open());
    // Writing to a closed sink is a no-op
    sink.write(make_record(LogLevel::Info, "x", "y"));
}

// ============================================================================
// NullSink
// ============================================================================

TEST(NullSinkTest, DiscardMessages) {
    NullSink sink;
    sink.write(make_record(LogLevel::Fatal, "test", "discarded"));
    sink.flush();
}

// ============================================================================
// Logger
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    CaptureSink* capture = nullptr;

    void SetUp() override {
        LogConfig config;
        config.console = false;
        config.level = LogLevel::Info;
        Logger::init(config);

        auto sink = std::make_unique<CaptureSink>();
        capture = sink.get();
        Logger::instance().add_sink(std::move(sink));
    }

    void TearDown() override {
        LogConfig config;
        config.console = false;
        config.level = LogLevel::Warn;
        Logger::init(config);
    }
};

TEST_F(LoggerTest, MacrosRespectLevel) {
    LETC_LOG_DEBUG("parser", "hidden");
    LETC_LOG_INFO("parser", "shown " << 42);
    LETC_LOG_ERROR("cli", "also shown");

    ASSERT_EQ(capture->records.size(), 2u);
    EXPECT_EQ(capture->records[0].message, "shown 42");
    EXPECT_EQ(capture->records[0].module, "parser");
    EXPECT_EQ(capture->records[1].level, LogLevel::Error);
}

TEST_F(LoggerTest, FilterEnablesOneModule) {
    Logger::instance().set_filter("parser=trace");

    LETC_LOG_TRACE("parser", "parser trace");
    LETC_LOG_TRACE("lexer", "lexer trace");
    LETC_LOG_INFO("lexer", "lexer info");

    ASSERT_EQ(capture->records.size(), 2u);
    EXPECT_EQ(capture->records[0].message, "parser trace");
    EXPECT_EQ(capture->records[1].message, "lexer info");
}

TEST_F(LoggerTest, SetLevelOff) {
    Logger::instance().set_level(LogLevel::Off);
    LETC_LOG_FATAL("cli", "nothing");
    EXPECT_TRUE(capture->records.empty());
}

TEST(LoggerNoSinkTest, ShouldLogIsFalseWithoutSinks) {
    LogConfig config;
    config.console = false;
    config.level = LogLevel::Trace;
    Logger::init(config);

    EXPECT_FALSE(Logger::instance().should_log(LogLevel::Fatal, "cli"));

    config.level = LogLevel::Warn;
    Logger::init(config);
}

TEST(LoggerInitTest, FilterSpecLowersFastPath) {
    LogConfig config;
    config.console = false;
    config.level = LogLevel::Warn;
    config.filter_spec = "codegen=debug";
    Logger::init(config);
    Logger::instance().add_sink(std::make_unique<NullSink>());

    auto& logger = Logger::instance();
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    EXPECT_TRUE(logger.should_log(LogLevel::Debug, "codegen"));
    EXPECT_FALSE(logger.should_log(LogLevel::Info, "parser"));
    EXPECT_TRUE(logger.should_log(LogLevel::Warn, "parser"));

    config.filter_spec.clear();
    Logger::init(config);
}

// ============================================================================
// Thread Safety: 8 Threads Logging Concurrently
// ============================================================================

TEST_F(LoggerTest, ConcurrentLogging) {
    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);

    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([t, messages_per_thread]() {
            for (int i = 0; i < messages_per_thread; i++) {
                LETC_LOG_INFO("test", "thread-" << t << "-msg-" << i);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(capture->records.size()), num_threads * messages_per_thread);
}

// ============================================================================
// Command-Line Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("LETC_LOG");
    }
    void TearDown() override {
        unsetenv("LETC_LOG");
    }
};

TEST_F(LogOptionsTest, DefaultIsWarn) {
    auto config = parse_log_options({});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_TRUE(config.log_file.empty());
    EXPECT_EQ(config.format, LogFormat::Text);
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse_log_options({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse_log_options({"--verbose"}).level, LogLevel::Info);
    EXPECT_EQ(parse_log_options({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse_log_options({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse_log_options({"-v", "-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse_log_options({"-q"}).level, LogLevel::Error);
    EXPECT_EQ(parse_log_options({"--quiet"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, ExplicitLevelBeatsVerbosity) {
    auto config = parse_log_options({"-vvv", "--log-level=error"});
    EXPECT_EQ(config.level, LogLevel::Error);
}

TEST_F(LogOptionsTest, FileFilterAndFormat) {
    auto config = parse_log_options(
        {"--compile=a.js", "--log-file=out.log", "--log-filter=parser=trace", "--log-format=json"});
    EXPECT_EQ(config.log_file, "out.log");
    EXPECT_EQ(config.filter_spec, "parser=trace");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, EnvironmentLevel) {
    setenv("LETC_LOG", "debug", 1);
    EXPECT_EQ(parse_log_options({}).level, LogLevel::Debug);
}

TEST_F(LogOptionsTest, EnvironmentFilter) {
    setenv("LETC_LOG", "parser=trace,*=error", 1);
    auto config = parse_log_options({});
    EXPECT_EQ(config.filter_spec, "parser=trace,*=error");
    EXPECT_EQ(config.level, LogLevel::Warn);
}

TEST_F(LogOptionsTest, CommandLineBeatsEnvironment) {
    setenv("LETC_LOG", "trace", 1);
    EXPECT_EQ(parse_log_options({"-q"}).level, LogLevel::Error);
    EXPECT_EQ(parse_log_options({"--log-filter=cli=info"}).level, LogLevel::Warn);
}

TEST(IsLogOptionTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("--log-filter=parser=trace"));
    EXPECT_TRUE(is_log_option("--log-file=x.log"));
    EXPECT_TRUE(is_log_option("--log-format=json"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_TRUE(is_log_option("--verbose"));
    EXPECT_TRUE(is_log_option("-v"));
    EXPECT_TRUE(is_log_option("-vvv"));

    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("--compile"));
    EXPECT_FALSE(is_log_option("-vx"));
    EXPECT_FALSE(is_log_option("--es6"));
}

// ============================================================================
// LogLevel helpers
// ============================================================================

TEST(LogLevelHelpersTest, LevelNames) {
    EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(level_name(LogLevel::Off), "OFF");
}

TEST(LogLevelHelpersTest, ParseLevelCaseInsensitive) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("ERROR"), LogLevel::Error);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
}

TEST(LogLevelHelpersTest, ParseUnknownDefaultsToInfo) {
    EXPECT_EQ(parse_level("garbage"), LogLevel::Info);
    EXPECT_EQ(parse_level(""), LogLevel::Info);
}

TEST(LogLevelHelpersTest, TryParseRejectsUnknown) {
    EXPECT_EQ(try_parse_level("fatal").value_or(LogLevel::Off), LogLevel::Fatal);
    EXPECT_EQ(try_parse_level("INFO").value_or(LogLevel::Off), LogLevel::Info);
    EXPECT_FALSE(try_parse_level("Warn").has_value());
    EXPECT_FALSE(try_parse_level("loud").has_value());
}

// ============================================================================
// Timestamp helpers
// ============================================================================

TEST(TimestampTest, GetTimestampFormat) {
    std::string ts = get_timestamp();
    // HH:MM:SS.mmm
    EXPECT_EQ(ts.size(), 12u);
    EXPECT_EQ(ts[2], ':');
    EXPECT_EQ(ts[5], ':');
    EXPECT_EQ(ts[8], '.');
}

TEST(TimestampTest, EpochMsPositive) {
    EXPECT_GT(epoch_ms(), 0);
}
