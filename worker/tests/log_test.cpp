//! # Logger Unit Tests
//!
//! Tests for the worker logging system: LogFilter parsing, FileSink I/O,
//! JSON output, CLI option extraction and capture through custom sinks.

#include "log/log.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace kiln::log;
namespace fs = std::filesystem;

namespace {

/// Records every message it receives.
class CaptureSink : public LogSink {
public:
    explicit CaptureSink(std::vector<std::string>& out) : out_(out) {}

    void write(const LogRecord& record) override {
        out_.push_back(std::string(record.module) + ":" + record.message);
    }
    void flush() override {}

private:
    std::vector<std::string>& out_;
};

auto read_file(const fs::path& path) -> std::string {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("vfs=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "vfs"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "vfs"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "vfs"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "session"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "session"));
}

TEST_F(LogFilterTest, BareModuleMeansTrace) {
    filter.parse("filter");
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "filter"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("worker=off");
    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "worker"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "request"));
}

TEST_F(LogFilterTest, MinLevelSeesOverrides) {
    filter.parse("*=warn,artifact=trace");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST(LogLevelTest, ParseLevelNames) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("WARN"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("bogus"), LogLevel::Info);
    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
}

// ============================================================================
// CLI Option Extraction
// ============================================================================

TEST(ParseLogOptionsTest, SplitsLogArgumentsFromRest) {
    std::vector<std::string> rest;
    auto config = parse_log_options(
        {"--log-level=debug", "--output=a.sum", "--log-format=json", "--source=a.kl"}, rest);

    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.format, LogFormat::JSON);
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest[0], "--output=a.sum");
    EXPECT_EQ(rest[1], "--source=a.kl");
}

TEST(ParseLogOptionsTest, VerbosityFlags) {
    std::vector<std::string> rest;
    EXPECT_EQ(parse_log_options({"-v"}, rest).level, LogLevel::Info);
    EXPECT_EQ(parse_log_options({"-vv"}, rest).level, LogLevel::Debug);
    EXPECT_EQ(parse_log_options({"-vvv"}, rest).level, LogLevel::Trace);
    EXPECT_EQ(parse_log_options({"-q"}, rest).level, LogLevel::Error);
    EXPECT_TRUE(rest.empty());
}

TEST(ParseLogOptionsTest, ExplicitLevelBeatsVerbosity) {
    std::vector<std::string> rest;
    auto config = parse_log_options({"-vvv", "--log-level=error"}, rest);
    EXPECT_EQ(config.level, LogLevel::Error);
}

TEST(ParseLogOptionsTest, WorkerFlagIsNotALogOption) {
    std::vector<std::string> rest;
    parse_log_options({"--persistent_worker", "--log-file=x.log"}, rest);
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0], "--persistent_worker");
}

// ============================================================================
// Sinks
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_dir_;

    void SetUp() override {
        temp_dir_ = kiln::fixtures::unique_temp_dir("kiln_log_test");
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    auto record(LogLevel level, const char* module, const std::string& message) -> LogRecord {
        return LogRecord{level, module, message, __FILE__, __LINE__, 1234};
    }
};

TEST_F(FileSinkTest, WritesTextLines) {
    auto path = temp_dir_ / "text.log";
    {
        FileSink sink(path.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(record(LogLevel::Warn, "session", "cache miss"));
    }
    auto text = read_file(path);
    EXPECT_NE(text.find("WARN"), std::string::npos);
    EXPECT_NE(text.find("[session] cache miss"), std::string::npos);
}

TEST_F(FileSinkTest, WritesEscapedJson) {
    auto path = temp_dir_ / "json.log";
    {
        FileSink sink(path.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(record(LogLevel::Error, "artifact", "bad \"path\"\n"));
    }
    auto text = read_file(path);
    EXPECT_NE(text.find("\"ts\":1234"), std::string::npos);
    EXPECT_NE(text.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(text.find("\"module\":\"artifact\""), std::string::npos);
    EXPECT_NE(text.find("bad \\\"path\\\"\\n"), std::string::npos);
}

TEST(FormatRecordTest, TextCarriesRequestId) {
    LogRecord record{LogLevel::Info, "request", "-> Compiling", __FILE__, __LINE__, 0, 42};
    std::ostringstream os;
    format_record(os, record, LogFormat::Text);
    EXPECT_NE(os.str().find("[request] #42 -> Compiling\n"), std::string::npos);
}

TEST(FormatRecordTest, JsonOmitsRequestIdOutsideRequests) {
    LogRecord record{LogLevel::Debug, "vfs", "tab\there", __FILE__, __LINE__, 7};
    std::ostringstream os;
    format_record(os, record, LogFormat::JSON);
    EXPECT_EQ(os.str(), "{\"ts\":7,\"level\":\"DEBUG\",\"module\":\"vfs\",\"msg\":\"tab\\there\"}\n");
}

TEST(RequestScopeTest, NestsAndRestores) {
    EXPECT_EQ(RequestScope::current(), 0);
    {
        RequestScope outer(5);
        EXPECT_EQ(RequestScope::current(), 5);
        {
            RequestScope inner(9);
            EXPECT_EQ(RequestScope::current(), 9);
        }
        EXPECT_EQ(RequestScope::current(), 5);
    }
    EXPECT_EQ(RequestScope::current(), 0);
}

// ============================================================================
// Logger
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    std::vector<std::string> captured;

    void SetUp() override {
        LogConfig config;
        config.console = false;
        config.level = LogLevel::Info;
        Logger::init(config);
        Logger::instance().add_sink(std::make_unique<CaptureSink>(captured));
    }

    void TearDown() override {
        LogConfig config;
        config.console = false;
        Logger::init(config);
    }
};

TEST_F(LoggerTest, MacroRespectsLevel) {
    KILN_LOG_INFO("worker", "started " << 3);
    KILN_LOG_DEBUG("worker", "hidden");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0], "worker:started 3");
}

TEST_F(LoggerTest, FilterEnablesSingleModule) {
    Logger::instance().set_filter("*=warn,vfs=trace");

    KILN_LOG_TRACE("vfs", "resolved");
    KILN_LOG_INFO("session", "hidden");
    KILN_LOG_WARN("session", "shown");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], "vfs:resolved");
    EXPECT_EQ(captured[1], "session:shown");
}

TEST_F(LoggerTest, RecordsTakeRequestIdFromScope) {
    class IdSink : public LogSink {
    public:
        explicit IdSink(std::vector<int64_t>& ids) : ids_(ids) {}
        void write(const LogRecord& record) override {
            ids_.push_back(record.request_id);
        }
        void flush() override {}

    private:
        std::vector<int64_t>& ids_;
    };

    std::vector<int64_t> ids;
    Logger::instance().add_sink(std::make_unique<IdSink>(ids));
    KILN_LOG_INFO("worker", "idle");
    {
        RequestScope scope(17);
        KILN_LOG_INFO("worker", "serving");
    }

    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], 0);
    EXPECT_EQ(ids[1], 17);
}

TEST_F(LoggerTest, ClearSinksSilences) {
    Logger::instance().clear_sinks();
    KILN_LOG_ERROR("worker", "dropped");
    EXPECT_TRUE(captured.empty());
}
