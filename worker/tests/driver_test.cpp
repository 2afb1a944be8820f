//! # Driver Tests
//!
//! `kiln_main` as the process sees it: argv arrays in, exit codes and
//! stderr text out, with stdin/stdout redirected for persistent mode.

#include "driver/driver.hpp"
#include "json/json_value.hpp"
#include "log/log.hpp"
#include "test_support.hpp"
#include "worker/work_protocol.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using namespace kiln;
using namespace kiln::fixtures;

namespace {

/// Points a standard stream at another buffer until destroyed.
class StreamRedirect {
public:
    StreamRedirect(std::ios& stream, std::streambuf* buffer)
        : stream_(stream), saved_(stream.rdbuf(buffer)) {}
    ~StreamRedirect() {
        stream_.rdbuf(saved_);
    }

    StreamRedirect(const StreamRedirect&) = delete;
    auto operator=(const StreamRedirect&) -> StreamRedirect& = delete;

private:
    std::ios& stream_;
    std::streambuf* saved_;
};

} // namespace

class DriverTest : public ::testing::Test {
protected:
    fs::path temp_dir_;
    std::ostringstream err_;

    void SetUp() override {
        temp_dir_ = kiln::fixtures::unique_temp_dir("kiln_driver_test");
        fs::remove_all(temp_dir_);
        write_summary(platform_graph(), temp_dir_ / "platform.sum");
        write_file(temp_dir_ / "src" / "a.kl", "const a: Int = 1;");
        write_file(temp_dir_ / "src" / "b.kl", "let b: Int = \"wrong\";");
    }

    void TearDown() override {
        // Closes any log file sink before the directory goes away.
        log::Logger::init(log::LogConfig{});
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    auto path(const std::string& name) const -> std::string {
        return (temp_dir_ / name).generic_string();
    }

    auto compile_args(const std::string& source, const std::string& output) const
        -> std::vector<std::string> {
        return {"kiln", "--platform-summary=" + path("platform.sum"),
                "--multi-root=" + path("src"), "--source=multi-root:///" + source,
                "--output=" + path(output)};
    }

    /// Runs `kiln_main` with stderr captured into `err_`.
    auto run_main(std::vector<std::string> args) -> int {
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        StreamRedirect capture(std::cerr, err_.rdbuf());
        return ::kiln_main(static_cast<int>(args.size()), argv.data());
    }

    auto stderr_text() const -> std::string {
        return err_.str();
    }
};

// ============================================================================
// Single-shot
// ============================================================================

TEST_F(DriverTest, HelpExitsZero) {
    EXPECT_EQ(run_main({"kiln", "--help"}), 0);
    EXPECT_EQ(stderr_text().rfind("Usage: kiln", 0), 0u);
}

TEST_F(DriverTest, SuccessfulCompileExitsZero) {
    EXPECT_EQ(run_main(compile_args("a.kl", "a.sum")), 0) << stderr_text();
    EXPECT_TRUE(fs::exists(temp_dir_ / "a.sum"));
}

TEST_F(DriverTest, CompileErrorsExitFifteen) {
    EXPECT_EQ(run_main(compile_args("b.kl", "b.sum")), 15);
    EXPECT_NE(stderr_text().find("Error[CompileDiagnostic]: Expected 'Int' but found 'String'"),
              std::string::npos)
        << stderr_text();
    EXPECT_FALSE(fs::exists(temp_dir_ / "b.sum"));
}

TEST_F(DriverTest, UnknownOptionExitsFifteen) {
    EXPECT_EQ(run_main({"kiln", "--bogus"}), 15);
    EXPECT_NE(stderr_text().find("Error[OptionParseError]"), std::string::npos);
}

// ============================================================================
// Argument files
// ============================================================================

TEST_F(DriverTest, ArgumentFileSuppliesTheRequest) {
    auto args = compile_args("a.kl", "a.sum");
    std::string lines;
    for (size_t i = 1; i < args.size(); ++i) {
        lines += args[i] + "\n";
    }
    write_file(temp_dir_ / "args.txt", lines);

    EXPECT_EQ(run_main({"kiln", "@" + path("args.txt")}), 0) << stderr_text();
    EXPECT_TRUE(fs::exists(temp_dir_ / "a.sum"));
}

TEST_F(DriverTest, UnreadableArgumentFileIsARequestFailure) {
    EXPECT_EQ(run_main({"kiln", "@" + path("missing.txt")}), 15);
    EXPECT_NE(stderr_text().find("Error[ArgFileUnreadable]: Failed to read file specified by @" +
                                 path("missing.txt")),
              std::string::npos)
        << stderr_text();
}

TEST_F(DriverTest, ArgumentFileIsExpandedOnce) {
    // The trailing line names no file; expanding a second time would fail.
    write_file(temp_dir_ / "args.txt", "--help\n@literal-at-arg\n");
    std::string arg_file = "@" + path("args.txt");

    EXPECT_EQ(run_main({"kiln", arg_file}), 0) << stderr_text();
    EXPECT_EQ(stderr_text().find("ArgFileUnreadable"), std::string::npos);

    // The same argument in persistent mode gives the same answer.
    json::JsonArray arguments;
    arguments.push_back(json::JsonValue(arg_file));
    json::JsonObject obj;
    obj["arguments"] = json::JsonValue(std::move(arguments));
    obj["requestId"] = json::JsonValue(1);

    std::istringstream in(json::JsonValue(std::move(obj)).to_string() + "\n");
    std::ostringstream out;
    {
        StreamRedirect input(std::cin, in.rdbuf());
        StreamRedirect output(std::cout, out.rdbuf());
        EXPECT_EQ(run_main({"kiln", "--persistent_worker"}), 0);
    }
    std::istringstream lines(out.str());
    std::string line;
    ASSERT_TRUE(std::getline(lines, line));
    auto response = worker::parse_response(line);
    ASSERT_TRUE(is_ok(response)) << line;
    EXPECT_EQ(unwrap(response).exit_code, 0) << unwrap(response).output;
}

// ============================================================================
// Logging options
// ============================================================================

TEST_F(DriverTest, LoggingOptionsNeverReachTheRequest) {
    auto args = compile_args("a.kl", "a.sum");
    args.push_back("--log-level=debug");
    args.push_back("--log-file=" + path("kiln.log"));
    args.push_back("-q");

    EXPECT_EQ(run_main(args), 0) << stderr_text();
    EXPECT_EQ(stderr_text().find("Could not find an option"), std::string::npos);
    EXPECT_TRUE(fs::exists(temp_dir_ / "a.sum"));
    EXPECT_TRUE(fs::exists(temp_dir_ / "kiln.log"));
}

TEST_F(DriverTest, LoggingOptionsBesideThePersistentFlag) {
    std::istringstream in("");
    std::ostringstream out;
    StreamRedirect input(std::cin, in.rdbuf());
    StreamRedirect output(std::cout, out.rdbuf());

    EXPECT_EQ(run_main({"kiln", "-v", "--persistent_worker", "--log-format=json"}), 0)
        << stderr_text();
    EXPECT_TRUE(out.str().empty());
}

// ============================================================================
// Persistent mode
// ============================================================================

TEST_F(DriverTest, PersistentFlagMustBeAlone) {
    EXPECT_EQ(run_main({"kiln", "--persistent_worker", "--help"}), 1);
    EXPECT_NE(stderr_text().find("--persistent_worker must be the only argument"),
              std::string::npos);
}

TEST_F(DriverTest, PersistentFlagFromArgumentFileMustBeAlone) {
    write_file(temp_dir_ / "args.txt", "--persistent_worker\n--help\n");
    EXPECT_EQ(run_main({"kiln", "@" + path("args.txt")}), 1);
    EXPECT_NE(stderr_text().find("must be the only argument"), std::string::npos);
}

TEST_F(DriverTest, PersistentModeServesStdin) {
    auto request = [this](int64_t id, const std::string& source, const std::string& output) {
        auto args = compile_args(source, output);
        json::JsonArray arguments;
        for (size_t i = 1; i < args.size(); ++i) {
            arguments.push_back(json::JsonValue(args[i]));
        }
        json::JsonObject obj;
        obj["arguments"] = json::JsonValue(std::move(arguments));
        obj["requestId"] = json::JsonValue(id);
        return json::JsonValue(std::move(obj)).to_string() + "\n";
    };

    std::istringstream in(request(1, "a.kl", "a.sum") + request(2, "b.kl", "b.sum"));
    std::ostringstream out;
    {
        StreamRedirect input(std::cin, in.rdbuf());
        StreamRedirect output(std::cout, out.rdbuf());
        EXPECT_EQ(run_main({"kiln", "--persistent_worker"}), 0) << stderr_text();
    }

    std::vector<worker::WorkResponse> responses;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        auto parsed = worker::parse_response(line);
        ASSERT_TRUE(is_ok(parsed)) << line;
        responses.push_back(unwrap(parsed));
    }
    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0].request_id, 1);
    EXPECT_EQ(responses[0].exit_code, 0) << responses[0].output;
    EXPECT_EQ(responses[1].request_id, 2);
    EXPECT_EQ(responses[1].exit_code, 15);
    EXPECT_TRUE(fs::exists(temp_dir_ / "a.sum"));
    EXPECT_FALSE(fs::exists(temp_dir_ / "b.sum"));
}
