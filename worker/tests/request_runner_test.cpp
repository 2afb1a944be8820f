//! # Request Runner Tests
//!
//! End-to-end requests against real files: successful summaries, compile
//! errors, help, missing options, `@file` arguments and filtering.

#include "driver/request_runner.hpp"
#include "service/source_compiler.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace kiln;
using namespace kiln::driver;
using namespace kiln::fixtures;

namespace {

/// Counts acquisitions and delegates to a fresh provider.
class CountingProvider : public session::SessionProvider {
public:
    explicit CountingProvider(Rc<session::SessionProvider> inner) : inner_(std::move(inner)) {}

    auto acquire(const session::SessionInputs& inputs, Rc<const vfs::FileSystem> overlay)
        -> Result<session::CompilationSession, diag::Diagnostic> override {
        ++calls;
        return inner_->acquire(inputs, std::move(overlay));
    }

    size_t calls = 0;

private:
    Rc<session::SessionProvider> inner_;
};

class ThrowingProvider : public session::SessionProvider {
public:
    auto acquire(const session::SessionInputs&, Rc<const vfs::FileSystem>)
        -> Result<session::CompilationSession, diag::Diagnostic> override {
        throw std::runtime_error("provider exploded");
    }
};

} // namespace

class RequestRunnerTest : public ::testing::Test {
protected:
    fs::path temp_dir_;
    Rc<vfs::StandardFileSystem> physical = make_rc<vfs::StandardFileSystem>();
    Rc<CountingProvider> provider;
    Box<RequestRunner> runner;

    void SetUp() override {
        temp_dir_ = kiln::fixtures::unique_temp_dir("kiln_request_runner_test");
        fs::remove_all(temp_dir_);
        fs::create_directories(temp_dir_);
        write_summary(platform_graph(), temp_dir_ / "platform.sum");

        provider = make_rc<CountingProvider>(make_rc<session::FreshSessionProvider>(
            make_rc<service::SourceCompiler>(), physical));
        runner = make_box<RequestRunner>(provider, physical);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    auto path(const std::string& name) const -> std::string {
        return (temp_dir_ / name).generic_string();
    }

    auto base_args() const -> std::vector<std::string> {
        return {"--platform-summary=" + path("platform.sum"), "--multi-root=" + path("src"),
                "--output=" + path("out/a.sum")};
    }
};

TEST_F(RequestRunnerTest, SuccessfulSummary) {
    write_file(temp_dir_ / "src" / "a.kl", "import \"platform:core\";\nconst a: Int = version;");
    auto args = base_args();
    args.push_back("--source=multi-root:///a.kl");

    auto result = runner->run(args);
    EXPECT_TRUE(result.succeeded) << result.output();
    EXPECT_EQ(result.exit_code(), 0);
    EXPECT_EQ(result.output(), "");
    ASSERT_TRUE(result.artifact_size.has_value());
    EXPECT_EQ(fs::file_size(path("out/a.sum")), *result.artifact_size);
    EXPECT_EQ(runner->trace(),
              (std::vector<RequestState>{RequestState::Parsing, RequestState::Resolving,
                                         RequestState::Compiling, RequestState::Writing,
                                         RequestState::Done}));

    auto decoded = kernel::decode_graph(read_file(path("out/a.sum")));
    ASSERT_TRUE(is_ok(decoded));
    EXPECT_EQ(unwrap(decoded).graph.top_level_uris(),
              std::vector<std::string>{"multi-root:///a.kl"});
}

TEST_F(RequestRunnerTest, CompileErrorFailsWithoutOutput) {
    write_file(temp_dir_ / "src" / "a.kl", "let a: Int = \"text\";");
    auto args = base_args();
    args.push_back("--source=multi-root:///a.kl");

    auto result = runner->run(args);
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.exit_code(), 15);
    EXPECT_NE(result.output().find("multi-root:///a.kl:1:14: Error[CompileDiagnostic]: Expected 'Int' but found "
                                   "'String'"),
              std::string::npos);
    EXPECT_FALSE(fs::exists(path("out/a.sum")));
    EXPECT_EQ(runner->trace().back(), RequestState::Done);
}

TEST_F(RequestRunnerTest, HelpNeverTouchesTheProvider) {
    auto result = runner->run({"--help"});
    EXPECT_TRUE(result.succeeded);
    EXPECT_EQ(result.exit_code(), 0);
    EXPECT_EQ(result.output().rfind("Usage: kiln", 0), 0u);
    EXPECT_EQ(provider->calls, 0u);
    EXPECT_EQ(runner->trace(),
              (std::vector<RequestState>{RequestState::Parsing, RequestState::Done}));
}

TEST_F(RequestRunnerTest, MissingPlatformSummary) {
    auto result = runner->run({"--output=" + path("x.sum"), "--source=multi-root:///a.kl"});
    EXPECT_EQ(result.exit_code(), 15);
    EXPECT_NE(result.output().find("Missing required option \"--platform-summary\"."),
              std::string::npos);
    EXPECT_EQ(provider->calls, 0u);
}

TEST_F(RequestRunnerTest, UnreadablePlatformSummary) {
    auto result = runner->run({"--platform-summary=" + path("none.sum"),
                               "--output=" + path("x.sum"), "--source=multi-root:///a.kl"});
    EXPECT_EQ(result.exit_code(), 15);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].kind, diag::ErrorKind::ResolutionError);
    EXPECT_EQ(provider->calls, 1u);
}

TEST_F(RequestRunnerTest, OptionErrorIsReported) {
    auto result = runner->run({"--bogus"});
    EXPECT_EQ(result.exit_code(), 15);
    EXPECT_EQ(result.output(), "Error[OptionParseError]: Could not find an option named \"bogus\".\n");
}

TEST_F(RequestRunnerTest, ArgumentFile) {
    write_file(temp_dir_ / "src" / "a.kl", "const a: Int = 1;");
    std::string lines;
    for (const auto& arg : base_args()) {
        lines += arg + "\n";
    }
    lines += "--source=multi-root:///a.kl\n";
    write_file(temp_dir_ / "request.args", lines);

    auto result = runner->run({"@" + path("request.args")});
    EXPECT_TRUE(result.succeeded) << result.output();
    EXPECT_TRUE(fs::exists(path("out/a.sum")));
}

TEST_F(RequestRunnerTest, MissingArgumentFile) {
    auto result = runner->run({"@" + path("none.args")});
    EXPECT_EQ(result.exit_code(), 15);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].kind, diag::ErrorKind::ArgFileUnreadable);
}

TEST_F(RequestRunnerTest, ExcludeNonSourcesFiltersImports) {
    write_file(temp_dir_ / "src" / "a.kl", "import \"b.kl\";\nconst a: Int = b;");
    write_file(temp_dir_ / "src" / "b.kl", "const b: Int = 2;");
    auto args = base_args();
    args.push_back("--source=multi-root:///a.kl");
    args.push_back("--exclude-non-sources");

    auto result = runner->run(args);
    ASSERT_TRUE(result.succeeded) << result.output();
    EXPECT_EQ(runner->trace()[3], RequestState::Filtering);

    auto decoded = kernel::decode_graph(read_file(path("out/a.sum")));
    ASSERT_TRUE(is_ok(decoded));
    const auto& graph = unwrap(decoded).graph;
    EXPECT_EQ(graph.top_level_uris(), std::vector<std::string>{"multi-root:///a.kl"});
    const auto* b = graph.names().lookup({"multi-root:///b.kl", "b"});
    ASSERT_NE(b, nullptr);
    EXPECT_FALSE(b->owner.has_value());
}

TEST_F(RequestRunnerTest, WithoutExcludeImportsAreKept) {
    write_file(temp_dir_ / "src" / "a.kl", "import \"b.kl\";\nconst a: Int = b;");
    write_file(temp_dir_ / "src" / "b.kl", "const b: Int = 2;");
    auto args = base_args();
    args.push_back("--source=multi-root:///a.kl");

    auto result = runner->run(args);
    ASSERT_TRUE(result.succeeded) << result.output();
    auto decoded = kernel::decode_graph(read_file(path("out/a.sum")));
    ASSERT_TRUE(is_ok(decoded));
    EXPECT_EQ(unwrap(decoded).graph.top_level().size(), 2u);
}

TEST_F(RequestRunnerTest, FullCompileIgnoresExclude) {
    write_file(temp_dir_ / "src" / "a.kl", "import \"b.kl\";\nconst a: Int = b;");
    write_file(temp_dir_ / "src" / "b.kl", "const b: Int = 2;");
    auto args = base_args();
    args.push_back("--source=multi-root:///a.kl");
    args.push_back("--exclude-non-sources");
    args.push_back("--no-summary-only");

    auto result = runner->run(args);
    ASSERT_TRUE(result.succeeded) << result.output();
    for (auto state : runner->trace()) {
        EXPECT_NE(state, RequestState::Filtering);
    }
    auto decoded = kernel::decode_graph(read_file(path("out/a.sum")));
    ASSERT_TRUE(is_ok(decoded));
    EXPECT_FALSE(unwrap(decoded).summary);
    EXPECT_EQ(unwrap(decoded).graph.top_level().size(), 2u);
}

TEST_F(RequestRunnerTest, ExceptionsBecomeInternalErrors) {
    RequestRunner throwing(make_rc<ThrowingProvider>(), physical);
    auto result = throwing.run(base_args());
    EXPECT_EQ(result.exit_code(), 15);
    ASSERT_FALSE(result.diagnostics.empty());
    EXPECT_EQ(result.diagnostics.back().kind, diag::ErrorKind::InternalError);
    EXPECT_NE(result.output().find("provider exploded"), std::string::npos);
    EXPECT_EQ(throwing.trace().back(), RequestState::Done);
}
