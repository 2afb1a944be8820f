//! # VFS Tests
//!
//! URI parsing and resolution, the in-memory file system and the multi-root
//! overlay.

#include "vfs/file_system.hpp"
#include "vfs/multi_root.hpp"
#include "vfs/uri.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace kiln;
using namespace kiln::vfs;

namespace {

auto text_of(const Bytes& bytes) -> std::string {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

// ============================================================================
// Uri
// ============================================================================

TEST(UriTest, ParseSchemes) {
    auto logical = Uri::parse("multi-root:///lib/a.kl");
    EXPECT_EQ(logical.scheme, "multi-root");
    EXPECT_EQ(logical.path, "/lib/a.kl");
    EXPECT_EQ(logical.to_string(), "multi-root:///lib/a.kl");

    auto package = Uri::parse("package:util/strings.kl");
    EXPECT_EQ(package.scheme, "package");
    EXPECT_EQ(package.path, "util/strings.kl");
    EXPECT_EQ(package.to_string(), "package:util/strings.kl");
}

TEST(UriTest, BarePathsAreFiles) {
    EXPECT_TRUE(Uri::parse("/tmp/a.kl").is_file());
    EXPECT_TRUE(Uri::parse("rel/a.kl").is_file());
    // Single-letter schemes are drive letters
    EXPECT_TRUE(Uri::parse("C:/src/a.kl").is_file());
    EXPECT_EQ(Uri::parse("FILE:///x").scheme, "file");
}

TEST(UriTest, ResolveRelativeReferences) {
    auto base = Uri::parse("multi-root:///lib/src/a.kl");
    EXPECT_EQ(base.resolve("b.kl").to_string(), "multi-root:///lib/src/b.kl");
    EXPECT_EQ(base.resolve("../c.kl").to_string(), "multi-root:///lib/c.kl");
    EXPECT_EQ(base.resolve("/top.kl").to_string(), "multi-root:///top.kl");
    EXPECT_EQ(base.resolve("package:p/x.kl").to_string(), "package:p/x.kl");
}

TEST(UriTest, NormalizePath) {
    EXPECT_EQ(normalize_path("/a/./b/../c"), "/a/c");
    EXPECT_EQ(normalize_path("/../a"), "/a");
    EXPECT_EQ(normalize_path("../a/b/.."), "../a");
    EXPECT_EQ(normalize_path("a//b/"), "a/b/");
    EXPECT_EQ(normalize_path(""), ".");
}

// ============================================================================
// MemoryFileSystem
// ============================================================================

TEST(MemoryFileSystemTest, ReadsNormalizedPaths) {
    MemoryFileSystem memory;
    memory.add_file("/src/./a.kl", "let a: Int = 1;");

    EXPECT_TRUE(memory.exists(Uri::parse("file:///src/a.kl")));
    auto bytes = memory.read_bytes(Uri::parse("/src/x/../a.kl"));
    ASSERT_TRUE(is_ok(bytes));
    EXPECT_EQ(text_of(unwrap(bytes)), "let a: Int = 1;");

    EXPECT_FALSE(memory.exists(Uri::parse("/src/b.kl")));
    EXPECT_TRUE(is_err(memory.read_bytes(Uri::parse("/src/b.kl"))));
    EXPECT_TRUE(is_err(memory.read_bytes(Uri::parse("multi-root:///src/a.kl"))));
}

// ============================================================================
// MultiRootFileSystem
// ============================================================================

class MultiRootTest : public ::testing::Test {
protected:
    Rc<MemoryFileSystem> memory = make_rc<MemoryFileSystem>();

    void SetUp() override {
        memory->add_file("/src/lib/a.kl", "from src");
        memory->add_file("/gen/lib/a.kl", "from gen");
        memory->add_file("/gen/lib/b.kl", "only gen");
    }
};

TEST_F(MultiRootTest, FirstRootWins) {
    MultiRootFileSystem overlay("multi-root", {"/src", "/gen"}, memory);
    auto bytes = overlay.read_bytes(Uri::parse("multi-root:///lib/a.kl"));
    ASSERT_TRUE(is_ok(bytes));
    EXPECT_EQ(text_of(unwrap(bytes)), "from src");
}

TEST_F(MultiRootTest, FallsThroughToLaterRoots) {
    MultiRootFileSystem overlay("multi-root", {"/src", "/gen"}, memory);
    EXPECT_EQ(overlay.resolve(Uri::parse("multi-root:///lib/b.kl")).to_string(),
              "file:///gen/lib/b.kl");
    EXPECT_TRUE(overlay.exists(Uri::parse("multi-root:///lib/b.kl")));
}

TEST_F(MultiRootTest, MissingFileResolvesUnderFirstRoot) {
    MultiRootFileSystem overlay("multi-root", {"/src", "/gen"}, memory);
    EXPECT_EQ(overlay.resolve(Uri::parse("multi-root:///lib/c.kl")).to_string(),
              "file:///src/lib/c.kl");

    auto bytes = overlay.read_bytes(Uri::parse("multi-root:///lib/c.kl"));
    ASSERT_TRUE(is_err(bytes));
    EXPECT_NE(unwrap_err(bytes).find("resolved from multi-root:///lib/c.kl"), std::string::npos);
}

TEST_F(MultiRootTest, CustomSchemeLeavesOthersAlone) {
    MultiRootFileSystem overlay("org-src", {"file:///gen"}, memory);
    EXPECT_EQ(overlay.scheme(), "org-src");
    EXPECT_EQ(overlay.resolve(Uri::parse("org-src:///lib/b.kl")).to_string(),
              "file:///gen/lib/b.kl");
    // Plain file URIs pass through to the delegate
    EXPECT_TRUE(overlay.exists(Uri::parse("/src/lib/a.kl")));
    EXPECT_FALSE(overlay.exists(Uri::parse("multi-root:///lib/b.kl")));
}

TEST_F(MultiRootTest, SchemeMatchesCaseInsensitively) {
    MultiRootFileSystem overlay("MyRoot", {"/gen"}, memory);
    EXPECT_EQ(overlay.scheme(), "myroot");
    EXPECT_TRUE(overlay.exists(Uri::parse("MyRoot:///lib/b.kl")));
    EXPECT_EQ(overlay.resolve(Uri::parse("myroot:///lib/b.kl")).to_string(),
              "file:///gen/lib/b.kl");
}

TEST_F(MultiRootTest, MixedCaseSchemeOnDisk) {
    auto dir = kiln::fixtures::unique_temp_dir("kiln_multi_root_scheme_test");
    fs::remove_all(dir);
    kiln::fixtures::write_file(dir / "r" / "a.kl", "const a: Int = 1;");

    MultiRootFileSystem overlay("MyRoot", {(dir / "r").generic_string()},
                                make_rc<StandardFileSystem>());
    EXPECT_TRUE(overlay.exists(Uri::parse("MyRoot:///a.kl")));

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_F(MultiRootTest, NoRootsMeansWorkingDirectory) {
    MultiRootFileSystem overlay("multi-root", {}, memory);
    ASSERT_EQ(overlay.roots().size(), 1u);
    EXPECT_EQ(overlay.roots()[0].path, normalize_path(fs::current_path().generic_string()));
}

TEST(StandardFileSystemTest, ReadsRealFiles) {
    auto dir = kiln::fixtures::unique_temp_dir("kiln_vfs_test");
    fs::create_directories(dir);
    auto path = dir / "a.kl";
    {
        std::ofstream out(path, std::ios::binary);
        out << "bytes";
    }

    StandardFileSystem standard;
    auto uri = Uri::from_path(path.generic_string());
    EXPECT_TRUE(standard.exists(uri));
    auto bytes = standard.read_bytes(uri);
    ASSERT_TRUE(is_ok(bytes));
    EXPECT_EQ(text_of(unwrap(bytes)), "bytes");
    EXPECT_TRUE(is_err(standard.read_bytes(Uri::from_path((dir / "none.kl").generic_string()))));

    std::error_code ec;
    fs::remove_all(dir, ec);
}
