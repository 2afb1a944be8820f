//! # Module Graph Tests
//!
//! Canonical name binding and the binary artifact format.

#include "kernel/graph.hpp"
#include "kernel/graph_binary.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace kiln;
using namespace kiln::kernel;
using namespace kiln::fixtures;

// ============================================================================
// CanonicalNameRoot
// ============================================================================

TEST(CanonicalNameRootTest, BindOwnedThenExternal) {
    CanonicalNameRoot root;
    Reference ref{"multi-root:///a.kl", "x"};

    auto first = root.bind(ref, ModuleId{0});
    ASSERT_TRUE(is_ok(first));
    EXPECT_TRUE(unwrap(first));

    // Same owner again is not new
    auto again = root.bind(ref, ModuleId{0});
    ASSERT_TRUE(is_ok(again));
    EXPECT_FALSE(unwrap(again));

    // Rebinding as external releases ownership
    ASSERT_TRUE(is_ok(root.bind(ref, std::nullopt)));
    ASSERT_NE(root.lookup(ref), nullptr);
    EXPECT_FALSE(root.lookup(ref)->owner.has_value());
    EXPECT_EQ(root.size(), 1u);
}

TEST(CanonicalNameRootTest, ConflictingOwnersFail) {
    CanonicalNameRoot root;
    Reference ref{"multi-root:///a.kl", "x"};
    ASSERT_TRUE(is_ok(root.bind(ref, ModuleId{0})));
    auto conflict = root.bind(ref, ModuleId{1});
    ASSERT_TRUE(is_err(conflict));
    EXPECT_NE(unwrap_err(conflict).find("already bound"), std::string::npos);
}

TEST(ModuleGraphTest, ComputeCanonicalNames) {
    auto graph = graph_of({make_module("multi-root:///a.kl",
                                       {make_member(MemberKind::Let, "a", "Int"),
                                        make_member(MemberKind::Fn, "f", "(Int) -> Int")})});
    EXPECT_EQ(graph.names().size(), 2u);
    const auto* name = graph.names().lookup({"multi-root:///a.kl", "f"});
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(name->owner, std::optional<ModuleId>(0));
    EXPECT_EQ(graph.find("multi-root:///a.kl"), std::optional<ModuleId>(0));
    EXPECT_FALSE(graph.find("multi-root:///b.kl").has_value());
}

// ============================================================================
// Binary Format
// ============================================================================

class GraphBinaryTest : public ::testing::Test {
protected:
    ModuleGraph graph = graph_of({
        make_module("multi-root:///a.kl", {make_member(MemberKind::Const, "limit", "Int")}),
        make_module("multi-root:///b.kl",
                    {make_member(MemberKind::Const, "twice", "Int",
                                 {{"multi-root:///a.kl", "limit"}}),
                     make_member(MemberKind::Fn, "id", "(String) -> String")},
                    {"multi-root:///a.kl"}),
    });
};

TEST_F(GraphBinaryTest, DecodeRestoresModulesAndNames) {
    auto bytes = encode_graph(graph, true);
    ASSERT_TRUE(is_ok(bytes));

    auto decoded = decode_graph(unwrap(bytes));
    ASSERT_TRUE(is_ok(decoded)) << unwrap_err(decoded);
    const auto& result = unwrap(decoded);
    EXPECT_TRUE(result.summary);
    EXPECT_EQ(result.graph.top_level_uris(),
              (std::vector<std::string>{"multi-root:///a.kl", "multi-root:///b.kl"}));

    const auto& b = result.graph.node(1);
    EXPECT_EQ(b.imports, std::vector<std::string>{"multi-root:///a.kl"});
    ASSERT_NE(b.find_member("twice"), nullptr);
    EXPECT_EQ(b.find_member("twice")->references.size(), 1u);
    EXPECT_EQ(b.find_member("id")->kind, MemberKind::Fn);
    EXPECT_EQ(b.find_member("id")->type, "(String) -> String");

    const auto* limit = result.graph.names().lookup({"multi-root:///a.kl", "limit"});
    ASSERT_NE(limit, nullptr);
    EXPECT_EQ(limit->owner, std::optional<ModuleId>(0));
}

TEST_F(GraphBinaryTest, EncodingIsDeterministic) {
    auto first = encode_graph(graph, false);
    auto second = encode_graph(graph, false);
    ASSERT_TRUE(is_ok(first));
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(first), unwrap(second));
}

TEST_F(GraphBinaryTest, ExternalReferencesAreKeptByName) {
    // b refers to a name from a summary that is not part of this graph
    ModuleGraph g;
    ASSERT_TRUE(is_ok(g.names_mut().bind({"platform:core", "version"}, std::nullopt)));
    auto id = g.add_module(make_module(
        "multi-root:///b.kl",
        {make_member(MemberKind::Const, "v", "Int", {{"platform:core", "version"}})}));
    ASSERT_TRUE(is_ok(g.compute_canonical_names(id)));

    auto bytes = encode_graph(g, true);
    ASSERT_TRUE(is_ok(bytes));
    auto decoded = decode_graph(unwrap(bytes));
    ASSERT_TRUE(is_ok(decoded));
    const auto* version = unwrap(decoded).graph.names().lookup({"platform:core", "version"});
    ASSERT_NE(version, nullptr);
    EXPECT_FALSE(version->owner.has_value());
}

TEST_F(GraphBinaryTest, UnboundReferenceIsRejected) {
    ModuleGraph g;
    g.add_module(make_module("multi-root:///b.kl", {make_member(MemberKind::Const, "v", "Int",
                                                                {{"multi-root:///gone.kl", "x"}})}));
    auto bytes = encode_graph(g, true);
    ASSERT_TRUE(is_err(bytes));
    EXPECT_EQ(unwrap_err(bytes).kind, diag::ErrorKind::FilterInvariantViolation);
}

TEST_F(GraphBinaryTest, OwnerOutsideOutputIsRejected) {
    // Drop a.kl without rebinding its names
    graph.set_top_level({1});
    auto bytes = encode_graph(graph, true);
    ASSERT_TRUE(is_err(bytes));
    EXPECT_EQ(unwrap_err(bytes).kind, diag::ErrorKind::FilterInvariantViolation);
    EXPECT_NE(unwrap_err(bytes).message.find("not part of the output"), std::string::npos);
}

TEST_F(GraphBinaryTest, CorruptArtifactsAreRejected) {
    auto bytes = encode_graph(graph, true);
    ASSERT_TRUE(is_ok(bytes));
    const Bytes good = unwrap(bytes);

    EXPECT_TRUE(is_err(decode_graph(Bytes(good.begin(), good.begin() + 10))));

    Bytes bad_magic = good;
    bad_magic[0] ^= 0xFF;
    auto magic = decode_graph(bad_magic);
    ASSERT_TRUE(is_err(magic));
    EXPECT_NE(unwrap_err(magic).find("magic"), std::string::npos);

    Bytes bad_version = good;
    bad_version[4] = 9;
    auto version = decode_graph(bad_version);
    ASSERT_TRUE(is_err(version));
    EXPECT_NE(unwrap_err(version).find("version"), std::string::npos);

    Bytes flipped = good;
    flipped.back() ^= 0x01;
    auto checksum = decode_graph(flipped);
    ASSERT_TRUE(is_err(checksum));
    EXPECT_NE(unwrap_err(checksum).find("checksum"), std::string::npos);

    Bytes truncated(good.begin(), good.end() - 1);
    EXPECT_TRUE(is_err(decode_graph(truncated)));
}
