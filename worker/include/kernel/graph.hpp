//! # Module Graph
//!
//! In-memory result of a compilation: an arena of `ModuleNode`s addressed by
//! `ModuleId`, the ordered top-level collection, and the canonical name root.
//!
//! ## Identity
//!
//! Modules are identified by their import URI; members by the pair
//! `(library URI, member name)`. References between members are stored as
//! these identity keys, never as pointers, so taking a module out of the
//! top-level collection cannot leave a dangling reference. It can only leave
//! a key with no binding in the name root, which the artifact encoder
//! rejects.
//!
//! ## Canonical Names
//!
//! The `CanonicalNameRoot` maps identity keys to `CanonicalName` records.
//! A record is either *owned* by a module of this graph or *external*
//! (bound without owner), meaning it is defined in some other artifact.

#pragma once

#include "common.hpp"

#include <compare>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kiln::kernel {

using ModuleId = uint32_t;

// ============================================================================
// Members and Modules
// ============================================================================

enum class MemberKind : uint8_t {
    Let = 0,
    Const = 1,
    Fn = 2,
};

[[nodiscard]] auto member_kind_name(MemberKind kind) -> const char*;

/// Identity key of a member.
struct Reference {
    std::string library_uri;
    std::string member;

    auto operator<=>(const Reference& other) const = default;
    auto operator==(const Reference& other) const -> bool = default;

    [[nodiscard]] auto to_string() const -> std::string {
        return library_uri + "::" + member;
    }
};

struct Member {
    MemberKind kind = MemberKind::Let;
    std::string name;
    /// Signature text, e.g. `Int` or `(Int, String) -> Bool`.
    std::string type;
    /// Members this one refers to, sorted and unique.
    std::vector<Reference> references;

    [[nodiscard]] auto is_private() const -> bool {
        return !name.empty() && name[0] == '_';
    }
};

struct ModuleNode {
    std::string import_uri;
    std::string file_uri;
    std::vector<std::string> imports;
    std::vector<Member> members;
    /// Cleared when the module is dropped from an output and its names are
    /// rebound as external.
    bool is_canonical_owner = true;

    [[nodiscard]] auto find_member(const std::string& name) const -> const Member*;
};

// ============================================================================
// Canonical Names
// ============================================================================

struct CanonicalName {
    std::string library_uri;
    std::string member;
    std::optional<ModuleId> owner;
};

class CanonicalNameRoot {
public:
    /// Binds `ref` to `owner` (`std::nullopt` for an external binding).
    ///
    /// Rebinding an owned name as external releases it. Binding a name that
    /// is owned by a different module is an error.
    auto bind(const Reference& ref, std::optional<ModuleId> owner) -> Result<bool, std::string>;

    [[nodiscard]] auto lookup(const Reference& ref) const -> const CanonicalName*;

    [[nodiscard]] auto contains(const Reference& ref) const -> bool {
        return lookup(ref) != nullptr;
    }

    [[nodiscard]] auto size() const -> size_t {
        return names_.size();
    }

    [[nodiscard]] auto entries() const -> const std::map<Reference, CanonicalName>& {
        return names_;
    }

private:
    std::map<Reference, CanonicalName> names_;
};

// ============================================================================
// ModuleGraph
// ============================================================================

class ModuleGraph {
public:
    /// Adds a node to the arena and appends it to the top-level collection.
    auto add_module(ModuleNode node) -> ModuleId;

    [[nodiscard]] auto node(ModuleId id) const -> const ModuleNode& {
        return nodes_.at(id);
    }

    [[nodiscard]] auto node_mut(ModuleId id) -> ModuleNode& {
        return nodes_.at(id);
    }

    [[nodiscard]] auto arena_size() const -> size_t {
        return nodes_.size();
    }

    [[nodiscard]] auto top_level() const -> const std::vector<ModuleId>& {
        return top_level_;
    }

    void set_top_level(std::vector<ModuleId> ids) {
        top_level_ = std::move(ids);
    }

    /// Import URIs of the top-level modules, in collection order.
    [[nodiscard]] auto top_level_uris() const -> std::vector<std::string>;

    /// Finds a top-level module by import URI.
    [[nodiscard]] auto find(const std::string& import_uri) const -> std::optional<ModuleId>;

    [[nodiscard]] auto names() const -> const CanonicalNameRoot& {
        return names_;
    }

    [[nodiscard]] auto names_mut() -> CanonicalNameRoot& {
        return names_;
    }

    /// Binds every member of `id` in the name root: owned by `id` when the
    /// node is a canonical owner, external otherwise.
    auto compute_canonical_names(ModuleId id) -> Result<size_t, std::string>;

private:
    std::vector<ModuleNode> nodes_;
    std::vector<ModuleId> top_level_;
    CanonicalNameRoot names_;
};

} // namespace kiln::kernel
