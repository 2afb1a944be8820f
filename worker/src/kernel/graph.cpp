#include "kernel/graph.hpp"

#include <algorithm>

namespace kiln::kernel {

auto member_kind_name(MemberKind kind) -> const char* {
    switch (kind) {
    case MemberKind::Let:
        return "let";
    case MemberKind::Const:
        return "const";
    case MemberKind::Fn:
        return "fn";
    }
    return "?";
}

auto ModuleNode::find_member(const std::string& name) const -> const Member* {
    auto it = std::find_if(members.begin(), members.end(),
                           [&](const Member& m) { return m.name == name; });
    return it == members.end() ? nullptr : &*it;
}

// ============================================================================
// CanonicalNameRoot
// ============================================================================

auto CanonicalNameRoot::bind(const Reference& ref, std::optional<ModuleId> owner)
    -> Result<bool, std::string> {
    auto it = names_.find(ref);
    if (it == names_.end()) {
        names_.emplace(ref, CanonicalName{ref.library_uri, ref.member, owner});
        return true;
    }

    auto& existing = it->second;
    if (owner && existing.owner && *existing.owner != *owner) {
        return "Canonical name " + ref.to_string() + " is already bound to module #" +
               std::to_string(*existing.owner);
    }
    existing.owner = owner;
    return false;
}

auto CanonicalNameRoot::lookup(const Reference& ref) const -> const CanonicalName* {
    auto it = names_.find(ref);
    return it == names_.end() ? nullptr : &it->second;
}

// ============================================================================
// ModuleGraph
// ============================================================================

auto ModuleGraph::add_module(ModuleNode node) -> ModuleId {
    auto id = static_cast<ModuleId>(nodes_.size());
    nodes_.push_back(std::move(node));
    top_level_.push_back(id);
    return id;
}

auto ModuleGraph::top_level_uris() const -> std::vector<std::string> {
    std::vector<std::string> uris;
    uris.reserve(top_level_.size());
    for (auto id : top_level_) {
        uris.push_back(nodes_.at(id).import_uri);
    }
    return uris;
}

auto ModuleGraph::find(const std::string& import_uri) const -> std::optional<ModuleId> {
    for (auto id : top_level_) {
        if (nodes_.at(id).import_uri == import_uri) {
            return id;
        }
    }
    return std::nullopt;
}

auto ModuleGraph::compute_canonical_names(ModuleId id) -> Result<size_t, std::string> {
    const auto& module = nodes_.at(id);
    std::optional<ModuleId> owner;
    if (module.is_canonical_owner) {
        owner = id;
    }

    for (const auto& member : module.members) {
        auto bound = names_.bind(Reference{module.import_uri, member.name}, owner);
        if (is_err(bound)) {
            return unwrap_err(bound);
        }
    }
    return module.members.size();
}

} // namespace kiln::kernel
