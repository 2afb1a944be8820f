#include "transform/summary_filter.hpp"

#include "log/log.hpp"
#include "vfs/uri.hpp"

#include <set>

namespace kiln::transform {

namespace {

auto violation(std::string message) -> diag::Diagnostic {
    KILN_LOG_ERROR("filter", message);
    return diag::Diagnostic::error(diag::ErrorKind::FilterInvariantViolation, std::move(message));
}

} // namespace

auto filter_to_sources(kernel::ModuleGraph& graph, const std::vector<std::string>& sources)
    -> Result<FilterStats, diag::Diagnostic> {
    std::set<std::string> include;
    for (const auto& source : sources) {
        include.insert(vfs::Uri::parse(source).to_string());
    }

    FilterStats stats;
    std::vector<kernel::ModuleId> keep;
    std::vector<kernel::ModuleId> drop;
    for (auto id : graph.top_level()) {
        if (include.count(graph.node(id).import_uri) > 0) {
            keep.push_back(id);
        } else {
            drop.push_back(id);
        }
    }

    for (auto id : drop) {
        auto& node = graph.node_mut(id);
        node.is_canonical_owner = false;
        auto bound = graph.compute_canonical_names(id);
        if (is_err(bound)) {
            return violation("Cannot bind names of dropped module " + node.import_uri + ": " +
                             unwrap_err(bound));
        }
        stats.names_bound += unwrap(bound);

        for (const auto& member : node.members) {
            kernel::Reference ref{node.import_uri, member.name};
            const kernel::CanonicalName* name = graph.names().lookup(ref);
            if (name == nullptr || name->owner.has_value()) {
                return violation("Canonical name " + ref.to_string() +
                                 " is not bound as external after dropping its module");
            }
        }
        KILN_LOG_DEBUG("filter", "Dropped " << node.import_uri << " (" << node.members.size()
                                            << " names bound as external)");
    }

    stats.kept = keep.size();
    stats.dropped = drop.size();
    graph.set_top_level(std::move(keep));

    KILN_LOG_INFO("filter", "Kept " << stats.kept << " of " << (stats.kept + stats.dropped)
                                    << " modules");
    return stats;
}

} // namespace kiln::transform
