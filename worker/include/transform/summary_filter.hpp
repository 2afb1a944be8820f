//! # Summary Filter
//!
//! Build systems may hand the same module to several summary compilations,
//! but only the compilation that lists it as a source should emit it. The
//! filter drops every top-level module that is not a requested source.
//!
//! Dropping a module takes its definitions out of the artifact, but kept
//! modules may still refer to them. Before a module is dropped its members
//! are therefore bound in the name root as external, so the encoder can
//! serialize those references by name.
//!
//! The filter is destructive and only meant for summaries.

#pragma once

#include "common.hpp"
#include "diag/diagnostic.hpp"
#include "kernel/graph.hpp"

#include <string>
#include <vector>

namespace kiln::transform {

struct FilterStats {
    size_t kept = 0;
    size_t dropped = 0;
    /// Canonical names bound as external for dropped modules.
    size_t names_bound = 0;
};

/// Keeps the top-level modules whose import URI is in `sources`, in their
/// original order, after binding the canonical names of the others.
///
/// Fails with `FilterInvariantViolation` when a dropped member cannot be
/// bound or its binding is missing afterwards.
[[nodiscard]] auto filter_to_sources(kernel::ModuleGraph& graph,
                                     const std::vector<std::string>& sources)
    -> Result<FilterStats, diag::Diagnostic>;

} // namespace kiln::transform
