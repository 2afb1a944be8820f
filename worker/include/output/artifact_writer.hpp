//! # Artifact Writer
//!
//! Encodes a module graph and writes it to the requested output path.
//!
//! The bytes go to `<path>.tmp` first and are then renamed over `path`
//! (copy + remove when rename fails, e.g. across devices). A failed write
//! removes the temporary file, so `path` either keeps its previous contents
//! or holds the complete new artifact.

#pragma once

#include "common.hpp"
#include "diag/diagnostic.hpp"
#include "kernel/graph.hpp"

#include <string>

namespace kiln::output {

/// Encodes and writes `graph`. Parent directories are created as needed.
///
/// # Returns
///
/// The number of bytes written, a `FilterInvariantViolation` from the
/// encoder, or `ArtifactWriteFailed` naming the path and the cause.
[[nodiscard]] auto write_artifact(const kernel::ModuleGraph& graph, const std::string& path,
                                  bool summary) -> Result<size_t, diag::Diagnostic>;

/// Writes raw bytes with the same temporary-file protocol.
[[nodiscard]] auto write_bytes_atomic(const Bytes& bytes, const std::string& path)
    -> Result<size_t, diag::Diagnostic>;

} // namespace kiln::output
