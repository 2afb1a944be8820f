//! # Source Compiler
//!
//! Reference `CompilerService` for the module language (`.kl` files).
//!
//! ## Pipeline
//!
//! 1. **Load**: starting from the sources, read and parse every reachable
//!    module through the request's file system. Imports already provided
//!    by a loaded summary are not read; they stay external.
//! 2. **Interfaces**: collect each loaded module's declared signatures, so
//!    modules may import each other cyclically.
//! 3. **Check**: run the `Checker` on every loaded module.
//! 4. **Graph**: add the modules to a `ModuleGraph` in load order (sources
//!    first), bind the names of imported summary modules as external and
//!    compute canonical names for the compiled ones.
//!
//! Import URIs are resolved relative to the importing module, except
//! `package:name/path`, which is resolved through the package metadata.

#pragma once

#include "service/compiler_service.hpp"

#include <map>
#include <string>

namespace kiln::service {

/// Libraries loaded from summaries and linked inputs.
class LoadedLibraries : public SessionState {
public:
    /// Import URI -> module interface. The first input providing a URI wins.
    std::map<std::string, kernel::ModuleNode> libraries;
    /// Package name -> root URI text, always ending in `/`.
    std::map<std::string, std::string> packages;
    /// Number of input artifacts the libraries came from.
    size_t artifact_count = 0;
};

class SourceCompiler : public CompilerService {
public:
    [[nodiscard]] auto initialize(const CompilerInputs& inputs)
        -> Result<SessionHandle, diag::Diagnostic> override;

    [[nodiscard]] auto compile(const SessionHandle& handle,
                               const std::vector<std::string>& sources,
                               const CompileOptions& options,
                               const DiagnosticHandler& on_diagnostic)
        -> std::optional<kernel::ModuleGraph> override;
};

} // namespace kiln::service
