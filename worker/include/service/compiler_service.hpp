//! # Compiler Service Contract
//!
//! The worker never compiles anything itself. It hands loaded inputs to a
//! `CompilerService`, asks it to compile a set of source URIs, and receives
//! a `ModuleGraph` (or nothing, when compilation reported errors).
//!
//! ```text
//! initialize(inputs)                        -> SessionHandle | Diagnostic
//! compile(handle, sources, options, report) -> ModuleGraph | nullopt
//! ```
//!
//! A `SessionHandle` is immutable once created and may be shared between
//! compiles. Diagnostics are delivered through the callback while
//! compilation continues; the callback cannot abort it.

#pragma once

#include "common.hpp"
#include "diag/diagnostic.hpp"
#include "kernel/graph.hpp"
#include "vfs/file_system.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kiln::service {

/// An input artifact read from disk.
struct InputBlob {
    std::string location;
    Bytes bytes;
};

/// Everything a compiler session is initialized from.
struct CompilerInputs {
    InputBlob platform_summary;
    std::vector<InputBlob> input_summaries;
    std::vector<InputBlob> input_linked;
    /// Package name -> root URI, from the package metadata file.
    std::map<std::string, std::string> packages;
};

/// Loaded, immutable compiler state. Implementations derive from this.
class SessionState {
public:
    virtual ~SessionState() = default;
};

using SessionHandle = Rc<const SessionState>;

struct CompileOptions {
    bool summary_only = true;
    /// Overlay the sources and their non-summary imports are read from.
    Rc<const vfs::FileSystem> file_system;
};

using DiagnosticHandler = std::function<void(const diag::Diagnostic&)>;

class CompilerService {
public:
    virtual ~CompilerService() = default;

    /// Loads summaries and linked inputs. An undecodable input is a
    /// `ResolutionError`.
    [[nodiscard]] virtual auto initialize(const CompilerInputs& inputs)
        -> Result<SessionHandle, diag::Diagnostic> = 0;

    /// Compiles `sources` (URI texts). Returns no graph exactly when an
    /// error diagnostic was reported.
    [[nodiscard]] virtual auto compile(const SessionHandle& handle,
                                       const std::vector<std::string>& sources,
                                       const CompileOptions& options,
                                       const DiagnosticHandler& on_diagnostic)
        -> std::optional<kernel::ModuleGraph> = 0;
};

} // namespace kiln::service
