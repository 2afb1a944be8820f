//! # Compilation Sessions
//!
//! A `CompilationSession` pairs an initialized compiler state with the file
//! system overlay of one request. Sessions are obtained from a
//! `SessionProvider`:
//!
//! | Provider                 | Behavior                                        |
//! |--------------------------|-------------------------------------------------|
//! | `FreshSessionProvider`   | Loads every input and initializes per request   |
//! | `CachedSessionProvider`  | Reuses the last state while inputs are unchanged |
//!
//! Inputs are "unchanged" when the same locations are given in the same
//! order and every file still has the same CRC32C. The cached state is
//! immutable and shared; each compile builds its own graph.

#pragma once

#include "common.hpp"
#include "diag/diagnostic.hpp"
#include "kernel/graph.hpp"
#include "service/compiler_service.hpp"
#include "vfs/file_system.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kiln::session {

/// Locations of the inputs a session is initialized from.
struct SessionInputs {
    std::string platform_summary;
    std::vector<std::string> input_summaries;
    std::vector<std::string> input_linked;
    std::optional<std::string> package_metadata;
};

struct CompileOutcome {
    std::optional<kernel::ModuleGraph> graph;
    std::vector<diag::Diagnostic> diagnostics;
};

class CompilationSession {
public:
    CompilationSession(Rc<service::CompilerService> service, service::SessionHandle handle,
                       Rc<const vfs::FileSystem> overlay);

    /// Compiles `sources`. Diagnostics are collected into the outcome and,
    /// when given, also forwarded to `on_diagnostic` as they arrive.
    [[nodiscard]] auto compile(const std::vector<std::string>& sources, bool summary_only,
                               const service::DiagnosticHandler& on_diagnostic = {})
        -> CompileOutcome;

    [[nodiscard]] auto handle() const -> const service::SessionHandle& {
        return handle_;
    }

private:
    Rc<service::CompilerService> service_;
    service::SessionHandle handle_;
    Rc<const vfs::FileSystem> overlay_;
};

// ============================================================================
// Input Loading
// ============================================================================

/// Identity of a set of inputs: each location with the CRC32C of its bytes.
using InputFingerprint = std::vector<std::pair<std::string, uint32_t>>;

struct LoadedInputs {
    service::CompilerInputs inputs;
    InputFingerprint fingerprint;
};

/// Reads every input through `fs`. Relative locations are taken relative to
/// the working directory. A missing or unreadable input, or malformed
/// package metadata, is a `ResolutionError`.
[[nodiscard]] auto load_inputs(const SessionInputs& locations, const vfs::FileSystem& fs)
    -> Result<LoadedInputs, diag::Diagnostic>;

// ============================================================================
// Providers
// ============================================================================

class SessionProvider {
public:
    virtual ~SessionProvider() = default;

    [[nodiscard]] virtual auto acquire(const SessionInputs& inputs,
                                       Rc<const vfs::FileSystem> overlay)
        -> Result<CompilationSession, diag::Diagnostic> = 0;
};

class FreshSessionProvider : public SessionProvider {
public:
    /// `input_fs` serves the summary, linked and metadata files.
    FreshSessionProvider(Rc<service::CompilerService> service, Rc<const vfs::FileSystem> input_fs);

    [[nodiscard]] auto acquire(const SessionInputs& inputs, Rc<const vfs::FileSystem> overlay)
        -> Result<CompilationSession, diag::Diagnostic> override;

private:
    Rc<service::CompilerService> service_;
    Rc<const vfs::FileSystem> input_fs_;
};

class CachedSessionProvider : public SessionProvider {
public:
    CachedSessionProvider(Rc<service::CompilerService> service,
                          Rc<const vfs::FileSystem> input_fs);

    [[nodiscard]] auto acquire(const SessionInputs& inputs, Rc<const vfs::FileSystem> overlay)
        -> Result<CompilationSession, diag::Diagnostic> override;

    [[nodiscard]] auto reuse_count() const -> size_t;
    [[nodiscard]] auto initialize_count() const -> size_t;

private:
    Rc<service::CompilerService> service_;
    Rc<const vfs::FileSystem> input_fs_;

    mutable std::mutex mutex_;
    InputFingerprint cached_fingerprint_;
    service::SessionHandle cached_handle_;
    size_t reuse_count_ = 0;
    size_t initialize_count_ = 0;
};

} // namespace kiln::session
