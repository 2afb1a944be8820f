//! # Request Runner
//!
//! Runs one compile request through its states:
//!
//! ```text
//! Parsing -> Resolving -> Compiling -> Filtering -> Writing -> Done
//!    |           |            |            |           |
//!    +-----------+------------+------------+-----------+--> Done (failure)
//! ```
//!
//! - **Parsing**: expand `@file`, parse and validate options. `--help` ends
//!   here with the usage text and success.
//! - **Resolving**: build the multi-root overlay and acquire a session.
//! - **Compiling**: compile the sources; no graph means failure.
//! - **Filtering**: only when both `summary-only` and `exclude-non-sources`
//!   are set.
//! - **Writing**: encode and write the artifact.
//!
//! `run()` never throws: an exception escaping any collaborator becomes an
//! `InternalError` diagnostic.

#pragma once

#include "common.hpp"
#include "diag/diagnostic.hpp"
#include "session/compilation_session.hpp"
#include "vfs/file_system.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kiln::driver {

enum class RequestState : uint8_t {
    Parsing,
    Resolving,
    Compiling,
    Filtering,
    Writing,
    Done,
};

[[nodiscard]] auto state_name(RequestState state) -> const char*;

struct WorkResult {
    bool succeeded = false;
    std::vector<diag::Diagnostic> diagnostics;
    std::optional<size_t> artifact_size;

    /// 0 on success, 15 on failure.
    [[nodiscard]] auto exit_code() const -> int;

    /// Every diagnostic formatted, one per line (context lines included).
    [[nodiscard]] auto output() const -> std::string;
};

class RequestRunner {
public:
    /// # Arguments
    ///
    /// * `provider` - Source of compilation sessions
    /// * `physical_fs` - File system behind the multi-root overlay
    RequestRunner(Rc<session::SessionProvider> provider, Rc<const vfs::FileSystem> physical_fs);

    [[nodiscard]] auto run(const std::vector<std::string>& args) -> WorkResult;

    /// States entered by the last `run()`, in order.
    [[nodiscard]] auto trace() const -> const std::vector<RequestState>& {
        return trace_;
    }

private:
    Rc<session::SessionProvider> provider_;
    Rc<const vfs::FileSystem> physical_fs_;
    std::vector<RequestState> trace_;

    void enter(RequestState state);
    void run_states(const std::vector<std::string>& args, WorkResult& result);
};

} // namespace kiln::driver
