#include "session/compilation_session.hpp"

#include "common/crc32c.hpp"
#include "log/log.hpp"
#include "session/package_metadata.hpp"

#include <filesystem>
#include <system_error>

namespace kiln::session {

namespace {

auto input_uri(const std::string& location) -> vfs::Uri {
    vfs::Uri uri = vfs::Uri::parse(location);
    if (uri.is_file() && !uri.path.empty() && uri.path[0] != '/') {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(uri.path, ec);
        if (!ec) {
            uri.path = vfs::normalize_path(absolute.generic_string());
        }
    }
    return uri;
}

auto read_input(const std::string& location, const vfs::FileSystem& fs, const char* what,
                InputFingerprint& fingerprint) -> Result<service::InputBlob, diag::Diagnostic> {
    auto bytes = fs.read_bytes(input_uri(location));
    if (is_err(bytes)) {
        KILN_LOG_WARN("session", "Cannot read " << what << " " << location << ": "
                                                << unwrap_err(bytes));
        return diag::Diagnostic::error(diag::ErrorKind::ResolutionError,
                                       std::string("Cannot read ") + what + " '" + location +
                                           "': " + unwrap_err(bytes));
    }
    service::InputBlob blob{location, std::move(unwrap(bytes))};
    uint32_t crc = crc32c(blob.bytes.data(), blob.bytes.size());
    KILN_LOG_TRACE("session", "Read " << what << " " << location << " ["
                                      << crc32c_hex(crc, blob.bytes.size()) << "]");
    fingerprint.emplace_back(location, crc);
    return blob;
}

} // namespace

// ============================================================================
// CompilationSession
// ============================================================================

CompilationSession::CompilationSession(Rc<service::CompilerService> service,
                                       service::SessionHandle handle,
                                       Rc<const vfs::FileSystem> overlay)
    : service_(std::move(service)), handle_(std::move(handle)), overlay_(std::move(overlay)) {}

auto CompilationSession::compile(const std::vector<std::string>& sources, bool summary_only,
                                 const service::DiagnosticHandler& on_diagnostic)
    -> CompileOutcome {
    CompileOutcome outcome;
    service::CompileOptions options;
    options.summary_only = summary_only;
    options.file_system = overlay_;

    auto collect = [&](const diag::Diagnostic& d) {
        outcome.diagnostics.push_back(d);
        if (on_diagnostic) {
            on_diagnostic(d);
        }
    };
    outcome.graph = service_->compile(handle_, sources, options, collect);

    // A graph alongside an error would be written as a valid artifact.
    if (outcome.graph && diag::has_errors(outcome.diagnostics)) {
        KILN_LOG_WARN("session", "Compiler returned a graph despite errors, discarding it");
        outcome.graph.reset();
    }
    if (!outcome.graph && !diag::has_errors(outcome.diagnostics)) {
        outcome.diagnostics.push_back(diag::Diagnostic::error(
            diag::ErrorKind::InternalError, "Compilation produced no output and no errors"));
    }
    return outcome;
}

// ============================================================================
// Input Loading
// ============================================================================

auto load_inputs(const SessionInputs& locations, const vfs::FileSystem& fs)
    -> Result<LoadedInputs, diag::Diagnostic> {
    LoadedInputs loaded;

    auto platform = read_input(locations.platform_summary, fs, "platform summary",
                               loaded.fingerprint);
    if (is_err(platform)) {
        return unwrap_err(platform);
    }
    loaded.inputs.platform_summary = std::move(unwrap(platform));

    for (const auto& location : locations.input_summaries) {
        auto blob = read_input(location, fs, "input summary", loaded.fingerprint);
        if (is_err(blob)) {
            return unwrap_err(blob);
        }
        loaded.inputs.input_summaries.push_back(std::move(unwrap(blob)));
    }

    for (const auto& location : locations.input_linked) {
        auto blob = read_input(location, fs, "linked input", loaded.fingerprint);
        if (is_err(blob)) {
            return unwrap_err(blob);
        }
        loaded.inputs.input_linked.push_back(std::move(unwrap(blob)));
    }

    if (locations.package_metadata) {
        auto blob = read_input(*locations.package_metadata, fs, "package metadata",
                               loaded.fingerprint);
        if (is_err(blob)) {
            return unwrap_err(blob);
        }
        const auto& bytes = unwrap(blob).bytes;
        auto packages = parse_package_metadata(std::string(bytes.begin(), bytes.end()),
                                               input_uri(*locations.package_metadata));
        if (is_err(packages)) {
            return diag::Diagnostic::error(diag::ErrorKind::ResolutionError,
                                           "Invalid package metadata '" +
                                               *locations.package_metadata +
                                               "': " + unwrap_err(packages));
        }
        loaded.inputs.packages = std::move(unwrap(packages));
    }

    return loaded;
}

// ============================================================================
// FreshSessionProvider
// ============================================================================

FreshSessionProvider::FreshSessionProvider(Rc<service::CompilerService> service,
                                           Rc<const vfs::FileSystem> input_fs)
    : service_(std::move(service)), input_fs_(std::move(input_fs)) {}

auto FreshSessionProvider::acquire(const SessionInputs& inputs, Rc<const vfs::FileSystem> overlay)
    -> Result<CompilationSession, diag::Diagnostic> {
    auto loaded = load_inputs(inputs, *input_fs_);
    if (is_err(loaded)) {
        return unwrap_err(loaded);
    }

    auto handle = service_->initialize(unwrap(loaded).inputs);
    if (is_err(handle)) {
        return unwrap_err(handle);
    }
    return CompilationSession(service_, std::move(unwrap(handle)), std::move(overlay));
}

// ============================================================================
// CachedSessionProvider
// ============================================================================

CachedSessionProvider::CachedSessionProvider(Rc<service::CompilerService> service,
                                             Rc<const vfs::FileSystem> input_fs)
    : service_(std::move(service)), input_fs_(std::move(input_fs)) {}

auto CachedSessionProvider::acquire(const SessionInputs& inputs, Rc<const vfs::FileSystem> overlay)
    -> Result<CompilationSession, diag::Diagnostic> {
    auto loaded = load_inputs(inputs, *input_fs_);
    if (is_err(loaded)) {
        return unwrap_err(loaded);
    }
    auto& fresh = unwrap(loaded);

    std::lock_guard<std::mutex> lock(mutex_);
    if (cached_handle_ && cached_fingerprint_ == fresh.fingerprint) {
        ++reuse_count_;
        KILN_LOG_DEBUG("session", "Reusing cached session (" << fresh.fingerprint.size()
                                                             << " inputs unchanged)");
        return CompilationSession(service_, cached_handle_, std::move(overlay));
    }

    auto handle = service_->initialize(fresh.inputs);
    if (is_err(handle)) {
        return unwrap_err(handle);
    }
    ++initialize_count_;
    KILN_LOG_DEBUG("session", "Initialized new cached session from " << fresh.fingerprint.size()
                                                                     << " inputs");
    cached_fingerprint_ = std::move(fresh.fingerprint);
    cached_handle_ = unwrap(handle);
    return CompilationSession(service_, cached_handle_, std::move(overlay));
}

auto CachedSessionProvider::reuse_count() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return reuse_count_;
}

auto CachedSessionProvider::initialize_count() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialize_count_;
}

} // namespace kiln::session
