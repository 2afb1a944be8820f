#include "driver/request_runner.hpp"

#include "args/arg_expander.hpp"
#include "args/options.hpp"
#include "log/log.hpp"
#include "output/artifact_writer.hpp"
#include "transform/summary_filter.hpp"
#include "vfs/multi_root.hpp"

#include <exception>

namespace kiln::driver {

auto state_name(RequestState state) -> const char* {
    switch (state) {
    case RequestState::Parsing:
        return "Parsing";
    case RequestState::Resolving:
        return "Resolving";
    case RequestState::Compiling:
        return "Compiling";
    case RequestState::Filtering:
        return "Filtering";
    case RequestState::Writing:
        return "Writing";
    case RequestState::Done:
        return "Done";
    }
    return "Unknown";
}

// ============================================================================
// WorkResult
// ============================================================================

auto WorkResult::exit_code() const -> int {
    return succeeded ? exit_code::SUCCESS : exit_code::DIAGNOSTICS;
}

auto WorkResult::output() const -> std::string {
    std::string out;
    for (const auto& d : diagnostics) {
        out += d.format();
        if (out.empty() || out.back() != '\n') {
            out += '\n';
        }
    }
    return out;
}

// ============================================================================
// RequestRunner
// ============================================================================

RequestRunner::RequestRunner(Rc<session::SessionProvider> provider,
                             Rc<const vfs::FileSystem> physical_fs)
    : provider_(std::move(provider)), physical_fs_(std::move(physical_fs)) {}

void RequestRunner::enter(RequestState state) {
    trace_.push_back(state);
    KILN_LOG_DEBUG("request", "-> " << state_name(state));
}

auto RequestRunner::run(const std::vector<std::string>& args) -> WorkResult {
    trace_.clear();
    WorkResult result;
    try {
        run_states(args, result);
    } catch (const std::exception& e) {
        KILN_LOG_ERROR("request", "Unhandled exception: " << e.what());
        result.diagnostics.push_back(diag::Diagnostic::error(
            diag::ErrorKind::InternalError, std::string("Internal error: ") + e.what()));
    } catch (...) {
        KILN_LOG_ERROR("request", "Unhandled non-standard exception");
        result.diagnostics.push_back(diag::Diagnostic::error(diag::ErrorKind::InternalError,
                                                             "Internal error: unknown exception"));
    }

    if (trace_.empty() || trace_.back() != RequestState::Done) {
        enter(RequestState::Done);
    }
    result.succeeded = !diag::has_errors(result.diagnostics);
    if (!result.succeeded) {
        KILN_LOG_WARN("request", "Request failed with " << result.diagnostics.size()
                                                        << " diagnostics");
    }
    return result;
}

void RequestRunner::run_states(const std::vector<std::string>& args, WorkResult& result) {
    auto& diagnostics = result.diagnostics;

    // Parsing
    enter(RequestState::Parsing);
    auto expanded = args::expand_arguments(args);
    if (is_err(expanded)) {
        diagnostics.push_back(std::move(unwrap_err(expanded)));
        return;
    }
    auto parsed = args::parse_options(unwrap(expanded), diagnostics);
    if (is_err(parsed)) {
        diagnostics.push_back(std::move(unwrap_err(parsed)));
        return;
    }
    const auto& options = unwrap(parsed);
    if (options.help) {
        diagnostics.push_back(diag::Diagnostic::info(args::usage()));
        return;
    }
    if (auto invalid = args::validate(options)) {
        diagnostics.push_back(std::move(*invalid));
        return;
    }

    // Resolving
    enter(RequestState::Resolving);
    auto overlay = make_rc<vfs::MultiRootFileSystem>(options.multi_root_scheme,
                                                     options.multi_roots, physical_fs_);
    session::SessionInputs inputs;
    inputs.platform_summary = *options.platform_summary;
    inputs.input_summaries = options.input_summaries;
    inputs.input_linked = options.input_linked;
    inputs.package_metadata = options.package_metadata;
    auto acquired = provider_->acquire(inputs, overlay);
    if (is_err(acquired)) {
        diagnostics.push_back(std::move(unwrap_err(acquired)));
        return;
    }
    auto& session = unwrap(acquired);

    // Compiling
    enter(RequestState::Compiling);
    auto outcome = session.compile(options.sources, options.summary_only);
    for (auto& d : outcome.diagnostics) {
        diagnostics.push_back(std::move(d));
    }
    if (!outcome.graph) {
        return;
    }
    auto& graph = *outcome.graph;

    // Filtering
    if (options.summary_only && options.exclude_non_sources) {
        enter(RequestState::Filtering);
        auto filtered = transform::filter_to_sources(graph, options.sources);
        if (is_err(filtered)) {
            diagnostics.push_back(std::move(unwrap_err(filtered)));
            return;
        }
    }

    // Writing
    enter(RequestState::Writing);
    auto written = output::write_artifact(graph, *options.output, options.summary_only);
    if (is_err(written)) {
        diagnostics.push_back(std::move(unwrap_err(written)));
        return;
    }
    result.artifact_size = unwrap(written);
    enter(RequestState::Done);
}

} // namespace kiln::driver
