#include "service/source_compiler.hpp"

#include "kernel/graph_binary.hpp"
#include "log/log.hpp"
#include "service/kl_checker.hpp"
#include "service/kl_lexer.hpp"
#include "service/kl_parser.hpp"
#include "vfs/multi_root.hpp"

#include <deque>
#include <set>

namespace kiln::service {

namespace {

/// A module read and parsed during one compile.
struct LoadedModule {
    std::string uri;
    std::string file_uri;
    std::string source;
    ModuleAst ast;
    /// Resolved import URIs, parallel to `ast.imports`; empty when the
    /// import could not be resolved.
    std::vector<std::string> imports;
};

/// Where a module was first requested from, for "cannot load" diagnostics.
struct ImportSite {
    std::string importer;
    Position pos;
};

class CompileRun {
public:
    CompileRun(const LoadedLibraries& state, const CompileOptions& options,
               const DiagnosticHandler& on_diagnostic)
        : state_(state), options_(options), on_diagnostic_(on_diagnostic) {}

    auto run(const std::vector<std::string>& sources) -> std::optional<kernel::ModuleGraph>;

private:
    const LoadedLibraries& state_;
    const CompileOptions& options_;
    const DiagnosticHandler& on_diagnostic_;
    bool had_error_ = false;

    /// Keyed by URI; `order_` keeps load order.
    std::map<std::string, LoadedModule> modules_;
    std::vector<std::string> order_;
    std::map<std::string, ImportSite> sites_;
    std::set<std::string> external_used_;

    void report(diag::Diagnostic d) {
        if (d.is_error()) {
            had_error_ = true;
        }
        if (on_diagnostic_) {
            on_diagnostic_(d);
        }
    }

    auto source_of(const std::string& uri) const -> std::string_view {
        auto it = modules_.find(uri);
        return it == modules_.end() ? std::string_view() : std::string_view(it->second.source);
    }

    auto resolve_import(const LoadedModule& importer, const ImportDecl& imp)
        -> std::optional<std::string>;
    void load(const std::string& uri);
    auto physical_uri(const vfs::Uri& uri) const -> std::string;
};

auto CompileRun::physical_uri(const vfs::Uri& uri) const -> std::string {
    if (const auto* overlay = dynamic_cast<const vfs::MultiRootFileSystem*>(
            options_.file_system.get())) {
        return overlay->resolve(uri).to_string();
    }
    return uri.to_string();
}

auto CompileRun::resolve_import(const LoadedModule& importer, const ImportDecl& imp)
    -> std::optional<std::string> {
    if (imp.uri.starts_with("package:")) {
        std::string rest = imp.uri.substr(8);
        size_t slash = rest.find('/');
        std::string package = rest.substr(0, slash);
        auto it = state_.packages.find(package);
        if (slash == std::string::npos || it == state_.packages.end()) {
            report(source_diagnostic(importer.uri, importer.source, imp.pos,
                                     "Unknown package '" + package + "' in import '" + imp.uri +
                                         "'"));
            return std::nullopt;
        }
        return vfs::Uri::parse(it->second).resolve(rest.substr(slash + 1)).to_string();
    }
    return vfs::Uri::parse(importer.uri).resolve(imp.uri).to_string();
}

void CompileRun::load(const std::string& uri_text) {
    vfs::Uri uri = vfs::Uri::parse(uri_text);
    auto bytes = options_.file_system->read_bytes(uri);
    if (is_err(bytes)) {
        auto site = sites_.find(uri_text);
        if (site == sites_.end()) {
            auto d = diag::Diagnostic::error(diag::ErrorKind::CompileDiagnostic,
                                             "Error reading '" + uri_text + "'");
            d.context.push_back(unwrap_err(bytes));
            report(std::move(d));
        } else {
            auto d = source_diagnostic(site->second.importer, source_of(site->second.importer),
                                       site->second.pos,
                                       "Error reading imported module '" + uri_text + "'");
            d.context.push_back(unwrap_err(bytes));
            report(std::move(d));
        }
        return;
    }

    LoadedModule module;
    module.uri = uri_text;
    module.file_uri = physical_uri(uri);
    const auto& data = unwrap(bytes);
    module.source.assign(data.begin(), data.end());

    Lexer lexer(module.source);
    Parser parser(lexer.tokenize());
    module.ast = parser.parse_module();
    for (const auto& e : lexer.errors()) {
        report(source_diagnostic(uri_text, module.source, Position{e.line, e.column}, e.message));
    }
    for (const auto& e : parser.errors()) {
        report(source_diagnostic(uri_text, module.source, e.pos, e.message));
    }

    KILN_LOG_DEBUG("session", "Loaded " << uri_text << " from " << module.file_uri << " ("
                                        << module.ast.members.size() << " members)");
    order_.push_back(uri_text);
    modules_.emplace(uri_text, std::move(module));
}

auto CompileRun::run(const std::vector<std::string>& sources)
    -> std::optional<kernel::ModuleGraph> {
    std::deque<std::string> queue;
    std::set<std::string> seen;
    for (const auto& source : sources) {
        std::string uri = vfs::Uri::parse(source).to_string();
        if (seen.insert(uri).second) {
            queue.push_back(uri);
        }
    }

    // Load every reachable module that no summary provides.
    while (!queue.empty()) {
        std::string uri = std::move(queue.front());
        queue.pop_front();
        if (state_.libraries.count(uri) > 0) {
            external_used_.insert(uri);
            continue;
        }
        load(uri);

        auto it = modules_.find(uri);
        if (it == modules_.end()) {
            continue;
        }
        auto& module = it->second;
        for (const auto& imp : module.ast.imports) {
            auto target = resolve_import(module, imp);
            module.imports.push_back(target.value_or(std::string()));
            if (target && seen.insert(*target).second) {
                sites_.emplace(*target, ImportSite{uri, imp.pos});
                queue.push_back(*target);
            }
        }
    }

    // Interfaces of compiled modules, for imports between them.
    std::map<std::string, kernel::ModuleNode> interfaces;
    for (const auto& uri : order_) {
        interfaces.emplace(uri, declared_interface(uri, modules_.at(uri).ast));
    }

    std::vector<kernel::ModuleNode> checked;
    for (const auto& uri : order_) {
        const auto& module = modules_.at(uri);
        std::vector<const kernel::ModuleNode*> imported;
        for (const auto& target : module.imports) {
            if (target.empty()) {
                continue;
            }
            if (auto lib = state_.libraries.find(target); lib != state_.libraries.end()) {
                imported.push_back(&lib->second);
            } else if (auto own = interfaces.find(target); own != interfaces.end()) {
                imported.push_back(&own->second);
            }
        }

        Checker checker(uri, module.source, options_.summary_only, std::move(imported));
        kernel::ModuleNode node = checker.check(module.ast);
        for (const auto& d : checker.diagnostics()) {
            report(d);
        }
        node.file_uri = module.file_uri;
        for (const auto& target : module.imports) {
            if (!target.empty()) {
                node.imports.push_back(target);
            }
        }
        checked.push_back(std::move(node));
    }

    if (had_error_) {
        KILN_LOG_INFO("session", "Compilation of " << sources.size()
                                                   << " sources reported errors");
        return std::nullopt;
    }

    kernel::ModuleGraph graph;
    for (const auto& uri : external_used_) {
        for (const auto& member : state_.libraries.at(uri).members) {
            auto bound = graph.names_mut().bind(kernel::Reference{uri, member.name}, std::nullopt);
            if (is_err(bound)) {
                report(diag::Diagnostic::error(diag::ErrorKind::InternalError, unwrap_err(bound)));
                return std::nullopt;
            }
        }
    }
    for (auto& node : checked) {
        kernel::ModuleId id = graph.add_module(std::move(node));
        auto bound = graph.compute_canonical_names(id);
        if (is_err(bound)) {
            report(diag::Diagnostic::error(diag::ErrorKind::InternalError, unwrap_err(bound)));
            return std::nullopt;
        }
    }

    KILN_LOG_DEBUG("session", "Compiled " << graph.top_level().size() << " modules ("
                                          << external_used_.size() << " external libraries)");
    return graph;
}

} // namespace

// ============================================================================
// SourceCompiler
// ============================================================================

auto SourceCompiler::initialize(const CompilerInputs& inputs)
    -> Result<SessionHandle, diag::Diagnostic> {
    auto state = make_rc<LoadedLibraries>();
    state->packages = inputs.packages;

    std::vector<const InputBlob*> blobs;
    blobs.push_back(&inputs.platform_summary);
    for (const auto& blob : inputs.input_summaries) {
        blobs.push_back(&blob);
    }
    for (const auto& blob : inputs.input_linked) {
        blobs.push_back(&blob);
    }

    for (const auto* blob : blobs) {
        auto decoded = kernel::decode_graph(blob->bytes);
        if (is_err(decoded)) {
            KILN_LOG_WARN("session", "Cannot decode " << blob->location << ": "
                                                      << unwrap_err(decoded));
            return diag::Diagnostic::error(diag::ErrorKind::ResolutionError,
                                           "Failed to load " + blob->location + ": " +
                                               unwrap_err(decoded));
        }
        const auto& graph = unwrap(decoded).graph;
        for (auto id : graph.top_level()) {
            const auto& node = graph.node(id);
            if (!state->libraries.emplace(node.import_uri, node).second) {
                KILN_LOG_DEBUG("session", node.import_uri << " from " << blob->location
                                                          << " is already provided, skipping");
            }
        }
        ++state->artifact_count;
    }

    KILN_LOG_INFO("session", "Loaded " << state->libraries.size() << " libraries from "
                                       << state->artifact_count << " artifacts");
    return SessionHandle(std::move(state));
}

auto SourceCompiler::compile(const SessionHandle& handle, const std::vector<std::string>& sources,
                             const CompileOptions& options, const DiagnosticHandler& on_diagnostic)
    -> std::optional<kernel::ModuleGraph> {
    const auto* state = dynamic_cast<const LoadedLibraries*>(handle.get());
    if (state == nullptr || !options.file_system) {
        auto d = diag::Diagnostic::error(diag::ErrorKind::InternalError,
                                         state == nullptr
                                             ? "Session was not created by this compiler"
                                             : "No file system configured for compilation");
        if (on_diagnostic) {
            on_diagnostic(d);
        }
        return std::nullopt;
    }

    CompileRun run(*state, options, on_diagnostic);
    return run.run(sources);
}

} // namespace kiln::service
