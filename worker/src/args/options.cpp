//! # Request Option Parser
//!
//! Table-driven parser for compile request arguments. Values are stored by
//! option name into `ParsedOptions` through `apply_value`/`apply_flag`.

#include "args/options.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <sstream>

namespace kiln::args {

namespace {

auto error(std::string message) -> diag::Diagnostic {
    return diag::Diagnostic::error(diag::ErrorKind::OptionParseError, std::move(message));
}

auto find_option(std::string_view name) -> const OptionSpec* {
    const auto& table = option_table();
    auto it = std::find_if(table.begin(), table.end(),
                           [name](const OptionSpec& spec) { return spec.name == name; });
    return it == table.end() ? nullptr : &*it;
}

auto split_commas(const std::string& value) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t comma = value.find(',', start);
        parts.push_back(value.substr(start, comma - start));
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return parts;
}

void apply_flag(ParsedOptions& options, std::string_view name, bool value) {
    if (name == "help") {
        options.help = value;
    } else if (name == "summary-only") {
        options.summary_only = value;
    } else if (name == "exclude-non-sources") {
        options.exclude_non_sources = value;
    }
}

void apply_value(ParsedOptions& options, std::string_view name, const std::string& value) {
    if (name == "platform-summary") {
        options.platform_summary = value;
    } else if (name == "multi-root-scheme") {
        options.multi_root_scheme = value;
    } else if (name == "package-metadata") {
        options.package_metadata = value;
    } else if (name == "output") {
        options.output = value;
    } else if (name == "input-summary") {
        options.input_summaries.push_back(value);
    } else if (name == "input-linked") {
        options.input_linked.push_back(value);
    } else if (name == "source") {
        options.sources.push_back(value);
    } else if (name == "multi-root") {
        auto& roots = options.multi_roots;
        if (std::find(roots.begin(), roots.end(), value) == roots.end()) {
            roots.push_back(value);
        }
    }
}

} // namespace

auto option_table() -> const std::vector<OptionSpec>& {
    static const std::vector<OptionSpec> table = {
        {"help", OptionKind::Flag, "", "Print this usage information.", false, 'h'},
        {"exclude-non-sources", OptionKind::Flag, "",
         "Whether modules loaded implicitly should be left out of the summary.", false},
        {"summary-only", OptionKind::Flag, "true", "Whether to only build summary files.", true},
        {"platform-summary", OptionKind::Single, "",
         "Summary of the platform libraries every module can use."},
        {"input-summary", OptionKind::Multi, "", "Summary of an already compiled dependency."},
        {"input-linked", OptionKind::Multi, "",
         "Fully compiled dependency linked into the compilation."},
        {"multi-root", OptionKind::Multi, "",
         "Physical root searched for files under the multi-root scheme."},
        {"multi-root-scheme", OptionKind::Single, DEFAULT_MULTI_ROOT_SCHEME,
         "Logical URI scheme served by the multi-root roots."},
        {"package-metadata", OptionKind::Single, "",
         "File mapping package names to URIs (`name:uri` per line)."},
        {"source", OptionKind::Multi, "", "URI of a module to compile."},
        {"output", OptionKind::Single, "", "Path of the artifact to write."},
    };
    return table;
}

auto parse_options(const std::vector<std::string>& args, std::vector<diag::Diagnostic>& warnings)
    -> Result<ParsedOptions, diag::Diagnostic> {
    ParsedOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg.size() == 2 && arg[0] == '-' && arg[1] != '-') {
            const auto& table = option_table();
            auto it = std::find_if(table.begin(), table.end(), [&](const OptionSpec& spec) {
                return spec.abbreviation == arg[1];
            });
            if (it == table.end()) {
                return error("Could not find an option or flag \"" + arg + "\".");
            }
            apply_flag(options, it->name, true);
            continue;
        }

        if (!arg.starts_with("--") || arg.size() == 2) {
            warnings.push_back(diag::Diagnostic::warning("Ignoring unexpected argument \"" + arg +
                                                         "\"."));
            continue;
        }

        std::string body = arg.substr(2);
        std::optional<std::string> inline_value;
        if (auto eq = body.find('='); eq != std::string::npos) {
            inline_value = body.substr(eq + 1);
            body.resize(eq);
        }

        const OptionSpec* spec = find_option(body);
        if (spec == nullptr && body.starts_with("no-")) {
            const OptionSpec* negated = find_option(body.substr(3));
            if (negated != nullptr && negated->kind == OptionKind::Flag) {
                if (!negated->negatable) {
                    return error("Cannot negate option \"" + std::string(negated->name) + "\".");
                }
                if (inline_value) {
                    return error("Flag option \"" + body + "\" should not be given a value.");
                }
                apply_flag(options, negated->name, false);
                continue;
            }
        }
        if (spec == nullptr) {
            return error("Could not find an option named \"" + body + "\".");
        }

        if (spec->kind == OptionKind::Flag) {
            if (inline_value) {
                return error("Flag option \"" + body + "\" should not be given a value.");
            }
            apply_flag(options, spec->name, true);
            continue;
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < args.size()) {
            value = args[++i];
        } else {
            return error("Missing argument for \"" + body + "\".");
        }

        if (spec->kind == OptionKind::Multi) {
            for (auto& part : split_commas(value)) {
                apply_value(options, spec->name, part);
            }
        } else {
            apply_value(options, spec->name, value);
        }
    }

    KILN_LOG_DEBUG("request", "Parsed options: " << options.sources.size() << " sources, "
                                                 << options.input_summaries.size()
                                                 << " input summaries, summary-only="
                                                 << options.summary_only);
    return options;
}

auto validate(const ParsedOptions& options) -> std::optional<diag::Diagnostic> {
    if (options.help) {
        return std::nullopt;
    }
    if (!options.platform_summary || options.platform_summary->empty()) {
        return error("Missing required option \"--platform-summary\".");
    }
    if (!options.output || options.output->empty()) {
        return error("Missing required option \"--output\".");
    }
    return std::nullopt;
}

auto usage() -> std::string {
    std::ostringstream out;
    out << "Usage: kiln [--persistent_worker] [options] [@argfile]\n\n";
    out << "Options:\n";

    size_t width = 0;
    for (const auto& spec : option_table()) {
        size_t len = spec.name.size() + (spec.negatable ? 5 : 0) +
                     (spec.kind != OptionKind::Flag ? 8 : 0) + (spec.abbreviation ? 4 : 0);
        width = std::max(width, len);
    }

    for (const auto& spec : option_table()) {
        std::string left;
        if (spec.abbreviation) {
            left += "-";
            left += spec.abbreviation;
            left += ", ";
        }
        left += spec.negatable ? "--[no-]" : "--";
        left += spec.name;
        if (spec.kind != OptionKind::Flag) {
            left += "=<value>";
        }

        out << "  " << left << std::string(width + 4 - std::min(width + 4, left.size()), ' ')
            << spec.help;
        if (spec.kind == OptionKind::Multi) {
            out << " (repeatable)";
        }
        if (!spec.default_value.empty()) {
            out << " (defaults to \"" << spec.default_value << "\")";
        }
        out << "\n";
    }
    return out.str();
}

} // namespace kiln::args
