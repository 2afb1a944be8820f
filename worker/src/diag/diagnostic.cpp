#include "diag/diagnostic.hpp"

#include <algorithm>

namespace kiln::diag {

auto severity_name(Severity severity) -> const char* {
    switch (severity) {
    case Severity::Info:
        return "Info";
    case Severity::Warning:
        return "Warning";
    case Severity::Error:
        return "Error";
    }
    return "Unknown";
}

auto kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::ArgFileUnreadable:
        return "ArgFileUnreadable";
    case ErrorKind::OptionParseError:
        return "OptionParseError";
    case ErrorKind::ResolutionError:
        return "ResolutionError";
    case ErrorKind::CompileDiagnostic:
        return "CompileDiagnostic";
    case ErrorKind::FilterInvariantViolation:
        return "FilterInvariantViolation";
    case ErrorKind::ArtifactWriteFailed:
        return "ArtifactWriteFailed";
    case ErrorKind::InternalError:
        return "InternalError";
    }
    return "Unknown";
}

auto Diagnostic::error(ErrorKind kind, std::string message) -> Diagnostic {
    Diagnostic d;
    d.severity = Severity::Error;
    d.kind = kind;
    d.message = std::move(message);
    return d;
}

auto Diagnostic::warning(std::string message) -> Diagnostic {
    Diagnostic d;
    d.severity = Severity::Warning;
    d.message = std::move(message);
    return d;
}

auto Diagnostic::info(std::string message) -> Diagnostic {
    Diagnostic d;
    d.severity = Severity::Info;
    d.message = std::move(message);
    return d;
}

auto Diagnostic::format() const -> std::string {
    if (severity == Severity::Info) {
        return message;
    }

    std::string out;
    if (location) {
        out += location->uri;
        out += ':' + std::to_string(location->line) + ':' + std::to_string(location->column);
        out += ": ";
    }
    out += severity_name(severity);
    if (kind != ErrorKind::None) {
        out += '[';
        out += kind_name(kind);
        out += ']';
    }
    out += ": ";
    out += message;
    for (const auto& line : context) {
        out += '\n';
        out += line;
    }
    return out;
}

auto has_errors(const std::vector<Diagnostic>& diagnostics) -> bool {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
                       [](const Diagnostic& d) { return d.is_error(); });
}

} // namespace kiln::diag
