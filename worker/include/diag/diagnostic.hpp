//! # Diagnostics
//!
//! Every problem a request runs into ends up as a `Diagnostic` in the
//! request's `WorkResult`. Severities and error kinds are closed enums.
//!
//! ## Error Kinds
//!
//! | Kind                       | Raised by                                  |
//! |----------------------------|--------------------------------------------|
//! | `ArgFileUnreadable`        | argument expansion (`@file`)               |
//! | `OptionParseError`         | option parsing and validation              |
//! | `ResolutionError`          | loading summaries, linked inputs, packages |
//! | `CompileDiagnostic`        | the compiler service                       |
//! | `FilterInvariantViolation` | summary filter and artifact encoder        |
//! | `ArtifactWriteFailed`      | artifact writer                            |
//! | `InternalError`            | exception caught at a boundary             |
//!
//! Only `Severity::Error` fails a request.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kiln::diag {

// ============================================================================
// Severity and Kind
// ============================================================================

enum class Severity : uint8_t {
    Info,
    Warning,
    Error,
};

enum class ErrorKind : uint8_t {
    None, ///< Informational message
    ArgFileUnreadable,
    OptionParseError,
    ResolutionError,
    CompileDiagnostic,
    FilterInvariantViolation,
    ArtifactWriteFailed,
    InternalError,
};

[[nodiscard]] auto severity_name(Severity severity) -> const char*;

[[nodiscard]] auto kind_name(ErrorKind kind) -> const char*;

// ============================================================================
// Diagnostic
// ============================================================================

/// A position in a source file. Line and column are 1-based.
struct SourceLocation {
    std::string uri;
    uint32_t line = 0;
    uint32_t column = 0;
};

struct Diagnostic {
    Severity severity = Severity::Error;
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::optional<SourceLocation> location;
    /// Extra lines printed below the message (source excerpt, notes).
    std::vector<std::string> context;

    [[nodiscard]] static auto error(ErrorKind kind, std::string message) -> Diagnostic;
    [[nodiscard]] static auto warning(std::string message) -> Diagnostic;
    [[nodiscard]] static auto info(std::string message) -> Diagnostic;

    [[nodiscard]] auto is_error() const -> bool {
        return severity == Severity::Error;
    }

    /// Formats the diagnostic as it appears in a response's output text.
    ///
    /// ```text
    /// multi-root:///lib/a.kl:3:17: Error[CompileDiagnostic]: Expected 'Int' but found 'String'
    ///   let x: Int = "s";
    ///                ^
    /// ```
    ///
    /// The bracketed kind is omitted for `ErrorKind::None`; info diagnostics
    /// are rendered as their bare message.
    [[nodiscard]] auto format() const -> std::string;
};

/// True if any diagnostic has error severity.
[[nodiscard]] auto has_errors(const std::vector<Diagnostic>& diagnostics) -> bool;

} // namespace kiln::diag
