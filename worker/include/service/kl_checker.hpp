//! # Module Language Checker
//!
//! Resolves names, checks types and produces the `kernel::ModuleNode` for one
//! parsed module.
//!
//! ## Name Resolution
//!
//! Inside an initializer a name is looked up in order:
//!
//! 1. parameters of the enclosing `fn`
//! 2. members of the module itself
//! 3. exported members (not starting with `_`) of imported modules
//!
//! A name exported by two imports and not shadowed is ambiguous.
//!
//! ## Outlines
//!
//! In summary mode a member keeps only the references its outline needs:
//! `const` initializers keep theirs, `let` and `fn` bodies are dropped.

#pragma once

#include "diag/diagnostic.hpp"
#include "kernel/graph.hpp"
#include "service/kl_ast.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::service {

// ============================================================================
// Types
// ============================================================================

enum class Type : uint8_t {
    Int,
    String,
    Bool,
    Error, ///< Result of an expression that already produced a diagnostic
};

[[nodiscard]] auto type_name(Type type) -> const char*;

[[nodiscard]] auto parse_type_name(std::string_view name) -> std::optional<Type>;

/// Member signature. Stored in the graph as text: `Int` for values,
/// `(Int, String) -> Bool` for functions.
struct Signature {
    bool is_fn = false;
    std::vector<Type> params;
    Type result = Type::Error;

    [[nodiscard]] auto to_string() const -> std::string;
};

[[nodiscard]] auto parse_signature(std::string_view text) -> std::optional<Signature>;

// ============================================================================
// Diagnostics
// ============================================================================

/// Builds a `CompileDiagnostic` at `pos` with the offending source line and a
/// caret as context.
[[nodiscard]] auto source_diagnostic(const std::string& uri, std::string_view source,
                                     Position pos, std::string message) -> diag::Diagnostic;

/// Declared signatures of a parsed module, without references. Used as the
/// import interface of modules compiled in the same request.
[[nodiscard]] auto declared_interface(const std::string& uri, const ModuleAst& ast)
    -> kernel::ModuleNode;

// ============================================================================
// Checker
// ============================================================================

class Checker {
public:
    /// # Arguments
    ///
    /// * `uri` - Import URI of the module being checked
    /// * `source` - Its text, for diagnostic excerpts
    /// * `summary_only` - Keep outline references only
    /// * `imports` - Interfaces of the modules it imports, in import order
    Checker(std::string uri, std::string_view source, bool summary_only,
            std::vector<const kernel::ModuleNode*> imports);

    /// Checks `ast` and returns its module node (import URIs are filled in
    /// by the caller).
    [[nodiscard]] auto check(const ModuleAst& ast) -> kernel::ModuleNode;

    [[nodiscard]] auto diagnostics() const -> const std::vector<diag::Diagnostic>& {
        return diagnostics_;
    }

private:
    struct Local {
        std::string name;
        Type type;
    };

    struct Resolved {
        Signature signature;
        std::optional<kernel::Reference> reference; ///< Empty for parameters
    };

    std::string uri_;
    std::string_view source_;
    bool summary_only_;
    std::vector<const kernel::ModuleNode*> imports_;
    std::vector<diag::Diagnostic> diagnostics_;

    /// Own members by name, filled before any initializer is checked.
    std::vector<std::pair<std::string, Signature>> own_;
    std::vector<Local> locals_;
    std::vector<kernel::Reference> refs_;

    void error(Position pos, std::string message);
    auto resolve_type(const TypeRef& ref) -> Type;
    auto resolve_name(const std::string& name, Position pos) -> std::optional<Resolved>;
    auto check_expr(const Expr& expr) -> Type;
};

} // namespace kiln::service
