#include "service/kl_checker.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace kiln::service {

// ============================================================================
// Types
// ============================================================================

auto type_name(Type type) -> const char* {
    switch (type) {
    case Type::Int:
        return "Int";
    case Type::String:
        return "String";
    case Type::Bool:
        return "Bool";
    case Type::Error:
        return "<error>";
    }
    return "<error>";
}

auto parse_type_name(std::string_view name) -> std::optional<Type> {
    if (name == "Int") {
        return Type::Int;
    }
    if (name == "String") {
        return Type::String;
    }
    if (name == "Bool") {
        return Type::Bool;
    }
    // Interfaces of modules with broken declarations carry this name.
    if (name == "<error>") {
        return Type::Error;
    }
    return std::nullopt;
}

auto Signature::to_string() const -> std::string {
    if (!is_fn) {
        return type_name(result);
    }
    std::string text = "(";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += type_name(params[i]);
    }
    text += ") -> ";
    text += type_name(result);
    return text;
}

auto parse_signature(std::string_view text) -> std::optional<Signature> {
    Signature sig;
    if (!text.starts_with("(")) {
        auto type = parse_type_name(text);
        if (!type) {
            return std::nullopt;
        }
        sig.result = *type;
        return sig;
    }

    sig.is_fn = true;
    size_t close = text.find(')');
    if (close == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view params = text.substr(1, close - 1);
    while (!params.empty()) {
        size_t comma = params.find(',');
        std::string_view part = params.substr(0, comma);
        while (!part.empty() && part.front() == ' ') {
            part.remove_prefix(1);
        }
        auto type = parse_type_name(part);
        if (!type) {
            return std::nullopt;
        }
        sig.params.push_back(*type);
        if (comma == std::string_view::npos) {
            break;
        }
        params.remove_prefix(comma + 1);
    }

    std::string_view rest = text.substr(close + 1);
    if (!rest.starts_with(" -> ")) {
        return std::nullopt;
    }
    auto result = parse_type_name(rest.substr(4));
    if (!result) {
        return std::nullopt;
    }
    sig.result = *result;
    return sig;
}

auto declared_interface(const std::string& uri, const ModuleAst& ast) -> kernel::ModuleNode {
    kernel::ModuleNode node;
    node.import_uri = uri;
    for (const auto& decl : ast.members) {
        if (node.find_member(decl.name) != nullptr) {
            continue;
        }
        Signature sig;
        sig.is_fn = decl.kind == kernel::MemberKind::Fn;
        for (const auto& param : decl.params) {
            sig.params.push_back(parse_type_name(param.type.name).value_or(Type::Error));
        }
        sig.result = parse_type_name(decl.type.name).value_or(Type::Error);

        kernel::Member member;
        member.kind = decl.kind;
        member.name = decl.name;
        member.type = sig.to_string();
        node.members.push_back(std::move(member));
    }
    return node;
}

// ============================================================================
// Diagnostics
// ============================================================================

auto source_diagnostic(const std::string& uri, std::string_view source, Position pos,
                       std::string message) -> diag::Diagnostic {
    auto d = diag::Diagnostic::error(diag::ErrorKind::CompileDiagnostic, std::move(message));
    d.location = diag::SourceLocation{uri, pos.line, pos.column};

    size_t start = 0;
    for (uint32_t line = 1; line < pos.line && start != std::string_view::npos; ++line) {
        start = source.find('\n', start);
        if (start != std::string_view::npos) {
            ++start;
        }
    }
    if (start != std::string_view::npos && start <= source.size() && pos.line > 0) {
        size_t end = source.find('\n', start);
        std::string_view text = source.substr(start, end == std::string_view::npos
                                                         ? std::string_view::npos
                                                         : end - start);
        if (!text.empty() && text.back() == '\r') {
            text.remove_suffix(1);
        }
        d.context.push_back("  " + std::string(text));
        d.context.push_back("  " + std::string(pos.column > 0 ? pos.column - 1 : 0, ' ') + "^");
    }
    return d;
}

// ============================================================================
// Checker
// ============================================================================

Checker::Checker(std::string uri, std::string_view source, bool summary_only,
                 std::vector<const kernel::ModuleNode*> imports)
    : uri_(std::move(uri)), source_(source), summary_only_(summary_only),
      imports_(std::move(imports)) {}

void Checker::error(Position pos, std::string message) {
    diagnostics_.push_back(source_diagnostic(uri_, source_, pos, std::move(message)));
}

auto Checker::resolve_type(const TypeRef& ref) -> Type {
    auto type = parse_type_name(ref.name);
    if (!type || *type == Type::Error) {
        error(ref.pos, "Unknown type '" + ref.name + "'");
        return Type::Error;
    }
    return *type;
}

auto Checker::check(const ModuleAst& ast) -> kernel::ModuleNode {
    kernel::ModuleNode node;
    node.import_uri = uri_;

    // Signatures first, so initializers may refer to later members.
    std::vector<bool> duplicate(ast.members.size(), false);
    for (size_t i = 0; i < ast.members.size(); ++i) {
        const auto& decl = ast.members[i];
        auto existing = std::find_if(own_.begin(), own_.end(),
                                     [&](const auto& entry) { return entry.first == decl.name; });
        if (existing != own_.end()) {
            error(decl.pos, "Duplicate definition of '" + decl.name + "'");
            duplicate[i] = true;
            continue;
        }

        Signature sig;
        sig.is_fn = decl.kind == kernel::MemberKind::Fn;
        for (const auto& param : decl.params) {
            sig.params.push_back(resolve_type(param.type));
        }
        sig.result = resolve_type(decl.type);
        own_.emplace_back(decl.name, std::move(sig));
    }

    size_t own_index = 0;
    for (size_t i = 0; i < ast.members.size(); ++i) {
        if (duplicate[i]) {
            continue;
        }
        const auto& decl = ast.members[i];
        const Signature& sig = own_[own_index++].second;

        locals_.clear();
        refs_.clear();
        for (size_t p = 0; p < decl.params.size(); ++p) {
            const auto& param = decl.params[p];
            bool seen = std::any_of(locals_.begin(), locals_.end(),
                                    [&](const Local& l) { return l.name == param.name; });
            if (seen) {
                error(param.pos, "Duplicate parameter '" + param.name + "'");
            }
            locals_.push_back(Local{param.name, sig.params[p]});
        }

        Type actual = check_expr(*decl.init);
        if (actual != Type::Error && sig.result != Type::Error && actual != sig.result) {
            error(decl.init->pos, std::string("Expected '") + type_name(sig.result) +
                                      "' but found '" + type_name(actual) + "'");
        }

        kernel::Member member;
        member.kind = decl.kind;
        member.name = decl.name;
        member.type = sig.to_string();
        if (!summary_only_ || decl.kind == kernel::MemberKind::Const) {
            std::sort(refs_.begin(), refs_.end());
            refs_.erase(std::unique(refs_.begin(), refs_.end()), refs_.end());
            member.references = refs_;
        }
        node.members.push_back(std::move(member));
    }

    KILN_LOG_TRACE("session", "Checked " << uri_ << ": " << node.members.size() << " members, "
                                         << diagnostics_.size() << " diagnostics");
    return node;
}

auto Checker::resolve_name(const std::string& name, Position pos) -> std::optional<Resolved> {
    for (auto it = locals_.rbegin(); it != locals_.rend(); ++it) {
        if (it->name == name) {
            Signature sig;
            sig.result = it->type;
            return Resolved{std::move(sig), std::nullopt};
        }
    }

    for (const auto& [own_name, sig] : own_) {
        if (own_name == name) {
            return Resolved{sig, kernel::Reference{uri_, name}};
        }
    }

    const kernel::ModuleNode* found = nullptr;
    const kernel::Member* found_member = nullptr;
    const kernel::ModuleNode* private_owner = nullptr;
    for (const auto* imported : imports_) {
        const kernel::Member* member = imported->find_member(name);
        if (member == nullptr) {
            continue;
        }
        if (member->is_private()) {
            private_owner = imported;
            continue;
        }
        if (found != nullptr && found->import_uri != imported->import_uri) {
            error(pos, "Name '" + name + "' is ambiguous: it is exported by " + found->import_uri +
                           " and " + imported->import_uri);
            return std::nullopt;
        }
        found = imported;
        found_member = member;
    }

    if (found == nullptr) {
        auto d = source_diagnostic(uri_, source_, pos, "Unknown name '" + name + "'");
        if (private_owner != nullptr) {
            d.context.push_back("'" + name + "' is private to " + private_owner->import_uri);
        }
        diagnostics_.push_back(std::move(d));
        return std::nullopt;
    }

    auto sig = parse_signature(found_member->type);
    if (!sig) {
        error(pos, "Malformed signature '" + found_member->type + "' for " + found->import_uri +
                       "::" + name);
        return std::nullopt;
    }
    return Resolved{std::move(*sig), kernel::Reference{found->import_uri, name}};
}

auto Checker::check_expr(const Expr& expr) -> Type {
    switch (expr.kind) {
    case ExprKind::IntLiteral:
        return Type::Int;
    case ExprKind::StringLiteral:
        return Type::String;
    case ExprKind::BoolLiteral:
        return Type::Bool;

    case ExprKind::Name: {
        auto resolved = resolve_name(expr.text, expr.pos);
        if (!resolved) {
            return Type::Error;
        }
        if (resolved->reference) {
            refs_.push_back(*resolved->reference);
        }
        if (resolved->signature.is_fn) {
            error(expr.pos, "'" + expr.text + "' is a function and must be called");
            return Type::Error;
        }
        return resolved->signature.result;
    }

    case ExprKind::Add: {
        Type lhs = check_expr(*expr.operands[0]);
        Type rhs = check_expr(*expr.operands[1]);
        if (lhs == Type::Error || rhs == Type::Error) {
            return Type::Error;
        }
        if (lhs != rhs || lhs == Type::Bool) {
            error(expr.pos, std::string("Operator '+' cannot be applied to '") + type_name(lhs) +
                                "' and '" + type_name(rhs) + "'");
            return Type::Error;
        }
        return lhs;
    }

    case ExprKind::Call: {
        std::vector<Type> args;
        for (const auto& operand : expr.operands) {
            args.push_back(check_expr(*operand));
        }

        auto resolved = resolve_name(expr.text, expr.pos);
        if (!resolved) {
            return Type::Error;
        }
        if (resolved->reference) {
            refs_.push_back(*resolved->reference);
        }
        const Signature& sig = resolved->signature;
        if (!sig.is_fn) {
            error(expr.pos, "'" + expr.text + "' is not a function");
            return Type::Error;
        }
        if (args.size() != sig.params.size()) {
            error(expr.pos, "Function '" + expr.text + "' expects " +
                                std::to_string(sig.params.size()) + " arguments but got " +
                                std::to_string(args.size()));
            return sig.result;
        }
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] != Type::Error && sig.params[i] != Type::Error && args[i] != sig.params[i]) {
                error(expr.operands[i]->pos, "Argument " + std::to_string(i + 1) + " of '" +
                                                 expr.text + "' expects '" +
                                                 type_name(sig.params[i]) + "' but found '" +
                                                 type_name(args[i]) + "'");
            }
        }
        return sig.result;
    }
    }
    return Type::Error;
}

} // namespace kiln::service
