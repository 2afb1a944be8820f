#include "service/kl_parser.hpp"

namespace kiln::service {

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || !tokens_.back().is(TokenKind::Eof)) {
        tokens_.push_back(Token{});
    }
}

// ============================================================================
// Token Access
// ============================================================================

auto Parser::peek() const -> const Token& {
    return tokens_[pos_];
}

auto Parser::advance() -> const Token& {
    const Token& token = tokens_[pos_];
    if (!token.is(TokenKind::Eof)) {
        ++pos_;
    }
    return token;
}

auto Parser::check(TokenKind kind) const -> bool {
    return peek().is(kind);
}

auto Parser::match(TokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::expect(TokenKind kind, const char* context) -> std::optional<Token> {
    if (check(kind)) {
        return advance();
    }
    const Token& found = peek();
    // Invalid tokens were already reported by the lexer.
    if (!found.is(TokenKind::Error)) {
        errors_.push_back({std::string("Expected ") + token_kind_name(kind) + " " + context +
                               ", found " + token_kind_name(found.kind),
                           Position{found.line, found.column}});
    }
    return std::nullopt;
}

void Parser::synchronize() {
    while (!check(TokenKind::Eof)) {
        if (advance().is(TokenKind::Semi)) {
            return;
        }
    }
}

// ============================================================================
// Declarations
// ============================================================================

auto Parser::parse_module() -> ModuleAst {
    ModuleAst module;
    while (!check(TokenKind::Eof)) {
        if (check(TokenKind::KwImport)) {
            if (auto imp = parse_import()) {
                module.imports.push_back(std::move(*imp));
                continue;
            }
        } else if (check(TokenKind::KwLet) || check(TokenKind::KwConst) ||
                   check(TokenKind::KwFn)) {
            if (auto member = parse_member()) {
                module.members.push_back(std::move(*member));
                continue;
            }
        } else {
            const Token& found = peek();
            if (!found.is(TokenKind::Error)) {
                errors_.push_back({std::string("Expected a declaration, found ") +
                                       token_kind_name(found.kind),
                                   Position{found.line, found.column}});
            }
        }
        synchronize();
    }
    return module;
}

auto Parser::parse_import() -> std::optional<ImportDecl> {
    const Token& kw = advance();
    auto uri = expect(TokenKind::StringLiteral, "after 'import'");
    if (!uri) {
        return std::nullopt;
    }
    if (!expect(TokenKind::Semi, "after import")) {
        return std::nullopt;
    }
    return ImportDecl{uri->text, Position{kw.line, kw.column}};
}

auto Parser::parse_member() -> std::optional<MemberDecl> {
    MemberDecl decl;
    const Token& kw = advance();
    decl.kind = kw.is(TokenKind::KwFn)      ? kernel::MemberKind::Fn
                : kw.is(TokenKind::KwConst) ? kernel::MemberKind::Const
                                            : kernel::MemberKind::Let;

    auto name = expect(TokenKind::Ident, "as declaration name");
    if (!name) {
        return std::nullopt;
    }
    decl.name = name->text;
    decl.pos = Position{name->line, name->column};

    if (decl.kind == kernel::MemberKind::Fn) {
        if (!expect(TokenKind::LParen, "after function name")) {
            return std::nullopt;
        }
        if (!check(TokenKind::RParen)) {
            do {
                auto param_name = expect(TokenKind::Ident, "as parameter name");
                if (!param_name || !expect(TokenKind::Colon, "after parameter name")) {
                    return std::nullopt;
                }
                auto type = parse_type();
                if (!type) {
                    return std::nullopt;
                }
                decl.params.push_back(Param{param_name->text, std::move(*type),
                                            Position{param_name->line, param_name->column}});
            } while (match(TokenKind::Comma));
        }
        if (!expect(TokenKind::RParen, "after parameters")) {
            return std::nullopt;
        }
    }

    if (!expect(TokenKind::Colon, "before type")) {
        return std::nullopt;
    }
    auto type = parse_type();
    if (!type) {
        return std::nullopt;
    }
    decl.type = std::move(*type);

    if (!expect(TokenKind::Assign, "before initializer")) {
        return std::nullopt;
    }
    decl.init = parse_expr();
    if (!decl.init) {
        return std::nullopt;
    }
    if (!expect(TokenKind::Semi, "after declaration")) {
        return std::nullopt;
    }
    return decl;
}

auto Parser::parse_type() -> std::optional<TypeRef> {
    auto name = expect(TokenKind::Ident, "as type name");
    if (!name) {
        return std::nullopt;
    }
    return TypeRef{name->text, Position{name->line, name->column}};
}

// ============================================================================
// Expressions
// ============================================================================

auto Parser::parse_expr() -> Box<Expr> {
    auto lhs = parse_primary();
    if (!lhs) {
        return nullptr;
    }
    while (check(TokenKind::Plus)) {
        const Token& op = advance();
        auto rhs = parse_primary();
        if (!rhs) {
            return nullptr;
        }
        auto add = make_box<Expr>();
        add->kind = ExprKind::Add;
        add->pos = Position{op.line, op.column};
        add->operands.push_back(std::move(lhs));
        add->operands.push_back(std::move(rhs));
        lhs = std::move(add);
    }
    return lhs;
}

auto Parser::parse_primary() -> Box<Expr> {
    const Token& token = peek();
    auto expr = make_box<Expr>();
    expr->pos = Position{token.line, token.column};

    switch (token.kind) {
    case TokenKind::IntLiteral:
        expr->kind = ExprKind::IntLiteral;
        expr->int_value = token.int_value;
        advance();
        return expr;
    case TokenKind::StringLiteral:
        expr->kind = ExprKind::StringLiteral;
        expr->text = token.text;
        advance();
        return expr;
    case TokenKind::True:
    case TokenKind::False:
        expr->kind = ExprKind::BoolLiteral;
        expr->bool_value = token.is(TokenKind::True);
        advance();
        return expr;
    case TokenKind::LParen: {
        advance();
        auto inner = parse_expr();
        if (!inner || !expect(TokenKind::RParen, "to close parenthesis")) {
            return nullptr;
        }
        return inner;
    }
    case TokenKind::Ident:
        expr->kind = ExprKind::Name;
        expr->text = token.text;
        advance();
        if (match(TokenKind::LParen)) {
            expr->kind = ExprKind::Call;
            if (!check(TokenKind::RParen)) {
                do {
                    auto arg = parse_expr();
                    if (!arg) {
                        return nullptr;
                    }
                    expr->operands.push_back(std::move(arg));
                } while (match(TokenKind::Comma));
            }
            if (!expect(TokenKind::RParen, "after arguments")) {
                return nullptr;
            }
        }
        return expr;
    default:
        if (!token.is(TokenKind::Error)) {
            errors_.push_back({std::string("Expected an expression, found ") +
                                   token_kind_name(token.kind),
                               expr->pos});
        }
        return nullptr;
    }
}

} // namespace kiln::service
