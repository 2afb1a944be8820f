//! # Module Language Parser
//!
//! Recursive descent parser over the token stream.
//!
//! ```text
//! module  := (import | member)*
//! import  := "import" STRING ";"
//! member  := ("let" | "const") IDENT ":" IDENT "=" expr ";"
//!          | "fn" IDENT "(" (param ("," param)*)? ")" ":" IDENT "=" expr ";"
//! param   := IDENT ":" IDENT
//! expr    := primary ("+" primary)*
//! primary := INT | STRING | "true" | "false" | IDENT ("(" args? ")")? | "(" expr ")"
//! ```
//!
//! On a syntax error the parser records it, skips past the next `;` and
//! continues, so one compile reports every broken declaration.

#pragma once

#include "service/kl_ast.hpp"
#include "service/kl_lexer.hpp"

#include <optional>
#include <vector>

namespace kiln::service {

struct ParseError {
    std::string message;
    Position pos;
};

class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    [[nodiscard]] auto parse_module() -> ModuleAst;

    [[nodiscard]] auto errors() const -> const std::vector<ParseError>& {
        return errors_;
    }

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    std::vector<ParseError> errors_;

    [[nodiscard]] auto peek() const -> const Token&;
    auto advance() -> const Token&;
    [[nodiscard]] auto check(TokenKind kind) const -> bool;
    auto match(TokenKind kind) -> bool;
    auto expect(TokenKind kind, const char* context) -> std::optional<Token>;
    void synchronize();

    auto parse_import() -> std::optional<ImportDecl>;
    auto parse_member() -> std::optional<MemberDecl>;
    auto parse_type() -> std::optional<TypeRef>;
    auto parse_expr() -> Box<Expr>;
    auto parse_primary() -> Box<Expr>;
};

} // namespace kiln::service
