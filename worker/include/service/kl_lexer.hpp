//! # Module Language Lexer
//!
//! Tokenizer for the small module language compiled by `SourceCompiler`.
//!
//! ```text
//! import "other.kl";
//! const greeting: String = "hi";
//! fn add(a: Int, b: Int): Int = a + b;   // line comment
//! ```
//!
//! The lexer continues after errors; each bad character or unterminated
//! string produces a `TokenKind::Error` token and an entry in `errors()`.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::service {

enum class TokenKind : uint8_t {
    // Literals and names
    Ident,
    IntLiteral,
    StringLiteral,
    True,
    False,

    // Keywords
    KwImport,
    KwLet,
    KwConst,
    KwFn,

    // Punctuation
    Colon,
    Semi,
    Comma,
    Assign,
    Plus,
    LParen,
    RParen,

    Eof,
    Error,
};

[[nodiscard]] auto token_kind_name(TokenKind kind) -> const char*;

struct Token {
    TokenKind kind = TokenKind::Eof;
    uint32_t line = 1;
    uint32_t column = 1;
    /// Identifier name, unescaped string contents, or raw text.
    std::string text;
    int64_t int_value = 0;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }
};

struct LexerError {
    std::string message;
    uint32_t line = 0;
    uint32_t column = 0;
};

class Lexer {
public:
    /// The source must outlive the lexer.
    explicit Lexer(std::string_view source);

    /// Tokenizes the whole source. The result always ends with `Eof`.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    [[nodiscard]] auto errors() const -> const std::vector<LexerError>& {
        return errors_;
    }

private:
    std::string_view source_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;
    std::vector<LexerError> errors_;

    [[nodiscard]] auto peek(size_t ahead = 0) const -> char;
    auto advance() -> char;
    void skip_trivia();

    auto next_token() -> Token;
    auto lex_identifier(Token token) -> Token;
    auto lex_number(Token token) -> Token;
    auto lex_string(Token token) -> Token;
    auto lex_invalid(Token token) -> Token;
    auto error_token(Token token, std::string message) -> Token;
};

} // namespace kiln::service
