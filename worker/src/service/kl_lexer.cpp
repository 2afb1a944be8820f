#include "service/kl_lexer.hpp"

#include "common/utf8.hpp"

#include <cctype>
#include <cstdio>
#include <limits>

namespace kiln::service {

auto token_kind_name(TokenKind kind) -> const char* {
    switch (kind) {
    case TokenKind::Ident:
        return "identifier";
    case TokenKind::IntLiteral:
        return "integer literal";
    case TokenKind::StringLiteral:
        return "string literal";
    case TokenKind::True:
        return "'true'";
    case TokenKind::False:
        return "'false'";
    case TokenKind::KwImport:
        return "'import'";
    case TokenKind::KwLet:
        return "'let'";
    case TokenKind::KwConst:
        return "'const'";
    case TokenKind::KwFn:
        return "'fn'";
    case TokenKind::Colon:
        return "':'";
    case TokenKind::Semi:
        return "';'";
    case TokenKind::Comma:
        return "','";
    case TokenKind::Assign:
        return "'='";
    case TokenKind::Plus:
        return "'+'";
    case TokenKind::LParen:
        return "'('";
    case TokenKind::RParen:
        return "')'";
    case TokenKind::Eof:
        return "end of file";
    case TokenKind::Error:
        return "invalid token";
    }
    return "token";
}

Lexer::Lexer(std::string_view source) : source_(source) {}

auto Lexer::peek(size_t ahead) const -> char {
    return pos_ + ahead < source_.size() ? source_[pos_ + ahead] : '\0';
}

auto Lexer::advance() -> char {
    char c = source_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void Lexer::skip_trivia() {
    while (pos_ < source_.size()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else if (c == '/' && peek(1) == '/') {
            while (pos_ < source_.size() && peek() != '\n') {
                advance();
            }
        } else {
            break;
        }
    }
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    while (true) {
        Token token = next_token();
        bool eof = token.is(TokenKind::Eof);
        tokens.push_back(std::move(token));
        if (eof) {
            break;
        }
    }
    return tokens;
}

auto Lexer::next_token() -> Token {
    skip_trivia();

    Token token;
    token.line = line_;
    token.column = column_;
    if (pos_ >= source_.size()) {
        token.kind = TokenKind::Eof;
        return token;
    }

    char c = peek();
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        return lex_identifier(std::move(token));
    }
    if (std::isdigit(static_cast<unsigned char>(c))) {
        return lex_number(std::move(token));
    }
    if (c == '"') {
        return lex_string(std::move(token));
    }

    advance();
    token.text = std::string(1, c);
    switch (c) {
    case ':':
        token.kind = TokenKind::Colon;
        return token;
    case ';':
        token.kind = TokenKind::Semi;
        return token;
    case ',':
        token.kind = TokenKind::Comma;
        return token;
    case '=':
        token.kind = TokenKind::Assign;
        return token;
    case '+':
        token.kind = TokenKind::Plus;
        return token;
    case '(':
        token.kind = TokenKind::LParen;
        return token;
    case ')':
        token.kind = TokenKind::RParen;
        return token;
    default:
        return lex_invalid(std::move(token));
    }
}

auto Lexer::lex_identifier(Token token) -> Token {
    size_t start = pos_;
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_') {
        advance();
    }
    token.text = std::string(source_.substr(start, pos_ - start));

    if (token.text == "import") {
        token.kind = TokenKind::KwImport;
    } else if (token.text == "let") {
        token.kind = TokenKind::KwLet;
    } else if (token.text == "const") {
        token.kind = TokenKind::KwConst;
    } else if (token.text == "fn") {
        token.kind = TokenKind::KwFn;
    } else if (token.text == "true") {
        token.kind = TokenKind::True;
    } else if (token.text == "false") {
        token.kind = TokenKind::False;
    } else {
        token.kind = TokenKind::Ident;
    }
    return token;
}

auto Lexer::lex_number(Token token) -> Token {
    size_t start = pos_;
    int64_t value = 0;
    bool overflow = false;
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
        int digit = advance() - '0';
        if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
            overflow = true;
        } else {
            value = value * 10 + digit;
        }
    }
    token.text = std::string(source_.substr(start, pos_ - start));
    if (overflow) {
        std::string message = "Integer literal " + token.text + " is too large";
        return error_token(std::move(token), std::move(message));
    }
    token.kind = TokenKind::IntLiteral;
    token.int_value = value;
    return token;
}

auto Lexer::lex_string(Token token) -> Token {
    advance(); // opening quote
    std::string value;
    while (pos_ < source_.size() && peek() != '"' && peek() != '\n') {
        char c = advance();
        if (c != '\\') {
            value += c;
            continue;
        }
        char escaped = pos_ < source_.size() ? advance() : '\0';
        switch (escaped) {
        case 'n':
            value += '\n';
            break;
        case 't':
            value += '\t';
            break;
        case '"':
        case '\\':
            value += escaped;
            break;
        default:
            errors_.push_back({std::string("Invalid escape sequence '\\") + escaped + "'", line_,
                               column_ - 1});
            break;
        }
    }
    if (peek() != '"') {
        return error_token(std::move(token), "Unterminated string literal");
    }
    advance(); // closing quote
    token.kind = TokenKind::StringLiteral;
    token.text = std::move(value);
    return token;
}

auto Lexer::lex_invalid(Token token) -> Token {
    // The first byte is already consumed; a multi-byte character becomes one token.
    size_t start = pos_ - 1;
    size_t length = utf8_sequence_length(source_, start);
    if (length == 0) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "0x%02X",
                      static_cast<unsigned>(static_cast<unsigned char>(source_[start])));
        return error_token(std::move(token), std::string("Invalid byte ") + buf +
                                                 " (source is not valid UTF-8)");
    }
    for (size_t i = 1; i < length; ++i) {
        advance();
    }
    token.text = std::string(source_.substr(start, length));
    std::string message = "Invalid character '" + token.text + "'";
    return error_token(std::move(token), std::move(message));
}

auto Lexer::error_token(Token token, std::string message) -> Token {
    errors_.push_back({std::move(message), token.line, token.column});
    token.kind = TokenKind::Error;
    return token;
}

} // namespace kiln::service
