//! # JSON Parser Implementation
//!
//! Character-level recursive descent over the input. Strings are unescaped
//! (including `\uXXXX` and surrogate pairs) into UTF-8.

#include "json/json_parser.hpp"

#include <charconv>
#include <cstdlib>

namespace kiln::json {

namespace {

void append_utf8(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

} // namespace

JsonParser::JsonParser(std::string_view input) : input_(input) {}

auto JsonParser::peek() const -> char {
    return pos_ < input_.size() ? input_[pos_] : '\0';
}

auto JsonParser::advance() -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonParser::skip_whitespace() {
    while (pos_ < input_.size()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto JsonParser::make_error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, line_, column_);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }
    skip_whitespace();
    if (pos_ < input_.size()) {
        return make_error("Unexpected content after JSON value");
    }
    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    if (depth_ >= MAX_DEPTH) {
        return make_error("Maximum nesting depth exceeded");
    }

    skip_whitespace();
    char c = peek();
    switch (c) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"': {
        auto str = parse_string();
        if (is_err(str)) {
            return unwrap_err(str);
        }
        return JsonValue(std::move(unwrap(str)));
    }
    case 't':
    case 'f':
    case 'n':
        return parse_keyword();
    case '\0':
        return make_error("Unexpected end of input");
    default:
        if (c == '-' || (c >= '0' && c <= '9')) {
            return parse_number();
        }
        return make_error(std::string("Unexpected character '") + c + "'");
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '{'

    JsonObject obj;
    skip_whitespace();
    if (peek() == '}') {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            return make_error("Expected string key in object");
        }
        auto key = parse_string();
        if (is_err(key)) {
            return unwrap_err(key);
        }

        skip_whitespace();
        if (advance() != ':') {
            return make_error("Expected ':' after object key");
        }

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj[std::move(unwrap(key))] = std::move(unwrap(value));

        skip_whitespace();
        char next = advance();
        if (next == '}') {
            --depth_;
            return JsonValue(std::move(obj));
        }
        if (next != ',') {
            return make_error("Expected ',' or '}' in object");
        }
    }
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '['

    JsonArray arr;
    skip_whitespace();
    if (peek() == ']') {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        skip_whitespace();
        char next = advance();
        if (next == ']') {
            --depth_;
            return JsonValue(std::move(arr));
        }
        if (next != ',') {
            return make_error("Expected ',' or ']' in array");
        }
    }
}

auto JsonParser::parse_string() -> Result<std::string, JsonError> {
    size_t start_line = line_;
    size_t start_col = column_;
    advance(); // opening quote

    std::string value;
    while (pos_ < input_.size()) {
        char c = advance();
        if (c == '"') {
            return value;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return make_error("Control character in string");
        }
        if (c != '\\') {
            value += c;
            continue;
        }

        char escaped = advance();
        switch (escaped) {
        case '"':
            value += '"';
            break;
        case '\\':
            value += '\\';
            break;
        case '/':
            value += '/';
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            auto read_hex = [this](uint32_t& out) -> bool {
                if (pos_ + 4 > input_.size()) {
                    return false;
                }
                const char* begin = input_.data() + pos_;
                auto [ptr, ec] = std::from_chars(begin, begin + 4, out, 16);
                if (ec != std::errc{} || ptr != begin + 4) {
                    return false;
                }
                pos_ += 4;
                column_ += 4;
                return true;
            };
            uint32_t codepoint = 0;
            if (!read_hex(codepoint)) {
                return make_error("Invalid unicode escape sequence");
            }
            if (codepoint >= 0xD800 && codepoint <= 0xDBFF && peek() == '\\' &&
                pos_ + 1 < input_.size() && input_[pos_ + 1] == 'u') {
                advance();
                advance();
                uint32_t low = 0;
                if (!read_hex(low) || low < 0xDC00 || low > 0xDFFF) {
                    return make_error("Invalid unicode surrogate pair");
                }
                codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
            }
            append_utf8(value, codepoint);
            break;
        }
        default:
            return make_error(std::string("Invalid escape sequence: \\") + escaped);
        }
    }

    return JsonError::make("Unterminated string", start_line, start_col);
}

auto JsonParser::parse_number() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    bool is_float = false;

    if (peek() == '-') {
        advance();
    }
    if (peek() < '0' || peek() > '9') {
        return make_error("Invalid number");
    }
    while (peek() >= '0' && peek() <= '9') {
        advance();
    }
    if (peek() == '.') {
        is_float = true;
        advance();
        if (peek() < '0' || peek() > '9') {
            return make_error("Expected digit after decimal point");
        }
        while (peek() >= '0' && peek() <= '9') {
            advance();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (peek() < '0' || peek() > '9') {
            return make_error("Expected digit in exponent");
        }
        while (peek() >= '0' && peek() <= '9') {
            advance();
        }
    }

    std::string_view text = input_.substr(start, pos_ - start);
    if (!is_float) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            return JsonValue(value);
        }
        // Out of int64 range: fall through to double.
    }
    return JsonValue(std::strtod(std::string(text).c_str(), nullptr));
}

auto JsonParser::parse_keyword() -> Result<JsonValue, JsonError> {
    auto rest = input_.substr(pos_);
    auto consume = [this](size_t n) {
        for (size_t i = 0; i < n; ++i) {
            advance();
        }
    };
    if (rest.starts_with("true")) {
        consume(4);
        return JsonValue(true);
    }
    if (rest.starts_with("false")) {
        consume(5);
        return JsonValue(false);
    }
    if (rest.starts_with("null")) {
        consume(4);
        return JsonValue();
    }
    return make_error("Invalid literal");
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace kiln::json
