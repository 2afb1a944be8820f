//! # JSON Values and Serialization
//!
//! Accessors and compact serialization.

#include "json/json_value.hpp"

#include "common/utf8.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>
#include <type_traits>

namespace kiln::json {

namespace {

/// Malformed UTF-8 is replaced by U+FFFD so that every frame is valid UTF-8.
void write_string(std::string& out, const std::string& text) {
    out += '"';
    size_t pos = 0;
    while (pos < text.size()) {
        char c = text[pos];
        if (static_cast<unsigned char>(c) >= 0x80) {
            size_t length = utf8_sequence_length(text, pos);
            if (length == 0) {
                out += "\xEF\xBF\xBD";
                ++pos;
            } else {
                out.append(text, pos, length);
                pos += length;
            }
            continue;
        }
        ++pos;
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    out += '"';
}

void write_number(std::string& out, const JsonNumber& number) {
    if (auto i = number.as_i64()) {
        out += std::to_string(*i);
        return;
    }
    double d = number.as_f64();
    // JSON has no NaN or infinity.
    if (!std::isfinite(d)) {
        out += "null";
        return;
    }
    std::ostringstream oss;
    oss.precision(17);
    oss << d;
    std::string text = oss.str();
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    out += text;
}

void write_value(std::string& out, const JsonValue& value) {
    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, JsonValue::Null>) {
                out += "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                out += v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, JsonNumber>) {
                write_number(out, v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                write_string(out, v);
            } else if constexpr (std::is_same_v<T, Box<JsonArray>>) {
                out += '[';
                for (size_t i = 0; i < v->size(); ++i) {
                    if (i > 0) {
                        out += ',';
                    }
                    write_value(out, (*v)[i]);
                }
                out += ']';
            } else {
                out += '{';
                bool first = true;
                for (const auto& [key, item] : *v) {
                    if (!first) {
                        out += ',';
                    }
                    first = false;
                    write_string(out, key);
                    out += ':';
                    write_value(out, item);
                }
                out += '}';
            }
        },
        value.data);
}

} // namespace

// ============================================================================
// Access
// ============================================================================

auto JsonValue::is_integer() const -> bool {
    const auto* number = std::get_if<JsonNumber>(&data);
    return number != nullptr && number->is_integer();
}

auto JsonValue::as_bool() const -> bool {
    return std::get<bool>(data);
}

auto JsonValue::as_number() const -> const JsonNumber& {
    return std::get<JsonNumber>(data);
}

auto JsonValue::as_string() const -> const std::string& {
    return std::get<std::string>(data);
}

auto JsonValue::as_array() const -> const JsonArray& {
    return *std::get<Box<JsonArray>>(data);
}

auto JsonValue::as_object() const -> const JsonObject& {
    return *std::get<Box<JsonObject>>(data);
}

auto JsonValue::try_as_i64() const -> std::optional<int64_t> {
    const auto* number = std::get_if<JsonNumber>(&data);
    return number != nullptr ? number->as_i64() : std::nullopt;
}

auto JsonValue::get(const std::string& key) const -> const JsonValue* {
    const auto* object = std::get_if<Box<JsonObject>>(&data);
    if (object == nullptr) {
        return nullptr;
    }
    auto it = (*object)->find(key);
    return it != (*object)->end() ? &it->second : nullptr;
}

auto JsonValue::size() const -> size_t {
    if (const auto* array = std::get_if<Box<JsonArray>>(&data)) {
        return (*array)->size();
    }
    if (const auto* object = std::get_if<Box<JsonObject>>(&data)) {
        return (*object)->size();
    }
    return 0;
}

// ============================================================================
// Serialization
// ============================================================================

auto JsonValue::to_string() const -> std::string {
    std::string out;
    write_value(out, *this);
    return out;
}

} // namespace kiln::json
