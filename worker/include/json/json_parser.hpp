//! # JSON Parser
//!
//! Recursive descent JSON parser producing `JsonValue` trees.
//!
//! - Integers without decimals/exponents are parsed as `Int64`
//! - Errors carry precise line/column information
//! - Nesting depth is limited to prevent stack overflow
//!
//! ```cpp
//! auto result = parse_json(R"({"arguments": ["--help"], "requestId": 3})");
//! if (is_ok(result)) {
//!     auto& json = unwrap(result);
//!     auto id = json.get("requestId")->try_as_i64();
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string_view>

namespace kiln::json {

class JsonParser {
public:
    explicit JsonParser(std::string_view input);

    /// Parses exactly one JSON value followed by end of input.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;
    static constexpr size_t MAX_DEPTH = 256;

    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    void skip_whitespace();
    [[nodiscard]] auto make_error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
    auto parse_string() -> Result<std::string, JsonError>;
    auto parse_number() -> Result<JsonValue, JsonError>;
    auto parse_keyword() -> Result<JsonValue, JsonError>;
};

/// Parses a JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace kiln::json
