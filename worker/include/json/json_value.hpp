//! # JSON Values
//!
//! The value tree behind the worker protocol. Integers and doubles are kept
//! apart (`42` stays an `int64_t`, `4.2` and `1e3` become doubles) so that
//! request ids round-trip exactly.
//!
//! ```cpp
//! JsonObject obj;
//! obj["exitCode"] = JsonValue(0);
//! obj["output"] = JsonValue("done");
//! JsonValue(std::move(obj)).to_string(); // {"exitCode":0,"output":"done"}
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kiln::json {

struct JsonValue;

using JsonArray = std::vector<JsonValue>;
/// Keys are kept sorted, which makes serialization deterministic.
using JsonObject = std::map<std::string, JsonValue>;

/// A JSON number: an exact integer or a double.
class JsonNumber {
public:
    JsonNumber() : value_(int64_t{0}) {}
    explicit JsonNumber(int64_t value) : value_(value) {}
    explicit JsonNumber(double value) : value_(value) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return std::holds_alternative<int64_t>(value_);
    }

    [[nodiscard]] auto as_i64() const -> std::optional<int64_t> {
        if (const auto* i = std::get_if<int64_t>(&value_)) {
            return *i;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto as_f64() const -> double {
        if (const auto* i = std::get_if<int64_t>(&value_)) {
            return static_cast<double>(*i);
        }
        return std::get<double>(value_);
    }

private:
    std::variant<int64_t, double> value_;
};

/// Any JSON value. Move-only because arrays and objects are boxed.
struct JsonValue {
    using Null = std::monostate;

    std::variant<Null, bool, JsonNumber, std::string, Box<JsonArray>, Box<JsonObject>> data;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}
    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}
    explicit JsonValue(double value) : data(JsonNumber(value)) {}
    explicit JsonValue(JsonNumber value) : data(value) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }
    [[nodiscard]] auto is_integer() const -> bool;
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // Typed access throws `std::bad_variant_access` on a mismatch.
    [[nodiscard]] auto as_bool() const -> bool;
    [[nodiscard]] auto as_number() const -> const JsonNumber&;
    [[nodiscard]] auto as_string() const -> const std::string&;
    [[nodiscard]] auto as_array() const -> const JsonArray&;
    [[nodiscard]] auto as_object() const -> const JsonObject&;

    /// The integer value, or `std::nullopt` for anything else.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t>;

    /// Member `key` of an object; nullptr when absent or not an object.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue*;

    /// Element count of an array or object, 0 otherwise.
    [[nodiscard]] auto size() const -> size_t;

    /// Compact form with no whitespace and no raw newlines, so one value is
    /// always one protocol line.
    [[nodiscard]] auto to_string() const -> std::string;
};

} // namespace kiln::json
