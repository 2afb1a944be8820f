//! # JSON Error Types
//!
//! Error type for JSON parsing with source location information.
//!
//! ```cpp
//! auto error = JsonError::make("Unexpected token", 1, 12);
//! std::cerr << error.to_string() << std::endl;
//! // Output: "line 1, column 12: Unexpected token"
//! ```

#pragma once

#include <cstddef>
#include <string>

namespace kiln::json {

/// An error encountered during JSON parsing.
///
/// Location fields are 1-based; 0 means unknown.
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;

    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0};
    }

    static auto make(std::string msg, size_t line, size_t column) -> JsonError {
        return JsonError{std::move(msg), line, column};
    }

    /// Formats the error as `"line X, column Y: message"` when the location is known.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        return message;
    }
};

} // namespace kiln::json
