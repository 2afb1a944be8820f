//! # Common Definitions
//!
//! Vocabulary shared by every kiln component.
//!
//! - `VERSION` and the exit codes reported by the process and by worker
//!   responses
//! - `Bytes`, the buffer type of summaries and artifacts
//! - `Result<T, E>`, returned by every fallible library operation
//! - `Box<T>` / `Rc<T>` for unique and shared ownership
//!
//! Exceptions are caught only at the request and worker boundaries; below
//! them failures travel as `Result` errors.

#ifndef KILN_COMMON_HPP
#define KILN_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace kiln {

constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Exit Codes
// ============================================================================

/// | Code | Meaning                                      |
/// |------|----------------------------------------------|
/// | 0    | Request succeeded                            |
/// | 1    | Process-level startup failure                |
/// | 15   | Request failed, diagnostics were emitted     |
namespace exit_code {
constexpr int SUCCESS = 0;
constexpr int STARTUP_FAILURE = 1;
constexpr int DIAGNOSTICS = 15;
} // namespace exit_code

using Bytes = std::vector<uint8_t>;

// ============================================================================
// Result
// ============================================================================

/// Either a value or an error. `T` and `E` must be distinct types.
///
/// ```cpp
/// auto bytes = fs.read_bytes(uri);
/// if (is_err(bytes)) {
///     return diag::Diagnostic::error(kind, unwrap_err(bytes));
/// }
/// use(unwrap(bytes));
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// The value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// The error. Throws `std::bad_variant_access` on a value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Ownership
// ============================================================================

template <typename T> using Box = std::unique_ptr<T>;
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace kiln

#endif // KILN_COMMON_HPP
