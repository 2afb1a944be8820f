//! # UTF-8 Helpers
//!
//! Response frames must be valid UTF-8 even when a source file or an
//! argument is not; writers use `utf8_sequence_length` to tell well-formed
//! sequences from bytes that must be replaced.

#ifndef KILN_COMMON_UTF8_HPP
#define KILN_COMMON_UTF8_HPP

#include <cstddef>
#include <string_view>

namespace kiln {

/// Byte length of the well-formed UTF-8 sequence starting at `text[pos]`,
/// or 0 when the bytes there are not one (stray continuation byte,
/// overlong form, surrogate, truncated sequence, value above U+10FFFF).
[[nodiscard]] auto utf8_sequence_length(std::string_view text, size_t pos) -> size_t;

} // namespace kiln

#endif // KILN_COMMON_UTF8_HPP
