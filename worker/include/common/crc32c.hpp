//! # CRC32C Hash Utility
//!
//! CRC32C (Castagnoli polynomial) checksums. Used to verify artifact payloads
//! and to fingerprint summary inputs for session reuse.
//!
//! ## Usage
//!
//! ```cpp
//! #include "common/crc32c.hpp"
//!
//! uint32_t sum = kiln::crc32c(bytes.data(), bytes.size());
//! ```

#ifndef KILN_COMMON_CRC32C_HPP
#define KILN_COMMON_CRC32C_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace kiln {

// ============================================================================
// CRC32C Lookup Table (reflected Castagnoli polynomial 0x82F63B78)
// ============================================================================

namespace detail {

constexpr auto make_crc32c_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1) ? (crc >> 1) ^ 0x82F63B78u : crc >> 1;
        }
        table[i] = crc;
    }
    return table;
}

} // namespace detail

inline constexpr std::array<uint32_t, 256> CRC32C_TABLE = detail::make_crc32c_table();

// ============================================================================
// CRC32C Functions
// ============================================================================

/// Continues a CRC32C computation over more data.
///
/// @param crc Value returned by a previous call (or 0 to start)
/// @param data Pointer to the data to hash
/// @param len Length of the data in bytes
[[nodiscard]] inline uint32_t crc32c_extend(uint32_t crc, const void* data, size_t len) noexcept {
    const auto* bytes = static_cast<const uint8_t*>(data);
    crc = ~crc;
    for (size_t i = 0; i < len; ++i) {
        crc = CRC32C_TABLE[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return ~crc;
}

/// Computes CRC32C hash of a byte array.
[[nodiscard]] inline uint32_t crc32c(const void* data, size_t len) noexcept {
    return crc32c_extend(0, data, len);
}

/// Computes CRC32C hash of a string_view.
[[nodiscard]] inline uint32_t crc32c(std::string_view str) noexcept {
    return crc32c(str.data(), str.size());
}

/// Formats a checksum together with the data length as a 16-character hex
/// string (4 bytes CRC32C + 4 bytes length).
[[nodiscard]] std::string crc32c_hex(uint32_t hash, size_t len);

} // namespace kiln

#endif // KILN_COMMON_CRC32C_HPP
