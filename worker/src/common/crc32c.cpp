//! # CRC32C Implementation
//!
//! Formatting helpers for checksums.

#include "common/crc32c.hpp"

namespace kiln {

std::string crc32c_hex(uint32_t hash, size_t len) {
    uint64_t combined =
        (static_cast<uint64_t>(hash) << 32) | static_cast<uint64_t>(len & 0xFFFFFFFF);

    char hex[17];
    static constexpr char HEX_CHARS[] = "0123456789abcdef";
    for (int i = 15; i >= 0; --i) {
        hex[i] = HEX_CHARS[combined & 0xF];
        combined >>= 4;
    }
    hex[16] = '\0';
    return std::string(hex);
}

} // namespace kiln
