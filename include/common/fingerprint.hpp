//! # Content Fingerprints
//!
//! CRC32C (Castagnoli) hashing of file contents. A fingerprint is the 32-bit
//! checksum combined with the content length and rendered as 16 hex digits.
//! Reports carry it so external tooling can tell whether a file changed
//! between runs.
//!
//! ```cpp
//! std::string fp = docforge::fingerprint(source_text); // "e3069283000000c8"
//! ```

#ifndef DOCFORGE_COMMON_FINGERPRINT_HPP
#define DOCFORGE_COMMON_FINGERPRINT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace docforge {

// ============================================================================
// CRC32C Lookup Table
// ============================================================================

/// Reflected form of the Castagnoli polynomial 0x1EDC6F41.
inline constexpr uint32_t CRC32C_POLY = 0x82F63B78;

[[nodiscard]] constexpr auto make_crc32c_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1) ? (crc >> 1) ^ CRC32C_POLY : crc >> 1;
        }
        table[i] = crc;
    }
    return table;
}

inline constexpr std::array<uint32_t, 256> CRC32C_TABLE = make_crc32c_table();

// ============================================================================
// Hash Functions
// ============================================================================

[[nodiscard]] inline uint32_t crc32c(const void* data, size_t len) noexcept {
    const auto* bytes = static_cast<const uint8_t*>(data);
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < len; ++i) {
        crc = CRC32C_TABLE[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

[[nodiscard]] inline uint32_t crc32c(std::string_view str) noexcept {
    return crc32c(str.data(), str.size());
}

/// 16-character hex string: CRC32C in the high half, length in the low half.
[[nodiscard]] std::string fingerprint(std::string_view content);

/// Fingerprint of a file's bytes, or an empty string if it cannot be read.
[[nodiscard]] std::string fingerprint_file(const std::string& path);

} // namespace docforge

#endif // DOCFORGE_COMMON_FINGERPRINT_HPP
