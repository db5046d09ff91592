//! # CRC32C Hash Utility
//!
//! CRC32C (Castagnoli polynomial) used to fingerprint compressed module
//! artifacts so the decompression cache can tell when a cached library is
//! stale.
//!
//! ## Usage
//!
//! ```cpp
//! uint32_t hash = modload::crc32c(data.data(), data.size());
//! std::string file_hash = modload::crc32c_file("plugins/math.so.zst");
//! ```

#ifndef MODLOAD_COMMON_CRC32C_HPP
#define MODLOAD_COMMON_CRC32C_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace modload {

namespace detail {

/// Reflected Castagnoli polynomial.
inline constexpr uint32_t CRC32C_POLY = 0x82F63B78;

constexpr auto make_crc32c_table() -> std::array<uint32_t, 256> {
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

inline constexpr auto CRC32C_TABLE = make_crc32c_table();

} // namespace detail

/// Computes the CRC32C of a byte range.
[[nodiscard]] inline uint32_t crc32c(const void* data, size_t len) noexcept {
    const auto* bytes = static_cast<const uint8_t*>(data);
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < len; ++i) {
        crc = detail::CRC32C_TABLE[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

[[nodiscard]] inline uint32_t crc32c(std::string_view str) noexcept {
    return crc32c(str.data(), str.size());
}

/// Formats a 32-bit hash as 8 lowercase hex digits.
[[nodiscard]] std::string hex32(uint32_t value);

/// CRC32C of a buffer combined with its length, as a 16-character hex string.
[[nodiscard]] std::string crc32c_hex(const void* data, size_t len);

/// CRC32C of a file's contents (see `crc32c_hex`).
///
/// @return 16-character hex string, or empty string if the file cannot be read
[[nodiscard]] std::string crc32c_file(const std::string& file_path);

} // namespace modload

#endif // MODLOAD_COMMON_CRC32C_HPP
