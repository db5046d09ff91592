//! # CRC32C Implementation
//!
//! Hex formatting and streamed file hashing.

#include "modload/common/crc32c.hpp"

#include <fstream>

namespace modload {

static constexpr char HEX_CHARS[] = "0123456789abcdef";

std::string hex32(uint32_t value) {
    std::string out(8, '0');
    for (int i = 7; i >= 0; --i) {
        out[static_cast<size_t>(i)] = HEX_CHARS[value & 0xF];
        value >>= 4;
    }
    return out;
}

std::string crc32c_hex(const void* data, size_t len) {
    return hex32(crc32c(data, len)) + hex32(static_cast<uint32_t>(len & 0xFFFFFFFF));
}

std::string crc32c_file(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        return "";
    }

    uint32_t crc = 0xFFFFFFFF;
    uint64_t total = 0;
    char buf[65536];
    while (file) {
        file.read(buf, sizeof(buf));
        auto got = static_cast<size_t>(file.gcount());
        for (size_t i = 0; i < got; ++i) {
            crc = detail::CRC32C_TABLE[(crc ^ static_cast<uint8_t>(buf[i])) & 0xFF] ^ (crc >> 8);
        }
        total += got;
    }
    if (file.bad()) {
        return "";
    }

    return hex32(crc ^ 0xFFFFFFFF) + hex32(static_cast<uint32_t>(total & 0xFFFFFFFF));
}

} // namespace modload
