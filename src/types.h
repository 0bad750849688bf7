#pragma once

/**
 * @file types.h
 * @brief Core types and constants for qtm
 *
 * Digest types shared by the hasher and the encoder, piece size limits
 * and the display conversions (hex, base32) used for info hashes.
 */

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <sstream>
#include <iomanip>

namespace qtm {

//=============================================================================
// Constants
//=============================================================================

/// Size of a SHA-1 digest in bytes
constexpr size_t QTM_DIGEST_SIZE = 20;

/// Size of info hash in bytes (SHA-1 of the info dictionary)
constexpr size_t QTM_INFO_HASH_SIZE = QTM_DIGEST_SIZE;

/// Smallest piece length accepted (16 KiB)
constexpr uint32_t QTM_MIN_PIECE_LENGTH = 16 * 1024;

/// Largest piece length accepted (16 MiB)
constexpr uint32_t QTM_MAX_PIECE_LENGTH = 16 * 1024 * 1024;

/// Upper end of the piece count band targeted by the planner
constexpr uint32_t QTM_TARGET_MAX_PIECES = 2048;

//=============================================================================
// Type Definitions
//=============================================================================

/// 20-byte SHA-1 digest of one piece
using PieceDigest = std::array<uint8_t, QTM_DIGEST_SIZE>;

/// 20-byte info hash (SHA-1 of the encoded info dict)
using InfoHash = std::array<uint8_t, QTM_INFO_HASH_SIZE>;

//=============================================================================
// Conversion Utilities
//=============================================================================

/**
 * @brief Convert info hash to hex string
 *
 * @param hash Info hash to convert
 * @return 40-character lowercase hex string
 */
inline std::string info_hash_to_hex(const InfoHash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : hash) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

/**
 * @brief Convert hex string to info hash
 *
 * @param hex 40-character hex string (either case)
 * @return Info hash, or zero-filled array on error
 */
inline InfoHash hex_to_info_hash(const std::string& hex) {
    InfoHash hash{};
    if (hex.length() != QTM_INFO_HASH_SIZE * 2) {
        return hash;
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    for (size_t i = 0; i < QTM_INFO_HASH_SIZE; ++i) {
        int hi = nibble(hex[i * 2]);
        int lo = nibble(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return InfoHash{};
        }
        hash[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    return hash;
}

/**
 * @brief Convert info hash to RFC 4648 base32 (uppercase, no padding)
 *
 * This is the 32-character form used in magnet links.
 */
inline std::string info_hash_to_base32(const InfoHash& hash) {
    static const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

    std::string out;
    out.reserve(32);

    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : hash) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            out.push_back(alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(alphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

/**
 * @brief Check whether a hash is all zeros (the "not computed" value)
 */
inline bool is_zero_hash(const InfoHash& hash) {
    for (uint8_t byte : hash) {
        if (byte != 0) return false;
    }
    return true;
}

} // namespace qtm
