#include "sha1.h"
#include <iomanip>
#include <sstream>
#include <cstring>

namespace qtm {

// SHA1 constants
static const uint32_t K[] = {
    0x5A827999, 0x6ED9EBA1, 0x8F1BBCDC, 0xCA62C1D6
};

static uint32_t left_rotate(uint32_t value, int amount) {
    return (value << amount) | (value >> (32 - amount));
}

SHA1::SHA1() {
    reset();
}

void SHA1::reset() {
    h0 = 0x67452301;
    h1 = 0xEFCDAB89;
    h2 = 0x98BADCFE;
    h3 = 0x10325476;
    h4 = 0xC3D2E1F0;

    buffer_length = 0;
    total_length = 0;
    finalized = false;
}

void SHA1::update(uint8_t byte) {
    update(&byte, 1);
}

void SHA1::update(const uint8_t* data, size_t length) {
    if (finalized || length == 0) {
        return;
    }

    total_length += length;

    // Top up a partially filled block first
    if (buffer_length > 0) {
        size_t take = 64 - buffer_length;
        if (take > length) take = length;
        std::memcpy(buffer + buffer_length, data, take);
        buffer_length += take;
        data += take;
        length -= take;

        if (buffer_length < 64) {
            return;
        }
        process_block(buffer);
        buffer_length = 0;
    }

    // Whole blocks straight from the caller's memory
    while (length >= 64) {
        process_block(data);
        data += 64;
        length -= 64;
    }

    if (length > 0) {
        std::memcpy(buffer, data, length);
        buffer_length = length;
    }
}

void SHA1::update(const std::string& str) {
    update(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

void SHA1::process_block(const uint8_t* block) {
    uint32_t w[80];

    // Break chunk into sixteen 32-bit big-endian words
    for (int i = 0; i < 16; i++) {
        w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) |
               (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
               (static_cast<uint32_t>(block[i * 4 + 2]) << 8) |
               (static_cast<uint32_t>(block[i * 4 + 3]));
    }

    for (int i = 16; i < 80; i++) {
        w[i] = left_rotate(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    uint32_t a = h0;
    uint32_t b = h1;
    uint32_t c = h2;
    uint32_t d = h3;
    uint32_t e = h4;

    for (int i = 0; i < 80; i++) {
        uint32_t f, k;

        if (i < 20) {
            f = (b & c) | (~b & d);
            k = K[0];
        } else if (i < 40) {
            f = b ^ c ^ d;
            k = K[1];
        } else if (i < 60) {
            f = (b & c) | (b & d) | (c & d);
            k = K[2];
        } else {
            f = b ^ c ^ d;
            k = K[3];
        }

        uint32_t temp = left_rotate(a, 5) + f + e + k + w[i];
        e = d;
        d = c;
        c = left_rotate(b, 30);
        b = a;
        a = temp;
    }

    h0 += a;
    h1 += b;
    h2 += c;
    h3 += d;
    h4 += e;
}

PieceDigest SHA1::finalize_bytes() {
    if (!finalized) {
        uint64_t bit_length = total_length * 8;

        // Padding: a single 1 bit, zeros up to 56 mod 64, then the length
        uint8_t pad[72];
        size_t pad_len = (buffer_length < 56) ? (56 - buffer_length) : (120 - buffer_length);
        std::memset(pad, 0, sizeof(pad));
        pad[0] = 0x80;
        for (int i = 0; i < 8; i++) {
            pad[pad_len + i] = static_cast<uint8_t>(bit_length >> ((7 - i) * 8));
        }

        uint64_t saved_length = total_length;
        update(pad, pad_len + 8);
        total_length = saved_length;

        finalized = true;
    }

    PieceDigest out;
    const uint32_t words[5] = { h0, h1, h2, h3, h4 };
    for (int i = 0; i < 5; i++) {
        out[i * 4]     = static_cast<uint8_t>(words[i] >> 24);
        out[i * 4 + 1] = static_cast<uint8_t>(words[i] >> 16);
        out[i * 4 + 2] = static_cast<uint8_t>(words[i] >> 8);
        out[i * 4 + 3] = static_cast<uint8_t>(words[i]);
    }
    return out;
}

std::string SHA1::finalize() {
    PieceDigest bytes = finalize_bytes();

    std::ostringstream result;
    result << std::hex << std::setfill('0');
    for (uint8_t byte : bytes) {
        result << std::setw(2) << static_cast<int>(byte);
    }
    return result.str();
}

PieceDigest SHA1::digest(const uint8_t* data, size_t length) {
    SHA1 hasher;
    hasher.update(data, length);
    return hasher.finalize_bytes();
}

PieceDigest SHA1::digest(const std::vector<uint8_t>& data) {
    return digest(data.data(), data.size());
}

std::string SHA1::hash(const std::string& input) {
    SHA1 hasher;
    hasher.update(input);
    return hasher.finalize();
}

} // namespace qtm
