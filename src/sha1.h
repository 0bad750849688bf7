#pragma once

#include "types.h"

#include <string>
#include <vector>
#include <cstdint>

namespace qtm {

/**
 * Incremental SHA-1 (FIPS 180-1).
 *
 * Used for piece digests and for the info hash. A finalized instance keeps
 * returning the same digest until reset() is called.
 */
class SHA1 {
public:
    SHA1();

    // Process a single byte
    void update(uint8_t byte);

    // Process a buffer
    void update(const uint8_t* data, size_t length);

    // Process a string
    void update(const std::string& str);

    // Get the final hash as 20 raw bytes
    PieceDigest finalize_bytes();

    // Get the final hash as a hex string
    std::string finalize();

    // Start over with a fresh state
    void reset();

    // Convenience functions to hash a buffer directly
    static PieceDigest digest(const uint8_t* data, size_t length);
    static PieceDigest digest(const std::vector<uint8_t>& data);
    static std::string hash(const std::string& input);

private:
    void process_block(const uint8_t* block);

    uint32_t h0, h1, h2, h3, h4;
    uint8_t buffer[64];
    size_t buffer_length;
    uint64_t total_length;
    bool finalized;
};

} // namespace qtm
