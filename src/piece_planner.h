#pragma once

/**
 * @file piece_planner.h
 * @brief Piece length selection
 *
 * Size classes are the powers of two from 16 KiB to 16 MiB. The planner
 * picks the smallest class that keeps the piece count at or below
 * QTM_TARGET_MAX_PIECES (2048). Away from the two clamps this puts the
 * count in [1025, 2048] and one class smaller would exceed 2048.
 *
 * The table is part of the output format: changing it changes the info
 * hash of every torrent created from the same content.
 */

#include "types.h"
#include "create_error.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace qtm {

struct PieceLayout {
    uint32_t piece_length = 0;
    uint32_t piece_count = 0;

    PieceLayout() = default;
    PieceLayout(uint32_t length, uint32_t count) : piece_length(length), piece_count(count) {}

    bool operator==(const PieceLayout& other) const {
        return piece_length == other.piece_length && piece_count == other.piece_count;
    }
};

/**
 * @brief All size classes, smallest first
 */
const std::vector<uint32_t>& piece_size_classes();

/**
 * @brief Check that a piece length is a power of two in [16 KiB, 16 MiB]
 */
bool is_valid_piece_length(uint32_t piece_length);

/**
 * @brief Piece count for a given total and piece length (ceil division)
 */
uint32_t piece_count_for(int64_t total_length, uint32_t piece_length);

/**
 * @brief Choose the layout for a total content length
 *
 * @param total_length Total bytes of the virtual stream
 * @param error InvalidSize if total_length <= 0
 */
std::optional<PieceLayout> plan_pieces(int64_t total_length,
                                       TorrentCreateError* error = nullptr);

/**
 * @brief Layout for a caller-chosen piece length
 *
 * @param error InvalidSize if total_length <= 0, the piece length is not
 *              a valid size class, or the piece count would not fit 32 bits
 */
std::optional<PieceLayout> plan_pieces_with_length(int64_t total_length,
                                                   uint32_t piece_length,
                                                   TorrentCreateError* error = nullptr);

} // namespace qtm
