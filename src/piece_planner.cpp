#include "piece_planner.h"
#include "logger.h"

#include <limits>

#define LOG_PLANNER_DEBUG(message) LOG_DEBUG("planner", message)

namespace qtm {

const std::vector<uint32_t>& piece_size_classes() {
    static const std::vector<uint32_t> classes = [] {
        std::vector<uint32_t> sizes;
        for (uint32_t size = QTM_MIN_PIECE_LENGTH; size <= QTM_MAX_PIECE_LENGTH; size *= 2) {
            sizes.push_back(size);
        }
        return sizes;
    }();
    return classes;
}

bool is_valid_piece_length(uint32_t piece_length) {
    if (piece_length < QTM_MIN_PIECE_LENGTH || piece_length > QTM_MAX_PIECE_LENGTH) {
        return false;
    }
    return (piece_length & (piece_length - 1)) == 0;
}

uint32_t piece_count_for(int64_t total_length, uint32_t piece_length) {
    if (total_length <= 0 || piece_length == 0) {
        return 0;
    }
    int64_t count = (total_length + piece_length - 1) / piece_length;
    if (count > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        return std::numeric_limits<uint32_t>::max();
    }
    return static_cast<uint32_t>(count);
}

std::optional<PieceLayout> plan_pieces(int64_t total_length, TorrentCreateError* error) {
    if (total_length <= 0) {
        set_error(error, TorrentCreateErrorCode::InvalidSize,
                  "Total content length must be positive, got " + std::to_string(total_length));
        return std::nullopt;
    }

    const auto& classes = piece_size_classes();
    uint32_t chosen = classes.back();
    for (uint32_t size : classes) {
        if (piece_count_for(total_length, size) <= QTM_TARGET_MAX_PIECES) {
            chosen = size;
            break;
        }
    }

    return plan_pieces_with_length(total_length, chosen, error);
}

std::optional<PieceLayout> plan_pieces_with_length(int64_t total_length,
                                                   uint32_t piece_length,
                                                   TorrentCreateError* error) {
    if (total_length <= 0) {
        set_error(error, TorrentCreateErrorCode::InvalidSize,
                  "Total content length must be positive, got " + std::to_string(total_length));
        return std::nullopt;
    }

    if (!is_valid_piece_length(piece_length)) {
        set_error(error, TorrentCreateErrorCode::InvalidSize,
                  "Piece length must be a power of two between 16 KiB and 16 MiB, got "
                  + std::to_string(piece_length));
        return std::nullopt;
    }

    int64_t count = (total_length + piece_length - 1) / piece_length;
    if (count > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        set_error(error, TorrentCreateErrorCode::InvalidSize,
                  "Content too large for piece length " + std::to_string(piece_length));
        return std::nullopt;
    }

    PieceLayout layout(piece_length, static_cast<uint32_t>(count));
    LOG_PLANNER_DEBUG("Planned " << layout.piece_count << " pieces of " << layout.piece_length
                      << " bytes for " << total_length << " bytes");
    return layout;
}

} // namespace qtm
