#include "file_storage.h"
#include <algorithm>

namespace qtm {

std::string FileEntry::path_string() const {
    std::string result;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) result += '/';
        result += path[i];
    }
    return result;
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find_first_of("/\\", pos);
        if (next == std::string::npos) {
            next = path.size();
        }
        std::string segment = path.substr(pos, next - pos);
        if (!segment.empty() && segment != ".") {
            segments.push_back(std::move(segment));
        }
        pos = next + 1;
    }
    return segments;
}

//=============================================================================
// Constructors
//=============================================================================

FileStorage::FileStorage()
    : total_size_(0)
    , piece_length_(0)
    , num_pieces_(0)
    , finalized_(false)
    , single_file_(false) {
}

FileStorage::FileStorage(uint32_t piece_length)
    : total_size_(0)
    , piece_length_(piece_length)
    , num_pieces_(0)
    , finalized_(false)
    , single_file_(false) {
}

//=============================================================================
// File Management
//=============================================================================

void FileStorage::add_file(std::vector<std::string> path, int64_t size) {
    if (finalized_) {
        return;
    }

    files_.emplace_back(std::move(path), size, total_size_);
    total_size_ += size;
}

void FileStorage::add_file(const std::string& path, int64_t size) {
    add_file(split_path(path), size);
}

void FileStorage::reserve(size_t num_files) {
    files_.reserve(num_files);
}

void FileStorage::set_piece_length(uint32_t length) {
    piece_length_ = length;
    if (finalized_) {
        finalize();
    }
}

void FileStorage::finalize() {
    if (piece_length_ > 0 && total_size_ > 0) {
        num_pieces_ = static_cast<uint32_t>((total_size_ + piece_length_ - 1) / piece_length_);
    } else {
        num_pieces_ = 0;
    }
    finalized_ = true;
}

//=============================================================================
// Accessors
//=============================================================================

uint32_t FileStorage::piece_size(uint32_t piece_index) const {
    if (piece_index >= num_pieces_) {
        return 0;
    }

    if (piece_index == num_pieces_ - 1) {
        int64_t remaining = total_size_ - static_cast<int64_t>(piece_index) * piece_length_;
        return static_cast<uint32_t>(remaining);
    }

    return piece_length_;
}

//=============================================================================
// Piece-to-File Mapping
//=============================================================================

std::vector<FileSlice> FileStorage::map_block(uint32_t piece, uint32_t offset, uint32_t size) const {
    std::vector<FileSlice> result;

    if (!finalized_ || files_.empty() || piece >= num_pieces_) {
        return result;
    }

    int64_t torrent_offset = static_cast<int64_t>(piece) * piece_length_ + offset;
    if (torrent_offset >= total_size_) {
        return result;
    }

    int64_t remaining = (std::min)(static_cast<int64_t>(size), total_size_ - torrent_offset);
    size_t file_idx = find_file_at_offset(torrent_offset);
    int64_t current_offset = torrent_offset;

    while (remaining > 0 && file_idx < files_.size()) {
        const FileEntry& file = files_[file_idx];

        int64_t file_offset = current_offset - file.offset;
        int64_t bytes_to_read = (std::min)(remaining, file.size - file_offset);

        if (bytes_to_read > 0) {
            result.emplace_back(file_idx, file_offset, bytes_to_read);
            current_offset += bytes_to_read;
            remaining -= bytes_to_read;
        }
        ++file_idx;
    }

    return result;
}

size_t FileStorage::file_at_offset(int64_t torrent_offset) const {
    if (torrent_offset < 0 || torrent_offset >= total_size_) {
        return files_.size();
    }
    return find_file_at_offset(torrent_offset);
}

size_t FileStorage::find_file_at_offset(int64_t offset) const {
    // First file whose end lies beyond offset; skips zero-length files
    // sitting at the same offset as the file that actually holds the byte.
    size_t left = 0;
    size_t right = files_.size();

    while (left < right) {
        size_t mid = left + (right - left) / 2;
        const FileEntry& file = files_[mid];

        if (file.offset + file.size <= offset) {
            left = mid + 1;
        } else {
            right = mid;
        }
    }

    return left;
}

} // namespace qtm
