#pragma once

/**
 * @file file_storage.h
 * @brief Layout of the virtual concatenated stream of a torrent
 *
 * Files are laid end to end in walk order. This class maps piece ranges
 * of that stream back to (file, offset, length) slices so the hasher can
 * read a piece that straddles file boundaries.
 */

#include <string>
#include <vector>
#include <cstdint>

namespace qtm {

/**
 * @brief A single file of the torrent
 */
struct FileEntry {
    std::vector<std::string> path; ///< Path segments relative to the torrent root
    int64_t size;                  ///< Size in bytes
    int64_t offset;                ///< Offset from start of the virtual stream

    FileEntry() : size(0), offset(0) {}

    FileEntry(std::vector<std::string> p, int64_t s, int64_t off = 0)
        : path(std::move(p)), size(s), offset(off) {}

    /// Path joined with '/' regardless of platform
    std::string path_string() const;
};

/**
 * @brief A slice of a file that corresponds to part of a piece
 */
struct FileSlice {
    size_t file_index;          ///< Index of the file in FileStorage
    int64_t offset;             ///< Offset within the file
    int64_t size;               ///< Number of bytes in this slice

    FileSlice() : file_index(0), offset(0), size(0) {}
    FileSlice(size_t idx, int64_t off, int64_t sz)
        : file_index(idx), offset(off), size(sz) {}
};

/**
 * @brief Split a '/' or '\\' separated relative path into segments
 *
 * Empty segments and "." are dropped.
 */
std::vector<std::string> split_path(const std::string& path);

/**
 * @brief Manages file layout and piece-to-file mapping for a torrent
 *
 * Thread-safe for read operations once finalized.
 */
class FileStorage {
public:
    FileStorage();
    explicit FileStorage(uint32_t piece_length);

    FileStorage(const FileStorage& other) = default;
    FileStorage(FileStorage&& other) noexcept = default;
    FileStorage& operator=(const FileStorage& other) = default;
    FileStorage& operator=(FileStorage&& other) noexcept = default;

    //=========================================================================
    // File Management
    //=========================================================================

    /**
     * @brief Append a file; its offset is the current total size
     *
     * Ignored once the storage is finalized.
     */
    void add_file(std::vector<std::string> path, int64_t size);
    void add_file(const std::string& path, int64_t size);

    void reserve(size_t num_files);

    /**
     * @brief Set the piece length
     *
     * Recomputes the piece count if the storage is already finalized.
     */
    void set_piece_length(uint32_t length);

    /**
     * @brief Freeze the file list and compute the piece count
     */
    void finalize();

    //=========================================================================
    // Accessors
    //=========================================================================

    size_t num_files() const { return files_.size(); }
    int64_t total_size() const { return total_size_; }
    uint32_t piece_length() const { return piece_length_; }
    uint32_t num_pieces() const { return num_pieces_; }

    /**
     * @brief Size of a piece; every piece but the last is piece_length()
     * @return 0 for an index past the end
     */
    uint32_t piece_size(uint32_t piece_index) const;

    const FileEntry& file_at(size_t index) const { return files_[index]; }
    const std::vector<FileEntry>& files() const { return files_; }

    bool empty() const { return files_.empty(); }
    bool is_finalized() const { return finalized_; }

    //=========================================================================
    // Piece-to-File Mapping
    //=========================================================================

    /**
     * @brief Map a byte range of a piece to the file slices that hold it
     *
     * Zero-length files never produce a slice.
     *
     * @param piece Piece index
     * @param offset Offset within the piece
     * @param size Number of bytes (clamped to the end of the stream)
     */
    std::vector<FileSlice> map_block(uint32_t piece, uint32_t offset, uint32_t size) const;

    /**
     * @brief Find which file contains a given byte offset
     * @return File index, or num_files() if offset is out of range
     */
    size_t file_at_offset(int64_t torrent_offset) const;

    //=========================================================================
    // Torrent Name and Mode
    //=========================================================================

    void set_name(const std::string& name) { name_ = name; }
    const std::string& name() const { return name_; }

    /**
     * @brief Single-file mode: the root was a regular file
     *
     * A directory that happens to hold one file is still multi-file.
     */
    void set_single_file(bool single) { single_file_ = single; }
    bool is_single_file() const { return single_file_; }

private:
    std::vector<FileEntry> files_;
    std::string name_;
    int64_t total_size_;
    uint32_t piece_length_;
    uint32_t num_pieces_;
    bool finalized_;
    bool single_file_;

    size_t find_file_at_offset(int64_t offset) const;
};

} // namespace qtm
