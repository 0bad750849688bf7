#pragma once

/**
 * @file piece_hasher.h
 * @brief SHA-1 hashing of every piece of the virtual concatenated stream
 *
 * Two implementations with identical output:
 * - hash_pieces_sequential(): streams the files once, front to back, on the
 *   calling thread. This is the reference implementation.
 * - PieceHasher / hash_pieces(): a bounded pool of workers claims disjoint
 *   batches of piece indices and writes each digest into its own slot.
 *
 * Either way the result is all-or-nothing: on error or cancellation no
 * digests are returned and every file handle has been closed.
 */

#include "types.h"
#include "file_storage.h"
#include "create_error.h"
#include "cancellation.h"
#include "threadmanager.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace qtm {

/**
 * @brief Snapshot handed to the progress callback
 */
struct HashProgress {
    uint32_t pieces_done = 0;
    uint32_t total_pieces = 0;
    int64_t bytes_done = 0;
    int64_t total_bytes = 0;
};

/**
 * @brief Progress callback for piece hashing
 *
 * Always invoked on the thread that called the hasher, with non-decreasing
 * values; the last call reports pieces_done == total_pieces on success.
 */
using PieceHashProgressCallback = std::function<void(const HashProgress& progress)>;

struct HashOptions {
    unsigned num_threads = 0;               ///< 0 = hardware concurrency, 1 = sequential
    PieceHashProgressCallback progress;     ///< Optional
    const CancellationToken* cancel = nullptr; ///< Optional, checked before every piece

    HashOptions() = default;
};

/**
 * @brief Full path of a file of @p storage on disk
 *
 * In single-file mode @p base_path is the file itself, otherwise it is the
 * torrent root directory.
 */
std::string resolve_file_path(const FileStorage& storage, const std::string& base_path,
                              size_t file_index);

/**
 * @brief Reference single-threaded piece hashing
 *
 * @param storage Finalized storage with a piece length
 * @param base_path Content root (see resolve_file_path)
 * @param options num_threads is ignored
 * @param error IoError with the offending path, InvalidSize for an
 *              unfinalized storage, Cancelled on cancellation
 */
std::optional<std::vector<PieceDigest>> hash_pieces_sequential(
    const FileStorage& storage, const std::string& base_path,
    const HashOptions& options = HashOptions(),
    TorrentCreateError* error = nullptr);

/**
 * @brief Parallel piece hashing
 *
 * Falls back to hash_pieces_sequential() when only one worker would run.
 */
std::optional<std::vector<PieceDigest>> hash_pieces(
    const FileStorage& storage, const std::string& base_path,
    const HashOptions& options = HashOptions(),
    TorrentCreateError* error = nullptr);

/**
 * @brief Concatenate digests into the "pieces" byte string
 */
std::string concat_digests(const std::vector<PieceDigest>& digests);

/**
 * @brief Worker pool behind hash_pieces()
 *
 * One instance hashes one storage once. Workers are ThreadManager-owned
 * threads; run() does not return before every one of them is joined.
 */
class PieceHasher : public ThreadManager {
public:
    PieceHasher(const FileStorage& storage, const std::string& base_path, unsigned num_threads);
    ~PieceHasher() override;

    /**
     * @brief Hash every piece
     * @return digests in piece order, or nullopt with @p error filled
     */
    std::optional<std::vector<PieceDigest>> run(const PieceHashProgressCallback& progress,
                                                const CancellationToken* cancel,
                                                TorrentCreateError* error);

    unsigned num_workers() const { return num_workers_; }

private:
    const FileStorage& storage_;
    std::string base_path_;
    unsigned num_workers_;
    uint32_t batch_size_;

    std::vector<PieceDigest> digests_;      // One slot per piece, written once
    std::atomic<uint32_t> next_piece_;
    std::atomic<uint32_t> pieces_done_;
    std::atomic<int64_t> bytes_done_;

    std::mutex error_mutex_;
    TorrentCreateError first_error_;

    const CancellationToken* cancel_;

    void worker_loop(unsigned worker_id);
    bool should_stop() const;
    void record_error(const TorrentCreateError& err);
};

} // namespace qtm
