#include "piece_hasher.h"
#include "sha1.h"
#include "fs.h"
#include "logger.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <limits>
#include <system_error>

// Hasher module logging macros
#define LOG_HASHER_DEBUG(message) LOG_DEBUG("hasher", message)
#define LOG_HASHER_INFO(message)  LOG_INFO("hasher", message)
#define LOG_HASHER_WARN(message)  LOG_WARN("hasher", message)
#define LOG_HASHER_ERROR(message) LOG_ERROR("hasher", message)

namespace qtm {

namespace {

constexpr unsigned MAX_HASH_THREADS = 64;
constexpr uint32_t MAX_BATCH_PIECES = 64;

/**
 * Reads whole pieces through FileStorage::map_block, keeping the most
 * recently used file open so consecutive pieces do not reopen or seek.
 */
class PieceReader {
public:
    PieceReader(const FileStorage& storage, const std::string& base_path)
        : storage_(storage), base_path_(base_path)
        , open_index_(std::numeric_limits<size_t>::max()), position_(0) {}

    bool read_piece(uint32_t piece, std::vector<uint8_t>& buffer, TorrentCreateError& err) {
        uint32_t size = storage_.piece_size(piece);
        buffer.resize(size);

        size_t filled = 0;
        for (const FileSlice& slice : storage_.map_block(piece, 0, size)) {
            if (!open(slice.file_index, err)) {
                return false;
            }

            if (position_ != slice.offset) {
                file_.seekg(static_cast<std::streamoff>(slice.offset));
                if (!file_) {
                    fail(err, "Failed to seek in file");
                    return false;
                }
                position_ = slice.offset;
            }

            file_.read(reinterpret_cast<char*>(buffer.data() + filled),
                       static_cast<std::streamsize>(slice.size));
            if (file_.gcount() != static_cast<std::streamsize>(slice.size)) {
                fail(err, "Unexpected end of file (was it modified while hashing?)");
                return false;
            }

            position_ += slice.size;
            filled += static_cast<size_t>(slice.size);

            // Reached the walked length: anything left means the file grew
            if (position_ == storage_.file_at(slice.file_index).size
                && file_.peek() != std::char_traits<char>::eof()) {
                fail(err, "File grew after it was scanned");
                return false;
            }
        }

        if (filled != size) {
            err = TorrentCreateError(TorrentCreateErrorCode::IoError,
                                     "Piece " + std::to_string(piece) + " maps to "
                                     + std::to_string(filled) + " of " + std::to_string(size) + " bytes");
            return false;
        }
        return true;
    }

    void close() {
        if (file_.is_open()) {
            file_.close();
        }
        open_index_ = std::numeric_limits<size_t>::max();
    }

private:
    const FileStorage& storage_;
    const std::string& base_path_;
    std::ifstream file_;
    size_t open_index_;
    int64_t position_;
    std::string open_path_;

    bool open(size_t file_index, TorrentCreateError& err) {
        if (file_index == open_index_ && file_.is_open()) {
            return true;
        }

        close();
        open_path_ = resolve_file_path(storage_, base_path_, file_index);
        file_.clear();
        file_.open(open_path_, std::ios::binary);
        if (!file_) {
            err = TorrentCreateError(TorrentCreateErrorCode::IoError,
                                     "Failed to open file: " + open_path_, open_path_);
            return false;
        }
        open_index_ = file_index;
        position_ = 0;
        return true;
    }

    void fail(TorrentCreateError& err, const std::string& what) {
        err = TorrentCreateError(TorrentCreateErrorCode::IoError, what + ": " + open_path_, open_path_);
        close();
    }
};

bool check_storage(const FileStorage& storage, TorrentCreateError* error) {
    if (storage.empty()) {
        set_error(error, TorrentCreateErrorCode::EmptyInput, "No files to hash");
        return false;
    }
    if (!storage.is_finalized() || storage.piece_length() == 0 || storage.num_pieces() == 0) {
        set_error(error, TorrentCreateErrorCode::InvalidSize,
                  "File storage has no piece layout (total size "
                  + std::to_string(storage.total_size()) + ")");
        return false;
    }
    return true;
}

unsigned resolve_thread_count(unsigned requested, uint32_t num_pieces) {
    unsigned threads = requested;
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 1;
    }
    threads = (std::min)(threads, MAX_HASH_THREADS);
    if (num_pieces < threads) {
        threads = num_pieces;
    }
    return (std::max)(threads, 1u);
}

void report(const PieceHashProgressCallback& progress, uint32_t done, uint32_t total,
            int64_t bytes_done, int64_t total_bytes) {
    if (!progress) return;

    HashProgress snapshot;
    snapshot.pieces_done = done;
    snapshot.total_pieces = total;
    snapshot.bytes_done = bytes_done;
    snapshot.total_bytes = total_bytes;
    progress(snapshot);
}

} // namespace

std::string resolve_file_path(const FileStorage& storage, const std::string& base_path,
                              size_t file_index) {
    if (storage.is_single_file()) {
        return base_path;
    }
    return combine_paths(base_path, storage.file_at(file_index).path_string());
}

std::string concat_digests(const std::vector<PieceDigest>& digests) {
    std::string pieces;
    pieces.reserve(digests.size() * QTM_DIGEST_SIZE);
    for (const auto& digest : digests) {
        pieces.append(reinterpret_cast<const char*>(digest.data()), digest.size());
    }
    return pieces;
}

//=============================================================================
// Sequential reference implementation
//=============================================================================

std::optional<std::vector<PieceDigest>> hash_pieces_sequential(
    const FileStorage& storage, const std::string& base_path,
    const HashOptions& options, TorrentCreateError* error) {
    if (!check_storage(storage, error)) {
        return std::nullopt;
    }

    const uint32_t psize = storage.piece_length();
    const uint32_t num_pcs = storage.num_pieces();

    std::vector<PieceDigest> digests;
    digests.reserve(num_pcs);

    std::vector<uint8_t> piece_buffer(psize);
    uint32_t piece_offset = 0;
    int64_t bytes_done = 0;

    auto cancelled = [&options]() {
        return options.cancel && options.cancel->is_cancelled();
    };

    for (size_t file_idx = 0; file_idx < storage.num_files(); ++file_idx) {
        const FileEntry& entry = storage.file_at(file_idx);
        if (entry.size == 0) {
            continue;
        }

        std::string file_path = resolve_file_path(storage, base_path, file_idx);
        std::ifstream file(file_path, std::ios::binary);
        if (!file) {
            LOG_HASHER_ERROR("Failed to open file: " << file_path);
            set_error(error, TorrentCreateErrorCode::IoError, "Failed to open file: " + file_path, file_path);
            return std::nullopt;
        }

        int64_t remaining = entry.size;
        while (remaining > 0) {
            if (piece_offset == 0 && cancelled()) {
                LOG_HASHER_INFO("Hashing cancelled at piece " << digests.size() << "/" << num_pcs);
                set_error(error, TorrentCreateErrorCode::Cancelled, "Hashing cancelled");
                return std::nullopt;
            }

            uint32_t space_in_piece = psize - piece_offset;
            uint32_t to_read = static_cast<uint32_t>(
                (std::min)(static_cast<int64_t>(space_in_piece), remaining));

            if (!file.read(reinterpret_cast<char*>(piece_buffer.data() + piece_offset), to_read)) {
                LOG_HASHER_ERROR("Failed to read file: " << file_path);
                set_error(error, TorrentCreateErrorCode::IoError,
                          "Unexpected end of file (was it modified while hashing?): " + file_path, file_path);
                return std::nullopt;
            }

            piece_offset += to_read;
            remaining -= to_read;
            bytes_done += to_read;

            if (piece_offset == psize) {
                digests.push_back(SHA1::digest(piece_buffer.data(), psize));
                piece_offset = 0;
                report(options.progress, static_cast<uint32_t>(digests.size()), num_pcs,
                       bytes_done, storage.total_size());
            }
        }

        if (file.peek() != std::char_traits<char>::eof()) {
            LOG_HASHER_ERROR("File grew after it was scanned: " << file_path);
            set_error(error, TorrentCreateErrorCode::IoError,
                      "File grew after it was scanned: " + file_path, file_path);
            return std::nullopt;
        }
    }

    // Final partial piece
    if (piece_offset > 0) {
        digests.push_back(SHA1::digest(piece_buffer.data(), piece_offset));
        report(options.progress, static_cast<uint32_t>(digests.size()), num_pcs,
               bytes_done, storage.total_size());
    }

    if (digests.size() != num_pcs) {
        set_error(error, TorrentCreateErrorCode::IoError,
                  "Hashed " + std::to_string(digests.size()) + " pieces, expected " + std::to_string(num_pcs));
        return std::nullopt;
    }

    return digests;
}

//=============================================================================
// Parallel implementation
//=============================================================================

std::optional<std::vector<PieceDigest>> hash_pieces(
    const FileStorage& storage, const std::string& base_path,
    const HashOptions& options, TorrentCreateError* error) {
    if (!check_storage(storage, error)) {
        return std::nullopt;
    }

    unsigned threads = resolve_thread_count(options.num_threads, storage.num_pieces());
    if (threads <= 1) {
        LOG_HASHER_DEBUG("Hashing " << storage.num_pieces() << " pieces on the calling thread");
        return hash_pieces_sequential(storage, base_path, options, error);
    }

    PieceHasher hasher(storage, base_path, threads);
    return hasher.run(options.progress, options.cancel, error);
}

PieceHasher::PieceHasher(const FileStorage& storage, const std::string& base_path, unsigned num_threads)
    : storage_(storage)
    , base_path_(base_path)
    , num_workers_(resolve_thread_count(num_threads, storage.num_pieces()))
    , batch_size_(1)
    , next_piece_(0)
    , pieces_done_(0)
    , bytes_done_(0)
    , cancel_(nullptr) {
    uint32_t per_worker = storage.num_pieces() / (num_workers_ * 8);
    batch_size_ = (std::max)(1u, (std::min)(per_worker, MAX_BATCH_PIECES));
}

PieceHasher::~PieceHasher() {
    // Workers reference our members; they must be gone before we are
    request_stop();
    join_workers();
}

bool PieceHasher::should_stop() const {
    return stop_requested() || (cancel_ && cancel_->is_cancelled());
}

void PieceHasher::record_error(const TorrentCreateError& err) {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (first_error_.ok()) {
            first_error_ = err;
            LOG_HASHER_ERROR(err.message);
        }
    }
    request_stop();
}

void PieceHasher::worker_loop(unsigned worker_id) {
    const uint32_t total = storage_.num_pieces();
    PieceReader reader(storage_, base_path_);
    std::vector<uint8_t> buffer;
    uint32_t hashed = 0;

    try {
        while (!should_stop()) {
            uint32_t start = next_piece_.fetch_add(batch_size_);
            if (start >= total) {
                break;
            }
            uint32_t end = (std::min)(start + batch_size_, total);

            for (uint32_t piece = start; piece < end; ++piece) {
                if (should_stop()) {
                    break;
                }

                TorrentCreateError err;
                if (!reader.read_piece(piece, buffer, err)) {
                    record_error(err);
                    break;
                }

                digests_[piece] = SHA1::digest(buffer);
                bytes_done_.fetch_add(static_cast<int64_t>(buffer.size()));
                pieces_done_.fetch_add(1);
                ++hashed;
                state_cv_.notify_all();
            }
        }
    } catch (const std::exception& e) {
        record_error(TorrentCreateError(TorrentCreateErrorCode::IoError,
                                        std::string("Hashing worker failed: ") + e.what()));
    }

    reader.close();
    LOG_HASHER_DEBUG("Worker " << worker_id << " hashed " << hashed << " pieces");
    mark_worker_finished();
}

std::optional<std::vector<PieceDigest>> PieceHasher::run(const PieceHashProgressCallback& progress,
                                                         const CancellationToken* cancel,
                                                         TorrentCreateError* error) {
    if (!check_storage(storage_, error)) {
        return std::nullopt;
    }

    const uint32_t total = storage_.num_pieces();
    const int64_t total_bytes = storage_.total_size();

    cancel_ = cancel;
    digests_.assign(total, PieceDigest{});
    next_piece_.store(0);
    pieces_done_.store(0);
    bytes_done_.store(0);
    reset_worker_state();

    LOG_HASHER_INFO("Hashing " << total << " pieces of " << storage_.piece_length()
                    << " bytes with " << num_workers_ << " workers");

    unsigned spawned = 0;
    for (unsigned i = 0; i < num_workers_; ++i) {
        try {
            spawn_worker("hasher-" + std::to_string(i), [this, i]() { worker_loop(i); });
            ++spawned;
        } catch (const std::system_error& e) {
            record_error(TorrentCreateError(TorrentCreateErrorCode::IoError,
                                            std::string("Failed to start hashing worker: ") + e.what()));
            break;
        }
    }

    // Barrier: relay progress on this thread until every worker has finished
    uint32_t reported = 0;
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        while (finished_workers_locked() < spawned) {
            state_cv_.wait_for(lock, std::chrono::milliseconds(50));

            if (cancel_ && cancel_->is_cancelled() && !stop_requested()) {
                LOG_HASHER_INFO("Cancellation requested, stopping workers");
                lock.unlock();
                request_stop();
                lock.lock();
            }

            uint32_t done = pieces_done_.load();
            if (progress && done != reported) {
                int64_t bytes = bytes_done_.load();
                lock.unlock();
                report(progress, done, total, bytes, total_bytes);
                lock.lock();
                reported = done;
            }
        }
    }
    join_workers();

    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (!first_error_.ok()) {
            if (error) *error = first_error_;
            digests_.clear();
            return std::nullopt;
        }
    }

    if (pieces_done_.load() != total) {
        LOG_HASHER_INFO("Hashing cancelled after " << pieces_done_.load() << "/" << total << " pieces");
        set_error(error, TorrentCreateErrorCode::Cancelled, "Hashing cancelled");
        digests_.clear();
        return std::nullopt;
    }

    if (reported != total) {
        report(progress, total, total, total_bytes, total_bytes);
    }

    LOG_HASHER_INFO("Hashed " << total << " pieces");
    return std::move(digests_);
}

} // namespace qtm
