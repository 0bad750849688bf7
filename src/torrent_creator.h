#pragma once

/**
 * @file torrent_creator.h
 * @brief Torrent file creation and generation
 *
 * Drives the pipeline Walker -> Planner -> Hasher -> Encoder -> Writer for
 * a single file or a directory tree. Each stage hands its result to the
 * next by value; nothing is shared between runs.
 */

#include "types.h"
#include "file_storage.h"
#include "file_walker.h"
#include "piece_hasher.h"
#include "metafile.h"
#include "metafile_writer.h"
#include "cancellation.h"
#include "create_error.h"

#include <string>
#include <vector>
#include <optional>
#include <ctime>

namespace qtm {

/**
 * @brief Default "created by" string
 */
std::string default_created_by();

/**
 * @brief Default comment: "This torrent was created by <created_by>"
 */
std::string default_comment(const std::string& created_by);

/**
 * @brief Configuration for torrent creation
 */
struct TorrentCreatorConfig {
    uint32_t piece_size = 0;            ///< Piece size in bytes (0 = auto-detect)
    bool is_private = false;            ///< Private torrent flag
    std::string comment;                ///< Comment (empty to omit)
    std::string created_by;             ///< Creator string (empty to omit)
    std::time_t creation_date = 0;      ///< Creation timestamp (0 to omit)
    std::string encoding;               ///< Text encoding tag (empty to omit)
    bool include_hidden_files = true;   ///< Include dot files when walking directories
    unsigned num_threads = 0;           ///< Hashing threads (0 = hardware concurrency)
    Announce announce;                  ///< Tracker URL or ordered list of URLs
    std::vector<std::string> web_seeds; ///< "url-list" entries

    TorrentCreatorConfig()
        : created_by(default_created_by())
        , creation_date(std::time(nullptr))
        , encoding("UTF-8") {
        comment = default_comment(created_by);
    }
};

/**
 * @brief Creates torrent files from files or directories
 *
 * This class provides a simple API to create .torrent files:
 *
 * 1. Create TorrentCreator with the content path
 * 2. Set properties (trackers, comment, etc.)
 * 3. Call set_piece_hashes() to walk the content and hash it
 * 4. Call generate() or save_to_file()
 *
 * Or call create() to run every step at once.
 *
 * Example usage:
 * @code
 * TorrentCreator creator("./my_folder");
 * creator.add_tracker("http://tracker.example.com/announce");
 * creator.set_comment("My torrent");
 *
 * TorrentCreateError error;
 * auto summary = creator.create("my_folder.torrent", nullptr, nullptr, &error);
 * if (summary) {
 *     std::cout << summary->to_string();
 * }
 * @endcode
 *
 * Thread-safety: Not thread-safe. Cancellation is requested through a
 * CancellationToken from any thread.
 */
class TorrentCreator {
public:
    /**
     * @brief Create a torrent creator for a file or directory
     *
     * Nothing is read until scan_files() or set_piece_hashes() runs.
     *
     * @param path Path to file or directory
     * @param config Optional configuration
     */
    explicit TorrentCreator(const std::string& path,
                            const TorrentCreatorConfig& config = TorrentCreatorConfig());

    /**
     * @brief Create a torrent creator with custom file storage
     *
     * Use this when you want manual control over which files are included.
     *
     * @param storage Pre-configured file storage, with a name
     * @param base_path Directory the storage paths are relative to, or the
     *                  file itself when the storage is single-file
     * @param config Optional configuration
     */
    TorrentCreator(FileStorage&& storage,
                   const std::string& base_path,
                   const TorrentCreatorConfig& config = TorrentCreatorConfig());

    ~TorrentCreator() = default;

    // Non-copyable, moveable
    TorrentCreator(const TorrentCreator&) = delete;
    TorrentCreator& operator=(const TorrentCreator&) = delete;
    TorrentCreator(TorrentCreator&&) noexcept = default;
    TorrentCreator& operator=(TorrentCreator&&) noexcept = default;

    //=========================================================================
    // File Management
    //=========================================================================

    /**
     * @brief Walk the content path
     *
     * Called by set_piece_hashes() when no files have been scanned yet.
     * Call this to re-scan or to scan with a custom filter.
     *
     * @param filter Optional filter callback
     * @param error IoError or EmptyInput, see walk_path()
     * @return true if at least one file was found
     */
    bool scan_files(FileFilterCallback filter = nullptr, TorrentCreateError* error = nullptr);

    const FileStorage& files() const { return files_; }
    size_t num_files() const { return files_.num_files(); }
    int64_t total_size() const { return files_.total_size(); }
    const std::string& base_path() const { return base_path_; }

    //=========================================================================
    // Torrent Properties
    //=========================================================================

    /**
     * @brief Set the torrent name
     *
     * By default, the name is derived from the path.
     */
    void set_name(const std::string& name);
    const std::string& name() const { return files_.name(); }

    void set_comment(const std::string& comment) { comment_ = comment; }
    const std::string& comment() const { return comment_; }

    void set_creator(const std::string& creator) { created_by_ = creator; }
    const std::string& creator() const { return created_by_; }

    /**
     * @brief Set the creation date
     * @param timestamp Unix timestamp (0 to omit from torrent)
     */
    void set_creation_date(std::time_t timestamp) { creation_date_ = timestamp; }
    std::time_t creation_date() const { return creation_date_; }

    void set_encoding(const std::string& encoding) { encoding_ = encoding; }
    const std::string& encoding() const { return encoding_; }

    /**
     * @brief Set private flag
     *
     * Part of the info dictionary, so it changes the info hash.
     */
    void set_private(bool is_private);
    bool is_private() const { return is_private_; }

    /**
     * @brief Set piece size manually
     *
     * If not set (or 0), the piece size is chosen by plan_pieces().
     * A non-zero size must be a power of two in [16 KiB, 16 MiB];
     * set_piece_hashes() fails with InvalidSize otherwise.
     */
    void set_piece_size(uint32_t size);
    uint32_t piece_size() const { return piece_size_; }

    uint32_t num_pieces() const { return files_.num_pieces(); }

    /**
     * @brief Number of hashing threads (0 = hardware concurrency)
     */
    void set_num_threads(unsigned threads) { num_threads_ = threads; }
    unsigned num_threads() const { return num_threads_; }

    //=========================================================================
    // Trackers
    //=========================================================================

    /**
     * @brief Append a tracker URL
     *
     * The first tracker is written as "announce"; once there is more than
     * one, all of them are also written to "announce-list", one per tier.
     * Duplicates and empty URLs are ignored.
     */
    void add_tracker(const std::string& url);

    /**
     * @brief Replace the announce value with an explicit single URL or list
     */
    void set_announce(const Announce& announce) { announce_ = announce; }
    const Announce& announce() const { return announce_; }

    std::vector<std::string> trackers() const { return announce_urls(announce_); }
    void clear_trackers() { announce_ = std::string(); }

    //=========================================================================
    // Web Seeds
    //=========================================================================

    void add_url_seed(const std::string& url);
    const std::vector<std::string>& url_seeds() const { return url_seeds_; }

    //=========================================================================
    // Piece Hashing
    //=========================================================================

    /**
     * @brief Plan the piece layout and hash every piece
     *
     * This is a potentially long operation as it reads all file content.
     * Call this before generate().
     *
     * @param progress_callback Optional, invoked on this thread
     * @param cancel Optional cancellation token
     * @param error Optional output for error information
     * @return true if all pieces were hashed successfully
     */
    bool set_piece_hashes(PieceHashProgressCallback progress_callback = nullptr,
                          const CancellationToken* cancel = nullptr,
                          TorrentCreateError* error = nullptr);

    /**
     * @brief Check if piece hashes have been computed
     */
    bool has_piece_hashes() const { return !piece_hashes_.empty(); }

    /**
     * @brief Concatenated 20-byte piece digests
     */
    const std::string& piece_hashes() const { return piece_hashes_; }

    //=========================================================================
    // Generation
    //=========================================================================

    /**
     * @brief Assemble the Metafile model
     *
     * Requires set_piece_hashes() to have been called first.
     */
    std::optional<Metafile> build_metafile(TorrentCreateError* error = nullptr) const;

    /**
     * @brief Generate the bencoded torrent data
     *
     * @param error Optional output for error information
     * @return Bencoded torrent data, or empty vector on failure
     */
    std::vector<uint8_t> generate(TorrentCreateError* error = nullptr) const;

    /**
     * @brief Generate and atomically save to a file
     *
     * @param output_path Path to save the .torrent file
     * @param cancel Checked once more before anything is written
     * @param error Optional output for error information
     * @return true if saved successfully
     */
    bool save_to_file(const std::string& output_path,
                      const CancellationToken* cancel = nullptr,
                      TorrentCreateError* error = nullptr) const;

    /**
     * @brief Run the whole pipeline: scan, hash, encode, write
     *
     * @return Summary of the written torrent, or nullopt with @p error set.
     *         On any failure, cancellation included, no file is written.
     */
    std::optional<TorrentSummary> create(const std::string& output_path,
                                         PieceHashProgressCallback progress_callback = nullptr,
                                         const CancellationToken* cancel = nullptr,
                                         TorrentCreateError* error = nullptr);

    /**
     * @brief Get the info hash without generating full torrent
     *
     * Requires set_piece_hashes() to have been called.
     *
     * @return Info hash, or zero hash if not ready
     */
    InfoHash info_hash() const;

    /**
     * @brief Get the info hash as hex string
     */
    std::string info_hash_hex() const;

    /**
     * @brief Summary of the current state (hashes required)
     */
    std::optional<TorrentSummary> summary(const std::string& output_path = "",
                                          TorrentCreateError* error = nullptr) const;

private:
    std::string base_path_;
    FileStorage files_;
    bool scanned_;
    bool include_hidden_;

    // Torrent metadata
    std::string comment_;
    std::string created_by_;
    std::time_t creation_date_;
    std::string encoding_;
    bool is_private_;
    uint32_t piece_size_;
    unsigned num_threads_;

    Announce announce_;
    std::vector<std::string> url_seeds_;

    // Piece hashes (concatenated 20-byte SHA-1 hashes)
    std::string piece_hashes_;

    // Cached info hash
    mutable InfoHash cached_info_hash_;
    mutable bool info_hash_valid_;

    InfoDictionary build_info() const;
    void invalidate_hashes();
};

//=============================================================================
// Convenience Functions
//=============================================================================

/**
 * @brief Create a torrent from a file or directory
 *
 * Convenience function that creates a torrent in one call.
 *
 * @param path Path to file or directory
 * @param output_path Path to save the .torrent file
 * @param config Metadata, trackers and hashing options
 * @param progress_callback Optional progress callback
 * @param cancel Optional cancellation token
 * @param error Optional output for error information
 * @return Summary if the torrent was created successfully
 */
std::optional<TorrentSummary> create_torrent(const std::string& path,
                                             const std::string& output_path,
                                             const TorrentCreatorConfig& config = TorrentCreatorConfig(),
                                             PieceHashProgressCallback progress_callback = nullptr,
                                             const CancellationToken* cancel = nullptr,
                                             TorrentCreateError* error = nullptr);

/**
 * @brief Create a torrent and return the data
 *
 * @return Bencoded torrent data, or empty vector on failure
 */
std::vector<uint8_t> create_torrent_data(const std::string& path,
                                         const TorrentCreatorConfig& config = TorrentCreatorConfig(),
                                         PieceHashProgressCallback progress_callback = nullptr,
                                         const CancellationToken* cancel = nullptr,
                                         TorrentCreateError* error = nullptr);

} // namespace qtm
