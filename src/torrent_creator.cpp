#include "torrent_creator.h"
#include "piece_planner.h"
#include "version.h"
#include "logger.h"

#include <algorithm>

// Creator module logging macros
#define LOG_CREATOR_DEBUG(message) LOG_DEBUG("creator", message)
#define LOG_CREATOR_INFO(message)  LOG_INFO("creator", message)
#define LOG_CREATOR_WARN(message)  LOG_WARN("creator", message)
#define LOG_CREATOR_ERROR(message) LOG_ERROR("creator", message)

namespace qtm {

std::string default_created_by() {
    return version::application_name();
}

std::string default_comment(const std::string& created_by) {
    return "This torrent was created by " + created_by;
}

//=============================================================================
// TorrentCreator Implementation
//=============================================================================

TorrentCreator::TorrentCreator(const std::string& path,
                               const TorrentCreatorConfig& config)
    : base_path_(path)
    , scanned_(false)
    , include_hidden_(config.include_hidden_files)
    , comment_(config.comment)
    , created_by_(config.created_by)
    , creation_date_(config.creation_date)
    , encoding_(config.encoding)
    , is_private_(config.is_private)
    , piece_size_(config.piece_size)
    , num_threads_(config.num_threads)
    , announce_(config.announce)
    , cached_info_hash_{}
    , info_hash_valid_(false) {

    files_.set_name(torrent_name_for_path(path));

    for (const auto& seed : config.web_seeds) {
        add_url_seed(seed);
    }
}

TorrentCreator::TorrentCreator(FileStorage&& storage,
                               const std::string& base_path,
                               const TorrentCreatorConfig& config)
    : base_path_(base_path)
    , files_(std::move(storage))
    , scanned_(true)
    , include_hidden_(config.include_hidden_files)
    , comment_(config.comment)
    , created_by_(config.created_by)
    , creation_date_(config.creation_date)
    , encoding_(config.encoding)
    , is_private_(config.is_private)
    , piece_size_(config.piece_size)
    , num_threads_(config.num_threads)
    , announce_(config.announce)
    , cached_info_hash_{}
    , info_hash_valid_(false) {

    if (files_.name().empty()) {
        files_.set_name(torrent_name_for_path(base_path));
    }

    for (const auto& seed : config.web_seeds) {
        add_url_seed(seed);
    }
}

//=============================================================================
// File Management
//=============================================================================

bool TorrentCreator::scan_files(FileFilterCallback filter, TorrentCreateError* error) {
    // Keep the name across re-scans; it may have been set explicitly
    std::string name = files_.name();
    invalidate_hashes();

    WalkOptions options;
    options.include_hidden = include_hidden_;
    options.filter = std::move(filter);

    FileStorage walked;
    if (!walk_path(base_path_, walked, options, error)) {
        files_ = FileStorage();
        files_.set_name(name);
        scanned_ = false;
        return false;
    }

    if (!name.empty()) {
        walked.set_name(name);
    }
    files_ = std::move(walked);
    scanned_ = true;

    LOG_CREATOR_DEBUG("Scanned " << files_.num_files() << " files, " << files_.total_size()
                      << " bytes under " << base_path_);
    return true;
}

//=============================================================================
// Properties
//=============================================================================

void TorrentCreator::set_name(const std::string& name) {
    files_.set_name(name);
    info_hash_valid_ = false;
}

void TorrentCreator::set_private(bool is_private) {
    is_private_ = is_private;
    info_hash_valid_ = false;
}

void TorrentCreator::set_piece_size(uint32_t size) {
    piece_size_ = size;
    invalidate_hashes();
}

void TorrentCreator::invalidate_hashes() {
    piece_hashes_.clear();
    info_hash_valid_ = false;
}

//=============================================================================
// Trackers and Seeds
//=============================================================================

void TorrentCreator::add_tracker(const std::string& url) {
    if (url.empty()) return;

    std::vector<std::string> urls = announce_urls(announce_);

    // Check for duplicates
    if (std::find(urls.begin(), urls.end(), url) != urls.end()) {
        return;
    }

    if (urls.empty()) {
        announce_ = url;
    } else {
        urls.push_back(url);
        announce_ = std::move(urls);
    }
}

void TorrentCreator::add_url_seed(const std::string& url) {
    if (url.empty()) return;

    if (std::find(url_seeds_.begin(), url_seeds_.end(), url) == url_seeds_.end()) {
        url_seeds_.push_back(url);
    }
}

//=============================================================================
// Piece Hashing
//=============================================================================

bool TorrentCreator::set_piece_hashes(PieceHashProgressCallback progress_callback,
                                      const CancellationToken* cancel,
                                      TorrentCreateError* error) {
    if (!scanned_ && !scan_files(nullptr, error)) {
        return false;
    }

    invalidate_hashes();

    if (files_.empty()) {
        set_error(error, TorrentCreateErrorCode::EmptyInput, "No files to hash");
        return false;
    }

    // Determine piece size
    std::optional<PieceLayout> layout = piece_size_ == 0
        ? plan_pieces(files_.total_size(), error)
        : plan_pieces_with_length(files_.total_size(), piece_size_, error);
    if (!layout) {
        LOG_CREATOR_ERROR("Cannot plan pieces for " << files_.total_size() << " bytes");
        return false;
    }

    // Finalize file storage with piece size
    files_.set_piece_length(layout->piece_length);
    files_.finalize();

    LOG_CREATOR_INFO("Hashing '" << files_.name() << "': " << files_.num_files() << " files, "
                     << format_size(files_.total_size()) << ", " << layout->piece_count
                     << " pieces of " << format_size(layout->piece_length));

    HashOptions options;
    options.num_threads = num_threads_;
    options.progress = std::move(progress_callback);
    options.cancel = cancel;

    auto digests = hash_pieces(files_, base_path_, options, error);
    if (!digests) {
        return false;
    }

    piece_hashes_ = concat_digests(*digests);
    info_hash_valid_ = false;
    return true;
}

//=============================================================================
// Generation
//=============================================================================

InfoDictionary TorrentCreator::build_info() const {
    return make_info_dictionary(files_, piece_hashes_, is_private_);
}

std::optional<Metafile> TorrentCreator::build_metafile(TorrentCreateError* error) const {
    if (piece_hashes_.empty()) {
        set_error(error, TorrentCreateErrorCode::Encoding,
                  "Piece hashes not computed. Call set_piece_hashes() first.");
        return std::nullopt;
    }

    Metafile meta;
    meta.announce = announce_;
    meta.creation_date = creation_date_;
    meta.created_by = created_by_;
    meta.comment = comment_;
    meta.encoding = encoding_;
    meta.url_list = url_seeds_;
    meta.info = build_info();

    if (!validate_info(meta.info, error)) {
        return std::nullopt;
    }
    return meta;
}

std::vector<uint8_t> TorrentCreator::generate(TorrentCreateError* error) const {
    auto meta = build_metafile(error);
    if (!meta) {
        return {};
    }
    return encode_metafile(*meta, error);
}

bool TorrentCreator::save_to_file(const std::string& output_path,
                                  const CancellationToken* cancel,
                                  TorrentCreateError* error) const {
    auto data = generate(error);
    if (data.empty()) {
        return false;
    }

    if (cancel && cancel->is_cancelled()) {
        LOG_CREATOR_INFO("Cancelled before writing " << output_path);
        set_error(error, TorrentCreateErrorCode::Cancelled, "Cancelled before writing output");
        return false;
    }

    return write_metafile(output_path, data, error);
}

std::optional<TorrentSummary> TorrentCreator::create(const std::string& output_path,
                                                     PieceHashProgressCallback progress_callback,
                                                     const CancellationToken* cancel,
                                                     TorrentCreateError* error) {
    if (!set_piece_hashes(std::move(progress_callback), cancel, error)) {
        return std::nullopt;
    }

    if (!save_to_file(output_path, cancel, error)) {
        return std::nullopt;
    }

    auto result = summary(output_path, error);
    if (result) {
        LOG_CREATOR_INFO("Created " << output_path << " (info hash " << result->info_hash_hex << ")");
    }
    return result;
}

InfoHash TorrentCreator::info_hash() const {
    if (info_hash_valid_) {
        return cached_info_hash_;
    }

    if (piece_hashes_.empty()) {
        return InfoHash{};
    }

    auto hash = compute_info_hash(build_info());
    if (!hash) {
        return InfoHash{};
    }

    cached_info_hash_ = *hash;
    info_hash_valid_ = true;

    return cached_info_hash_;
}

std::string TorrentCreator::info_hash_hex() const {
    InfoHash hash = info_hash();
    return info_hash_to_hex(hash);
}

std::optional<TorrentSummary> TorrentCreator::summary(const std::string& output_path,
                                                      TorrentCreateError* error) const {
    if (piece_hashes_.empty()) {
        set_error(error, TorrentCreateErrorCode::Encoding,
                  "Piece hashes not computed. Call set_piece_hashes() first.");
        return std::nullopt;
    }

    InfoDictionary info = build_info();
    auto hash = compute_info_hash(info, error);
    if (!hash) {
        return std::nullopt;
    }
    return make_summary(info, *hash, output_path);
}

//=============================================================================
// Convenience Functions
//=============================================================================

std::optional<TorrentSummary> create_torrent(const std::string& path,
                                             const std::string& output_path,
                                             const TorrentCreatorConfig& config,
                                             PieceHashProgressCallback progress_callback,
                                             const CancellationToken* cancel,
                                             TorrentCreateError* error) {
    TorrentCreator creator(path, config);
    return creator.create(output_path, std::move(progress_callback), cancel, error);
}

std::vector<uint8_t> create_torrent_data(const std::string& path,
                                         const TorrentCreatorConfig& config,
                                         PieceHashProgressCallback progress_callback,
                                         const CancellationToken* cancel,
                                         TorrentCreateError* error) {
    TorrentCreator creator(path, config);

    if (!creator.set_piece_hashes(std::move(progress_callback), cancel, error)) {
        return {};
    }

    return creator.generate(error);
}

} // namespace qtm
