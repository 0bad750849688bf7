#include "metafile.h"
#include "piece_planner.h"
#include "sha1.h"
#include "logger.h"

// Metafile module logging macros
#define LOG_METAFILE_DEBUG(message) LOG_DEBUG("metafile", message)
#define LOG_METAFILE_ERROR(message) LOG_ERROR("metafile", message)

namespace qtm {

namespace {

bool fail(TorrentCreateError* error, const std::string& message, const std::string& path = "") {
    LOG_METAFILE_ERROR(message);
    set_error(error, TorrentCreateErrorCode::Encoding, message, path);
    return false;
}

BencodeValue string_list(const std::vector<std::string>& items) {
    BencodeValue list = BencodeValue::create_list();
    for (const auto& item : items) {
        list.push_back(BencodeValue(item));
    }
    return list;
}

} // namespace

std::vector<std::string> announce_urls(const Announce& announce) {
    if (const auto* single = std::get_if<std::string>(&announce)) {
        if (single->empty()) {
            return {};
        }
        return {*single};
    }
    return std::get<std::vector<std::string>>(announce);
}

int64_t InfoDictionary::total_length() const {
    int64_t total = 0;
    for (const auto& file : files) {
        total += file.size;
    }
    return total;
}

InfoDictionary make_info_dictionary(const FileStorage& storage, std::string pieces, bool is_private) {
    InfoDictionary info;
    info.name = storage.name();
    info.piece_length = storage.piece_length();
    info.pieces = std::move(pieces);
    info.files = storage.files();
    info.single_file = storage.is_single_file();
    info.is_private = is_private;
    return info;
}

//=============================================================================
// Validation
//=============================================================================

bool validate_info(const InfoDictionary& info, TorrentCreateError* error) {
    if (info.files.empty()) {
        return fail(error, "Torrent has no files");
    }

    if (info.name.empty()) {
        return fail(error, "Torrent name is empty");
    }

    if (!is_valid_piece_length(info.piece_length)) {
        return fail(error, "Invalid piece length: " + std::to_string(info.piece_length));
    }

    if (info.single_file && info.files.size() != 1) {
        return fail(error, "Single-file torrent with " + std::to_string(info.files.size()) + " files");
    }

    int64_t total = 0;
    for (const auto& file : info.files) {
        if (file.size < 0) {
            return fail(error, "Negative file length", file.path_string());
        }
        if (!info.single_file) {
            if (file.path.empty()) {
                return fail(error, "File has an empty path");
            }
            for (const auto& segment : file.path) {
                if (segment.empty() || segment == "." || segment == "..") {
                    return fail(error, "Invalid path segment '" + segment + "'", file.path_string());
                }
            }
        }
        total += file.size;
    }

    if (total <= 0) {
        return fail(error, "Torrent content is empty");
    }

    uint64_t expected = static_cast<uint64_t>(piece_count_for(total, info.piece_length)) * QTM_DIGEST_SIZE;
    if (info.pieces.size() != expected) {
        return fail(error, "Pieces string is " + std::to_string(info.pieces.size())
                    + " bytes, expected " + std::to_string(expected));
    }

    return true;
}

//=============================================================================
// Encoding
//=============================================================================

std::optional<BencodeValue> build_info_dict(const InfoDictionary& info, TorrentCreateError* error) {
    if (!validate_info(info, error)) {
        return std::nullopt;
    }

    BencodeValue dict = BencodeValue::create_dict();
    dict["name"] = BencodeValue(info.name);
    dict["piece length"] = BencodeValue(static_cast<int64_t>(info.piece_length));
    dict["pieces"] = BencodeValue(info.pieces);

    if (info.is_private) {
        dict["private"] = BencodeValue(static_cast<int64_t>(1));
    }

    if (info.single_file) {
        dict["length"] = BencodeValue(info.files.front().size);
    } else {
        BencodeValue files_list = BencodeValue::create_list();
        for (const auto& file : info.files) {
            BencodeValue file_dict = BencodeValue::create_dict();
            file_dict["length"] = BencodeValue(file.size);
            file_dict["path"] = string_list(file.path);
            files_list.push_back(std::move(file_dict));
        }
        dict["files"] = std::move(files_list);
    }

    return dict;
}

std::vector<uint8_t> encode_info(const InfoDictionary& info, TorrentCreateError* error) {
    auto dict = build_info_dict(info, error);
    if (!dict) {
        return {};
    }
    return dict->encode();
}

std::optional<InfoHash> compute_info_hash(const InfoDictionary& info, TorrentCreateError* error) {
    std::vector<uint8_t> bytes = encode_info(info, error);
    if (bytes.empty()) {
        return std::nullopt;
    }
    return SHA1::digest(bytes);
}

std::vector<uint8_t> encode_metafile(const Metafile& meta, TorrentCreateError* error) {
    auto info = build_info_dict(meta.info, error);
    if (!info) {
        return {};
    }

    BencodeValue dict = BencodeValue::create_dict();
    dict["info"] = std::move(*info);

    if (const auto* single = std::get_if<std::string>(&meta.announce)) {
        if (!single->empty()) {
            dict["announce"] = BencodeValue(*single);
        }
    } else {
        const auto& urls = std::get<std::vector<std::string>>(meta.announce);
        for (const auto& url : urls) {
            if (url.empty()) {
                fail(error, "Announce list contains an empty URL");
                return {};
            }
        }
        if (!urls.empty()) {
            dict["announce"] = BencodeValue(urls.front());

            // One tier per URL, tried in order
            BencodeValue tiers = BencodeValue::create_list();
            for (const auto& url : urls) {
                tiers.push_back(string_list({url}));
            }
            dict["announce-list"] = std::move(tiers);
        }
    }

    if (!meta.comment.empty()) {
        dict["comment"] = BencodeValue(meta.comment);
    }

    if (!meta.created_by.empty()) {
        dict["created by"] = BencodeValue(meta.created_by);
    }

    if (meta.creation_date != 0) {
        dict["creation date"] = BencodeValue(static_cast<int64_t>(meta.creation_date));
    }

    if (!meta.encoding.empty()) {
        dict["encoding"] = BencodeValue(meta.encoding);
    }

    // Web seeds
    if (!meta.url_list.empty()) {
        for (const auto& url : meta.url_list) {
            if (url.empty()) {
                fail(error, "Web seed list contains an empty URL");
                return {};
            }
        }
        if (meta.url_list.size() == 1) {
            dict["url-list"] = BencodeValue(meta.url_list.front());
        } else {
            dict["url-list"] = string_list(meta.url_list);
        }
    }

    std::vector<uint8_t> bytes = dict.encode();
    LOG_METAFILE_DEBUG("Encoded metafile '" << meta.info.name << "': " << bytes.size() << " bytes");
    return bytes;
}

} // namespace qtm
