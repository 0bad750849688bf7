#pragma once

/**
 * @file metafile.h
 * @brief The .torrent document model and its canonical encoding
 *
 * A Metafile is built once per run from the walk, the piece layout and the
 * piece digests, encoded once and then discarded. The info dictionary is
 * encoded on its own for the info hash; the same bytes are embedded in the
 * full document, so the hash always matches what is written to disk.
 */

#include "types.h"
#include "bencode.h"
#include "file_storage.h"
#include "create_error.h"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace qtm {

/**
 * @brief Announce URL(s)
 *
 * A single URL, or an ordered list of URLs. The list form is written as
 * "announce" (first URL) plus "announce-list" with one URL per tier, in
 * the given order. An empty string or an empty list writes no announce.
 */
using Announce = std::variant<std::string, std::vector<std::string>>;

/**
 * @brief All announce URLs in order, whichever form @p announce has
 */
std::vector<std::string> announce_urls(const Announce& announce);

/**
 * @brief The part of the torrent that is hashed into the info hash
 */
struct InfoDictionary {
    std::string name;
    uint32_t piece_length = 0;
    std::string pieces;                 ///< Concatenated 20-byte digests
    std::vector<FileEntry> files;       ///< Exactly one entry in single-file mode
    bool single_file = false;
    bool is_private = false;

    InfoDictionary() = default;

    int64_t total_length() const;
    uint32_t piece_count() const { return static_cast<uint32_t>(pieces.size() / QTM_DIGEST_SIZE); }
};

/**
 * @brief Build an InfoDictionary from a walked, finalized storage
 */
InfoDictionary make_info_dictionary(const FileStorage& storage, std::string pieces, bool is_private);

struct Metafile {
    Announce announce;
    std::time_t creation_date = 0;      ///< Omitted when 0
    std::string created_by;             ///< Omitted when empty
    std::string comment;                ///< Omitted when empty
    std::string encoding;               ///< Omitted when empty
    std::vector<std::string> url_list;  ///< Web seeds
    InfoDictionary info;

    Metafile() = default;
};

/**
 * @brief Check the structural invariants of an info dictionary
 *
 * Encoding error when: no files, empty name, piece length not a valid
 * size class, a negative length, an empty or "."/".." path segment, more
 * than one file in single-file mode, zero total length, or a pieces string
 * that is not 20 bytes per piece of the total length.
 */
bool validate_info(const InfoDictionary& info, TorrentCreateError* error = nullptr);

/**
 * @brief The info dictionary as a bencode value
 */
std::optional<BencodeValue> build_info_dict(const InfoDictionary& info,
                                            TorrentCreateError* error = nullptr);

/**
 * @brief Canonical bytes of the info dictionary
 * @return Encoded bytes, or an empty vector with @p error filled
 */
std::vector<uint8_t> encode_info(const InfoDictionary& info, TorrentCreateError* error = nullptr);

/**
 * @brief SHA-1 of encode_info()
 */
std::optional<InfoHash> compute_info_hash(const InfoDictionary& info,
                                          TorrentCreateError* error = nullptr);

/**
 * @brief Canonical bytes of the whole .torrent document
 * @return Encoded bytes, or an empty vector with @p error filled
 */
std::vector<uint8_t> encode_metafile(const Metafile& meta, TorrentCreateError* error = nullptr);

} // namespace qtm
