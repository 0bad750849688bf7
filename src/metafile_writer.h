#pragma once

/**
 * @file metafile_writer.h
 * @brief Persisting the encoded metafile and describing the result
 */

#include "types.h"
#include "metafile.h"
#include "create_error.h"

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace qtm {

/**
 * @brief What a successful run produced
 */
struct TorrentSummary {
    std::string name;
    InfoHash info_hash{};
    std::string info_hash_hex;          ///< 40 lowercase hex characters
    std::string info_hash_base32;       ///< 32 uppercase base32 characters
    int64_t total_length = 0;
    uint32_t piece_length = 0;
    uint32_t piece_count = 0;
    size_t file_count = 0;
    std::string output_path;            ///< Empty when nothing was written

    TorrentSummary() = default;

    /**
     * @brief Multi-line human readable report
     */
    std::string to_string() const;
};

TorrentSummary make_summary(const InfoDictionary& info, const InfoHash& info_hash,
                            const std::string& output_path = "");

/**
 * @brief Format a byte count as "512 B", "1.50 MiB", ...
 */
std::string format_size(int64_t bytes);

/**
 * @brief "qtm-<timestamp>.torrent"
 */
std::string default_output_name(std::time_t timestamp);

/**
 * @brief Atomically write @p data to @p target
 *
 * The bytes go to a uniquely named temporary file next to the target,
 * which is flushed to disk and then renamed over the target. On failure
 * the temporary file is removed and the target is left untouched.
 *
 * @param error IoError with the offending path
 */
bool write_metafile(const std::string& target, const std::vector<uint8_t>& data,
                    TorrentCreateError* error = nullptr);

} // namespace qtm
