#pragma once

/**
 * @file creator_config.h
 * @brief JSON settings file for torrent creation
 *
 * Example:
 * @code
 * {
 *     "announce": ["http://a.example/announce", "udp://b.example:6969"],
 *     "private": true,
 *     "comment": "Weekly build",
 *     "piece_size": 1048576,
 *     "threads": 4,
 *     "include_hidden": false,
 *     "web_seeds": ["https://mirror.example/files/"],
 *     "log_level": "info"
 * }
 * @endcode
 *
 * Every key is optional and unknown keys are ignored. A key holding the
 * wrong JSON type fails the whole load.
 */

#include "metafile.h"
#include "torrent_creator.h"
#include "create_error.h"

#include <optional>
#include <string>
#include <vector>

namespace qtm {

// Upper bound for "threads" in a settings file and for -t on the command line
constexpr unsigned QTM_MAX_SETTINGS_THREADS = 1024;

struct CreatorSettings {
    Announce announce;                      ///< "announce": string or array of strings
    bool is_private = false;                ///< "private"
    std::optional<std::string> comment;     ///< "comment", unset = default comment
    std::optional<std::string> created_by;  ///< "created_by", unset = application name
    uint32_t piece_size = 0;                ///< "piece_size", 0 = automatic
    unsigned threads = 0;                   ///< "threads", 0 = hardware concurrency
    bool include_hidden = true;             ///< "include_hidden"
    std::vector<std::string> web_seeds;     ///< "web_seeds"
    std::string log_level = "info";         ///< "log_level": debug, info, warn, error

    CreatorSettings() = default;
};

/**
 * @brief Parse settings from JSON text
 * @param error Config on malformed JSON, a non-object document, a wrong
 *              value type or an out of range number
 */
bool parse_creator_settings(const std::string& json_text, CreatorSettings& out,
                            TorrentCreateError* error = nullptr);

/**
 * @brief Load settings from a JSON file
 * @param error IoError if the file cannot be read, otherwise as
 *              parse_creator_settings()
 */
bool load_creator_settings(const std::string& path, CreatorSettings& out,
                           TorrentCreateError* error = nullptr);

/**
 * @brief Pretty-printed JSON for @p settings
 */
std::string creator_settings_to_json(const CreatorSettings& settings);

bool save_creator_settings(const std::string& path, const CreatorSettings& settings,
                           TorrentCreateError* error = nullptr);

/**
 * @brief Parse a size argument such as "262144", "256K" or "1M"
 *
 * Accepts decimal digits with an optional K/k/KiB or M/m/MiB suffix. Signs,
 * spaces and values above QTM_MAX_PIECE_LENGTH fail with Config and leave
 * @p out unchanged. "0" means automatic.
 */
bool parse_size_argument(const std::string& text, uint32_t& out, TorrentCreateError* error = nullptr);

/**
 * @brief Parse a thread count argument (decimal, 0..QTM_MAX_SETTINGS_THREADS)
 */
bool parse_thread_argument(const std::string& text, unsigned& out, TorrentCreateError* error = nullptr);

/**
 * @brief Creator configuration for @p settings, creation date set to now
 */
TorrentCreatorConfig to_creator_config(const CreatorSettings& settings);

} // namespace qtm
