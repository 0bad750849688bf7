#pragma once

/**
 * @file create_error.h
 * @brief Error reporting shared by every torrent creation stage
 *
 * Stages return bool / optional / empty buffers and describe the failure
 * through an optional TorrentCreateError out-parameter.
 */

#include <string>

namespace qtm {

enum class TorrentCreateErrorCode {
    None,
    IoError,        ///< Unreadable input or unwritable output
    EmptyInput,     ///< No files found under the root
    InvalidSize,    ///< Zero/negative total length or bad piece length
    Encoding,       ///< Structurally invalid metafile handed to the encoder
    Cancelled,      ///< Aborted by the caller, not a fault
    Config          ///< Malformed settings file
};

/**
 * @brief Error information for torrent creation failures
 */
struct TorrentCreateError {
    TorrentCreateErrorCode code = TorrentCreateErrorCode::None;
    std::string message;
    std::string path;           ///< Offending file, when there is one

    TorrentCreateError() = default;
    explicit TorrentCreateError(const std::string& msg)
        : code(TorrentCreateErrorCode::IoError), message(msg) {}
    TorrentCreateError(TorrentCreateErrorCode c, const std::string& msg, const std::string& p = "")
        : code(c), message(msg), path(p) {}

    bool ok() const { return code == TorrentCreateErrorCode::None; }
    bool is_cancelled() const { return code == TorrentCreateErrorCode::Cancelled; }

    void clear() {
        code = TorrentCreateErrorCode::None;
        message.clear();
        path.clear();
    }
};

inline const char* error_code_name(TorrentCreateErrorCode code) {
    switch (code) {
        case TorrentCreateErrorCode::None:        return "none";
        case TorrentCreateErrorCode::IoError:     return "io_error";
        case TorrentCreateErrorCode::EmptyInput:  return "empty_input";
        case TorrentCreateErrorCode::InvalidSize: return "invalid_size";
        case TorrentCreateErrorCode::Encoding:    return "encoding_error";
        case TorrentCreateErrorCode::Cancelled:   return "cancelled";
        case TorrentCreateErrorCode::Config:      return "config_error";
    }
    return "unknown";
}

/**
 * @brief Fill an optional error out-parameter
 */
inline void set_error(TorrentCreateError* error, TorrentCreateErrorCode code,
                      const std::string& message, const std::string& path = "") {
    if (error) {
        error->code = code;
        error->message = message;
        error->path = path;
    }
}

} // namespace qtm
