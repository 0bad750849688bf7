#include "metafile_writer.h"
#include "fs.h"
#include "logger.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <sstream>

// Writer module logging macros
#define LOG_WRITER_DEBUG(message) LOG_DEBUG("writer", message)
#define LOG_WRITER_INFO(message)  LOG_INFO("writer", message)
#define LOG_WRITER_ERROR(message) LOG_ERROR("writer", message)

namespace qtm {

std::string TorrentSummary::to_string() const {
    std::ostringstream oss;
    oss << "Name:         " << name << "\n";
    oss << "Info hash:    " << info_hash_hex << "\n";
    oss << "Base32:       " << info_hash_base32 << "\n";
    oss << "Total size:   " << format_size(total_length) << " (" << total_length << " bytes)\n";
    oss << "Files:        " << file_count << "\n";
    oss << "Pieces:       " << piece_count << " x " << format_size(piece_length) << "\n";
    if (!output_path.empty()) {
        oss << "Written to:   " << output_path << "\n";
    }
    return oss.str();
}

TorrentSummary make_summary(const InfoDictionary& info, const InfoHash& info_hash,
                            const std::string& output_path) {
    TorrentSummary summary;
    summary.name = info.name;
    summary.info_hash = info_hash;
    summary.info_hash_hex = info_hash_to_hex(info_hash);
    summary.info_hash_base32 = info_hash_to_base32(info_hash);
    summary.total_length = info.total_length();
    summary.piece_length = info.piece_length;
    summary.piece_count = info.piece_count();
    summary.file_count = info.files.size();
    summary.output_path = output_path;
    return summary;
}

std::string format_size(int64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};

    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    return oss.str();
}

std::string default_output_name(std::time_t timestamp) {
    return "qtm-" + std::to_string(static_cast<int64_t>(timestamp)) + ".torrent";
}

bool write_metafile(const std::string& target, const std::vector<uint8_t>& data,
                    TorrentCreateError* error) {
    if (target.empty()) {
        set_error(error, TorrentCreateErrorCode::IoError, "Output path is empty");
        return false;
    }

    if (is_directory(target)) {
        LOG_WRITER_ERROR("Output path is a directory: " << target);
        set_error(error, TorrentCreateErrorCode::IoError, "Output path is a directory: " + target, target);
        return false;
    }

    std::string temp_path = make_temp_path(target);
    LOG_WRITER_DEBUG("Staging " << data.size() << " bytes in " << temp_path);

    FILE* file = fopen(temp_path.c_str(), "wb");
    if (!file) {
        std::string reason = strerror(errno);
        LOG_WRITER_ERROR("Failed to create " << temp_path << ": " << reason);
        set_error(error, TorrentCreateErrorCode::IoError,
                  "Failed to create output file " + temp_path + ": " + reason, target);
        return false;
    }

    int write_errno = 0;
    bool written = data.empty() || fwrite(data.data(), 1, data.size(), file) == data.size();
    if (!written) write_errno = errno;
    bool flushed = written && flush_file_to_disk(file);
    if (written && !flushed) write_errno = errno;
    bool closed = fclose(file) == 0;
    if (written && flushed && !closed) write_errno = errno;

    if (!written || !flushed || !closed) {
        std::string reason = strerror(write_errno);
        delete_file(temp_path);
        LOG_WRITER_ERROR("Failed to write " << temp_path << ": " << reason);
        set_error(error, TorrentCreateErrorCode::IoError,
                  "Failed to write output file " + target + ": " + reason, target);
        return false;
    }

    if (!rename_file(temp_path, target)) {
        std::string reason = strerror(errno);
        delete_file(temp_path);
        LOG_WRITER_ERROR("Failed to rename " << temp_path << " to " << target << ": " << reason);
        set_error(error, TorrentCreateErrorCode::IoError,
                  "Failed to move output file into place at " + target + ": " + reason, target);
        return false;
    }

    LOG_WRITER_INFO("Wrote " << target << " (" << data.size() << " bytes)");
    return true;
}

} // namespace qtm
