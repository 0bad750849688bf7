#include "file_walker.h"
#include "fs.h"
#include "logger.h"

#include <algorithm>

// Walker module logging macros
#define LOG_WALKER_DEBUG(message) LOG_DEBUG("walker", message)
#define LOG_WALKER_INFO(message)  LOG_INFO("walker", message)
#define LOG_WALKER_WARN(message)  LOG_WARN("walker", message)
#define LOG_WALKER_ERROR(message) LOG_ERROR("walker", message)

namespace qtm {

namespace {

struct WalkedFile {
    std::vector<std::string> path;
    int64_t size;
};

std::string strip_trailing_separators(const std::string& path) {
    std::string p(path);
    while (p.size() > 1 && (p.back() == '/' || p.back() == '\\')) {
        p.pop_back();
    }
    return p;
}

bool walk_directory(const std::string& dir_path,
                    const std::vector<std::string>& prefix,
                    const WalkOptions& options,
                    std::vector<WalkedFile>& out,
                    TorrentCreateError* error) {
    std::vector<DirectoryEntry> entries;
    if (!list_directory(dir_path, entries)) {
        set_error(error, TorrentCreateErrorCode::IoError,
                  "Failed to list directory: " + dir_path, dir_path);
        return false;
    }

    for (const auto& entry : entries) {
        if (!options.include_hidden && is_hidden_name(entry.name)) {
            LOG_WALKER_DEBUG("Skipping hidden entry: " << entry.path);
            continue;
        }

        if (entry.is_symlink) {
            LOG_WALKER_WARN("Skipping symbolic link: " << entry.path);
            continue;
        }

        if (options.filter && !options.filter(entry.path)) {
            LOG_WALKER_DEBUG("Filtered out: " << entry.path);
            continue;
        }

        std::vector<std::string> relative = prefix;
        relative.push_back(entry.name);

        if (entry.is_directory) {
            if (!walk_directory(entry.path, relative, options, out, error)) {
                return false;
            }
        } else if (entry.is_regular) {
            out.push_back({std::move(relative), static_cast<int64_t>(entry.size)});
        } else {
            LOG_WALKER_WARN("Skipping entry that is not a regular file: " << entry.path);
        }
    }

    return true;
}

} // namespace

bool is_hidden_name(const std::string& name) {
    return !name.empty() && name[0] == '.';
}

std::string torrent_name_for_path(const std::string& root) {
    std::string name = get_filename_from_path(strip_trailing_separators(root));
    if (name.empty() || name == "." || name == ".." || name == "/") {
        name = get_filename_from_path(absolute_path(root));
    }
    if (name == "/" || name == "\\") {
        return "";
    }
    return name;
}

bool walk_path(const std::string& root, FileStorage& out,
               const WalkOptions& options, TorrentCreateError* error) {
    std::string path = strip_trailing_separators(root);
    out = FileStorage();

    if (path.empty() || !file_exists(path)) {
        LOG_WALKER_ERROR("Content path does not exist: " << root);
        set_error(error, TorrentCreateErrorCode::IoError,
                  "Content path does not exist: " + root, root);
        return false;
    }

    if (is_symlink(path)) {
        LOG_WALKER_ERROR("Content path is a symbolic link: " << root);
        set_error(error, TorrentCreateErrorCode::IoError,
                  "Content path is a symbolic link: " + root, root);
        return false;
    }

    std::string name = torrent_name_for_path(path);
    if (name.empty()) {
        set_error(error, TorrentCreateErrorCode::IoError,
                  "Cannot derive a torrent name from: " + root, root);
        return false;
    }
    out.set_name(name);

    if (is_file(path)) {
        int64_t size = get_file_size(path);
        if (size < 0) {
            set_error(error, TorrentCreateErrorCode::IoError,
                      "Failed to stat file: " + root, root);
            return false;
        }

        out.set_single_file(true);
        out.add_file(std::vector<std::string>{name}, size);
        LOG_WALKER_INFO("Single file " << name << " (" << size << " bytes)");
        return true;
    }

    if (!is_directory(path)) {
        set_error(error, TorrentCreateErrorCode::IoError,
                  "Content path is neither a file nor a directory: " + root, root);
        return false;
    }

    std::vector<WalkedFile> walked;
    if (!walk_directory(path, {}, options, walked, error)) {
        LOG_WALKER_ERROR("Directory walk failed under " << root);
        return false;
    }

    if (walked.empty()) {
        LOG_WALKER_ERROR("No files found under " << root);
        set_error(error, TorrentCreateErrorCode::EmptyInput,
                  "No files found under: " + root, root);
        return false;
    }

    // vector<string> comparison is lexicographic by segment, each segment byte-wise
    std::sort(walked.begin(), walked.end(),
        [](const WalkedFile& a, const WalkedFile& b) { return a.path < b.path; });

    out.set_single_file(false);
    out.reserve(walked.size());
    for (auto& file : walked) {
        out.add_file(std::move(file.path), file.size);
    }

    LOG_WALKER_INFO("Found " << out.num_files() << " files (" << out.total_size()
                    << " bytes) under " << root);
    return true;
}

} // namespace qtm
