#pragma once

/**
 * @file file_walker.h
 * @brief Enumerates the files that make up a torrent
 *
 * Produces the ordered file list of the virtual concatenated stream. The
 * order is a pure function of the relative paths (segment-wise, byte-wise
 * comparison) so two walks over the same tree always agree, whatever
 * order the OS lists directory entries in.
 *
 * Symbolic links are never followed: links found inside the tree are
 * skipped with a warning and a root that is itself a link is rejected.
 */

#include "file_storage.h"
#include "create_error.h"

#include <string>
#include <functional>

namespace qtm {

/**
 * @brief File filter callback for directory traversal
 *
 * @param path Full path to the file or directory
 * @return true to include the file/traverse the directory, false to skip
 */
using FileFilterCallback = std::function<bool(const std::string& path)>;

struct WalkOptions {
    bool include_hidden = true;     ///< Include names starting with '.'
    FileFilterCallback filter;      ///< Optional extra filter

    WalkOptions() = default;
};

/**
 * @brief Check if a file name is hidden by the dot-file convention
 */
bool is_hidden_name(const std::string& name);

/**
 * @brief Walk a file or directory into a FileStorage
 *
 * On success @p out holds the files in canonical order, its name set to
 * the last component of @p root and its single-file flag set when @p root
 * is a regular file. @p out is not finalized.
 *
 * Errors:
 * - IoError: root missing, a symbolic link, not a file or directory, or
 *   any directory in the tree cannot be listed
 * - EmptyInput: no files survived the walk
 *
 * @return true on success
 */
bool walk_path(const std::string& root, FileStorage& out,
               const WalkOptions& options = WalkOptions(),
               TorrentCreateError* error = nullptr);

/**
 * @brief Torrent name for a root path
 *
 * Uses the last path component, resolving "." and ".." against the
 * filesystem. Returns an empty string if no usable name exists.
 */
std::string torrent_name_for_path(const std::string& root);

} // namespace qtm
