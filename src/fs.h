#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstdio>

namespace qtm {

// File/Directory existence check
bool file_exists(const char* path);
bool directory_exists(const char* path);

// File creation and writing
bool create_file(const char* path, const char* content);
bool create_file_binary(const char* path, const void* data, size_t size);

// File reading
bool read_file_bytes(const char* path, std::vector<uint8_t>& out);

// Directory operations
bool create_directories(const char* path); // Create parent directories if needed

// File information
int64_t get_file_size(const char* path);
bool is_file(const char* path);
bool is_directory(const char* path);
bool is_symlink(const char* path);       // Does not follow the link

// File operations
bool delete_file(const char* path);
bool delete_directory_recursive(const char* path);
bool rename_file(const char* old_path, const char* new_path); // Replaces an existing target

// Flush stdio buffers and ask the OS to commit the file to disk
bool flush_file_to_disk(FILE* file);

// Path helpers
std::string get_filename_from_path(const char* path);
std::string get_parent_directory(const char* path);

// Directory listing
struct DirectoryEntry {
    std::string name;
    std::string path;
    bool is_directory;
    bool is_regular;
    bool is_symlink;
    uint64_t size;
};

/**
 * List the immediate children of a directory, excluding "." and "..".
 * Entries are returned in the order the OS reports them. Symbolic links
 * are reported with is_symlink set and are not followed.
 * @return false if the directory cannot be opened
 */
bool list_directory(const char* path, std::vector<DirectoryEntry>& entries);

// Path utilities
std::string combine_paths(const std::string& base, const std::string& relative);

/**
 * Resolve a path to an absolute, canonical form
 * @return empty string if the path cannot be resolved
 */
std::string absolute_path(const std::string& path);

/**
 * Build a unique sibling path for staging a write: "<path>.<random>.tmp"
 */
std::string make_temp_path(const std::string& path);

// C++ convenience wrappers
inline bool file_exists(const std::string& path) { return file_exists(path.c_str()); }
inline bool directory_exists(const std::string& path) { return directory_exists(path.c_str()); }
inline bool is_file(const std::string& path) { return is_file(path.c_str()); }
inline bool is_directory(const std::string& path) { return is_directory(path.c_str()); }
inline bool is_symlink(const std::string& path) { return is_symlink(path.c_str()); }
inline int64_t get_file_size(const std::string& path) { return get_file_size(path.c_str()); }
inline bool create_file(const std::string& path, const std::string& content) {
    return create_file_binary(path.c_str(), content.data(), content.size());
}
inline bool create_directories(const std::string& path) { return create_directories(path.c_str()); }
inline bool delete_file(const std::string& path) { return delete_file(path.c_str()); }
inline bool delete_directory_recursive(const std::string& path) { return delete_directory_recursive(path.c_str()); }
inline bool read_file_bytes(const std::string& path, std::vector<uint8_t>& out) {
    return read_file_bytes(path.c_str(), out);
}
inline std::string read_file_text_cpp(const std::string& path) {
    std::vector<uint8_t> bytes;
    if (!read_file_bytes(path.c_str(), bytes)) return "";
    return std::string(bytes.begin(), bytes.end());
}
inline std::string get_filename_from_path(const std::string& path) { return get_filename_from_path(path.c_str()); }
inline std::string get_parent_directory(const std::string& path) { return get_parent_directory(path.c_str()); }
inline bool rename_file(const std::string& old_path, const std::string& new_path) {
    return rename_file(old_path.c_str(), new_path.c_str());
}
inline bool list_directory(const std::string& path, std::vector<DirectoryEntry>& entries) {
    return list_directory(path.c_str(), entries);
}

} // namespace qtm
