#include "fs.h"
#include "logger.h"
#include <cstring>
#include <cstdlib>
#include <random>
#include <sstream>
#include <iomanip>
#include <sys/stat.h>

#ifdef _WIN32
    #include <windows.h>
    #include <direct.h>
    #include <io.h>
    #define stat _stat64
    #define access _access
    #define F_OK 0
#else
    #include <unistd.h>
    #include <dirent.h>
    #include <errno.h>
#endif

// FS module logging macros
#define LOG_FS_DEBUG(message) LOG_DEBUG("fs", message)
#define LOG_FS_WARN(message)  LOG_WARN("fs", message)
#define LOG_FS_ERROR(message) LOG_ERROR("fs", message)

namespace qtm {

bool file_exists(const char* path) {
    if (!path) return false;
    return access(path, F_OK) == 0;
}

bool directory_exists(const char* path) {
    if (!path) return false;

    struct stat st;
    if (stat(path, &st) == 0) {
        return (st.st_mode & S_IFMT) == S_IFDIR;
    }
    return false;
}

bool create_file(const char* path, const char* content) {
    if (!path) return false;
    return create_file_binary(path, content, content ? strlen(content) : 0);
}

bool create_file_binary(const char* path, const void* data, size_t size) {
    if (!path) return false;

    FILE* file = fopen(path, "wb");
    if (!file) {
        LOG_FS_ERROR("Failed to create file: " << path);
        return false;
    }

    if (data && size > 0) {
        size_t written = fwrite(data, 1, size, file);
        if (written != size) {
            fclose(file);
            LOG_FS_ERROR("Failed to write complete data to file: " << path);
            return false;
        }
    }

    return fclose(file) == 0;
}

bool read_file_bytes(const char* path, std::vector<uint8_t>& out) {
    out.clear();
    if (!path) return false;

    FILE* file = fopen(path, "rb");
    if (!file) {
        LOG_FS_DEBUG("Failed to open file for reading: " << path);
        return false;
    }

    uint8_t chunk[64 * 1024];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), file)) > 0) {
        out.insert(out.end(), chunk, chunk + n);
    }

    bool ok = ferror(file) == 0;
    fclose(file);
    if (!ok) {
        LOG_FS_ERROR("Failed to read file: " << path);
        out.clear();
    }
    return ok;
}

// One level only; the parent must exist
static bool make_directory(const char* path) {
    if (!path) return false;

    if (directory_exists(path)) {
        return true;
    }

#ifdef _WIN32
    return _mkdir(path) == 0;
#else
    return mkdir(path, 0755) == 0;
#endif
}

bool create_directories(const char* path) {
    if (!path || !*path) return false;

    if (directory_exists(path)) {
        return true;
    }

    std::string current(path);
    for (size_t i = 1; i < current.size(); i++) {
        if (current[i] == '/' || current[i] == '\\') {
            std::string prefix = current.substr(0, i);
            if (!directory_exists(prefix.c_str()) && !make_directory(prefix.c_str())) {
                return false;
            }
        }
    }

    return make_directory(current.c_str());
}

int64_t get_file_size(const char* path) {
    if (!path) return -1;

    struct stat st;
    if (stat(path, &st) == 0) {
        return static_cast<int64_t>(st.st_size);
    }
    return -1;
}

bool is_file(const char* path) {
    if (!path) return false;

    struct stat st;
    if (stat(path, &st) == 0) {
        return (st.st_mode & S_IFMT) == S_IFREG;
    }
    return false;
}

bool is_directory(const char* path) {
    return directory_exists(path);
}

bool is_symlink(const char* path) {
    if (!path) return false;

#ifdef _WIN32
    DWORD attrs = GetFileAttributesA(path);
    return attrs != INVALID_FILE_ATTRIBUTES && (attrs & FILE_ATTRIBUTE_REPARSE_POINT) != 0;
#else
    struct ::stat st;
    if (lstat(path, &st) == 0) {
        return S_ISLNK(st.st_mode);
    }
    return false;
#endif
}

bool delete_file(const char* path) {
    if (!path) return false;
    return remove(path) == 0;
}

// Fails unless the directory is empty
static bool remove_empty_directory(const char* path) {
    if (!path) return false;

#ifdef _WIN32
    return RemoveDirectoryA(path) != 0;
#else
    return rmdir(path) == 0;
#endif
}

bool delete_directory_recursive(const char* path) {
    if (!path) return false;

    std::vector<DirectoryEntry> entries;
    if (!list_directory(path, entries)) {
        return false;
    }

    bool ok = true;
    for (const auto& entry : entries) {
        if (entry.is_directory && !entry.is_symlink) {
            ok = delete_directory_recursive(entry.path.c_str()) && ok;
        } else {
            ok = delete_file(entry.path.c_str()) && ok;
        }
    }
    return remove_empty_directory(path) && ok;
}

bool rename_file(const char* old_path, const char* new_path) {
    if (!old_path || !new_path) return false;

#ifdef _WIN32
    return MoveFileExA(old_path, new_path, MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH) != 0;
#else
    if (rename(old_path, new_path) != 0) {
        int saved_errno = errno;
        LOG_FS_ERROR("Failed to rename " << old_path << " to " << new_path << ": " << strerror(saved_errno));
        errno = saved_errno;  // Callers report the failure from errno
        return false;
    }
    return true;
#endif
}

bool flush_file_to_disk(FILE* file) {
    if (!file) return false;

    if (fflush(file) != 0) {
        return false;
    }
#ifdef _WIN32
    return _commit(_fileno(file)) == 0;
#else
    return fsync(fileno(file)) == 0;
#endif
}

std::string get_filename_from_path(const char* path) {
    if (!path) return "";

    std::string p(path);
    // Ignore trailing separators so "dir/" yields "dir"
    while (p.size() > 1 && (p.back() == '/' || p.back() == '\\')) {
        p.pop_back();
    }

    size_t pos = p.find_last_of("/\\");
    if (pos == std::string::npos) {
        return p;
    }
    return p.substr(pos + 1);
}

std::string get_parent_directory(const char* path) {
    if (!path) return "";

    std::string p(path);
    while (p.size() > 1 && (p.back() == '/' || p.back() == '\\')) {
        p.pop_back();
    }

    size_t pos = p.find_last_of("/\\");
    if (pos == std::string::npos) {
        return "";
    }
    if (pos == 0) {
        return p.substr(0, 1);
    }
    return p.substr(0, pos);
}

bool list_directory(const char* path, std::vector<DirectoryEntry>& entries) {
    entries.clear();
    if (!path) return false;

#ifdef _WIN32
    std::string pattern = combine_paths(path, "*");
    WIN32_FIND_DATAA data;
    HANDLE handle = FindFirstFileA(pattern.c_str(), &data);
    if (handle == INVALID_HANDLE_VALUE) {
        LOG_FS_WARN("Failed to list directory: " << path);
        return false;
    }

    do {
        std::string name = data.cFileName;
        if (name == "." || name == "..") continue;

        DirectoryEntry entry;
        entry.name = name;
        entry.path = combine_paths(path, name);
        entry.is_directory = (data.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY) != 0;
        entry.is_symlink = (data.dwFileAttributes & FILE_ATTRIBUTE_REPARSE_POINT) != 0;
        entry.is_regular = !entry.is_directory && !entry.is_symlink;
        entry.size = (static_cast<uint64_t>(data.nFileSizeHigh) << 32) | data.nFileSizeLow;
        entries.push_back(std::move(entry));
    } while (FindNextFileA(handle, &data));

    FindClose(handle);
    return true;
#else
    DIR* dir = opendir(path);
    if (!dir) {
        LOG_FS_WARN("Failed to list directory: " << path << ": " << strerror(errno));
        return false;
    }

    bool ok = true;
    for (;;) {
        errno = 0;
        struct dirent* ent = readdir(dir);
        if (!ent) {
            ok = errno == 0;
            break;
        }

        std::string name = ent->d_name;
        if (name == "." || name == "..") continue;

        DirectoryEntry entry;
        entry.name = name;
        entry.path = combine_paths(path, name);
        entry.is_directory = false;
        entry.is_regular = false;
        entry.is_symlink = false;
        entry.size = 0;

        struct ::stat st;
        if (lstat(entry.path.c_str(), &st) == 0) {
            entry.is_symlink = S_ISLNK(st.st_mode);
            entry.is_directory = S_ISDIR(st.st_mode);
            entry.is_regular = S_ISREG(st.st_mode);
            entry.size = entry.is_directory ? 0 : static_cast<uint64_t>(st.st_size);
        }

        entries.push_back(std::move(entry));
    }

    closedir(dir);
    return ok;
#endif
}

std::string combine_paths(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty()) return base;

    char last = base.back();
    if (last == '/' || last == '\\') {
        return base + relative;
    }
    return base + "/" + relative;
}

std::string absolute_path(const std::string& path) {
#ifdef _WIN32
    char buffer[MAX_PATH];
    if (_fullpath(buffer, path.c_str(), MAX_PATH) == nullptr) {
        return "";
    }
    return std::string(buffer);
#else
    char* resolved = realpath(path.c_str(), nullptr);
    if (!resolved) {
        return "";
    }
    std::string result(resolved);
    free(resolved);
    return result;
#endif
}

std::string make_temp_path(const std::string& path) {
    std::random_device rd;
    std::mt19937_64 gen(rd());

    std::ostringstream oss;
    oss << path << "." << std::hex << std::setw(16) << std::setfill('0') << gen() << ".tmp";
    return oss.str();
}

} // namespace qtm
