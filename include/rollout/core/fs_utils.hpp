#ifndef ROLLOUT_FS_UTILS_HPP
#define ROLLOUT_FS_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cerrno>
#include <fstream>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <dirent.h>

namespace rollout {
namespace detail {

    inline std::string joinPath(const std::string& dir, const std::string& name) {
        if (dir.empty()) return name;
        if (dir[dir.size() - 1] == '/') return dir + name;
        return dir + "/" + name;
    }

    inline bool pathExists(const std::string& path) {
        struct stat st;
        return stat(path.c_str(), &st) == 0;
    }

    inline bool isDirectory(const std::string& path) {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) return false;
        return S_ISDIR(st.st_mode);
    }

    inline std::uint64_t getFileSize(const std::string& path) {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) return 0;
        return static_cast<std::uint64_t>(st.st_size);
    }

    /// Creates @p path and any missing parents. Returns false with errno set
    /// on failure; an existing directory is success.
    inline bool mkdirRecursive(const std::string& path) {
        if (path.empty()) return true;
        struct stat st;
        if (stat(path.c_str(), &st) == 0) {
            if (S_ISDIR(st.st_mode)) return true;
            errno = ENOTDIR;
            return false;
        }

        size_t slashPos = path.find_last_of('/');
        if (slashPos != std::string::npos && slashPos > 0) {
            if (!mkdirRecursive(path.substr(0, slashPos))) return false;
        }
        return mkdir(path.c_str(), 0755) == 0 || errno == EEXIST;
    }

    /// Lists entry names in @p dirPath, skipping "." and "..".
    /// Returns false with errno set if the directory cannot be read.
    inline bool listDirectory(const std::string& dirPath, std::vector<std::string>& entries) {
        DIR* dir = opendir(dirPath.c_str());
        if (!dir) return false;
        struct dirent* ent;
        while ((ent = readdir(dir)) != nullptr) {
            std::string name = ent->d_name;
            if (name != "." && name != "..") {
                entries.push_back(name);
            }
        }
        closedir(dir);
        return true;
    }

    /// Reads the final byte of a non-empty file.
    inline bool readLastByte(const std::string& path, char& out) {
        std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
        if (!in.is_open()) return false;
        in.seekg(-1, std::ios::end);
        if (!in) return false;
        in.get(out);
        return static_cast<bool>(in);
    }

} // namespace detail
} // namespace rollout

#endif // ROLLOUT_FS_UTILS_HPP
