#include "tokenkeys/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace tokenkeys {

namespace fs = std::filesystem;

namespace {

#ifndef _WIN32
// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}
#endif

// Generate a temporary filename next to the target
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

// Follow a symlinked target so the rename replaces the file it points at,
// not the link itself
std::string resolve_write_target(const std::string& path) {
    std::error_code ec;
    if (!fs::is_symlink(path, ec)) {
        return path;
    }

    fs::path resolved = fs::weakly_canonical(path, ec);
    if (ec) {
        return path;
    }
    return resolved.string();
}

// Permission bits of an existing regular file at path
std::optional<std::uint32_t> existing_file_mode(const std::string& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::is_regular_file(status)) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(status.permissions() & fs::perms::mask) & 0777u;
}

} // namespace

// ============================================================================
// PosixFileSystem
// ============================================================================

IoResult PosixFileSystem::create_directories(const std::string& path) {
    IoResult result;

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        result.error = ec.message();
        return result;
    }
    if (!fs::is_directory(path, ec)) {
        result.error = "path exists and is not a directory";
        return result;
    }

#ifndef _WIN32
    std::string parent = get_parent_directory(path);
    if (!parent.empty()) {
        fsync_directory(parent);
    }
#endif

    result.ok = true;
    return result;
}

IoResult PosixFileSystem::set_permissions(const std::string& path, std::uint32_t mode) {
    IoResult result;

    std::error_code ec;
    fs::permissions(path, static_cast<fs::perms>(mode & 0777), fs::perm_options::replace, ec);
    if (ec) {
        result.error = ec.message();
        return result;
    }

    result.ok = true;
    return result;
}

IoResult PosixFileSystem::write_file(const std::string& path,
                                     const std::string& content,
                                     std::optional<std::uint32_t> mode) {
    IoResult result;

    std::string target = resolve_write_target(path);
    std::string temp_path = make_temp_filename(target);

    // An existing file keeps its bits unless the requested mode is stricter
    std::optional<std::uint32_t> existing = existing_file_mode(target);
    std::optional<std::uint32_t> final_mode = mode;
    if (existing) {
        final_mode = mode ? (*mode & *existing) : *existing;
    }

#ifdef _WIN32
    std::ofstream temp_file(temp_path, std::ios::binary);
    if (!temp_file) {
        result.error = "failed to create temp file";
        return result;
    }

    temp_file.write(content.data(), static_cast<std::streamsize>(content.size()));
    temp_file.flush();
    if (!temp_file) {
        temp_file.close();
        DeleteFileA(temp_path.c_str());
        result.error = "failed to write content";
        return result;
    }
    temp_file.close();

    if (mode) {
        std::error_code ec;
        fs::permissions(temp_path, static_cast<fs::perms>(*final_mode & 0777),
                        fs::perm_options::replace, ec);
        if (ec) {
            DeleteFileA(temp_path.c_str());
            result.error = "failed to apply mode " + format_mode(*final_mode) + ": " +
                           ec.message();
            return result;
        }
    }

    if (!MoveFileExA(temp_path.c_str(), target.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to rename temp file";
        return result;
    }

    result.ok = true;
#else
    // temp + fchmod + fsync(file) + rename + fsync(dir)
    std::string dir_path = get_parent_directory(target);

    // Restricted writes start owner-only so the content is never exposed
    // under a wider mode, even briefly. Unrestricted writes over an existing
    // file create with its bits (narrowed further by umask, never widened).
    mode_t create_mode = mode ? 0600 : static_cast<mode_t>(final_mode.value_or(0666));
    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL, create_mode);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    size_t offset = 0;
    while (offset < content.size()) {
        ssize_t written = write(fd, content.data() + offset, content.size() - offset);
        if (written < 0) {
            if (errno == EINTR) continue;
            result.error = "failed to write content: " + std::string(strerror(errno));
            close(fd);
            unlink(temp_path.c_str());
            return result;
        }
        offset += static_cast<size_t>(written);
    }

    if (mode && fchmod(fd, static_cast<mode_t>(*final_mode & 0777)) != 0) {
        result.error = "failed to apply mode " + format_mode(*final_mode) + ": " +
                       std::string(strerror(errno));
        close(fd);
        unlink(temp_path.c_str());
        return result;
    }

    if (!fsync_fd(fd)) {
        result.error = "failed to fsync temp file: " + std::string(strerror(errno));
        close(fd);
        unlink(temp_path.c_str());
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), target.c_str()) != 0) {
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        unlink(temp_path.c_str());
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
#endif

    return result;
}

ReadResult PosixFileSystem::read_file(const std::string& path) {
    ReadResult result;

    std::error_code ec;
    auto status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        result.not_found = true;
        result.error = "file not found";
        return result;
    }
    if (fs::is_directory(status)) {
        result.error = "path is a directory";
        return result;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + std::string(strerror(errno));
        return result;
    }

    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        result.error = "failed to read file";
        return result;
    }

    result.content = ss.str();
    result.ok = true;
    return result;
}

FileSystem& default_filesystem() {
    static PosixFileSystem instance;
    return instance;
}

// ============================================================================
// Path Utilities
// ============================================================================

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return p.string();
}

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) {
        return path;
    }
    return abs.lexically_normal().string();
}

std::optional<std::uint32_t> get_permissions(const std::string& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || status.type() == fs::file_type::not_found) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(status.permissions() & fs::perms::mask) & 0777u;
}

std::string format_mode(std::uint32_t mode) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%04o", static_cast<unsigned>(mode & 07777));
    return buf;
}

std::optional<std::uint32_t> parse_octal_mode(const std::string& text) {
    if (text.empty() || text.size() > 4) {
        return std::nullopt;
    }

    std::uint32_t mode = 0;
    for (char c : text) {
        if (c < '0' || c > '7') {
            return std::nullopt;
        }
        mode = mode * 8 + static_cast<std::uint32_t>(c - '0');
    }

    if (mode > 0777) {
        return std::nullopt;
    }
    return mode;
}

} // namespace tokenkeys
