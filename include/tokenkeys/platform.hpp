#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tokenkeys {

// ============================================================================
// Filesystem Operations
// ============================================================================

struct IoResult {
    bool ok = false;
    std::string error;
};

struct ReadResult {
    bool ok = false;
    bool not_found = false;
    std::string error;
    std::string content;
};

/**
 * Filesystem primitives used by secure storage and the env file loader.
 *
 * PosixFileSystem is the real implementation; tests substitute their own to
 * simulate hosts that reject permission changes or writes.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    // Create a directory and any missing parents. Succeeds if it already exists.
    virtual IoResult create_directories(const std::string& path) = 0;

    // Replace the permission bits of an existing path
    virtual IoResult set_permissions(const std::string& path, std::uint32_t mode) = 0;

    // Write content atomically. A new file gets exactly the given mode, or
    // the process defaults (umask) without one. An existing file is never
    // widened: its bits are kept, narrowed to the given mode if stricter.
    // A symlinked path is written through to the file it points at.
    virtual IoResult write_file(const std::string& path,
                                const std::string& content,
                                std::optional<std::uint32_t> mode) = 0;

    virtual ReadResult read_file(const std::string& path) = 0;
};

class PosixFileSystem : public FileSystem {
public:
    IoResult create_directories(const std::string& path) override;
    IoResult set_permissions(const std::string& path, std::uint32_t mode) override;
    IoResult write_file(const std::string& path,
                        const std::string& content,
                        std::optional<std::uint32_t> mode) override;
    ReadResult read_file(const std::string& path) override;
};

// Shared PosixFileSystem instance
FileSystem& default_filesystem();

// ============================================================================
// Path Utilities
// ============================================================================

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Resolve against the current working directory, lexically normalized
std::string absolute_path(const std::string& path);

// Permission bits of an existing path, or nullopt if it cannot be stat'ed
std::optional<std::uint32_t> get_permissions(const std::string& path);

// Format permission bits as zero-padded octal ("0644")
std::string format_mode(std::uint32_t mode);

// Parse an octal permission string ("600", "0644"). Rejects anything above 0777.
std::optional<std::uint32_t> parse_octal_mode(const std::string& text);

} // namespace tokenkeys
