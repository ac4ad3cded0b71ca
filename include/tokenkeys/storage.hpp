#pragma once

#include "tokenkeys/events.hpp"
#include "tokenkeys/platform.hpp"
#include "tokenkeys/types.hpp"

#include <cstdint>
#include <string>

namespace tokenkeys {

// Mode applied to the key directory when hardening it
constexpr std::uint32_t kSecureDirectoryMode = 0700;

/**
 * Persists key material with permission hardening.
 *
 * Directory hardening is best effort: a rejected chmod is reported as a
 * directory_hardening_failed warning and the directory is used as is.
 * File content is mandatory: a write that fails with the requested mode is
 * retried once with default permissions, and only a second failure is an
 * error.
 */
class SecureStorage {
public:
    SecureStorage(FileSystem& fs, EventSink& sink, Stage stage = Stage::ensure_directory)
        : fs_(fs), sink_(sink), stage_(stage) {}

    // Create path (and parents) if missing, then restrict it to the owner
    Status ensure_directory(const std::string& path);

    // Write content with mode, falling back to default permissions once
    Status write_protected(const std::string& path,
                           const std::string& content,
                           std::uint32_t mode);

    // Stage reported on emitted warnings
    void set_stage(Stage stage) { stage_ = stage; }

private:
    FileSystem& fs_;
    EventSink& sink_;
    Stage stage_;
};

} // namespace tokenkeys
