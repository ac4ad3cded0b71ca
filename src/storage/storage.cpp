#include "tokenkeys/storage.hpp"

namespace tokenkeys {

Status SecureStorage::ensure_directory(const std::string& path) {
    if (path.empty()) {
        return Status::err(Error(ErrorCode::PERSISTENCE, "empty directory path"));
    }

    // No-op for an existing directory; fails if something else occupies path
    auto created = fs_.create_directories(path);
    if (!created.ok) {
        return Status::err(Error(ErrorCode::PERSISTENCE,
                                 "failed to create directory " + path + ": " + created.error));
    }

    auto hardened = fs_.set_permissions(path, kSecureDirectoryMode);
    if (!hardened.ok) {
        sink_.warn(stage_, Warning::directory_hardening_failed,
                   "could not set restrictive directory permissions, using default permissions",
                   warnings::directory_hardening_failed(path, hardened.error));
    }

    return Status::ok();
}

Status SecureStorage::write_protected(const std::string& path,
                                      const std::string& content,
                                      std::uint32_t mode) {
    auto restricted = fs_.write_file(path, content, mode);
    if (restricted.ok) {
        return Status::ok();
    }

    sink_.warn(stage_, Warning::restricted_write_fallback,
               "could not write file with restricted permissions (" + format_mode(mode) +
                   "), trying with default permissions",
               warnings::restricted_write_fallback(path, format_mode(mode), restricted.error));

    auto fallback = fs_.write_file(path, content, std::nullopt);
    if (!fallback.ok) {
        return Status::err(Error(ErrorCode::PERSISTENCE,
                                 path + ": " + restricted.error +
                                     "; retry with default permissions: " + fallback.error));
    }

    return Status::ok();
}

} // namespace tokenkeys
