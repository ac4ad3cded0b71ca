#include "tokenkeys/config.hpp"
#include "tokenkeys/platform.hpp"

#include <algorithm>
#include <iterator>

namespace tokenkeys {

bool is_supported_modulus(int modulus_bits) {
    return std::find(std::begin(kSupportedModulusBits), std::end(kSupportedModulusBits),
                     modulus_bits) != std::end(kSupportedModulusBits);
}

Status validate_config(const ProvisioningConfig& config) {
    if (config.key_directory.empty()) {
        return Status::err(Error(ErrorCode::INVALID_CONFIG, "key directory is empty"));
    }

    if (config.env_file.empty()) {
        return Status::err(Error(ErrorCode::INVALID_CONFIG, "env file name is empty"));
    }

    if (config.file_mode > 0777) {
        return Status::err(Error(ErrorCode::INVALID_CONFIG,
                                 "file mode " + format_mode(config.file_mode) +
                                     " is outside 0000..0777"));
    }

    if (!is_supported_modulus(config.modulus_bits)) {
        return Status::err(Error(ErrorCode::INVALID_CONFIG,
                                 "unsupported modulus length " +
                                     std::to_string(config.modulus_bits) +
                                     " (expected 2048 or 4096)"));
    }

    return Status::ok();
}

std::string key_file_name(KeyType type, bool is_private) {
    switch (type) {
        case KeyType::Access:
            return is_private ? key_files::ACCESS_PRIVATE : key_files::ACCESS_PUBLIC;
        case KeyType::Refresh:
            return is_private ? key_files::REFRESH_PRIVATE : key_files::REFRESH_PUBLIC;
    }
    return {};
}

namespace env_names {

std::string public_key_path(KeyType type) {
    return std::string(key_type_env_prefix(type)) + "_TOKEN_PUBLIC_KEY_PATH";
}

std::string private_key_path(KeyType type) {
    return std::string(key_type_env_prefix(type)) + "_TOKEN_PRIVATE_KEY_PATH";
}

std::string passphrase(KeyType type) {
    return std::string(key_type_env_prefix(type)) + "_TOKEN_PRIVATE_KEY_PASSPHRASE";
}

std::string public_key(KeyType type) {
    return std::string(key_type_env_prefix(type)) + "_TOKEN_PUBLIC_KEY";
}

std::string private_key(KeyType type) {
    return std::string(key_type_env_prefix(type)) + "_TOKEN_PRIVATE_KEY";
}

} // namespace env_names

} // namespace tokenkeys
