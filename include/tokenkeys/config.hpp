#pragma once

#include "tokenkeys/types.hpp"

#include <string>

namespace tokenkeys {

// ============================================================================
// Provisioning Configuration
// ============================================================================

constexpr int kSupportedModulusBits[] = {2048, 4096};

bool is_supported_modulus(int modulus_bits);

/**
 * Check a config before any side effect. The core does not fill in
 * defaults; a config missing a value is rejected with INVALID_CONFIG.
 *
 * - key_directory and env_file must be non-empty
 * - file_mode must be within 0..0777
 * - modulus_bits must be one of kSupportedModulusBits
 */
Status validate_config(const ProvisioningConfig& config);

// Names of the four PEM files inside the key directory
namespace key_files {
constexpr const char* ACCESS_PUBLIC = "access-public.pem";
constexpr const char* ACCESS_PRIVATE = "access-private.pem";
constexpr const char* REFRESH_PUBLIC = "refresh-public.pem";
constexpr const char* REFRESH_PRIVATE = "refresh-private.pem";
} // namespace key_files

// "access-public.pem" / "refresh-private.pem" etc.
std::string key_file_name(KeyType type, bool is_private);

// Environment variable names owned by this tool, e.g.
// ACCESS_TOKEN_PUBLIC_KEY_PATH, REFRESH_TOKEN_PRIVATE_KEY_PASSPHRASE
namespace env_names {
std::string public_key_path(KeyType type);
std::string private_key_path(KeyType type);
std::string passphrase(KeyType type);
std::string public_key(KeyType type);
std::string private_key(KeyType type);
} // namespace env_names

} // namespace tokenkeys
