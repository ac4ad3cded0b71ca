#pragma once

/**
 * @file provisioner.hpp
 * @brief Entry point for provisioning access/refresh token key pairs
 *
 * @example
 * ```cpp
 * #include <tokenkeys/provisioner.hpp>
 *
 * tokenkeys::ProvisioningConfig config;
 * config.key_directory = "secure-keys";
 * config.env_file = ".env";
 * config.file_mode = 0600;
 * config.modulus_bits = 2048;
 *
 * tokenkeys::EventCollector events;
 * tokenkeys::Provisioner provisioner(config, events);
 * auto result = provisioner.provision();
 * if (result.isErr()) {
 *     std::cerr << result.error().toString() << "\n";
 * }
 * ```
 */

#include "tokenkeys/env_file.hpp"
#include "tokenkeys/events.hpp"
#include "tokenkeys/platform.hpp"
#include "tokenkeys/types.hpp"

#include <string>
#include <vector>

namespace tokenkeys {

// Absolute locations of the four PEM files
struct KeyFilePaths {
    std::string access_public;
    std::string access_private;
    std::string refresh_public;
    std::string refresh_private;
};

struct ProvisioningReport {
    std::string key_directory;  // absolute
    std::string env_file;
    KeyFilePaths files;
    size_t preserved_entries = 0;  // pre-existing env entries kept untouched
    std::vector<WarningObject> warnings;
};

// Resolve the PEM file locations for a key directory
KeyFilePaths resolve_key_file_paths(const std::string& key_directory);

// The ten environment entries this tool owns, in a fixed order
EnvironmentRecord build_key_entries(const TokenKeyPairs& keys, const KeyFilePaths& paths);

/**
 * Drives a provisioning run.
 *
 * Stages run strictly in order and each is gated on the previous one:
 * generate access -> generate refresh -> ensure directory -> write PEM files
 * -> load env -> merge -> write env. The env file is written last, so a
 * failure in any earlier stage leaves it untouched. Files already written
 * are not rolled back.
 *
 * Two runs against the same env file must not overlap; nothing here locks.
 */
class Provisioner {
public:
    Provisioner(ProvisioningConfig config,
                EventSink& sink,
                FileSystem& fs = default_filesystem());

    // Generate and validate both pairs without touching the filesystem
    Result<TokenKeyPairs> generate_keys();

    // Write the PEM files and merge the key entries into the env file
    Result<ProvisioningReport> persist(const TokenKeyPairs& keys);

    // generate_keys() followed by persist()
    Result<ProvisioningReport> provision();

    const ProvisioningConfig& config() const { return config_; }

private:
    Result<KeyPair> generate_one(KeyType type, Stage stage);

    template<typename T>
    Result<T> fail(Stage stage, Error error);

    ProvisioningConfig config_;
    EventCollector events_;
    FileSystem& fs_;
};

} // namespace tokenkeys
