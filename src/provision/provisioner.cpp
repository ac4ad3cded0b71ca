#include "tokenkeys/provisioner.hpp"
#include "tokenkeys/config.hpp"
#include "tokenkeys/keygen.hpp"
#include "tokenkeys/storage.hpp"

#include <utility>

namespace tokenkeys {

KeyFilePaths resolve_key_file_paths(const std::string& key_directory) {
    std::string dir = absolute_path(key_directory);

    KeyFilePaths paths;
    paths.access_public = join_path(dir, key_file_name(KeyType::Access, false));
    paths.access_private = join_path(dir, key_file_name(KeyType::Access, true));
    paths.refresh_public = join_path(dir, key_file_name(KeyType::Refresh, false));
    paths.refresh_private = join_path(dir, key_file_name(KeyType::Refresh, true));
    return paths;
}

EnvironmentRecord build_key_entries(const TokenKeyPairs& keys, const KeyFilePaths& paths) {
    EnvironmentRecord entries;

    auto add = [&entries](KeyType type, const KeyPair& pair,
                          const std::string& public_path, const std::string& private_path) {
        entries.set(env_names::public_key_path(type), public_path);
        entries.set(env_names::private_key_path(type), private_path);
        entries.set(env_names::passphrase(type), pair.passphrase);
        entries.set(env_names::public_key(type), pair.public_key);
        entries.set(env_names::private_key(type), pair.private_key);
    };

    add(KeyType::Access, keys.access, paths.access_public, paths.access_private);
    add(KeyType::Refresh, keys.refresh, paths.refresh_public, paths.refresh_private);
    return entries;
}

// ============================================================================
// Provisioner
// ============================================================================

Provisioner::Provisioner(ProvisioningConfig config, EventSink& sink, FileSystem& fs)
    : config_(std::move(config)), events_(&sink), fs_(fs) {}

template<typename T>
Result<T> Provisioner::fail(Stage stage, Error error) {
    error.withStage(stage);
    events_.emit(Event{stage, Outcome::failed, error.message(),
                       {{"code", error_code_to_string(error.code())}}});
    return Result<T>::err(std::move(error));
}

Result<KeyPair> Provisioner::generate_one(KeyType type, Stage stage) {
    events_.emit(stage, Outcome::started,
                 std::string("generating ") + key_type_to_string(type) + " key pair (" +
                     std::to_string(config_.modulus_bits) + " bits)");

    auto pair = generate_key_pair(type, config_.modulus_bits);
    if (pair.isErr()) {
        return fail<KeyPair>(stage, pair.error());
    }

    events_.emit(stage, Outcome::succeeded,
                 std::string(key_type_to_string(type)) + " key pair generated and validated");
    return pair;
}

Result<TokenKeyPairs> Provisioner::generate_keys() {
    events_.clear();

    auto valid = validate_config(config_);
    if (valid.isErr()) {
        return fail<TokenKeyPairs>(Stage::validate_config, valid.error());
    }

    auto access = generate_one(KeyType::Access, Stage::generate_access);
    if (access.isErr()) {
        return Result<TokenKeyPairs>::err(access.error());
    }

    auto refresh = generate_one(KeyType::Refresh, Stage::generate_refresh);
    if (refresh.isErr()) {
        return Result<TokenKeyPairs>::err(refresh.error());
    }

    TokenKeyPairs keys;
    keys.access = std::move(access.value());
    keys.refresh = std::move(refresh.value());
    return Result<TokenKeyPairs>::ok(std::move(keys));
}

Result<ProvisioningReport> Provisioner::persist(const TokenKeyPairs& keys) {
    events_.clear();

    auto valid = validate_config(config_);
    if (valid.isErr()) {
        return fail<ProvisioningReport>(Stage::validate_config, valid.error());
    }

    ProvisioningReport report;
    report.key_directory = absolute_path(config_.key_directory);
    report.env_file = config_.env_file;
    report.files = resolve_key_file_paths(config_.key_directory);

    SecureStorage storage(fs_, events_);

    // Directory
    events_.emit(Stage::ensure_directory, Outcome::started, report.key_directory);
    auto dir = storage.ensure_directory(report.key_directory);
    if (dir.isErr()) {
        return fail<ProvisioningReport>(Stage::ensure_directory, dir.error());
    }
    events_.emit(Stage::ensure_directory, Outcome::succeeded, report.key_directory);

    // Key files
    events_.emit(Stage::write_key_files, Outcome::started, report.key_directory);
    storage.set_stage(Stage::write_key_files);

    const std::pair<const std::string*, const std::string*> files[] = {
        {&report.files.access_public, &keys.access.public_key},
        {&report.files.access_private, &keys.access.private_key},
        {&report.files.refresh_public, &keys.refresh.public_key},
        {&report.files.refresh_private, &keys.refresh.private_key},
    };
    for (const auto& [path, content] : files) {
        auto written = storage.write_protected(*path, *content, config_.file_mode);
        if (written.isErr()) {
            return fail<ProvisioningReport>(Stage::write_key_files, written.error());
        }
    }
    events_.emit(Stage::write_key_files, Outcome::succeeded, "4 key files written");

    // Environment
    events_.emit(Stage::load_environment, Outcome::started, config_.env_file);
    EnvironmentRecord existing = load_env_file(config_.env_file, fs_, events_);
    events_.emit(Stage::load_environment, Outcome::succeeded,
                 std::to_string(existing.size()) + " existing entries");

    events_.emit(Stage::merge_environment, Outcome::started);
    EnvironmentRecord updates = build_key_entries(keys, report.files);
    EnvironmentRecord merged = merge_env(existing, updates);
    for (const auto& entry : existing) {
        if (!updates.contains(entry.first)) {
            ++report.preserved_entries;
        }
    }
    events_.emit(Stage::merge_environment, Outcome::succeeded,
                 std::to_string(report.preserved_entries) + " existing entries preserved");

    events_.emit(Stage::write_environment, Outcome::started, config_.env_file);
    storage.set_stage(Stage::write_environment);
    auto env_written = storage.write_protected(config_.env_file, serialize_env(merged),
                                               config_.file_mode);
    if (env_written.isErr()) {
        return fail<ProvisioningReport>(Stage::write_environment, env_written.error());
    }
    events_.emit(Stage::write_environment, Outcome::succeeded, config_.env_file);

    report.warnings = events_.get_warnings();
    return Result<ProvisioningReport>::ok(std::move(report));
}

Result<ProvisioningReport> Provisioner::provision() {
    auto keys = generate_keys();
    if (keys.isErr()) {
        return Result<ProvisioningReport>::err(keys.error());
    }
    return persist(keys.value());
}

} // namespace tokenkeys
