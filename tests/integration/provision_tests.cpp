#include <doctest/doctest.h>
#include <tokenkeys/config.hpp>
#include <tokenkeys/env_file.hpp>
#include <tokenkeys/keygen.hpp>
#include <tokenkeys/provisioner.hpp>

#include "../test_support.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using namespace tokenkeys;
using tokenkeys::testing::FaultyFileSystem;
using tokenkeys::testing::TempTestDir;

namespace {

ProvisioningConfig make_config(const TempTestDir& dir, std::uint32_t mode = 0600) {
    ProvisioningConfig config;
    config.key_directory = dir.file("secure-keys");
    config.env_file = dir.file(".env");
    config.file_mode = mode;
    config.modulus_bits = 2048;
    return config;
}

const char* kKeyFiles[] = {
    "access-public.pem", "access-private.pem", "refresh-public.pem", "refresh-private.pem",
};

const char* kOwnedKeys[] = {
    "ACCESS_TOKEN_PUBLIC_KEY_PATH",  "ACCESS_TOKEN_PRIVATE_KEY_PATH",
    "ACCESS_TOKEN_PRIVATE_KEY_PASSPHRASE", "ACCESS_TOKEN_PUBLIC_KEY",
    "ACCESS_TOKEN_PRIVATE_KEY",      "REFRESH_TOKEN_PUBLIC_KEY_PATH",
    "REFRESH_TOKEN_PRIVATE_KEY_PATH", "REFRESH_TOKEN_PRIVATE_KEY_PASSPHRASE",
    "REFRESH_TOKEN_PUBLIC_KEY",      "REFRESH_TOKEN_PRIVATE_KEY",
};

} // namespace

TEST_CASE("provision writes keys and merges into an existing env file") {
    TempTestDir temp_dir;
    auto config = make_config(temp_dir);
    testing::write_text(config.env_file, "FOO=\"bar\"\n");

    EventCollector events;
    Provisioner provisioner(config, events);
    auto result = provisioner.provision();
    REQUIRE(result.isOk());

    const auto& report = result.value();
    CHECK(report.preserved_entries == 1);
    CHECK(report.warnings.empty());
    CHECK(fs::path(report.key_directory).is_absolute());

    // Key files
    for (const char* name : kKeyFiles) {
        std::string path = temp_dir.file(std::string("secure-keys/") + name);
        REQUIRE(fs::exists(path));
        std::string content = testing::read_text(path);
        bool is_private = std::string(name).find("private") != std::string::npos;
        CHECK(is_pem_block(content, is_private ? kEncryptedPrivateKeyPemLabel : kPublicKeyPemLabel));
#ifndef _WIN32
        CHECK(get_permissions(path) == std::optional<std::uint32_t>(0600));
#endif
    }
#ifndef _WIN32
    CHECK(get_permissions(config.key_directory) == std::optional<std::uint32_t>(0700));
#endif

    // Env file
    std::string env_content = testing::read_text(config.env_file);
    CHECK(env_content.find("FOO=\"bar\"") != std::string::npos);

    auto env = parse_env(env_content);
    CHECK(env.size() == 11);
    CHECK(env.get("FOO") == std::optional<std::string>("bar"));
    for (const char* key : kOwnedKeys) {
        CHECK_MESSAGE(env.contains(key), key);
    }

    // Env values match the files on disk and form valid pairs
    CHECK(env.get("ACCESS_TOKEN_PUBLIC_KEY_PATH") ==
          std::optional<std::string>(report.files.access_public));
    CHECK(env.get("REFRESH_TOKEN_PRIVATE_KEY") ==
          std::optional<std::string>(testing::read_text(report.files.refresh_private)));

    KeyPair access{*env.get("ACCESS_TOKEN_PUBLIC_KEY"), *env.get("ACCESS_TOKEN_PRIVATE_KEY"),
                   *env.get("ACCESS_TOKEN_PRIVATE_KEY_PASSPHRASE")};
    KeyPair refresh{*env.get("REFRESH_TOKEN_PUBLIC_KEY"), *env.get("REFRESH_TOKEN_PRIVATE_KEY"),
                    *env.get("REFRESH_TOKEN_PRIVATE_KEY_PASSPHRASE")};
    CHECK(validate_key_pair(access).isOk());
    CHECK(validate_key_pair(refresh).isOk());
    CHECK(access.passphrase != refresh.passphrase);
    CHECK(access.public_key != refresh.public_key);

    // Stage order
    CHECK(events.count(Stage::generate_access, Outcome::succeeded) == 1);
    CHECK(events.count(Stage::generate_refresh, Outcome::succeeded) == 1);
    CHECK(events.count(Stage::write_environment, Outcome::succeeded) == 1);
    CHECK(events.events().back().stage == Stage::write_environment);
    CHECK_FALSE(events.has_failures());
}

TEST_CASE("provision creates the env file when none exists") {
    TempTestDir temp_dir;
    auto config = make_config(temp_dir);

    Provisioner provisioner(config, null_event_sink());
    auto result = provisioner.provision();
    REQUIRE(result.isOk());
    CHECK(result.value().preserved_entries == 0);

    auto env = parse_env(testing::read_text(config.env_file));
    CHECK(env.size() == 10);
}

TEST_CASE("provision twice replaces owned keys and keeps the rest") {
    TempTestDir temp_dir;
    auto config = make_config(temp_dir);
    testing::write_text(config.env_file, "# app settings\nPORT=8080\nACCESS_TOKEN_PUBLIC_KEY=\"stale\"\n");

    Provisioner provisioner(config, null_event_sink());
    REQUIRE(provisioner.provision().isOk());
    auto first = parse_env(testing::read_text(config.env_file));

    REQUIRE(provisioner.provision().isOk());
    auto second = parse_env(testing::read_text(config.env_file));

    CHECK(second.size() == 11);
    CHECK(second.get("PORT") == std::optional<std::string>("8080"));
    CHECK(second.get("ACCESS_TOKEN_PUBLIC_KEY") != std::optional<std::string>("stale"));
    CHECK(first.get("ACCESS_TOKEN_PRIVATE_KEY_PASSPHRASE") !=
          second.get("ACCESS_TOKEN_PRIVATE_KEY_PASSPHRASE"));
}

#ifndef _WIN32
TEST_CASE("provision merges through a symlinked env file") {
    TempTestDir temp_dir;
    auto config = make_config(temp_dir);
    fs::create_directories(temp_dir.file("shared"));
    std::string shared_env = temp_dir.file("shared/app.env");
    testing::write_text(shared_env, "FOO=\"bar\"\n");
    fs::create_symlink(shared_env, config.env_file);

    Provisioner provisioner(config, null_event_sink());
    auto result = provisioner.provision();
    REQUIRE(result.isOk());
    CHECK(result.value().preserved_entries == 1);

    CHECK(fs::is_symlink(config.env_file));
    auto env = parse_env(testing::read_text(shared_env));
    CHECK(env.size() == 11);
    CHECK(env.get("FOO") == std::optional<std::string>("bar"));
    CHECK(env.contains("ACCESS_TOKEN_PRIVATE_KEY"));
}

TEST_CASE("provision keeps a hardened env file owner-only") {
    TempTestDir temp_dir;
    auto config = make_config(temp_dir, 0644);
    testing::write_text(config.env_file, "FOO=\"bar\"\n");
    fs::permissions(config.env_file, static_cast<fs::perms>(0600), fs::perm_options::replace);

    Provisioner provisioner(config, null_event_sink());
    REQUIRE(provisioner.provision().isOk());

    CHECK(get_permissions(config.env_file) == std::optional<std::uint32_t>(0600));
    CHECK(get_permissions(temp_dir.file("secure-keys/access-public.pem")) ==
          std::optional<std::uint32_t>(0644));
}
#endif

TEST_CASE("provision completes when directory hardening is rejected") {
    TempTestDir temp_dir;
    auto config = make_config(temp_dir);

    FaultyFileSystem faulty;
    faulty.fail_set_permissions = true;
    EventCollector events;
    Provisioner provisioner(config, events, faulty);

    auto result = provisioner.provision();
    REQUIRE(result.isOk());

    for (const char* name : kKeyFiles) {
        CHECK(fs::exists(temp_dir.file(std::string("secure-keys/") + name)));
    }

    const auto& warnings = result.value().warnings;
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].key == "directory_hardening_failed");
    CHECK(events.count(Stage::ensure_directory, Outcome::degraded) == 1);
}

TEST_CASE("provision falls back to default permissions for every file") {
    TempTestDir temp_dir;
    auto config = make_config(temp_dir);

    FaultyFileSystem faulty;
    faulty.fail_restricted_writes = true;
    Provisioner provisioner(config, null_event_sink(), faulty);

    auto result = provisioner.provision();
    REQUIRE(result.isOk());

    // four key files plus the env file
    CHECK(faulty.restricted_write_attempts == 5);
    CHECK(faulty.default_write_attempts == 5);
    CHECK(result.value().warnings.size() == 5);
    CHECK(parse_env(testing::read_text(config.env_file)).size() == 10);
}

TEST_CASE("provision fails with PERSISTENCE and leaves the env file alone") {
    TempTestDir temp_dir;
    auto config = make_config(temp_dir);
    const std::string original_env = "FOO=\"bar\"\n";
    testing::write_text(config.env_file, original_env);

    FaultyFileSystem faulty;
    faulty.fail_restricted_writes = true;
    faulty.fail_default_writes = true;
    EventCollector events;
    Provisioner provisioner(config, events, faulty);

    auto result = provisioner.provision();
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::PERSISTENCE);
    CHECK(result.error().stage() == std::optional<Stage>(Stage::write_key_files));
    CHECK(result.error().toString().find("write_key_files") == 0);

    CHECK(testing::read_text(config.env_file) == original_env);

    // aborted on the first file
    CHECK(faulty.restricted_write_attempts == 1);
    CHECK(faulty.default_write_attempts == 1);
    CHECK(events.count(Stage::write_key_files, Outcome::failed) == 1);
    CHECK(events.count(Stage::load_environment, Outcome::started) == 0);
}

TEST_CASE("provision aborts when the key directory cannot be created") {
    TempTestDir temp_dir;
    auto config = make_config(temp_dir);
    testing::write_text(config.env_file, "FOO=bar\n");

    FaultyFileSystem faulty;
    faulty.fail_create_directories = true;
    Provisioner provisioner(config, null_event_sink(), faulty);

    auto result = provisioner.provision();
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::PERSISTENCE);
    CHECK(result.error().stage() == std::optional<Stage>(Stage::ensure_directory));
    CHECK(testing::read_text(config.env_file) == "FOO=bar\n");
    CHECK(faulty.restricted_write_attempts == 0);
}

TEST_CASE("provision treats an unreadable env file as empty") {
    TempTestDir temp_dir;
    auto config = make_config(temp_dir);
    testing::write_text(config.env_file, "FOO=bar\n");

    FaultyFileSystem faulty;
    faulty.fail_reads = true;
    Provisioner provisioner(config, null_event_sink(), faulty);

    auto result = provisioner.provision();
    REQUIRE(result.isOk());
    REQUIRE(result.value().warnings.size() == 1);
    CHECK(result.value().warnings[0].key == "environment_load_failed");

    auto env = parse_env(testing::read_text(config.env_file));
    CHECK(env.size() == 10);
    CHECK_FALSE(env.contains("FOO"));
}

TEST_CASE("provision rejects an invalid config before touching the filesystem") {
    TempTestDir temp_dir;
    auto config = make_config(temp_dir);
    config.modulus_bits = 1024;

    EventCollector events;
    Provisioner provisioner(config, events);
    auto result = provisioner.provision();

    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::INVALID_CONFIG);
    CHECK(result.error().stage() == std::optional<Stage>(Stage::validate_config));
    CHECK_FALSE(fs::exists(config.key_directory));
    CHECK_FALSE(fs::exists(config.env_file));
    CHECK(events.count(Stage::generate_access, Outcome::started) == 0);
}

TEST_CASE("generate_keys has no side effects") {
    TempTestDir temp_dir;
    auto config = make_config(temp_dir);

    Provisioner provisioner(config, null_event_sink());
    auto keys = provisioner.generate_keys();
    REQUIRE(keys.isOk());

    CHECK(validate_key_pair(keys.value().access).isOk());
    CHECK(validate_key_pair(keys.value().refresh).isOk());
    CHECK(keys.value().access.passphrase != keys.value().refresh.passphrase);
    CHECK_FALSE(fs::exists(config.key_directory));
    CHECK_FALSE(fs::exists(config.env_file));

    // persist is a separate explicit step
    auto report = provisioner.persist(keys.value());
    REQUIRE(report.isOk());
    CHECK(testing::read_text(report.value().files.access_public) == keys.value().access.public_key);
}

TEST_CASE("build_key_entries produces the ten owned entries") {
    TokenKeyPairs keys;
    keys.access = {"apub", "apriv", "apass"};
    keys.refresh = {"rpub", "rpriv", "rpass"};
    auto paths = resolve_key_file_paths("/srv/keys");

    auto entries = build_key_entries(keys, paths);

    REQUIRE(entries.size() == 10);
    CHECK(entries.entries()[0].first == "ACCESS_TOKEN_PUBLIC_KEY_PATH");
    CHECK(entries.get("ACCESS_TOKEN_PUBLIC_KEY_PATH") == std::optional<std::string>(paths.access_public));
    CHECK(entries.get("ACCESS_TOKEN_PRIVATE_KEY_PASSPHRASE") == std::optional<std::string>("apass"));
    CHECK(entries.get("REFRESH_TOKEN_PRIVATE_KEY") == std::optional<std::string>("rpriv"));
    CHECK(paths.refresh_private == fs::path("/srv/keys/refresh-private.pem").lexically_normal().string());
}
