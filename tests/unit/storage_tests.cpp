#include <doctest/doctest.h>
#include <tokenkeys/storage.hpp>

#include "../test_support.hpp"

#include <filesystem>

using namespace tokenkeys;
using tokenkeys::testing::FaultyFileSystem;
using tokenkeys::testing::TempTestDir;

TEST_CASE("SecureStorage::ensure_directory") {
    TempTestDir temp_dir;
    EventCollector events;
    SecureStorage storage(default_filesystem(), events);

    SUBCASE("creates nested directories owner-only") {
        std::string dir = temp_dir.file("a/b/keys");

        auto result = storage.ensure_directory(dir);

        REQUIRE(result.isOk());
        CHECK(std::filesystem::is_directory(dir));
#ifndef _WIN32
        CHECK(get_permissions(dir) == std::optional<std::uint32_t>(0700));
#endif
        CHECK_FALSE(events.has_warnings());
    }

    SUBCASE("existing directory is hardened") {
        std::string dir = temp_dir.file("existing");
        std::filesystem::create_directories(dir);
        std::filesystem::permissions(dir, std::filesystem::perms::all);

        REQUIRE(storage.ensure_directory(dir).isOk());
#ifndef _WIN32
        CHECK(get_permissions(dir) == std::optional<std::uint32_t>(0700));
#endif
    }

    SUBCASE("path occupied by a file is an error") {
        std::string path = temp_dir.file("occupied");
        testing::write_text(path, "x");

        auto result = storage.ensure_directory(path);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::PERSISTENCE);
    }

    SUBCASE("empty path is an error") {
        CHECK(storage.ensure_directory("").isErr());
    }
}

TEST_CASE("SecureStorage::ensure_directory degrades when hardening is rejected") {
    TempTestDir temp_dir;
    FaultyFileSystem fs;
    fs.fail_set_permissions = true;
    EventCollector events;
    SecureStorage storage(fs, events);

    std::string dir = temp_dir.file("keys");
    auto result = storage.ensure_directory(dir);

    REQUIRE(result.isOk());
    CHECK(std::filesystem::is_directory(dir));

    auto warnings = events.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].key == "directory_hardening_failed");
    CHECK(warnings[0].action == "warn");
    CHECK(warnings[0].fields.at("path") == dir);
    CHECK(events.events()[0].stage == Stage::ensure_directory);
}

TEST_CASE("SecureStorage::ensure_directory fails when creation fails") {
    TempTestDir temp_dir;
    FaultyFileSystem fs;
    fs.fail_create_directories = true;
    EventCollector events;
    SecureStorage storage(fs, events);

    auto result = storage.ensure_directory(temp_dir.file("never"));
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::PERSISTENCE);
    CHECK(result.error().message().find("simulated mkdir failure") != std::string::npos);
}

TEST_CASE("SecureStorage::write_protected") {
    TempTestDir temp_dir;
    std::string path = temp_dir.file("key.pem");

    SUBCASE("applies the requested mode") {
        EventCollector events;
        SecureStorage storage(default_filesystem(), events);

        REQUIRE(storage.write_protected(path, "secret", 0600).isOk());
        CHECK(testing::read_text(path) == "secret");
#ifndef _WIN32
        CHECK(get_permissions(path) == std::optional<std::uint32_t>(0600));
#endif
        CHECK_FALSE(events.has_warnings());
    }

    SUBCASE("overwrites existing content") {
        EventCollector events;
        SecureStorage storage(default_filesystem(), events);
        testing::write_text(path, "old content that is longer");

        REQUIRE(storage.write_protected(path, "new", 0644).isOk());
        CHECK(testing::read_text(path) == "new");
    }

    SUBCASE("falls back to default permissions once") {
        FaultyFileSystem fs;
        fs.fail_restricted_writes = true;
        EventCollector events;
        SecureStorage storage(fs, events, Stage::write_key_files);

        REQUIRE(storage.write_protected(path, "secret", 0600).isOk());
        CHECK(testing::read_text(path) == "secret");
        CHECK(fs.restricted_write_attempts == 1);
        CHECK(fs.default_write_attempts == 1);

        auto warnings = events.get_warnings();
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].key == "restricted_write_fallback");
        CHECK(warnings[0].fields.at("mode") == "0600");
        CHECK(events.events()[0].stage == Stage::write_key_files);
    }

    SUBCASE("second failure is a persistence error") {
        FaultyFileSystem fs;
        fs.fail_restricted_writes = true;
        fs.fail_default_writes = true;
        EventCollector events;
        SecureStorage storage(fs, events);

        auto result = storage.write_protected(path, "secret", 0600);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::PERSISTENCE);
        CHECK(result.error().message().find("simulated restricted write failure") != std::string::npos);
        CHECK(result.error().message().find("simulated write failure") != std::string::npos);
        CHECK(fs.restricted_write_attempts == 1);
        CHECK(fs.default_write_attempts == 1);
        CHECK_FALSE(std::filesystem::exists(path));
    }
}
