/**
 * tokenkeys CLI - Common utilities and types
 */

#pragma once

#include <tokenkeys/tokenkeys.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace tokenkeys::cli {

// Exit codes
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Portable getenv that avoids MSVC warnings
inline std::string safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name) == 0 && buf != nullptr) {
        std::string result(buf);
        free(buf);
        return result;
    }
    return "";
#else
    const char* val = std::getenv(name);
    return val ? val : "";
#endif
}

/**
 * Options for a provisioning run. Empty strings mean "not given on the
 * command line" and are resolved by resolve_options().
 */
struct GenerateOptions {
    std::string key_dir;            // --keyDir
    std::string env_file;           // --envFile
    std::string permissions = "644"; // --permissions (octal)
    int modulus = 2048;             // --modulus
    std::string log_level = "minimal"; // --log minimal|all
    std::string log_file;           // --log-file
    bool json = false;              // --json
    bool dry_run = false;           // --dry-run
};

/**
 * Resolve a path option.
 * Priority: flag > environment variable > built-in default
 */
inline std::string resolve_option(const std::string& flag_value,
                                  const char* env_name,
                                  const std::string& fallback) {
    if (!flag_value.empty()) {
        return flag_value;
    }

    std::string env_value = safe_getenv(env_name);
    if (!env_value.empty()) {
        return env_value;
    }

    return fallback;
}

struct ResolvedOptions {
    bool ok = false;
    std::string error;
    ProvisioningConfig config;
};

inline ResolvedOptions resolve_options(const GenerateOptions& opts) {
    ResolvedOptions result;

    result.config.key_directory = resolve_option(opts.key_dir, "TOKENKEYS_KEY_DIR", "secure-keys");
    result.config.env_file = resolve_option(opts.env_file, "TOKENKEYS_ENV_FILE", ".env");
    result.config.modulus_bits = opts.modulus;

    auto mode = parse_octal_mode(opts.permissions);
    if (!mode) {
        result.error = "invalid permissions '" + opts.permissions +
                       "': expected an octal mode such as 600 or 644";
        return result;
    }
    result.config.file_mode = *mode;

    result.ok = true;
    return result;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_failure(const Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["code"] = error_code_to_string(error.code());
        if (error.stage()) {
            j["stage"] = stage_to_string(*error.stage());
        }
        j["error"] = error.message();
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << error.toString() << std::endl;
    }
}

// True if hardening or a restricted write fell back to default permissions
inline bool has_permission_warning(const std::vector<WarningObject>& warnings) {
    for (const auto& w : warnings) {
        if (w.key == warning_to_string(Warning::directory_hardening_failed) ||
            w.key == warning_to_string(Warning::restricted_write_fallback)) {
            return true;
        }
    }
    return false;
}

inline nlohmann::json warnings_to_json(const std::vector<WarningObject>& warnings) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& w : warnings) {
        nlohmann::json obj;
        obj["key"] = w.key;
        obj["action"] = w.action;
        obj["fields"] = w.fields;
        arr.push_back(obj);
    }
    return arr;
}

} // namespace tokenkeys::cli
