#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tokenkeys {

// ============================================================================
// Key Material
// ============================================================================

enum class KeyType {
    Access,
    Refresh,
};

// Lowercase name used in file names and messages ("access", "refresh")
inline const char* key_type_to_string(KeyType t) {
    switch (t) {
        case KeyType::Access: return "access";
        case KeyType::Refresh: return "refresh";
    }
    return "unknown";
}

// Uppercase prefix used for environment variable names ("ACCESS", "REFRESH")
inline const char* key_type_env_prefix(KeyType t) {
    switch (t) {
        case KeyType::Access: return "ACCESS";
        case KeyType::Refresh: return "REFRESH";
    }
    return "UNKNOWN";
}

// A validated RSA key pair. The encrypted private key and its passphrase
// always travel together.
struct KeyPair {
    std::string public_key;   // SPKI PEM
    std::string private_key;  // Encrypted PKCS#8 PEM
    std::string passphrase;
};

struct TokenKeyPairs {
    KeyPair access;
    KeyPair refresh;
};

// ============================================================================
// Configuration
// ============================================================================

struct ProvisioningConfig {
    std::string key_directory;
    std::string env_file;
    std::uint32_t file_mode = 0;
    int modulus_bits = 0;
};

// ============================================================================
// Stages
// ============================================================================

enum class Stage {
    validate_config,
    generate_access,
    generate_refresh,
    ensure_directory,
    write_key_files,
    load_environment,
    merge_environment,
    write_environment,
};

inline const char* stage_to_string(Stage s) {
    switch (s) {
        case Stage::validate_config: return "validate_config";
        case Stage::generate_access: return "generate_access";
        case Stage::generate_refresh: return "generate_refresh";
        case Stage::ensure_directory: return "ensure_directory";
        case Stage::write_key_files: return "write_key_files";
        case Stage::load_environment: return "load_environment";
        case Stage::merge_environment: return "merge_environment";
        case Stage::write_environment: return "write_environment";
    }
    return "unknown";
}

// ============================================================================
// Warnings
// ============================================================================

// Non-fatal conditions. A run that emits any of these still completes.
enum class Warning {
    directory_hardening_failed,  ///< chmod 0700 on the key directory was rejected
    restricted_write_fallback,   ///< Write with the requested mode failed, retried with defaults
    environment_load_failed,     ///< Existing env file unreadable, treated as empty
};

inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::directory_hardening_failed: return "directory_hardening_failed";
        case Warning::restricted_write_fallback: return "restricted_write_fallback";
        case Warning::environment_load_failed: return "environment_load_failed";
    }
    return "unknown";
}

struct WarningObject {
    std::string key;
    std::string action;  // always "warn"; warnings never abort a run
    std::unordered_map<std::string, std::string> fields;

    bool operator==(const WarningObject& other) const {
        return key == other.key && action == other.action && fields == other.fields;
    }
};

// ============================================================================
// Error Handling
// ============================================================================

enum class ErrorCode {
    INVALID_CONFIG,
    KEY_GENERATION,
    KEY_VALIDATION,
    PERSISTENCE,
};

inline const char* error_code_to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::INVALID_CONFIG: return "INVALID_CONFIG";
        case ErrorCode::KEY_GENERATION: return "KEY_GENERATION";
        case ErrorCode::KEY_VALIDATION: return "KEY_VALIDATION";
        case ErrorCode::PERSISTENCE: return "PERSISTENCE";
    }
    return "UNKNOWN";
}

/**
 * @brief Fatal error with code, failing stage and message
 *
 * The stage is filled in by whoever knows it; leaf operations leave it at
 * the default and the provisioner stamps it with withStage().
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    Error& withStage(Stage stage) {
        stage_ = stage;
        return *this;
    }

    ErrorCode code() const { return code_; }
    std::optional<Stage> stage() const { return stage_; }
    const std::string& message() const { return message_; }

    std::string toString() const {
        if (stage_) {
            return std::string(stage_to_string(*stage_)) + ": " + message_;
        }
        return message_;
    }

private:
    ErrorCode code_;
    std::optional<Stage> stage_;
    std::string message_;
};

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

using Status = Result<void>;

} // namespace tokenkeys
