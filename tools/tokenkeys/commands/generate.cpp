/**
 * tokenkeys CLI - generate
 *
 * Generate access/refresh key pairs, write them under the key directory and
 * merge them into the env file.
 */

#include "../common.hpp"
#include "../event_log.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

namespace tokenkeys::cli::commands {

namespace {

void print_security_notes(const ProvisioningConfig& config, const ProvisioningReport& report) {
    std::cout << "\nSecurity Notes:\n";
    std::cout << "1. Key files have been generated in '" << report.key_directory << "'\n";
    std::cout << "2. Both file paths and actual keys are stored in '" << report.env_file << "'\n";
    std::cout << "3. Access and Refresh token key pairs have been generated.\n";
    std::cout << "4. Ensure your .gitignore includes:\n";
    std::cout << "   - " << config.env_file << "\n";
    std::cout << "   - " << config.key_directory << "/\n";
    std::cout << "5. Consider moving keys to a secure key management service for production.\n";
    std::cout << "6. Backup these keys securely and never commit them to version control.\n";
    std::cout << "7. " << report.preserved_entries
              << " previous environment variable(s) have been preserved.\n";

    if (has_permission_warning(report.warnings)) {
        std::cout << "\nNote: permission warnings were reported. Consider restricting file "
                     "permissions manually: chmod 600 "
                  << report.key_directory << "/*.pem\n";
    }
}

int run_dry(const GenerateOptions& opts, Provisioner& provisioner) {
    auto keys = provisioner.generate_keys();
    if (keys.isErr()) {
        print_failure(keys.error(), opts.json);
        return kExitFailure;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["dry_run"] = true;
        j["modulus"] = provisioner.config().modulus_bits;
        j["access_public_key"] = keys.value().access.public_key;
        j["refresh_public_key"] = keys.value().refresh.public_key;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cout << "Dry run: key pairs generated and validated, nothing written.\n\n";
        std::cout << "Access public key:\n" << keys.value().access.public_key << "\n";
        std::cout << "Refresh public key:\n" << keys.value().refresh.public_key;
    }
    return kExitOk;
}

} // anonymous namespace

int cmd_generate(const GenerateOptions& opts) {
    if (!configure_logging(opts.log_level)) {
        print_error("invalid log level '" + opts.log_level + "': expected minimal or all",
                    opts.json);
        return kExitUsage;
    }

    auto resolved = resolve_options(opts);
    if (!resolved.ok) {
        print_error(resolved.error, opts.json);
        return kExitUsage;
    }

    auto valid = validate_config(resolved.config);
    if (valid.isErr()) {
        print_error(valid.error().message(), opts.json);
        return kExitUsage;
    }

    SpdlogEventSink sink(opts.log_file);
    Provisioner provisioner(resolved.config, sink);

    int code = kExitOk;
    if (opts.dry_run) {
        code = run_dry(opts, provisioner);
    } else {
        auto result = provisioner.provision();
        if (result.isErr()) {
            spdlog::error("Error during key generation: {}", result.error().toString());
            print_failure(result.error(), opts.json);
            code = kExitFailure;
        } else {
            const auto& report = result.value();
            spdlog::info("Keys have been generated and stored successfully");

            if (opts.json) {
                nlohmann::json j;
                j["ok"] = true;
                j["key_directory"] = report.key_directory;
                j["env_file"] = report.env_file;
                j["files"] = {report.files.access_public, report.files.access_private,
                              report.files.refresh_public, report.files.refresh_private};
                j["preserved_entries"] = report.preserved_entries;
                j["warnings"] = warnings_to_json(report.warnings);
                std::cout << j.dump(2) << std::endl;
            } else {
                std::cout << "Keys have been generated and stored successfully\n";
                print_security_notes(resolved.config, report);
            }
        }
    }

    auto log_written = sink.write_log_file(default_filesystem());
    if (!log_written.ok) {
        spdlog::warn("could not write log file {}: {}", opts.log_file, log_written.error);
    }

    return code;
}

void setup_generate(CLI::App& app, GenerateOptions& opts) {
    app.add_option("--keyDir", opts.key_dir,
                   "Directory where keys will be stored (default: secure-keys, env TOKENKEYS_KEY_DIR)");
    app.add_option("--envFile", opts.env_file,
                   "Environment file to update (default: .env, env TOKENKEYS_ENV_FILE)");
    app.add_option("--permissions", opts.permissions, "File permissions in octal (e.g. 600)")
        ->capture_default_str();
    app.add_option("--modulus", opts.modulus, "RSA modulus length (2048 or 4096)")
        ->capture_default_str();
    app.add_option("--log", opts.log_level,
                   "Logging level (minimal, or 'all' for verbose)")
        ->capture_default_str();
    app.add_option("--log-file", opts.log_file, "Also write events as JSON to this file");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("--dry-run", opts.dry_run, "Generate and validate keys without writing files");
}

} // namespace tokenkeys::cli::commands
