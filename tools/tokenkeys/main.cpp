/**
 * tokenkeys CLI - Entry Point
 *
 * Generate RSA token key pairs for access and refresh tokens.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

namespace tokenkeys::cli::commands {
    void setup_generate(CLI::App& app, GenerateOptions& opts);
    int cmd_generate(const GenerateOptions& opts);
}

int main(int argc, char** argv) {
    using namespace tokenkeys::cli;

    CLI::App app{"tokenkeys - Generate RSA token key pairs for access and refresh tokens"};
    app.set_version_flag("-V,--version", TOKENKEYS_VERSION);

    GenerateOptions opts;
    commands::setup_generate(app, opts);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? kExitOk : kExitUsage;
    }

    return commands::cmd_generate(opts);
}
