/**
 * shipyard CLI - Entry Point
 *
 * Publishes binaries and bundles to the artifact registry.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace shipyard::cli::commands {
    void setup_binaries(CLI::App* app, GlobalOptions& opts);
    void setup_bundles(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace shipyard::cli;

    CLI::App app{"shipyard - binary and bundle publishing"};
    app.set_version_flag("-V,--version", SHIPYARD_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--api-key", opts.api_key, "Registry API key")->envname("SHIPYARD_API_KEY");
    app.add_option("--base-url", opts.base_url, "Registry base URL");
    app.add_option("--ca-path", opts.ca_path, "CA bundle for TLS verification")
        ->check(CLI::ExistingFile);
    app.add_option("--api-version", opts.api_version, "Registry API version (1 or 2)")
        ->check(CLI::Range(1, 2));
    app.add_option("--profile", opts.profile, "Profile from the config file");
    app.add_option("--config-dir", opts.config_dir, "Configuration directory");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* binaries_cmd = app.add_subcommand("binaries", "Manage binaries");
    commands::setup_binaries(binaries_cmd, opts);

    auto* bundles_cmd = app.add_subcommand("bundles", "Build, push and pull bundles");
    commands::setup_bundles(bundles_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
