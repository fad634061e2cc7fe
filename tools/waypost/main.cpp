/**
 * waypost CLI - Entry Point
 *
 * Check redirect targets against a trusted origin from the command line.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace waypost::cli::commands {
    void setup_resolve(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_origin(CLI::App* app, GlobalOptions& opts);
    void setup_callback(CLI::App* app, GlobalOptions& opts);
    void setup_config(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace waypost::cli;

    CLI::App app{"waypost - redirect target resolver"};
    app.set_version_flag("-V,--version", WAYPOST_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("-c,--config", opts.config_path, "Configuration file")
        ->envname(waypost::ENV_CONFIG);
    app.add_option("--origin", opts.origin, "Trusted origin, e.g. https://app.example.com");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Log every decision");
    app.add_flag("-q,--quiet", opts.quiet, "Only log errors");

    // Commands
    auto* resolve_cmd = app.add_subcommand("resolve", "Resolve candidates to safe targets");
    commands::setup_resolve(resolve_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Exit 0 if a candidate is accepted as-is");
    commands::setup_check(check_cmd, opts);

    auto* origin_cmd = app.add_subcommand("origin", "Print the effective trusted origin");
    commands::setup_origin(origin_cmd, opts);

    auto* callback_cmd = app.add_subcommand("callback", "Print an absolute auth callback URL");
    commands::setup_callback(callback_cmd, opts);

    auto* config_cmd = app.add_subcommand("config", "Validate and show the effective configuration");
    commands::setup_config(config_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
