/**
 * waypost CLI - config command
 *
 * Show the effective configuration and every diagnostic, including errors.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace waypost::cli::commands {

namespace {

int cmd_config(const GlobalOptions& opts) {
    auto loaded = load_session(opts);
    if (!loaded.ok) {
        print_error(loaded.error, opts.json);
        return 1;
    }
    const auto& session = loaded.session;
    const auto& config = session.config;
    bool has_errors = session.diagnostics.has_errors();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = !has_errors;
        j["config"]["$schema"] = config.schema;
        j["config"]["trusted_origin"] = config.trusted_origin;
        j["config"]["default_fallback"] = config.default_fallback;
        j["config"]["log_level"] = config.log_level;
        j["config"]["source"] = config.source_path.empty() ? "builtin" : config.source_path;
        j["warnings"] = warnings_to_json(session.diagnostics);
        output_json(j);
    } else {
        std::cout << "Source: " << (config.source_path.empty() ? "builtin" : config.source_path) << std::endl;
        std::cout << "Trusted origin: "
                  << (config.trusted_origin.empty() ? "(none)" : config.trusted_origin) << std::endl;
        std::cout << "Default fallback: " << config.default_fallback << std::endl;
        std::cout << "Log level: " << config.log_level << std::endl;

        auto diagnostics = session.diagnostics.get_warnings();
        if (!diagnostics.empty()) {
            std::cout << "Diagnostics:" << std::endl;
            for (const auto& w : diagnostics) {
                std::cout << "  [" << w.action << "] " << format_warning(w) << std::endl;
            }
        }
    }

    return has_errors ? 1 : 0;
}

} // anonymous namespace

void setup_config(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_config(opts));
    });
}

} // namespace waypost::cli::commands
