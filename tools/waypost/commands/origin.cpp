/**
 * waypost CLI - origin command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace waypost::cli::commands {

namespace {

int cmd_origin(const GlobalOptions& opts) {
    Session session;
    if (!open_session(opts, session)) {
        return 1;
    }

    if (session.config.trusted_origin.empty()) {
        print_error("No trusted origin configured (use --origin or " +
                    std::string(ENV_TRUSTED_ORIGIN) + ")", opts.json);
        return 1;
    }

    auto parsed = parse_origin(session.config.trusted_origin);
    if (!parsed.ok) {
        print_error("Invalid trusted origin: " + parsed.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["origin"] = parsed.origin.serialize();
        j["scheme"] = parsed.origin.scheme;
        j["host"] = parsed.origin.host;
        auto port = parsed.origin.port ? parsed.origin.port : default_port_for_scheme(parsed.origin.scheme);
        j["port"] = port ? nlohmann::json(*port) : nlohmann::json(nullptr);
        output_json(j);
    } else {
        std::cout << parsed.origin.serialize() << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_origin(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_origin(opts));
    });
}

} // namespace waypost::cli::commands
