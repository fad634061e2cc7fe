/**
 * waypost CLI - callback command
 *
 * Print the absolute return URL to register with an identity provider.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace waypost::cli::commands {

namespace {

struct CallbackOptions {
    std::string path;
    bool reset_password = false;
};

int cmd_callback(const GlobalOptions& opts, const CallbackOptions& callback_opts) {
    Session session;
    if (!open_session(opts, session)) {
        return 1;
    }

    std::string path = callback_opts.path;
    if (path.empty()) {
        path = callback_opts.reset_password ? RESET_PASSWORD_CONFIRM_PATH : CALLBACK_PATH;
    }

    RedirectResolver resolver(fixed_origin(session.config.trusted_origin));
    if (!resolver.trusted_origin()) {
        print_error("No valid trusted origin configured", opts.json);
        return 1;
    }

    auto url = resolver.absolute_url(path);
    if (!url) {
        print_error("Not a safe callback path: " + escape_for_log(path), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["path"] = path;
        j["url"] = *url;
        output_json(j);
    } else {
        std::cout << *url << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_callback(CLI::App* app, GlobalOptions& opts) {
    static CallbackOptions callback_opts;

    app->add_option("path", callback_opts.path, "Path on the trusted origin (default: /auth/callback)");
    app->add_flag("--reset-password", callback_opts.reset_password,
                  "Use the password-reset confirmation path");

    app->callback([&opts]() {
        std::exit(cmd_callback(opts, callback_opts));
    });
}

} // namespace waypost::cli::commands
