/**
 * waypost CLI - check command
 *
 * Exit status tells whether a candidate would be followed.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace waypost::cli::commands {

namespace {

struct CheckOptions {
    std::string candidate;
};

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    Session session;
    if (!open_session(opts, session)) {
        return 1;
    }

    RedirectResolver resolver(fixed_origin(session.config.trusted_origin));
    auto outcome = evaluate_audited(resolver, check_opts.candidate,
                                    session.config.default_fallback, *session.logger);
    bool accepted = !outcome.used_fallback;

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["candidate"] = check_opts.candidate;
        j["accepted"] = accepted;
        j["target"] = outcome.target;
        output_json(j);
    } else if (!opts.quiet) {
        if (accepted) {
            std::cout << "accepted: " << outcome.target << std::endl;
        } else {
            std::cout << "rejected" << std::endl;
        }
    }

    return accepted ? 0 : 1;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("candidate", check_opts.candidate, "Destination to check")->required();

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace waypost::cli::commands
