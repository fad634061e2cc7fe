/**
 * waypost CLI - resolve command
 *
 * Resolve one or more candidates, one target per line.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <optional>

namespace waypost::cli::commands {

namespace {

struct ResolveOptions {
    std::vector<std::string> candidates;
    std::string fallback;
    bool from_stdin = false;
};

int cmd_resolve(const GlobalOptions& opts, const ResolveOptions& resolve_opts) {
    Session session;
    if (!open_session(opts, session)) {
        return 1;
    }

    std::string fallback = resolve_opts.fallback.empty()
        ? session.config.default_fallback
        : resolve_opts.fallback;
    if (!is_safe_relative_target(fallback)) {
        print_error("Fallback must be a path starting with a single '/': " + fallback, opts.json);
        return 1;
    }

    RedirectResolver resolver(fixed_origin(session.config.trusted_origin));

    std::vector<std::optional<std::string>> inputs(resolve_opts.candidates.begin(),
                                                   resolve_opts.candidates.end());
    if (resolve_opts.from_stdin) {
        std::string line;
        while (std::getline(std::cin, line)) {
            inputs.emplace_back(line);
        }
    }
    // No candidate at all resolves like an absent one
    if (inputs.empty()) {
        inputs.emplace_back(std::nullopt);
    }

    nlohmann::json results = nlohmann::json::array();
    for (const auto& input : inputs) {
        auto outcome = evaluate_audited(resolver, input, fallback, *session.logger);

        if (opts.json) {
            nlohmann::json entry;
            entry["candidate"] = input ? nlohmann::json(*input) : nlohmann::json(nullptr);
            entry["target"] = outcome.target;
            entry["fallback_used"] = outcome.used_fallback;
            results.push_back(entry);
        } else {
            std::cout << outcome.target << std::endl;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["fallback"] = fallback;
        j["results"] = results;
        j["warnings"] = warnings_to_json(session.diagnostics);
        output_json(j);
    }

    return 0;
}

} // anonymous namespace

void setup_resolve(CLI::App* app, GlobalOptions& opts) {
    static ResolveOptions resolve_opts;

    app->add_option("candidates", resolve_opts.candidates, "Destinations to resolve");
    app->add_option("-f,--fallback", resolve_opts.fallback,
                    "Fallback path (default: configured default_fallback)");
    app->add_flag("--stdin", resolve_opts.from_stdin, "Also read one candidate per line from stdin");

    app->callback([&opts]() {
        std::exit(cmd_resolve(opts, resolve_opts));
    });
}

} // namespace waypost::cli::commands
