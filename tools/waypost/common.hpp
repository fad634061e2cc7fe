/**
 * waypost CLI - Common utilities and types
 */

#pragma once

#include <waypost/waypost.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace waypost::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config_path;       // --config, WAYPOST_CONFIG
    std::string origin;            // --origin
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Effective configuration plus its diagnostics and the CLI logger.
 */
struct Session {
    ResolverConfig config;
    WarningCollector diagnostics;
    std::shared_ptr<spdlog::logger> logger;
};

struct SessionResult {
    bool ok = false;
    std::string error;
    Session session;
};

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline std::string format_warning(const WarningObject& w) {
    std::vector<std::pair<std::string, std::string>> fields(w.fields.begin(), w.fields.end());
    std::sort(fields.begin(), fields.end());

    std::string out = w.key;
    for (size_t i = 0; i < fields.size(); ++i) {
        out += (i == 0 ? " (" : ", ");
        out += fields[i].first + "=" + fields[i].second;
    }
    if (!fields.empty()) {
        out += ")";
    }
    return out;
}

inline nlohmann::json warnings_to_json(const WarningCollector& collector) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& w : collector.get_warnings()) {
        nlohmann::json entry;
        entry["key"] = w.key;
        entry["action"] = w.action;
        entry["fields"] = w.fields;
        arr.push_back(entry);
    }
    return arr;
}

/**
 * Text mode: log collected diagnostics on stderr.
 * JSON mode: they are attached to the command's output instead.
 */
inline void report_diagnostics(const Session& session, const GlobalOptions& opts) {
    if (opts.json) {
        return;
    }
    for (const auto& w : session.diagnostics.get_warnings()) {
        if (w.action == "error") {
            session.logger->error("{}", format_warning(w));
        } else {
            session.logger->warn("{}", format_warning(w));
        }
    }
}

/**
 * Logger on stderr. Level priority: --quiet > --verbose > log_level.
 */
inline std::shared_ptr<spdlog::logger> configure_logger(const GlobalOptions& opts,
                                                        const ResolverConfig& config) {
    auto logger = spdlog::get("waypost");
    if (!logger) {
        logger = spdlog::stderr_color_mt("waypost");
    }
    logger->set_pattern("%^%l%$: %v");

    if (opts.quiet) {
        logger->set_level(spdlog::level::err);
    } else if (opts.verbose) {
        logger->set_level(spdlog::level::debug);
    } else {
        logger->set_level(spdlog::level::from_str(config.log_level));
    }
    return logger;
}

/**
 * Build the effective configuration.
 * Priority: --origin flag > WAYPOST_* environment > config file > built-in.
 */
inline SessionResult load_session(const GlobalOptions& opts) {
    SessionResult result;
    auto& session = result.session;
    session.config = get_builtin_default_config();

    if (!opts.config_path.empty()) {
        auto parsed = load_config_file(opts.config_path);
        if (!parsed.ok) {
            result.error = parsed.error;
            return result;
        }
        session.config = parsed.config;
        session.diagnostics.set_policy(session.config.warnings);
        report_parse_warnings(parsed, session.diagnostics);
    }

    apply_environment(session.config, get_env);

    if (!opts.origin.empty()) {
        session.config.trusted_origin = opts.origin;
    }

    validate_config(session.config, session.diagnostics);
    session.logger = configure_logger(opts, session.config);

    result.ok = true;
    return result;
}

/**
 * Load the session and stop on configuration errors.
 * Returns false after printing the error; `out` is filled on success.
 */
inline bool open_session(const GlobalOptions& opts, Session& out) {
    auto loaded = load_session(opts);
    if (!loaded.ok) {
        print_error(loaded.error, opts.json);
        return false;
    }

    out = std::move(loaded.session);
    report_diagnostics(out, opts);

    if (out.diagnostics.has_errors()) {
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = false;
            j["error"] = "configuration has errors";
            j["warnings"] = warnings_to_json(out.diagnostics);
            output_json(j);
        } else {
            print_error("configuration has errors", false);
        }
        return false;
    }
    return true;
}

} // namespace waypost::cli
