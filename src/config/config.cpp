#include "waypost/config.hpp"
#include "waypost/origin.hpp"
#include "waypost/platform.hpp"
#include "waypost/redirect.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

namespace waypost {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Reads a string member, recording a warning when it has the wrong type
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key,
                                      std::vector<std::string>& warnings) {
    if (!j.contains(key)) {
        return std::nullopt;
    }
    if (!j[key].is_string()) {
        warnings.push_back("invalid_configuration:" + key + " must be a string");
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

bool is_known_key(const std::string& key) {
    return key == "$schema" || key == "trusted_origin" || key == "default_fallback" ||
           key == "log_level" || key == "warnings";
}

bool is_valid_log_level(const std::string& name) {
    return spdlog::level::from_str(name) != spdlog::level::off || name == "off";
}

} // namespace

ResolverConfig get_builtin_default_config() {
    ResolverConfig config;
    config.schema = CONFIG_SCHEMA;
    config.default_fallback = DEFAULT_FALLBACK;
    config.log_level = "warn";
    return config;
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config = get_builtin_default_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (j.contains("$schema") && j["$schema"].is_string()) {
            result.config.schema = trim(j["$schema"].get<std::string>());
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != CONFIG_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
            return result;
        }

        if (auto origin = get_string(j, "trusted_origin", result.warnings)) {
            result.config.trusted_origin = trim(*origin);
        }

        if (auto fallback = get_string(j, "default_fallback", result.warnings)) {
            result.config.default_fallback = trim(*fallback);
        }

        if (auto level = get_string(j, "log_level", result.warnings)) {
            result.config.log_level = to_lower(trim(*level));
        }

        // "warnings" section
        if (j.contains("warnings")) {
            if (j["warnings"].is_object()) {
                for (auto& [key, val] : j["warnings"].items()) {
                    std::string key_str = to_lower(key);
                    auto action = val.is_string()
                        ? parse_warning_action(val.get<std::string>())
                        : std::nullopt;
                    if (action) {
                        result.config.warnings[key_str] = *action;
                    } else {
                        result.warnings.push_back("invalid_configuration:invalid warning action for " + key_str);
                    }
                }
            } else {
                result.warnings.push_back("invalid_configuration:warnings must be an object");
            }
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!is_known_key(it.key())) {
                result.warnings.push_back("unknown_config_key:" + it.key());
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ConfigParseResult load_config_file(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        ConfigParseResult result;
        result.config = get_builtin_default_config();
        result.config.source_path = path;
        result.error = "config file not found: " + path;
        return result;
    }
    return parse_config(*content, path);
}

void report_parse_warnings(const ConfigParseResult& result, WarningCollector& collector) {
    for (const auto& w : result.warnings) {
        auto colon = w.find(':');
        std::string key = w.substr(0, colon);
        std::string detail = colon == std::string::npos ? "" : w.substr(colon + 1);

        if (key == "unknown_config_key") {
            collector.emit(Warning::unknown_config_key,
                           warnings::unknown_config_key(detail, result.config.source_path));
        } else {
            collector.emit(Warning::invalid_configuration,
                           warnings::invalid_configuration(detail, result.config.source_path));
        }
    }
}

void apply_environment(ResolverConfig& config, const EnvLookup& lookup) {
    if (!lookup) {
        return;
    }
    if (auto origin = lookup(ENV_TRUSTED_ORIGIN); origin && !trim(*origin).empty()) {
        config.trusted_origin = trim(*origin);
    }
    if (auto fallback = lookup(ENV_DEFAULT_FALLBACK); fallback && !trim(*fallback).empty()) {
        config.default_fallback = trim(*fallback);
    }
    if (auto level = lookup(ENV_LOG_LEVEL); level && !trim(*level).empty()) {
        config.log_level = to_lower(trim(*level));
    }
}

void validate_config(ResolverConfig& config, WarningCollector& collector) {
    collector.set_policy(config.warnings);

    if (config.trusted_origin.empty()) {
        collector.emit(Warning::trusted_origin_missing);
    } else {
        auto parsed = parse_origin(config.trusted_origin);
        if (parsed.ok) {
            config.trusted_origin = parsed.origin.serialize();
        } else {
            collector.emit(Warning::trusted_origin_invalid,
                           warnings::trusted_origin_invalid(config.trusted_origin, parsed.error));
        }
    }

    // The resolver trusts its fallback, so the configured one is checked here
    if (!is_safe_relative_target(config.default_fallback)) {
        collector.emit(Warning::fallback_unsafe,
                       warnings::fallback_unsafe(config.default_fallback, DEFAULT_FALLBACK));
        config.default_fallback = DEFAULT_FALLBACK;
    }

    if (!is_valid_log_level(config.log_level)) {
        collector.emit(Warning::log_level_invalid, warnings::log_level_invalid(config.log_level));
        config.log_level = "warn";
    }
}

} // namespace waypost
