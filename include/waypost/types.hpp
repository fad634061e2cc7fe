#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace waypost {

// ============================================================================
// Configuration Diagnostics
// ============================================================================

enum class Warning {
    invalid_configuration,
    unknown_config_key,
    trusted_origin_missing,
    trusted_origin_invalid,
    fallback_unsafe,
    log_level_invalid,
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::invalid_configuration: return "invalid_configuration";
        case Warning::unknown_config_key: return "unknown_config_key";
        case Warning::trusted_origin_missing: return "trusted_origin_missing";
        case Warning::trusted_origin_invalid: return "trusted_origin_invalid";
        case Warning::fallback_unsafe: return "fallback_unsafe";
        case Warning::log_level_invalid: return "log_level_invalid";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

// ============================================================================
// Warning Action (config "warnings" section)
// ============================================================================

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

// ============================================================================
// Warning Object
// ============================================================================

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

} // namespace waypost
