#include "waypost/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace waypost {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "invalid_configuration") return Warning::invalid_configuration;
    if (lower == "unknown_config_key") return Warning::unknown_config_key;
    if (lower == "trusted_origin_missing") return Warning::trusted_origin_missing;
    if (lower == "trusted_origin_invalid") return Warning::trusted_origin_invalid;
    if (lower == "fallback_unsafe") return Warning::fallback_unsafe;
    if (lower == "log_level_invalid") return Warning::log_level_invalid;

    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

} // namespace waypost
