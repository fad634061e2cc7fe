#pragma once

#include "waypost/types.hpp"
#include "waypost/warnings.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace waypost {

constexpr const char* CONFIG_SCHEMA = "waypost.config.v1";

// Environment variables consulted by apply_environment()
constexpr const char* ENV_CONFIG = "WAYPOST_CONFIG";
constexpr const char* ENV_TRUSTED_ORIGIN = "WAYPOST_TRUSTED_ORIGIN";
constexpr const char* ENV_DEFAULT_FALLBACK = "WAYPOST_DEFAULT_FALLBACK";
constexpr const char* ENV_LOG_LEVEL = "WAYPOST_LOG_LEVEL";

// ============================================================================
// Resolver Configuration
// ============================================================================

struct ResolverConfig {
    std::string schema;            // MUST be "waypost.config.v1"
    std::string trusted_origin;    // e.g. "https://app.example.com"
    std::string default_fallback;  // safe relative path
    std::string log_level;         // spdlog level name

    // "warnings" section - maps diagnostic key to action
    std::unordered_map<std::string, WarningAction> warnings;

    // Source path for diagnostics
    std::string source_path;
};

// Built-in configuration: no trusted origin, "/dashboard", "warn"
ResolverConfig get_builtin_default_config();

// ============================================================================
// Parsing
// ============================================================================

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    ResolverConfig config;
    std::vector<std::string> warnings;  // "key:detail"
};

// Parse a configuration document. Keys absent from the document keep their
// built-in defaults.
ConfigParseResult parse_config(const std::string& json_str,
                               const std::string& source_path = "");

// Read and parse a configuration file
ConfigParseResult load_config_file(const std::string& path);

// Feed "key:detail" parse warnings into a collector
void report_parse_warnings(const ConfigParseResult& result, WarningCollector& collector);

// ============================================================================
// Environment Overrides
// ============================================================================

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Apply WAYPOST_TRUSTED_ORIGIN, WAYPOST_DEFAULT_FALLBACK and WAYPOST_LOG_LEVEL.
// Unset or empty variables leave the config untouched.
void apply_environment(ResolverConfig& config, const EnvLookup& lookup);

// ============================================================================
// Validation
// ============================================================================

// Check the effective configuration and normalize it in place:
// - trusted_origin is rewritten to its serialized form when valid
// - an unsafe default_fallback is replaced by "/dashboard"
// - an unknown log_level is replaced by "warn"
// Each problem is emitted to `collector` under the config's warning policy.
void validate_config(ResolverConfig& config, WarningCollector& collector);

} // namespace waypost
