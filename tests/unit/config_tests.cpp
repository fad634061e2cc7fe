#include <doctest/doctest.h>
#include <waypost/config.hpp>

#include <algorithm>
#include <unordered_map>

using namespace waypost;

namespace {

bool has_warning(const std::vector<std::string>& warnings, const std::string& entry) {
    return std::find(warnings.begin(), warnings.end(), entry) != warnings.end();
}

EnvLookup env_from(std::unordered_map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

TEST_CASE("builtin config defaults") {
    auto config = get_builtin_default_config();
    CHECK(config.schema == "waypost.config.v1");
    CHECK(config.trusted_origin.empty());
    CHECK(config.default_fallback == "/dashboard");
    CHECK(config.log_level == "warn");
    CHECK(config.warnings.empty());
}

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("config parses every section") {
    const char* json = R"({
        "$schema": "waypost.config.v1",
        "trusted_origin": "https://app.example.com",
        "default_fallback": "/home",
        "log_level": "DEBUG",
        "warnings": {
            "Fallback_Unsafe": "error",
            "unknown_config_key": "ignore"
        }
    })";
    auto result = parse_config(json, "waypost.json");
    REQUIRE(result.ok);
    CHECK(result.warnings.empty());
    CHECK(result.config.trusted_origin == "https://app.example.com");
    CHECK(result.config.default_fallback == "/home");
    CHECK(result.config.log_level == "debug");
    CHECK(result.config.source_path == "waypost.json");
    REQUIRE(result.config.warnings.size() == 2);
    CHECK(result.config.warnings.at("fallback_unsafe") == WarningAction::Error);
    CHECK(result.config.warnings.at("unknown_config_key") == WarningAction::Ignore);
}

TEST_CASE("config keeps defaults for absent keys") {
    auto result = parse_config(R"({"$schema": "waypost.config.v1"})");
    REQUIRE(result.ok);
    CHECK(result.config.trusted_origin.empty());
    CHECK(result.config.default_fallback == "/dashboard");
    CHECK(result.config.log_level == "warn");
}

TEST_CASE("config trims string values") {
    auto result = parse_config(R"({
        "$schema": " waypost.config.v1 ",
        "trusted_origin": "  https://app.example.com  "
    })");
    REQUIRE(result.ok);
    CHECK(result.config.trusted_origin == "https://app.example.com");
}

TEST_CASE("config requires $schema") {
    auto result = parse_config(R"({"trusted_origin": "https://app.example.com"})");
    CHECK_FALSE(result.ok);
    CHECK(result.error == "$schema missing");
}

TEST_CASE("config rejects another schema") {
    auto result = parse_config(R"({"$schema": "waypost.config.v2"})");
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("$schema mismatch") != std::string::npos);
}

TEST_CASE("config rejects malformed JSON") {
    auto result = parse_config("{ not json");
    CHECK_FALSE(result.ok);
    CHECK(result.error.rfind("parse error", 0) == 0);
}

TEST_CASE("config must be an object") {
    auto result = parse_config("[1, 2]");
    CHECK_FALSE(result.ok);
    CHECK(result.error == "JSON must be an object");
}

TEST_CASE("config reports unknown keys") {
    auto result = parse_config(R"({"$schema": "waypost.config.v1", "allowed_hosts": []})");
    REQUIRE(result.ok);
    CHECK(has_warning(result.warnings, "unknown_config_key:allowed_hosts"));
}

TEST_CASE("config reports wrongly typed values") {
    auto result = parse_config(R"({
        "$schema": "waypost.config.v1",
        "trusted_origin": 42,
        "warnings": {"fallback_unsafe": "explode", "log_level_invalid": 1}
    })");
    REQUIRE(result.ok);
    CHECK(result.config.trusted_origin.empty());
    CHECK(has_warning(result.warnings, "invalid_configuration:trusted_origin must be a string"));
    CHECK(has_warning(result.warnings, "invalid_configuration:invalid warning action for fallback_unsafe"));
    CHECK(has_warning(result.warnings, "invalid_configuration:invalid warning action for log_level_invalid"));
    CHECK(result.config.warnings.empty());
}

TEST_CASE("config warnings section must be an object") {
    auto result = parse_config(R"({"$schema": "waypost.config.v1", "warnings": ["x"]})");
    REQUIRE(result.ok);
    CHECK(has_warning(result.warnings, "invalid_configuration:warnings must be an object"));
}

TEST_CASE("load_config_file reports a missing file") {
    auto result = load_config_file("/nonexistent/waypost/config.json");
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("not found") != std::string::npos);
}

TEST_CASE("report_parse_warnings feeds the collector") {
    auto result = parse_config(R"({"$schema": "waypost.config.v1", "extra": 1, "log_level": []})", "cfg.json");
    REQUIRE(result.ok);

    WarningCollector collector;
    report_parse_warnings(result, collector);
    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 2);

    bool saw_unknown = false;
    bool saw_invalid = false;
    for (const auto& w : warnings) {
        if (w.key == "unknown_config_key") {
            saw_unknown = true;
            CHECK(w.fields.at("key") == "extra");
            CHECK(w.fields.at("source_path") == "cfg.json");
        }
        if (w.key == "invalid_configuration") {
            saw_invalid = true;
            CHECK(w.fields.at("reason") == "log_level must be a string");
        }
    }
    CHECK(saw_unknown);
    CHECK(saw_invalid);
}

// ============================================================================
// Environment
// ============================================================================

TEST_CASE("environment overrides file values") {
    auto config = get_builtin_default_config();
    config.trusted_origin = "https://file.example.com";

    apply_environment(config, env_from({
        {"WAYPOST_TRUSTED_ORIGIN", " https://env.example.com "},
        {"WAYPOST_DEFAULT_FALLBACK", "/home"},
        {"WAYPOST_LOG_LEVEL", "INFO"},
    }));

    CHECK(config.trusted_origin == "https://env.example.com");
    CHECK(config.default_fallback == "/home");
    CHECK(config.log_level == "info");
}

TEST_CASE("empty or unset environment leaves config untouched") {
    auto config = get_builtin_default_config();
    config.trusted_origin = "https://file.example.com";

    apply_environment(config, env_from({{"WAYPOST_TRUSTED_ORIGIN", "   "}}));
    CHECK(config.trusted_origin == "https://file.example.com");
    CHECK(config.default_fallback == "/dashboard");

    apply_environment(config, EnvLookup{});
    CHECK(config.trusted_origin == "https://file.example.com");
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("validate_config normalizes a valid origin") {
    auto config = get_builtin_default_config();
    config.trusted_origin = "HTTPS://App.Example.com:443/";

    WarningCollector collector;
    validate_config(config, collector);
    CHECK(config.trusted_origin == "https://app.example.com");
    CHECK(collector.get_warnings().empty());
}

TEST_CASE("validate_config reports a missing origin") {
    auto config = get_builtin_default_config();
    WarningCollector collector;
    validate_config(config, collector);

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].key == "trusted_origin_missing");
    CHECK_FALSE(collector.has_errors());
}

TEST_CASE("validate_config reports an invalid origin") {
    auto config = get_builtin_default_config();
    config.trusted_origin = "https://app.example.com/dashboard";

    WarningCollector collector;
    validate_config(config, collector);

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].key == "trusted_origin_invalid");
    CHECK(warnings[0].fields.at("value") == "https://app.example.com/dashboard");
    CHECK(config.trusted_origin == "https://app.example.com/dashboard");
}

TEST_CASE("validate_config replaces an unsafe fallback") {
    for (const char* bad : {"//evil.com", "https://evil.com", "dashboard", "", "/\\evil.com"}) {
        auto config = get_builtin_default_config();
        config.trusted_origin = "https://app.example.com";
        config.default_fallback = bad;

        WarningCollector collector;
        validate_config(config, collector);

        CAPTURE(bad);
        CHECK(config.default_fallback == "/dashboard");
        auto warnings = collector.get_warnings();
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].key == "fallback_unsafe");
        CHECK(warnings[0].fields.at("replacement") == "/dashboard");
    }
}

TEST_CASE("validate_config applies the configured policy") {
    auto config = get_builtin_default_config();
    config.trusted_origin = "https://app.example.com";
    config.default_fallback = "//evil.com";
    config.warnings["fallback_unsafe"] = WarningAction::Error;

    WarningCollector collector;
    validate_config(config, collector);
    CHECK(collector.has_errors());

    auto ignored = get_builtin_default_config();
    ignored.warnings["trusted_origin_missing"] = WarningAction::Ignore;
    WarningCollector quiet;
    validate_config(ignored, quiet);
    CHECK(quiet.get_warnings().empty());
}

TEST_CASE("validate_config checks log levels") {
    for (const char* level : {"trace", "debug", "info", "warn", "err", "critical", "off"}) {
        auto config = get_builtin_default_config();
        config.trusted_origin = "https://app.example.com";
        config.log_level = level;
        WarningCollector collector;
        validate_config(config, collector);
        CAPTURE(level);
        CHECK(collector.get_warnings().empty());
        CHECK(config.log_level == level);
    }

    auto config = get_builtin_default_config();
    config.trusted_origin = "https://app.example.com";
    config.log_level = "loud";
    WarningCollector collector;
    validate_config(config, collector);
    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].key == "log_level_invalid");
    CHECK(config.log_level == "warn");
}
