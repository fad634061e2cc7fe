#include <doctest/doctest.h>
#include <waypost/warnings.hpp>
#include <waypost/types.hpp>

using namespace waypost;

TEST_CASE("warning_to_string returns correct warning key") {
    CHECK(std::string(warning_to_string(Warning::invalid_configuration)) == "invalid_configuration");
    CHECK(std::string(warning_to_string(Warning::trusted_origin_missing)) == "trusted_origin_missing");
    CHECK(std::string(warning_to_string(Warning::fallback_unsafe)) == "fallback_unsafe");
    CHECK(std::string(warning_to_string(Warning::log_level_invalid)) == "log_level_invalid");
}

TEST_CASE("parse_warning_key parses known warning keys") {
    CHECK(parse_warning_key("unknown_config_key") == Warning::unknown_config_key);
    CHECK(parse_warning_key("trusted_origin_invalid") == Warning::trusted_origin_invalid);
    CHECK(parse_warning_key("FALLBACK_UNSAFE") == Warning::fallback_unsafe);
}

TEST_CASE("parse_warning_key returns nullopt for unknown keys") {
    CHECK_FALSE(parse_warning_key("open_redirect").has_value());
    CHECK_FALSE(parse_warning_key("").has_value());
}

TEST_CASE("parse_warning_action is case-insensitive") {
    CHECK(parse_warning_action("warn") == WarningAction::Warn);
    CHECK(parse_warning_action("IGNORE") == WarningAction::Ignore);
    CHECK(parse_warning_action("Error") == WarningAction::Error);
    CHECK_FALSE(parse_warning_action("fatal").has_value());
}

TEST_CASE("WarningCollector default policy is warn") {
    WarningCollector collector;

    collector.emit(Warning::trusted_origin_missing);

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "warn");
    CHECK(warnings[0].key == "trusted_origin_missing");
    CHECK_FALSE(collector.has_errors());
}

TEST_CASE("WarningCollector applies error policy") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["fallback_unsafe"] = WarningAction::Error;

    WarningCollector collector(policy);
    collector.emit(Warning::fallback_unsafe, warnings::fallback_unsafe("//evil.com", "/dashboard"));

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "error");
    CHECK(warnings[0].fields.at("value") == "//evil.com");
    CHECK(collector.has_errors());
}

TEST_CASE("WarningCollector applies ignore policy") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["unknown_config_key"] = WarningAction::Ignore;

    WarningCollector collector(policy);
    collector.emit(Warning::unknown_config_key, warnings::unknown_config_key("extra", "cfg.json"));

    CHECK(collector.get_warnings().empty());
    CHECK_FALSE(collector.has_errors());
}

TEST_CASE("WarningCollector policy keys are case-insensitive") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["Trusted_Origin_Missing"] = WarningAction::Error;

    WarningCollector collector(policy);
    collector.emit("TRUSTED_ORIGIN_MISSING");

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].key == "trusted_origin_missing");
    CHECK(collector.has_errors());
}

TEST_CASE("WarningCollector set_policy affects later emissions only") {
    WarningCollector collector;
    collector.emit(Warning::log_level_invalid);

    collector.set_policy({{"log_level_invalid", WarningAction::Error}});
    collector.emit(Warning::log_level_invalid);

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 2);
    CHECK(warnings[0].action == "warn");
    CHECK(warnings[1].action == "error");
}

TEST_CASE("WarningCollector clear removes collected warnings") {
    WarningCollector collector;
    collector.emit(Warning::invalid_configuration, warnings::invalid_configuration("bad", "cfg.json"));
    REQUIRE(collector.get_warnings().size() == 1);

    collector.clear();
    CHECK(collector.get_warnings().empty());
    CHECK_FALSE(collector.has_errors());
}
