#pragma once

#include "waypost/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace waypost {

// ============================================================================
// Warning Collector
// ============================================================================

class WarningCollector {
public:
    WarningCollector() = default;

    explicit WarningCollector(const std::unordered_map<std::string, WarningAction>& policy) {
        set_policy(policy);
    }

    // Replace the policy map (keys are matched case-insensitively)
    void set_policy(const std::unordered_map<std::string, WarningAction>& policy);

    // Emit a warning with fields
    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);

    // Emit a warning with no fields
    void emit(Warning warning);

    // Emit a warning by key string (for keys carried over from parse results)
    void emit(const std::string& warning_key, std::unordered_map<std::string, std::string> fields = {});

    // Get all emitted warnings after policy application
    // Warnings with action "ignore" are excluded
    std::vector<WarningObject> get_warnings() const;

    // Check if any warning was upgraded to error
    bool has_errors() const;

    // Clear all collected warnings
    void clear();

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    std::unordered_map<std::string, WarningAction> policy_;
    std::vector<CollectedWarning> warnings_;

    WarningAction get_effective_action(const std::string& key) const;
};

// ============================================================================
// Field builders for specific warnings
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> invalid_configuration(
    const std::string& reason,
    const std::string& source_path) {
    return {{"reason", reason}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> unknown_config_key(
    const std::string& key,
    const std::string& source_path) {
    return {{"key", key}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> trusted_origin_invalid(
    const std::string& value,
    const std::string& reason) {
    return {{"value", value}, {"reason", reason}};
}

inline std::unordered_map<std::string, std::string> fallback_unsafe(
    const std::string& value,
    const std::string& replacement) {
    return {{"value", value}, {"replacement", replacement}};
}

inline std::unordered_map<std::string, std::string> log_level_invalid(
    const std::string& value) {
    return {{"value", value}};
}

} // namespace warnings

} // namespace waypost
