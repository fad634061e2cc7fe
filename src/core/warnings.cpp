#include "waypost/warnings.hpp"

#include <algorithm>
#include <cctype>

namespace waypost {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

void WarningCollector::set_policy(const std::unordered_map<std::string, WarningAction>& policy) {
    policy_.clear();
    for (const auto& [key, action] : policy) {
        policy_[to_lower(key)] = action;
    }
}

void WarningCollector::emit(Warning warning, const std::unordered_map<std::string, std::string>& fields) {
    emit(warning_to_string(warning), fields);
}

void WarningCollector::emit(Warning warning) {
    emit(warning_to_string(warning), {});
}

void WarningCollector::emit(const std::string& warning_key,
                            std::unordered_map<std::string, std::string> fields) {
    std::string key = to_lower(warning_key);
    WarningAction action = get_effective_action(key);

    // Ignored warnings are still collected so has_errors() sees the full set
    warnings_.push_back({key, std::move(fields), action});
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::vector<WarningObject> result;

    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Ignore) {
            continue;
        }

        WarningObject obj;
        obj.key = w.key;
        obj.action = action_to_string(w.effective_action);
        obj.fields = w.fields;
        result.push_back(std::move(obj));
    }

    return result;
}

bool WarningCollector::has_errors() const {
    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Error) {
            return true;
        }
    }
    return false;
}

void WarningCollector::clear() {
    warnings_.clear();
}

WarningAction WarningCollector::get_effective_action(const std::string& key) const {
    auto it = policy_.find(to_lower(key));
    if (it != policy_.end()) {
        return it->second;
    }

    // Default: warn
    return WarningAction::Warn;
}

} // namespace waypost
