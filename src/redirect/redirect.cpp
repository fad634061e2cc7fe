#include "waypost/redirect.hpp"

#include <exception>
#include <string>
#include <utility>

namespace waypost {

namespace {

bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

bool is_control(char c) {
    auto u = static_cast<unsigned char>(c);
    return u < 0x20 || u == 0x7F;
}

bool is_slash(char c) {
    return c == '/' || c == '\\';
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && is_ascii_space(s[start])) ++start;
    size_t end = s.size();
    while (end > start && is_ascii_space(s[end - 1])) --end;
    return s.substr(start, end - start);
}

} // namespace

OriginProvider fixed_origin(std::string origin) {
    return [origin = std::move(origin)]() { return origin; };
}

bool is_safe_relative_target(const std::string& target) {
    if (target.empty() || target[0] != '/') {
        return false;
    }
    // "//host" and "/\host" are authority references in browsers
    if (target.size() > 1 && is_slash(target[1])) {
        return false;
    }
    for (char c : target) {
        if (is_control(c)) {
            return false;
        }
    }
    return true;
}

RedirectResolver::RedirectResolver(OriginProvider provider)
    : provider_(std::move(provider)) {}

std::optional<Origin> RedirectResolver::trusted_origin() const {
    if (!provider_) {
        return std::nullopt;
    }

    std::string value;
    try {
        value = provider_();
    } catch (const std::exception&) {
        // An unavailable origin means nothing absolute is same-origin
        return std::nullopt;
    }

    auto parsed = parse_origin(value);
    if (!parsed.ok) {
        return std::nullopt;
    }
    return parsed.origin;
}

std::optional<std::string> RedirectResolver::accept(const std::string& candidate) const {
    std::string trimmed = trim(candidate);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    if (is_slash(trimmed[0])) {
        if (is_safe_relative_target(trimmed)) {
            return trimmed;
        }
        return std::nullopt;
    }

    auto parsed = parse_absolute_url(trimmed);
    if (!parsed.ok || !is_http_scheme(parsed.parts.scheme)) {
        return std::nullopt;
    }

    auto trusted = trusted_origin();
    if (!trusted || parsed.parts.origin != trusted->serialize()) {
        return std::nullopt;
    }

    // A leading '\' is a path separator to the browser; take the parser's path
    std::string target = parsed.parts.remainder;
    if (!target.empty() && target[0] == '\\') {
        target = parsed.parts.serialized_remainder;
    }
    if (target.empty() || target[0] == '?' || target[0] == '#') {
        target.insert(0, "/");
    }

    // The stripped form must survive a second pass unchanged
    if (!is_safe_relative_target(target)) {
        return std::nullopt;
    }
    return target;
}

RedirectOutcome RedirectResolver::evaluate(const std::optional<std::string>& candidate,
                                           const std::string& fallback) const {
    if (candidate) {
        if (auto target = accept(*candidate)) {
            return {std::move(*target), false};
        }
    }
    return {fallback, true};
}

std::string RedirectResolver::resolve(const std::optional<std::string>& candidate,
                                      const std::string& fallback) const {
    return evaluate(candidate, fallback).target;
}

std::optional<std::string> RedirectResolver::absolute_url(const std::string& path) const {
    auto origin = trusted_origin();
    if (!origin) {
        return std::nullopt;
    }
    auto target = accept(path);
    if (!target) {
        return std::nullopt;
    }
    return origin->serialize() + *target;
}

std::string resolve_redirect(const std::optional<std::string>& candidate,
                             const std::string& trusted_origin,
                             const std::string& fallback) {
    return RedirectResolver(fixed_origin(trusted_origin)).resolve(candidate, fallback);
}

} // namespace waypost
