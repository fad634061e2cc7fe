#pragma once

/**
 * @file redirect.hpp
 * @brief Redirect-target resolution (open-redirect guard)
 *
 * Decides whether a caller-supplied destination is safe to send the user to
 * after a sign-in or workflow step, and substitutes a fallback when it is not.
 * The result is always a root-relative string ("/..."), never an absolute URL.
 *
 * @example
 * ```cpp
 * #include <waypost/redirect.hpp>
 *
 * waypost::RedirectResolver resolver(waypost::fixed_origin("https://app.example.com"));
 *
 * resolver.resolve("/contracts/123?view=detail");      // "/contracts/123?view=detail"
 * resolver.resolve("https://app.example.com/x?y#z");   // "/x?y#z"
 * resolver.resolve("//evil.com");                      // "/dashboard"
 * resolver.resolve(std::nullopt, "/home");             // "/home"
 * ```
 *
 * Rejections are never distinguished by cause. The resolver performs no I/O
 * and no logging; see audit.hpp for a logging wrapper.
 */

#include "waypost/origin.hpp"

#include <functional>
#include <optional>
#include <string>

namespace waypost {

/// Destination used when the caller supplies no fallback
constexpr const char* DEFAULT_FALLBACK = "/dashboard";

/// Identity-provider return paths used by the dashboard's auth flows
constexpr const char* CALLBACK_PATH = "/auth/callback";
constexpr const char* RESET_PASSWORD_CONFIRM_PATH = "/auth/reset-password/confirm";
constexpr const char* SIGN_IN_PATH = "/auth/signin";

/// Read-only accessor for the serving application's origin, e.g.
/// "https://app.example.com". Called on every resolution.
///
/// A provider may signal "origin unavailable" by throwing an exception
/// derived from std::exception; the resolver then has no trusted origin.
/// Throwing any other type is a contract violation and propagates.
using OriginProvider = std::function<std::string()>;

/// Provider that always yields the given origin string
OriginProvider fixed_origin(std::string origin);

struct RedirectOutcome {
    std::string target;
    bool used_fallback = false;
};

// True when `target` is a root-relative reference that is safe to navigate to
// as-is: starts with a single '/', is not "//..." or "/\...", and contains no
// ASCII control characters. No trimming is applied.
bool is_safe_relative_target(const std::string& target);

class RedirectResolver {
public:
    explicit RedirectResolver(OriginProvider provider);

    /**
     * @brief Resolve a candidate destination.
     *
     * Returns the trimmed candidate when it is a safe relative path, the
     * path + query + fragment when it is an absolute http(s) URL on the
     * trusted origin, and `fallback` otherwise. `fallback` is not validated;
     * it must already be a safe relative path.
     */
    std::string resolve(const std::optional<std::string>& candidate,
                        const std::string& fallback = DEFAULT_FALLBACK) const;

    /// Same decision as resolve(), also reporting whether the fallback was used
    RedirectOutcome evaluate(const std::optional<std::string>& candidate,
                             const std::string& fallback = DEFAULT_FALLBACK) const;

    /// Absolute URL on the trusted origin for a safe path (e.g. CALLBACK_PATH),
    /// or nullopt when the path is unsafe or no trusted origin is available
    std::optional<std::string> absolute_url(const std::string& path) const;

    /// Current trusted origin, or nullopt when the provider yields nothing parseable
    std::optional<Origin> trusted_origin() const;

private:
    std::optional<std::string> accept(const std::string& candidate) const;

    OriginProvider provider_;
};

/// One-shot resolution against a fixed trusted origin
std::string resolve_redirect(const std::optional<std::string>& candidate,
                             const std::string& trusted_origin,
                             const std::string& fallback = DEFAULT_FALLBACK);

} // namespace waypost
