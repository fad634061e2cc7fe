#pragma once

#include "waypost/url.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace waypost {

/**
 * @brief The (scheme, host, port) triple used as the unit of same-site trust.
 *
 * `scheme` and `host` are in WHATWG-serialized form (lowercase, IDNA and
 * IP literals canonicalized). `port` is empty when it equals the scheme's
 * default port, so two spellings of the same origin compare equal
 * ("https://a.com" and "https://a.com:443").
 */
struct Origin {
    std::string scheme;
    std::string host;
    std::optional<uint16_t> port;

    /// "scheme://host[:port]"
    std::string serialize() const;
};

bool operator==(const Origin& a, const Origin& b);
bool operator!=(const Origin& a, const Origin& b);

/// 80 for http, 443 for https, nullopt otherwise
std::optional<uint16_t> default_port_for_scheme(const std::string& scheme);

struct OriginParseResult {
    bool ok = false;
    std::string error;
    Origin origin;
};

/**
 * @brief Parse a configured origin such as "https://app.example.com".
 *
 * Accepts `scheme://host[:port]` with at most a single trailing '/'.
 * Rejects non-http(s) schemes, userinfo, and any path, query or fragment.
 * Surrounding ASCII whitespace is ignored.
 */
OriginParseResult parse_origin(const std::string& value);

/// Origin of a parsed URL, with the default port elided
Origin origin_of(const UrlParts& parts);

/// Exact comparison of serialized origins. No subdomain or scheme relaxation.
bool same_origin(const Origin& a, const Origin& b);

} // namespace waypost
