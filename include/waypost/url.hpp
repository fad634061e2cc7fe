#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace waypost {

enum class UrlError {
    None,
    MissingScheme,
    InvalidScheme,
    MissingAuthority,
    InvalidHost,
    InvalidPort,
};

const char* url_error_to_string(UrlError error);

struct UrlParts {
    std::string scheme;               // lowercase
    bool has_authority = false;       // "//" followed the scheme
    bool has_userinfo = false;        // authority contained '@'
    std::string userinfo;
    std::string host;                 // WHATWG-serialized, IPv6 literals keep their brackets
    std::optional<uint16_t> port;     // empty when absent or equal to the scheme's default
    std::string origin;               // WHATWG-serialized origin, empty without an authority
    std::string remainder;            // path + query + fragment, byte-exact
    std::string serialized_remainder; // path + query + fragment as the URL parser serializes them
};

struct UrlParseResult {
    bool ok = false;
    UrlError error = UrlError::None;
    UrlParts parts;
};

// Split an absolute URL into scheme, authority and remainder.
// - Scheme must match ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) followed by ':'
// - http and https require the "scheme://host" form and a non-empty host
// - Authority ends at the first '/', '\', '?' or '#'
// - Port is at most 5 digits and at most 65535; "host:" means the default port
// - Host, port and origin come from ada's WHATWG parser (percent-decoding,
//   IDNA, IPv4/IPv6 canonicalization); a host it refuses is InvalidHost
// `remainder` is sliced from the input at the end of the authority and is
// never re-encoded or normalized.
UrlParseResult parse_absolute_url(const std::string& input);

// True for "http" and "https" (expects a lowercase scheme)
bool is_http_scheme(const std::string& scheme);

} // namespace waypost
