#include "waypost/origin.hpp"

#include <cctype>
#include <string>

namespace waypost {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

std::string Origin::serialize() const {
    std::string out = scheme + "://" + host;
    if (port) {
        out += ":" + std::to_string(*port);
    }
    return out;
}

bool operator==(const Origin& a, const Origin& b) {
    return a.scheme == b.scheme && a.host == b.host && a.port == b.port;
}

bool operator!=(const Origin& a, const Origin& b) {
    return !(a == b);
}

std::optional<uint16_t> default_port_for_scheme(const std::string& scheme) {
    if (scheme == "http") return 80;
    if (scheme == "https") return 443;
    return std::nullopt;
}

Origin origin_of(const UrlParts& parts) {
    Origin origin;
    origin.scheme = parts.scheme;
    origin.host = parts.host;
    if (parts.port && *parts.port != default_port_for_scheme(parts.scheme)) {
        origin.port = parts.port;
    }
    return origin;
}

bool same_origin(const Origin& a, const Origin& b) {
    return a.serialize() == b.serialize();
}

OriginParseResult parse_origin(const std::string& value) {
    OriginParseResult result;

    auto parsed = parse_absolute_url(trim(value));
    if (!parsed.ok) {
        result.error = std::string("not an absolute URL: ") + url_error_to_string(parsed.error);
        return result;
    }

    const auto& parts = parsed.parts;
    if (!is_http_scheme(parts.scheme)) {
        result.error = "unsupported scheme: " + parts.scheme;
        return result;
    }
    if (parts.has_userinfo) {
        result.error = "origin must not contain userinfo";
        return result;
    }
    if (!parts.remainder.empty() && parts.remainder != "/") {
        result.error = "origin must not contain a path, query or fragment";
        return result;
    }

    result.origin = origin_of(parts);
    result.ok = true;
    return result;
}

} // namespace waypost
