#include "waypost/url.hpp"

#include <ada.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace waypost {

namespace {

bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_scheme_char(char c) {
    return is_alpha(c) || is_digit(c) || c == '+' || c == '-' || c == '.';
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// WHATWG parsing drops ASCII tab and newline anywhere in the input
std::string strip_tab_newline(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != '\t' && c != '\n' && c != '\r') {
            out += c;
        }
    }
    return out;
}

bool parse_port(const std::string& text, std::optional<uint16_t>& out) {
    if (text.empty()) {
        out.reset();
        return true;
    }
    if (text.size() > 5) {
        return false;
    }
    unsigned long value = 0;
    for (char c : text) {
        if (!is_digit(c)) {
            return false;
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value > 65535) {
        return false;
    }
    out = static_cast<uint16_t>(value);
    return true;
}

UrlParseResult fail(UrlError error) {
    UrlParseResult result;
    result.ok = false;
    result.error = error;
    return result;
}

} // namespace

const char* url_error_to_string(UrlError error) {
    switch (error) {
        case UrlError::None: return "none";
        case UrlError::MissingScheme: return "missing scheme";
        case UrlError::InvalidScheme: return "invalid scheme";
        case UrlError::MissingAuthority: return "missing authority";
        case UrlError::InvalidHost: return "invalid host";
        case UrlError::InvalidPort: return "invalid port";
        default: return "unknown";
    }
}

bool is_http_scheme(const std::string& scheme) {
    return scheme == "http" || scheme == "https";
}

UrlParseResult parse_absolute_url(const std::string& input) {
    // Scheme
    size_t i = 0;
    if (!input.empty() && is_alpha(input[0])) {
        i = 1;
        while (i < input.size() && is_scheme_char(input[i])) {
            ++i;
        }
    }
    if (i == 0 || i >= input.size() || input[i] != ':') {
        if (input.find(':') == std::string::npos) {
            return fail(UrlError::MissingScheme);
        }
        return fail(UrlError::InvalidScheme);
    }

    UrlParseResult result;
    result.parts.scheme = to_lower(input.substr(0, i));
    const bool http = is_http_scheme(result.parts.scheme);

    size_t pos = i + 1;
    if (input.compare(pos, 2, "//") != 0) {
        if (http) {
            return fail(UrlError::MissingAuthority);
        }
        result.parts.remainder = input.substr(pos);
        result.ok = true;
        return result;
    }

    // Authority
    pos += 2;
    size_t auth_end = input.find_first_of("/\\?#", pos);
    if (auth_end == std::string::npos) {
        auth_end = input.size();
    }
    std::string authority = strip_tab_newline(input.substr(pos, auth_end - pos));
    result.parts.has_authority = true;

    size_t at = authority.rfind('@');
    std::string hostport = authority;
    if (at != std::string::npos) {
        result.parts.has_userinfo = true;
        result.parts.userinfo = authority.substr(0, at);
        hostport = authority.substr(at + 1);
    }

    // Locate the port text; the host itself is left to the URL parser
    std::string host_text;
    std::string port_text;
    if (!hostport.empty() && hostport[0] == '[') {
        size_t close = hostport.find(']');
        if (close == std::string::npos) {
            return fail(UrlError::InvalidHost);
        }
        host_text = hostport.substr(0, close + 1);
        std::string rest = hostport.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') {
                return fail(UrlError::InvalidHost);
            }
            port_text = rest.substr(1);
        }
    } else {
        size_t colon = hostport.find(':');
        host_text = hostport.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = hostport.substr(colon + 1);
        }
    }

    if (http && host_text.empty()) {
        return fail(UrlError::InvalidHost);
    }
    std::optional<uint16_t> written_port;
    if (!parse_port(port_text, written_port)) {
        return fail(UrlError::InvalidPort);
    }

    auto url = ada::parse<ada::url_aggregator>(input);
    if (!url) {
        return fail(UrlError::InvalidHost);
    }

    result.parts.host = std::string(url->get_hostname());
    std::string_view port = url->get_port();
    if (!port.empty()) {
        std::optional<uint16_t> parsed_port;
        if (!parse_port(std::string(port), parsed_port)) {
            return fail(UrlError::InvalidPort);
        }
        result.parts.port = parsed_port;
    }
    if (http) {
        result.parts.origin = url->get_origin();
    }

    result.parts.remainder = input.substr(auth_end);
    result.parts.serialized_remainder = std::string(url->get_pathname()) +
                                        std::string(url->get_search()) +
                                        std::string(url->get_hash());
    result.ok = true;
    return result;
}

} // namespace waypost
