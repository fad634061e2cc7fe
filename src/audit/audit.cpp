#include "waypost/audit.hpp"

#include <cctype>

namespace waypost {

namespace {

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string escape_for_log(const std::string& value, size_t max_bytes) {
    static const char* hex = "0123456789abcdef";

    std::string out;
    size_t limit = value.size() < max_bytes ? value.size() : max_bytes;
    out.reserve(limit + 8);

    for (size_t i = 0; i < limit; ++i) {
        auto c = static_cast<unsigned char>(value[i]);
        if (c == '"' || c == '\\') {
            out += '\\';
            out += static_cast<char>(c);
        } else if (c >= 0x20 && c < 0x7F) {
            out += static_cast<char>(c);
        } else {
            out += "\\x";
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    if (value.size() > limit) {
        out += "...";
    }
    return out;
}

RedirectOutcome evaluate_audited(const RedirectResolver& resolver,
                                 const std::optional<std::string>& candidate,
                                 const std::string& fallback,
                                 spdlog::logger& logger) {
    auto outcome = resolver.evaluate(candidate, fallback);

    if (!candidate || is_blank(*candidate)) {
        logger.debug("no redirect candidate, using {}", outcome.target);
    } else if (outcome.used_fallback) {
        logger.info("redirect rejected: candidate=\"{}\" fallback={}",
                    escape_for_log(*candidate), outcome.target);
    } else {
        logger.debug("redirect accepted: {}", escape_for_log(outcome.target));
    }

    return outcome;
}

std::string resolve_audited(const RedirectResolver& resolver,
                            const std::optional<std::string>& candidate,
                            const std::string& fallback,
                            spdlog::logger& logger) {
    return evaluate_audited(resolver, candidate, fallback, logger).target;
}

} // namespace waypost
