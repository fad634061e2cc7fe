#pragma once

#include "waypost/redirect.hpp"

#include <cstddef>
#include <optional>
#include <string>

#include <spdlog/logger.h>

namespace waypost {

/// Longest candidate prefix written to a log line
constexpr size_t MAX_LOGGED_CANDIDATE = 256;

// Render untrusted text for a single log line: printable ASCII is kept,
// '"' and '\' are backslash-escaped, every other byte becomes \xNN.
// Input beyond `max_bytes` is cut and replaced by "...".
std::string escape_for_log(const std::string& value, size_t max_bytes = MAX_LOGGED_CANDIDATE);

// Evaluate through `resolver` and record the outcome on `logger`:
// info when a non-blank candidate was replaced by the fallback, debug otherwise.
RedirectOutcome evaluate_audited(const RedirectResolver& resolver,
                                 const std::optional<std::string>& candidate,
                                 const std::string& fallback,
                                 spdlog::logger& logger);

// evaluate_audited() returning only the target, exactly what resolve() would
std::string resolve_audited(const RedirectResolver& resolver,
                            const std::optional<std::string>& candidate,
                            const std::string& fallback,
                            spdlog::logger& logger);

} // namespace waypost
