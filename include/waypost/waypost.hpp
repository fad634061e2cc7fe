/*
 * waypost - redirect-target resolution
 *
 * Answers one question for a web application: "is it safe to send the user
 * to this destination after sign-in?"
 *
 *   candidate ("/contracts/7", "https://evil.com", ...)
 *        |
 *        v
 *   RedirectResolver ----- OriginProvider ("https://app.example.com")
 *        |
 *        v
 *   "/contracts/7" or the fallback ("/dashboard")
 *
 * Headers:
 *   redirect.hpp  - RedirectResolver, resolve_redirect(), callback paths
 *   origin.hpp    - Origin parsing and comparison
 *   url.hpp       - minimal absolute-URL splitter used by the resolver
 *   config.hpp    - JSON configuration and environment overrides
 *   warnings.hpp  - configuration diagnostics
 *   audit.hpp     - spdlog wrapper for callers that want rejection logs
 */

#ifndef WAYPOST_HPP
#define WAYPOST_HPP

#include "waypost/audit.hpp"
#include "waypost/config.hpp"
#include "waypost/origin.hpp"
#include "waypost/platform.hpp"
#include "waypost/redirect.hpp"
#include "waypost/types.hpp"
#include "waypost/url.hpp"
#include "waypost/warnings.hpp"

namespace waypost {

/// Library version following semver
constexpr const char* WAYPOST_LIB_VERSION = "1.0.0";

} // namespace waypost

#endif // WAYPOST_HPP
