#pragma once

#include <optional>
#include <string>

namespace waypost {

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// ============================================================================
// Files
// ============================================================================

// Read a whole file into a string, nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

} // namespace waypost
