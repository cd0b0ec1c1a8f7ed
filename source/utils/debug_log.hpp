#ifndef DOTMCPS_DEBUG_LOG_HPP
#define DOTMCPS_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if DOTMCPS_DEBUG env is set to a truthy value (1, true, yes).
// Read once, on first use.
bool is_debug_enabled();

// Writes message to stderr with [dotmcps] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [dotmcps] error: prefix, regardless of DOTMCPS_DEBUG.
void error(const std::string &message);

} // namespace debug_log

#endif // DOTMCPS_DEBUG_LOG_HPP
