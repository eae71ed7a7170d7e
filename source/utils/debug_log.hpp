#ifndef TMCPS_DEBUG_LOG_HPP
#define TMCPS_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if TMCPS_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [tmcps] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [tmcps] prefix unconditionally.
// Used for lifecycle events (startup, connections, session end, shutdown).
void notice(const std::string &message);

} // namespace debug_log

#endif // TMCPS_DEBUG_LOG_HPP
