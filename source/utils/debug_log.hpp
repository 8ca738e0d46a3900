#ifndef PAGEPILOT_DEBUG_LOG_HPP
#define PAGEPILOT_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if PAGEPILOT_DEBUG env is set to a truthy value (1, true, yes).
// The value is read once and cached.
bool is_debug_enabled();

// Writes message to stderr with [pagepilot] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [pagepilot] prefix unconditionally.
void warn(const std::string &message);

} // namespace debug_log

#endif // PAGEPILOT_DEBUG_LOG_HPP
