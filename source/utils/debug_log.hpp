#ifndef GDSJAMD_DEBUG_LOG_HPP
#define GDSJAMD_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if GDSJAMD_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [gdsjamd] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [gdsjamd] prefix, regardless of GDSJAMD_DEBUG.
void info(const std::string &message);

// Writes message to stderr with [gdsjamd] error: prefix, regardless of GDSJAMD_DEBUG.
// Watch errors and transport failures end up here instead of reaching the UI.
void error(const std::string &message);

} // namespace debug_log

#endif // GDSJAMD_DEBUG_LOG_HPP
