#ifndef FSMCPS_DEBUG_LOG_HPP
#define FSMCPS_DEBUG_LOG_HPP

// Diagnostic output. Everything goes to stderr; stdout belongs to the stdio transport.

#include <string>

namespace debug_log {

// Returns true if FSMCPS_DEBUG env is set to a truthy value (1, true, yes),
// or if debug output was forced on with set_debug_enabled().
bool is_debug_enabled();

// Force debug output on (used by the --debug flag). Never turns it off.
void set_debug_enabled(bool enabled);

// Parses a truthy flag value (1, true, yes; case-insensitive).
bool parse_flag(const std::string &value);

// Writes message to stderr with [fsmcps] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [fsmcps] prefix unconditionally.
void info(const std::string &message);

} // namespace debug_log

#endif // FSMCPS_DEBUG_LOG_HPP
