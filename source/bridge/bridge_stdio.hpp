#ifndef GDSJAMD_BRIDGE_STDIO_HPP
#define GDSJAMD_BRIDGE_STDIO_HPP

// Stdio transport between the backend and the viewer process.

#include <istream>
#include <string>

namespace bridge_stdio {

// Read a single complete JSON object from input (stdin by default).
// Returns the raw JSON string, or empty string on EOF / error.
std::string read_message(std::istream &input);
std::string read_message();

// Write one JSON message line to stdout. Safe to call from any thread.
void write_message(const std::string &json_string);

// Write a lifecycle line to stderr (always shown, unlike debug_log::log).
void log_message(const std::string &message);

} // namespace bridge_stdio

#endif // GDSJAMD_BRIDGE_STDIO_HPP
