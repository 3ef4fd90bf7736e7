#ifndef GDSJAMD_PATH_TEXT_HPP
#define GDSJAMD_PATH_TEXT_HPP

// Conversion of raw filesystem path bytes into text that is safe to put
// into a JSON string. Linux paths are arbitrary byte strings; the wire
// protocol is UTF-8, so invalid sequences are replaced with U+FFFD.

#include <filesystem>
#include <string>

namespace path_text {

// Returns true if every byte sequence in text is well-formed UTF-8.
bool is_valid_utf8(const std::string &text);

// Copy of raw with each invalid UTF-8 sequence replaced by U+FFFD.
std::string to_lossy_utf8(const std::string &raw);

// Lossy text form of a filesystem path.
std::string from_path(const std::filesystem::path &path);

} // namespace path_text

#endif // GDSJAMD_PATH_TEXT_HPP
