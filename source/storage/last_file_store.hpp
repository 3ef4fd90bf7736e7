#ifndef GDSJAMD_LAST_FILE_STORE_HPP
#define GDSJAMD_LAST_FILE_STORE_HPP

// Persistence of the "last opened file" marker: a single text file inside
// the application data directory holding the path that was saved last.

#include <optional>
#include <string>

#include "platform/platform_abi.hpp"

namespace last_file_store {

static const char MARKER_FILE_NAME[] = "last_file.txt";

// Result of reading the marker. success with no path means nothing was saved yet.
struct LoadResult {
    bool success = false;
    std::optional<std::string> path;
    std::string error_message;
};

// Result of writing the marker.
struct SaveResult {
    bool success = false;
    std::string error_message;
};

// Read the marker from data_directory and trim surrounding whitespace.
// A failed directory resolution is passed through as an error.
LoadResult load(const platform::DirectoryResult &data_directory);

// Create data_directory (with parents) and overwrite the marker with path verbatim.
SaveResult save(const platform::DirectoryResult &data_directory, const std::string &path);

// Strip leading and trailing whitespace (space, \t, \r, \n, \v, \f).
std::string trim(const std::string &value);

} // namespace last_file_store

#endif // GDSJAMD_LAST_FILE_STORE_HPP
