#ifndef GDSJAMD_PLATFORM_ABI_HPP
#define GDSJAMD_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <vector>

namespace platform {

// Result of running a child process to completion.
struct ProcessOutput {
    bool success = false;        // process was spawned and exited normally
    int exit_code = -1;
    std::string standard_output; // everything the child wrote to stdout
    std::string error_message;
};

// Run executable_path with arguments and wait for it to exit, capturing stdout.
// The child's stdin is /dev/null so it never competes with the protocol stream,
// and its stderr is inherited.
ProcessOutput run_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments);

// Search PATH for an executable named program_name. Absolute names are
// checked directly. Returns the full path, or empty if not found.
std::string find_executable_on_path(const std::string &program_name);

// Result of resolving a directory.
struct DirectoryResult {
    bool success = false;
    std::string path;
    std::string error_message;
};

// The per-user application data directory for app_identifier:
// $XDG_DATA_HOME/<id>, falling back to $HOME/.local/share/<id>.
// The directory is not created.
DirectoryResult resolve_app_data_directory(const std::string &app_identifier);

// The user's home directory, or empty if HOME is unset.
std::string home_directory();

// Read the entire contents of a file into a string.
// Returns false and fills error_message (strerror text) on failure.
bool read_file_contents(const std::string &file_path, std::string &output_contents,
                        std::string &error_message);

// Replace the contents of file_path with contents (truncating).
bool write_file_contents(const std::string &file_path, const std::string &contents,
                         std::string &error_message);

} // namespace platform

#endif // GDSJAMD_PLATFORM_ABI_HPP
