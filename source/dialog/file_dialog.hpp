#ifndef GDSJAMD_FILE_DIALOG_HPP
#define GDSJAMD_FILE_DIALOG_HPP

// Native open-file dialog, shown by running zenity or kdialog and reading
// the chosen path from its stdout.

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "backend/backend_config.hpp"
#include "platform/platform_abi.hpp"

namespace file_dialog {

// A named group of file extensions (without the leading dot).
struct FileFilter {
    std::string label;
    std::vector<std::string> extensions;
};

// The only filter the viewer offers: GDS Files (gds, gdsii, dxf).
FileFilter layout_file_filter();

// Result of showing the dialog. success with no path means the user cancelled.
struct DialogResult {
    bool success = false;
    std::optional<std::string> path;
    std::string error_message;
};

// Program and argv for one dialog backend.
struct DialogCommandLine {
    std::string executable_path;
    std::vector<std::string> arguments;
};

DialogCommandLine build_zenity_command_line(const std::string &executable_path,
                                            const std::string &title,
                                            const FileFilter &filter);

DialogCommandLine build_kdialog_command_line(const std::string &executable_path,
                                             const std::string &title,
                                             const std::string &start_directory,
                                             const FileFilter &filter);

// Hooks for the process-level work, replaceable in tests.
struct DialogEnvironment {
    std::function<platform::ProcessOutput(const std::string &, const std::vector<std::string> &)> run_process =
        platform::run_process;
    std::function<std::string(const std::string &)> find_executable = platform::find_executable_on_path;
    std::string start_directory; // empty = home directory
};

// Dialog programs to try, in order, for a preference.
std::vector<std::string> program_search_order(backend_config::DialogPreference preference);

// Map a finished dialog process to a DialogResult. Exit 0 with a path on the
// first stdout line is a pick, exit 1 (or exit 0 with no output) is a cancel,
// anything else is an error. Relative paths are resolved against start_directory.
DialogResult interpret_process_output(const std::string &program_name,
                                      const platform::ProcessOutput &output,
                                      const std::string &start_directory);

// Show the dialog with the first available program and block until the user
// answers.
DialogResult pick_file(const std::string &title,
                       const FileFilter &filter,
                       backend_config::DialogPreference preference,
                       const DialogEnvironment &environment = {});

} // namespace file_dialog

#endif // GDSJAMD_FILE_DIALOG_HPP
