#include "dialog/file_dialog.hpp"
#include "utils/debug_log.hpp"
#include "utils/path_text.hpp"

#include <filesystem>

namespace file_dialog {

FileFilter layout_file_filter() {
    return FileFilter{"GDS Files", {"gds", "gdsii", "dxf"}};
}

// "*.gds *.gdsii *.dxf"
static std::string glob_pattern_list(const FileFilter &filter) {
    std::string patterns;
    for (const auto &extension : filter.extensions) {
        if (!patterns.empty()) {
            patterns += " ";
        }
        patterns += "*." + extension;
    }
    return patterns;
}

DialogCommandLine build_zenity_command_line(const std::string &executable_path,
                                            const std::string &title,
                                            const FileFilter &filter) {
    DialogCommandLine command_line;
    command_line.executable_path = executable_path;
    command_line.arguments = {
        "--file-selection",
        "--title=" + title,
        "--file-filter=" + filter.label + " | " + glob_pattern_list(filter),
    };
    return command_line;
}

DialogCommandLine build_kdialog_command_line(const std::string &executable_path,
                                             const std::string &title,
                                             const std::string &start_directory,
                                             const FileFilter &filter) {
    DialogCommandLine command_line;
    command_line.executable_path = executable_path;
    command_line.arguments = {
        "--title",
        title,
        "--getopenfilename",
        start_directory.empty() ? "." : start_directory,
        glob_pattern_list(filter) + "|" + filter.label,
    };
    return command_line;
}

std::vector<std::string> program_search_order(backend_config::DialogPreference preference) {
    switch (preference) {
        case backend_config::DialogPreference::kdialog:
            return {"kdialog", "zenity"};
        case backend_config::DialogPreference::zenity:
        case backend_config::DialogPreference::automatic:
            break;
    }
    return {"zenity", "kdialog"};
}

DialogResult interpret_process_output(const std::string &program_name,
                                      const platform::ProcessOutput &output,
                                      const std::string &start_directory) {
    DialogResult result;

    if (!output.success) {
        result.error_message = "Failed to open file dialog: " + program_name + ": " + output.error_message;
        return result;
    }

    // Both zenity and kdialog exit with 1 when the dialog is dismissed.
    if (output.exit_code == 1) {
        debug_log::log("File dialog cancelled");
        result.success = true;
        return result;
    }

    if (output.exit_code != 0) {
        result.error_message = "Failed to open file dialog: " + program_name +
                               " exited with status " + std::to_string(output.exit_code);
        return result;
    }

    std::string first_line = output.standard_output.substr(0, output.standard_output.find('\n'));
    if (!first_line.empty() && first_line.back() == '\r') {
        first_line.pop_back();
    }

    result.success = true;
    if (first_line.empty()) {
        return result;
    }

    std::filesystem::path chosen_path(first_line);
    if (chosen_path.is_relative()) {
        std::filesystem::path base = start_directory.empty()
                                         ? std::filesystem::path(platform::home_directory())
                                         : std::filesystem::path(start_directory);
        chosen_path = (base / chosen_path).lexically_normal();
    }
    result.path = path_text::from_path(chosen_path);
    return result;
}

DialogResult pick_file(const std::string &title,
                       const FileFilter &filter,
                       backend_config::DialogPreference preference,
                       const DialogEnvironment &environment) {
    std::string start_directory = environment.start_directory.empty()
                                      ? platform::home_directory()
                                      : environment.start_directory;

    for (const auto &program_name : program_search_order(preference)) {
        std::string executable_path = environment.find_executable(program_name);
        if (executable_path.empty()) {
            debug_log::log("Dialog program not found: " + program_name);
            continue;
        }

        DialogCommandLine command_line = program_name == "kdialog"
                                             ? build_kdialog_command_line(executable_path, title, start_directory, filter)
                                             : build_zenity_command_line(executable_path, title, filter);

        debug_log::log("Showing file dialog with " + executable_path);
        platform::ProcessOutput output = environment.run_process(command_line.executable_path,
                                                                 command_line.arguments);
        return interpret_process_output(program_name, output, start_directory);
    }

    DialogResult result;
    result.error_message = "Failed to open file dialog: no dialog program found (install zenity or kdialog)";
    return result;
}

} // namespace file_dialog
