#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>

extern char **environ;

namespace platform {

static std::string error_text(int error_number) {
    return std::string(strerror(error_number));
}

ProcessOutput run_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments) {
    ProcessOutput result;

    // Build argv array: [executable, arg1, arg2, ..., nullptr]
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    for (const auto &argument : arguments) {
        argv_strings.push_back(argument);
    }

    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    int pipe_descriptors[2];
    if (pipe2(pipe_descriptors, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + error_text(errno);
        return result;
    }
    int read_end = pipe_descriptors[0];
    int write_end = pipe_descriptors[1];

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&file_actions, write_end, STDOUT_FILENO);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(),
                                   &file_actions, nullptr,
                                   argv_pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);
    close(write_end);

    if (spawn_status != 0) {
        close(read_end);
        result.error_message = "posix_spawn failed: " + error_text(spawn_status);
        return result;
    }

    // Drain stdout until the child closes it.
    char buffer[4096];
    while (true) {
        ssize_t bytes_read = read(read_end, buffer, sizeof(buffer));
        if (bytes_read > 0) {
            result.standard_output.append(buffer, static_cast<size_t>(bytes_read));
            continue;
        }
        if (bytes_read < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    close(read_end);

    int wait_status = 0;
    pid_t waited_pid = -1;
    do {
        waited_pid = waitpid(child_pid, &wait_status, 0);
    } while (waited_pid < 0 && errno == EINTR);

    if (waited_pid < 0) {
        result.error_message = "waitpid failed: " + error_text(errno);
        return result;
    }

    if (WIFEXITED(wait_status)) {
        result.success = true;
        result.exit_code = WEXITSTATUS(wait_status);
        return result;
    }

    if (WIFSIGNALED(wait_status)) {
        result.error_message = "process terminated by signal " + std::to_string(WTERMSIG(wait_status));
    } else {
        result.error_message = "process ended abnormally";
    }
    return result;
}

std::string find_executable_on_path(const std::string &program_name) {
    if (program_name.empty()) {
        return "";
    }

    if (program_name.find('/') != std::string::npos) {
        if (access(program_name.c_str(), X_OK) == 0) {
            return program_name;
        }
        return "";
    }

    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        return "";
    }
    std::istringstream path_stream(path_environment);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        if (directory.empty()) {
            continue;
        }
        std::string full_path = directory + "/" + program_name;
        if (access(full_path.c_str(), X_OK) == 0) {
            return full_path;
        }
    }
    return "";
}

DirectoryResult resolve_app_data_directory(const std::string &app_identifier) {
    DirectoryResult result;

    if (app_identifier.empty()) {
        result.error_message = "application identifier is empty";
        return result;
    }

    // XDG base directory spec: relative values must be ignored.
    const char *xdg_data_home = std::getenv("XDG_DATA_HOME");
    if (xdg_data_home != nullptr && xdg_data_home[0] == '/') {
        result.success = true;
        result.path = (std::filesystem::path(xdg_data_home) / app_identifier).string();
        return result;
    }

    std::string home = home_directory();
    if (home.empty()) {
        result.error_message = "unknown path: neither XDG_DATA_HOME nor HOME is set";
        return result;
    }
    if (home[0] != '/') {
        result.error_message = "unknown path: HOME is not absolute (" + home + ")";
        return result;
    }

    result.success = true;
    result.path = (std::filesystem::path(home) / ".local" / "share" / app_identifier).string();
    return result;
}

std::string home_directory() {
    const char *home = std::getenv("HOME");
    if (home == nullptr) {
        return "";
    }
    return std::string(home);
}

bool read_file_contents(const std::string &file_path, std::string &output_contents,
                        std::string &error_message) {
    int file_descriptor = open(file_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (file_descriptor < 0) {
        error_message = error_text(errno);
        return false;
    }

    std::string contents;
    char buffer[4096];
    while (true) {
        ssize_t bytes_read = read(file_descriptor, buffer, sizeof(buffer));
        if (bytes_read > 0) {
            contents.append(buffer, static_cast<size_t>(bytes_read));
            continue;
        }
        if (bytes_read == 0) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        // e.g. EISDIR when the path names a directory.
        error_message = error_text(errno);
        close(file_descriptor);
        return false;
    }

    close(file_descriptor);
    output_contents = std::move(contents);
    return true;
}

bool write_file_contents(const std::string &file_path, const std::string &contents,
                         std::string &error_message) {
    int file_descriptor = open(file_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (file_descriptor < 0) {
        error_message = error_text(errno);
        return false;
    }

    size_t written_total = 0;
    while (written_total < contents.size()) {
        ssize_t bytes_written = write(file_descriptor, contents.data() + written_total,
                                      contents.size() - written_total);
        if (bytes_written < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_message = error_text(errno);
            close(file_descriptor);
            return false;
        }
        written_total += static_cast<size_t>(bytes_written);
    }

    if (close(file_descriptor) != 0) {
        error_message = error_text(errno);
        return false;
    }
    return true;
}

} // namespace platform
