#include "command_handlers/command_handlers.hpp"

// Forward declarations of individual command registration functions.
// Each cmd_*.cpp defines its own namespace with a register_command() function.

namespace cmd_open_file_dialog { void register_command(); }
namespace cmd_watch_file { void register_command(); }
namespace cmd_unwatch_file { void register_command(); }
namespace cmd_get_last_file_path { void register_command(); }
namespace cmd_save_last_file_path { void register_command(); }

namespace command_handlers {

void register_all_commands() {
    cmd_open_file_dialog::register_command();
    cmd_watch_file::register_command();
    cmd_unwatch_file::register_command();
    cmd_get_last_file_path::register_command();
    cmd_save_last_file_path::register_command();
}

std::optional<std::string> get_string_argument(const nlohmann::json &arguments, const std::string &key) {
    if (!arguments.is_object() || !arguments.contains(key) || !arguments[key].is_string()) {
        return std::nullopt;
    }
    return arguments[key].get<std::string>();
}

nlohmann::json optional_path_value(const std::optional<std::string> &path) {
    if (!path) {
        return nullptr;
    }
    return *path;
}

} // namespace command_handlers
