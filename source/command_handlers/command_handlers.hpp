#ifndef GDSJAMD_COMMAND_HANDLERS_HPP
#define GDSJAMD_COMMAND_HANDLERS_HPP

// Command handler registration.
// Each cmd_*.cpp file provides a register function that is called during startup.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace command_handlers {

// Register all available command handlers with the command registry.
void register_all_commands();

// The string argument named key, or nullopt if it is missing or not a string.
std::optional<std::string> get_string_argument(const nlohmann::json &arguments, const std::string &key);

// Text form of an optional path: the string, or JSON null.
nlohmann::json optional_path_value(const std::optional<std::string> &path);

} // namespace command_handlers

#endif // GDSJAMD_COMMAND_HANDLERS_HPP
