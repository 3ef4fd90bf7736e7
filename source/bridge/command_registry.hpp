#ifndef GDSJAMD_COMMAND_REGISTRY_HPP
#define GDSJAMD_COMMAND_REGISTRY_HPP

// Command registry: registration, listing, and dispatch of backend commands.

#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <vector>

namespace backend_context {
class BackendContext;
}

namespace command_registry {

using json = nlohmann::json;

// Outcome of one command: a JSON value on success, human-readable text on failure.
struct CommandResult {
    bool success = false;
    json value;
    std::string error_message;
};

CommandResult succeed(json value = nullptr);
CommandResult fail(const std::string &error_message);

// A command handler: receives the backend context and the arguments object.
using CommandHandler = std::function<CommandResult(backend_context::BackendContext &context,
                                                   const json &arguments)>;

// Description of a registered command, as reported by commands/list.
struct CommandDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    CommandHandler handler;
};

// Register a command. A later registration with the same name replaces the earlier one.
void register_command(const CommandDefinition &definition);

// Build the response payload for commands/list.
json build_commands_list_response();

// Run the named command and wrap its outcome for commands/invoke:
// {"isError": false, "value": ...} or {"isError": true, "error": "..."}.
json dispatch_command(backend_context::BackendContext &context,
                      const std::string &command_name,
                      const json &arguments);

// Wrap a CommandResult in the commands/invoke result shape.
json to_invoke_result(const CommandResult &result);

// Snapshot of all registered command definitions (for testing or introspection).
std::vector<CommandDefinition> get_registered_commands();

} // namespace command_registry

#endif // GDSJAMD_COMMAND_REGISTRY_HPP
