#include "bridge/command_registry.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <exception>
#include <mutex>

namespace command_registry {

// Global command registry (module-level, not class-based). Filled at startup,
// read concurrently by worker threads.
static std::vector<CommandDefinition> registered_commands;
static std::mutex registry_mutex;

CommandResult succeed(json value) {
    CommandResult result;
    result.success = true;
    result.value = std::move(value);
    return result;
}

CommandResult fail(const std::string &error_message) {
    CommandResult result;
    result.success = false;
    result.error_message = error_message;
    return result;
}

void register_command(const CommandDefinition &definition) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto existing = std::find_if(registered_commands.begin(), registered_commands.end(),
                                 [&](const CommandDefinition &command) { return command.name == definition.name; });
    if (existing != registered_commands.end()) {
        *existing = definition;
        return;
    }
    registered_commands.push_back(definition);
}

json build_commands_list_response() {
    json commands_array = json::array();
    for (const auto &command : get_registered_commands()) {
        json command_entry;
        command_entry["name"] = command.name;
        command_entry["description"] = command.description;
        command_entry["inputSchema"] = command.input_schema;
        commands_array.push_back(command_entry);
    }

    json result;
    result["commands"] = commands_array;
    return result;
}

json to_invoke_result(const CommandResult &result) {
    json payload;
    payload["isError"] = !result.success;
    if (result.success) {
        payload["value"] = result.value;
    } else {
        payload["error"] = result.error_message;
    }
    return payload;
}

json dispatch_command(backend_context::BackendContext &context,
                      const std::string &command_name,
                      const json &arguments) {
    CommandHandler handler;
    {
        std::lock_guard<std::mutex> lock(registry_mutex);
        for (const auto &command : registered_commands) {
            if (command.name == command_name) {
                handler = command.handler;
                break;
            }
        }
    }

    if (!handler) {
        return to_invoke_result(fail("Unknown command: " + command_name));
    }

    try {
        return to_invoke_result(handler(context, arguments));
    } catch (const std::exception &exception) {
        debug_log::error(command_name + " threw: " + exception.what());
        return to_invoke_result(fail(command_name + " failed: " + exception.what()));
    }
}

std::vector<CommandDefinition> get_registered_commands() {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return registered_commands;
}

} // namespace command_registry
