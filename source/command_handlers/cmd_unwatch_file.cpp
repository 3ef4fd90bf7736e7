#include "command_handlers/command_handlers.hpp"
#include "bridge/command_registry.hpp"
#include "backend/backend_context.hpp"
#include "watch/watch_state.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static command_registry::CommandResult handle_unwatch_file(backend_context::BackendContext &context,
                                                           const json &arguments) {
    (void)arguments;

    debug_log::log("unwatch_file invoked");
    context.watch_state().unwatch();
    return command_registry::succeed();
}

namespace cmd_unwatch_file {

void register_command() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    command_registry::register_command({
        "unwatch_file",
        "Clear the watched file.",
        input_schema,
        handle_unwatch_file
    });
}

} // namespace cmd_unwatch_file
