#include "command_handlers/command_handlers.hpp"
#include "bridge/command_registry.hpp"
#include "backend/backend_context.hpp"
#include "watch/watch_state.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static command_registry::CommandResult handle_watch_file(backend_context::BackendContext &context,
                                                         const json &arguments) {
    auto path = command_handlers::get_string_argument(arguments, "path");
    if (!path) {
        return command_registry::fail("watch_file requires a string path.");
    }

    debug_log::log("watch_file invoked for " + *path);
    watch_state::WatchResult watch_result = context.watch_state().watch(*path);
    if (!watch_result.success) {
        return command_registry::fail(watch_result.error_message);
    }

    return command_registry::succeed();
}

namespace cmd_watch_file {

void register_command() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"path", {{"type", "string"}, {"description", "Absolute path of the file to watch."}}}
    };
    input_schema["required"] = json::array({"path"});

    command_registry::register_command({
        "watch_file",
        "Make path the watched file. Emits a file-changed event (no payload) after each "
        "debounced burst of modifications.",
        input_schema,
        handle_watch_file
    });
}

} // namespace cmd_watch_file
