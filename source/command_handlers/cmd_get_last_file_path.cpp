#include "command_handlers/command_handlers.hpp"
#include "bridge/command_registry.hpp"
#include "backend/backend_context.hpp"
#include "storage/last_file_store.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static command_registry::CommandResult handle_get_last_file_path(backend_context::BackendContext &context,
                                                                 const json &arguments) {
    (void)arguments;

    debug_log::log("get_last_file_path invoked");
    last_file_store::LoadResult load_result =
        last_file_store::load(backend_config::resolve_data_directory(context.config()));

    if (!load_result.success) {
        return command_registry::fail(load_result.error_message);
    }

    return command_registry::succeed(command_handlers::optional_path_value(load_result.path));
}

namespace cmd_get_last_file_path {

void register_command() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    command_registry::register_command({
        "get_last_file_path",
        "Read the last opened file path from the app data directory. Returns null if none was saved.",
        input_schema,
        handle_get_last_file_path
    });
}

} // namespace cmd_get_last_file_path
