#include "command_handlers/command_handlers.hpp"
#include "bridge/command_registry.hpp"
#include "backend/backend_context.hpp"
#include "storage/last_file_store.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static command_registry::CommandResult handle_save_last_file_path(backend_context::BackendContext &context,
                                                                  const json &arguments) {
    auto path = command_handlers::get_string_argument(arguments, "path");
    if (!path) {
        return command_registry::fail("save_last_file_path requires a string path.");
    }

    debug_log::log("save_last_file_path invoked");
    last_file_store::SaveResult save_result =
        last_file_store::save(backend_config::resolve_data_directory(context.config()), *path);

    if (!save_result.success) {
        return command_registry::fail(save_result.error_message);
    }

    return command_registry::succeed();
}

namespace cmd_save_last_file_path {

void register_command() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"path", {{"type", "string"}, {"description", "Path to remember; stored verbatim."}}}
    };
    input_schema["required"] = json::array({"path"});

    command_registry::register_command({
        "save_last_file_path",
        "Overwrite the last opened file marker in the app data directory with path.",
        input_schema,
        handle_save_last_file_path
    });
}

} // namespace cmd_save_last_file_path
