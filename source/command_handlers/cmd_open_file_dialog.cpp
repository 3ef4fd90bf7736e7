#include "command_handlers/command_handlers.hpp"
#include "bridge/command_registry.hpp"
#include "backend/backend_context.hpp"
#include "dialog/file_dialog.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static const char DIALOG_TITLE[] = "Open GDS File";

static command_registry::CommandResult handle_open_file_dialog(backend_context::BackendContext &context,
                                                               const json &arguments) {
    (void)arguments;

    debug_log::log("open_file_dialog invoked");
    file_dialog::DialogResult dialog_result = file_dialog::pick_file(DIALOG_TITLE,
                                                                     file_dialog::layout_file_filter(),
                                                                     context.config().dialog_preference,
                                                                     context.dialog_environment());

    if (!dialog_result.success) {
        return command_registry::fail(dialog_result.error_message);
    }

    return command_registry::succeed(command_handlers::optional_path_value(dialog_result.path));
}

namespace cmd_open_file_dialog {

void register_command() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    command_registry::register_command({
        "open_file_dialog",
        "Show a native open-file dialog filtered to GDS Files (gds, gdsii, dxf). "
        "Returns the chosen absolute path, or null if the dialog was cancelled.",
        input_schema,
        handle_open_file_dialog
    });
}

} // namespace cmd_open_file_dialog
