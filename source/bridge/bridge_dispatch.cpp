#include "bridge/bridge_dispatch.hpp"
#include "bridge/command_registry.hpp"
#include "bridge/notification_channel.hpp"
#include "protocol/json_rpc.hpp"

#include <string>

// Routes incoming viewer messages to the appropriate handler.

namespace bridge_dispatch {

// Server info.
static const std::string SERVER_NAME = "gdsjamd";
static const std::string SERVER_VERSION = "0.1.0";
static const std::string SERVER_DESCRIPTION =
    "Native backend of the GDS layout viewer: native file picker, single-file change "
    "watching, and the last opened file marker.";

// Handle the "initialize" request.
static json handle_initialize(const json &request_id, const json &params) {
    (void)params; // Any client capabilities are accepted.

    json capabilities;
    capabilities["commands"] = json::object();
    capabilities["events"] = json::array({notification_channel::FILE_CHANGED_EVENT});

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

// Handle the "commands/list" request.
static json handle_commands_list(const json &request_id, const json &params) {
    (void)params;
    json result = command_registry::build_commands_list_response();
    return json_rpc::build_response(request_id, result);
}

// Handle the "commands/invoke" request.
static json handle_commands_invoke(backend_context::BackendContext &context,
                                   const json &request_id, const json &params) {
    std::string command_name;
    if (params.contains("name") && params["name"].is_string()) {
        command_name = params["name"].get<std::string>();
    } else {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Missing or invalid 'name' in commands/invoke");
    }

    json arguments = json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        arguments = params["arguments"];
    }

    json command_result = command_registry::dispatch_command(context, command_name, arguments);
    return json_rpc::build_response(request_id, command_result);
}

json dispatch_message(backend_context::BackendContext &context, const json &message) {
    if (!message.is_object()) {
        return json_rpc::build_error_response(nullptr, json_rpc::INVALID_REQUEST, "Request must be a JSON object");
    }

    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    // Notifications from the viewer (e.g. "notifications/initialized") need no response.
    if (json_rpc::is_notification(message)) {
        return nullptr;
    }

    if (method.empty()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST, "Request has no method");
    }

    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "commands/list") {
        return handle_commands_list(request_id, params);
    }
    if (method == "commands/invoke") {
        return handle_commands_invoke(context, request_id, params);
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                          "Unknown method: " + method);
}

} // namespace bridge_dispatch
