// Tests for JSON-RPC dispatch and the five registered commands, driven the
// same way the viewer drives them: messages in, responses out.

#include "bridge/bridge_dispatch.hpp"
#include "bridge/command_registry.hpp"
#include "backend/backend_context.hpp"
#include "command_handlers/command_handlers.hpp"
#include "protocol/json_rpc.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <string>

using json = nlohmann::json;

namespace test_command_dispatch {

using test_helpers::report;

static std::unique_ptr<backend_context::BackendContext> make_context(const std::string &data_directory) {
    backend_config::BackendConfig config;
    config.data_directory_override = data_directory;
    return std::make_unique<backend_context::BackendContext>(config);
}

static json invoke(backend_context::BackendContext &context, int request_id,
                   const std::string &command_name, const json &arguments) {
    json request;
    request["jsonrpc"] = "2.0";
    request["id"] = request_id;
    request["method"] = "commands/invoke";
    request["params"]["name"] = command_name;
    request["params"]["arguments"] = arguments;
    return bridge_dispatch::dispatch_message(context, request);
}

// Test: initialize reports the file-changed event capability.
static bool test_initialize() {
    auto context = make_context(test_helpers::make_temp_directory("gdsjamd_dispatch"));
    json request = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}, {"params", json::object()}};
    json response = bridge_dispatch::dispatch_message(*context, request);
    return report(response["id"] == 1 &&
                      response["result"]["serverInfo"]["name"] == "gdsjamd" &&
                      response["result"]["capabilities"]["events"] == json::array({"file-changed"}),
                  "initialize returns server info and the file-changed event");
}

// Test: commands/list includes exactly the five commands.
static bool test_commands_list() {
    auto context = make_context(test_helpers::make_temp_directory("gdsjamd_dispatch"));
    json request = {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "commands/list"}};
    json response = bridge_dispatch::dispatch_message(*context, request);

    std::vector<std::string> names;
    for (const auto &command : response["result"]["commands"]) {
        names.push_back(command["name"].get<std::string>());
    }
    return report(names == std::vector<std::string>({"open_file_dialog", "watch_file", "unwatch_file",
                                                     "get_last_file_path", "save_last_file_path"}),
                  "commands/list names the five commands");
}

// Test: save_last_file_path then get_last_file_path through commands/invoke.
static bool test_save_and_get_through_invoke() {
    auto context = make_context(test_helpers::make_temp_directory("gdsjamd_dispatch") + "/app");

    json before = invoke(*context, 3, "get_last_file_path", json::object());
    bool empty_first = report(before["result"]["isError"] == false && before["result"]["value"].is_null(),
                              "get_last_file_path before any save returns null");

    json saved = invoke(*context, 4, "save_last_file_path", {{"path", "/designs/ring.gds\n"}});
    bool save_ok = report(saved["result"]["isError"] == false && saved["result"]["value"].is_null(),
                          "save_last_file_path succeeds");

    json after = invoke(*context, 5, "get_last_file_path", json::object());
    bool round_trip = report(after["id"] == 5 && after["result"]["value"] == "/designs/ring.gds",
                             "get_last_file_path returns the saved path, trimmed");
    return empty_first && save_ok && round_trip;
}

// Test: Missing string arguments are reported as error text.
static bool test_missing_path_argument() {
    auto context = make_context(test_helpers::make_temp_directory("gdsjamd_dispatch"));
    json watch = invoke(*context, 6, "watch_file", json::object());
    json save = invoke(*context, 7, "save_last_file_path", {{"path", 42}});
    return report(watch["result"]["isError"] == true &&
                      watch["result"]["error"] == "watch_file requires a string path." &&
                      save["result"]["isError"] == true &&
                      save["result"]["error"] == "save_last_file_path requires a string path.",
                  "Missing or non-string path yields error text");
}

// Test: watch_file on a missing file returns the watch error; unwatch_file always succeeds.
static bool test_watch_and_unwatch_through_invoke() {
    std::string directory = test_helpers::make_temp_directory("gdsjamd_dispatch");
    auto context = make_context(directory);

    json failed = invoke(*context, 8, "watch_file", {{"path", directory + "/absent.gds"}});
    bool watch_error = report(failed["result"]["isError"] == true &&
                                  failed["result"]["error"].get<std::string>().find("Failed to watch file:") == 0,
                              "watch_file on a missing file returns a watch error");

    std::string present = directory + "/present.gds";
    test_helpers::write_file(present, "x");
    json watched = invoke(*context, 9, "watch_file", {{"path", present}});
    bool watch_ok = report(watched["result"]["isError"] == false &&
                               context->watch_state().current_target() == present,
                           "watch_file on an existing file succeeds and sets the target");

    json unwatched = invoke(*context, 10, "unwatch_file", json::object());
    bool unwatch_ok = report(unwatched["result"]["isError"] == false &&
                                 !context->watch_state().current_target().has_value(),
                             "unwatch_file succeeds and clears the target");
    return watch_error && watch_ok && unwatch_ok;
}

// Test: open_file_dialog maps a cancelled dialog to a null value.
static bool test_open_file_dialog_cancel() {
    auto context = make_context(test_helpers::make_temp_directory("gdsjamd_dispatch"));
    context->dialog_environment().find_executable = [](const std::string &program_name) {
        return "/usr/bin/" + program_name;
    };
    context->dialog_environment().run_process = [](const std::string &, const std::vector<std::string> &) {
        platform::ProcessOutput output;
        output.success = true;
        output.exit_code = 1;
        return output;
    };

    json response = invoke(*context, 11, "open_file_dialog", json::object());
    return report(response["result"]["isError"] == false && response["result"]["value"].is_null(),
                  "open_file_dialog returns null when cancelled");
}

// Test: Unknown command is error text, not a protocol error.
static bool test_unknown_command() {
    auto context = make_context(test_helpers::make_temp_directory("gdsjamd_dispatch"));
    json response = invoke(*context, 12, "format_disk", json::object());
    return report(response["result"]["isError"] == true &&
                      response["result"]["error"] == "Unknown command: format_disk",
                  "Unknown command yields error text");
}

// Test: Protocol-level errors use JSON-RPC codes.
static bool test_protocol_errors() {
    auto context = make_context(test_helpers::make_temp_directory("gdsjamd_dispatch"));

    json unknown_method = bridge_dispatch::dispatch_message(
        *context, {{"jsonrpc", "2.0"}, {"id", 13}, {"method", "files/delete"}});
    json missing_name = bridge_dispatch::dispatch_message(
        *context, {{"jsonrpc", "2.0"}, {"id", 14}, {"method", "commands/invoke"}, {"params", json::object()}});
    json not_object = bridge_dispatch::dispatch_message(*context, json::array({1, 2}));
    json no_method = bridge_dispatch::dispatch_message(*context, {{"jsonrpc", "2.0"}, {"id", 15}});
    json notification = bridge_dispatch::dispatch_message(
        *context, {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});

    return report(unknown_method["error"]["code"] == json_rpc::METHOD_NOT_FOUND &&
                      missing_name["error"]["code"] == json_rpc::INVALID_PARAMS &&
                      not_object["error"]["code"] == json_rpc::INVALID_REQUEST &&
                      no_method["error"]["code"] == json_rpc::INVALID_REQUEST &&
                      no_method["id"] == 15 &&
                      notification.is_null(),
                  "Protocol errors map to JSON-RPC codes and notifications get no reply");
}

// Test: Outbound events are notifications without id or params.
static bool test_file_changed_notification_shape() {
    json notification = json_rpc::build_notification(notification_channel::FILE_CHANGED_EVENT);
    return report(notification == json({{"jsonrpc", "2.0"}, {"method", "file-changed"}}),
                  "file-changed notification has no id and no params");
}

bool run_all_tests() {
    command_handlers::register_all_commands();

    bool all_passed = true;
    all_passed &= test_initialize();
    all_passed &= test_commands_list();
    all_passed &= test_save_and_get_through_invoke();
    all_passed &= test_missing_path_argument();
    all_passed &= test_watch_and_unwatch_through_invoke();
    all_passed &= test_open_file_dialog_cancel();
    all_passed &= test_unknown_command();
    all_passed &= test_protocol_errors();
    all_passed &= test_file_changed_notification_shape();
    return all_passed;
}

} // namespace test_command_dispatch
