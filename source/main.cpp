// gdsjamd – native backend of the GDS layout viewer
// Entry point: stdio JSON-RPC loop.
//
// Reads JSON-RPC 2.0 messages from stdin and runs each one on the worker pool.
// Responses and file-changed events are written to stdout; logs go to stderr.

#include <nlohmann/json.hpp>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

#include "backend/backend_config.hpp"
#include "backend/backend_context.hpp"
#include "bridge/bridge_dispatch.hpp"
#include "bridge/bridge_stdio.hpp"
#include "bridge/notification_channel.hpp"
#include "bridge/worker_pool.hpp"
#include "command_handlers/command_handlers.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

// No SA_RESTART: a signal interrupts the blocking stdin read so the loop can exit.
static void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

// Paths may carry bytes that are not UTF-8; never let serialization throw.
static std::string serialize(const json &message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

int main() {
    bridge_stdio::log_message("gdsjamd – GDS viewer backend, build " + std::string(__DATE__) + " " + __TIME__);

    install_signal_handlers();

    backend_config::BackendConfig config = backend_config::load_from_environment();
    command_handlers::register_all_commands();

    auto context = std::make_unique<backend_context::BackendContext>(config);

    // Drains file-changed events from watcher threads onto stdout.
    std::thread notification_pump([&context]() {
        while (auto notification = context->notifications().receive()) {
            bridge_stdio::write_message(serialize(json_rpc::build_notification(notification->event)));
        }
    });

    worker_pool::WorkerPool pool(config.worker_count);

    bridge_stdio::log_message("Backend started (watch mode " +
                              std::string(backend_config::watch_mode_name(config.watch_mode)) +
                              "). Waiting for messages on stdin.");

    while (!shutdown_requested) {
        std::string raw_message = bridge_stdio::read_message();

        if (raw_message.empty()) {
            // EOF on stdin means the viewer went away.
            debug_log::log(shutdown_requested ? "Signal received." : "EOF on stdin.");
            break;
        }

        json parsed_message;
        try {
            parsed_message = json::parse(raw_message);
        } catch (const json::parse_error &error) {
            debug_log::error("Failed to parse incoming JSON: " + std::string(error.what()));
            json error_response = json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error");
            bridge_stdio::write_message(serialize(error_response));
            continue;
        }

        backend_context::BackendContext *context_pointer = context.get();
        bool submitted = pool.submit([context_pointer, parsed_message]() {
            json response = bridge_dispatch::dispatch_message(*context_pointer, parsed_message);

            // Notifications return null (no response needed).
            if (response.is_null()) {
                return;
            }
            bridge_stdio::write_message(serialize(response));
        });
        if (!submitted) {
            debug_log::error("Worker pool is shut down; dropping request");
        }
    }

    // In-flight commands finish first, the pump drains what is queued, then watchers are released.
    pool.shutdown();
    context->notifications().close();
    notification_pump.join();
    context.reset();

    bridge_stdio::log_message("Backend shut down.");
    return 0;
}
