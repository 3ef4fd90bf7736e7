#ifndef GDSJAMD_BRIDGE_DISPATCH_HPP
#define GDSJAMD_BRIDGE_DISPATCH_HPP

// JSON-RPC method dispatch for the viewer protocol.

#include <nlohmann/json.hpp>

namespace backend_context {
class BackendContext;
}

namespace bridge_dispatch {

using json = nlohmann::json;

// Protocol revision reported by initialize.
static const char PROTOCOL_VERSION[] = "2025-01-15";

// Dispatch a single JSON-RPC message. Returns the response JSON, or a null
// json value for notifications (which require no response).
json dispatch_message(backend_context::BackendContext &context, const json &message);

} // namespace bridge_dispatch

#endif // GDSJAMD_BRIDGE_DISPATCH_HPP
