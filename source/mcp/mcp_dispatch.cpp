#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

namespace mcp_dispatch {

static const char *const SUPPORTED_PROTOCOL_VERSIONS[] = {
    "2024-11-05",
    "2025-03-26",
    "2025-06-18",
};

bool is_supported_protocol_version(const std::string &version) {
    for (const char *supported : SUPPORTED_PROTOCOL_VERSIONS) {
        if (version == supported) {
            return true;
        }
    }
    return false;
}

// Handle the "initialize" request.
json Dispatcher::handle_initialize(const json &request_id, const json &params) const {
    std::string protocol_version = PROTOCOL_VERSION;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        std::string requested = params["protocolVersion"].get<std::string>();
        if (is_supported_protocol_version(requested)) {
            protocol_version = requested;
        } else {
            debug_log::log("Client requested unsupported protocol version " + requested +
                           ", answering with " + protocol_version);
        }
    }

    json capabilities;
    capabilities["tools"] = json::object(); // We expose tools.

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;

    json result;
    result["protocolVersion"] = protocol_version;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/list" request.
json Dispatcher::handle_tools_list(const json &request_id) const {
    return json_rpc::build_response(request_id, registry_.build_tools_list_response());
}

// Handle the "tools/call" request.
json Dispatcher::handle_tools_call(const json &request_id, const json &params) const {
    std::string tool_name;
    if (params.contains("name") && params["name"].is_string()) {
        tool_name = params["name"].get<std::string>();
    } else {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Missing or invalid 'name' in tools/call");
    }

    json arguments = json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        arguments = params["arguments"];
    }

    tool_result::ToolOutcome outcome = registry_.dispatch(tool_name, arguments);
    return json_rpc::build_response(request_id, tool_result::to_json(outcome));
}

json Dispatcher::dispatch_message(const json &message) const {
    if (!json_rpc::is_well_formed_request(message)) {
        // A client response to a server request: nothing to answer.
        if (message.is_object() && !message.contains("method") &&
            (message.contains("result") || message.contains("error"))) {
            return nullptr;
        }
        json request_id = json_rpc::get_id(message);
        if (!request_id.is_string() && !request_id.is_number()) {
            request_id = nullptr;
        }
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST, "Invalid Request");
    }

    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    // Handle notifications (no response expected).
    if (json_rpc::is_notification(message)) {
        debug_log::log("Notification received: " + method);
        return nullptr;
    }

    debug_log::log("Request received: " + method);

    // Route to the appropriate handler.
    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }
    if (method == "tools/list") {
        return handle_tools_list(request_id);
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params);
    }

    // Unknown method.
    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                          "Unknown method: " + method);
}

} // namespace mcp_dispatch
