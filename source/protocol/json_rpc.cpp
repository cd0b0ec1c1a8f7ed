#include "protocol/json_rpc.hpp"

namespace json_rpc {

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_parse_error_response(const std::string &detail) {
    json response = build_error_response(nullptr, PARSE_ERROR, "Parse error");
    if (!detail.empty()) {
        response["error"]["data"] = detail;
    }
    return response;
}

bool is_well_formed_request(const json &message) {
    if (!message.is_object()) {
        return false;
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        return false;
    }
    if (message.contains("id")) {
        const json &id = message["id"];
        if (!id.is_string() && !id.is_number() && !id.is_null()) {
            return false;
        }
    }
    return true;
}

std::string get_method(const json &message) {
    if (message.is_object() && message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.is_object() && message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.is_object() && message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return message.is_object() && !message.contains("id");
}

} // namespace json_rpc
