#include "protocol/json_rpc.hpp"

namespace json_rpc {

static json make_envelope(const json &request_id) {
    json envelope;
    envelope["jsonrpc"] = "2.0";
    envelope["id"] = request_id;
    return envelope;
}

json build_response(const json &request_id, const json &result_payload) {
    json response = make_envelope(request_id);
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response = make_envelope(request_id);
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
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
    return message.is_object() && !message.contains("id") && message.contains("method") &&
           message["method"].is_string();
}

bool is_well_formed(const json &message) {
    if (!message.is_object()) {
        return false;
    }
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        return false;
    }
    return message.contains("method") && message["method"].is_string();
}

} // namespace json_rpc
