#include "lensbridge/protocol/json_rpc.hpp"

namespace lensbridge {

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::int64_t id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(id),
      params_(std::move(params)) {}

JsonRpcRequest JsonRpcRequest::tool_call(std::int64_t id, std::string name, Json arguments) {
    if (arguments.is_null()) {
        arguments = Json::object();
    }
    Json params = Json::object();
    params["name"] = std::move(name);
    params["arguments"] = std::move(arguments);
    return JsonRpcRequest(std::string(kToolCallMethod), id, std::move(params));
}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

std::int64_t JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = std::string(kJsonRpcVersion);
    payload["method"] = method_;
    payload["id"] = id_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

Json error_envelope(std::string_view message, std::int64_t code) {
    const JsonRpcError error{code, std::string(message)};
    Json envelope = Json::object();
    envelope["error"] = error.to_json();
    return envelope;
}

bool is_error_envelope(const Json& envelope) {
    return envelope.is_object() && envelope.contains("error");
}

std::optional<std::int64_t> response_id(const Json& envelope) {
    if (envelope.is_object() == false) {
        return std::nullopt;
    }
    const auto it = envelope.find("id");
    if (it == envelope.end()) {
        return std::nullopt;
    }
    if (it->is_number_integer()) {
        return it->get<std::int64_t>();
    }
    return std::nullopt;
}

}  // namespace lensbridge
