#include "toolbridge/json_rpc.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/version.hpp"

namespace toolbridge {

std::string to_string(const RequestId& id) {
    if (auto* i = std::get_if<int64_t>(&id)) return std::to_string(*i);
    if (auto* s = std::get_if<std::string>(&id)) return "\"" + *s + "\"";
    return "null";
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    from_json(j.at("id"), r.id);
    r.method = j.at("method").get<std::string>();
    if (j.contains("params")) r.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    if (r.error) {
        j["error"] = *r.error;
    } else {
        // A success response always carries a result member, even if null.
        j["result"] = r.result ? *r.result : nlohmann::json(nullptr);
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    from_json(j.at("id"), r.id);
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void from_json(const nlohmann::json& j, JsonRpcNotification& n) {
    n.method = j.at("method").get<std::string>();
    if (j.contains("params")) n.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

JsonRpcResponse make_result(const RequestId& id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = id;
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse make_error(const RequestId& id, int code, std::string message,
                           std::optional<nlohmann::json> data) {
    JsonRpcResponse resp;
    resp.id = id;
    resp.error = JsonRpcError{code, std::move(message), std::move(data)};
    return resp;
}

bool is_notification_method(const std::string& method) {
    return method.rfind("notifications/", 0) == 0;
}

void throw_error(const JsonRpcError& err) {
    switch (err.code) {
        case error::RequestTimeout:      throw TimeoutError(err.message, err.data);
        case error::WorkerUnavailable:   throw WorkerUnavailableError(err.message, err.data);
        case error::WorkerStartupFailed: throw WorkerStartupError(err.message, err.data);
        case error::RequestCancelled:    throw CancelledError(err.message, err.data);
        default:                         throw ProtocolError(err.code, err.message, err.data);
    }
}

JsonRpcError error_from_exception(const std::exception& e) {
    // Covers the bridge's own coded errors as well.
    if (auto* pe = dynamic_cast<const ProtocolError*>(&e)) {
        return JsonRpcError{pe->code, pe->what(), pe->data};
    }
    return JsonRpcError{error::InternalError, e.what(), std::nullopt};
}

} // namespace toolbridge
