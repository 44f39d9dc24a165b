#pragma once
#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>

namespace toolbridge {

/// Null is only legal on a response to a request whose id could not be read.
using RequestId = std::variant<std::nullptr_t, int64_t, std::string>;

inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_null()) {
        id = nullptr;
    } else if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be integer, string or null");
    }
}

/// Printable form of an id, for logs and error messages.
std::string to_string(const RequestId& id);

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

inline void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.value("message", std::string{});
    if (j.contains("data")) e.data = j.at("data");
}

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcNotification& o) const {
        return method == o.method && params == o.params;
    }
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

void to_json(nlohmann::json& j, const JsonRpcNotification& n);
void from_json(const nlohmann::json& j, JsonRpcNotification& n);

void to_json(nlohmann::json& j, const JsonRpcMessage& m);

// ---- Construction helpers ----

JsonRpcResponse make_result(const RequestId& id, nlohmann::json result);
JsonRpcResponse make_error(const RequestId& id, int code, std::string message,
                           std::optional<nlohmann::json> data = std::nullopt);

/// Methods under this prefix never receive a response, even when sent with an id.
bool is_notification_method(const std::string& method);

// ---- Error object <-> exception mapping ----

/// Throws the typed exception matching the error's code: TimeoutError,
/// WorkerUnavailableError, WorkerStartupError, CancelledError, or
/// ProtocolError for everything else.
[[noreturn]] void throw_error(const JsonRpcError& err);

/// Inverse of throw_error. Unrecognised exceptions map to InternalError.
JsonRpcError error_from_exception(const std::exception& e);

} // namespace toolbridge
