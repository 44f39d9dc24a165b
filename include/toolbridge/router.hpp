#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <optional>
#include <unordered_map>
#include <string>
#include <mutex>

namespace toolbridge {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Method-name dispatch with two layers: handlers registered with on_request()
/// and on_notification() shadow the built-ins of the same name.
class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Built-in layer, consulted when no user handler matches.
    void set_builtin_request(const std::string& method, RequestHandler handler);
    void set_builtin_notification(const std::string& method, NotificationHandler handler);

    /// Dispatch an incoming message. Returns the response to send, if any.
    /// Notifications, requests under "notifications/" and responses never
    /// produce one.
    [[nodiscard]] std::optional<JsonRpcMessage> dispatch(const JsonRpcMessage& msg);

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    using RequestTable = std::unordered_map<std::string, RequestHandler>;
    using NotificationTable = std::unordered_map<std::string, NotificationHandler>;

    std::optional<RequestHandler> find_request(const std::string& method) const;
    std::optional<NotificationHandler> find_notification(const std::string& method) const;
    void notify(const std::string& method, const nlohmann::json& params);

    mutable std::mutex mutex_;
    RequestTable request_handlers_;
    NotificationTable notification_handlers_;
    RequestTable builtin_requests_;
    NotificationTable builtin_notifications_;
};

} // namespace toolbridge
