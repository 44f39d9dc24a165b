#include "toolbridge/router.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"

namespace toolbridge {

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

void Router::set_builtin_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    builtin_requests_[method] = std::move(handler);
}

void Router::set_builtin_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    builtin_notifications_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0
        || builtin_requests_.count(method) > 0 || builtin_notifications_.count(method) > 0;
}

std::optional<RequestHandler> Router::find_request(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = request_handlers_.find(method);
    if (it != request_handlers_.end()) return it->second;
    it = builtin_requests_.find(method);
    if (it != builtin_requests_.end()) return it->second;
    return std::nullopt;
}

std::optional<NotificationHandler> Router::find_notification(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = notification_handlers_.find(method);
    if (it != notification_handlers_.end()) return it->second;
    it = builtin_notifications_.find(method);
    if (it != builtin_notifications_.end()) return it->second;
    return std::nullopt;
}

void Router::notify(const std::string& method, const nlohmann::json& params) {
    auto handler = find_notification(method);
    if (!handler) {
        LOG4CPLUS_DEBUG(logging::server(), "No handler for notification '" << method << "'");
        return;
    }
    // Handlers run without the lock held so they may register further handlers.
    try {
        (*handler)(params);
    } catch (const std::exception& e) {
        LOG4CPLUS_WARN(logging::server(),
            "Notification handler for '" << method << "' failed: " << e.what());
    }
}

std::optional<JsonRpcMessage> Router::dispatch(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        nlohmann::json params = req->params ? *req->params : nlohmann::json::object();

        // An id on a notifications/* method does not earn it a reply.
        if (is_notification_method(req->method)) {
            notify(req->method, params);
            return std::nullopt;
        }

        auto handler = find_request(req->method);
        if (!handler) {
            return make_error(req->id, error::MethodNotFound, "Method not found: " + req->method);
        }

        try {
            auto result = (*handler)(params);
            if (auto* err = std::get_if<JsonRpcError>(&result)) {
                JsonRpcResponse resp;
                resp.id = req->id;
                resp.error = std::move(*err);
                return resp;
            }
            return make_result(req->id, std::get<nlohmann::json>(std::move(result)));
        } catch (const std::exception& e) {
            JsonRpcError err = error_from_exception(e);
            if (err.code == error::InternalError) {
                LOG4CPLUS_ERROR(logging::server(),
                    "Handler for '" << req->method << "' threw: " << e.what());
            }
            JsonRpcResponse resp;
            resp.id = req->id;
            resp.error = std::move(err);
            return resp;
        }
    } else if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        notify(notif->method, notif->params ? *notif->params : nlohmann::json::object());
        return std::nullopt;
    }

    // Responses are not dispatched.
    return std::nullopt;
}

} // namespace toolbridge
