#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "router.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge {

class WorkerClient;

/// A tool's implementation: arguments in, JSON value out. Throwing a
/// ProtocolError (or any BridgeError) turns into a JSON-RPC error response;
/// any other exception is reported in-band as an isError result.
using ToolHandler = std::function<nlohmann::json(const nlohmann::json& arguments)>;

class BridgeServer {
public:
    struct Options {
        Implementation server_info{"toolbridge", std::string(LIBRARY_VERSION)};
        std::optional<std::string> instructions;
        int thread_pool_size = 4;
        size_t page_size = 50;
    };

    explicit BridgeServer(Options opts);
    ~BridgeServer();

    // Non-copyable, non-movable
    BridgeServer(const BridgeServer&) = delete;
    BridgeServer& operator=(const BridgeServer&) = delete;

    // ---- Tool registration ----
    void add_tool(ToolDefinition def, ToolHandler handler);
    void remove_tool(const std::string& name);
    [[nodiscard]] std::vector<ToolDefinition> tools() const;

    // ---- Worker ----

    /// Hand the server a worker. It is shut down together with the server.
    void attach_worker(std::shared_ptr<WorkerClient> worker);

    /// Register a tool whose calls are forwarded to the attached worker as
    /// `worker_method` (the tool name when empty). Throws BridgeError if no
    /// worker is attached.
    void add_worker_tool(ToolDefinition def, std::string worker_method = {},
                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // ---- Custom handlers (take precedence over the built-ins) ----
    void on_request(const std::string& method, RequestHandler handler);
    void on_notification(const std::string& method, NotificationHandler handler);

    // ---- Dispatch ----

    /// Handle one decoded message; returns the reply, if one is due.
    [[nodiscard]] std::optional<JsonRpcMessage> handle(const JsonRpcMessage& msg);

    /// Handle one raw line; returns the encoded reply without its newline.
    /// An undecodable line is answered with a parse error and a null id.
    [[nodiscard]] std::optional<std::string> handle_line(std::string_view line);

    // ---- Transport ----
    void serve_stdio();
    void serve(std::unique_ptr<ITransport> transport);

    /// Stop serving, cancel pending worker calls and stop the worker.
    void shutdown();

    [[nodiscard]] bool is_running() const;

    /// True once the client has sent notifications/initialized.
    [[nodiscard]] bool is_initialized() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace toolbridge
