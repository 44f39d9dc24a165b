#include "toolbridge/server.hpp"
#include "toolbridge/codec.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"
#include "toolbridge/worker_client.hpp"
#include "toolbridge/transport/stdio_transport.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <queue>
#include <thread>
#include <unordered_map>

namespace toolbridge {

// ----------- Pager helper -----------

template<typename T>
struct PagedStore {
    std::vector<T> items;
    size_t page_size = 50;

    // returns items starting from cursor, and next_cursor
    std::pair<std::vector<T>, std::optional<std::string>>
    page(const std::optional<std::string>& cursor) const {
        size_t start = 0;
        if (cursor) {
            if (cursor->empty() || !std::all_of(cursor->begin(), cursor->end(),
                                                [](char c) { return c >= '0' && c <= '9'; })) {
                throw ProtocolError(error::InvalidParams, "Invalid cursor: " + *cursor);
            }
            try {
                start = std::stoull(*cursor);
            } catch (const std::out_of_range&) {
                throw ProtocolError(error::InvalidParams, "Invalid cursor: " + *cursor);
            }
        }
        if (start >= items.size()) {
            return {{}, std::nullopt};
        }
        size_t end = start + std::min(page_size, items.size() - start);
        std::vector<T> page_items(items.begin() + start, items.begin() + end);
        std::optional<std::string> next;
        if (end < items.size()) next = std::to_string(end);
        return {page_items, next};
    }
};

// ----------- BridgeServer::Impl -----------

struct BridgeServer::Impl {
    Options opts;
    Router router;

    mutable std::mutex store_mutex;
    PagedStore<ToolDefinition> tools;
    std::unordered_map<std::string, ToolHandler> tool_handlers;

    std::shared_ptr<WorkerClient> worker;

    // Session state
    std::atomic<bool> initialized{false};
    std::mutex session_mutex;
    std::optional<Implementation> client_info;
    std::string client_protocol_version;

    ITransport* transport{nullptr};
    std::mutex transport_mutex;
    std::atomic<bool> running{false};

    // Thread pool
    std::vector<std::thread> thread_pool;
    std::queue<std::function<void()>> task_queue;
    std::mutex pool_mutex;
    std::condition_variable pool_cv;
    std::atomic<bool> pool_running{false};

    explicit Impl(Options o) : opts(std::move(o)) {
        tools.page_size = opts.page_size;
        setup_handlers();
    }

    void start_thread_pool() {
        pool_running = true;
        int n = std::max(1, opts.thread_pool_size);
        for (int i = 0; i < n; ++i) {
            thread_pool.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(pool_mutex);
                        pool_cv.wait(lock, [this] {
                            return !task_queue.empty() || !pool_running;
                        });
                        if (!pool_running && task_queue.empty()) return;
                        task = std::move(task_queue.front());
                        task_queue.pop();
                    }
                    task();
                }
            });
        }
    }

    // Queued requests are still answered before the workers exit.
    void stop_thread_pool() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            pool_running = false;
        }
        pool_cv.notify_all();
        for (auto& t : thread_pool) {
            if (t.joinable()) t.join();
        }
        thread_pool.clear();
    }

    void dispatch_to_pool(std::function<void()> fn) {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            task_queue.push(std::move(fn));
        }
        pool_cv.notify_one();
    }

    void send_message(const JsonRpcMessage& msg) {
        std::lock_guard<std::mutex> lock(transport_mutex);
        if (!transport) return;
        try {
            transport->send(msg);
        } catch (const TransportError& e) {
            LOG4CPLUS_DEBUG(logging::server(), "Dropping reply: " << e.what());
        }
    }

    ServerCapabilities build_capabilities() const {
        ServerCapabilities caps;
        caps.tools = nlohmann::json{{"listChanged", true}};
        return caps;
    }

    nlohmann::json call_tool(const std::string& name, const nlohmann::json& arguments) {
        ToolHandler handler;
        {
            std::lock_guard<std::mutex> lock(store_mutex);
            auto it = tool_handlers.find(name);
            if (it == tool_handlers.end()) {
                throw ProtocolError(error::InvalidParams, "Unknown tool: " + name);
            }
            handler = it->second;
        }

        CallToolResult result;
        try {
            result = CallToolResult::from_value(handler(arguments));
        } catch (const BridgeError&) {
            // ProtocolError, timeouts and worker failures become JSON-RPC errors.
            throw;
        } catch (const std::exception& e) {
            LOG4CPLUS_WARN(logging::server(), "Tool '" << name << "' failed: " << e.what());
            result = CallToolResult::failure("Error executing " + name + ": " + e.what());
        }
        return nlohmann::json(result);
    }

    void setup_handlers() {
        // initialize
        router.set_builtin_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            {
                std::lock_guard<std::mutex> lock(session_mutex);
                client_protocol_version = params.value("protocolVersion", std::string(PROTOCOL_VERSION));
                if (params.contains("clientInfo") && params.at("clientInfo").is_object()) {
                    client_info = params.at("clientInfo").get<Implementation>();
                }
                LOG4CPLUS_INFO(logging::server(), "Initialize from "
                    << (client_info ? client_info->name : std::string("unknown client"))
                    << " (protocol " << client_protocol_version << ")");
            }

            InitializeResult result;
            result.protocol_version = std::string(PROTOCOL_VERSION);
            result.capabilities = build_capabilities();
            result.server_info = opts.server_info;
            result.instructions = opts.instructions;
            return nlohmann::json(result);
        });

        // notifications/initialized
        router.set_builtin_notification("notifications/initialized", [this](const nlohmann::json&) {
            initialized = true;
            LOG4CPLUS_DEBUG(logging::server(), "Client initialized");
        });

        // ping
        router.set_builtin_request("ping", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json::object();
        });

        // tools/list
        router.set_builtin_request("tools/list", [this](const nlohmann::json& params) -> HandlerResult {
            std::optional<std::string> cursor;
            if (params.contains("cursor") && !params.at("cursor").is_null()) {
                if (!params.at("cursor").is_string()) {
                    return JsonRpcError{error::InvalidParams, "cursor must be a string", std::nullopt};
                }
                cursor = params.at("cursor").get<std::string>();
            }
            std::lock_guard<std::mutex> lock(store_mutex);
            auto [items, next] = tools.page(cursor);
            nlohmann::json result = {{"tools", items}};
            if (next) result["nextCursor"] = *next;
            return result;
        });

        // tools/call
        router.set_builtin_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            if (!params.contains("name") || !params.at("name").is_string()) {
                return JsonRpcError{error::InvalidParams, "tools/call requires a string 'name'", std::nullopt};
            }
            std::string name = params.at("name").get<std::string>();
            nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
            if (!arguments.is_object()) {
                return JsonRpcError{error::InvalidParams, "'arguments' must be an object", std::nullopt};
            }
            return nlohmann::json(call_tool(name, arguments));
        });
    }

    void on_message(JsonRpcMessage msg) {
        // Requests may block on the worker; keep them off the reader thread.
        if (std::holds_alternative<JsonRpcRequest>(msg)) {
            dispatch_to_pool([this, msg = std::move(msg)] {
                if (auto reply = router.dispatch(msg)) send_message(*reply);
            });
            return;
        }
        if (std::holds_alternative<JsonRpcResponse>(msg)) {
            LOG4CPLUS_DEBUG(logging::server(), "Ignoring response from client for id "
                << to_string(std::get<JsonRpcResponse>(msg).id));
            return;
        }
        // Notifications run in arrival order.
        (void)router.dispatch(msg);
    }

    void on_transport_error(std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const ParseError& e) {
            send_message(make_error(nullptr, error::ParseError, "Parse error", nlohmann::json(e.what())));
        } catch (const std::exception& e) {
            LOG4CPLUS_ERROR(logging::server(), "Transport error: " << e.what());
        }
    }
};

// ----------- BridgeServer -----------

BridgeServer::BridgeServer(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {}

BridgeServer::~BridgeServer() {
    shutdown();
}

void BridgeServer::add_tool(ToolDefinition def, ToolHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->store_mutex);
    auto& items = impl_->tools.items;
    items.erase(std::remove_if(items.begin(), items.end(),
        [&def](const ToolDefinition& t) { return t.name == def.name; }), items.end());
    impl_->tool_handlers[def.name] = std::move(handler);
    LOG4CPLUS_DEBUG(logging::server(), "Registered tool '" << def.name << "'");
    items.push_back(std::move(def));
}

void BridgeServer::remove_tool(const std::string& name) {
    std::lock_guard<std::mutex> lock(impl_->store_mutex);
    auto& items = impl_->tools.items;
    items.erase(std::remove_if(items.begin(), items.end(),
        [&name](const ToolDefinition& t) { return t.name == name; }), items.end());
    impl_->tool_handlers.erase(name);
}

std::vector<ToolDefinition> BridgeServer::tools() const {
    std::lock_guard<std::mutex> lock(impl_->store_mutex);
    return impl_->tools.items;
}

void BridgeServer::attach_worker(std::shared_ptr<WorkerClient> worker) {
    std::lock_guard<std::mutex> lock(impl_->store_mutex);
    impl_->worker = std::move(worker);
}

void BridgeServer::add_worker_tool(ToolDefinition def, std::string worker_method,
                                   std::optional<std::chrono::milliseconds> timeout) {
    std::shared_ptr<WorkerClient> worker;
    {
        std::lock_guard<std::mutex> lock(impl_->store_mutex);
        worker = impl_->worker;
    }
    if (!worker) {
        throw BridgeError("Cannot add worker tool '" + def.name + "': no worker attached");
    }
    if (worker_method.empty()) worker_method = def.name;

    add_tool(std::move(def), [worker, worker_method, timeout](const nlohmann::json& arguments) {
        if (timeout) return worker->call(worker_method, arguments, *timeout);
        return worker->call(worker_method, arguments);
    });
}

void BridgeServer::on_request(const std::string& method, RequestHandler handler) {
    impl_->router.on_request(method, std::move(handler));
}

void BridgeServer::on_notification(const std::string& method, NotificationHandler handler) {
    impl_->router.on_notification(method, std::move(handler));
}

std::optional<JsonRpcMessage> BridgeServer::handle(const JsonRpcMessage& msg) {
    return impl_->router.dispatch(msg);
}

std::optional<std::string> BridgeServer::handle_line(std::string_view line) {
    std::optional<JsonRpcMessage> reply;
    try {
        reply = handle(Codec::parse(line));
    } catch (const ParseError& e) {
        LOG4CPLUS_WARN(logging::codec(), "Undecodable line: " << e.what());
        reply = make_error(nullptr, error::ParseError, "Parse error", nlohmann::json(e.what()));
    }
    if (!reply) return std::nullopt;
    return Codec::serialize(*reply);
}

void BridgeServer::serve(std::unique_ptr<ITransport> transport) {
    if (impl_->running.exchange(true)) {
        throw BridgeError("Server is already serving");
    }
    impl_->start_thread_pool();

    auto* t = transport.get();
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = t;
    }
    LOG4CPLUS_INFO(logging::server(), "Serving " << impl_->opts.server_info.name
                   << " " << impl_->opts.server_info.version);

    t->start([this](JsonRpcMessage msg) { impl_->on_message(std::move(msg)); },
             [this](std::exception_ptr ep) { impl_->on_transport_error(ep); });

    // Input is done; answer what is already queued, then flush the writer.
    impl_->stop_thread_pool();
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
    }
    transport.reset();
    impl_->running = false;
    LOG4CPLUS_INFO(logging::server(), "Stopped serving");
}

void BridgeServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void BridgeServer::shutdown() {
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        if (impl_->transport) {
            impl_->transport->shutdown();
        }
    }
    std::shared_ptr<WorkerClient> worker;
    {
        std::lock_guard<std::mutex> lock(impl_->store_mutex);
        worker = impl_->worker;
    }
    if (worker) worker->shutdown();
}

bool BridgeServer::is_running() const {
    return impl_->running;
}

bool BridgeServer::is_initialized() const {
    return impl_->initialized;
}

} // namespace toolbridge
