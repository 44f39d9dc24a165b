#include "toolbridge/worker_client.hpp"
#include "toolbridge/codec.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"
#include <atomic>

namespace toolbridge {

struct WorkerClient::Impl {
    Options opts;
    CorrelationTable table;
    WorkerSupervisor supervisor;
    std::atomic<int64_t> next_id{1};
    std::atomic<bool> shut_down{false};

    explicit Impl(Options o)
        : opts(std::move(o)), supervisor(opts.worker) {
        supervisor.on_message([this](JsonRpcMessage msg) { handle_message(std::move(msg)); });
        supervisor.on_crash([this](const std::string& reason) {
            size_t n = table.fail_all(JsonRpcError{
                error::WorkerUnavailable, "Worker process exited: " + reason, std::nullopt});
            if (n > 0) {
                LOG4CPLUS_WARN(logging::worker(), "Failed " << n << " pending call(s) after worker exit");
            }
        });
    }

    void handle_message(JsonRpcMessage msg) {
        if (auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
            if (!table.resolve(*resp)) {
                LOG4CPLUS_DEBUG(logging::worker(),
                    "Discarding orphan response for id " << to_string(resp->id));
            }
        } else if (auto* req = std::get_if<JsonRpcRequest>(&msg)) {
            // The worker only answers; refuse anything it asks so it is not left waiting.
            LOG4CPLUS_WARN(logging::worker(), "Worker sent unexpected request '" << req->method << "'");
            try {
                supervisor.send_line(Codec::encode(make_error(
                    req->id, error::MethodNotFound, "Method not found: " + req->method)));
            } catch (const WorkerUnavailableError& e) {
                LOG4CPLUS_DEBUG(logging::worker(), "Could not refuse worker request: " << e.what());
            }
        } else {
            const auto& note = std::get<JsonRpcNotification>(msg);
            LOG4CPLUS_DEBUG(logging::worker(), "Ignoring worker notification '" << note.method << "'");
        }
    }

    std::future<CallOutcome> start_call(const std::string& method, const nlohmann::json& params,
                                        std::chrono::milliseconds timeout) {
        if (shut_down.load()) {
            throw CancelledError("Call '" + method + "' rejected: worker client is shut down");
        }
        supervisor.ensure_running();

        int64_t id = next_id.fetch_add(1);
        auto completion = table.register_call(id, method, CorrelationTable::Clock::now() + timeout);

        JsonRpcRequest req{id, method, params};
        try {
            std::string line = Codec::encode(req);
            LOG4CPLUS_TRACE(logging::worker(), "-> worker: " << line.substr(0, line.size() - 1));
            supervisor.send_line(line);
        } catch (const WorkerUnavailableError& e) {
            table.resolve(id, CallOutcome{JsonRpcError{error::WorkerUnavailable, e.what(), std::nullopt}});
        }
        return completion;
    }

    static nlohmann::json finish(std::future<CallOutcome>& completion) {
        CallOutcome outcome = completion.get();
        if (auto* err = std::get_if<JsonRpcError>(&outcome)) {
            throw_error(*err);
        }
        return std::get<nlohmann::json>(std::move(outcome));
    }
};

WorkerClient::WorkerClient(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {}

WorkerClient::~WorkerClient() {
    shutdown();
}

nlohmann::json WorkerClient::call(const std::string& method, const nlohmann::json& params) {
    return call(method, params, impl_->opts.request_timeout);
}

nlohmann::json WorkerClient::call(const std::string& method, const nlohmann::json& params,
                                  std::chrono::milliseconds timeout) {
    auto completion = impl_->start_call(method, params, timeout);
    return Impl::finish(completion);
}

std::future<nlohmann::json> WorkerClient::call_async(const std::string& method,
                                                     const nlohmann::json& params,
                                                     std::optional<std::chrono::milliseconds> timeout) {
    auto completion = impl_->start_call(method, params, timeout.value_or(impl_->opts.request_timeout));
    return std::async(std::launch::deferred, [completion = std::move(completion)]() mutable {
        return Impl::finish(completion);
    });
}

void WorkerClient::start() {
    impl_->supervisor.ensure_running();
}

void WorkerClient::shutdown() {
    if (impl_->shut_down.exchange(true)) return;
    impl_->table.shutdown();
    impl_->supervisor.shutdown();
}

WorkerState WorkerClient::worker_state() const {
    return impl_->supervisor.state();
}

std::optional<pid_t> WorkerClient::worker_pid() const {
    return impl_->supervisor.pid();
}

uint64_t WorkerClient::restart_count() const {
    return impl_->supervisor.restart_count();
}

size_t WorkerClient::pending_calls() const {
    return impl_->table.pending_count();
}

} // namespace toolbridge
