#pragma once
#include "correlation_table.hpp"
#include "worker_supervisor.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace toolbridge {

/// Multiplexes concurrent calls onto one worker process.
///
/// Every call gets a fresh integer id; replies are matched back by id in
/// whatever order the worker produces them. The worker is spawned on the
/// first call and respawned on the first call after a crash.
class WorkerClient {
public:
    struct Options {
        WorkerSupervisor::Options worker;
        std::chrono::milliseconds request_timeout{30000};
    };

    explicit WorkerClient(Options opts);
    ~WorkerClient();

    WorkerClient(const WorkerClient&) = delete;
    WorkerClient& operator=(const WorkerClient&) = delete;

    // ---- Calls ----

    /// Send `method` to the worker and block for its result.
    /// Throws TimeoutError, WorkerUnavailableError, WorkerStartupError,
    /// CancelledError, or ProtocolError carrying the worker's error object.
    nlohmann::json call(const std::string& method,
                        const nlohmann::json& params = nlohmann::json::object());
    nlohmann::json call(const std::string& method, const nlohmann::json& params,
                        std::chrono::milliseconds timeout);

    /// Send now, wait later. The request is on the wire when this returns;
    /// get() on the future blocks for the outcome and throws like call().
    [[nodiscard]] std::future<nlohmann::json> call_async(
        const std::string& method,
        const nlohmann::json& params = nlohmann::json::object(),
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // ---- Lifecycle ----

    /// Start the worker now instead of on the first call.
    void start();

    /// Cancel every pending call and stop the worker. Idempotent.
    void shutdown();

    [[nodiscard]] WorkerState worker_state() const;
    [[nodiscard]] std::optional<pid_t> worker_pid() const;
    [[nodiscard]] uint64_t restart_count() const;
    [[nodiscard]] size_t pending_calls() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace toolbridge
