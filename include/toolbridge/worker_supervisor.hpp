#pragma once
#include "json_rpc.hpp"
#include <sys/types.h>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

enum class WorkerState {
    Unstarted,
    Starting,
    Ready,
    Exited,   // explicit shutdown; terminal
    Crashed   // process went away; next ensure_running() respawns
};

const char* to_string(WorkerState s);

/// Owns the one external worker process: spawn, crash detection, lazy
/// respawn and teardown. The worker's stdin/stdout carry newline-delimited
/// messages; its stderr is inherited and never parsed.
class WorkerSupervisor {
public:
    struct Options {
        std::string command;
        std::vector<std::string> args;
        std::optional<std::string> working_directory;
        /// How long shutdown() waits after SIGTERM before SIGKILL.
        std::chrono::milliseconds terminate_grace{2000};
    };

    /// Receives every message decoded from the worker's stdout, on the
    /// reader thread.
    using MessageHandler = std::function<void(JsonRpcMessage)>;

    /// Called once per crash, before a respawn is allowed. Must not call
    /// back into the supervisor.
    using CrashHandler = std::function<void(const std::string& reason)>;

    explicit WorkerSupervisor(Options opts);
    ~WorkerSupervisor();

    WorkerSupervisor(const WorkerSupervisor&) = delete;
    WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

    /// Handlers are captured at spawn time; set them before ensure_running().
    void on_message(MessageHandler handler);
    void on_crash(CrashHandler handler);

    /// Spawn the worker unless it is already Ready.
    /// Throws WorkerStartupError if the process cannot be launched and
    /// WorkerUnavailableError after shutdown().
    void ensure_running();

    /// Write one encoded line. Concurrent callers never interleave bytes.
    /// Throws WorkerUnavailableError unless the worker is Ready and accepts it.
    void send_line(const std::string& line);

    /// Terminate the worker (SIGTERM, grace period, SIGKILL) and stop.
    void shutdown();

    [[nodiscard]] WorkerState state() const;
    [[nodiscard]] std::optional<pid_t> pid() const;

    /// Successful respawns after a crash.
    [[nodiscard]] uint64_t restart_count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace toolbridge
