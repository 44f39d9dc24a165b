#pragma once
#include "json_rpc.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <variant>

namespace toolbridge {

/// What a pending call completes with: the result, or an error object.
using CallOutcome = std::variant<nlohmann::json, JsonRpcError>;

/// One in-flight call. Owned by the table from register_call() until it is
/// completed; completion removes it, so every id completes exactly once.
struct PendingCall {
    using Clock = std::chrono::steady_clock;

    int64_t id{0};
    std::string method;
    Clock::time_point issued_at;
    Clock::time_point deadline;
    std::promise<CallOutcome> completion;
    std::multimap<Clock::time_point, int64_t>::iterator deadline_entry;
};

/// Tracks calls awaiting a reply, keyed by id, and fires their deadlines.
///
/// Resolution, timeout and drain all race for the same entry under one lock;
/// whichever removes it first completes it and the others become no-ops.
class CorrelationTable {
public:
    using Clock = PendingCall::Clock;

    CorrelationTable();
    ~CorrelationTable();

    CorrelationTable(const CorrelationTable&) = delete;
    CorrelationTable& operator=(const CorrelationTable&) = delete;

    /// Track a new call. Throws BridgeError if `id` is already pending and
    /// CancelledError after shutdown().
    [[nodiscard]] std::future<CallOutcome> register_call(int64_t id, const std::string& method,
                                                         Clock::time_point deadline);

    /// Complete a pending call from a response. Returns false for orphans
    /// (unknown, already completed, or non-integer ids).
    bool resolve(const JsonRpcResponse& resp);
    bool resolve(int64_t id, CallOutcome outcome);

    /// Expire `id` now if it is still pending.
    bool timeout_fire(int64_t id);

    /// Force-complete every pending call with `err`. Returns how many.
    size_t fail_all(const JsonRpcError& err);

    [[nodiscard]] size_t pending_count() const;
    [[nodiscard]] bool has_pending(int64_t id) const;

    /// Cancel everything still pending and stop the deadline thread.
    void shutdown();

private:
    using PendingMap = std::map<int64_t, PendingCall>;

    PendingCall take_locked(PendingMap::iterator it);
    static JsonRpcError timeout_error(const PendingCall& call);
    void timer_loop();

    mutable std::mutex mutex_;
    std::condition_variable timer_cv_;
    PendingMap pending_;
    std::multimap<Clock::time_point, int64_t> deadlines_;
    bool stopping_{false};
    std::thread timer_thread_;
};

} // namespace toolbridge
