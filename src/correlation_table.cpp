#include "toolbridge/correlation_table.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"
#include <vector>

namespace toolbridge {

CorrelationTable::CorrelationTable()
    : timer_thread_([this] { timer_loop(); }) {}

CorrelationTable::~CorrelationTable() {
    shutdown();
}

std::future<CallOutcome> CorrelationTable::register_call(int64_t id, const std::string& method,
                                                         Clock::time_point deadline) {
    std::future<CallOutcome> fut;
    bool new_earliest = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw CancelledError("Call '" + method + "' rejected: bridge is shutting down");
        }
        if (pending_.count(id) > 0) {
            throw BridgeError("Duplicate in-flight request id " + std::to_string(id));
        }

        PendingCall call;
        call.id = id;
        call.method = method;
        call.issued_at = Clock::now();
        call.deadline = deadline;
        new_earliest = deadlines_.empty() || deadline < deadlines_.begin()->first;
        call.deadline_entry = deadlines_.emplace(deadline, id);
        fut = call.completion.get_future();
        pending_.emplace(id, std::move(call));
    }
    if (new_earliest) timer_cv_.notify_one();
    return fut;
}

PendingCall CorrelationTable::take_locked(PendingMap::iterator it) {
    PendingCall call = std::move(it->second);
    deadlines_.erase(call.deadline_entry);
    pending_.erase(it);
    return call;
}

JsonRpcError CorrelationTable::timeout_error(const PendingCall& call) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - call.issued_at).count();
    auto budget = std::chrono::duration_cast<std::chrono::milliseconds>(
        call.deadline - call.issued_at).count();
    return JsonRpcError{
        error::RequestTimeout,
        "Request '" + call.method + "' timed out after " + std::to_string(elapsed) + " ms",
        nlohmann::json{{"method", call.method},
                       {"elapsed_ms", elapsed},
                       {"timeout_ms", budget}}
    };
}

bool CorrelationTable::resolve(const JsonRpcResponse& resp) {
    const auto* id = std::get_if<int64_t>(&resp.id);
    if (!id) return false;
    if (resp.error) return resolve(*id, CallOutcome{*resp.error});
    return resolve(*id, CallOutcome{resp.result ? *resp.result : nlohmann::json(nullptr)});
}

bool CorrelationTable::resolve(int64_t id, CallOutcome outcome) {
    PendingCall call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return false;
        call = take_locked(it);
    }
    call.completion.set_value(std::move(outcome));
    return true;
}

bool CorrelationTable::timeout_fire(int64_t id) {
    PendingCall call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return false;
        call = take_locked(it);
    }
    JsonRpcError err = timeout_error(call);
    LOG4CPLUS_WARN(logging::worker(), err.message << " (id " << id << ")");
    call.completion.set_value(CallOutcome{std::move(err)});
    return true;
}

size_t CorrelationTable::fail_all(const JsonRpcError& err) {
    std::vector<PendingCall> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.reserve(pending_.size());
        for (auto& [id, call] : pending_) {
            drained.push_back(std::move(call));
        }
        pending_.clear();
        deadlines_.clear();
    }
    for (auto& call : drained) {
        call.completion.set_value(CallOutcome{err});
    }
    return drained.size();
}

size_t CorrelationTable::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool CorrelationTable::has_pending(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) > 0;
}

void CorrelationTable::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    timer_cv_.notify_all();
    if (timer_thread_.joinable()) timer_thread_.join();

    size_t n = fail_all(JsonRpcError{error::RequestCancelled, "Bridge shut down", std::nullopt});
    if (n > 0) {
        LOG4CPLUS_INFO(logging::worker(), "Cancelled " << n << " pending call(s) on shutdown");
    }
}

void CorrelationTable::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (deadlines_.empty()) {
            timer_cv_.wait(lock);
            continue;
        }
        auto earliest = deadlines_.begin()->first;
        if (Clock::now() < earliest) {
            timer_cv_.wait_until(lock, earliest);
            continue;
        }

        auto it = pending_.find(deadlines_.begin()->second);
        PendingCall call = take_locked(it);
        lock.unlock();

        JsonRpcError err = timeout_error(call);
        LOG4CPLUS_WARN(logging::worker(), err.message << " (id " << call.id << ")");
        call.completion.set_value(CallOutcome{std::move(err)});

        lock.lock();
    }
}

} // namespace toolbridge
