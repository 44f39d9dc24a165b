#pragma once
#include <functional>
#include <memory>
#include <vector>

namespace toolbridge {

/// Takes a set of signals synchronously on a dedicated thread.
///
/// The constructor blocks the signals in the calling thread, so every thread
/// started after it inherits the mask. The handler runs at most once, on the
/// watcher thread. Destruction stops and joins the thread, including when the
/// owning scope is left by an exception.
class SignalWatcher {
public:
    using Handler = std::function<void(int)>;

    SignalWatcher(std::vector<int> signals, Handler handler);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    /// Stops the watcher without running the handler. Waits for a handler
    /// that is already running. Safe to call more than once.
    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace toolbridge
