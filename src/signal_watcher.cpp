#include "toolbridge/signal_watcher.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"

#include <atomic>
#include <cstring>
#include <exception>
#include <mutex>
#include <thread>

#include <pthread.h>
#include <signal.h>

namespace toolbridge {

struct SignalWatcher::Impl {
    std::vector<int> signals;
    Handler handler;
    sigset_t set;
    std::atomic<bool> stopping{false};
    std::mutex stop_mutex;
    std::thread thread;

    void run() {
        int sig = 0;
        if (sigwait(&set, &sig) != 0) return;
        if (stopping) return;
        try {
            handler(sig);
        } catch (const std::exception& e) {
            LOG4CPLUS_ERROR(logging::core(), "Signal handler failed: " << e.what());
        }
    }
};

SignalWatcher::SignalWatcher(std::vector<int> signals, Handler handler)
    : impl_(std::make_unique<Impl>()) {
    if (signals.empty()) throw BridgeError("SignalWatcher needs at least one signal");
    impl_->signals = std::move(signals);
    impl_->handler = std::move(handler);

    sigemptyset(&impl_->set);
    for (int sig : impl_->signals) sigaddset(&impl_->set, sig);
    int rc = pthread_sigmask(SIG_BLOCK, &impl_->set, nullptr);
    if (rc != 0) {
        throw BridgeError(std::string("pthread_sigmask failed: ") + strerror(rc));
    }

    impl_->thread = std::thread([impl = impl_.get()] { impl->run(); });
}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::stop() {
    std::lock_guard<std::mutex> lock(impl_->stop_mutex);
    if (!impl_->thread.joinable()) return;
    impl_->stopping = true;
    // The thread stays joinable until joined, so its handle is valid here
    // even if sigwait already returned. One of its own signals wakes it.
    pthread_kill(impl_->thread.native_handle(), impl_->signals.front());
    impl_->thread.join();
}

} // namespace toolbridge
