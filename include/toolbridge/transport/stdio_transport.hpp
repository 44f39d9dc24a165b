#pragma once
#include "transport.hpp"
#include "../frame_reader.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace toolbridge {

/// StdioTransport reads newline-delimited JSON from one descriptor and writes
/// it to another. Reads happen on the thread that calls start(); writes go
/// through a queue drained by a single writer thread, one line per message.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors, which it then owns.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error);
    void write_loop();
    void stop_writer();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::unique_ptr<FrameReader> reader_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::thread writer_thread_;
    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;
    bool writer_stopping_{false};
};

} // namespace toolbridge
