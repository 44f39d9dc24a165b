#include "toolbridge/transport/stdio_transport.hpp"
#include "toolbridge/codec.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace toolbridge {

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false),
      reader_(std::make_unique<FrameReader>(read_fd_)) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true),
      reader_(std::make_unique<FrameReader>(read_fd_)) {
}

StdioTransport::~StdioTransport() {
    shutdown();
    stop_writer();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    // If shutdown() was called before start(), don't block.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    connected_ = true;

    writer_thread_ = std::thread([this]() { write_loop(); });
    read_loop(on_message, on_error);
    connected_ = false;
    running_ = false;
}

void StdioTransport::read_loop(const MessageCallback& on_message, const ErrorCallback& on_error) {
    while (auto event = reader_->next()) {
        if (auto* msg = std::get_if<JsonRpcMessage>(&*event)) {
            on_message(std::move(*msg));
            continue;
        }
        const auto& bad = std::get<DecodeError>(*event);
        LOG4CPLUS_WARN(logging::codec(), "Undecodable line: " << bad.reason);
        if (on_error) on_error(std::make_exception_ptr(ParseError(bad.reason)));
    }

    if (reader_->last_errno() != 0 && !shutdown_requested_.load()) {
        std::string what = std::string("Read error: ") + std::strerror(reader_->last_errno());
        LOG4CPLUS_ERROR(logging::server(), what);
        if (on_error) on_error(std::make_exception_ptr(TransportError(what)));
    }
}

void StdioTransport::write_loop() {
    while (true) {
        std::string line;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || writer_stopping_;
            });
            if (write_queue_.empty()) break; // stopping, fully drained
            line = std::move(write_queue_.front());
            write_queue_.pop();
        }

        const char* data = line.data();
        size_t remaining = line.size();
        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                LOG4CPLUS_ERROR(logging::server(), "Write error: " << std::strerror(errno));
                connected_ = false;
                std::lock_guard<std::mutex> lock(write_mutex_);
                std::queue<std::string>().swap(write_queue_);
                break;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void StdioTransport::send(const JsonRpcMessage& msg) {
    // Messages queued before start() are written once the writer runs.
    if (shutdown_requested_.load()) {
        throw TransportError("Transport shut down");
    }
    std::string line = Codec::encode(msg);
    LOG4CPLUS_TRACE(logging::server(), "-> " << line.substr(0, line.size() - 1));
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(line));
    }
    write_cv_.notify_one();
}

void StdioTransport::stop_writer() {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        writer_stopping_ = true;
    }
    write_cv_.notify_all();
    if (writer_thread_.joinable()) writer_thread_.join();
}

void StdioTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    connected_ = false;
    reader_->interrupt();
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace toolbridge
