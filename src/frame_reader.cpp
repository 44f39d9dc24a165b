#include "toolbridge/frame_reader.hpp"
#include "toolbridge/error.hpp"
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace toolbridge {

FrameReader::FrameReader(int fd, size_t max_line_length)
    : fd_(fd), decoder_(max_line_length) {
    if (::pipe2(wakeup_pipe_, O_CLOEXEC | O_NONBLOCK) < 0) {
        throw TransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
}

FrameReader::~FrameReader() {
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void FrameReader::interrupt() {
    interrupted_ = true;
    char b = 1;
    // A full pipe already guarantees a pending wakeup.
    (void)!::write(wakeup_pipe_[1], &b, 1);
}

std::optional<DecodeEvent> FrameReader::next() {
    char chunk[4096];

    while (true) {
        if (auto ev = decoder_.next()) return ev;
        if (eof_ || interrupted_) return std::nullopt;

        // poll() rather than a bare read() so interrupt() can break the wait.
        struct pollfd fds[2];
        fds[0].fd = fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            errno_ = errno;
            eof_ = true;
            continue;
        }

        if (fds[1].revents & POLLIN) {
            interrupted_ = true;
            return std::nullopt;
        }
        if (fds[0].revents & POLLNVAL) {
            errno_ = EBADF;
            eof_ = true;
            continue;
        }
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            errno_ = errno;
            eof_ = true;
            continue;
        }
        if (n == 0) {
            eof_ = true;
            // The peer is gone; an unterminated final line is all there will ever be.
            decoder_.feed("\n");
            continue;
        }
        decoder_.feed(std::string_view(chunk, static_cast<size_t>(n)));
    }
}

} // namespace toolbridge
