#pragma once
#include "codec.hpp"
#include <atomic>
#include <cstddef>
#include <optional>

namespace toolbridge {

/// Pull-style frame reader over a file descriptor.
///
/// next() blocks until the next decoded message or decode error is available
/// and returns nullopt once the stream has ended (EOF or read error) or
/// interrupt() was called. The descriptor is borrowed, not owned.
class FrameReader {
public:
    explicit FrameReader(int fd, size_t max_line_length = FrameDecoder::kDefaultMaxLineLength);
    ~FrameReader();

    FrameReader(const FrameReader&) = delete;
    FrameReader& operator=(const FrameReader&) = delete;

    [[nodiscard]] std::optional<DecodeEvent> next();

    /// Wake a blocked next(); safe to call from any thread.
    void interrupt();

    [[nodiscard]] bool at_eof() const noexcept { return eof_; }

    /// errno of the read failure that ended the stream, 0 for a clean EOF.
    [[nodiscard]] int last_errno() const noexcept { return errno_; }

private:
    int fd_;
    FrameDecoder decoder_;
    int wakeup_pipe_[2]{-1, -1};
    std::atomic<bool> interrupted_{false};
    bool eof_{false};
    int errno_{0};
};

} // namespace toolbridge
