#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace toolbridge {

class Codec {
public:
    /// Parse raw JSON bytes into a message.
    /// Throws ParseError on invalid JSON or missing required fields.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse a batch of messages (JSON array).
    [[nodiscard]] static std::vector<JsonRpcMessage> parse_batch(std::string_view raw);

    /// Serialize a message to a single-line JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    /// Serialize a batch.
    [[nodiscard]] static std::string serialize_batch(const std::vector<JsonRpcMessage>& msgs);

    /// Serialize and terminate with exactly one newline: one frame on the wire.
    [[nodiscard]] static std::string encode(const JsonRpcMessage& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

/// A line that was complete but did not decode. The stream carries on.
struct DecodeError {
    std::string line;
    std::string reason;
};

using DecodeEvent = std::variant<JsonRpcMessage, DecodeError>;

/// Incremental newline-delimited decoder.
///
/// feed() appends raw bytes; next() pulls one event per complete line.
/// Bytes after the last newline stay buffered until more input arrives, so a
/// message split across any number of chunks decodes exactly as if whole.
class FrameDecoder {
public:
    static constexpr size_t kDefaultMaxLineLength = 16 * 1024 * 1024;

    explicit FrameDecoder(size_t max_line_length = kDefaultMaxLineLength);

    void feed(std::string_view chunk);

    /// Next decoded message or decode error, or nullopt when no complete
    /// line is buffered. Blank lines are skipped.
    [[nodiscard]] std::optional<DecodeEvent> next();

    /// Bytes received but not yet consumed as a line.
    [[nodiscard]] size_t buffered() const noexcept { return buffer_.size() - pos_; }

    void reset();

private:
    void compact();

    std::string buffer_;
    size_t pos_{0};
    size_t max_line_length_;
    bool discarding_{false};
};

} // namespace toolbridge
