#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace toolbridge {

/// Callback for incoming messages
using MessageCallback = std::function<void(JsonRpcMessage)>;

/// Receives ParseError for an undecodable line (the stream continues) and
/// TransportError for a read failure (the stream ends).
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start the transport. Blocks until the peer disconnects or shutdown().
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Queue a message for the peer. Throws TransportError after shutdown().
    virtual void send(const JsonRpcMessage& msg) = 0;

    /// Stop reading and refuse new messages. Messages already queued are
    /// still written before the transport is destroyed.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace toolbridge
