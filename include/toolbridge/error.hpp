#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace toolbridge {

class BridgeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A line or document that could not be decoded into a message.
class ParseError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

/// An error carrying a wire error code. Handlers throw this to report
/// domain failures; code, message and data are preserved on the wire.
class ProtocolError : public BridgeError {
public:
    int code;
    std::optional<nlohmann::json> data;

    ProtocolError(int code, const std::string& msg,
                  std::optional<nlohmann::json> data = std::nullopt)
        : BridgeError(msg), code(code), data(std::move(data)) {}
};

class TransportError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

// Errors the bridge itself reports under its reserved codes. They are
// ProtocolErrors too, so the code and any data survive a relay.

class TimeoutError : public ProtocolError {
public:
    explicit TimeoutError(const std::string& msg, std::optional<nlohmann::json> data = std::nullopt);
};

/// The worker went away while the call was pending (or before it could be sent).
class WorkerUnavailableError : public ProtocolError {
public:
    explicit WorkerUnavailableError(const std::string& msg,
                                    std::optional<nlohmann::json> data = std::nullopt);
};

/// The worker process could not be launched.
class WorkerStartupError : public ProtocolError {
public:
    explicit WorkerStartupError(const std::string& msg,
                                std::optional<nlohmann::json> data = std::nullopt);
};

class CancelledError : public ProtocolError {
public:
    explicit CancelledError(const std::string& msg, std::optional<nlohmann::json> data = std::nullopt);
};

class ConfigError : public BridgeError {
public:
    using BridgeError::BridgeError;
};

namespace error {
    constexpr int ParseError          = -32700;
    constexpr int InvalidRequest      = -32600;
    constexpr int MethodNotFound      = -32601;
    constexpr int InvalidParams       = -32602;
    constexpr int InternalError       = -32603;

    // Bridge-originated codes. Anything else is a domain code and passes through.
    constexpr int RequestTimeout      = -32001;
    constexpr int WorkerUnavailable   = -32002;
    constexpr int WorkerStartupFailed = -32003;
    constexpr int RequestCancelled    = -32004;
} // namespace error

inline TimeoutError::TimeoutError(const std::string& msg, std::optional<nlohmann::json> data)
    : ProtocolError(error::RequestTimeout, msg, std::move(data)) {}

inline WorkerUnavailableError::WorkerUnavailableError(const std::string& msg,
                                                      std::optional<nlohmann::json> data)
    : ProtocolError(error::WorkerUnavailable, msg, std::move(data)) {}

inline WorkerStartupError::WorkerStartupError(const std::string& msg,
                                              std::optional<nlohmann::json> data)
    : ProtocolError(error::WorkerStartupFailed, msg, std::move(data)) {}

inline CancelledError::CancelledError(const std::string& msg, std::optional<nlohmann::json> data)
    : ProtocolError(error::RequestCancelled, msg, std::move(data)) {}

} // namespace toolbridge
