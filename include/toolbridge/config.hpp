#pragma once
#include "server.hpp"
#include "types.hpp"
#include "worker_client.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolbridge {

/// A tool exposed by the server and served by the worker.
struct ToolConfig {
    ToolDefinition definition;
    std::string worker_method;  // empty: same as the tool name
    std::optional<std::chrono::milliseconds> timeout;
};

struct LoggingConfig {
    std::string level = "INFO";
    std::string properties_file;
};

/// Everything the executable needs, loaded from a JSON file:
///
///   {
///     "server":  {"name", "version", "instructions", "thread_pool_size", "page_size"},
///     "worker":  {"command", "args", "working_directory", "request_timeout_ms",
///                 "terminate_grace_ms"},
///     "logging": {"level", "properties_file"},
///     "tools":   [{"name", "description", "input_schema", "worker_method", "timeout_ms"}]
///   }
///
/// Every section and key is optional.
struct BridgeConfig {
    BridgeServer::Options server;
    WorkerClient::Options worker;
    LoggingConfig logging;
    std::vector<ToolConfig> tools;

    /// Throws ConfigError naming the offending key on a type mismatch.
    [[nodiscard]] static BridgeConfig from_json(const nlohmann::json& j);

    /// Throws ConfigError if the file is missing or not valid JSON.
    [[nodiscard]] static BridgeConfig load_file(const std::string& path);

    /// TOOLBRIDGE_WORKER replaces the worker command line (split on
    /// whitespace); TOOLBRIDGE_LOG_LEVEL replaces the log level.
    void apply_environment();
};

} // namespace toolbridge
