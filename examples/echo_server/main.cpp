/// Echo server: minimal bridge with one in-process tool and no worker.
/// Usage: ./echo_server
/// Communicates over stdio (newline-delimited JSON-RPC).

#include <toolbridge/toolbridge.hpp>
#include <log4cplus/initializer.h>

int main() {
    log4cplus::Initializer log_initializer;
    toolbridge::logging::init("", "WARN");

    toolbridge::BridgeServer::Options opts;
    opts.server_info = {"echo-server", "1.0.0"};
    opts.instructions = "A simple echo server that returns whatever you send it.";

    toolbridge::BridgeServer server{std::move(opts)};

    toolbridge::ToolDefinition echo_tool;
    echo_tool.name = "echo";
    echo_tool.description = "Echo the input text back to the caller";
    echo_tool.input_schema = {
        {"type", "object"},
        {"properties", {
            {"text", {{"type", "string"}, {"description", "The text to echo"}}}
        }},
        {"required", {"text"}}
    };

    server.add_tool(echo_tool, [](const nlohmann::json& args) {
        if (!args.contains("text") || !args.at("text").is_string()) {
            throw toolbridge::ProtocolError(toolbridge::error::InvalidParams, "'text' must be a string");
        }
        return nlohmann::json{{"text", args.at("text")}};
    });

    // Serve over stdio; blocks until stdin closes
    server.serve_stdio();
    return 0;
}
