#include "toolbridge/config.hpp"
#include "toolbridge/error.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace toolbridge {

namespace {

const nlohmann::json& section(const nlohmann::json& j, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!j.contains(key)) return empty;
    const auto& s = j.at(key);
    if (!s.is_object()) throw ConfigError(std::string("'") + key + "' must be an object");
    return s;
}

template <typename T>
void read(const nlohmann::json& obj, const char* section_name, const char* key, T& out) {
    if (!obj.contains(key) || obj.at(key).is_null()) return;
    try {
        out = obj.at(key).get<T>();
    } catch (const nlohmann::json::exception&) {
        throw ConfigError(std::string("'") + section_name + "." + key + "' has the wrong type");
    }
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream in(s);
    std::string w;
    while (in >> w) words.push_back(w);
    return words;
}

ToolConfig tool_from_json(const nlohmann::json& t, size_t index) {
    std::string where = "tools[" + std::to_string(index) + "]";
    if (!t.is_object()) throw ConfigError("'" + where + "' must be an object");

    ToolConfig tool;
    read(t, where.c_str(), "name", tool.definition.name);
    if (tool.definition.name.empty()) throw ConfigError("'" + where + ".name' is required");

    std::string description;
    read(t, where.c_str(), "description", description);
    if (!description.empty()) tool.definition.description = description;

    if (t.contains("input_schema")) {
        if (!t.at("input_schema").is_object()) {
            throw ConfigError("'" + where + ".input_schema' must be an object");
        }
        tool.definition.input_schema = t.at("input_schema");
    }

    read(t, where.c_str(), "worker_method", tool.worker_method);

    int64_t timeout_ms = 0;
    read(t, where.c_str(), "timeout_ms", timeout_ms);
    if (timeout_ms < 0) throw ConfigError("'" + where + ".timeout_ms' must not be negative");
    if (timeout_ms > 0) tool.timeout = std::chrono::milliseconds(timeout_ms);
    return tool;
}

} // namespace

BridgeConfig BridgeConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigError("Configuration must be a JSON object");

    BridgeConfig cfg;

    const auto& server = section(j, "server");
    read(server, "server", "name", cfg.server.server_info.name);
    read(server, "server", "version", cfg.server.server_info.version);
    std::string instructions;
    read(server, "server", "instructions", instructions);
    if (!instructions.empty()) cfg.server.instructions = instructions;
    read(server, "server", "thread_pool_size", cfg.server.thread_pool_size);
    int64_t page_size = static_cast<int64_t>(cfg.server.page_size);
    read(server, "server", "page_size", page_size);
    if (page_size < 1) throw ConfigError("'server.page_size' must be at least 1");
    cfg.server.page_size = static_cast<size_t>(page_size);
    if (cfg.server.thread_pool_size < 1) throw ConfigError("'server.thread_pool_size' must be at least 1");

    const auto& worker = section(j, "worker");
    read(worker, "worker", "command", cfg.worker.worker.command);
    read(worker, "worker", "args", cfg.worker.worker.args);
    std::string cwd;
    read(worker, "worker", "working_directory", cwd);
    if (!cwd.empty()) cfg.worker.worker.working_directory = cwd;
    int64_t timeout_ms = cfg.worker.request_timeout.count();
    read(worker, "worker", "request_timeout_ms", timeout_ms);
    if (timeout_ms <= 0) throw ConfigError("'worker.request_timeout_ms' must be positive");
    cfg.worker.request_timeout = std::chrono::milliseconds(timeout_ms);
    int64_t grace_ms = cfg.worker.worker.terminate_grace.count();
    read(worker, "worker", "terminate_grace_ms", grace_ms);
    if (grace_ms < 0) throw ConfigError("'worker.terminate_grace_ms' must not be negative");
    cfg.worker.worker.terminate_grace = std::chrono::milliseconds(grace_ms);

    const auto& logging = section(j, "logging");
    read(logging, "logging", "level", cfg.logging.level);
    read(logging, "logging", "properties_file", cfg.logging.properties_file);

    if (j.contains("tools")) {
        const auto& tools = j.at("tools");
        if (!tools.is_array()) throw ConfigError("'tools' must be an array");
        for (size_t i = 0; i < tools.size(); ++i) {
            cfg.tools.push_back(tool_from_json(tools[i], i));
        }
    }
    return cfg;
}

BridgeConfig BridgeConfig::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("Cannot open config file '" + path + "'");

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid JSON in '" + path + "': " + e.what());
    }
    return from_json(j);
}

void BridgeConfig::apply_environment() {
    if (const char* cmd = std::getenv("TOOLBRIDGE_WORKER")) {
        auto words = split_words(cmd);
        if (!words.empty()) {
            worker.worker.command = words.front();
            worker.worker.args.assign(words.begin() + 1, words.end());
        }
    }
    if (const char* level = std::getenv("TOOLBRIDGE_LOG_LEVEL")) {
        if (*level) logging.level = level;
    }
}

} // namespace toolbridge
