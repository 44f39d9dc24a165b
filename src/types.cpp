#include "toolbridge/types.hpp"

namespace toolbridge {

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    t.text = j.at("text").get<std::string>();
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    if (t.description) j["description"] = *t.description;
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    if (j.contains("inputSchema")) t.input_schema = j.at("inputSchema");
    if (j.contains("description")) t.description = j.at("description").get<std::string>();
}

// ---------- CallToolResult ----------

CallToolResult CallToolResult::from_value(const nlohmann::json& value) {
    CallToolResult r;
    r.content.push_back(TextContent{
        value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)});
    r.structured_content = value;
    return r;
}

CallToolResult CallToolResult::failure(const std::string& message) {
    CallToolResult r;
    r.content.push_back(TextContent{message});
    r.is_error = true;
    return r;
}

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = t.content;
    if (t.structured_content) j["structuredContent"] = *t.structured_content;
    j["isError"] = t.is_error;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    if (j.contains("content")) t.content = j.at("content").get<std::vector<TextContent>>();
    if (j.contains("structuredContent")) t.structured_content = j.at("structuredContent");
    if (j.contains("isError")) t.is_error = j.at("isError").get<bool>();
}

// ---------- Initialization ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.value("version", std::string{});
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    if (t.instructions) j["instructions"] = *t.instructions;
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities").get<ServerCapabilities>();
    t.server_info = j.at("serverInfo").get<Implementation>();
    if (j.contains("instructions")) t.instructions = j.at("instructions").get<std::string>();
}

} // namespace toolbridge
