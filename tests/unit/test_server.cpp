#include <gtest/gtest.h>
#include "toolbridge/server.hpp"
#include "toolbridge/error.hpp"
#include <limits>
#include <stdexcept>

using namespace toolbridge;

namespace {

BridgeServer::Options make_opts(size_t page_size = 50) {
    BridgeServer::Options opts;
    opts.server_info = {"test-bridge", "1.2.3"};
    opts.instructions = "Physics tools";
    opts.thread_pool_size = 2;
    opts.page_size = page_size;
    return opts;
}

ToolDefinition tool(const std::string& name) {
    ToolDefinition def;
    def.name = name;
    def.description = "Tool " + name;
    return def;
}

JsonRpcResponse call(BridgeServer& server, int64_t id, const std::string& method,
                     nlohmann::json params = nlohmann::json::object()) {
    auto reply = server.handle(JsonRpcRequest{id, method, std::move(params)});
    EXPECT_TRUE(reply.has_value());
    return std::get<JsonRpcResponse>(*reply);
}

} // namespace

TEST(BridgeServer, Initialize) {
    BridgeServer server{make_opts()};
    auto resp = call(server, 1, "initialize", {
        {"protocolVersion", "2024-11-05"},
        {"clientInfo", {{"name", "test-client"}, {"version", "0.0.1"}}},
        {"capabilities", nlohmann::json::object()}
    });
    ASSERT_TRUE(resp.result.has_value());
    const auto& r = *resp.result;
    EXPECT_EQ(r["protocolVersion"], "2024-11-05");
    EXPECT_EQ(r["capabilities"]["tools"]["listChanged"], true);
    EXPECT_EQ(r["serverInfo"]["name"], "test-bridge");
    EXPECT_EQ(r["serverInfo"]["version"], "1.2.3");
    EXPECT_EQ(r["instructions"], "Physics tools");
}

TEST(BridgeServer, InitializedNotificationRecorded) {
    BridgeServer server{make_opts()};
    EXPECT_FALSE(server.is_initialized());
    auto reply = server.handle(JsonRpcNotification{"notifications/initialized", std::nullopt});
    EXPECT_FALSE(reply.has_value());
    EXPECT_TRUE(server.is_initialized());
}

TEST(BridgeServer, Ping) {
    BridgeServer server{make_opts()};
    auto resp = call(server, 2, "ping");
    EXPECT_EQ(*resp.result, nlohmann::json::object());
}

TEST(BridgeServer, ToolsList) {
    BridgeServer server{make_opts()};
    server.add_tool(tool("alpha"), [](const nlohmann::json&) { return nlohmann::json(1); });
    server.add_tool(tool("beta"), [](const nlohmann::json&) { return nlohmann::json(2); });

    auto resp = call(server, 3, "tools/list");
    const auto& tools = resp.result->at("tools");
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0]["name"], "alpha");
    EXPECT_EQ(tools[0]["description"], "Tool alpha");
    EXPECT_TRUE(tools[0].contains("inputSchema"));
    EXPECT_FALSE(resp.result->contains("nextCursor"));
}

TEST(BridgeServer, ToolsListPaginates) {
    BridgeServer server{make_opts(2)};
    for (const char* name : {"a", "b", "c", "d", "e"}) {
        server.add_tool(tool(name), [](const nlohmann::json&) { return nlohmann::json(nullptr); });
    }

    std::vector<std::string> seen;
    nlohmann::json params = nlohmann::json::object();
    for (int page = 0; page < 10; ++page) {
        auto resp = call(server, 10 + page, "tools/list", params);
        for (const auto& t : resp.result->at("tools")) seen.push_back(t["name"].get<std::string>());
        if (!resp.result->contains("nextCursor")) break;
        params = {{"cursor", resp.result->at("nextCursor")}};
    }
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b", "c", "d", "e"}));
}

TEST(BridgeServer, ToolsListBadCursor) {
    BridgeServer server{make_opts()};
    auto resp = call(server, 4, "tools/list", {{"cursor", "not-a-number"}});
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
}

TEST(BridgeServer, ToolsListOversizedCursor) {
    BridgeServer server{make_opts()};
    server.add_tool(tool("a"), [](const nlohmann::json&) { return nlohmann::json(nullptr); });

    auto resp = call(server, 5, "tools/list", {{"cursor", "123456789012345678901234"}});
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InvalidParams);

    auto past_end = call(server, 6, "tools/list", {{"cursor", "18446744073709551615"}});
    ASSERT_TRUE(past_end.result.has_value());
    EXPECT_TRUE(past_end.result->at("tools").empty());
}

TEST(BridgeServer, ToolsListHugePageSize) {
    BridgeServer server{make_opts(std::numeric_limits<size_t>::max())};
    for (const char* name : {"a", "b", "c"}) {
        server.add_tool(tool(name), [](const nlohmann::json&) { return nlohmann::json(nullptr); });
    }
    auto resp = call(server, 7, "tools/list", {{"cursor", "1"}});
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_EQ(resp.result->at("tools").size(), 2u);
    EXPECT_FALSE(resp.result->contains("nextCursor"));
}

TEST(BridgeServer, ReRegisteringToolReplacesIt) {
    BridgeServer server{make_opts()};
    server.add_tool(tool("dup"), [](const nlohmann::json&) { return nlohmann::json("old"); });
    server.add_tool(tool("dup"), [](const nlohmann::json&) { return nlohmann::json("new"); });
    EXPECT_EQ(server.tools().size(), 1u);

    auto resp = call(server, 5, "tools/call", {{"name", "dup"}});
    EXPECT_EQ(resp.result->at("structuredContent"), "new");
}

TEST(BridgeServer, RemoveTool) {
    BridgeServer server{make_opts()};
    server.add_tool(tool("gone"), [](const nlohmann::json&) { return nlohmann::json(1); });
    server.remove_tool("gone");
    EXPECT_TRUE(server.tools().empty());

    auto resp = call(server, 6, "tools/call", {{"name", "gone"}});
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
}

TEST(BridgeServer, ToolsCallWrapsResult) {
    BridgeServer server{make_opts()};
    server.add_tool(tool("add"), [](const nlohmann::json& args) {
        return nlohmann::json{{"sum", args.at("a").get<int>() + args.at("b").get<int>()}};
    });

    auto resp = call(server, 7, "tools/call", {{"name", "add"}, {"arguments", {{"a", 2}, {"b", 3}}}});
    ASSERT_TRUE(resp.result.has_value());
    const auto& r = *resp.result;
    EXPECT_EQ(r["isError"], false);
    EXPECT_EQ(r["content"][0]["type"], "text");
    EXPECT_EQ(nlohmann::json::parse(r["content"][0]["text"].get<std::string>())["sum"], 5);
    EXPECT_EQ(r["structuredContent"]["sum"], 5);
}

TEST(BridgeServer, ToolsCallPlainExceptionIsInBand) {
    BridgeServer server{make_opts()};
    server.add_tool(tool("div"), [](const nlohmann::json&) -> nlohmann::json {
        throw std::runtime_error("division by zero");
    });

    auto resp = call(server, 8, "tools/call", {{"name", "div"}});
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_EQ(resp.result->at("isError"), true);
    EXPECT_EQ(resp.result->at("content")[0]["text"], "Error executing div: division by zero");
}

TEST(BridgeServer, ToolsCallProtocolErrorBecomesErrorResponse) {
    BridgeServer server{make_opts()};
    server.add_tool(tool("strict"), [](const nlohmann::json&) -> nlohmann::json {
        throw ProtocolError(-32050, "domain failure", nlohmann::json{{"hint", "check units"}});
    });

    auto resp = call(server, 9, "tools/call", {{"name", "strict"}});
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, -32050);
    EXPECT_EQ(resp.error->message, "domain failure");
    EXPECT_EQ(resp.error->data->at("hint"), "check units");
}

TEST(BridgeServer, ToolsCallWorkerTimeoutBecomesErrorResponse) {
    BridgeServer server{make_opts()};
    server.add_tool(tool("slow"), [](const nlohmann::json&) -> nlohmann::json {
        throw TimeoutError("Request 'slow' timed out after 50 ms");
    });
    auto resp = call(server, 10, "tools/call", {{"name", "slow"}});
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::RequestTimeout);
}

TEST(BridgeServer, ToolsCallValidatesParams) {
    BridgeServer server{make_opts()};
    EXPECT_EQ(call(server, 11, "tools/call", nlohmann::json::object()).error->code, error::InvalidParams);
    EXPECT_EQ(call(server, 12, "tools/call", {{"name", 5}}).error->code, error::InvalidParams);

    server.add_tool(tool("t"), [](const nlohmann::json&) { return nlohmann::json(1); });
    EXPECT_EQ(call(server, 13, "tools/call", {{"name", "t"}, {"arguments", {1, 2}}}).error->code,
              error::InvalidParams);
}

TEST(BridgeServer, UserOverrideOfBuiltin) {
    BridgeServer server{make_opts()};
    server.add_tool(tool("hidden"), [](const nlohmann::json&) { return nlohmann::json(1); });
    server.on_request("tools/list", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"tools", nlohmann::json::array()}, {"custom", true}};
    });

    auto resp = call(server, 14, "tools/list");
    EXPECT_EQ(resp.result->at("custom"), true);
    EXPECT_TRUE(resp.result->at("tools").empty());
}

TEST(BridgeServer, WorkerToolRequiresWorker) {
    BridgeServer server{make_opts()};
    EXPECT_THROW(server.add_worker_tool(tool("remote")), BridgeError);
}

// ---- handle_line ----

TEST(BridgeServerLine, UnknownMethod) {
    BridgeServer server{make_opts()};
    auto out = server.handle_line(R"({"jsonrpc":"2.0","id":7,"method":"nonexistent"})");
    ASSERT_TRUE(out.has_value());
    auto j = nlohmann::json::parse(*out);
    EXPECT_EQ(j["id"], 7);
    EXPECT_EQ(j["error"]["code"], -32601);
}

TEST(BridgeServerLine, ParseErrorHasNullId) {
    BridgeServer server{make_opts()};
    auto out = server.handle_line("{not json");
    ASSERT_TRUE(out.has_value());
    auto j = nlohmann::json::parse(*out);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    ASSERT_TRUE(j.contains("id"));
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_EQ(j["error"]["code"], -32700);
    EXPECT_EQ(j["error"]["message"], "Parse error");
}

TEST(BridgeServerLine, NotificationsAreSilent) {
    BridgeServer server{make_opts()};
    server.on_notification("notifications/boom", [](const nlohmann::json&) {
        throw std::runtime_error("ignored");
    });
    EXPECT_FALSE(server.handle_line(R"({"jsonrpc":"2.0","method":"notifications/boom"})").has_value());
    EXPECT_FALSE(server.handle_line(R"({"jsonrpc":"2.0","id":3,"method":"notifications/boom"})").has_value());
}

TEST(BridgeServerLine, OutputIsSingleLine) {
    BridgeServer server{make_opts()};
    server.add_tool(tool("multi"), [](const nlohmann::json&) { return nlohmann::json("a\nb"); });
    auto out = server.handle_line(R"({"id":1,"method":"tools/call","params":{"name":"multi"}})");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->find('\n'), std::string::npos);
}

TEST(BridgeServer, ShutdownWithoutServeIsSafe) {
    BridgeServer server{make_opts()};
    EXPECT_NO_THROW(server.shutdown());
    EXPECT_FALSE(server.is_running());
}
