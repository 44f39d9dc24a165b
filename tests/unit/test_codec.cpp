#include <gtest/gtest.h>
#include "toolbridge/codec.hpp"
#include "toolbridge/error.hpp"

using namespace toolbridge;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "ping");
}

TEST(CodecParse, ValidRequestStringId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"abc-123","method":"tools/list"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<std::string>(req.id), "abc-123");
    EXPECT_FALSE(req.params.has_value());
}

TEST(CodecParse, ValidResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":42,"result":{"tools":[]}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    EXPECT_EQ(std::get<int64_t>(resp.id), 42);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_TRUE(resp.result->contains("tools"));
}

TEST(CodecParse, ValidErrorResponseKeepsData) {
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","id":1,"error":{"code":-32603,"message":"boom","data":{"traceback":"tb"}}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, -32603);
    EXPECT_EQ(resp.error->message, "boom");
    ASSERT_TRUE(resp.error->data.has_value());
    EXPECT_EQ(resp.error->data->at("traceback"), "tb");
}

TEST(CodecParse, NullResultIsStillAResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":3,"result":null})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_TRUE(resp.result->is_null());
}

TEST(CodecParse, ValidNotification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    EXPECT_EQ(std::get<JsonRpcNotification>(msg).method, "notifications/initialized");
}

TEST(CodecParse, MissingJsonrpcIsAccepted) {
    // Workers commonly reply without the version member.
    auto msg = Codec::parse(R"({"id":5,"result":{"value":1}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    EXPECT_EQ(std::get<int64_t>(std::get<JsonRpcResponse>(msg).id), 5);
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse("{invalid json"), ParseError);
}

TEST(CodecParse, TrailingContent) {
    EXPECT_THROW(Codec::parse(R"({"id":1,"method":"ping"} {"id":2})"), ParseError);
}

TEST(CodecParse, WrongJsonrpcVersion) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"ping"})"), ParseError);
}

TEST(CodecParse, NullIdOnRequest) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"ping"})"), ParseError);
}

TEST(CodecParse, NonStringMethod) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":7})"), ParseError);
}

TEST(CodecParse, FractionalIdRejected) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1.5,"method":"ping"})"), ParseError);
}

TEST(CodecParse, ResponseWithoutResultOrError) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1})"), ParseError);
}

TEST(CodecParse, MalformedErrorObject) {
    EXPECT_THROW(Codec::parse(R"({"id":1,"error":{"message":"no code"}})"), ParseError);
    EXPECT_THROW(Codec::parse(R"({"id":1,"error":"text"})"), ParseError);
}

TEST(CodecParse, NeitherIdNorMethod) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0"})"), ParseError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW(Codec::parse(""), ParseError);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_THROW(Codec::parse("[1,2,3]"), ParseError);
    EXPECT_THROW(Codec::parse("42"), ParseError);
}

TEST(CodecParse, Utf8Preserved) {
    auto msg = Codec::parse(R"({"id":1,"method":"echo","params":{"s":"café 😀"}})");
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(req.params->at("s").get<std::string>(), "caf\xC3\xA9 \xF0\x9F\x98\x80");
}

// ---- Batch parse tests ----

TEST(CodecParseBatch, ValidBatch) {
    auto msgs = Codec::parse_batch(R"([
        {"jsonrpc":"2.0","id":1,"method":"ping"},
        {"jsonrpc":"2.0","id":2,"result":{}},
        {"jsonrpc":"2.0","method":"notifications/initialized"}
    ])");
    ASSERT_EQ(msgs.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<JsonRpcRequest>(msgs[0]));
    EXPECT_TRUE(std::holds_alternative<JsonRpcResponse>(msgs[1]));
    EXPECT_TRUE(std::holds_alternative<JsonRpcNotification>(msgs[2]));
}

TEST(CodecParseBatch, NotAnArray) {
    EXPECT_THROW(Codec::parse_batch(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"), ParseError);
}

// ---- Serialize tests ----

TEST(CodecSerialize, RequestShape) {
    JsonRpcRequest req{int64_t{7}, "tools/call", nlohmann::json{{"name", "x"}}};
    auto j = nlohmann::json::parse(Codec::serialize(req));
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 7);
    EXPECT_EQ(j["method"], "tools/call");
    EXPECT_EQ(j["params"]["name"], "x");
}

TEST(CodecSerialize, ErrorResponseHasNoResult) {
    auto j = nlohmann::json::parse(Codec::serialize(make_error(int64_t{7}, error::MethodNotFound, "nope")));
    EXPECT_EQ(j["error"]["code"], -32601);
    EXPECT_FALSE(j.contains("result"));
    EXPECT_FALSE(j["error"].contains("data"));
}

TEST(CodecSerialize, NullIdSerializedAsNull) {
    auto j = nlohmann::json::parse(Codec::serialize(make_error(nullptr, error::ParseError, "Parse error")));
    ASSERT_TRUE(j.contains("id"));
    EXPECT_TRUE(j["id"].is_null());
}

TEST(CodecSerialize, StringIdEchoedVerbatim) {
    JsonRpcResponse resp = make_result(std::string("req-\"1\""), nlohmann::json::object());
    auto parsed = Codec::parse(Codec::serialize(resp));
    EXPECT_EQ(std::get<std::string>(std::get<JsonRpcResponse>(parsed).id), "req-\"1\"");
}

TEST(CodecSerialize, EncodeIsOneLine) {
    JsonRpcRequest req{int64_t{1}, "echo", nlohmann::json{{"text", "line1\nline2"}}};
    std::string line = Codec::encode(req);
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find('\n'), line.size() - 1);
}

TEST(CodecSerialize, InvalidUtf8IsReplaced) {
    JsonRpcRequest req{int64_t{1}, "echo", nlohmann::json{{"bytes", std::string("\xff\xfe")}}};
    EXPECT_NO_THROW({
        auto out = Codec::serialize(req);
        (void)Codec::parse(out);
    });
}

TEST(CodecSerialize, BatchRoundTrip) {
    std::vector<JsonRpcMessage> msgs;
    msgs.push_back(JsonRpcRequest{int64_t{1}, "ping", std::nullopt});
    msgs.push_back(JsonRpcNotification{"notifications/initialized", std::nullopt});

    auto parsed = Codec::parse_batch(Codec::serialize_batch(msgs));
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0], msgs[0]);
    EXPECT_EQ(parsed[1], msgs[1]);
}

// ---- Large message test ----

TEST(CodecParse, LargeMessage) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < 100; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Description for tool " + std::to_string(i)},
            {"inputSchema", {{"type", "object"}, {"properties", nlohmann::json::object()}}}
        });
    }
    nlohmann::json response = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"tools", tools}}}};
    auto msg = Codec::parse(response.dump());
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    EXPECT_EQ(std::get<JsonRpcResponse>(msg).result->at("tools").size(), 100u);
}
