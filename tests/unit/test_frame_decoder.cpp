#include <gtest/gtest.h>
#include "toolbridge/codec.hpp"

using namespace toolbridge;

namespace {

std::vector<DecodeEvent> drain(FrameDecoder& dec) {
    std::vector<DecodeEvent> events;
    while (auto ev = dec.next()) events.push_back(std::move(*ev));
    return events;
}

const JsonRpcMessage& message_at(const std::vector<DecodeEvent>& events, size_t i) {
    return std::get<JsonRpcMessage>(events.at(i));
}

} // namespace

TEST(FrameDecoder, SingleLine) {
    FrameDecoder dec;
    dec.feed("{\"id\":1,\"method\":\"ping\"}\n");
    auto events = drain(dec);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<JsonRpcRequest>(message_at(events, 0)));
    EXPECT_EQ(dec.buffered(), 0u);
}

TEST(FrameDecoder, IncompleteLineStaysBuffered) {
    FrameDecoder dec;
    dec.feed("{\"id\":1,\"meth");
    EXPECT_FALSE(dec.next().has_value());
    EXPECT_EQ(dec.buffered(), 13u);
    dec.feed("od\":\"ping\"}\n");
    auto events = drain(dec);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<JsonRpcRequest>(message_at(events, 0)).method, "ping");
}

TEST(FrameDecoder, EverySplitPointYieldsSameMessages) {
    const std::string stream =
        "{\"id\":1,\"method\":\"echo\",\"params\":{\"text\":\"a\\nb\"}}\n"
        "{\"id\":\"x\",\"result\":{\"v\":[1,2,3]}}\r\n"
        "{\"method\":\"notifications/progress\"}\n";

    FrameDecoder whole;
    whole.feed(stream);
    auto expected = drain(whole);
    ASSERT_EQ(expected.size(), 3u);

    for (size_t split = 0; split <= stream.size(); ++split) {
        FrameDecoder dec;
        dec.feed(std::string_view(stream).substr(0, split));
        auto events = drain(dec);
        dec.feed(std::string_view(stream).substr(split));
        auto rest = drain(dec);
        events.insert(events.end(), rest.begin(), rest.end());

        ASSERT_EQ(events.size(), expected.size()) << "split at " << split;
        for (size_t i = 0; i < events.size(); ++i) {
            EXPECT_EQ(message_at(events, i), message_at(expected, i)) << "split at " << split;
        }
    }
}

TEST(FrameDecoder, ByteAtATime) {
    const std::string stream = "{\"id\":1,\"result\":\"caf\xC3\xA9\"}\n{\"id\":2,\"result\":null}\n";
    FrameDecoder dec;
    std::vector<DecodeEvent> events;
    for (char c : stream) {
        dec.feed(std::string_view(&c, 1));
        auto got = drain(dec);
        events.insert(events.end(), got.begin(), got.end());
    }
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<JsonRpcResponse>(message_at(events, 0)).result->get<std::string>(),
              "caf\xC3\xA9");
}

TEST(FrameDecoder, BlankAndWhitespaceLinesSkipped) {
    FrameDecoder dec;
    dec.feed("\n   \n\t\r\n  {\"id\":1,\"method\":\"ping\"}  \n\n");
    auto events = drain(dec);
    ASSERT_EQ(events.size(), 1u);
}

TEST(FrameDecoder, BadLineReportedAndStreamContinues) {
    FrameDecoder dec;
    dec.feed("not json\n{\"id\":2,\"method\":\"ping\"}\n");
    auto events = drain(dec);
    ASSERT_EQ(events.size(), 2u);
    ASSERT_TRUE(std::holds_alternative<DecodeError>(events[0]));
    EXPECT_EQ(std::get<DecodeError>(events[0]).line, "not json");
    EXPECT_FALSE(std::get<DecodeError>(events[0]).reason.empty());
    EXPECT_TRUE(std::holds_alternative<JsonRpcMessage>(events[1]));
}

TEST(FrameDecoder, StructurallyInvalidMessageIsDecodeError) {
    FrameDecoder dec;
    dec.feed("{\"jsonrpc\":\"2.0\"}\n[1,2]\n");
    auto events = drain(dec);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<DecodeError>(events[0]));
    EXPECT_TRUE(std::holds_alternative<DecodeError>(events[1]));
}

TEST(FrameDecoder, OversizedLineDroppedOnce) {
    FrameDecoder dec(64);
    dec.feed(std::string(100, 'x'));
    auto first = dec.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(std::holds_alternative<DecodeError>(*first));
    EXPECT_EQ(dec.buffered(), 0u);

    // The rest of the oversized line is swallowed without a second error.
    dec.feed(std::string(100, 'y'));
    EXPECT_FALSE(dec.next().has_value());
    dec.feed("tail\n{\"id\":1,\"method\":\"ping\"}\n");
    auto events = drain(dec);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<JsonRpcMessage>(events[0]));
}

TEST(FrameDecoder, ResetDropsPartialInput) {
    FrameDecoder dec;
    dec.feed("{\"id\":1,");
    dec.reset();
    EXPECT_EQ(dec.buffered(), 0u);
    dec.feed("{\"id\":1,\"method\":\"ping\"}\n");
    EXPECT_EQ(drain(dec).size(), 1u);
}
