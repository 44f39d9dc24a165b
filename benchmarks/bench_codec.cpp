#include <benchmark/benchmark.h>
#include "toolbridge/codec.hpp"
#include "toolbridge/json_rpc.hpp"
#include <string>
#include <vector>

using namespace toolbridge;

static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"run_query","arguments":{"sql":"select 1","limit":100}}})";

// A worker reply carrying n rows, the typical shape of a large tool result.
static std::string make_large_reply(int n) {
    nlohmann::json rows = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        rows.push_back({
            {"id", i},
            {"name", "row_" + std::to_string(i)},
            {"tags", {"alpha", "beta", "gamma"}},
            {"score", i * 0.5}
        });
    }
    return nlohmann::json{{"id", 7}, {"result", {{"rows", rows}}}}.dump();
}

static const std::string kLargeReply = make_large_reply(500);

// ---- Parse ----

static void BM_ParseSmallMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kSmallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallMessage)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseLargeReply(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kLargeReply);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kLargeReply.size());
}
BENCHMARK(BM_ParseLargeReply)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Encode ----

static void BM_EncodeRequest(benchmark::State& state) {
    JsonRpcRequest req{int64_t{1}, "run_query", nlohmann::json{{"sql", "select 1"}}};
    for (auto _ : state) {
        auto s = Codec::encode(req);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeRequest)->MinTime(1.0);

static void BM_EncodeLargeReply(benchmark::State& state) {
    auto msg = Codec::parse(kLargeReply);
    for (auto _ : state) {
        auto s = Codec::encode(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kLargeReply.size());
}
BENCHMARK(BM_EncodeLargeReply)->MinTime(1.0);

// ---- Framing ----

// A stream of lines delivered in fixed-size chunks, as a pipe would.
static void BM_FrameDecoderChunked(benchmark::State& state) {
    const size_t chunk = static_cast<size_t>(state.range(0));
    std::string stream;
    for (int i = 0; i < 100; ++i) stream += kToolCallRequest + "\n";

    for (auto _ : state) {
        FrameDecoder decoder;
        size_t decoded = 0;
        for (size_t off = 0; off < stream.size(); off += chunk) {
            decoder.feed(std::string_view(stream).substr(off, chunk));
            while (auto event = decoder.next()) {
                benchmark::DoNotOptimize(event);
                ++decoded;
            }
        }
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}
BENCHMARK(BM_FrameDecoderChunked)->Arg(16)->Arg(512)->Arg(65536)->MinTime(1.0);
