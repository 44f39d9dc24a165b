#include <benchmark/benchmark.h>
#include "toolbridge/router.hpp"
#include "toolbridge/server.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace toolbridge;

// Router holds a mutex; keep it behind a pointer.
static std::unique_ptr<Router> make_router(int n_methods) {
    auto router = std::make_unique<Router>();
    for (int i = 0; i < n_methods; ++i) {
        router->on_request("method_" + std::to_string(i),
            [](const nlohmann::json&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    router->set_builtin_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });
    return router;
}

static void BM_DispatchKnownMethod(benchmark::State& state) {
    auto router = make_router(1);
    JsonRpcMessage req = JsonRpcRequest{int64_t{1}, "ping", std::nullopt};

    for (auto _ : state) {
        auto resp = router->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchKnownMethod)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto router = make_router(1);
    JsonRpcMessage req = JsonRpcRequest{int64_t{1}, "not_registered_method", std::nullopt};

    for (auto _ : state) {
        auto resp = router->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_Dispatch100Methods(benchmark::State& state) {
    auto router = make_router(100);

    std::vector<JsonRpcMessage> requests;
    for (int i = 0; i < 100; ++i) {
        requests.push_back(JsonRpcRequest{int64_t{i}, "method_" + std::to_string(i), std::nullopt});
    }

    int i = 0;
    for (auto _ : state) {
        auto resp = router->dispatch(requests[i % 100]);
        benchmark::DoNotOptimize(resp);
        ++i;
    }
}
BENCHMARK(BM_Dispatch100Methods)->MinTime(1.0);

static void BM_DispatchNotification(benchmark::State& state) {
    Router router;
    router.on_notification("notifications/initialized", [](const nlohmann::json&) {});
    JsonRpcMessage notif = JsonRpcNotification{"notifications/initialized", std::nullopt};

    for (auto _ : state) {
        auto resp = router.dispatch(notif);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchNotification)->MinTime(1.0);

// Raw line in, encoded reply out, with an in-process tool.
static void BM_ServerHandleToolCall(benchmark::State& state) {
    BridgeServer server(BridgeServer::Options{});
    ToolDefinition echo;
    echo.name = "echo";
    server.add_tool(echo, [](const nlohmann::json& args) { return args; });

    const std::string line =
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hello"}}})";
    for (auto _ : state) {
        auto reply = server.handle_line(line);
        benchmark::DoNotOptimize(reply);
    }
}
BENCHMARK(BM_ServerHandleToolCall)->MinTime(1.0);
