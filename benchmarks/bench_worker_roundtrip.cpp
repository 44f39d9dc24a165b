#include <benchmark/benchmark.h>
#include "toolbridge/worker_client.hpp"
#include <future>
#include <vector>

using namespace toolbridge;

static WorkerClient::Options bench_worker() {
    WorkerClient::Options opts;
    opts.worker.command = FAKE_WORKER_PATH;
    return opts;
}

// One call at a time: pipe latency plus correlation overhead.
static void BM_WorkerEchoSequential(benchmark::State& state) {
    WorkerClient client(bench_worker());
    client.start();
    const nlohmann::json params = {{"text", "hello"}};

    for (auto _ : state) {
        auto r = client.call("echo", params);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_WorkerEchoSequential)->MinTime(1.0);

// N calls in flight before the first reply is awaited.
static void BM_WorkerEchoPipelined(benchmark::State& state) {
    WorkerClient client(bench_worker());
    client.start();
    const auto depth = static_cast<size_t>(state.range(0));
    const nlohmann::json params = {{"text", "hello"}};

    std::vector<std::future<nlohmann::json>> inflight;
    inflight.reserve(depth);
    for (auto _ : state) {
        for (size_t i = 0; i < depth; ++i) inflight.push_back(client.call_async("echo", params));
        for (auto& f : inflight) {
            auto r = f.get();
            benchmark::DoNotOptimize(r);
        }
        inflight.clear();
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(depth));
}
BENCHMARK(BM_WorkerEchoPipelined)->Arg(8)->Arg(64)->MinTime(1.0);
