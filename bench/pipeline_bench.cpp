// bench/pipeline_bench.cpp
// Pipeline benchmarks (send + flush through a connection worker).

#include <benchmark/benchmark.h>
#include "bench_common.hpp"
#include "apns/apns.hpp"

#include <condition_variable>
#include <mutex>

using namespace apns;
using namespace apns_bench;

namespace {

// Null gateway: accepts every frame and never answers.
class NullTransport : public Transport {
public:
    void connect() override {}

    bool write_all(const uint8_t*, size_t) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !closed_;
    }

    size_t read_some(uint8_t*, size_t) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_; });
        return 0;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

std::unique_ptr<ApnsClient> make_client(size_t connections) {
    auto config = ApnsConfig::builder("", "")
        .transport_factory([](const Endpoint&) -> std::unique_ptr<Transport> {
            return std::make_unique<NullTransport>();
        })
        .connections(connections)
        .grace_period(std::chrono::milliseconds(1))
        .replay_capacity(100000)
        .log_level(LogLevel::Off)
        .build();
    return ApnsClient::create(std::move(config));
}

} // namespace

// --- pipeline_flush ---

static void BM_PipelineFlush(benchmark::State& state) {
    size_t scenario_idx = static_cast<size_t>(state.range(0));
    const auto& scenario = SCENARIOS[scenario_idx];

    auto client = make_client(1);
    auto payload = generate_payload(scenario.payload_size);

    // Warm up connection
    client->send(Message({TOKEN_HEX}, payload));
    client->flush();

    for (auto _ : state) {
        for (size_t i = 0; i < scenario.notifications_per_batch; ++i) {
            client->send(Message({TOKEN_HEX}, payload));
        }
        client->flush();
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(scenario.notifications_per_batch));
    state.SetLabel(scenario.name);
    client->close();
}

BENCHMARK(BM_PipelineFlush)
    ->DenseRange(0, SCENARIO_COUNT - 1)
    ->Unit(benchmark::kMillisecond)
    ->Iterations(20);

// --- pipeline_flush across several connections ---

static void BM_PipelineFlushConnections(benchmark::State& state) {
    size_t connections = static_cast<size_t>(state.range(0));
    const auto& scenario = SCENARIOS[2];

    auto client = make_client(connections);
    auto payload = generate_payload(scenario.payload_size);
    std::vector<std::string> tokens(scenario.notifications_per_batch, TOKEN_HEX);

    client->send(Message({TOKEN_HEX}, payload));
    client->flush();

    for (auto _ : state) {
        client->send(Message(tokens, payload));
        client->flush();
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(scenario.notifications_per_batch));
    client->close();
}

BENCHMARK(BM_PipelineFlushConnections)
    ->Arg(1)->Arg(2)->Arg(4)
    ->Unit(benchmark::kMillisecond)
    ->Iterations(20);

BENCHMARK_MAIN();
