// bench/hot_path_bench.cpp
// Client API hot-path benchmarks (validate, expand, enqueue).

#include <benchmark/benchmark.h>
#include "bench_common.hpp"
#include "apns/apns.hpp"

using namespace apns;
using namespace apns_bench;

namespace {

// Gateway that never accepts, so the worker spawns but never connects.
class UnreachableTransport : public Transport {
public:
    void connect() override { throw ApnsError::network("unreachable"); }
    bool write_all(const uint8_t*, size_t) override { return false; }
    size_t read_some(uint8_t*, size_t) override { return 0; }
    void close() override {}
};

} // namespace

// Long reconnect delay keeps the worker parked during the bench.
static std::unique_ptr<ApnsClient> make_client() {
    auto config = ApnsConfig::builder("", "")
        .transport_factory([](const Endpoint&) -> std::unique_ptr<Transport> {
            return std::make_unique<UnreachableTransport>();
        })
        .reconnect_delay(std::chrono::milliseconds(3600000))
        .max_reconnect_delay(std::chrono::milliseconds(3600000))
        .connect_failure_threshold(0)
        .log_level(LogLevel::Off)
        .build();
    return ApnsClient::create(std::move(config));
}

// --- send ---

static void BM_SendRawPayload(benchmark::State& state) {
    auto client = make_client();
    auto payload = generate_payload(256);
    for (auto _ : state) {
        client->send(Message({TOKEN_HEX}, payload));
    }
    state.SetItemsProcessed(state.iterations());
    client->close(std::chrono::milliseconds(0));
}
BENCHMARK(BM_SendRawPayload);

static void BM_SendAps(benchmark::State& state) {
    auto client = make_client();
    for (auto _ : state) {
        client->send_aps({TOKEN_HEX},
            Aps().alert("New message", "You have 3 unread messages").badge(3).sound("default"));
    }
    state.SetItemsProcessed(state.iterations());
    client->close(std::chrono::milliseconds(0));
}
BENCHMARK(BM_SendAps);

static void BM_SendApsWithExtras(benchmark::State& state) {
    auto client = make_client();
    for (auto _ : state) {
        client->send_aps({TOKEN_HEX},
            Aps()
                .alert("Order shipped")
                .badge(1)
                .category("ORDER_STATUS")
                .extra("order_id", "ord_8f2c91")
                .extra("carrier", "UPS")
                .extra("eta_days", 3));
    }
    state.SetItemsProcessed(state.iterations());
    client->close(std::chrono::milliseconds(0));
}
BENCHMARK(BM_SendApsWithExtras);

// --- multicast: one payload, many tokens ---

static void BM_SendMulticast(benchmark::State& state) {
    int64_t count = state.range(0);
    auto client = make_client();
    std::vector<std::string> tokens(static_cast<size_t>(count), TOKEN_HEX);
    auto payload = generate_payload(256);
    for (auto _ : state) {
        client->send(Message(tokens, payload));
    }
    state.SetItemsProcessed(state.iterations() * count);
    client->close(std::chrono::milliseconds(0));
}
BENCHMARK(BM_SendMulticast)->Arg(10)->Arg(100)->Arg(1000);

// --- payload builder alone ---

static void BM_ApsToJson(benchmark::State& state) {
    for (auto _ : state) {
        auto json = Aps()
            .alert("Title", "Body with \"quotes\" and a\nnewline")
            .badge(7)
            .sound("default")
            .content_available()
            .to_json();
        benchmark::DoNotOptimize(json.data());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ApsToJson);

BENCHMARK_MAIN();
