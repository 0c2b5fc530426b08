// bench/codec_bench.cpp
// Wire codec benchmarks: notification frames, error frames, feedback.

#include <benchmark/benchmark.h>
#include "bench_common.hpp"
#include "codec.hpp"
#include "replay_window.hpp"

#include <chrono>

using namespace apns;
using namespace apns::codec;
using namespace apns_bench;

// --- encode_notification ---

static void BM_EncodeNotification(benchmark::State& state) {
    size_t scenario_idx = static_cast<size_t>(state.range(0));
    const auto& scenario = SCENARIOS[scenario_idx];
    auto n = make_notification(1, generate_payload(scenario.payload_size));

    std::vector<uint8_t> buf;
    for (auto _ : state) {
        buf.clear();
        encode_notification_into(buf, n);
        benchmark::DoNotOptimize(buf.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(n.payload.size()));
    state.SetLabel(scenario.name);
}

BENCHMARK(BM_EncodeNotification)->DenseRange(0, SCENARIO_COUNT - 1);

// --- decode_error ---

static void BM_DecodeError(benchmark::State& state) {
    auto frame = encode_error(8, 123456);
    for (auto _ : state) {
        auto error = decode_error(frame.data(), frame.size());
        benchmark::DoNotOptimize(error);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_DecodeError);

// --- feedback stream ---

static void BM_DecodeFeedback(benchmark::State& state) {
    size_t records = static_cast<size_t>(state.range(0));
    std::vector<uint8_t> stream;
    for (size_t i = 0; i < records; i++) {
        encode_feedback_into(stream, 1700000000 + static_cast<uint32_t>(i),
                             std::vector<uint8_t>(32, static_cast<uint8_t>(i)));
    }

    for (auto _ : state) {
        FeedbackDecoder decoder;
        decoder.feed(stream.data(), stream.size());
        size_t count = 0;
        while (auto fb = decoder.next()) {
            benchmark::DoNotOptimize(fb->token.data());
            count++;
        }
        benchmark::DoNotOptimize(count);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(records));
}

BENCHMARK(BM_DecodeFeedback)->Arg(10)->Arg(1000);

// --- replay window: push, then resolve a failure in the middle ---

static void BM_ReplayWindowResolve(benchmark::State& state) {
    size_t in_flight = static_cast<size_t>(state.range(0));
    auto payload = generate_payload(256);

    for (auto _ : state) {
        state.PauseTiming();
        ReplayWindow window(in_flight, std::chrono::milliseconds(5000));
        std::vector<Notification> batch;
        batch.reserve(in_flight);
        for (size_t i = 0; i < in_flight; i++) {
            batch.push_back(make_notification(static_cast<uint32_t>(i), payload));
        }
        state.ResumeTiming();

        for (auto& n : batch) {
            window.push(std::move(n));
        }
        auto resolution = window.resolve_failure(static_cast<uint32_t>(in_flight / 2));
        benchmark::DoNotOptimize(resolution.replay.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(in_flight));
}

BENCHMARK(BM_ReplayWindowResolve)->Arg(100)->Arg(10000);

BENCHMARK_MAIN();
