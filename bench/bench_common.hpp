// bench/bench_common.hpp
// Shared benchmark scenarios.

#pragma once

#include "apns/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace apns_bench {

struct BenchScenario {
    const char* name;
    size_t notifications_per_batch;
    size_t payload_size;

    size_t total_bytes() const { return notifications_per_batch * payload_size; }
};

constexpr BenchScenario SCENARIOS[] = {
    {"realtime_small", 10, 64},
    {"typical", 100, 256},
    {"high_volume", 1000, 256},
    {"max_payload", 100, 2048},
};

constexpr size_t SCENARIO_COUNT = sizeof(SCENARIOS) / sizeof(SCENARIOS[0]);

constexpr const char* TOKEN_HEX = "1ba97ad1311307c189696e2369c89fa83d652611a6e3c7370881289e45668fd3";

// Generate a JSON payload of approximately the given size in bytes.
inline std::string generate_payload(size_t size) {
    // Build {"aps":{"alert":"Benchmark","badge":1},"data":"xxx..."}
    std::string base = R"({"aps":{"alert":"Benchmark","badge":1}})";

    if (base.size() >= size) {
        return base;
    }

    base.pop_back(); // remove '}'
    base += R"(,"data":")";
    size_t remaining = size > base.size() + 2 ? size - base.size() - 2 : 0;
    base.append(remaining, 'x');
    base += "\"}";
    return base;
}

inline apns::Notification make_notification(uint32_t identifier, const std::string& payload) {
    apns::Notification n;
    n.identifier = identifier;
    n.token.assign(32, 0x42);
    n.payload.assign(payload.begin(), payload.end());
    n.expiration = 1700000000;
    return n;
}

} // namespace apns_bench
