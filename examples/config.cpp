// Full ApnsConfig builder — all available options with defaults.
//
//   cmake -B build -DAPNS_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/apns_config

#include "apns/apns.hpp"
#include <chrono>
#include <iostream>

int main() {
    try {
        auto config = apns::ApnsConfig::builder("cert.pem", "key.pem")
            .environment(apns::Environment::Production)               // default: production hosts
            .gateway_endpoint("gateway.push.apple.com:2195")          // default: per environment
            .feedback_endpoint("feedback.push.apple.com:2196")        // default: per environment
            .ca_path("")                                              // default: system trust store
            .verify_peer(true)                                        // default: verify the server
            .connections(1)                                           // default: 1 gateway connection
            .grace_period(std::chrono::milliseconds(5000))            // default: 5s until presumed delivered
            .replay_capacity(10000)                                   // default: 10000 in flight per connection
            .reconnect_delay(std::chrono::milliseconds(1000))         // default: 1s first retry
            .max_reconnect_delay(std::chrono::milliseconds(30000))    // default: 30s backoff cap
            .connect_failure_threshold(5)                             // default: escalate after 5 failures
            .close_timeout(std::chrono::milliseconds(10000))          // default: 10s graceful shutdown
            .network_timeout(std::chrono::milliseconds(30000))        // default: 30s connect/handshake
            .log_level(apns::LogLevel::Warn)                          // default: warnings and errors
            .on_error([](const apns::ApnsError& e) {                  // default: errors are logged only
                std::cerr << "[APNs] " << e.what() << std::endl;
            })
            .on_delivery_error([](const apns::DeliveryError& e) {     // default: rejections are logged only
                std::cerr << "[APNs] " << e.to_string() << std::endl;
            })
            .build();

        auto client = apns::ApnsClient::create(std::move(config));
        client->send_aps({"1ba97ad1311307c189696e2369c89fa83d652611a6e3c7370881289e45668fd3"},
                         apns::Aps().alert("Test"));
        client->close();
    } catch (const apns::ApnsError& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
}
