// examples/e2e.cpp
// End-to-end smoke test. Sends through the sandbox gateway and reads the
// feedback service.
//
//   cmake -B build -DAPNS_BUILD_EXAMPLES=ON && cmake --build build
//   APNS_CERT=cert.pem APNS_KEY=key.pem APNS_TOKEN=<64 hex chars> ./build/apns_e2e
//
// Override the gateway (e.g. a local TLS test server):
//
//   APNS_GATEWAY=localhost:2195 APNS_FEEDBACK=localhost:2196 ./build/apns_e2e
//
// Then verify on the device that the notifications arrived.

#include "apns/apns.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

static void step(const char* label) {
    std::cout << "  -> " << label << std::endl;
}

static std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

int main() {
    std::string cert = env_or("APNS_CERT", "");
    std::string key = env_or("APNS_KEY", "");
    std::string token = env_or("APNS_TOKEN", "");
    if (cert.empty() || key.empty() || token.empty()) {
        std::cerr << "APNS_CERT, APNS_KEY and APNS_TOKEN must be set" << std::endl;
        return 2;
    }

    std::cout << std::endl;
    std::cout << "  APNs C++ client: E2E smoke test" << std::endl;
    std::cout << std::endl;

    try {
        auto builder = apns::ApnsConfig::builder(cert, key);
        builder.environment(apns::Environment::Sandbox)
            .log_level(apns::LogLevel::Info)
            .on_error([](const apns::ApnsError& err) {
                std::cerr << "  !! " << err.what() << std::endl;
            })
            .on_delivery_error([](const apns::DeliveryError& err) {
                std::cerr << "  !! notification " << err.identifier << ": "
                          << err.to_string() << std::endl;
            });
        if (const char* gateway = std::getenv("APNS_GATEWAY")) builder.gateway_endpoint(gateway);
        if (const char* feedback = std::getenv("APNS_FEEDBACK")) builder.feedback_endpoint(feedback);

        auto client = apns::ApnsClient::create(builder.build());
        std::cout << "  Gateway: " << client->config().gateway_endpoint().to_string() << std::endl;

        step("plain alert");
        client->send_aps({token}, apns::Aps().alert("Hello from the C++ client"));

        step("alert with title, badge and sound");
        client->send_aps({token},
            apns::Aps().alert("E2E", "Title and body").badge(1).sound("default"));

        step("background update, conserve power");
        client->send_aps({token}, apns::Aps().content_available().extra("sync", "inbox"),
                         apns::Priority::ConservePower);

        step("raw payload with expiration");
        client->send(apns::Message({token}, R"({"aps":{"alert":"Expires in an hour"}})",
                                   std::chrono::system_clock::now() + std::chrono::hours(1)));

        step("bad token (expect a delivery error)");
        client->send_aps({std::string(64, '0')}, apns::Aps().alert("never delivered"));

        step("flush");
        client->flush();
        std::cout << "  .. flush ok" << std::endl;

        step("close");
        auto unsent = client->close();
        std::cout << "  .. close ok, " << unsent.size() << " unsent" << std::endl;

        step("feedback");
        auto reader = apns::ApnsClient::create(builder.build());
        size_t records = reader->fetch_feedback([](const apns::Feedback& fb) {
            std::cout << "     " << fb.token_hex() << " unregistered at "
                      << std::chrono::system_clock::to_time_t(fb.when) << std::endl;
        });
        std::cout << "  .. " << records << " feedback record(s)" << std::endl;
        reader->close();

    } catch (const apns::ApnsError& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    std::cout << std::endl;
    std::cout << "  Done. Verify on the device." << std::endl;
    std::cout << std::endl;
    return 0;
}
