// examples/feedback.cpp
// List devices the feedback service reports as no longer reachable.
//
//   cmake -B build -DAPNS_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/apns_feedback cert.pem key.pem

#include "apns/apns.hpp"
#include <ctime>
#include <iostream>

int main(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "usage: " << argv[0] << " cert.pem key.pem" << std::endl;
        return 2;
    }

    try {
        auto client = apns::ApnsClient::create(apns::ApnsConfig::sandbox(argv[1], argv[2]));

        size_t count = client->fetch_feedback([](const apns::Feedback& fb) {
            std::time_t when = std::chrono::system_clock::to_time_t(fb.when);
            std::cout << fb.token_hex() << "  " << std::asctime(std::gmtime(&when));
        });
        std::cout << count << " device(s) reported" << std::endl;
        client->close();
    } catch (const apns::ApnsError& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
