// examples/send.cpp
// Send one alert to a list of devices, then print anything left unsent.
//
//   cmake -B build -DAPNS_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/apns_send cert.pem key.pem <token> [<token>...]

#include "apns/apns.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: " << argv[0] << " cert.pem key.pem token [token...]" << std::endl;
        return 2;
    }
    std::vector<std::string> tokens(argv + 3, argv + argc);

    try {
        auto client = apns::ApnsClient::create(
            apns::ApnsConfig::builder(argv[1], argv[2])
                .environment(apns::Environment::Sandbox)
                .on_delivery_error([](const apns::DeliveryError& e) {
                    std::cerr << "rejected " << e.identifier << ": " << e.to_string() << std::endl;
                })
                .build()
        );

        uint32_t first = client->send_aps(tokens,
            apns::Aps().alert("Hello", "Sent from examples/send.cpp").badge(1).sound("default"));
        std::cout << "queued " << tokens.size() << " notification(s) from id " << first << std::endl;

        for (const auto& n : client->close()) {
            std::cout << "unsent: " << n.identifier << " -> " << n.token_hex() << std::endl;
        }
    } catch (const apns::ApnsError& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
