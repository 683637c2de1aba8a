#include "tickflow_client.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

using json = nlohmann::json;

int main(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help") {
        std::cerr << "Usage: " << argv[0] << " ws://host:port/ [source] [frequency_ms] [count]\n";
        std::cerr << "Example:\n";
        std::cerr << "  " << argv[0] << " ws://localhost:8083/ sensor 1000 10\n";
        return 2;
    }

    const std::string ws_url = argv[1];
    const std::string source = argc >= 3 ? argv[2] : "stock";
    int frequency = 500;
    int count = 10;
    try {
        if (argc >= 4) frequency = std::stoi(argv[3]);
        if (argc >= 5) count = std::stoi(argv[4]);
    } catch (const std::exception& e) {
        std::cerr << "Invalid number: " << e.what() << "\n";
        return 2;
    }

    try {
        tickflow::Client client(ws_url);
        client.connect();

        json welcome = client.read_until("welcome");
        std::cerr << "connected as " << welcome.value("client_id", std::string{"?"}) << "\n";

        client.subscribe(source, frequency);
        json ack = client.read_until("subscribed");
        std::cerr << "subscribed: " << ack.dump() << "\n";

        auto timeout = std::chrono::milliseconds(frequency * 2 + 5000);
        for (int received = 0; received < count;) {
            json msg = client.read(timeout);
            if (!msg.is_object()) continue;
            const std::string type = msg.value("type", std::string{});
            if (type == "data") {
                std::cout << msg.dump() << std::endl;
                ++received;
            } else if (type == "server_stats") {
                std::cerr << "stats: " << msg.value("stats", json::object()).dump() << "\n";
            } else if (type == "error") {
                std::cerr << "server error: " << msg.value("message", std::string{}) << "\n";
                return 1;
            }
        }

        client.unsubscribe();
        client.read_until("unsubscribed");
        client.close();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
