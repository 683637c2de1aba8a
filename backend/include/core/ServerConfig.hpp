#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace tickflow {

struct ServerConfig {
    std::string host = "localhost";
    // 0 binds an ephemeral port
    unsigned short port = 8083;
    std::chrono::milliseconds stats_interval{5000};
    // Transport keep-alive: ping after ping_interval of silence, drop after ping_timeout more
    std::chrono::seconds ping_interval{20};
    std::chrono::seconds ping_timeout{10};
    bool reject_unknown_types = false;
    double anomaly_probability = 0.05;
    // generators for names outside the listed kinds
    size_t max_custom_sources = 16;
    uint64_t seed = 0;
    bool show_help = false;
};

// Environment (TICKFLOW_HOST, TICKFLOW_PORT) is applied first, then flags.
// Throws std::invalid_argument with an E1501 message on bad input.
ServerConfig parse_args(int argc, char** argv);

void apply_env(ServerConfig& cfg);

// Beast's websocket idle timeout for the keep-alive: Beast sends a ping after
// half of it and closes the peer at the full value. ping_interval +
// ping_timeout keeps the dead-peer deadline, so the first ping goes out at
// half that sum rather than at ping_interval.
std::chrono::seconds keepalive_idle_timeout(const ServerConfig& cfg);

void print_usage(const char* prog);

} // namespace tickflow
