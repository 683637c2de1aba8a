#include "core/ServerConfig.hpp"
#include "core/ErrorCatalog.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace tickflow {

static bool is_unsigned_number(const std::string& s) {
    return !s.empty() && s.size() <= 19 &&
           std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c); });
}

static unsigned short parse_port(const std::string& s) {
    if (!is_unsigned_number(s)) throw std::invalid_argument(errors::format_E1501_invalid_config(errors::D1501_PORT_INVALID));
    unsigned long long v = std::stoull(s);
    if (v > 65535) throw std::invalid_argument(errors::format_E1501_invalid_config(errors::D1501_PORT_INVALID));
    return (unsigned short)v;
}

void apply_env(ServerConfig& cfg) {
    const char* host = std::getenv("TICKFLOW_HOST");
    if (host && *host) cfg.host = host;
    const char* port = std::getenv("TICKFLOW_PORT");
    if (port && *port) cfg.port = parse_port(port);
}

std::chrono::seconds keepalive_idle_timeout(const ServerConfig& cfg) {
    return cfg.ping_interval + cfg.ping_timeout;
}

ServerConfig parse_args(int argc, char** argv) {
    ServerConfig cfg;
    apply_env(cfg);

    auto next_value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(errors::format_E1501_invalid_config(
                std::string(errors::D1501_MISSING_VALUE) + " " + flag));
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "-h" || a == "--help") {
            cfg.show_help = true;
        } else if (a == "--host") {
            cfg.host = next_value(i, a);
        } else if (a.rfind("--host=", 0) == 0) {
            cfg.host = a.substr(7);
        } else if (a == "--port" || a == "-p") {
            cfg.port = parse_port(next_value(i, a));
        } else if (a.rfind("--port=", 0) == 0) {
            cfg.port = parse_port(a.substr(7));
        } else if (a == "--stats-interval-ms") {
            std::string v = next_value(i, a);
            if (!is_unsigned_number(v) || std::stoull(v) == 0 || std::stoull(v) > 86400000ULL) {
                throw std::invalid_argument(errors::format_E1501_invalid_config(errors::D1501_STATS_INTERVAL_INVALID));
            }
            cfg.stats_interval = std::chrono::milliseconds(std::stoull(v));
        } else if (a == "--strict-protocol") {
            cfg.reject_unknown_types = true;
        } else if (a == "--max-custom-sources") {
            std::string v = next_value(i, a);
            if (!is_unsigned_number(v) || std::stoull(v) > 1024) {
                throw std::invalid_argument(errors::format_E1501_invalid_config(errors::D1501_MAX_CUSTOM_SOURCES_INVALID));
            }
            cfg.max_custom_sources = (size_t)std::stoull(v);
        } else if (a == "--seed") {
            std::string v = next_value(i, a);
            if (!is_unsigned_number(v)) {
                throw std::invalid_argument(errors::format_E1501_invalid_config(errors::D1501_SEED_INVALID));
            }
            cfg.seed = std::stoull(v);
        } else {
            throw std::invalid_argument(errors::format_E1501_invalid_config(
                std::string(errors::D1501_UNKNOWN_OPTION) + " " + a));
        }
    }
    return cfg;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -h, --help                Show this help message and exit\n"
              << "  --host HOST               Bind address (default localhost, env TICKFLOW_HOST)\n"
              << "  -p, --port PORT           Listening TCP port (default 8083, env TICKFLOW_PORT)\n"
              << "  --stats-interval-ms N     Server stats broadcast interval (default 5000)\n"
              << "  --strict-protocol         Reply with an error to unknown message types\n"
              << "  --max-custom-sources N    Limit on sources outside the listed kinds (default 16)\n"
              << "  --seed N                  Seed the data generators (default: clock)\n"
              << std::flush;
}

} // namespace tickflow
