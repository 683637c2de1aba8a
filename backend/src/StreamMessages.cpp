#include "StreamMessages.hpp"
#include "SignalGenerator.hpp"
#include "core/BuildInfo.hpp"
#include "core/Clock.hpp"

namespace tickflow::messages {

nlohmann::json welcome(const std::string& client_id, double uptime_s, size_t clients_connected) {
    return {
        {"type", "welcome"},
        {"client_id", client_id},
        {"timestamp", clock::iso_timestamp()},
        {"available_sources", available_source_names()},
        {"server_info", {
            {"version", buildinfo::version()},
            {"uptime", uptime_s},
            {"clients_connected", clients_connected}
        }}
    };
}

nlohmann::json subscribed(const std::string& source, int frequency_ms) {
    return {
        {"type", "subscribed"},
        {"source", source},
        {"frequency", frequency_ms},
        {"timestamp", clock::iso_timestamp()}
    };
}

nlohmann::json unsubscribed() {
    return {
        {"type", "unsubscribed"},
        {"timestamp", clock::iso_timestamp()}
    };
}

nlohmann::json pong() {
    return {
        {"type", "pong"},
        {"timestamp", clock::iso_timestamp()}
    };
}

nlohmann::json error(const std::string& message, int code) {
    return {
        {"type", "error"},
        {"message", message},
        {"code", code},
        {"timestamp", clock::iso_timestamp()}
    };
}

nlohmann::json data(const std::string& source, const DataPoint& point) {
    return {
        {"type", "data"},
        {"source", source},
        {"data", point},
        {"timestamp", clock::iso_timestamp()}
    };
}

nlohmann::json server_stats(size_t clients_connected, const std::vector<std::string>& active_sources,
                            double uptime_s, uint64_t data_points_sent) {
    return {
        {"type", "server_stats"},
        {"timestamp", clock::iso_timestamp()},
        {"stats", {
            {"clients_connected", clients_connected},
            {"active_sources", active_sources},
            {"uptime", uptime_s},
            {"memory_usage", "N/A"},
            {"data_points_sent", data_points_sent}
        }}
    };
}

} // namespace tickflow::messages
