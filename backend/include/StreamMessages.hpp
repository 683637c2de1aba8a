#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tickflow {

struct DataPoint;

// Builders for every outbound message. Each one carries "type" and an
// ISO-8601 "timestamp".
namespace messages {

nlohmann::json welcome(const std::string& client_id, double uptime_s, size_t clients_connected);
nlohmann::json subscribed(const std::string& source, int frequency_ms);
nlohmann::json unsubscribed();
nlohmann::json pong();
nlohmann::json error(const std::string& message, int code);
nlohmann::json data(const std::string& source, const DataPoint& point);
nlohmann::json server_stats(size_t clients_connected, const std::vector<std::string>& active_sources,
                            double uptime_s, uint64_t data_points_sent);

} // namespace messages
} // namespace tickflow
