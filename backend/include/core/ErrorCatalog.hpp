#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace tickflow::errors {

// 1400-1499: client control channel errors (reported back to the client)
// 1500-1599: process level errors (reported on stderr, process exits)

inline constexpr int E1400_INVALID_JSON = 1400;
inline constexpr int E1401_NOT_AN_OBJECT = 1401;
inline constexpr int E1402_SOURCE_NOT_STRING = 1402;
inline constexpr int E1403_FREQUENCY_INVALID = 1403;
inline constexpr int E1404_UNKNOWN_TYPE = 1404;
inline constexpr int E1405_SOURCE_REJECTED = 1405;

inline constexpr int E1500_BIND_FAILED = 1500;
inline constexpr int E1501_INVALID_CONFIG = 1501;

inline constexpr const char* MSG_E1400_INVALID_JSON = "Invalid JSON message";
inline constexpr const char* MSG_E1401_NOT_AN_OBJECT = "Message must be a JSON object";
inline constexpr const char* MSG_E1402_SOURCE_NOT_STRING = "subscribe.source must be a string";
inline constexpr const char* MSG_E1403_FREQUENCY_INVALID = "subscribe.frequency must be an integer between 1 and 3600000 ms";
inline constexpr const char* MSG_E1404_UNKNOWN_TYPE_PREFIX = "Unknown message type: ";
inline constexpr const char* MSG_E1405_SOURCE_REJECTED_PREFIX = "Source rejected: ";

inline constexpr const char* MSG_E1500_BIND_FAILED_PREFIX = "Error 1500: failed to bind listening socket: ";
inline constexpr const char* MSG_E1501_INVALID_CONFIG_PREFIX = "Error 1501: invalid configuration: ";

// Detail strings for E1405.
inline constexpr const char* D1405_NAME_TOO_LONG = "source name longer than 64 bytes";
inline constexpr const char* D1405_SOURCE_LIMIT = "too many custom sources";

// Detail strings for E1501.
inline constexpr const char* D1501_PORT_INVALID = "port must be an integer between 0 and 65535";
inline constexpr const char* D1501_STATS_INTERVAL_INVALID = "stats interval must be a positive integer (ms)";
inline constexpr const char* D1501_MAX_CUSTOM_SOURCES_INVALID = "max custom sources must be an integer between 0 and 1024";
inline constexpr const char* D1501_SEED_INVALID = "seed must be a non-negative integer";
inline constexpr const char* D1501_MISSING_VALUE = "missing value for option";
inline constexpr const char* D1501_UNKNOWN_OPTION = "unknown option";

inline std::string format_E1404_unknown_type(std::string_view type) {
    std::string out(MSG_E1404_UNKNOWN_TYPE_PREFIX);
    out.append(type.data(), type.size());
    return out;
}

inline std::string format_E1405_source_rejected(std::string_view detail) {
    std::string out(MSG_E1405_SOURCE_REJECTED_PREFIX);
    out.append(detail.data(), detail.size());
    return out;
}

inline std::string format_E1500_bind_failed(std::string_view detail) {
    std::string out(MSG_E1500_BIND_FAILED_PREFIX);
    out.append(detail.data(), detail.size());
    return out;
}

inline std::string format_E1501_invalid_config(std::string_view detail) {
    std::string out(MSG_E1501_INVALID_CONFIG_PREFIX);
    out.append(detail.data(), detail.size());
    return out;
}

} // namespace tickflow::errors

namespace tickflow {

// Raised while validating an inbound control message; turned into an
// {"type":"error"} reply by StreamProtocol and never escapes it.
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

} // namespace tickflow
