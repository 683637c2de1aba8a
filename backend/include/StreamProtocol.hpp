#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "ClientSession.hpp"

namespace tickflow {

class ConnectionRegistry;
class OutboundChannel;
class SourceRegistry;
class StreamDispatcher;
struct StreamMetrics;

struct ProtocolOptions {
    // Reply with an error to unknown "type" values instead of ignoring them
    bool reject_unknown_types = false;
};

/**
 * @brief Per-connection control protocol.
 *
 * A session is idle after on_connect() and subscribed while it owns a
 * StreamDispatcher. Inbound messages for one session must be delivered
 * sequentially (the transport read loop does this); different sessions may
 * be handled concurrently.
 */
class StreamProtocol {
public:
    static constexpr const char* kDefaultSource = "stock";
    static constexpr int kDefaultFrequencyMs = 500;
    static constexpr int kMaxFrequencyMs = 3600000;

    StreamProtocol(ConnectionRegistry& connections, SourceRegistry& sources,
                   StreamMetrics& metrics, ProtocolOptions options = {});
    ~StreamProtocol();

    /** @brief Create and register a session; the welcome message is its first frame. */
    std::shared_ptr<ClientSession> on_connect(std::shared_ptr<OutboundChannel> channel);

    /** @brief Handle one inbound text frame. Never throws. */
    void on_message(const std::shared_ptr<ClientSession>& session, const std::string& text);

    /** @brief Transport closed: stop the dispatcher and drop the session. */
    void on_disconnect(const std::shared_ptr<ClientSession>& session);

    // Cancel every dispatcher (server shutdown)
    void shutdown();

    size_t active_dispatchers() const;
    bool has_dispatcher(const std::string& session_id) const;

    // Validates a subscribe message and fills defaults; throws ProtocolError
    static Subscription parse_subscribe(const nlohmann::json& msg);

private:
    void handle_subscribe(const std::shared_ptr<ClientSession>& session, const nlohmann::json& msg);
    void handle_unsubscribe(const std::shared_ptr<ClientSession>& session);
    // Send, dropping the session from the registry when its peer is gone
    bool reply(const std::shared_ptr<ClientSession>& session, const nlohmann::json& msg);
    void stop_dispatcher(const std::string& session_id);

    ConnectionRegistry& connections_;
    SourceRegistry& sources_;
    StreamMetrics& metrics_;
    ProtocolOptions options_;

    std::atomic<uint64_t> next_client_id_{0};

    mutable std::mutex dispatchers_m_;
    std::unordered_map<std::string, std::unique_ptr<StreamDispatcher>> dispatchers_;
};

} // namespace tickflow
