#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include "core/ServerConfig.hpp"

namespace tickflow {

class ConnectionRegistry;
class SourceRegistry;
class StatsBroadcaster;
class StreamProtocol;
struct StreamMetrics;

// WebSocket front end: one I/O thread runs every connection (each on its own
// strand) and hands inbound frames to StreamProtocol. The stats broadcaster
// runs on its own thread for the lifetime of the server.
class WebSocketServer {
public:
    WebSocketServer(const ServerConfig& config, ConnectionRegistry& connections,
                    SourceRegistry& sources, StreamMetrics& metrics);
    ~WebSocketServer();

    // Throws std::runtime_error (E1500) when the address cannot be bound
    void start();
    // Stop accepting, cancel dispatchers, close sessions and join threads
    void stop();

    bool running() const { return running_.load(); }
    // Actual listening port, useful when configured with port 0
    unsigned short port() const { return bound_port_; }

    StreamProtocol& protocol() { return *protocol_; }

private:
    struct Impl;

    void run_event_loop();
    void do_accept();

    ServerConfig config_;
    ConnectionRegistry& connections_;
    SourceRegistry& sources_;
    StreamMetrics& metrics_;

    std::unique_ptr<StreamProtocol> protocol_;
    std::unique_ptr<StatsBroadcaster> broadcaster_;
    std::shared_ptr<Impl> impl_;

    std::atomic<bool> running_{false};
    std::thread event_thread_;
    unsigned short bound_port_ = 0;
};

} // namespace tickflow
