#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace tickflow {

class ConnectionRegistry;
class SourceRegistry;
struct StreamMetrics;

// Periodically pushes a server_stats message to every registered session.
// Sessions whose delivery fails are dropped from the registry.
class StatsBroadcaster {
public:
    StatsBroadcaster(ConnectionRegistry& connections, SourceRegistry& sources,
                     StreamMetrics& metrics, std::chrono::milliseconds interval = std::chrono::seconds(5));
    ~StatsBroadcaster();

    void start();
    void stop();

    // One sweep. Returns the number of sessions that accepted the message.
    size_t broadcast_once();

private:
    void run();

    ConnectionRegistry& connections_;
    SourceRegistry& sources_;
    StreamMetrics& metrics_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::mutex wake_m_;
    std::condition_variable wake_;
    std::thread worker_;
};

} // namespace tickflow
