#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace tickflow {

class ClientSession;
class ConnectionRegistry;
class SignalGenerator;
struct StreamMetrics;

// Worker thread pushing one subscription's data points to one session at
// a fixed cadence. Stops on cancel(), on delivery failure, when the session
// leaves the registry, or when its generation is superseded.
class StreamDispatcher {
public:
    StreamDispatcher(std::shared_ptr<ClientSession> session,
                     std::shared_ptr<SignalGenerator> generator,
                     ConnectionRegistry& connections,
                     StreamMetrics& metrics,
                     uint64_t generation,
                     std::chrono::milliseconds frequency);
    ~StreamDispatcher();

    StreamDispatcher(const StreamDispatcher&) = delete;
    StreamDispatcher& operator=(const StreamDispatcher&) = delete;

    void start();
    // Signals the worker and joins it. Safe to call more than once.
    void cancel();

    bool running() const { return running_.load(); }
    uint64_t generation() const { return generation_; }
    uint64_t points_delivered() const { return delivered_.load(); }

private:
    void run();

    std::shared_ptr<ClientSession> session_;
    std::shared_ptr<SignalGenerator> generator_;
    ConnectionRegistry& connections_;
    StreamMetrics& metrics_;
    uint64_t generation_;
    std::chrono::milliseconds frequency_;

    std::mutex wake_m_;
    std::condition_variable wake_;
    bool cancelled_ = false;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> delivered_{0};
    std::thread worker_;
};

} // namespace tickflow
