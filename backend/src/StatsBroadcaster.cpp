#include "StatsBroadcaster.hpp"
#include "ClientSession.hpp"
#include "ConnectionRegistry.hpp"
#include "SourceRegistry.hpp"
#include "StreamMessages.hpp"
#include "StreamMetrics.hpp"
#include <iostream>

namespace tickflow {

StatsBroadcaster::StatsBroadcaster(ConnectionRegistry& connections, SourceRegistry& sources,
                                   StreamMetrics& metrics, std::chrono::milliseconds interval)
: connections_(connections), sources_(sources), metrics_(metrics), interval_(interval) {}

StatsBroadcaster::~StatsBroadcaster() {
    stop();
}

void StatsBroadcaster::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread([this]() { run(); });
}

void StatsBroadcaster::stop() {
    {
        std::lock_guard<std::mutex> lk(wake_m_);
        running_ = false;
    }
    wake_.notify_all();
    if (worker_.joinable()) worker_.join();
}

size_t StatsBroadcaster::broadcast_once() {
    auto sessions = connections_.snapshot();
    if (sessions.empty()) return 0;

    auto msg = messages::server_stats(sessions.size(), sources_.active_sources(),
                                      metrics_.uptime_seconds(), metrics_.data_points_sent.load());
    size_t delivered = 0;
    for (auto& s : sessions) {
        if (s->send(msg)) {
            ++delivered;
        } else {
            connections_.remove(s);
        }
    }
    return delivered;
}

void StatsBroadcaster::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lk(wake_m_);
            if (wake_.wait_for(lk, interval_, [this]() { return !running_.load(); })) break;
        }
        try {
            broadcast_once();
        } catch (const std::exception& e) {
            std::cerr << "StatsBroadcaster: broadcast error: " << e.what() << std::endl;
        }
    }
}

} // namespace tickflow
