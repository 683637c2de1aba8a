#include "StreamDispatcher.hpp"
#include "ClientSession.hpp"
#include "ConnectionRegistry.hpp"
#include "SignalGenerator.hpp"
#include "StreamMessages.hpp"
#include "StreamMetrics.hpp"
#include <iostream>

namespace tickflow {

StreamDispatcher::StreamDispatcher(std::shared_ptr<ClientSession> session,
                                   std::shared_ptr<SignalGenerator> generator,
                                   ConnectionRegistry& connections,
                                   StreamMetrics& metrics,
                                   uint64_t generation,
                                   std::chrono::milliseconds frequency)
: session_(std::move(session)), generator_(std::move(generator)), connections_(connections),
  metrics_(metrics), generation_(generation), frequency_(frequency) {}

StreamDispatcher::~StreamDispatcher() {
    cancel();
}

void StreamDispatcher::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread([this]() { run(); });
}

void StreamDispatcher::cancel() {
    {
        std::lock_guard<std::mutex> lk(wake_m_);
        cancelled_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void StreamDispatcher::run() {
    const std::string& source = generator_->source();
    while (true) {
        {
            std::lock_guard<std::mutex> lk(wake_m_);
            if (cancelled_) break;
        }
        if (!connections_.contains(session_)) break;

        try {
            auto point = generator_->generate_data_point();
            if (!session_->send_if_current(generation_, messages::data(source, point))) {
                // peer gone (or superseded); closed peers leave the registry
                if (!session_->is_open()) connections_.remove(session_);
                break;
            }
            delivered_.fetch_add(1);
            metrics_.data_points_sent.fetch_add(1);
        } catch (const std::exception& e) {
            std::cerr << "StreamDispatcher: " << session_->id() << " stopped: " << e.what() << std::endl;
            break;
        }

        std::unique_lock<std::mutex> lk(wake_m_);
        if (wake_.wait_for(lk, frequency_, [this]() { return cancelled_; })) break;
    }
    running_.store(false);
}

} // namespace tickflow
