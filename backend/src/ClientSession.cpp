#include "ClientSession.hpp"
#include "OutboundChannel.hpp"

namespace tickflow {

ClientSession::ClientSession(std::string id, std::shared_ptr<OutboundChannel> channel)
: id_(std::move(id)), channel_(std::move(channel)) {}

bool ClientSession::send(const nlohmann::json& msg) {
    auto payload = msg.dump();
    std::lock_guard<std::mutex> lk(m_);
    if (!channel_) return false;
    return channel_->deliver(payload);
}

bool ClientSession::send_if_current(uint64_t generation, const nlohmann::json& msg) {
    auto payload = msg.dump();
    std::lock_guard<std::mutex> lk(m_);
    if (generation != generation_ || !channel_) return false;
    return channel_->deliver(payload);
}

uint64_t ClientSession::begin_subscription(const Subscription& sub) {
    std::lock_guard<std::mutex> lk(m_);
    subscription_ = sub;
    return ++generation_;
}

uint64_t ClientSession::clear_subscription() {
    std::lock_guard<std::mutex> lk(m_);
    subscription_.reset();
    return ++generation_;
}

std::optional<Subscription> ClientSession::subscription() const {
    std::lock_guard<std::mutex> lk(m_);
    return subscription_;
}

uint64_t ClientSession::generation() const {
    std::lock_guard<std::mutex> lk(m_);
    return generation_;
}

bool ClientSession::is_open() const {
    std::lock_guard<std::mutex> lk(m_);
    return channel_ && channel_->is_open();
}

void ClientSession::close() {
    std::lock_guard<std::mutex> lk(m_);
    if (channel_) channel_->close();
}

} // namespace tickflow
