#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace tickflow {

class OutboundChannel;

struct Subscription {
    std::string source;
    int frequency_ms = 500;
};

// Server-side state of one connected client. The generation counter is
// bumped on every subscription change; a dispatcher only delivers while its
// generation is still current, so a replaced dispatcher can never write.
class ClientSession {
public:
    ClientSession(std::string id, std::shared_ptr<OutboundChannel> channel);

    const std::string& id() const { return id_; }

    bool send(const nlohmann::json& msg);
    // Deliver only if `generation` is still the session's current one
    bool send_if_current(uint64_t generation, const nlohmann::json& msg);

    // Both return the new generation
    uint64_t begin_subscription(const Subscription& sub);
    uint64_t clear_subscription();

    std::optional<Subscription> subscription() const;
    uint64_t generation() const;

    bool is_open() const;
    void close();

private:
    std::string id_;
    std::shared_ptr<OutboundChannel> channel_;
    mutable std::mutex m_;
    std::optional<Subscription> subscription_;
    uint64_t generation_ = 0;
};

} // namespace tickflow
