#pragma once
#include <string>

namespace tickflow {

/**
 * @brief Abstract outbound message path of one client connection.
 *
 * The WebSocket transport implements this with a per-connection write
 * queue. Tests implement it in memory.
 */
class OutboundChannel {
public:
    virtual ~OutboundChannel() = default;
    /** @brief Queue one text frame. Returns false once the peer is gone. */
    virtual bool deliver(const std::string& payload) = 0;
    /** @brief True until the peer disconnects or close() is called */
    virtual bool is_open() const = 0;
    /** @brief Begin a normal close; later deliver() calls fail */
    virtual void close() = 0;
};

} // namespace tickflow
