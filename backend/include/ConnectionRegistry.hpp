#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace tickflow {

class ClientSession;

class ConnectionRegistry {
public:
    using SessionPtr = std::shared_ptr<ClientSession>;

    // Returns false if the session is already registered. `on_added` runs
    // under the registry lock with the new count, so anything it queues
    // reaches the session before any message sent from a later snapshot().
    bool add(const SessionPtr& session, const std::function<void(size_t count)>& on_added = nullptr);

    // Removing an absent session is a no-op and returns false
    bool remove(const SessionPtr& session);

    bool contains(const SessionPtr& session) const;

    // Point-in-time copy; sessions may be removed right after it is taken
    std::vector<SessionPtr> snapshot() const;

    size_t count() const;

private:
    mutable std::mutex sessions_m_;
    std::set<SessionPtr> sessions_;
};

} // namespace tickflow
