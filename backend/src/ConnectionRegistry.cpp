#include "ConnectionRegistry.hpp"
#include "ClientSession.hpp"
#include <iostream>

namespace tickflow {

bool ConnectionRegistry::add(const SessionPtr& session, const std::function<void(size_t count)>& on_added) {
    if (!session) return false;
    std::lock_guard<std::mutex> lk(sessions_m_);
    if (!sessions_.insert(session).second) return false;
    std::cout << "ConnectionRegistry: client connected " << session->id()
              << " (count=" << sessions_.size() << ")" << std::endl;
    if (on_added) on_added(sessions_.size());
    return true;
}

bool ConnectionRegistry::remove(const SessionPtr& session) {
    std::lock_guard<std::mutex> lk(sessions_m_);
    if (sessions_.erase(session) == 0) return false;
    std::cout << "ConnectionRegistry: client disconnected " << session->id()
              << " (count=" << sessions_.size() << ")" << std::endl;
    return true;
}

bool ConnectionRegistry::contains(const SessionPtr& session) const {
    std::lock_guard<std::mutex> lk(sessions_m_);
    return sessions_.count(session) > 0;
}

std::vector<ConnectionRegistry::SessionPtr> ConnectionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lk(sessions_m_);
    return std::vector<SessionPtr>(sessions_.begin(), sessions_.end());
}

size_t ConnectionRegistry::count() const {
    std::lock_guard<std::mutex> lk(sessions_m_);
    return sessions_.size();
}

} // namespace tickflow
