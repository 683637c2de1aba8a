#include "StreamProtocol.hpp"
#include "ConnectionRegistry.hpp"
#include "OutboundChannel.hpp"
#include "SignalGenerator.hpp"
#include "SourceRegistry.hpp"
#include "StreamDispatcher.hpp"
#include "StreamMessages.hpp"
#include "StreamMetrics.hpp"
#include "core/ErrorCatalog.hpp"
#include <chrono>
#include <cmath>
#include <iostream>
#include <vector>

using json = nlohmann::json;

namespace tickflow {

StreamProtocol::StreamProtocol(ConnectionRegistry& connections, SourceRegistry& sources,
                               StreamMetrics& metrics, ProtocolOptions options)
: connections_(connections), sources_(sources), metrics_(metrics), options_(options) {}

StreamProtocol::~StreamProtocol() {
    shutdown();
}

std::shared_ptr<ClientSession> StreamProtocol::on_connect(std::shared_ptr<OutboundChannel> channel) {
    auto id = "client_" + std::to_string(++next_client_id_);
    auto session = std::make_shared<ClientSession>(id, std::move(channel));
    bool welcomed = false;
    connections_.add(session, [&](size_t count) {
        welcomed = session->send(messages::welcome(id, metrics_.uptime_seconds(), count));
    });
    if (!welcomed) connections_.remove(session);
    return session;
}

Subscription StreamProtocol::parse_subscribe(const json& msg) {
    Subscription sub;
    sub.source = kDefaultSource;
    sub.frequency_ms = kDefaultFrequencyMs;

    auto src = msg.find("source");
    if (src != msg.end() && !src->is_null()) {
        if (!src->is_string()) {
            throw ProtocolError(errors::E1402_SOURCE_NOT_STRING, errors::MSG_E1402_SOURCE_NOT_STRING);
        }
        sub.source = src->get<std::string>();
    }

    auto freq = msg.find("frequency");
    if (freq != msg.end() && !freq->is_null()) {
        double value = 0.0;
        if (freq->is_number_integer()) {
            value = (double)freq->get<int64_t>();
        } else if (freq->is_number_float()) {
            value = freq->get<double>();
            if (!std::isfinite(value) || std::floor(value) != value) value = 0.0;
        }
        if (!(value >= 1.0 && value <= (double)kMaxFrequencyMs)) {
            throw ProtocolError(errors::E1403_FREQUENCY_INVALID, errors::MSG_E1403_FREQUENCY_INVALID);
        }
        sub.frequency_ms = (int)value;
    }
    return sub;
}

void StreamProtocol::on_message(const std::shared_ptr<ClientSession>& session, const std::string& text) {
    try {
        json msg = json::parse(text, nullptr, false);
        if (msg.is_discarded()) {
            throw ProtocolError(errors::E1400_INVALID_JSON, errors::MSG_E1400_INVALID_JSON);
        }
        if (!msg.is_object()) {
            throw ProtocolError(errors::E1401_NOT_AN_OBJECT, errors::MSG_E1401_NOT_AN_OBJECT);
        }

        std::string type;
        auto t = msg.find("type");
        if (t != msg.end() && t->is_string()) type = t->get<std::string>();

        if (type == "subscribe") {
            handle_subscribe(session, msg);
        } else if (type == "unsubscribe") {
            handle_unsubscribe(session);
        } else if (type == "ping") {
            reply(session, messages::pong());
        } else if (options_.reject_unknown_types) {
            throw ProtocolError(errors::E1404_UNKNOWN_TYPE, errors::format_E1404_unknown_type(type));
        }
    } catch (const ProtocolError& e) {
        reply(session, messages::error(e.what(), e.code()));
    } catch (const std::exception& e) {
        std::cerr << "StreamProtocol: error handling message from " << session->id() << ": " << e.what() << std::endl;
    }
}

void StreamProtocol::handle_subscribe(const std::shared_ptr<ClientSession>& session, const json& msg) {
    Subscription sub = parse_subscribe(msg);
    // a rejected source leaves the current subscription running
    auto generator = sources_.get_or_create(sub.source);

    // re-subscribe replaces: the old worker is joined before the new one exists
    stop_dispatcher(session->id());

    uint64_t generation = session->begin_subscription(sub);
    if (!reply(session, messages::subscribed(sub.source, sub.frequency_ms))) {
        session->clear_subscription();
        return;
    }

    auto dispatcher = std::make_unique<StreamDispatcher>(
        session, generator, connections_, metrics_, generation,
        std::chrono::milliseconds(sub.frequency_ms));
    dispatcher->start();
    {
        std::lock_guard<std::mutex> lk(dispatchers_m_);
        dispatchers_[session->id()] = std::move(dispatcher);
    }
    std::cout << "StreamProtocol: " << session->id() << " subscribed to '" << sub.source
              << "' every " << sub.frequency_ms << " ms" << std::endl;
}

void StreamProtocol::handle_unsubscribe(const std::shared_ptr<ClientSession>& session) {
    stop_dispatcher(session->id());
    session->clear_subscription();
    reply(session, messages::unsubscribed());
}

void StreamProtocol::on_disconnect(const std::shared_ptr<ClientSession>& session) {
    if (!session) return;
    stop_dispatcher(session->id());
    session->clear_subscription();
    connections_.remove(session);
    session->close();
}

bool StreamProtocol::reply(const std::shared_ptr<ClientSession>& session, const json& msg) {
    if (session->send(msg)) return true;
    // the read loop reports the disconnect as well; removal is idempotent
    connections_.remove(session);
    return false;
}

void StreamProtocol::stop_dispatcher(const std::string& session_id) {
    std::unique_ptr<StreamDispatcher> old;
    {
        std::lock_guard<std::mutex> lk(dispatchers_m_);
        auto it = dispatchers_.find(session_id);
        if (it == dispatchers_.end()) return;
        old = std::move(it->second);
        dispatchers_.erase(it);
    }
    old->cancel();
}

void StreamProtocol::shutdown() {
    std::vector<std::unique_ptr<StreamDispatcher>> all;
    {
        std::lock_guard<std::mutex> lk(dispatchers_m_);
        for (auto& [_, d] : dispatchers_) all.push_back(std::move(d));
        dispatchers_.clear();
    }
    for (auto& d : all) d->cancel();
}

size_t StreamProtocol::active_dispatchers() const {
    std::lock_guard<std::mutex> lk(dispatchers_m_);
    size_t n = 0;
    for (const auto& [_, d] : dispatchers_) {
        if (d && d->running()) ++n;
    }
    return n;
}

bool StreamProtocol::has_dispatcher(const std::string& session_id) const {
    std::lock_guard<std::mutex> lk(dispatchers_m_);
    auto it = dispatchers_.find(session_id);
    return it != dispatchers_.end() && it->second && it->second->running();
}

} // namespace tickflow
