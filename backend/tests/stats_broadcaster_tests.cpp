#include <gtest/gtest.h>
#include "ClientSession.hpp"
#include "ConnectionRegistry.hpp"
#include "SourceRegistry.hpp"
#include "StatsBroadcaster.hpp"
#include "StreamMetrics.hpp"
#include "RecordingChannel.hpp"
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

struct Peer {
    std::shared_ptr<RecordingChannel> channel;
    std::shared_ptr<tickflow::ClientSession> session;
};

Peer add_peer(tickflow::ConnectionRegistry& reg, const std::string& id) {
    Peer p;
    p.channel = std::make_shared<RecordingChannel>();
    p.session = std::make_shared<tickflow::ClientSession>(id, p.channel);
    reg.add(p.session);
    return p;
}

} // namespace

TEST(StatsBroadcaster, EmptyRegistrySendsNothing) {
    tickflow::ConnectionRegistry reg;
    tickflow::SourceRegistry sources;
    tickflow::StreamMetrics metrics;
    tickflow::StatsBroadcaster stats(reg, sources, metrics);
    EXPECT_EQ(stats.broadcast_once(), 0u);
}

TEST(StatsBroadcaster, EveryRecipientSeesSameCount) {
    tickflow::ConnectionRegistry reg;
    tickflow::SourceRegistry sources(1);
    tickflow::StreamMetrics metrics;
    sources.get_or_create("weather");
    sources.get_or_create("crypto");
    metrics.data_points_sent = 17;

    std::vector<Peer> peers;
    for (int i = 0; i < 3; ++i) peers.push_back(add_peer(reg, "client_" + std::to_string(i)));

    tickflow::StatsBroadcaster stats(reg, sources, metrics);
    EXPECT_EQ(stats.broadcast_once(), 3u);

    for (auto& p : peers) {
        auto msgs = p.channel->of_type("server_stats");
        ASSERT_EQ(msgs.size(), 1u);
        const auto& s = msgs[0]["stats"];
        EXPECT_EQ(s["clients_connected"], 3);
        EXPECT_EQ(s["active_sources"], nlohmann::json({"crypto", "weather"}));
        EXPECT_EQ(s["data_points_sent"], 17);
        EXPECT_EQ(s["memory_usage"], "N/A");
        EXPECT_GE(s["uptime"].get<double>(), 0.0);
        EXPECT_TRUE(msgs[0]["timestamp"].is_string());
    }
}

TEST(StatsBroadcaster, FailedRecipientIsRemoved) {
    tickflow::ConnectionRegistry reg;
    tickflow::SourceRegistry sources;
    tickflow::StreamMetrics metrics;
    auto alive = add_peer(reg, "alive");
    auto gone = add_peer(reg, "gone");
    gone.channel->close();

    tickflow::StatsBroadcaster stats(reg, sources, metrics);
    EXPECT_EQ(stats.broadcast_once(), 1u);
    EXPECT_FALSE(reg.contains(gone.session));
    EXPECT_TRUE(reg.contains(alive.session));
    EXPECT_EQ(reg.count(), 1u);

    // next tick reflects the shrunken registry
    EXPECT_EQ(stats.broadcast_once(), 1u);
    auto msgs = alive.channel->of_type("server_stats");
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[1]["stats"]["clients_connected"], 1);
}

TEST(StatsBroadcaster, PeriodicTicks) {
    tickflow::ConnectionRegistry reg;
    tickflow::SourceRegistry sources;
    tickflow::StreamMetrics metrics;
    auto peer = add_peer(reg, "client_1");

    tickflow::StatsBroadcaster stats(reg, sources, metrics, 20ms);
    stats.start();
    EXPECT_TRUE(peer.channel->wait_for("server_stats", 3));
    stats.stop();

    size_t seen = peer.channel->count("server_stats");
    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(peer.channel->count("server_stats"), seen);
}

TEST(StatsBroadcaster, StopWithoutStart) {
    tickflow::ConnectionRegistry reg;
    tickflow::SourceRegistry sources;
    tickflow::StreamMetrics metrics;
    tickflow::StatsBroadcaster stats(reg, sources, metrics, 10ms);
    stats.stop();
    stats.stop();
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
