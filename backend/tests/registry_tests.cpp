#include <gtest/gtest.h>
#include "ClientSession.hpp"
#include "ConnectionRegistry.hpp"
#include "SignalGenerator.hpp"
#include "SourceRegistry.hpp"
#include "core/ErrorCatalog.hpp"
#include "RecordingChannel.hpp"
#include <atomic>
#include <memory>
#include <set>
#include <thread>
#include <vector>

using tickflow::ClientSession;
using tickflow::ConnectionRegistry;
using tickflow::SourceRegistry;

static std::shared_ptr<ClientSession> make_session(const std::string& id) {
    return std::make_shared<ClientSession>(id, std::make_shared<RecordingChannel>());
}

TEST(SourceRegistry, ReusesGeneratorPerSource) {
    SourceRegistry reg(1);
    auto a = reg.get_or_create("stock");
    auto b = reg.get_or_create("stock");
    auto c = reg.get_or_create("sensor");
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(reg.size(), 2u);
    EXPECT_EQ(reg.find("stock"), a);
    EXPECT_EQ(reg.find("weather"), nullptr);
}

TEST(SourceRegistry, ConcurrentFirstSubscriptionCreatesOneGenerator) {
    SourceRegistry reg;
    constexpr int kThreads = 16;
    std::vector<std::shared_ptr<tickflow::SignalGenerator>> seen(kThreads);
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            while (!go.load()) std::this_thread::yield();
            seen[i] = reg.get_or_create("crypto");
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    EXPECT_EQ(reg.size(), 1u);
    for (const auto& g : seen) EXPECT_EQ(g, seen.front());
}

TEST(SourceRegistry, ActiveSourcesSorted) {
    SourceRegistry reg;
    EXPECT_TRUE(reg.active_sources().empty());
    reg.get_or_create("weather");
    reg.get_or_create("crypto");
    reg.get_or_create("sensor");
    EXPECT_EQ(reg.active_sources(), (std::vector<std::string>{"crypto", "sensor", "weather"}));
}

TEST(SourceRegistry, SeededRegistriesAreReproducible) {
    SourceRegistry a(99, 0.0);
    SourceRegistry b(99, 0.0);
    EXPECT_DOUBLE_EQ(a.get_or_create("stock")->field_value("price"),
                     b.get_or_create("stock")->field_value("price"));
}

TEST(SourceRegistry, RejectsOverlongName) {
    SourceRegistry reg;
    std::string name(SourceRegistry::kMaxSourceNameLength, 'x');
    EXPECT_NE(reg.get_or_create(name), nullptr);
    try {
        reg.get_or_create(name + "x");
        FAIL() << "expected ProtocolError";
    } catch (const tickflow::ProtocolError& e) {
        EXPECT_EQ(e.code(), tickflow::errors::E1405_SOURCE_REJECTED);
    }
    EXPECT_EQ(reg.size(), 1u);
}

TEST(SourceRegistry, CustomSourceLimit) {
    SourceRegistry reg(3, 0.05, 2);
    auto lab = reg.get_or_create("lab");
    reg.get_or_create("bench");
    EXPECT_THROW(reg.get_or_create("rig"), tickflow::ProtocolError);

    // existing custom names and the listed kinds are not affected by the cap
    EXPECT_EQ(reg.get_or_create("lab"), lab);
    for (const auto& name : tickflow::available_source_names()) {
        EXPECT_NE(reg.get_or_create(name), nullptr);
    }
    EXPECT_EQ(reg.size(), 7u);
    EXPECT_EQ(reg.find("rig"), nullptr);
}

TEST(ConnectionRegistry, AddRejectsDuplicates) {
    ConnectionRegistry reg;
    auto s = make_session("client_1");
    EXPECT_TRUE(reg.add(s));
    EXPECT_FALSE(reg.add(s));
    EXPECT_EQ(reg.count(), 1u);
    EXPECT_TRUE(reg.contains(s));
    EXPECT_FALSE(reg.add(nullptr));
}

TEST(ConnectionRegistry, RemoveAbsentIsNoop) {
    ConnectionRegistry reg;
    auto s = make_session("client_1");
    EXPECT_FALSE(reg.remove(s));
    reg.add(s);
    EXPECT_TRUE(reg.remove(s));
    EXPECT_FALSE(reg.remove(s));
    EXPECT_EQ(reg.count(), 0u);
    EXPECT_FALSE(reg.contains(s));
}

TEST(ConnectionRegistry, OnAddedSeesNewCount) {
    ConnectionRegistry reg;
    size_t first = 0, second = 0;
    reg.add(make_session("a"), [&](size_t n) { first = n; });
    reg.add(make_session("b"), [&](size_t n) { second = n; });
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 2u);

    bool called = false;
    auto s = make_session("c");
    reg.add(s);
    reg.add(s, [&](size_t) { called = true; });
    EXPECT_FALSE(called);
}

TEST(ConnectionRegistry, SnapshotIsPointInTime) {
    ConnectionRegistry reg;
    auto a = make_session("a");
    auto b = make_session("b");
    reg.add(a);
    reg.add(b);
    auto snap = reg.snapshot();
    reg.remove(a);
    EXPECT_EQ(snap.size(), 2u);
    EXPECT_EQ(reg.count(), 1u);
    std::set<std::string> ids;
    for (const auto& s : snap) ids.insert(s->id());
    EXPECT_EQ(ids, (std::set<std::string>{"a", "b"}));
}

TEST(ConnectionRegistry, ConcurrentAddRemoveAndIterate) {
    ConnectionRegistry reg;
    constexpr int kWriters = 4;
    constexpr int kPerWriter = 200;
    std::atomic<bool> done{false};

    std::thread reader([&]() {
        while (!done.load()) {
            for (const auto& s : reg.snapshot()) ASSERT_NE(s, nullptr);
            (void)reg.count();
        }
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&, w]() {
            std::vector<std::shared_ptr<ClientSession>> mine;
            for (int i = 0; i < kPerWriter; ++i) {
                auto s = make_session("w" + std::to_string(w) + "_" + std::to_string(i));
                reg.add(s);
                mine.push_back(s);
            }
            // drop every other one
            for (size_t i = 0; i < mine.size(); i += 2) reg.remove(mine[i]);
        });
    }
    for (auto& t : writers) t.join();
    done = true;
    reader.join();

    EXPECT_EQ(reg.count(), (size_t)(kWriters * kPerWriter / 2));
}

TEST(ClientSession, GenerationGatesDelivery) {
    auto channel = std::make_shared<RecordingChannel>();
    ClientSession s("client_1", channel);
    EXPECT_EQ(s.generation(), 0u);
    auto g1 = s.begin_subscription({"stock", 100});
    ASSERT_TRUE(s.subscription().has_value());
    EXPECT_EQ(s.subscription()->source, "stock");
    EXPECT_TRUE(s.send_if_current(g1, {{"type", "data"}}));

    auto g2 = s.begin_subscription({"sensor", 200});
    EXPECT_GT(g2, g1);
    EXPECT_FALSE(s.send_if_current(g1, {{"type", "data"}}));
    EXPECT_TRUE(s.send_if_current(g2, {{"type", "data"}}));

    auto g3 = s.clear_subscription();
    EXPECT_FALSE(s.subscription().has_value());
    EXPECT_FALSE(s.send_if_current(g2, {{"type", "data"}}));
    EXPECT_GT(g3, g2);
    EXPECT_EQ(channel->count("data"), 2u);
}

TEST(ClientSession, SendFailsAfterClose) {
    auto channel = std::make_shared<RecordingChannel>();
    ClientSession s("client_1", channel);
    EXPECT_TRUE(s.is_open());
    EXPECT_TRUE(s.send({{"type", "pong"}}));
    s.close();
    EXPECT_FALSE(s.is_open());
    EXPECT_FALSE(s.send({{"type", "pong"}}));
    EXPECT_EQ(channel->size(), 1u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
