#include <gtest/gtest.h>
#include "PeerRegistry.hpp"
#include <chrono>
#include <thread>
#include <atomic>

using namespace lanchat;
using namespace std::chrono;

// -----------------------
// HELPER FUNCTIONS
// -----------------------
static PeerInfo makePeer(const string& name, const string& host, uint16_t port,
                         Clock::time_point seen = Clock::now()) {
    PeerInfo p;
    p.id = Identity::newPeerId();
    p.displayName = name;
    p.endpoint = Endpoint{host, port};
    p.lastSeen = seen;
    return p;
}

// -----------------------
// BASIC TESTS
// -----------------------
TEST(PeerRegistryTest, UpsertAndList) {
    PeerRegistry registry;
    PeerInfo p1 = makePeer("bob", "127.0.0.1", 8000);

    EXPECT_EQ(registry.upsert(p1), UpsertResult::Inserted);

    auto peers = registry.list();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].id, p1.id);
    EXPECT_EQ(peers[0].displayName, "bob");
    EXPECT_EQ(peers[0].endpoint.key(), "127.0.0.1:8000");
}

TEST(PeerRegistryTest, UpsertSameIdRefreshes) {
    PeerRegistry registry;
    PeerInfo p = makePeer("bob", "127.0.0.1", 8000);
    registry.upsert(p);

    PeerInfo again = p;
    again.lastSeen = p.lastSeen + seconds(5);
    EXPECT_EQ(registry.upsert(again), UpsertResult::Refreshed);

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find(p.id)->lastSeen, again.lastSeen);
}

TEST(PeerRegistryTest, AddressChangeOverwrites) {
    PeerRegistry registry;
    PeerInfo p = makePeer("bob", "192.168.1.5", 8000);
    registry.upsert(p);

    PeerInfo moved = p;
    moved.endpoint = Endpoint{"192.168.1.9", 8001};
    EXPECT_EQ(registry.upsert(moved), UpsertResult::AddressChanged);

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find(p.id)->endpoint, moved.endpoint);
    EXPECT_FALSE(registry.findByEndpoint(p.endpoint).has_value());
    EXPECT_EQ(registry.findByEndpoint(moved.endpoint)->id, p.id);
}

TEST(PeerRegistryTest, EmptyNameKeepsOldName) {
    PeerRegistry registry;
    PeerInfo p = makePeer("bob", "127.0.0.1", 8000);
    registry.upsert(p);

    PeerInfo unnamed = p;
    unnamed.displayName.clear();
    registry.upsert(unnamed);
    EXPECT_EQ(registry.find(p.id)->displayName, "bob");

    PeerInfo renamed = p;
    renamed.displayName = "roberto";
    registry.upsert(renamed);
    EXPECT_EQ(registry.find(p.id)->displayName, "roberto");
}

// -----------------------
// LAST SEEN
// -----------------------
TEST(PeerRegistryTest, TouchRefreshesLastSeen) {
    PeerRegistry registry;
    const auto t0 = Clock::now();
    PeerInfo p = makePeer("bob", "127.0.0.1", 8000, t0);
    registry.upsert(p);

    EXPECT_TRUE(registry.touch(p.id, t0 + seconds(3)));
    EXPECT_EQ(registry.find(p.id)->lastSeen, t0 + seconds(3));
}

TEST(PeerRegistryTest, TouchUnknownIdDoesNothing) {
    PeerRegistry registry;
    EXPECT_FALSE(registry.touch(Identity::newPeerId(), Clock::now()));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(PeerRegistryTest, LastSeenNeverMovesBackwards) {
    PeerRegistry registry;
    const auto t0 = Clock::now();
    PeerInfo p = makePeer("bob", "127.0.0.1", 8000, t0);
    registry.upsert(p);

    registry.touch(p.id, t0 - seconds(10));
    EXPECT_EQ(registry.find(p.id)->lastSeen, t0);

    PeerInfo older = p;
    older.lastSeen = t0 - seconds(20);
    registry.upsert(older);
    EXPECT_EQ(registry.find(p.id)->lastSeen, t0);
}

// -----------------------
// EVICTION
// -----------------------
TEST(PeerRegistryTest, EvictRemovesStalePeers) {
    PeerRegistry registry;
    const auto now = Clock::now();
    PeerInfo stale = makePeer("old", "10.0.0.1", 1, now - seconds(61));
    PeerInfo edge = makePeer("edge", "10.0.0.2", 2, now - seconds(60));
    PeerInfo fresh = makePeer("new", "10.0.0.3", 3, now - seconds(1));
    registry.upsert(stale);
    registry.upsert(edge);
    registry.upsert(fresh);

    auto removed = registry.evict(now, seconds(60));

    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].id, stale.id);
    EXPECT_TRUE(registry.contains(edge.id));
    EXPECT_TRUE(registry.contains(fresh.id));
    EXPECT_FALSE(registry.contains(stale.id));
}

TEST(PeerRegistryTest, RemoveAndClear) {
    PeerRegistry registry;
    PeerInfo p = makePeer("bob", "127.0.0.1", 8000);
    registry.upsert(p);
    registry.upsert(makePeer("carol", "127.0.0.1", 8001));

    EXPECT_TRUE(registry.remove(p.id));
    EXPECT_FALSE(registry.remove(p.id));
    EXPECT_EQ(registry.size(), 1u);

    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.find(p.id).has_value());
}

// -----------------------
// CONCURRENCY
// -----------------------
TEST(PeerRegistryTest, ConcurrentWritersAndReaders) {
    PeerRegistry registry;
    constexpr int threads = 4;
    constexpr int perThread = 200;
    std::atomic<bool> stopReading{false};

    std::thread reader([&]() {
        while (!stopReading.load()) {
            for (const auto& peer : registry.list()) {
                EXPECT_TRUE(peer.endpoint.isValid());
            }
        }
    });

    std::vector<std::thread> writers;
    std::vector<PeerId> ids(threads * perThread);
    for (auto& id : ids) id = Identity::newPeerId();

    for (int t = 0; t < threads; ++t) {
        writers.emplace_back([&, t]() {
            for (int i = 0; i < perThread; ++i) {
                PeerInfo p;
                p.id = ids[t * perThread + i];
                p.displayName = "p";
                p.endpoint = Endpoint{"10.0.0.1", static_cast<uint16_t>(1000 + t * perThread + i)};
                registry.upsert(p);
                registry.touch(p.id, Clock::now());
                if (i % 3 == 0) registry.evict(Clock::now(), hours(1));
            }
        });
    }

    for (auto& w : writers) w.join();
    stopReading = true;
    reader.join();

    EXPECT_EQ(registry.size(), static_cast<size_t>(threads * perThread));
}
