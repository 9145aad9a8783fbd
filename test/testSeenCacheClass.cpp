#include <gtest/gtest.h>
#include "SeenCache.hpp"
#include <thread>
#include <atomic>
#include <vector>

using namespace lanchat;
using namespace std::chrono;

TEST(SeenCacheTest, FirstInsertWinsDuplicateLoses) {
    SeenCache cache(16, minutes(1));
    MessageId id = Identity::newMessageId();

    EXPECT_TRUE(cache.insert(id));
    EXPECT_FALSE(cache.insert(id));
    EXPECT_EQ(cache.size(), 1u);
}

TEST(SeenCacheTest, CapacityEvictsOldestFirst) {
    SeenCache cache(3, minutes(1));
    std::vector<MessageId> ids;
    for (int i = 0; i < 4; ++i) {
        ids.push_back(Identity::newMessageId());
        cache.insert(ids.back());
    }

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_FALSE(cache.insert(ids[3]));
    EXPECT_FALSE(cache.insert(ids[1]));
    EXPECT_TRUE(cache.insert(ids[0])); // evicted, so new again
}

TEST(SeenCacheTest, EntriesExpireAfterMaxAge) {
    SeenCache cache(16, seconds(10));
    const auto t0 = Clock::now();
    MessageId a = Identity::newMessageId();
    MessageId b = Identity::newMessageId();

    cache.insert(a, t0);
    cache.insert(b, t0 + seconds(8));

    // exactly maxAge old is still a duplicate
    EXPECT_FALSE(cache.insert(a, t0 + seconds(10)));

    EXPECT_FALSE(cache.insert(b, t0 + seconds(11)));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.insert(a, t0 + seconds(11)));
}

TEST(SeenCacheTest, ExpiredIdCanBeInsertedAgain) {
    SeenCache cache(16, seconds(1));
    const auto t0 = Clock::now();
    MessageId id = Identity::newMessageId();

    EXPECT_TRUE(cache.insert(id, t0));
    EXPECT_FALSE(cache.insert(id, t0 + milliseconds(500)));
    EXPECT_TRUE(cache.insert(id, t0 + seconds(2)));
}

TEST(SeenCacheTest, InvalidBoundsThrow) {
    EXPECT_THROW(SeenCache(0, minutes(1)), std::invalid_argument);
    EXPECT_THROW(SeenCache(10, milliseconds(0)), std::invalid_argument);
}

TEST(SeenCacheTest, ClearEmpties) {
    SeenCache cache(8, minutes(1));
    cache.insert(Identity::newMessageId());
    cache.insert(Identity::newMessageId());
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.capacity(), 8u);
}

// -----------------------
// CONCURRENCY
// -----------------------
TEST(SeenCacheTest, ExactlyOneThreadWinsEachId) {
    SeenCache cache(1024, minutes(1));
    std::vector<MessageId> ids(200);
    for (auto& id : ids) id = Identity::newMessageId();

    std::atomic<int> wins{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&]() {
            for (const auto& id : ids) {
                if (cache.insert(id)) ++wins;
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(wins.load(), 200);
    EXPECT_EQ(cache.size(), 200u);
}
