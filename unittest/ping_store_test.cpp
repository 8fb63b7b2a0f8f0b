// ============================================================================
// PING STORE UNIT TESTS
// ============================================================================
// Tests for the bounded most-recent-first history and its locking
// ============================================================================

#include <gtest/gtest.h>
#include <canary/core/store/ping_store.hpp>
#include <algorithm>
#include <atomic>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace Canary;

namespace {

std::vector<std::string> reasonsOf(const std::vector<PingEvent>& pings) {
    std::vector<std::string> reasons;
    for (const auto& p : pings) reasons.push_back(p.reason);
    return reasons;
}

} // namespace

// ============================================================================
// BASIC BEHAVIOUR
// ============================================================================

TEST(PingStore, StartsEmpty) {
    PingStore store;
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.capacity(), PingStore::DEFAULT_CAPACITY);
    EXPECT_EQ(store.capacity(), 8u);
    EXPECT_TRUE(store.snapshot().empty());
    EXPECT_EQ(store.totalRecorded(), 0u);
}

TEST(PingStore, RejectsZeroCapacity) {
    EXPECT_THROW(PingStore(0), std::invalid_argument);
}

TEST(PingStore, RecordsNewestFirst) {
    PingStore store;
    store.record("first");
    store.record("second");
    store.record("");

    EXPECT_EQ(reasonsOf(store.snapshot()),
              (std::vector<std::string>{"", "second", "first"}));
}

TEST(PingStore, TimestampsFollowInsertionOrder) {
    PingStore store;
    auto before = std::chrono::system_clock::now();
    store.record("a");
    store.record("b");
    auto after = std::chrono::system_clock::now();

    auto pings = store.snapshot();
    ASSERT_EQ(pings.size(), 2u);
    EXPECT_GE(pings[0].timestamp, pings[1].timestamp);
    EXPECT_GE(pings[1].timestamp, before);
    EXPECT_LE(pings[0].timestamp, after);
}

TEST(PingStore, IdenticalReasonsAreDistinctEvents) {
    PingStore store;
    store.record("heartbeat");
    store.record("heartbeat");
    EXPECT_EQ(store.size(), 2u);
}

// ============================================================================
// CAPACITY & EVICTION
// ============================================================================

TEST(PingStore, TenPingsKeepNewestEight) {
    PingStore store(8);
    for (int i = 0; i < 10; ++i) {
        store.record("r" + std::to_string(i));
    }

    EXPECT_EQ(reasonsOf(store.snapshot()),
              (std::vector<std::string>{"r9", "r8", "r7", "r6", "r5", "r4", "r3", "r2"}));
    EXPECT_EQ(store.totalRecorded(), 10u);
}

TEST(PingStore, LengthNeverExceedsCapacity) {
    PingStore store(3);
    for (size_t i = 1; i <= 20; ++i) {
        store.record(std::to_string(i));
        EXPECT_EQ(store.size(), std::min<size_t>(i, 3));
    }
}

TEST(PingStore, EvictsOldestNotNewest) {
    PingStore store(2);
    store.record("old");
    store.record("mid");
    store.record("new");

    auto reasons = reasonsOf(store.snapshot());
    EXPECT_EQ(reasons, (std::vector<std::string>{"new", "mid"}));
}

TEST(PingStore, CapacityOfOneKeepsLatest) {
    PingStore store(1);
    store.record("a");
    store.record("b");
    EXPECT_EQ(reasonsOf(store.snapshot()), (std::vector<std::string>{"b"}));
}

TEST(PingStore, SnapshotDoesNotMutate) {
    PingStore store(4);
    store.record("x");
    store.record("y");

    for (int i = 0; i < 5; ++i) {
        auto snap = store.snapshot();
        snap.clear();
    }
    EXPECT_EQ(reasonsOf(store.snapshot()), (std::vector<std::string>{"y", "x"}));
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST(PingStore, ConcurrentWritersAndReaders) {
    constexpr int kWriters = 4;
    constexpr int kPerWriter = 500;
    constexpr size_t kCapacity = 8;

    PingStore store(kCapacity);
    std::atomic<bool> done{false};
    std::atomic<int> badSnapshots{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            while (!done.load(std::memory_order_acquire)) {
                auto snap = store.snapshot();
                if (snap.size() > kCapacity) {
                    badSnapshots.fetch_add(1);
                }
                for (size_t i = 1; i < snap.size(); ++i) {
                    if (snap[i - 1].timestamp < snap[i].timestamp) {
                        badSnapshots.fetch_add(1);
                    }
                }
            }
        });
    }

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&store, w]() {
            for (int i = 0; i < kPerWriter; ++i) {
                store.record("w" + std::to_string(w) + "-" + std::to_string(i));
            }
        });
    }

    for (auto& t : writers) t.join();
    done.store(true, std::memory_order_release);
    for (auto& t : readers) t.join();

    EXPECT_EQ(badSnapshots.load(), 0);
    EXPECT_EQ(store.size(), kCapacity);
    EXPECT_EQ(store.totalRecorded(), static_cast<uint64_t>(kWriters * kPerWriter));

    std::set<std::string> unique;
    for (const auto& p : store.snapshot()) unique.insert(p.reason);
    EXPECT_EQ(unique.size(), kCapacity);
}
