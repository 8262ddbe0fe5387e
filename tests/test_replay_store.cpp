#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "core/MemoryReplayStore.hpp"
#include "core/SqliteReplayStore.hpp"
#include "helpers/Encoding.hpp"
#include "core/Crypto.hpp"
#include "TestUtils.hpp"

using namespace std::chrono_literals;

static std::string hexKey(const std::string& seed) {
    return NEncoding::toHex(NCrypto::sha256(seed));
}

// counts how many of N threads get REPLAY_FRESH for one key
static int racingFreshCount(IReplayStore& store, const std::string& key, int threads) {
    std::atomic<int>         fresh = 0, failed = 0;
    std::atomic<bool>        go    = false;
    std::vector<std::thread> pool;

    for (int i = 0; i < threads; ++i) {
        pool.emplace_back([&] {
            while (!go) {
                std::this_thread::yield();
            }

            auto r = store.checkAndReserve(key, 60s);
            if (!r.has_value())
                failed++;
            else if (*r == REPLAY_FRESH)
                fresh++;
        });
    }

    go = true;
    for (auto& t : pool) {
        t.join();
    }

    EXPECT_EQ(failed.load(), 0);
    return fresh;
}

TEST(MemoryReplayStore, SecondReservationIsReplay) {
    CMemoryReplayStore store;
    const auto         KEY = hexKey("a");

    EXPECT_EQ(store.checkAndReserve(KEY, 60s).value(), REPLAY_FRESH);
    EXPECT_EQ(store.checkAndReserve(KEY, 60s).value(), REPLAY_ALREADY_USED);
    EXPECT_EQ(store.checkAndReserve(hexKey("b"), 60s).value(), REPLAY_FRESH);
    EXPECT_EQ(store.size(), 2u);
}

TEST(MemoryReplayStore, ExpiredKeysCanBeReservedAgain) {
    auto               now = std::chrono::steady_clock::time_point{} + 1000s;
    CMemoryReplayStore store(100, [&now] { return now; });
    const auto         KEY = hexKey("a");

    EXPECT_EQ(store.checkAndReserve(KEY, 60s).value(), REPLAY_FRESH);
    now += 59s;
    EXPECT_EQ(store.checkAndReserve(KEY, 60s).value(), REPLAY_ALREADY_USED);
    now += 1s;
    EXPECT_EQ(store.checkAndReserve(KEY, 60s).value(), REPLAY_FRESH);
}

TEST(MemoryReplayStore, PurgesExpiredBeforeEvicting) {
    auto               now = std::chrono::steady_clock::time_point{} + 1000s;
    CMemoryReplayStore store(2, [&now] { return now; });

    EXPECT_EQ(store.checkAndReserve(hexKey("short"), 10s).value(), REPLAY_FRESH);
    EXPECT_EQ(store.checkAndReserve(hexKey("long"), 600s).value(), REPLAY_FRESH);

    now += 30s;
    EXPECT_EQ(store.checkAndReserve(hexKey("new"), 600s).value(), REPLAY_FRESH);
    EXPECT_EQ(store.size(), 2u);

    // the live one survived
    EXPECT_EQ(store.checkAndReserve(hexKey("long"), 600s).value(), REPLAY_ALREADY_USED);
}

TEST(MemoryReplayStore, PurgeOnlyLooksAtTheTail) {
    constexpr size_t   LIMIT = CMemoryReplayStore::PURGE_SCAN_LIMIT;

    auto               now = std::chrono::steady_clock::time_point{} + 1000s;
    CMemoryReplayStore store(LIMIT + 2, [&now] { return now; });

    for (size_t i = 0; i <= LIMIT; ++i) {
        EXPECT_EQ(store.checkAndReserve(hexKey("long" + std::to_string(i)), 600s).value(), REPLAY_FRESH);
    }
    // most recently used, out of reach of the tail walk
    EXPECT_EQ(store.checkAndReserve(hexKey("short"), 10s).value(), REPLAY_FRESH);
    EXPECT_EQ(store.size(), LIMIT + 2);

    now += 30s;
    EXPECT_EQ(store.checkAndReserve(hexKey("new"), 600s).value(), REPLAY_FRESH);
    EXPECT_EQ(store.size(), LIMIT + 2);

    // the walk found nothing expired, so the oldest live entry went
    EXPECT_EQ(store.checkAndReserve(hexKey("long1"), 600s).value(), REPLAY_ALREADY_USED);
    EXPECT_EQ(store.checkAndReserve(hexKey("long0"), 600s).value(), REPLAY_FRESH);
    EXPECT_EQ(store.size(), LIMIT + 2);
}

TEST(MemoryReplayStore, EvictsLeastRecentlyUsedWhenFull) {
    auto               now = std::chrono::steady_clock::time_point{} + 1000s;
    CMemoryReplayStore store(2, [&now] { return now; });

    EXPECT_EQ(store.checkAndReserve(hexKey("1"), 600s).value(), REPLAY_FRESH);
    EXPECT_EQ(store.checkAndReserve(hexKey("2"), 600s).value(), REPLAY_FRESH);
    // touch 1, so 2 is the oldest
    EXPECT_EQ(store.checkAndReserve(hexKey("1"), 600s).value(), REPLAY_ALREADY_USED);
    EXPECT_EQ(store.checkAndReserve(hexKey("3"), 600s).value(), REPLAY_FRESH);

    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.checkAndReserve(hexKey("1"), 600s).value(), REPLAY_ALREADY_USED);
    EXPECT_EQ(store.checkAndReserve(hexKey("3"), 600s).value(), REPLAY_ALREADY_USED);
}

TEST(MemoryReplayStore, ConcurrentReservationsHaveOneWinner) {
    CMemoryReplayStore store;
    for (int round = 0; round < 5; ++round) {
        EXPECT_EQ(racingFreshCount(store, hexKey("race" + std::to_string(round)), 128), 1);
    }
}

TEST(SqliteReplayStore, SecondReservationIsReplay) {
    testutils::CTempDb db;
    CSqliteReplayStore store(db.path());
    const auto         KEY = hexKey("a");

    EXPECT_EQ(store.checkAndReserve(KEY, 60s).value(), REPLAY_FRESH);
    EXPECT_EQ(store.checkAndReserve(KEY, 60s).value(), REPLAY_ALREADY_USED);
    EXPECT_EQ(store.checkAndReserve(hexKey("b"), 60s).value(), REPLAY_FRESH);
    EXPECT_EQ(store.entries().value(), 2u);
}

TEST(SqliteReplayStore, RejectsKeysThatArentHashes) {
    testutils::CTempDb db;
    CSqliteReplayStore store(db.path());

    EXPECT_FALSE(store.checkAndReserve("'; DROP TABLE nonces; --", 60s).has_value());
    EXPECT_FALSE(store.checkAndReserve("", 60s).has_value());
    EXPECT_FALSE(store.checkAndReserve(std::string(64, '\xE9'), 60s).has_value());
    EXPECT_FALSE(store.checkAndReserve(std::string(64, 'A'), 60s).has_value());
    EXPECT_EQ(store.entries().value(), 0u);
}

TEST(SqliteReplayStore, ExpiredKeysCanBeReservedAgain) {
    testutils::CTempDb db;
    auto               now = std::chrono::system_clock::time_point{} + std::chrono::seconds(testutils::T0);
    CSqliteReplayStore store(db.path(), [&now] { return now; });
    const auto         KEY = hexKey("a");

    EXPECT_EQ(store.checkAndReserve(KEY, 60s).value(), REPLAY_FRESH);
    now += 59s;
    EXPECT_EQ(store.checkAndReserve(KEY, 60s).value(), REPLAY_ALREADY_USED);
    now += 1s;
    EXPECT_EQ(store.checkAndReserve(KEY, 60s).value(), REPLAY_FRESH);
    EXPECT_EQ(store.checkAndReserve(KEY, 60s).value(), REPLAY_ALREADY_USED);
}

TEST(SqliteReplayStore, SurvivesReopen) {
    testutils::CTempDb db;
    const auto         KEY = hexKey("persisted");

    {
        CSqliteReplayStore store(db.path());
        EXPECT_EQ(store.checkAndReserve(KEY, 600s).value(), REPLAY_FRESH);
    }

    CSqliteReplayStore store(db.path());
    EXPECT_EQ(store.checkAndReserve(KEY, 600s).value(), REPLAY_ALREADY_USED);
}

TEST(SqliteReplayStore, TwoHandlesShareOneDatabase) {
    testutils::CTempDb db;
    CSqliteReplayStore a(db.path()), b(db.path());
    const auto         KEY = hexKey("shared");

    EXPECT_EQ(a.checkAndReserve(KEY, 600s).value(), REPLAY_FRESH);
    EXPECT_EQ(b.checkAndReserve(KEY, 600s).value(), REPLAY_ALREADY_USED);
}

TEST(SqliteReplayStore, ConcurrentReservationsHaveOneWinner) {
    testutils::CTempDb db;
    CSqliteReplayStore store(db.path());
    for (int round = 0; round < 3; ++round) {
        EXPECT_EQ(racingFreshCount(store, hexKey("race" + std::to_string(round)), 128), 1);
    }
}

TEST(SqliteReplayStore, ThrowsWhenTheDatabaseCantBeOpened) {
    EXPECT_THROW(CSqliteReplayStore("/nonexistent-dir/for/sure/replay.db"), std::runtime_error);
}
